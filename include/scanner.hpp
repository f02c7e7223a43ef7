#pragma once

#include "cursor.hpp"
#include "error.hpp"
#include "token.hpp"

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace lox {

// Outcome of one scan step: a token or an error, never both.
using ScanResult = std::variant<Token, ScanError>;

class Scanner {
public:
  explicit Scanner(std::string_view source);

  // Produce the next token or error; nullopt once input is exhausted. The
  // scanner never emits TokenType::Eof itself.
  std::optional<ScanResult> next();

private:
  ScanResult scan_identifier_or_keyword();
  ScanResult scan_whitespace();
  ScanResult scan_number();
  ScanResult scan_operator(TokenType single, TokenType with_equal);
  ScanResult scan_slash_or_comment();
  ScanResult scan_string();

  Token make_token(TokenType type) const;
  ScanError make_error(ErrorKind kind) const;

  bool match(char expected);
  template <typename Pred> void advance_while(Pred pred);

  Cursor cursor_;
  std::size_t start_{0};
};

// Result of scanning one source unit to exhaustion.
struct ScanOutput {
  std::vector<Token> tokens; // Always terminated by an Eof token.
  std::vector<ScanError> errors;

  bool has_errors() const { return !errors.empty(); }
};

ScanOutput scan_all(std::string_view source);

} // namespace lox
