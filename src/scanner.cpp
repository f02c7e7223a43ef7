#include "scanner.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <utility>

namespace lox {
namespace {

enum class CharClass {
  Letter,
  Digit,
  Whitespace,
  Punctuation,
  Operator,
  Slash,
  Quote,
  Other,
};

constexpr std::array<std::pair<std::string_view, TokenType>, 16> kKeywords = {{
    {"and", TokenType::And},
    {"class", TokenType::Class},
    {"else", TokenType::Else},
    {"false", TokenType::False},
    {"fun", TokenType::Fun},
    {"for", TokenType::For},
    {"if", TokenType::If},
    {"nil", TokenType::Nil},
    {"or", TokenType::Or},
    {"print", TokenType::Print},
    {"return", TokenType::Return},
    {"super", TokenType::Super},
    {"this", TokenType::This},
    {"true", TokenType::True},
    {"var", TokenType::Var},
    {"while", TokenType::While},
}};

constexpr std::size_t kShortestKeyword = 2;
constexpr std::size_t kLongestKeyword = 6;

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

bool is_identifier_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_part(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_whitespace(char c) {
  switch (c) {
  case ' ':
  case '\t':
  case '\r':
  case '\n':
    return true;
  default:
    return false;
  }
}

std::optional<TokenType> punctuation_type(char c) {
  switch (c) {
  case '(':
    return TokenType::LeftParen;
  case ')':
    return TokenType::RightParen;
  case '{':
    return TokenType::LeftBrace;
  case '}':
    return TokenType::RightBrace;
  case ',':
    return TokenType::Comma;
  case '.':
    return TokenType::Dot;
  case '-':
    return TokenType::Minus;
  case '+':
    return TokenType::Plus;
  case ';':
    return TokenType::Semicolon;
  case '*':
    return TokenType::Star;
  default:
    return std::nullopt;
  }
}

// One-byte type and the type with a trailing '='.
struct OperatorTypes {
  TokenType single;
  TokenType with_equal;
};

std::optional<OperatorTypes> operator_types(char c) {
  switch (c) {
  case '!':
    return OperatorTypes{TokenType::Bang, TokenType::BangEqual};
  case '=':
    return OperatorTypes{TokenType::Equal, TokenType::EqualEqual};
  case '<':
    return OperatorTypes{TokenType::Less, TokenType::LessEqual};
  case '>':
    return OperatorTypes{TokenType::Greater, TokenType::GreaterEqual};
  default:
    return std::nullopt;
  }
}

CharClass classify(char c) {
  if (is_identifier_start(c)) {
    return CharClass::Letter;
  }
  if (is_digit(c)) {
    return CharClass::Digit;
  }
  if (is_whitespace(c)) {
    return CharClass::Whitespace;
  }
  if (punctuation_type(c)) {
    return CharClass::Punctuation;
  }
  if (operator_types(c)) {
    return CharClass::Operator;
  }
  switch (c) {
  case '/':
    return CharClass::Slash;
  case '"':
    return CharClass::Quote;
  default:
    return CharClass::Other;
  }
}

TokenType keyword_or_identifier(std::string_view lexeme) {
  if (lexeme.size() < kShortestKeyword || lexeme.size() > kLongestKeyword) {
    return TokenType::Identifier;
  }
  auto it = std::find_if(kKeywords.begin(), kKeywords.end(),
                         [&](const auto &kw) { return kw.first == lexeme; });
  return it != kKeywords.end() ? it->second : TokenType::Identifier;
}

const char *to_string_impl(TokenType type) {
  switch (type) {
  case TokenType::LeftParen:
    return "LeftParen";
  case TokenType::RightParen:
    return "RightParen";
  case TokenType::LeftBrace:
    return "LeftBrace";
  case TokenType::RightBrace:
    return "RightBrace";
  case TokenType::Comma:
    return "Comma";
  case TokenType::Dot:
    return "Dot";
  case TokenType::Minus:
    return "Minus";
  case TokenType::Plus:
    return "Plus";
  case TokenType::Semicolon:
    return "Semicolon";
  case TokenType::Star:
    return "Star";
  case TokenType::Bang:
    return "Bang";
  case TokenType::BangEqual:
    return "BangEqual";
  case TokenType::Equal:
    return "Equal";
  case TokenType::EqualEqual:
    return "EqualEqual";
  case TokenType::Less:
    return "Less";
  case TokenType::LessEqual:
    return "LessEqual";
  case TokenType::Greater:
    return "Greater";
  case TokenType::GreaterEqual:
    return "GreaterEqual";
  case TokenType::Slash:
    return "Slash";
  case TokenType::CommentLine:
    return "CommentLine";
  case TokenType::Whitespace:
    return "Whitespace";
  case TokenType::Identifier:
    return "Identifier";
  case TokenType::String:
    return "String";
  case TokenType::Number:
    return "Number";
  case TokenType::And:
    return "And";
  case TokenType::Class:
    return "Class";
  case TokenType::Else:
    return "Else";
  case TokenType::False:
    return "False";
  case TokenType::Fun:
    return "Fun";
  case TokenType::For:
    return "For";
  case TokenType::If:
    return "If";
  case TokenType::Nil:
    return "Nil";
  case TokenType::Or:
    return "Or";
  case TokenType::Print:
    return "Print";
  case TokenType::Return:
    return "Return";
  case TokenType::Super:
    return "Super";
  case TokenType::This:
    return "This";
  case TokenType::True:
    return "True";
  case TokenType::Var:
    return "Var";
  case TokenType::While:
    return "While";
  case TokenType::Eof:
    return "Eof";
  }
  return "Unknown";
}

} // namespace

Scanner::Scanner(std::string_view source) : cursor_(source) {}

template <typename Pred> void Scanner::advance_while(Pred pred) {
  for (std::optional<char> c = cursor_.peek(); c && pred(*c);
       c = cursor_.peek()) {
    cursor_.advance();
  }
}

std::optional<ScanResult> Scanner::next() {
  start_ = cursor_.position();
  std::optional<char> first = cursor_.advance();
  if (!first) {
    return std::nullopt;
  }

  char c = *first;
  switch (classify(c)) {
  case CharClass::Letter:
    return scan_identifier_or_keyword();
  case CharClass::Digit:
    return scan_number();
  case CharClass::Whitespace:
    return scan_whitespace();
  case CharClass::Punctuation:
    return make_token(*punctuation_type(c));
  case CharClass::Operator: {
    OperatorTypes types = *operator_types(c);
    return scan_operator(types.single, types.with_equal);
  }
  case CharClass::Slash:
    return scan_slash_or_comment();
  case CharClass::Quote:
    return scan_string();
  case CharClass::Other:
    return make_error(ErrorKind::Unknown);
  }
  return make_error(ErrorKind::Unknown);
}

ScanResult Scanner::scan_identifier_or_keyword() {
  advance_while(is_identifier_part);
  std::string_view lexeme =
      cursor_.source().substr(start_, cursor_.position() - start_);
  return make_token(keyword_or_identifier(lexeme));
}

ScanResult Scanner::scan_whitespace() {
  advance_while(is_whitespace);
  return make_token(TokenType::Whitespace);
}

ScanResult Scanner::scan_number() {
  bool saw_dot = false;

  for (std::optional<char> c = cursor_.peek(); c; c = cursor_.peek()) {
    if (is_digit(*c)) {
      cursor_.advance();
      continue;
    }

    // A dot belongs to the number only when a digit follows it, so `9.sqrt`
    // stays Number, Dot, Identifier.
    std::optional<char> after = cursor_.peek(1);
    if (*c != '.' || !after || !is_digit(*after)) {
      break;
    }
    if (saw_dot) {
      advance_while([](char ch) { return is_digit(ch) || ch == '.'; });
      return make_error(ErrorKind::InvalidNumber);
    }
    saw_dot = true;
    cursor_.advance();
  }

  return make_token(TokenType::Number);
}

ScanResult Scanner::scan_operator(TokenType single, TokenType with_equal) {
  return make_token(match('=') ? with_equal : single);
}

ScanResult Scanner::scan_slash_or_comment() {
  if (!match('/')) {
    return make_token(TokenType::Slash);
  }
  advance_while([](char ch) { return ch != '\n'; });
  return make_token(TokenType::CommentLine);
}

ScanResult Scanner::scan_string() {
  while (std::optional<char> c = cursor_.advance()) {
    if (*c == '"') {
      return make_token(TokenType::String);
    }
  }
  return make_error(ErrorKind::UnfinishString);
}

Token Scanner::make_token(TokenType type) const {
  return Token{type, Span{start_, cursor_.position()}};
}

ScanError Scanner::make_error(ErrorKind kind) const {
  return ScanError{kind, Span{start_, cursor_.position()}};
}

bool Scanner::match(char expected) {
  std::optional<char> c = cursor_.peek();
  if (!c || *c != expected) {
    return false;
  }
  cursor_.advance();
  return true;
}

ScanOutput scan_all(std::string_view source) {
  ScanOutput out;
  Scanner scanner(source);
  while (std::optional<ScanResult> result = scanner.next()) {
    if (const Token *tok = std::get_if<Token>(&*result)) {
      out.tokens.push_back(*tok);
    } else {
      out.errors.push_back(std::get<ScanError>(*result));
    }
  }
  out.tokens.push_back(
      Token{TokenType::Eof, Span{source.size(), source.size()}});
  return out;
}

const char *to_string(TokenType type) { return to_string_impl(type); }

bool is_trivia(TokenType type) {
  return type == TokenType::Whitespace || type == TokenType::CommentLine;
}

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Unknown:
    return "Unknown";
  case ErrorKind::UnfinishString:
    return "UnfinishString";
  case ErrorKind::InvalidNumber:
    return "InvalidNumber";
  }
  return "Unknown";
}

const char *message(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Unknown:
    return "unexpected character";
  case ErrorKind::UnfinishString:
    return "unterminated string literal";
  case ErrorKind::InvalidNumber:
    return "invalid number literal";
  }
  return "scan error";
}

} // namespace lox
