#pragma once

#include "span.hpp"

#include <string_view>

namespace lox {

enum class TokenType {
  // Single-character punctuation.
  LeftParen,
  RightParen,
  LeftBrace,
  RightBrace,
  Comma,
  Dot,
  Minus,
  Plus,
  Semicolon,
  Star,

  // One or two character operators.
  Bang,
  BangEqual,
  Equal,
  EqualEqual,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,
  Slash,

  // Trivia.
  CommentLine,
  Whitespace,

  // Literals.
  Identifier,
  String,
  Number,

  // Keywords.
  And,
  Class,
  Else,
  False,
  Fun,
  For,
  If,
  Nil,
  Or,
  Print,
  Return,
  Super,
  This,
  True,
  Var,
  While,

  Eof,
};

// A classified lexeme. The span is the only reference into the source; the
// token does not own any text, so the source must outlive it.
struct Token {
  TokenType type{TokenType::Eof};
  Span span{};

  std::string_view lexeme(std::string_view source) const {
    return span.slice(source);
  }
};

const char *to_string(TokenType type);

// Whitespace and line comments.
bool is_trivia(TokenType type);

} // namespace lox
