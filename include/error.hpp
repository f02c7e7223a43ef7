#pragma once

#include "span.hpp"

namespace lox {

enum class ErrorKind {
  Unknown,        // Byte that starts no lexeme.
  UnfinishString, // String literal with no closing quote before end of input.
  InvalidNumber,  // Numeric literal with more than one decimal point.
};

// Recoverable scan error; the scanner has already moved past `span`.
struct ScanError {
  ErrorKind kind{ErrorKind::Unknown};
  Span span{};
};

const char *to_string(ErrorKind kind);

// Human-readable description, e.g. "unterminated string literal".
const char *message(ErrorKind kind);

} // namespace lox
