#include "cursor.hpp"

namespace lox {

Cursor::Cursor(std::string_view source) : source_(source) {}

std::optional<char> Cursor::peek(std::size_t n) const {
  if (n >= source_.size() - position_) {
    return std::nullopt;
  }
  return source_[position_ + n];
}

std::optional<char> Cursor::advance() {
  if (at_end()) {
    return std::nullopt;
  }
  previous_ = current_;
  current_ = source_[position_++];
  return current_;
}

} // namespace lox
