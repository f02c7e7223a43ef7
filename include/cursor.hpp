#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace lox {

// Forward-only byte reader over a borrowed source buffer.
class Cursor {
public:
  explicit Cursor(std::string_view source);

  // Byte `n` positions past the next unconsumed one, without consuming.
  std::optional<char> peek(std::size_t n = 0) const;

  // Consume and return the next byte; no-op returning nullopt at end of input.
  std::optional<char> advance();

  std::size_t position() const { return position_; }
  std::optional<char> previous() const { return previous_; }
  std::optional<char> current() const { return current_; }
  bool at_end() const { return position_ >= source_.size(); }
  std::string_view source() const { return source_; }

private:
  std::string_view source_;
  std::size_t position_{0};
  std::optional<char> previous_{};
  std::optional<char> current_{};
};

} // namespace lox
