#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace lox {

// 1-based position in the source, computed from a byte offset.
struct Location {
  std::size_t line{1};
  std::size_t column{1};
};

Location location_of(std::string_view source, std::size_t offset);

// Start offset of every line of a source. Build once per source unit; each
// lookup is a binary search.
class LineIndex {
public:
  explicit LineIndex(std::string_view source);

  // Offsets past the end map to the end of the source.
  Location location(std::size_t offset) const;

  std::size_t line_count() const { return line_starts_.size(); }

  // Text of 1-based `line` without its trailing newline.
  std::string_view line_text(std::size_t line) const;
  std::size_t line_start(std::size_t line) const {
    return line_starts_[line - 1];
  }

  std::string_view source() const { return source_; }

private:
  std::string_view source_;
  std::vector<std::size_t> line_starts_;
};

// Half-open byte range [start, end) into a source buffer.
struct Span {
  std::size_t start{0};
  std::size_t end{0};

  std::size_t size() const { return end - start; }
  bool empty() const { return start == end; }

  // Covers from the start of this span to the end of `other`.
  Span join(const Span &other) const { return Span{start, other.end}; }

  std::string_view slice(std::string_view source) const {
    return source.substr(start, end - start);
  }

  Location start_location(std::string_view source) const;

  // Location of the last byte in the span (start for an empty span).
  Location end_location(std::string_view source) const;
};

inline bool operator==(const Span &lhs, const Span &rhs) {
  return lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const Span &lhs, const Span &rhs) {
  return !(lhs == rhs);
}

inline bool operator==(const Location &lhs, const Location &rhs) {
  return lhs.line == rhs.line && lhs.column == rhs.column;
}

} // namespace lox
