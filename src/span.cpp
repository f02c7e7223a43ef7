#include "span.hpp"

#include <algorithm>

namespace lox {

Location location_of(std::string_view source, std::size_t offset) {
  offset = std::min(offset, source.size());
  std::string_view before = source.substr(0, offset);

  Location loc;
  loc.line = static_cast<std::size_t>(
                 std::count(before.begin(), before.end(), '\n')) +
             1;

  std::size_t last_newline = before.rfind('\n');
  loc.column = (last_newline == std::string_view::npos)
                   ? offset + 1
                   : offset - last_newline;
  return loc;
}

LineIndex::LineIndex(std::string_view source) : source_(source) {
  line_starts_.push_back(0);
  for (std::size_t i = 0; i < source.size(); ++i) {
    if (source[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

Location LineIndex::location(std::size_t offset) const {
  offset = std::min(offset, source_.size());
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  std::size_t line = static_cast<std::size_t>(it - line_starts_.begin());
  return Location{line, offset - line_starts_[line - 1] + 1};
}

std::string_view LineIndex::line_text(std::size_t line) const {
  std::size_t start = line_start(line);
  std::size_t end = line < line_starts_.size() ? line_starts_[line] - 1
                                               : source_.size();
  return source_.substr(start, end - start);
}

Location Span::start_location(std::string_view source) const {
  return location_of(source, start);
}

Location Span::end_location(std::string_view source) const {
  return location_of(source, empty() ? start : end - 1);
}

} // namespace lox
