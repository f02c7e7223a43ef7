#pragma once

#include "error.hpp"
#include "span.hpp"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lox {

// One source line shown around a diagnostic.
struct ContextLine {
  std::size_t line{1};   // 1-based line number.
  std::string_view text; // Line contents without the trailing newline.

  // 0-based [begin, end) columns of the highlighted part of this line, set
  // only for lines the span touches.
  std::optional<std::pair<std::size_t, std::size_t>> highlight;
};

// Lines from `before` lines above the span's first line to `after` lines below
// its last line, clamped to the source.
std::vector<ContextLine> context_lines(const LineIndex &lines, Span span,
                                       std::size_t before, std::size_t after);

// A scan error bound to the source it came from. `lines` indexes that source
// and is shared by every diagnostic of one source unit.
struct Diagnostic {
  llvm::StringRef path;
  const LineIndex &lines;
  ScanError error;
};

// "unterminated string literal (UnfinishString)"
std::string describe(const ScanError &error);

void render(llvm::raw_ostream &os, const Diagnostic &diag, bool color = true);

} // namespace lox
