#include "diagnostic.hpp"

#include <llvm/Support/Format.h>
#include <llvm/Support/WithColor.h>

#include <algorithm>

using namespace llvm;

namespace lox {
namespace {

constexpr unsigned kGutterWidth = 4;
constexpr std::size_t kContextBefore = 1;
constexpr std::size_t kContextAfter = 1;

ColorMode color_mode(bool color) {
  return color ? ColorMode::Auto : ColorMode::Disable;
}

void print_gutter(raw_ostream &os, std::optional<std::size_t> line,
                  bool color) {
  WithColor gutter(os, raw_ostream::BLACK, true, false, color_mode(color));
  if (line) {
    gutter << format_decimal(static_cast<int64_t>(*line), kGutterWidth);
  } else {
    gutter << std::string(kGutterWidth, ' ');
  }
  gutter << " | ";
}

// Tabs are kept so the carets line up with the text above them.
void print_caret_indent(raw_ostream &os, std::string_view prefix) {
  std::string indent(prefix.size(), ' ');
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (prefix[i] == '\t') {
      indent[i] = '\t';
    }
  }
  os << indent;
}

} // namespace

std::vector<ContextLine> context_lines(const LineIndex &lines, Span span,
                                       std::size_t before, std::size_t after) {
  std::size_t start_line = lines.location(span.start).line;
  std::size_t end_line =
      lines.location(span.empty() ? span.start : span.end - 1).line;

  std::size_t first = start_line > before ? start_line - before : 1;
  std::size_t last = std::min(lines.line_count(), end_line + after);

  std::vector<ContextLine> result;
  for (std::size_t line = first; line <= last; ++line) {
    ContextLine ctx;
    ctx.line = line;
    ctx.text = lines.line_text(line);
    if (line >= start_line && line <= end_line) {
      std::size_t line_start = lines.line_start(line);
      std::size_t line_end = line_start + ctx.text.size();
      std::size_t begin = std::max(span.start, line_start) - line_start;
      std::size_t end = std::min(span.end, line_end);
      end = end > line_start ? end - line_start : 0;
      ctx.highlight = std::make_pair(begin, std::max(begin, end));
    }
    result.push_back(ctx);
  }
  return result;
}

std::string describe(const ScanError &error) {
  return std::string(message(error.kind)) + " (" + to_string(error.kind) + ")";
}

void render(raw_ostream &os, const Diagnostic &diag, bool color) {
  const Span &span = diag.error.span;
  Location loc = diag.lines.location(span.start);
  WithColor::error(os, "lox", !color)
      << diag.path << ":" << loc.line << ":" << loc.column << ": "
      << describe(diag.error) << ": '";
  os.write_escaped(span.slice(diag.lines.source()));
  os << "'\n";

  for (const ContextLine &ctx :
       context_lines(diag.lines, span, kContextBefore, kContextAfter)) {
    print_gutter(os, ctx.line, color);
    os << ctx.text << "\n";
    if (!ctx.highlight) {
      continue;
    }

    // One caret for an empty span, none on lines the span crosses without
    // covering any text.
    auto [begin, end] = *ctx.highlight;
    std::size_t width = span.empty() ? 1 : end - begin;
    if (width == 0) {
      continue;
    }

    print_gutter(os, std::nullopt, color);
    print_caret_indent(os, ctx.text.substr(0, begin));
    WithColor(os, raw_ostream::RED, true, false, color_mode(color))
        << std::string(width, '^');
    os << "\n";
  }
}

} // namespace lox
