#include "diagnostic.hpp"
#include "scanner.hpp"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/WithColor.h>
#include <llvm/Support/raw_ostream.h>

#include <iostream>
#include <string>
#include <system_error>

using namespace llvm;

static cl::opt<std::string> InputFilename(cl::Positional,
                                          cl::desc("[input file]"),
                                          cl::Optional);

static cl::opt<bool>
    SkipTrivia("skip-trivia",
               cl::desc("Do not print whitespace and comment tokens"));

static cl::opt<bool> Quiet("quiet",
                           cl::desc("Only report errors, do not print tokens"));

static cl::opt<bool> NoColor("no-color",
                             cl::desc("Disable colored diagnostics"));

static void printToken(const lox::Token &tok, const lox::LineIndex &lines,
                       raw_ostream &os) {
  os << "[" << lox::to_string(tok.type) << "]";
  if (tok.type != lox::TokenType::Eof) {
    os << " '";
    os.write_escaped(tok.lexeme(lines.source()));
    os << "'";
  }
  lox::Location loc = lines.location(tok.span.start);
  os << " " << tok.span.start << ".." << tok.span.end << " (line " << loc.line
     << ", col " << loc.column << ")\n";
}

// Scan one source unit, print its tokens and report every error. Returns the
// number of scan errors.
static std::size_t runScan(StringRef path, StringRef source) {
  lox::ScanOutput output = lox::scan_all(source);
  lox::LineIndex lines(source);

  if (!Quiet) {
    for (const auto &tok : output.tokens) {
      if (SkipTrivia && lox::is_trivia(tok.type)) {
        continue;
      }
      printToken(tok, lines, outs());
    }
  }
  outs().flush();

  for (const auto &err : output.errors) {
    lox::render(errs(), lox::Diagnostic{path, lines, err}, !NoColor);
  }
  errs().flush();
  return output.errors.size();
}

static int runFile(StringRef filename) {
  auto bufferOrErr = MemoryBuffer::getFile(filename);
  if (std::error_code ec = bufferOrErr.getError()) {
    WithColor::error(errs(), "lox", NoColor)
        << "cannot open file '" << filename << "': " << ec.message() << "\n";
    return 1;
  }

  std::unique_ptr<MemoryBuffer> buffer = std::move(*bufferOrErr);
  std::size_t errorCount = runScan(filename, buffer->getBuffer());
  if (errorCount > 0) {
    WithColor::error(errs(), "lox", NoColor)
        << "failed to scan '" << filename << "' with " << errorCount
        << " error(s)\n";
    return 1;
  }
  return 0;
}

static int runRepl() {
  std::string line;
  for (;;) {
    outs() << "> ";
    outs().flush();
    if (!std::getline(std::cin, line)) {
      break;
    }
    // Each line is scanned on its own; nothing carries over to the next one.
    runScan("<repl>", line);
  }
  outs() << "\n";
  return 0;
}

int main(int argc, char **argv) {
  cl::ParseCommandLineOptions(argc, argv, "lox scanner\n");
  errs().SetBuffered();

  if (InputFilename.empty()) {
    return runRepl();
  }
  return runFile(InputFilename);
}
