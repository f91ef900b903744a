/// @file
/// @brief CLI entry point for the SureScript notation tools.

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "core/version_info.h"
#include "notation/document_json.h"
#include "notation/document_parser.h"
#include "notation/formatter.h"
#include "notation/parse_warning.h"
#include "notation/validator.h"

namespace {

enum class Command { Format, Validate, Json, Check };

/// @brief Command-line options parsed from argv.
struct CliOptions {
  Command command = Command::Format;
  std::string input;       ///< Path, or "-" for stdin.
  std::string output;      ///< Empty = stdout.
  bool pretty = false;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("sur_cli - SureScript notation formatter and validator\n\n");
  std::printf("Usage: sur_cli COMMAND FILE [options]\n\n");
  std::printf("Commands:\n");
  std::printf("  format           Print the canonical form of FILE\n");
  std::printf("  validate         Check required fields and beat structure\n");
  std::printf("  json             Print the parsed document as JSON\n");
  std::printf("  check            Exit 1 if FILE is not in canonical form\n");
  std::printf("\nOptions:\n");
  std::printf("  -o FILE          Output file path (default: stdout)\n");
  std::printf("  --pretty         Indent JSON output\n");
  std::printf("  --verbose        Report skipped fragments on stderr\n");
  std::printf("  --version        Show version\n");
  std::printf("  --help           Show this help\n");
  std::printf("\nFILE may be '-' to read from stdin.\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @param exit_code Set when the caller should exit without running a command.
/// @return False if the program should exit with exit_code.
bool parseArgs(int argc, char* argv[], CliOptions& opts, int& exit_code) {
  bool have_command = false;
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage();
      exit_code = 0;
      return false;
    }
    if (std::strcmp(arg, "--version") == 0) {
      std::printf("sur_cli v%s\n", SUR_VERSION);
      exit_code = 0;
      return false;
    }
    if (std::strcmp(arg, "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(arg, "--pretty") == 0) {
      opts.pretty = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else if (!have_command) {
      if (std::strcmp(arg, "format") == 0) {
        opts.command = Command::Format;
      } else if (std::strcmp(arg, "validate") == 0) {
        opts.command = Command::Validate;
      } else if (std::strcmp(arg, "json") == 0) {
        opts.command = Command::Json;
      } else if (std::strcmp(arg, "check") == 0) {
        opts.command = Command::Check;
      } else {
        std::fprintf(stderr, "Error: unknown command '%s'\n", arg);
        exit_code = 1;
        return false;
      }
      have_command = true;
    } else if (opts.input.empty()) {
      opts.input = arg;
    } else {
      std::fprintf(stderr, "Error: unexpected argument '%s'\n", arg);
      exit_code = 1;
      return false;
    }
  }

  if (!have_command || opts.input.empty()) {
    printUsage();
    exit_code = 1;
    return false;
  }
  return true;
}

/// @brief Read the whole input file (or stdin for "-").
/// @return False if the file could not be opened.
bool readInput(const std::string& path, std::string& out_text) {
  if (path == "-") {
    out_text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out_text = buffer.str();
  return true;
}

/// @brief Write text to the output file, or stdout when no path is given.
bool writeOutput(const std::string& path, const std::string& text) {
  if (path.empty()) {
    std::fwrite(text.data(), 1, text.size(), stdout);
    return true;
  }
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) return false;
  file << text;
  return static_cast<bool>(file);
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  int exit_code = 0;
  if (!parseArgs(argc, argv, opts, exit_code)) {
    return exit_code;
  }

  std::string text;
  if (!readInput(opts.input, text)) {
    std::fprintf(stderr, "Error: failed to read %s\n", opts.input.c_str());
    return 1;
  }

  std::vector<sur::ParseWarning> warnings;
  sur::Document doc = sur::parse(text, warnings);
  if (opts.verbose) {
    sur::logParseWarnings(warnings);
  }

  switch (opts.command) {
    case Command::Format:
    case Command::Json: {
      std::string out = (opts.command == Command::Format)
                            ? sur::format(doc)
                            : sur::documentToJson(doc, opts.pretty) + "\n";
      if (!writeOutput(opts.output, out)) {
        std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
        return 1;
      }
      return 0;
    }

    case Command::Validate: {
      sur::ValidationResult result = sur::checkDocument(doc);
      if (!result.success) {
        std::fprintf(stderr, "Error: %s [%s]\n", result.error_message.c_str(),
                     result.field.c_str());
        return 1;
      }
      std::printf("OK: %zu sections, %zu beats", doc.composition.sections.size(),
                  doc.beatCount());
      if (!warnings.empty()) {
        std::printf(", %zu fragments skipped", warnings.size());
      }
      std::printf("\n");
      return 0;
    }

    case Command::Check: {
      std::string canonical = sur::format(doc);
      std::string normalized = text;
      // CRLF input is canonical if it only differs in line endings.
      std::string::size_type pos = 0;
      while ((pos = normalized.find("\r\n", pos)) != std::string::npos) {
        normalized.erase(pos, 1);
      }
      if (normalized != canonical) {
        std::fprintf(stderr, "%s: not in canonical form\n", opts.input.c_str());
        return 1;
      }
      return 0;
    }
  }

  return 0;
}
