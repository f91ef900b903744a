/// @file
/// @brief Warning construction and stderr logging for the lenient parser.

#include "notation/parse_warning.h"

#include <cstdio>
#include <utility>

namespace sur {

void addWarning(std::vector<ParseWarning>* warnings, size_t column, std::string message,
                std::string fragment) {
  if (!warnings) return;
  ParseWarning warning;
  warning.column = column;
  warning.message = std::move(message);
  warning.fragment = std::move(fragment);
  warnings->push_back(std::move(warning));
}

std::string describeWarning(const ParseWarning& warning) {
  std::string text;
  if (warning.line > 0) {
    text += "line " + std::to_string(warning.line) + ": ";
  }
  text += warning.message;
  if (!warning.fragment.empty()) {
    text += " (" + warning.fragment + ")";
  }
  return text;
}

void logParseWarnings(const std::vector<ParseWarning>& warnings) {
  for (const auto& warning : warnings) {
    std::fprintf(stderr, "[SurParser] WARNING: %s\n", describeWarning(warning).c_str());
  }
}

}  // namespace sur
