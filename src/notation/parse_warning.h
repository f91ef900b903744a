// Diagnostics recorded when the lenient parser drops a fragment.

#ifndef SUR_NOTATION_PARSE_WARNING_H
#define SUR_NOTATION_PARSE_WARNING_H

#include <cstddef>
#include <string>
#include <vector>

namespace sur {

/// @brief A skipped or repaired fragment of input. Never fatal.
struct ParseWarning {
  size_t line = 0;    ///< 1-based source line (0 when not tied to a line).
  size_t column = 0;  ///< 0-based column within the beat content.
  std::string message;
  std::string fragment;  ///< The offending text, if any.
};

/// @brief Append a warning when a sink is provided.
/// @param warnings Sink, may be null.
void addWarning(std::vector<ParseWarning>* warnings, size_t column, std::string message,
                std::string fragment = "");

/// @brief Render one warning as "line N: message (fragment)".
std::string describeWarning(const ParseWarning& warning);

/// @brief Print warnings to stderr, one per line, tagged with [SurParser].
void logParseWarnings(const std::vector<ParseWarning>& warnings);

}  // namespace sur

#endif  // SUR_NOTATION_PARSE_WARNING_H
