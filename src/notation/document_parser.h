// Document assembler: splits .sur text into CONFIG, SCALE and COMPOSITION
// blocks and builds a Document from them.

#ifndef SUR_NOTATION_DOCUMENT_PARSER_H
#define SUR_NOTATION_DOCUMENT_PARSER_H

#include <string>
#include <string_view>
#include <vector>

#include "notation/notation_types.h"
#include "notation/parse_warning.h"

namespace sur {

/// @brief Block selected by a module marker line.
enum class BlockKind : uint8_t {
  None,         ///< Line is not a module marker.
  Config,
  Scale,
  Composition,
  Unknown       ///< Marker syntax with an unrecognised name.
};

/// @brief Classify a (trimmed) line as a module marker.
///
/// Markers are "%%NAME" or "@NAME", case-insensitive, with optional spaces
/// after the sigil ("%% CONFIG" is accepted).
BlockKind parseModuleMarker(std::string_view line);

/// @brief Remove a "//" comment from one line.
///
/// A "//" inside a double-quoted span is kept, so quoted values and lyrics
/// may contain it.
std::string stripComment(std::string_view line);

/// @brief Parse a SureScript document, collecting warnings.
///
/// Lenient: malformed or out-of-context fragments (a b: line before any
/// section header, an unknown block, a stray bracket) are dropped and recorded
/// in `warnings`; parsing always continues. Does not log.
///
/// @param text Whole file content (LF or CRLF).
/// @param warnings Receives one entry per skipped fragment.
/// @return Parsed document. Not validated.
Document parse(std::string_view text, std::vector<ParseWarning>& warnings);

/// @brief Parse a SureScript document, logging warnings to stderr.
Document parse(std::string_view text);

}  // namespace sur

#endif  // SUR_NOTATION_DOCUMENT_PARSER_H
