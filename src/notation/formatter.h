// Canonical formatter: serialises notes, beats, lines and whole documents
// back to minimal, deterministic SureScript text.

#ifndef SUR_NOTATION_FORMATTER_H
#define SUR_NOTATION_FORMATTER_H

#include <string>
#include <string_view>
#include <vector>

#include "notation/notation_types.h"

namespace sur {

/// @brief Render a note: "S", "S'", ".S", "-" or "*".
///
/// Silence and sustain never take an octave mark, whatever the octave field
/// holds.
std::string formatNote(const Note& note);

/// @brief Check whether lyrics must be quoted to survive a re-parse.
///
/// True for empty text, whitespace, structural characters ([ ] : - * "),
/// a "//" sequence, or text that would otherwise read as notes ("SR").
bool lyricsNeedQuotes(std::string_view lyrics);

/// @brief Render lyrics, quoted only when lyricsNeedQuotes() says so.
std::string formatLyrics(std::string_view lyrics);

/// @brief Render an element: "lyrics:note", "lyrics" or "note".
std::string formatElement(const Element& element);

/// @brief Render one beat in canonical form.
///
/// Note-only beats collapse to the dense form ("S", "SRG") with no brackets.
/// A beat with any lyrics is bracketed with space-separated elements
/// ("[sa:S re:R]"). An empty beat renders as an empty string.
std::string formatBeat(const Beat& beat);

/// @brief Join formatted beats with single spaces, skipping empty ones.
std::string formatLine(const std::vector<Beat>& beats);

/// @brief Render a section: "#Title" then one "b: " line per beat row.
///
/// A new line starts whenever a beat's position row differs from the row of
/// the line in progress. Beats without a position stay on the current line.
std::string formatSection(const Section& section);

/// @brief Render a whole document (CONFIG, SCALE, COMPOSITION blocks).
///
/// Output is canonical: format(parse(format(doc))) == format(doc).
std::string format(const Document& doc);

}  // namespace sur

#endif  // SUR_NOTATION_FORMATTER_H
