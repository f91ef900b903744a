// Beat assembler: groups elements into timed beats using bracket scope.

#ifndef SUR_NOTATION_BEAT_ASSEMBLER_H
#define SUR_NOTATION_BEAT_ASSEMBLER_H

#include <cstdint>
#include <string_view>
#include <vector>

#include "notation/element_builder.h"
#include "notation/notation_types.h"
#include "notation/parse_warning.h"

namespace sur {

/// @brief Group builder items into beats.
///
/// Outside brackets a separator ends the current beat; inside brackets it only
/// separates elements and the closing bracket ends the beat. Brackets do not
/// nest, so a single mode flag is enough. Adjacent elements with no separator
/// between them (a compact run like "SRG") land in the same beat, exactly as
/// "[S R G]" does.
///
/// @param items Output of buildElements().
/// @param row Row recorded in each beat's position.
/// @param warnings Optional sink for dropped or repaired brackets.
/// @return Beats in order, positioned (row, 0..n-1).
std::vector<Beat> assembleBeats(const std::vector<BeatItem>& items, uint32_t row,
                                std::vector<ParseWarning>* warnings = nullptr);

/// @brief Tokenize, build elements and assemble beats for one line.
/// @param content Beat content without the leading "b:".
/// @param row Row recorded in each beat's position.
/// @param warnings Optional sink for parse warnings.
/// @return Beats of the line.
std::vector<Beat> parseBeatLine(std::string_view content, uint32_t row,
                                std::vector<ParseWarning>* warnings = nullptr);

}  // namespace sur

#endif  // SUR_NOTATION_BEAT_ASSEMBLER_H
