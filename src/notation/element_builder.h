// Element builder: turns beat-line tokens into elements plus structural markers.

#ifndef SUR_NOTATION_ELEMENT_BUILDER_H
#define SUR_NOTATION_ELEMENT_BUILDER_H

#include <cstddef>
#include <vector>

#include "notation/notation_types.h"
#include "notation/parse_warning.h"
#include "notation/tokenizer.h"

namespace sur {

/// @brief Output of the element builder: an element or a structural marker.
struct BeatItem {
  enum Kind : uint8_t { ElementItem, Separator, OpenBracket, CloseBracket };
  Kind kind = ElementItem;
  Element element;  ///< Valid only for ElementItem.
  size_t column = 0;
};

/// @brief Build elements from a token sequence.
///
/// Fusion rule: LYRICS COLON NOTE becomes one element carrying both lyrics and
/// note. When the note is a silence or sustain mark the two stay separate
/// elements, since those marks never carry lyrics. Every other NOTE or LYRICS
/// token maps to one element; brackets and separators pass through.
///
/// @param tokens Output of tokenizeBeatLine().
/// @param warnings Optional sink for dropped colons.
/// @return Items in source order.
std::vector<BeatItem> buildElements(const std::vector<Token>& tokens,
                                    std::vector<ParseWarning>* warnings = nullptr);

}  // namespace sur

#endif  // SUR_NOTATION_ELEMENT_BUILDER_H
