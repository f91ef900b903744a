// JSON export of documents for front ends that render the parsed structure.

#ifndef SUR_NOTATION_DOCUMENT_JSON_H
#define SUR_NOTATION_DOCUMENT_JSON_H

#include <string>

#include "notation/notation_types.h"

namespace sur {

/// @brief Serialise a document as JSON.
///
/// Shape:
/// @code
///   {"metadata":{...},"scale":{...},
///    "composition":{"sections":[{"title":"Sthayi","beats":[
///      {"bracketed":false,"position":{"row":0,"index":0},
///       "elements":[{"lyrics":"sa","note":{"pitch":"S","octave":0}}]}]}]}}
/// @endcode
/// Pitches use their symbols (S R G M P D N - *). Absent fields are omitted;
/// a beat without a position has "position":null.
///
/// @param doc Document to export.
/// @param pretty Indent the output when true.
/// @return JSON text.
std::string documentToJson(const Document& doc, bool pretty = false);

}  // namespace sur

#endif  // SUR_NOTATION_DOCUMENT_JSON_H
