// Structural validation of documents, parsed or built.

#ifndef SUR_NOTATION_VALIDATOR_H
#define SUR_NOTATION_VALIDATOR_H

#include <stdexcept>
#include <string>

#include "notation/notation_types.h"

namespace sur {

/// @brief Outcome of checkDocument().
struct ValidationResult {
  bool success = true;
  std::string field;          ///< Path of the offending field, e.g. "metadata.name".
  std::string error_message;  ///< Empty on success.
};

/// @brief Raised by validate() and DocumentBuilder::build().
class ValidationError : public std::runtime_error {
 public:
  ValidationError(const std::string& field, const std::string& message)
      : std::runtime_error(message), field_(field) {}

  /// @brief Path of the offending field.
  const std::string& field() const { return field_; }

 private:
  std::string field_;
};

/// @brief Check a document's required fields and element invariants.
///
/// Reports the first failure found, in this order: metadata name, metadata
/// entries, scale, section count, then each section title and beat (position,
/// elements, lyrics text, silence/sustain rules). Text fields are rejected when
/// format() could not write them back unchanged: a metadata key or scale symbol
/// that is empty, padded, or holds its separator, '"', "//" or a line break; a
/// metadata value with '"' or a line break; an empty or padded scale name; a
/// padded section title or one holding "//" or a line break. Never mutates the
/// document.
///
/// @param doc Document to check.
/// @return Result with success=false and a descriptive message on failure.
ValidationResult checkDocument(const Document& doc);

/// @brief Validate a document, throwing on the first structural failure.
/// @throws ValidationError naming the offending field.
void validate(const Document& doc);

}  // namespace sur

#endif  // SUR_NOTATION_VALIDATOR_H
