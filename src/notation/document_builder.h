// Fluent construction API for documents.

#ifndef SUR_NOTATION_DOCUMENT_BUILDER_H
#define SUR_NOTATION_DOCUMENT_BUILDER_H

#include <cstdint>
#include <string>

#include "notation/notation_types.h"

namespace sur {

/// @brief Builds a Document step by step, mirroring the data model.
///
/// Usage:
/// @code
///   Document doc = DocumentBuilder()
///                      .addMetadata("name", "Albela Sajan")
///                      .addScaleNote("S", "Sa")
///                      .beginSection("Sthayi")
///                      .beginBeat().addNote(Pitch::S)
///                      .beginBeat().addNote(Pitch::R, Octave::Middle, "re")
///                      .build();
/// @endcode
///
/// Beats opened with beginBeat() are positioned automatically: the row is the
/// current row (advanced by beginRow()) and the index counts beats within it.
/// Appending an element with no open beat, or opening a beat with no open
/// section, throws std::logic_error.
class DocumentBuilder {
 public:
  DocumentBuilder() = default;

  /// @brief Set a metadata entry. Later calls with the same key overwrite.
  DocumentBuilder& addMetadata(const std::string& key, const std::string& value);

  /// @brief Merge several metadata entries at once.
  DocumentBuilder& setMetadata(const Metadata& entries);

  /// @brief Map a scale symbol to its display name.
  DocumentBuilder& addScaleNote(const std::string& symbol, const std::string& name);

  /// @brief Replace the whole scale.
  DocumentBuilder& setScale(const Scale& scale);

  /// @brief Open a new section; later beats go into it.
  DocumentBuilder& beginSection(const std::string& title);

  /// @brief Start a new row (one "b:" line) in the current section.
  DocumentBuilder& beginRow();

  /// @brief Open a new beat at the next automatic position.
  DocumentBuilder& beginBeat(bool bracketed = false);

  /// @brief Open a new beat at an explicit position.
  DocumentBuilder& beginBeat(const BeatPosition& position, bool bracketed = false);

  /// @brief Append a note element to the open beat.
  DocumentBuilder& addNote(Pitch pitch, Octave octave = Octave::Middle);

  /// @brief Append a note element carrying lyrics to the open beat.
  DocumentBuilder& addNote(Pitch pitch, Octave octave, const std::string& lyrics);

  /// @brief Append a silence element.
  DocumentBuilder& addRest();

  /// @brief Append a sustain element.
  DocumentBuilder& addSustain();

  /// @brief Append a lyrics-only element.
  DocumentBuilder& addLyrics(const std::string& lyrics);

  /// @brief Validate and return the document. The builder stays usable.
  /// @throws ValidationError if the document is structurally incomplete.
  Document build() const;

 private:
  Section& openSection(const char* operation);
  Beat& openBeat(const char* operation);
  DocumentBuilder& appendElement(Element element, const char* operation);

  Document doc_;
  bool beat_open_ = false;
  uint32_t row_ = 0;
  uint32_t next_index_ = 0;
};

}  // namespace sur

#endif  // SUR_NOTATION_DOCUMENT_BUILDER_H
