// Data model for SureScript compositions: notes, elements, beats, sections.

#ifndef SUR_NOTATION_NOTATION_TYPES_H
#define SUR_NOTATION_NOTATION_TYPES_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sur {

/// @brief Pitch of a note. Silence and Sustain are the two non-pitched marks.
enum class Pitch : uint8_t {
  S,
  R,
  G,
  M,
  P,
  D,
  N,
  Silence,  ///< Rest ('-').
  Sustain   ///< Hold the previous note ('*').
};

/// @brief Register of a pitch relative to the middle octave.
enum class Octave : int8_t {
  Lower = -1,  ///< Leading '.' mark.
  Middle = 0,
  Upper = 1    ///< Trailing '\'' mark.
};

/// Textual marks of the canonical grammar.
constexpr char kSilenceMark = '-';
constexpr char kSustainMark = '*';
constexpr char kUpperOctaveMark = '\'';
constexpr char kLowerOctaveMark = '.';

/// @brief Check whether a pitch is Silence or Sustain.
inline constexpr bool isSpecialPitch(Pitch pitch) {
  return pitch == Pitch::Silence || pitch == Pitch::Sustain;
}

/// @brief Map a note letter or mark to a Pitch.
/// @param chr One of S R G M P D N - *.
/// @param out_pitch Output pitch when recognised.
/// @return False if chr is not a note character.
bool pitchFromChar(char chr, Pitch& out_pitch);

/// @brief Single-character symbol for a pitch ("S", "-", "*", ...).
char pitchToChar(Pitch pitch);

/// @brief Human-readable pitch name ("S", "silence", "sustain").
const char* pitchToString(Pitch pitch);

struct Note {
  Pitch pitch = Pitch::S;
  Octave octave = Octave::Middle;

  bool operator==(const Note& other) const {
    return pitch == other.pitch && octave == other.octave;
  }
  bool operator!=(const Note& other) const { return !(*this == other); }
};

/// @brief One note and/or lyric fragment within a beat.
struct Element {
  std::optional<Note> note;
  std::optional<std::string> lyrics;

  bool hasNote() const { return note.has_value(); }
  bool hasLyrics() const { return lyrics.has_value(); }

  bool operator==(const Element& other) const {
    return note == other.note && lyrics == other.lyrics;
  }
  bool operator!=(const Element& other) const { return !(*this == other); }
};

/// @brief Location of a beat: row is the index of its b: line among the
/// section's beat-producing b: lines, index the beat within that line.
struct BeatPosition {
  uint32_t row = 0;
  uint32_t index = 0;

  bool operator==(const BeatPosition& other) const {
    return row == other.row && index == other.index;
  }
  bool operator!=(const BeatPosition& other) const { return !(*this == other); }
};

/// @brief Smallest timed unit of a composition line.
///
/// `bracketed` records whether the beat was written in brackets. It is
/// provenance only: equality compares elements and nothing else.
struct Beat {
  std::vector<Element> elements;
  bool bracketed = false;
  std::optional<BeatPosition> position;

  bool operator==(const Beat& other) const { return elements == other.elements; }
  bool operator!=(const Beat& other) const { return !(*this == other); }
};

struct Section {
  std::string title;
  std::vector<Beat> beats;

  bool operator==(const Section& other) const {
    return title == other.title && beats == other.beats;
  }
  bool operator!=(const Section& other) const { return !(*this == other); }
};

using Metadata = std::map<std::string, std::string>;
using Scale = std::map<std::string, std::string>;

struct Composition {
  std::vector<Section> sections;
};

/// @brief A parsed or built composition document.
struct Document {
  Metadata metadata;
  Scale scale;
  Composition composition;

  /// @brief Total beat count across all sections.
  size_t beatCount() const;
};

/// @brief Compare two documents by metadata, scale and section content.
bool sameContent(const Document& lhs, const Document& rhs);

}  // namespace sur

#endif  // SUR_NOTATION_NOTATION_TYPES_H
