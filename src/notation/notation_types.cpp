/// @file
/// @brief Pitch symbol tables and document helpers.

#include "notation/notation_types.h"

namespace sur {

bool pitchFromChar(char chr, Pitch& out_pitch) {
  switch (chr) {
    case 'S': out_pitch = Pitch::S; return true;
    case 'R': out_pitch = Pitch::R; return true;
    case 'G': out_pitch = Pitch::G; return true;
    case 'M': out_pitch = Pitch::M; return true;
    case 'P': out_pitch = Pitch::P; return true;
    case 'D': out_pitch = Pitch::D; return true;
    case 'N': out_pitch = Pitch::N; return true;
    case kSilenceMark: out_pitch = Pitch::Silence; return true;
    case kSustainMark: out_pitch = Pitch::Sustain; return true;
    default: return false;
  }
}

char pitchToChar(Pitch pitch) {
  switch (pitch) {
    case Pitch::S: return 'S';
    case Pitch::R: return 'R';
    case Pitch::G: return 'G';
    case Pitch::M: return 'M';
    case Pitch::P: return 'P';
    case Pitch::D: return 'D';
    case Pitch::N: return 'N';
    case Pitch::Silence: return kSilenceMark;
    case Pitch::Sustain: return kSustainMark;
  }
  return '?';
}

const char* pitchToString(Pitch pitch) {
  switch (pitch) {
    case Pitch::S: return "S";
    case Pitch::R: return "R";
    case Pitch::G: return "G";
    case Pitch::M: return "M";
    case Pitch::P: return "P";
    case Pitch::D: return "D";
    case Pitch::N: return "N";
    case Pitch::Silence: return "silence";
    case Pitch::Sustain: return "sustain";
  }
  return "unknown";
}

size_t Document::beatCount() const {
  size_t count = 0;
  for (const auto& section : composition.sections) count += section.beats.size();
  return count;
}

bool sameContent(const Document& lhs, const Document& rhs) {
  return lhs.metadata == rhs.metadata && lhs.scale == rhs.scale &&
         lhs.composition.sections == rhs.composition.sections;
}

}  // namespace sur
