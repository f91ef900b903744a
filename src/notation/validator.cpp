/// @file
/// @brief Required-field and element-invariant checks.

#include "notation/validator.h"

#include <cctype>
#include <utility>

namespace sur {

namespace {

ValidationResult fail(std::string field, std::string message) {
  ValidationResult result;
  result.success = false;
  result.field = std::move(field);
  result.error_message = std::move(message);
  return result;
}

std::string beatPath(size_t section_idx, size_t beat_idx) {
  return "composition.sections[" + std::to_string(section_idx) + "].beats[" +
         std::to_string(beat_idx) + "]";
}

bool hasLineBreak(const std::string& text) {
  return text.find('\n') != std::string::npos || text.find('\r') != std::string::npos;
}

bool hasEdgeWhitespace(const std::string& text) {
  return !text.empty() && (std::isspace(static_cast<unsigned char>(text.front())) ||
                           std::isspace(static_cast<unsigned char>(text.back())));
}

/// @brief Check a metadata key or scale symbol, written bare before `separator`.
std::string checkHeaderKey(const std::string& key, const char* separator) {
  if (key.empty()) return "must not be empty";
  if (hasEdgeWhitespace(key)) return "must not start or end with whitespace";
  if (hasLineBreak(key)) return "must not contain a line break";
  if (key.find(separator) != std::string::npos) {
    return std::string("must not contain '") + separator + "'";
  }
  if (key.find('"') != std::string::npos) return "must not contain a double quote";
  if (key.find("//") != std::string::npos) return "must not contain '//'";
  if (key.front() == '@' || key.compare(0, 2, "%%") == 0) {
    return "must not start with a block marker";
  }
  return "";
}

/// @brief Check a section title, written bare after '#'.
std::string checkTitle(const std::string& title) {
  if (title.empty()) return "must not be empty";
  if (hasEdgeWhitespace(title)) return "must not start or end with whitespace";
  if (hasLineBreak(title)) return "must not contain a line break";
  if (title.find("//") != std::string::npos) return "must not contain '//'";
  return "";
}

/// @brief Check one element. Returns an empty message when it is valid.
std::string checkElement(const Element& element) {
  if (!element.hasNote() && !element.hasLyrics()) {
    return "element must carry a note or lyrics";
  }
  if (element.hasLyrics()) {
    const std::string& lyrics = *element.lyrics;
    if (lyrics.empty()) return "lyrics must not be empty";
    if (lyrics.find('"') != std::string::npos) return "lyrics must not contain a double quote";
    if (hasLineBreak(lyrics)) return "lyrics must not contain a line break";
  }
  if (element.hasNote() && isSpecialPitch(element.note->pitch)) {
    if (element.note->octave != Octave::Middle) {
      return std::string(pitchToString(element.note->pitch)) + " cannot carry an octave";
    }
    if (element.hasLyrics()) {
      return std::string(pitchToString(element.note->pitch)) + " cannot carry lyrics";
    }
  }
  return "";
}

}  // namespace

ValidationResult checkDocument(const Document& doc) {
  auto name_it = doc.metadata.find("name");
  if (name_it == doc.metadata.end() || name_it->second.empty()) {
    return fail("metadata.name", "Document must have a name in metadata");
  }
  for (const auto& [key, value] : doc.metadata) {
    std::string problem = checkHeaderKey(key, ":");
    if (!problem.empty()) {
      return fail("metadata." + key, "Metadata key \"" + key + "\" " + problem);
    }
    if (hasLineBreak(value)) {
      return fail("metadata." + key, "Metadata value must not contain a line break");
    }
    if (value.find('"') != std::string::npos) {
      return fail("metadata." + key, "Metadata value must not contain a double quote");
    }
  }

  if (doc.scale.empty()) {
    return fail("scale", "Scale must contain at least one note mapping");
  }
  for (const auto& [symbol, name] : doc.scale) {
    std::string problem = checkHeaderKey(symbol, "->");
    if (!problem.empty()) {
      return fail("scale." + symbol, "Scale symbol \"" + symbol + "\" " + problem);
    }
    if (name.empty()) return fail("scale." + symbol, "Scale name must not be empty");
    if (hasEdgeWhitespace(name)) {
      return fail("scale." + symbol, "Scale name must not start or end with whitespace");
    }
    if (hasLineBreak(name) || name.find('"') != std::string::npos) {
      return fail("scale." + symbol,
                  "Scale name must not contain a line break or double quote");
    }
  }
  const auto& sections = doc.composition.sections;
  if (sections.empty()) {
    return fail("composition.sections", "Document must have at least one section");
  }

  for (size_t sec_idx = 0; sec_idx < sections.size(); ++sec_idx) {
    const Section& section = sections[sec_idx];
    std::string title_problem = checkTitle(section.title);
    if (!title_problem.empty()) {
      return fail("composition.sections[" + std::to_string(sec_idx) + "].title",
                  "Section title at index " + std::to_string(sec_idx) + " " + title_problem);
    }

    for (size_t beat_idx = 0; beat_idx < section.beats.size(); ++beat_idx) {
      const Beat& beat = section.beats[beat_idx];
      std::string path = beatPath(sec_idx, beat_idx);
      std::string where = " in section \"" + section.title + "\"";

      if (!beat.position) {
        return fail(path + ".position", "Beat at index " + std::to_string(beat_idx) + where +
                                            " must have a position");
      }
      if (beat.elements.empty()) {
        return fail(path + ".elements", "Beat at index " + std::to_string(beat_idx) + where +
                                            " must have at least one element");
      }
      for (size_t elem_idx = 0; elem_idx < beat.elements.size(); ++elem_idx) {
        std::string problem = checkElement(beat.elements[elem_idx]);
        if (!problem.empty()) {
          return fail(path + ".elements[" + std::to_string(elem_idx) + "]",
                      "Element " + std::to_string(elem_idx) + " of beat " +
                          std::to_string(beat_idx) + where + ": " + problem);
        }
      }
    }
  }

  return ValidationResult{};
}

void validate(const Document& doc) {
  ValidationResult result = checkDocument(doc);
  if (!result.success) {
    throw ValidationError(result.field, result.error_message);
  }
}

}  // namespace sur
