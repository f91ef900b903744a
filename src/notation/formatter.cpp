/// @file
/// @brief Canonical beat, line, section and document rendering.

#include "notation/formatter.h"

#include <cctype>

#include "notation/tokenizer.h"

namespace sur {

namespace {

bool isStructuralChar(char chr) {
  return chr == '[' || chr == ']' || chr == ':' || chr == '"' || chr == kSilenceMark ||
         chr == kSustainMark;
}

/// Scale names are written bare unless the bare form would not re-parse.
std::string formatScaleName(const std::string& name) {
  bool quoted = name.find("//") != std::string::npos ||
                (!name.empty() && (name.front() == '"' || name.back() == '"'));
  return quoted ? "\"" + name + "\"" : name;
}

}  // namespace

std::string formatNote(const Note& note) {
  std::string text;
  if (isSpecialPitch(note.pitch)) {
    text += pitchToChar(note.pitch);
    return text;
  }
  if (note.octave == Octave::Lower) text += kLowerOctaveMark;
  text += pitchToChar(note.pitch);
  if (note.octave == Octave::Upper) text += kUpperOctaveMark;
  return text;
}

bool lyricsNeedQuotes(std::string_view lyrics) {
  if (lyrics.empty()) return true;
  for (char chr : lyrics) {
    if (std::isspace(static_cast<unsigned char>(chr)) || isStructuralChar(chr)) return true;
  }
  if (lyrics.find("//") != std::string_view::npos) return true;
  return isNoteRun(lyrics);
}

std::string formatLyrics(std::string_view lyrics) {
  if (lyricsNeedQuotes(lyrics)) {
    return "\"" + std::string(lyrics) + "\"";
  }
  return std::string(lyrics);
}

std::string formatElement(const Element& element) {
  if (element.hasLyrics() && element.hasNote()) {
    return formatLyrics(*element.lyrics) + ":" + formatNote(*element.note);
  }
  if (element.hasLyrics()) return formatLyrics(*element.lyrics);
  if (element.hasNote()) return formatNote(*element.note);
  return "";
}

std::string formatBeat(const Beat& beat) {
  bool has_lyrics = false;
  for (const auto& element : beat.elements) {
    if (element.hasLyrics()) {
      has_lyrics = true;
      break;
    }
  }

  std::string text;
  if (has_lyrics) {
    text += '[';
    for (size_t idx = 0; idx < beat.elements.size(); ++idx) {
      if (idx > 0) text += ' ';
      text += formatElement(beat.elements[idx]);
    }
    text += ']';
    return text;
  }

  // Note-only: dense form, whatever the element count.
  for (const auto& element : beat.elements) {
    text += formatElement(element);
  }
  return text;
}

std::string formatLine(const std::vector<Beat>& beats) {
  std::string line;
  for (const auto& beat : beats) {
    std::string text = formatBeat(beat);
    if (text.empty()) continue;
    if (!line.empty()) line += ' ';
    line += text;
  }
  return line;
}

std::string formatSection(const Section& section) {
  std::string text = "#" + section.title + "\n";

  std::vector<Beat> row_beats;
  bool row_known = false;
  uint32_t current_row = 0;

  auto flushRow = [&]() {
    std::string line = formatLine(row_beats);
    if (!line.empty()) text += "b: " + line + "\n";
    row_beats.clear();
  };

  for (const auto& beat : section.beats) {
    if (beat.position) {
      if (row_known && beat.position->row != current_row) flushRow();
      current_row = beat.position->row;
      row_known = true;
    }
    row_beats.push_back(beat);
  }
  flushRow();
  return text;
}

std::string format(const Document& doc) {
  std::string text = "%%CONFIG\n";
  for (const auto& [key, value] : doc.metadata) {
    text += key + ": \"" + value + "\"\n";
  }

  text += "\n%%SCALE\n";
  for (const auto& [symbol, name] : doc.scale) {
    text += symbol + " -> " + formatScaleName(name) + "\n";
  }

  text += "\n%%COMPOSITION\n";
  for (size_t idx = 0; idx < doc.composition.sections.size(); ++idx) {
    if (idx > 0) text += "\n";
    text += formatSection(doc.composition.sections[idx]);
  }
  return text;
}

}  // namespace sur
