/// @file
/// @brief Fluent document construction.

#include "notation/document_builder.h"

#include <stdexcept>
#include <utility>

#include "notation/validator.h"

namespace sur {

DocumentBuilder& DocumentBuilder::addMetadata(const std::string& key, const std::string& value) {
  doc_.metadata[key] = value;
  return *this;
}

DocumentBuilder& DocumentBuilder::setMetadata(const Metadata& entries) {
  for (const auto& entry : entries) {
    doc_.metadata[entry.first] = entry.second;
  }
  return *this;
}

DocumentBuilder& DocumentBuilder::addScaleNote(const std::string& symbol,
                                               const std::string& name) {
  doc_.scale[symbol] = name;
  return *this;
}

DocumentBuilder& DocumentBuilder::setScale(const Scale& scale) {
  doc_.scale = scale;
  return *this;
}

DocumentBuilder& DocumentBuilder::beginSection(const std::string& title) {
  Section section;
  section.title = title;
  doc_.composition.sections.push_back(std::move(section));
  beat_open_ = false;
  row_ = 0;
  next_index_ = 0;
  return *this;
}

DocumentBuilder& DocumentBuilder::beginRow() {
  openSection("beginRow");
  // A row with no beats yet is reused rather than left empty.
  if (next_index_ > 0) {
    ++row_;
    next_index_ = 0;
  }
  beat_open_ = false;
  return *this;
}

DocumentBuilder& DocumentBuilder::beginBeat(bool bracketed) {
  return beginBeat(BeatPosition{row_, next_index_}, bracketed);
}

DocumentBuilder& DocumentBuilder::beginBeat(const BeatPosition& position, bool bracketed) {
  Section& section = openSection("beginBeat");
  Beat beat;
  beat.bracketed = bracketed;
  beat.position = position;
  section.beats.push_back(std::move(beat));
  beat_open_ = true;
  row_ = position.row;
  next_index_ = position.index + 1;
  return *this;
}

DocumentBuilder& DocumentBuilder::addNote(Pitch pitch, Octave octave) {
  Element element;
  element.note = Note{pitch, octave};
  return appendElement(std::move(element), "addNote");
}

DocumentBuilder& DocumentBuilder::addNote(Pitch pitch, Octave octave, const std::string& lyrics) {
  Element element;
  element.note = Note{pitch, octave};
  element.lyrics = lyrics;
  return appendElement(std::move(element), "addNote");
}

DocumentBuilder& DocumentBuilder::addRest() {
  Element element;
  element.note = Note{Pitch::Silence, Octave::Middle};
  return appendElement(std::move(element), "addRest");
}

DocumentBuilder& DocumentBuilder::addSustain() {
  Element element;
  element.note = Note{Pitch::Sustain, Octave::Middle};
  return appendElement(std::move(element), "addSustain");
}

DocumentBuilder& DocumentBuilder::addLyrics(const std::string& lyrics) {
  Element element;
  element.lyrics = lyrics;
  return appendElement(std::move(element), "addLyrics");
}

Document DocumentBuilder::build() const {
  validate(doc_);
  return doc_;
}

Section& DocumentBuilder::openSection(const char* operation) {
  if (doc_.composition.sections.empty()) {
    throw std::logic_error(std::string(operation) + ": no open section");
  }
  return doc_.composition.sections.back();
}

Beat& DocumentBuilder::openBeat(const char* operation) {
  Section& section = openSection(operation);
  if (!beat_open_ || section.beats.empty()) {
    throw std::logic_error(std::string(operation) + ": no open beat");
  }
  return section.beats.back();
}

DocumentBuilder& DocumentBuilder::appendElement(Element element, const char* operation) {
  openBeat(operation).elements.push_back(std::move(element));
  return *this;
}

}  // namespace sur
