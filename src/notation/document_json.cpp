/// @file
/// @brief Document to JSON export via JsonWriter.

#include "notation/document_json.h"

#include "core/json_helpers.h"

namespace sur {

namespace {

void writeStringMap(JsonWriter& writer, const std::map<std::string, std::string>& entries) {
  writer.beginObject();
  for (const auto& entry : entries) {
    writer.field(entry.first, entry.second);
  }
  writer.endObject();
}

void writeElement(JsonWriter& writer, const Element& element) {
  writer.beginObject();
  if (element.hasLyrics()) {
    writer.field("lyrics", *element.lyrics);
  }
  if (element.hasNote()) {
    writer.key("note");
    writer.beginObject();
    writer.field("pitch", std::string(1, pitchToChar(element.note->pitch)));
    writer.field("octave", static_cast<int>(element.note->octave));
    writer.endObject();
  }
  writer.endObject();
}

void writeBeat(JsonWriter& writer, const Beat& beat) {
  writer.beginObject();
  writer.field("bracketed", beat.bracketed);
  writer.key("position");
  if (beat.position) {
    writer.beginObject();
    writer.field("row", static_cast<int>(beat.position->row));
    writer.field("index", static_cast<int>(beat.position->index));
    writer.endObject();
  } else {
    writer.valueNull();
  }
  writer.key("elements");
  writer.beginArray();
  for (const auto& element : beat.elements) writeElement(writer, element);
  writer.endArray();
  writer.endObject();
}

}  // namespace

std::string documentToJson(const Document& doc, bool pretty) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("metadata");
  writeStringMap(writer, doc.metadata);
  writer.key("scale");
  writeStringMap(writer, doc.scale);

  writer.key("composition");
  writer.beginObject();
  writer.key("sections");
  writer.beginArray();
  for (const auto& section : doc.composition.sections) {
    writer.beginObject();
    writer.field("title", section.title);
    writer.key("beats");
    writer.beginArray();
    for (const auto& beat : section.beats) writeBeat(writer, beat);
    writer.endArray();
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();

  writer.endObject();
  return pretty ? writer.toPrettyString() : writer.toString();
}

}  // namespace sur
