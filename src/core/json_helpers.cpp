/// @file
/// @brief Implementation of the minimal JSON writer used by the document export.

#include "core/json_helpers.h"

#include <cstdio>

namespace sur {

namespace {

/// @brief Append `input` to `out` with JSON string escapes applied.
void appendEscaped(std::string& out, std::string_view input) {
  for (char chr : input) {
    const char* escape = nullptr;
    switch (chr) {
      case '"': escape = "\\\""; break;
      case '\\': escape = "\\\\"; break;
      case '\b': escape = "\\b"; break;
      case '\f': escape = "\\f"; break;
      case '\n': escape = "\\n"; break;
      case '\r': escape = "\\r"; break;
      case '\t': escape = "\\t"; break;
      default: break;
    }
    if (escape) {
      out += escape;
    } else if (static_cast<unsigned char>(chr) < 0x20) {
      char code[8];
      std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(chr));
      out += code;
    } else {
      out += chr;
    }
  }
}

/// @brief Re-indent compact JSON. Empty containers stay on one line.
std::string indentJson(std::string_view compact, int indent_size) {
  std::string out;
  out.reserve(compact.size() * 2);
  size_t depth = 0;
  bool in_string = false;

  auto breakLine = [&]() {
    out += '\n';
    out.append(depth * static_cast<size_t>(indent_size), ' ');
  };

  for (size_t pos = 0; pos < compact.size(); ++pos) {
    char chr = compact[pos];
    if (in_string) {
      out += chr;
      if (chr == '\\' && pos + 1 < compact.size()) {
        out += compact[++pos];
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    bool next_closes =
        pos + 1 < compact.size() && (compact[pos + 1] == '}' || compact[pos + 1] == ']');
    switch (chr) {
      case '"':
        in_string = true;
        out += chr;
        break;
      case '{':
      case '[':
        out += chr;
        ++depth;
        if (!next_closes) breakLine();
        break;
      case '}':
      case ']': {
        bool empty = !out.empty() && (out.back() == '{' || out.back() == '[');
        if (depth > 0) --depth;
        if (!empty) breakLine();
        out += chr;
        break;
      }
      case ',':
        out += chr;
        breakLine();
        break;
      case ':':
        out += ": ";
        break;
      default:
        out += chr;
        break;
    }
  }
  return out;
}

}  // namespace

void JsonWriter::open(char bracket) {
  separate();
  buffer_ += bracket;
  frames_.emplace_back();
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!frames_.empty()) frames_.pop_back();
  finishValue();
}

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  separate();
  buffer_ += '"';
  appendEscaped(buffer_, name);
  buffer_ += "\":";
  if (!frames_.empty()) frames_.back().after_key = true;
}

void JsonWriter::value(std::string_view val) {
  separate();
  buffer_ += '"';
  appendEscaped(buffer_, val);
  buffer_ += '"';
  finishValue();
}

void JsonWriter::value(int val) {
  separate();
  buffer_ += std::to_string(val);
  finishValue();
}

void JsonWriter::value(bool val) {
  separate();
  buffer_ += val ? "true" : "false";
  finishValue();
}

void JsonWriter::valueNull() {
  separate();
  buffer_ += "null";
  finishValue();
}

std::string JsonWriter::toString() const {
  return buffer_;
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  return indentJson(buffer_, indent_size);
}

void JsonWriter::separate() {
  if (frames_.empty()) return;
  Frame& frame = frames_.back();
  // A value directly after its key takes no comma.
  if (frame.items > 0 && !frame.after_key) buffer_ += ',';
}

void JsonWriter::finishValue() {
  if (frames_.empty()) return;
  Frame& frame = frames_.back();
  frame.after_key = false;
  ++frame.items;
}

}  // namespace sur
