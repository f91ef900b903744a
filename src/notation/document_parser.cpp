/// @file
/// @brief Block splitting, CONFIG/SCALE line parsing and section assembly.

#include "notation/document_parser.h"

#include <cctype>
#include <cstdint>
#include <utility>

#include "notation/beat_assembler.h"

namespace sur {

namespace {

std::string_view trim(std::string_view text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(start, end - start);
}

std::string_view stripQuotes(std::string_view text) {
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) return false;
  for (size_t idx = 0; idx < lhs.size(); ++idx) {
    if (std::toupper(static_cast<unsigned char>(lhs[idx])) !=
        std::toupper(static_cast<unsigned char>(rhs[idx]))) {
      return false;
    }
  }
  return true;
}

bool startsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

/// @brief Split text into lines, dropping the '\r' of CRLF endings.
std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.push_back(line);
    if (end == text.size()) break;
    start = end + 1;
  }
  return lines;
}

/// @brief Parser state for one parse() call.
class DocumentAssembler {
 public:
  explicit DocumentAssembler(std::vector<ParseWarning>& warnings) : warnings_(warnings) {}

  void feedLine(size_t line_number, std::string_view raw_line) {
    line_number_ = line_number;
    std::string stripped = stripComment(raw_line);
    std::string_view line = trim(stripped);
    if (line.empty()) return;

    BlockKind marker = parseModuleMarker(line);
    if (marker != BlockKind::None) {
      if (marker == BlockKind::Unknown) warn("unknown block marker, block skipped", line);
      block_ = marker;
      return;
    }

    switch (block_) {
      case BlockKind::None:
        warn("text outside any block ignored", line);
        break;
      case BlockKind::Unknown:
        break;
      case BlockKind::Config:
        parseConfigLine(line);
        break;
      case BlockKind::Scale:
        parseScaleLine(line);
        break;
      case BlockKind::Composition:
        parseCompositionLine(line);
        break;
    }
  }

  Document take() { return std::move(doc_); }

 private:
  void warn(std::string message, std::string_view fragment) {
    ParseWarning warning;
    warning.line = line_number_;
    warning.message = std::move(message);
    warning.fragment = std::string(fragment);
    warnings_.push_back(std::move(warning));
  }

  void parseConfigLine(std::string_view line) {
    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      warn("config line without ':' ignored", line);
      return;
    }
    std::string_view key = trim(line.substr(0, colon));
    if (key.empty()) {
      warn("config line without a key ignored", line);
      return;
    }
    std::string_view value = stripQuotes(trim(line.substr(colon + 1)));
    doc_.metadata[std::string(key)] = std::string(value);
  }

  void parseScaleLine(std::string_view line) {
    size_t arrow = line.find("->");
    if (arrow == std::string_view::npos) {
      warn("scale line without '->' ignored", line);
      return;
    }
    std::string_view symbol = trim(line.substr(0, arrow));
    std::string_view name = stripQuotes(trim(line.substr(arrow + 2)));
    if (symbol.empty() || name.empty()) {
      warn("incomplete scale mapping ignored", line);
      return;
    }
    doc_.scale[std::string(symbol)] = std::string(name);
  }

  void parseCompositionLine(std::string_view line) {
    if (line.front() == '#') {
      Section section;
      section.title = std::string(trim(line.substr(1)));
      doc_.composition.sections.push_back(std::move(section));
      row_ = 0;
      return;
    }

    if (!startsWith(line, "b:")) {
      warn("unrecognised composition line ignored", line);
      return;
    }
    if (doc_.composition.sections.empty()) {
      warn("beat line before any section header discarded", line);
      return;
    }

    size_t first_new = warnings_.size();
    std::vector<Beat> beats = parseBeatLine(line.substr(2), row_, &warnings_);
    for (size_t idx = first_new; idx < warnings_.size(); ++idx) {
      warnings_[idx].line = line_number_;
    }

    // A b: line with no beats ("b:", "b: []") does not take a row.
    if (beats.empty()) return;
    ++row_;

    auto& section_beats = doc_.composition.sections.back().beats;
    for (auto& beat : beats) section_beats.push_back(std::move(beat));
  }

  std::vector<ParseWarning>& warnings_;
  Document doc_;
  BlockKind block_ = BlockKind::None;
  size_t line_number_ = 0;
  uint32_t row_ = 0;
};

}  // namespace

BlockKind parseModuleMarker(std::string_view line) {
  std::string_view name;
  if (startsWith(line, "%%")) {
    name = trim(line.substr(2));
  } else if (startsWith(line, "@")) {
    name = trim(line.substr(1));
  } else {
    return BlockKind::None;
  }

  if (equalsIgnoreCase(name, "CONFIG")) return BlockKind::Config;
  if (equalsIgnoreCase(name, "SCALE")) return BlockKind::Scale;
  if (equalsIgnoreCase(name, "COMPOSITION")) return BlockKind::Composition;
  return BlockKind::Unknown;
}

std::string stripComment(std::string_view line) {
  bool in_quotes = false;
  for (size_t pos = 0; pos < line.size(); ++pos) {
    if (line[pos] == '"') {
      in_quotes = !in_quotes;
    } else if (!in_quotes && line[pos] == '/' && pos + 1 < line.size() && line[pos + 1] == '/') {
      return std::string(line.substr(0, pos));
    }
  }
  return std::string(line);
}

Document parse(std::string_view text, std::vector<ParseWarning>& warnings) {
  DocumentAssembler assembler(warnings);
  std::vector<std::string_view> lines = splitLines(text);
  for (size_t idx = 0; idx < lines.size(); ++idx) {
    assembler.feedLine(idx + 1, lines[idx]);
  }
  return assembler.take();
}

Document parse(std::string_view text) {
  std::vector<ParseWarning> warnings;
  Document doc = parse(text, warnings);
  logParseWarnings(warnings);
  return doc;
}

}  // namespace sur
