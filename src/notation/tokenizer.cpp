/// @file
/// @brief Beat-line tokenizer: quotes, brackets, colons, note runs, lyrics.

#include "notation/tokenizer.h"

#include <cctype>
#include <utility>

namespace sur {

namespace {

constexpr size_t kNoWord = std::string_view::npos;

bool isPitchLetter(char chr) {
  Pitch pitch;
  return pitchFromChar(chr, pitch) && !isSpecialPitch(pitch);
}

bool isWhitespace(char chr) {
  return std::isspace(static_cast<unsigned char>(chr)) != 0;
}

Token makeToken(TokenType type, std::string text, size_t column) {
  Token token;
  token.type = type;
  token.text = std::move(text);
  token.column = column;
  return token;
}

/// @brief Emit the word [start, end) as note tokens or a single lyrics token.
void flushWord(std::string_view line, size_t start, size_t end, std::vector<Token>& tokens) {
  if (start == kNoWord || end <= start) return;
  std::string_view word = line.substr(start, end - start);

  std::vector<NoteUnit> units;
  if (parseNoteRun(word, units)) {
    for (const auto& unit : units) {
      Token token = makeToken(TokenType::Note, std::string(word.substr(unit.offset, unit.length)),
                              start + unit.offset);
      token.note = unit.note;
      tokens.push_back(std::move(token));
    }
    return;
  }
  tokens.push_back(makeToken(TokenType::Lyrics, std::string(word), start));
}

}  // namespace

const char* tokenTypeToString(TokenType type) {
  switch (type) {
    case TokenType::Note: return "NOTE";
    case TokenType::Lyrics: return "LYRICS";
    case TokenType::Colon: return "COLON";
    case TokenType::OpenBracket: return "OPEN_BRACKET";
    case TokenType::CloseBracket: return "CLOSE_BRACKET";
    case TokenType::Separator: return "SEPARATOR";
  }
  return "UNKNOWN";
}

bool parseNoteRun(std::string_view word, std::vector<NoteUnit>& out_units) {
  out_units.clear();
  if (word.empty()) return false;

  size_t pos = 0;
  while (pos < word.size()) {
    NoteUnit unit;
    unit.offset = pos;
    char chr = word[pos];

    if (chr == kLowerOctaveMark) {
      if (pos + 1 >= word.size() || !isPitchLetter(word[pos + 1])) {
        out_units.clear();
        return false;
      }
      pitchFromChar(word[pos + 1], unit.note.pitch);
      unit.note.octave = Octave::Lower;
      pos += 2;
    } else if (chr == kSilenceMark || chr == kSustainMark) {
      pitchFromChar(chr, unit.note.pitch);
      ++pos;
    } else if (isPitchLetter(chr)) {
      pitchFromChar(chr, unit.note.pitch);
      ++pos;
      if (pos < word.size() && word[pos] == kUpperOctaveMark) {
        unit.note.octave = Octave::Upper;
        ++pos;
      }
    } else {
      out_units.clear();
      return false;
    }

    unit.length = pos - unit.offset;
    out_units.push_back(unit);
  }
  return true;
}

bool isNoteRun(std::string_view word) {
  std::vector<NoteUnit> units;
  return parseNoteRun(word, units);
}

std::vector<Token> tokenizeBeatLine(std::string_view line) {
  std::vector<Token> tokens;
  size_t word_start = kNoWord;
  size_t pos = 0;

  while (pos < line.size()) {
    char chr = line[pos];

    if (chr == '"') {
      flushWord(line, word_start, pos, tokens);
      word_start = kNoWord;
      size_t close = line.find('"', pos + 1);
      size_t content_end = (close == std::string_view::npos) ? line.size() : close;
      tokens.push_back(makeToken(TokenType::Lyrics,
                                 std::string(line.substr(pos + 1, content_end - pos - 1)), pos));
      pos = (close == std::string_view::npos) ? line.size() : close + 1;
      continue;
    }

    if (isWhitespace(chr)) {
      flushWord(line, word_start, pos, tokens);
      word_start = kNoWord;
      size_t start = pos;
      while (pos < line.size() && isWhitespace(line[pos])) ++pos;
      tokens.push_back(makeToken(TokenType::Separator, " ", start));
      continue;
    }

    if (chr == '[' || chr == ']' || chr == ':') {
      flushWord(line, word_start, pos, tokens);
      word_start = kNoWord;
      TokenType type = (chr == '[')   ? TokenType::OpenBracket
                       : (chr == ']') ? TokenType::CloseBracket
                                      : TokenType::Colon;
      tokens.push_back(makeToken(type, std::string(1, chr), pos));
      ++pos;
      continue;
    }

    if (word_start == kNoWord) word_start = pos;
    ++pos;
  }

  flushWord(line, word_start, line.size(), tokens);
  return tokens;
}

}  // namespace sur
