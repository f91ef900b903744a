/// @file
/// @brief Lyric+colon+note fusion and structural pass-through.

#include "notation/element_builder.h"

#include <utility>

namespace sur {

namespace {

BeatItem makeMarker(BeatItem::Kind kind, size_t column) {
  BeatItem item;
  item.kind = kind;
  item.column = column;
  return item;
}

BeatItem makeElementItem(Element element, size_t column) {
  BeatItem item;
  item.kind = BeatItem::ElementItem;
  item.element = std::move(element);
  item.column = column;
  return item;
}

Element noteElement(const Note& note) {
  Element element;
  element.note = note;
  return element;
}

Element lyricsElement(const std::string& text) {
  Element element;
  element.lyrics = text;
  return element;
}

}  // namespace

std::vector<BeatItem> buildElements(const std::vector<Token>& tokens,
                                    std::vector<ParseWarning>* warnings) {
  std::vector<BeatItem> items;
  items.reserve(tokens.size());

  size_t idx = 0;
  while (idx < tokens.size()) {
    const Token& token = tokens[idx];

    switch (token.type) {
      case TokenType::Lyrics: {
        bool fuses = idx + 2 < tokens.size() && tokens[idx + 1].type == TokenType::Colon &&
                     tokens[idx + 2].type == TokenType::Note;
        if (!fuses) {
          items.push_back(makeElementItem(lyricsElement(token.text), token.column));
          ++idx;
          break;
        }
        const Token& note_token = tokens[idx + 2];
        if (isSpecialPitch(note_token.note.pitch)) {
          addWarning(warnings, tokens[idx + 1].column,
                     "lyrics cannot attach to a silence or sustain mark",
                     token.text + ":" + note_token.text);
          items.push_back(makeElementItem(lyricsElement(token.text), token.column));
          items.push_back(makeElementItem(noteElement(note_token.note), note_token.column));
        } else {
          Element element = noteElement(note_token.note);
          element.lyrics = token.text;
          items.push_back(makeElementItem(std::move(element), token.column));
        }
        idx += 3;
        break;
      }
      case TokenType::Note:
        items.push_back(makeElementItem(noteElement(token.note), token.column));
        ++idx;
        break;
      case TokenType::Colon:
        addWarning(warnings, token.column, "stray colon dropped", token.text);
        ++idx;
        break;
      case TokenType::OpenBracket:
        items.push_back(makeMarker(BeatItem::OpenBracket, token.column));
        ++idx;
        break;
      case TokenType::CloseBracket:
        items.push_back(makeMarker(BeatItem::CloseBracket, token.column));
        ++idx;
        break;
      case TokenType::Separator:
        items.push_back(makeMarker(BeatItem::Separator, token.column));
        ++idx;
        break;
    }
  }

  return items;
}

}  // namespace sur
