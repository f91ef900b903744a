// Tokenizer for the content of one composition line (text after "b:").

#ifndef SUR_NOTATION_TOKENIZER_H
#define SUR_NOTATION_TOKENIZER_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "notation/notation_types.h"

namespace sur {

enum class TokenType : uint8_t {
  Note,
  Lyrics,
  Colon,
  OpenBracket,
  CloseBracket,
  Separator
};

/// @brief Token name for diagnostics ("NOTE", "LYRICS", ...).
const char* tokenTypeToString(TokenType type);

/// @brief One lexical unit of a beat line.
///
/// The note/lyrics decision is taken once, here: a Note token already carries
/// its decoded Note, so later stages never re-classify text.
struct Token {
  TokenType type = TokenType::Separator;
  std::string text;  ///< Source text (quotes stripped for quoted lyrics).
  size_t column = 0;
  Note note;         ///< Valid only when type == TokenType::Note.
};

/// @brief One note unit found inside a compact note run such as "S'R.G".
struct NoteUnit {
  Note note;
  size_t offset = 0;  ///< Offset of the unit within the run.
  size_t length = 0;  ///< 1 or 2 characters.
};

/// @brief Split a word into note units.
///
/// Unit grammar: `.X`, `X`, `X'` for X in S R G M P D N; `-`; `*`.
/// Succeeds only if the whole word is consumed.
///
/// @param word Text without whitespace or structural characters.
/// @param out_units Output units on success, cleared on failure.
/// @return True if the entire word is a run of note units.
bool parseNoteRun(std::string_view word, std::vector<NoteUnit>& out_units);

/// @brief Check whether a word would tokenize as one or more notes.
bool isNoteRun(std::string_view word);

/// @brief Tokenize the content of a beat line.
///
/// Never fails: any character run that is not a note run becomes a Lyrics
/// token, and an unterminated quote extends to the end of the line.
///
/// @param line Beat content, without the leading "b:".
/// @return Tokens in source order.
std::vector<Token> tokenizeBeatLine(std::string_view line);

}  // namespace sur

#endif  // SUR_NOTATION_TOKENIZER_H
