/// @file
/// @brief Single-pass beat grouping with one inside-brackets flag.

#include "notation/beat_assembler.h"

#include <utility>

#include "notation/tokenizer.h"

namespace sur {

namespace {

/// @brief Accumulates elements of the beat under construction.
class BeatAccumulator {
 public:
  explicit BeatAccumulator(uint32_t row) : row_(row) {}

  void add(const Element& element) { pending_.push_back(element); }

  bool empty() const { return pending_.empty(); }

  /// Emit the pending elements as one beat; no-op when nothing is pending.
  void flush(bool bracketed, std::vector<Beat>& beats) {
    if (pending_.empty()) return;
    Beat beat;
    beat.elements = std::move(pending_);
    beat.bracketed = bracketed;
    beat.position = BeatPosition{row_, next_index_++};
    beats.push_back(std::move(beat));
    pending_.clear();
  }

 private:
  uint32_t row_;
  uint32_t next_index_ = 0;
  std::vector<Element> pending_;
};

}  // namespace

std::vector<Beat> assembleBeats(const std::vector<BeatItem>& items, uint32_t row,
                                std::vector<ParseWarning>* warnings) {
  std::vector<Beat> beats;
  BeatAccumulator acc(row);
  bool in_brackets = false;

  for (const auto& item : items) {
    switch (item.kind) {
      case BeatItem::ElementItem:
        acc.add(item.element);
        break;

      case BeatItem::Separator:
        if (!in_brackets) acc.flush(false, beats);
        break;

      case BeatItem::OpenBracket:
        if (in_brackets) {
          addWarning(warnings, item.column, "nested bracket ignored", "[");
          break;
        }
        acc.flush(false, beats);
        in_brackets = true;
        break;

      case BeatItem::CloseBracket:
        if (!in_brackets) {
          addWarning(warnings, item.column, "unmatched closing bracket dropped", "]");
          break;
        }
        if (acc.empty()) {
          addWarning(warnings, item.column, "empty brackets produce no beat", "[]");
        }
        acc.flush(true, beats);
        in_brackets = false;
        break;
    }
  }

  if (in_brackets) {
    addWarning(warnings, items.empty() ? 0 : items.back().column,
               "unclosed bracket closed at end of line", "[");
  }
  acc.flush(in_brackets, beats);
  return beats;
}

std::vector<Beat> parseBeatLine(std::string_view content, uint32_t row,
                                std::vector<ParseWarning>* warnings) {
  std::vector<Token> tokens = tokenizeBeatLine(content);
  std::vector<BeatItem> items = buildElements(tokens, warnings);
  return assembleBeats(items, row, warnings);
}

}  // namespace sur
