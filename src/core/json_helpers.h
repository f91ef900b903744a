// JSON writer for the document export.
//
// Appends to a string as calls arrive; output is compact unless
// toPrettyString() is used. Write-only.

#ifndef SUR_CORE_JSON_HELPERS_H
#define SUR_CORE_JSON_HELPERS_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sur {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("pitch");
///   writer.value("S");
///   writer.key("octave");
///   writer.value(1);
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"pitch":"S","octave":1}
/// @endcode
///
/// Separators are tracked per open container. Structure is not validated:
/// begin/end calls must pair up.
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object member name; the next call supplies its value.
  void key(std::string_view name);

  /// @brief Write an escaped string.
  void value(std::string_view val);

  /// @brief Write a string literal value. Keeps literals off the bool overload.
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(bool val);
  void valueNull();

  /// @brief key(name) then value(val).
  template <typename T>
  void field(std::string_view name, const T& val) {
    key(name);
    value(val);
  }

  /// @brief Compact JSON written so far.
  std::string toString() const;

  /// @brief Same JSON, one member or element per line.
  /// @param indent_size Spaces per nesting level.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Open container state.
  struct Frame {
    size_t items = 0;        ///< Values (or key/value pairs) written so far.
    bool after_key = false;  ///< A key was written and awaits its value.
  };

  /// Emit the separator owed before the next key or value.
  void separate();

  /// Record that a value completed in the innermost container.
  void finishValue();

  void open(char bracket);
  void close(char bracket);

  std::string buffer_;
  std::vector<Frame> frames_;
};

}  // namespace sur

#endif  // SUR_CORE_JSON_HELPERS_H
