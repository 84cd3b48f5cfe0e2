// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output with a string-builder approach. Used for chord and
// scale descriptions, ranked branch results, and exploration snapshots.

#ifndef CHORDMAP_CORE_JSON_HELPERS_H
#define CHORDMAP_CORE_JSON_HELPERS_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace chordmap {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.field("root", "C");
///   writer.key("pitch_classes");
///   writer.beginArray();
///   writer.value(0);
///   writer.value(4);
///   writer.endArray();
///   writer.endObject();
///   // -> {"root":"C","pitch_classes":[0,4]}
/// @endcode
///
/// Commas are inserted automatically. Structure is not validated; callers
/// must match begin/end pairs.
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a C-string value. Keeps literals from binding to value(bool).
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(size_t val);

  /// @brief Write a floating-point value (NaN and infinity become null).
  void value(double val);

  void value(bool val);
  void valueNull();

  /// @brief Write "name": val in one call.
  template <typename T>
  void field(std::string_view name, const T& val) {
    key(name);
    value(val);
  }

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if the current container already holds an element.
  void maybeComma();

  /// Mark that the current container now holds an element.
  void markWritten();

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: true once it holds an element.
  std::vector<bool> needs_comma_;
};

}  // namespace chordmap

#endif  // CHORDMAP_CORE_JSON_HELPERS_H
