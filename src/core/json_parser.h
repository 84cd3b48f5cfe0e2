// Minimal flat-object JSON parser for configuration input (no external
// dependencies).
//
// Handles the subset needed for TheoryConfig: a flat object whose values are
// strings, numbers, booleans, null, or arrays of numbers. Nested objects and
// arrays holding anything but numbers are skipped.

#ifndef CHORDMAP_CORE_JSON_PARSER_H
#define CHORDMAP_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace chordmap {

/// @brief A single JSON value (string, number, boolean, or number array).
struct JsonValue {
  enum Type { String, Number, Bool, Null, NumberArray };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;
  std::vector<double> array_val;

  /// @brief Get value as integer, with default (also used when out of int range).
  int asInt(int default_val = 0) const;

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Get a number array as integers (truncated, saturated at the int
  ///        limits). Empty for other types.
  std::vector<int> asIntArray() const;
};

/// @brief Result of parsing a flat JSON object.
struct JsonParseResult {
  std::map<std::string, JsonValue> values;
  bool success = false;
  std::string error_message;
};

/// @brief Parse a flat JSON object into a key-value map.
///
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
/// @return Parsed map. success is false (with a message naming the byte
///         offset) when the text is not an object or is malformed.
JsonParseResult parseJsonObject(const char* json, size_t length);

/// @brief True if a JSON number converts to int without overflow.
bool fitsInt(double value);

}  // namespace chordmap

#endif  // CHORDMAP_CORE_JSON_PARSER_H
