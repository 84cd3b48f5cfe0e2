// Implementation of the minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <climits>
#include <cstdlib>

namespace chordmap {

bool fitsInt(double value) {
  return value >= static_cast<double>(INT_MIN) && value <= static_cast<double>(INT_MAX);
}

int JsonValue::asInt(int default_val) const {
  if (type == Number && fitsInt(number_val)) return static_cast<int>(number_val);
  return default_val;
}

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

std::vector<int> JsonValue::asIntArray() const {
  std::vector<int> result;
  if (type != NumberArray) return result;
  result.reserve(array_val.size());
  for (double val : array_val) {
    if (fitsInt(val)) {
      result.push_back(static_cast<int>(val));
    } else {
      result.push_back(val < 0 ? INT_MIN : INT_MAX);
    }
  }
  return result;
}

namespace {

/// @brief Cursor over the JSON text.
struct Cursor {
  const char* json;
  size_t length;
  size_t pos;

  bool atEnd() const { return pos >= length; }
  char peek() const { return json[pos]; }
};

/// @brief Skip whitespace in JSON text.
void skipWhitespace(Cursor& cur) {
  while (!cur.atEnd() && std::isspace(static_cast<unsigned char>(cur.peek()))) {
    ++cur.pos;
  }
}

/// @brief Parse a JSON string literal (expects pos at opening quote).
/// @return False if the closing quote is missing.
bool parseString(Cursor& cur, std::string& out) {
  if (cur.atEnd() || cur.peek() != '"') return false;
  ++cur.pos;  // skip opening quote

  out.clear();
  while (!cur.atEnd() && cur.peek() != '"') {
    if (cur.peek() == '\\' && cur.pos + 1 < cur.length) {
      ++cur.pos;
      switch (cur.peek()) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'n':  out += '\n'; break;
        case 't':  out += '\t'; break;
        case 'r':  out += '\r'; break;
        default:   out += cur.peek(); break;
      }
    } else {
      out += cur.peek();
    }
    ++cur.pos;
  }

  if (cur.atEnd()) return false;
  ++cur.pos;  // skip closing quote
  return true;
}

/// @brief Parse a JSON number (integer or floating point, optional exponent).
bool parseNumber(Cursor& cur, double& out) {
  size_t start = cur.pos;
  if (!cur.atEnd() && (cur.peek() == '-' || cur.peek() == '+')) ++cur.pos;
  while (!cur.atEnd() &&
         (std::isdigit(static_cast<unsigned char>(cur.peek())) || cur.peek() == '.' ||
          cur.peek() == 'e' || cur.peek() == 'E' ||
          ((cur.peek() == '-' || cur.peek() == '+') &&
           (cur.json[cur.pos - 1] == 'e' || cur.json[cur.pos - 1] == 'E')))) {
    ++cur.pos;
  }
  if (cur.pos == start) return false;

  std::string num_str(cur.json + start, cur.pos - start);
  char* end = nullptr;
  out = std::strtod(num_str.c_str(), &end);
  return end != nullptr && *end == '\0';
}

/// @brief Match a literal keyword (true/false/null) at the cursor.
bool matchKeyword(Cursor& cur, const char* word) {
  size_t idx = 0;
  while (word[idx] != '\0') {
    if (cur.pos + idx >= cur.length || cur.json[cur.pos + idx] != word[idx]) return false;
    ++idx;
  }
  cur.pos += idx;
  return true;
}

/// @brief Skip a nested object or array we do not interpret.
void skipNested(Cursor& cur) {
  char open = cur.peek();
  char close = (open == '{') ? '}' : ']';
  int depth = 1;
  ++cur.pos;
  std::string ignored;
  while (!cur.atEnd() && depth > 0) {
    if (cur.peek() == '"') {
      if (!parseString(cur, ignored)) return;
      continue;
    }
    if (cur.peek() == open) ++depth;
    if (cur.peek() == close) --depth;
    ++cur.pos;
  }
}

/// @brief Parse an array; keeps it only if every element is a number.
/// @return False on malformed input.
bool parseArray(Cursor& cur, JsonValue& out, bool& keep) {
  size_t start = cur.pos;
  ++cur.pos;  // skip '['
  out.type = JsonValue::NumberArray;
  out.array_val.clear();
  keep = true;

  skipWhitespace(cur);
  if (!cur.atEnd() && cur.peek() == ']') {
    ++cur.pos;
    return true;
  }

  while (!cur.atEnd()) {
    skipWhitespace(cur);
    double number = 0.0;
    if (cur.atEnd()) break;
    if (cur.peek() == '-' || std::isdigit(static_cast<unsigned char>(cur.peek()))) {
      if (!parseNumber(cur, number)) return false;
      out.array_val.push_back(number);
    } else {
      // Not a number array: rewind and skip the whole value.
      cur.pos = start;
      skipNested(cur);
      keep = false;
      return true;
    }
    skipWhitespace(cur);
    if (cur.atEnd()) break;
    if (cur.peek() == ',') {
      ++cur.pos;
      continue;
    }
    if (cur.peek() == ']') {
      ++cur.pos;
      return true;
    }
    return false;
  }
  return false;
}

}  // namespace

JsonParseResult parseJsonObject(const char* json, size_t length) {
  JsonParseResult result;
  if (!json || length == 0) {
    result.error_message = "empty JSON input";
    return result;
  }

  Cursor cur{json, length, 0};
  auto fail = [&](const char* what) {
    result.values.clear();
    result.success = false;
    result.error_message = std::string(what) + " at offset " + std::to_string(cur.pos);
    return result;
  };

  skipWhitespace(cur);
  if (cur.atEnd() || cur.peek() != '{') return fail("expected '{'");
  ++cur.pos;  // skip '{'

  bool expect_key = true;
  while (true) {
    skipWhitespace(cur);
    if (cur.atEnd()) return fail("unterminated object");
    if (cur.peek() == '}') {
      ++cur.pos;
      break;
    }
    if (!expect_key) {
      if (cur.peek() != ',') return fail("expected ','");
      ++cur.pos;
      skipWhitespace(cur);
    }

    std::string key;
    if (!parseString(cur, key)) return fail("expected key string");

    skipWhitespace(cur);
    if (cur.atEnd() || cur.peek() != ':') return fail("expected ':'");
    ++cur.pos;
    skipWhitespace(cur);
    if (cur.atEnd()) return fail("missing value");

    JsonValue val;
    char chr = cur.peek();
    if (chr == '"') {
      val.type = JsonValue::String;
      if (!parseString(cur, val.string_val)) return fail("unterminated string");
      result.values[key] = val;
    } else if (chr == 't' || chr == 'f') {
      val.type = JsonValue::Bool;
      val.bool_val = (chr == 't');
      if (!matchKeyword(cur, val.bool_val ? "true" : "false")) return fail("bad literal");
      result.values[key] = val;
    } else if (chr == 'n') {
      if (!matchKeyword(cur, "null")) return fail("bad literal");
      result.values[key] = val;
    } else if (chr == '[') {
      bool keep = false;
      if (!parseArray(cur, val, keep)) return fail("malformed array");
      if (keep) result.values[key] = val;
    } else if (chr == '{') {
      skipNested(cur);
    } else {
      val.type = JsonValue::Number;
      if (!parseNumber(cur, val.number_val)) return fail("malformed number");
      result.values[key] = val;
    }
    expect_key = false;
  }

  result.success = true;
  return result;
}

}  // namespace chordmap
