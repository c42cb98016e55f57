// Implementation of minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace scl {

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
}

int64_t JsonValue::asInt(int64_t default_val) const {
  if (type == Number) return static_cast<int64_t>(number_val);
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

namespace {

/// @brief Cursor over the JSON text.
struct JsonCursor {
  const char* json;
  size_t length;
  size_t pos = 0;

  bool atEnd() const { return pos >= length; }
  char peek() const { return json[pos]; }

  void skipWhitespace() {
    while (pos < length && std::isspace(static_cast<unsigned char>(json[pos]))) {
      ++pos;
    }
  }

  /// Consume an exact literal such as "true".
  bool consumeLiteral(const char* literal) {
    size_t len = std::strlen(literal);
    if (pos + len > length || std::strncmp(json + pos, literal, len) != 0) return false;
    pos += len;
    return true;
  }
};

/// @brief Parse a JSON string literal (expects cursor at opening quote).
/// @return False if the closing quote is missing.
bool parseString(JsonCursor& cur, std::string& out) {
  out.clear();
  if (cur.atEnd() || cur.peek() != '"') return false;
  ++cur.pos;

  while (!cur.atEnd() && cur.peek() != '"') {
    char chr = cur.peek();
    if (chr == '\\' && cur.pos + 1 < cur.length) {
      ++cur.pos;
      switch (cur.peek()) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'n':  out += '\n'; break;
        case 't':  out += '\t'; break;
        case 'r':  out += '\r'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        default:   out += cur.peek(); break;
      }
    } else {
      out += chr;
    }
    ++cur.pos;
  }

  if (cur.atEnd()) return false;
  ++cur.pos;  // closing quote
  return true;
}

/// @brief Parse a JSON number (integer, fraction, exponent).
bool parseNumber(JsonCursor& cur, double& out) {
  size_t start = cur.pos;
  while (!cur.atEnd()) {
    char chr = cur.peek();
    if (std::isdigit(static_cast<unsigned char>(chr)) || chr == '-' || chr == '+' ||
        chr == '.' || chr == 'e' || chr == 'E') {
      ++cur.pos;
    } else {
      break;
    }
  }
  if (cur.pos == start) return false;

  std::string num_str(cur.json + start, cur.pos - start);
  char* end = nullptr;
  out = std::strtod(num_str.c_str(), &end);
  return end == num_str.c_str() + num_str.size();
}

/// @brief Skip a nested object or array, honouring strings.
bool skipNested(JsonCursor& cur) {
  char open = cur.peek();
  char close = (open == '{') ? '}' : ']';
  int depth = 1;
  ++cur.pos;
  std::string scratch;
  while (!cur.atEnd() && depth > 0) {
    if (cur.peek() == '"') {
      if (!parseString(cur, scratch)) return false;
      continue;
    }
    if (cur.peek() == open) ++depth;
    if (cur.peek() == close) --depth;
    ++cur.pos;
  }
  return depth == 0;
}

}  // namespace

JsonObject parseJsonObject(const char* json, size_t length, bool* ok) {
  JsonObject result;
  bool well_formed = false;
  if (ok) *ok = false;
  if (!json || length == 0) return result;

  JsonCursor cur{json, length};
  cur.skipWhitespace();
  if (cur.atEnd() || cur.peek() != '{') return result;
  ++cur.pos;

  bool expect_entry = false;  // true right after a comma
  while (true) {
    cur.skipWhitespace();
    if (cur.atEnd()) break;
    if (cur.peek() == '}') {
      well_formed = !expect_entry;
      break;
    }

    std::string key;
    if (!parseString(cur, key)) break;

    cur.skipWhitespace();
    if (cur.atEnd() || cur.peek() != ':') break;
    ++cur.pos;
    cur.skipWhitespace();
    if (cur.atEnd()) break;

    JsonValue val;
    bool parsed = true;
    bool keep = true;
    char chr = cur.peek();
    if (chr == '"') {
      val.type = JsonValue::String;
      parsed = parseString(cur, val.string_val);
    } else if (chr == 't' || chr == 'f') {
      val.type = JsonValue::Bool;
      val.bool_val = (chr == 't');
      parsed = cur.consumeLiteral(val.bool_val ? "true" : "false");
    } else if (chr == 'n') {
      val.type = JsonValue::Null;
      parsed = cur.consumeLiteral("null");
    } else if (chr == '{' || chr == '[') {
      parsed = skipNested(cur);
      keep = false;
    } else {
      val.type = JsonValue::Number;
      parsed = parseNumber(cur, val.number_val);
    }
    if (!parsed) break;
    if (keep) result[key] = val;

    cur.skipWhitespace();
    expect_entry = false;
    if (!cur.atEnd() && cur.peek() == ',') {
      ++cur.pos;
      expect_entry = true;
    } else if (cur.atEnd() || cur.peek() != '}') {
      break;
    }
  }

  if (ok) *ok = well_formed;
  return result;
}

const JsonValue* findJsonValue(const JsonObject& object, const std::string& key) {
  auto it = object.find(key);
  return it == object.end() ? nullptr : &it->second;
}

}  // namespace scl
