// Implementation of minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>

namespace tonerow {

uint64_t JsonValue::asUint64(uint64_t default_val) const {
  if (type == Number && number_val >= 0.0) return static_cast<uint64_t>(number_val);
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

/// @brief Cursor over the input with a sticky error.
struct Cursor {
  std::string_view text;
  size_t pos = 0;
  std::string error;

  bool atEnd() const { return pos >= text.size(); }
  char peek() const { return atEnd() ? '\0' : text[pos]; }

  void skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
  }

  bool fail(const std::string& what) {
    if (error.empty()) error = what + " at offset " + std::to_string(pos);
    return false;
  }
};

/// @brief Append a code point as UTF-8.
void appendUtf8(std::string& out, uint32_t code) {
  if (code < 0x80) {
    out += static_cast<char>(code);
  } else if (code < 0x800) {
    out += static_cast<char>(0xC0 | (code >> 6));
    out += static_cast<char>(0x80 | (code & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (code >> 12));
    out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code & 0x3F));
  }
}

/// @brief Decode the four hex digits of a \u escape (cursor at the 'u').
///
/// Leaves the cursor after the last digit. Code points outside the Basic
/// Multilingual Plane (surrogate pairs) are not combined.
bool parseUnicodeEscape(Cursor& cur, std::string& out) {
  ++cur.pos;
  if (cur.text.size() - cur.pos < 4) return cur.fail("truncated \\u escape");
  uint32_t code = 0;
  for (int digit = 0; digit < 4; ++digit) {
    char chr = cur.text[cur.pos];
    code <<= 4;
    if (chr >= '0' && chr <= '9') {
      code |= static_cast<uint32_t>(chr - '0');
    } else if (chr >= 'a' && chr <= 'f') {
      code |= static_cast<uint32_t>(chr - 'a' + 10);
    } else if (chr >= 'A' && chr <= 'F') {
      code |= static_cast<uint32_t>(chr - 'A' + 10);
    } else {
      return cur.fail("invalid \\u escape");
    }
    ++cur.pos;
  }
  appendUtf8(out, code);
  return true;
}

/// @brief Parse a string literal (cursor at the opening quote).
bool parseString(Cursor& cur, std::string& out) {
  if (cur.peek() != '"') return cur.fail("expected '\"'");
  ++cur.pos;
  out.clear();
  while (!cur.atEnd() && cur.peek() != '"') {
    char chr = cur.text[cur.pos];
    if (chr == '\\') {
      ++cur.pos;
      if (cur.atEnd()) break;
      switch (cur.text[cur.pos]) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'n':  out += '\n'; break;
        case 't':  out += '\t'; break;
        case 'r':  out += '\r'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'u':
          if (!parseUnicodeEscape(cur, out)) return false;
          continue;
        default:   out += cur.text[cur.pos]; break;
      }
    } else {
      out += chr;
    }
    ++cur.pos;
  }
  if (cur.atEnd()) return cur.fail("unterminated string");
  ++cur.pos;  // closing quote
  return true;
}

/// @brief Parse a number (integer, fraction, exponent).
bool parseNumber(Cursor& cur, JsonValue& out) {
  size_t start = cur.pos;
  if (cur.peek() == '-') ++cur.pos;
  while (!cur.atEnd() &&
         (std::isdigit(static_cast<unsigned char>(cur.peek())) || cur.peek() == '.' ||
          cur.peek() == 'e' || cur.peek() == 'E' || cur.peek() == '+' || cur.peek() == '-')) {
    ++cur.pos;
  }
  std::string num_str(cur.text.substr(start, cur.pos - start));
  char* end = nullptr;
  double val = std::strtod(num_str.c_str(), &end);
  if (num_str.empty() || end == num_str.c_str() || *end != '\0') {
    cur.pos = start;
    return cur.fail("invalid number");
  }
  out.type = JsonValue::Number;
  out.number_val = val;
  return true;
}

/// @brief Match a literal keyword such as "true".
bool parseKeyword(Cursor& cur, std::string_view word) {
  if (cur.text.substr(cur.pos, word.size()) != word) return cur.fail("invalid literal");
  cur.pos += word.size();
  return true;
}

/// @brief Skip a nested object or array (cursor at the opening bracket).
bool skipNested(Cursor& cur) {
  int depth = 0;
  std::string ignored;
  while (!cur.atEnd()) {
    char chr = cur.peek();
    if (chr == '"') {
      if (!parseString(cur, ignored)) return false;
      continue;
    }
    if (chr == '{' || chr == '[') ++depth;
    if (chr == '}' || chr == ']') --depth;
    ++cur.pos;
    if (depth == 0) return true;
  }
  return cur.fail("unterminated nested value");
}

}  // namespace

JsonParseResult parseJsonObject(std::string_view json) {
  JsonParseResult result;
  Cursor cur{json};

  cur.skipWhitespace();
  if (cur.peek() != '{') {
    cur.fail("expected '{'");
    result.error_message = cur.error;
    return result;
  }
  ++cur.pos;

  bool expect_member = false;
  while (true) {
    cur.skipWhitespace();
    if (cur.atEnd()) {
      cur.fail("unterminated object");
      break;
    }
    if (cur.peek() == '}' && !expect_member) {
      ++cur.pos;
      result.success = true;
      break;
    }

    std::string key;
    if (!parseString(cur, key)) break;
    cur.skipWhitespace();
    if (cur.peek() != ':') {
      cur.fail("expected ':'");
      break;
    }
    ++cur.pos;
    cur.skipWhitespace();

    JsonValue val;
    bool keep = true;
    bool parsed = false;
    char chr = cur.peek();
    if (chr == '"') {
      val.type = JsonValue::String;
      parsed = parseString(cur, val.string_val);
    } else if (chr == 't') {
      val.type = JsonValue::Bool;
      val.bool_val = true;
      parsed = parseKeyword(cur, "true");
    } else if (chr == 'f') {
      val.type = JsonValue::Bool;
      parsed = parseKeyword(cur, "false");
    } else if (chr == 'n') {
      parsed = parseKeyword(cur, "null");
    } else if (chr == '{' || chr == '[') {
      keep = false;
      parsed = skipNested(cur);
    } else {
      parsed = parseNumber(cur, val);
    }
    if (!parsed) break;
    if (keep) result.values[key] = val;

    cur.skipWhitespace();
    if (cur.peek() == ',') {
      ++cur.pos;
      expect_member = true;
    } else if (cur.peek() == '}') {
      expect_member = false;
    } else {
      cur.fail("expected ',' or '}'");
      break;
    }
  }

  if (result.success) {
    cur.skipWhitespace();
    if (!cur.atEnd()) {
      cur.fail("unexpected trailing content");
      result.success = false;
    }
  }

  if (!result.success) {
    result.values.clear();
    result.error_message = cur.error;
  }
  return result;
}

}  // namespace tonerow
