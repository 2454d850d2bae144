/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_helpers.h"

#include <cstdio>

namespace tonerow {

void JsonWriter::beforeElement() {
  if (pending_key_) {
    pending_key_ = false;
    return;
  }
  if (!has_element_.empty() && has_element_.back()) {
    buffer_ += ',';
  }
}

void JsonWriter::afterElement() {
  if (!has_element_.empty()) {
    has_element_.back() = true;
  }
}

void JsonWriter::openContainer(char open) {
  beforeElement();
  buffer_ += open;
  has_element_.push_back(false);
}

void JsonWriter::closeContainer(char close) {
  buffer_ += close;
  if (!has_element_.empty()) {
    has_element_.pop_back();
  }
  afterElement();
}

void JsonWriter::beginObject() { openContainer('{'); }
void JsonWriter::endObject() { closeContainer('}'); }
void JsonWriter::beginArray() { openContainer('['); }
void JsonWriter::endArray() { closeContainer(']'); }

void JsonWriter::key(std::string_view name) {
  beforeElement();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  pending_key_ = true;
}

void JsonWriter::value(std::string_view val) {
  beforeElement();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
  afterElement();
}

void JsonWriter::value(int val) {
  beforeElement();
  buffer_ += std::to_string(val);
  afterElement();
}

void JsonWriter::value(uint64_t val) {
  beforeElement();
  buffer_ += std::to_string(val);
  afterElement();
}

void JsonWriter::value(bool val) {
  beforeElement();
  buffer_ += val ? "true" : "false";
  afterElement();
}

void JsonWriter::valueNull() {
  beforeElement();
  buffer_ += "null";
  afterElement();
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto newline = [&]() {
    result += '\n';
    result.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];
    if (in_string) {
      result += chr;
      if (escaped) {
        escaped = false;
      } else if (chr == '\\') {
        escaped = true;
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        result += chr;
        break;
      case '{':
      case '[':
        result += chr;
        ++depth;
        // Empty containers stay compact: {} or [].
        if (pos + 1 < buffer_.size() && buffer_[pos + 1] != '}' && buffer_[pos + 1] != ']') {
          newline();
        }
        break;
      case '}':
      case ']':
        --depth;
        if (!result.empty() && result.back() != '{' && result.back() != '[') {
          newline();
        }
        result += chr;
        break;
      case ',':
        result += chr;
        newline();
        break;
      case ':':
        result += ": ";
        break;
      default:
        result += chr;
        break;
    }
  }
  return result;
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }
  return result;
}

}  // namespace tonerow
