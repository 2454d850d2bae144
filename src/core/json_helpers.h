// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach for analysis records and
// batch summaries. Does not parse JSON (see json_parser.h).

#ifndef TONEROW_CORE_JSON_HELPERS_H
#define TONEROW_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tonerow {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("prime_row");
///   writer.value("0 1 2 3 4 5 6 7 8 9 10 11");
///   writer.key("count");
///   writer.value(3);
///   writer.endObject();
///   // -> {"prime_row":"0 1 2 3 4 5 6 7 8 9 10 11","count":3}
/// @endcode
///
/// Commas are inserted automatically. Structure is not validated; callers
/// must balance begin/end calls.
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

  /// @brief Write a string value from a C string (avoids the bool overload).
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(uint64_t val);
  void value(bool val);
  void valueNull();

  /// @brief Get the accumulated compact JSON string.
  const std::string& toString() const { return buffer_; }

  /// @brief Get the accumulated JSON re-indented for reading.
  /// @param indent_size Spaces per nesting level.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Emit a separating comma when the current container already has an element.
  void beforeElement();

  /// Mark the current container as holding at least one element.
  void afterElement();

  void openContainer(char open);
  void closeContainer(char close);

  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: true once it holds an element.
  std::vector<bool> has_element_;

  // Set between key() and its value so the value is not comma-prefixed.
  bool pending_key_ = false;
};

}  // namespace tonerow

#endif  // TONEROW_CORE_JSON_HELPERS_H
