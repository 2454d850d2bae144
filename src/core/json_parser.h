// Minimal flat-object JSON parser for configuration input (no external
// dependencies).
//
// Handles the subset needed for AnalyzerConfig files: one flat object with
// string, number, boolean and null values. Nested objects and arrays are
// skipped.

#ifndef TONEROW_CORE_JSON_PARSER_H
#define TONEROW_CORE_JSON_PARSER_H

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace tonerow {

/// @brief A single JSON value (string, number, boolean or null).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;


  /// @brief Get value as unsigned 64-bit integer; negatives yield the default.
  uint64_t asUint64(uint64_t default_val = 0) const;

  /// @brief Get value as boolean, with default for non-booleans.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default for non-strings.
  std::string asString(const std::string& default_val = "") const;
};

/// Outcome of parsing a flat JSON object.
struct JsonParseResult {
  bool success = false;
  std::map<std::string, JsonValue> values;
  std::string error_message;  ///< Includes the byte offset of the problem.
};

/// @brief Parse a flat JSON object into a key-value map.
/// @param json JSON text.
/// @return Parsed key-value pairs, or a failure with a message.
JsonParseResult parseJsonObject(std::string_view json);

}  // namespace tonerow

#endif  // TONEROW_CORE_JSON_PARSER_H
