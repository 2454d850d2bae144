// Implementation of analyzer configuration loading and validation.

#include "analyzer_config.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#include "core/json_helpers.h"
#include "enumerate/row_enumerator.h"

namespace tonerow {

namespace {

/// @brief Parse a non-negative decimal integer, rejecting junk and overflow.
bool parseUnsigned(const char* text, uint64_t& out) {
  if (!text || *text == '\0' || *text == '-' || *text == '+') return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long val = std::strtoull(text, &end, 10);
  if (errno != 0 || *end != '\0') return false;
  out = static_cast<uint64_t>(val);
  return true;
}

ConfigResult makeFailure(ConfigError error, const std::string& message) {
  ConfigResult result;
  result.error = error;
  result.error_message = message;
  return result;
}

/// @brief Fetch a numeric JSON member as uint64; false on wrong type.
bool jsonUnsigned(const JsonValue& val, uint64_t& out) {
  if (val.type != JsonValue::Number || val.number_val < 0.0) return false;
  if (val.number_val >= 18446744073709551616.0) return false;
  out = val.asUint64(0);
  return static_cast<double>(out) == val.number_val;
}

}  // namespace

const char* runModeToString(RunMode mode) {
  switch (mode) {
    case RunMode::SingleRow: return "row";
    case RunMode::Enumerate: return "enumerate";
  }
  return "row";
}

const char* configErrorToString(ConfigError error) {
  switch (error) {
    case ConfigError::None:             return "none";
    case ConfigError::UnknownOption:    return "unknown_option";
    case ConfigError::MissingValue:     return "missing_value";
    case ConfigError::InvalidNumber:    return "invalid_number";
    case ConfigError::InvalidFormat:    return "invalid_format";
    case ConfigError::InvalidMode:      return "invalid_mode";
    case ConfigError::UnreadableFile:   return "unreadable_file";
    case ConfigError::MalformedFile:    return "malformed_file";
    case ConfigError::MissingRow:       return "missing_row";
    case ConfigError::RowWithEnumerate: return "row_with_enumerate";
    case ConfigError::OffsetOutOfRange: return "offset_out_of_range";
    case ConfigError::ZeroBatchSize:    return "zero_batch_size";
  }
  return "unknown";
}

ConfigError applyConfigValues(const std::map<std::string, JsonValue>& values,
                              AnalyzerConfig& config, std::string& message) {
  auto it = values.find("mode");
  if (it != values.end()) {
    const std::string mode = it->second.asString();
    if (mode == "row") {
      config.mode = RunMode::SingleRow;
    } else if (mode == "enumerate") {
      config.mode = RunMode::Enumerate;
    } else {
      message = "config: mode must be \"row\" or \"enumerate\"";
      return ConfigError::InvalidMode;
    }
  }

  it = values.find("row");
  if (it != values.end()) {
    config.row_text = it->second.asString(config.row_text);
  }

  it = values.find("format");
  if (it != values.end()) {
    if (!outputFormatFromString(it->second.asString(), config.format)) {
      message = "config: format must be text, csv or json";
      return ConfigError::InvalidFormat;
    }
  }

  it = values.find("output");
  if (it != values.end()) {
    config.output_path = it->second.asString(config.output_path);
  }

  struct NumericKey {
    const char* name;
    uint64_t* target;
  };
  uint64_t batch_size = config.batch_size;
  NumericKey numeric_keys[] = {
      {"limit", &config.limit}, {"offset", &config.offset}, {"batch_size", &batch_size}};
  for (const auto& numeric : numeric_keys) {
    it = values.find(numeric.name);
    if (it == values.end()) continue;
    if (!jsonUnsigned(it->second, *numeric.target)) {
      message = std::string("config: ") + numeric.name + " must be a non-negative integer";
      return ConfigError::InvalidNumber;
    }
  }
  if (batch_size > UINT32_MAX) {
    message = "config: batch_size is too large";
    return ConfigError::InvalidNumber;
  }
  config.batch_size = static_cast<uint32_t>(batch_size);

  it = values.find("matrix");
  if (it != values.end()) config.show_matrix = it->second.asBool(config.show_matrix);
  it = values.find("progress");
  if (it != values.end()) config.progress = it->second.asBool(config.progress);
  it = values.find("verbose");
  if (it != values.end()) config.verbose = it->second.asBool(config.verbose);

  return ConfigError::None;
}

ConfigError loadConfigFile(const std::string& path, AnalyzerConfig& config,
                           std::string& message) {
  std::ifstream file(path);
  if (!file.is_open()) {
    message = "cannot open config file " + path;
    return ConfigError::UnreadableFile;
  }
  std::ostringstream contents;
  contents << file.rdbuf();

  JsonParseResult parsed = parseJsonObject(contents.str());
  if (!parsed.success) {
    message = path + ": " + parsed.error_message;
    return ConfigError::MalformedFile;
  }
  return applyConfigValues(parsed.values, config, message);
}

std::string configToJson(const AnalyzerConfig& config, bool pretty) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("mode");
  writer.value(runModeToString(config.mode));
  writer.key("row");
  if (config.row_text.empty()) {
    writer.valueNull();
  } else {
    writer.value(config.row_text);
  }
  writer.key("format");
  writer.value(outputFormatToString(config.format));
  writer.key("output");
  if (config.output_path.empty()) {
    writer.valueNull();
  } else {
    writer.value(config.output_path);
  }
  writer.key("limit");
  writer.value(config.limit);
  writer.key("offset");
  writer.value(config.offset);
  writer.key("batch_size");
  writer.value(static_cast<uint64_t>(config.batch_size));
  writer.key("matrix");
  writer.value(config.show_matrix);
  writer.key("progress");
  writer.value(config.progress);
  writer.key("verbose");
  writer.value(config.verbose);
  writer.endObject();
  return pretty ? writer.toPrettyString() : writer.toString();
}

ConfigError validateConfig(const AnalyzerConfig& config, std::string& message) {
  if (config.mode == RunMode::SingleRow && config.row_text.empty()) {
    message = "no row given (use --row or --enumerate)";
    return ConfigError::MissingRow;
  }
  if (config.mode == RunMode::Enumerate && !config.row_text.empty()) {
    message = "--row cannot be combined with --enumerate";
    return ConfigError::RowWithEnumerate;
  }
  if (config.offset >= kTotalRowsStartingAtZero) {
    message = "offset must be below " + std::to_string(kTotalRowsStartingAtZero);
    return ConfigError::OffsetOutOfRange;
  }
  if (config.batch_size == 0) {
    message = "batch size must be at least 1";
    return ConfigError::ZeroBatchSize;
  }
  return ConfigError::None;
}

std::vector<std::string> configWarnings(const AnalyzerConfig& config) {
  std::vector<std::string> warnings;
  if (config.show_matrix &&
      (config.mode == RunMode::Enumerate || config.format != OutputFormat::Text)) {
    warnings.push_back("--matrix is only printed for a single row with --format text");
  }
  return warnings;
}

ConfigResult parseCommandLine(int argc, const char* const argv[]) {
  ConfigResult result;
  AnalyzerConfig& config = result.config;
  std::string message;

  // Config file first so that flags override it regardless of position.
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--config") != 0) continue;
    if (idx + 1 >= argc) {
      return makeFailure(ConfigError::MissingValue, "--config requires a file path");
    }
    ConfigError error = loadConfigFile(argv[idx + 1], config, message);
    if (error != ConfigError::None) return makeFailure(error, message);
    ++idx;
  }

  bool row_flag = false;
  bool enumerate_flag = false;
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    auto requireValue = [&](const char* flag) -> const char* {
      if (idx + 1 >= argc) {
        message = std::string(flag) + " requires a value";
        return nullptr;
      }
      return argv[++idx];
    };
    auto requireNumber = [&](const char* flag, uint64_t& out) -> ConfigError {
      const char* val = requireValue(flag);
      if (!val) return ConfigError::MissingValue;
      if (!parseUnsigned(val, out)) {
        message = std::string(flag) + " expects a non-negative integer, got '" + val + "'";
        return ConfigError::InvalidNumber;
      }
      return ConfigError::None;
    };

    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      result.help_requested = true;
      result.success = true;
      return result;
    }

    ConfigError error = ConfigError::None;
    if (std::strcmp(arg, "--config") == 0) {
      ++idx;  // already applied
    } else if (std::strcmp(arg, "--row") == 0) {
      const char* val = requireValue(arg);
      if (!val) return makeFailure(ConfigError::MissingValue, message);
      config.row_text = val;
      row_flag = true;
    } else if (std::strcmp(arg, "--enumerate") == 0) {
      config.mode = RunMode::Enumerate;
      enumerate_flag = true;
    } else if (std::strcmp(arg, "--format") == 0) {
      const char* val = requireValue(arg);
      if (!val) return makeFailure(ConfigError::MissingValue, message);
      if (!outputFormatFromString(val, config.format)) {
        return makeFailure(ConfigError::InvalidFormat,
                           std::string("unknown format '") + val + "' (text, csv, json)");
      }
    } else if (std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--output") == 0) {
      const char* val = requireValue(arg);
      if (!val) return makeFailure(ConfigError::MissingValue, message);
      config.output_path = val;
    } else if (std::strcmp(arg, "--limit") == 0) {
      error = requireNumber(arg, config.limit);
    } else if (std::strcmp(arg, "--offset") == 0) {
      error = requireNumber(arg, config.offset);
    } else if (std::strcmp(arg, "--batch-size") == 0) {
      uint64_t batch_size = 0;
      error = requireNumber(arg, batch_size);
      if (error == ConfigError::None && batch_size > UINT32_MAX) {
        message = "--batch-size is too large";
        error = ConfigError::InvalidNumber;
      }
      config.batch_size = static_cast<uint32_t>(batch_size);
    } else if (std::strcmp(arg, "--matrix") == 0) {
      config.show_matrix = true;
    } else if (std::strcmp(arg, "--progress") == 0) {
      config.progress = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      config.verbose = true;
    } else {
      return makeFailure(ConfigError::UnknownOption, std::string("unknown option '") + arg + "'");
    }
    if (error != ConfigError::None) return makeFailure(error, message);
  }

  // A mode chosen by flag replaces the file's mode and the row that went with it.
  if (row_flag && !enumerate_flag) {
    config.mode = RunMode::SingleRow;
  } else if (enumerate_flag && !row_flag) {
    config.row_text.clear();
  }

  ConfigError error = validateConfig(config, message);
  if (error != ConfigError::None) return makeFailure(error, message);

  result.success = true;
  return result;
}

}  // namespace tonerow
