// Analyzer configuration -- one value object assembled at startup from
// defaults, an optional JSON config file, and command-line flags.

#ifndef TONEROW_ANALYZER_CONFIG_H
#define TONEROW_ANALYZER_CONFIG_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "batch/record_sink.h"
#include "core/json_parser.h"

namespace tonerow {

/// What the CLI does with its input.
enum class RunMode : uint8_t {
  SingleRow,  ///< Analyze the row given by --row.
  Enumerate   ///< Analyze enumerated rows starting on pitch class 0.
};

/// @brief Convert RunMode to its config-file name ("row", "enumerate").
const char* runModeToString(RunMode mode);

/// Process-wide analyzer settings, built once and passed by reference.
struct AnalyzerConfig {
  RunMode mode = RunMode::SingleRow;
  std::string row_text;              ///< Row for SingleRow mode.
  OutputFormat format = OutputFormat::Text;
  std::string output_path;           ///< Empty = stdout.
  uint64_t limit = 0;                ///< Enumerate: rows to analyze (0 = all).
  uint64_t offset = 0;               ///< Enumerate: rows to skip first.
  uint32_t batch_size = 100;         ///< Enumerate: records per flush.
  bool show_matrix = false;          ///< SingleRow: print the matrix too.
  bool progress = false;             ///< Enumerate: progress line on stderr.
  bool verbose = false;
};

/// Configuration failure kinds.
enum class ConfigError : uint8_t {
  None,
  UnknownOption,
  MissingValue,
  InvalidNumber,
  InvalidFormat,
  InvalidMode,
  UnreadableFile,
  MalformedFile,
  MissingRow,
  RowWithEnumerate,
  OffsetOutOfRange,
  ZeroBatchSize
};

/// @brief Convert ConfigError to a short identifier string.
const char* configErrorToString(ConfigError error);

/// Outcome of building an AnalyzerConfig.
struct ConfigResult {
  bool success = false;
  bool help_requested = false;
  AnalyzerConfig config;
  ConfigError error = ConfigError::None;
  std::string error_message;
};

/// @brief Overlay values from a parsed JSON config object onto a config.
///
/// Recognized keys: mode, row, format, output, limit, offset, batch_size,
/// matrix, progress, verbose. Unknown keys are ignored.
///
/// @param values Parsed flat JSON object.
/// @param config Config to modify.
/// @param message Receives a description on failure.
/// @return ConfigError::None on success.
ConfigError applyConfigValues(const std::map<std::string, JsonValue>& values,
                              AnalyzerConfig& config, std::string& message);

/// @brief Read a JSON config file and overlay it onto a config.
ConfigError loadConfigFile(const std::string& path, AnalyzerConfig& config,
                           std::string& message);

/// @brief Serialize a config as a flat JSON object accepted by loadConfigFile.
///
/// An empty row or output path is written as null, which leaves the default
/// in place when the file is loaded again.
/// @param config Config to write.
/// @param pretty Indent the object over several lines.
std::string configToJson(const AnalyzerConfig& config, bool pretty = false);

/// @brief Check cross-field constraints of a complete config.
ConfigError validateConfig(const AnalyzerConfig& config, std::string& message);

/// @brief Settings that are valid but have no effect in combination.
/// @return One message per ignored setting (empty when none).
std::vector<std::string> configWarnings(const AnalyzerConfig& config);

/// @brief Build the config from command-line arguments.
///
/// A --config file is applied first wherever it appears; every other flag
/// then overrides it. --row or --enumerate given alone as a flag replaces the
/// file's mode, and --enumerate drops a row that came from the file. Both
/// given as flags is an error. The result is validated.
///
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @return Complete config, a help request, or the first failure.
ConfigResult parseCommandLine(int argc, const char* const argv[]);

}  // namespace tonerow

#endif  // TONEROW_ANALYZER_CONFIG_H
