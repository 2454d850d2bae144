/// @file
/// @brief CLI entry point for the twelve-tone row analyzer.

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "analysis/row_analysis.h"
#include "analyzer_config.h"
#include "batch/batch_runner.h"
#include "batch/record_sink.h"
#include "enumerate/row_enumerator.h"
#include "row/tone_row.h"

namespace {

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("tonerow_cli - Twelve-Tone Row Combinatoriality Analyzer\n\n");
  std::printf("Usage: tonerow_cli --row \"0 11 3 4 8 7 9 5 6 1 2 10\" [options]\n");
  std::printf("       tonerow_cli --enumerate [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --row ROW        Row to analyze (integers, t/e, or note names)\n");
  std::printf("  --enumerate      Analyze every row starting on pitch class 0\n");
  std::printf("  --limit N        Enumerate: analyze at most N rows (0 = all)\n");
  std::printf("  --offset N       Enumerate: skip the first N rows\n");
  std::printf("  --batch-size N   Enumerate: records per output flush (default 100)\n");
  std::printf("  --format FMT     Output format: text, csv, json\n");
  std::printf("  --matrix         Print the twelve-tone matrix (single row)\n");
  std::printf("  --progress       Show progress on stderr (enumerate)\n");
  std::printf("  --config FILE    Read settings from a JSON file (flags override)\n");
  std::printf("  --verbose        Print the effective configuration\n");
  std::printf("  -o FILE          Output file path (default stdout)\n");
  std::printf("  --help           Show this help\n");
}

/// @brief Echo the effective configuration to stderr as loadable JSON.
void printConfig(const tonerow::AnalyzerConfig& config) {
  std::fprintf(stderr, "Configuration:\n%s\n\n", tonerow::configToJson(config, true).c_str());
}

/// @brief Analyze the single row named in the config.
int runSingleRow(const tonerow::AnalyzerConfig& config, std::ostream& out) {
  tonerow::ToneRowResult parsed = tonerow::parseRow(config.row_text);
  if (!parsed.success) {
    std::fprintf(stderr, "Error: invalid row: %s\n", parsed.error_message.c_str());
    return 1;
  }

  const tonerow::ToneRow& row = *parsed.row;
  if (config.show_matrix && config.format == tonerow::OutputFormat::Text) {
    out << row.matrix().toText() << "\n";
  }

  std::unique_ptr<tonerow::RecordSink> sink = tonerow::makeRecordSink(config.format, out);
  sink->begin();
  sink->write(tonerow::analyzeRow(row));
  sink->end();
  if (!sink->good()) {
    std::fprintf(stderr, "Error: failed to write output\n");
    return 1;
  }
  return 0;
}

/// @brief Run the bulk enumeration described by the config.
int runEnumerate(const tonerow::AnalyzerConfig& config, std::ostream& out) {
  std::unique_ptr<tonerow::RecordSink> sink = tonerow::makeRecordSink(config.format, out);

  tonerow::BatchOptions options;
  options.limit = config.limit;
  options.offset = config.offset;
  options.batch_size = config.batch_size;
  options.progress = config.progress;
  options.progress_stream = stderr;

  tonerow::BatchResult result = tonerow::runBatch(options, *sink);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }
  if (config.verbose) {
    std::fprintf(stderr, "Rows:       %llu of %llu\n",
                 static_cast<unsigned long long>(result.rows_processed),
                 static_cast<unsigned long long>(tonerow::kTotalRowsStartingAtZero));
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  tonerow::ConfigResult parsed = tonerow::parseCommandLine(argc, argv);
  if (!parsed.success) {
    std::fprintf(stderr, "Error: %s\n", parsed.error_message.c_str());
    std::fprintf(stderr, "Try 'tonerow_cli --help'.\n");
    return 1;
  }
  if (parsed.help_requested) {
    printUsage();
    return 0;
  }

  const tonerow::AnalyzerConfig& config = parsed.config;
  if (config.verbose) {
    printConfig(config);
  }
  for (const std::string& warning : tonerow::configWarnings(config)) {
    std::fprintf(stderr, "Warning: %s\n", warning.c_str());
  }

  std::ofstream file;
  if (!config.output_path.empty()) {
    file.open(config.output_path);
    if (!file.is_open()) {
      std::fprintf(stderr, "Error: failed to open %s\n", config.output_path.c_str());
      return 1;
    }
  }
  std::ostream& out = config.output_path.empty() ? std::cout : file;

  int status = config.mode == tonerow::RunMode::Enumerate ? runEnumerate(config, out)
                                                            : runSingleRow(config, out);
  if (status == 0 && !config.output_path.empty() && config.verbose) {
    std::fprintf(stderr, "Wrote %s\n", config.output_path.c_str());
  }
  return status;
}
