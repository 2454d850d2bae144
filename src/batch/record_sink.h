// Record sinks -- destinations for RowAnalysis records produced by the
// batch runner (CSV, JSON Lines, or plain text over an output stream).

#ifndef TONEROW_BATCH_RECORD_SINK_H
#define TONEROW_BATCH_RECORD_SINK_H

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "analysis/row_analysis.h"

namespace tonerow {

/// Output format for analysis records.
enum class OutputFormat : uint8_t {
  Text,
  Csv,
  JsonLines
};

/// @brief Convert OutputFormat to its command-line name ("text", "csv", "json").
const char* outputFormatToString(OutputFormat format);

/// @brief Parse an output format name.
/// @param name "text", "csv" or "json" (also accepts "jsonl").
/// @param out Receives the format on success.
/// @return False for an unknown name.
bool outputFormatFromString(const std::string& name, OutputFormat& out);

/// @brief Destination for analysis records.
///
/// The batch runner calls begin() once, write() per record, flush() at each
/// batch boundary, and end() once after the last record.
class RecordSink {
 public:
  virtual ~RecordSink() = default;

  /// @brief Called before the first record (headers, opening brackets).
  virtual void begin() {}

  /// @brief Consume one record.
  virtual void write(const RowAnalysis& analysis) = 0;

  /// @brief Make written records durable (end of a batch).
  virtual void flush() {}

  /// @brief Called after the last record.
  virtual void end() { flush(); }

  /// @brief False once the underlying destination has failed.
  virtual bool good() const { return true; }
};

/// @brief Base for sinks writing to a caller-owned std::ostream.
class StreamRecordSink : public RecordSink {
 public:
  explicit StreamRecordSink(std::ostream& out) : out_(out) {}

  void flush() override { out_.flush(); }
  bool good() const override { return static_cast<bool>(out_); }

 protected:
  std::ostream& out_;
};

/// CSV with a header line; one quoted record per line.
class CsvRecordSink : public StreamRecordSink {
 public:
  using StreamRecordSink::StreamRecordSink;
  void begin() override;
  void write(const RowAnalysis& analysis) override;
};

/// One compact JSON object per line.
class JsonLinesRecordSink : public StreamRecordSink {
 public:
  using StreamRecordSink::StreamRecordSink;
  void write(const RowAnalysis& analysis) override;
};

/// Four labelled lines per record, blank line between records.
class TextRecordSink : public StreamRecordSink {
 public:
  using StreamRecordSink::StreamRecordSink;
  void write(const RowAnalysis& analysis) override;

 private:
  bool first_ = true;
};

/// @brief Create the sink for a format over a caller-owned stream.
std::unique_ptr<RecordSink> makeRecordSink(OutputFormat format, std::ostream& out);

}  // namespace tonerow

#endif  // TONEROW_BATCH_RECORD_SINK_H
