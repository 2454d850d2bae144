// Implementation of the stream-backed record sinks.

#include "batch/record_sink.h"

namespace tonerow {

const char* outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::Text:      return "text";
    case OutputFormat::Csv:       return "csv";
    case OutputFormat::JsonLines: return "json";
  }
  return "text";
}

bool outputFormatFromString(const std::string& name, OutputFormat& out) {
  if (name == "text") {
    out = OutputFormat::Text;
  } else if (name == "csv") {
    out = OutputFormat::Csv;
  } else if (name == "json" || name == "jsonl") {
    out = OutputFormat::JsonLines;
  } else {
    return false;
  }
  return true;
}

void CsvRecordSink::begin() {
  out_ << RowAnalysis::csvHeader() << '\n';
}

void CsvRecordSink::write(const RowAnalysis& analysis) {
  out_ << analysis.toCsvRow() << '\n';
}

void JsonLinesRecordSink::write(const RowAnalysis& analysis) {
  out_ << analysis.toJson() << '\n';
}

void TextRecordSink::write(const RowAnalysis& analysis) {
  if (!first_) out_ << '\n';
  first_ = false;
  out_ << analysis.toText();
}

std::unique_ptr<RecordSink> makeRecordSink(OutputFormat format, std::ostream& out) {
  switch (format) {
    case OutputFormat::Csv:       return std::make_unique<CsvRecordSink>(out);
    case OutputFormat::JsonLines: return std::make_unique<JsonLinesRecordSink>(out);
    case OutputFormat::Text:      return std::make_unique<TextRecordSink>(out);
  }
  return std::make_unique<TextRecordSink>(out);
}

}  // namespace tonerow
