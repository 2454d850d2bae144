// Tests for batch/record_sink.h -- CSV, JSON Lines and text sinks.

#include "batch/record_sink.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace tonerow {
namespace {

RowAnalysis sampleRecord(const char* prime, const char* hex) {
  RowAnalysis analysis;
  analysis.prime_row = prime;
  analysis.hexachordal = hex;
  analysis.tetrachordal = "I4 RI4";
  return analysis;
}

TEST(RecordSinkTest, FormatNames) {
  OutputFormat format = OutputFormat::Text;
  EXPECT_TRUE(outputFormatFromString("csv", format));
  EXPECT_EQ(format, OutputFormat::Csv);
  EXPECT_TRUE(outputFormatFromString("jsonl", format));
  EXPECT_EQ(format, OutputFormat::JsonLines);
  EXPECT_TRUE(outputFormatFromString("json", format));
  EXPECT_EQ(format, OutputFormat::JsonLines);
  EXPECT_TRUE(outputFormatFromString("text", format));
  EXPECT_EQ(format, OutputFormat::Text);
  EXPECT_FALSE(outputFormatFromString("xml", format));
  EXPECT_EQ(format, OutputFormat::Text);
  EXPECT_STREQ(outputFormatToString(OutputFormat::JsonLines), "json");
}

TEST(RecordSinkTest, CsvWritesHeaderThenRows) {
  std::ostringstream out;
  CsvRecordSink sink(out);
  sink.begin();
  sink.write(sampleRecord("0 1", "P6"));
  sink.write(sampleRecord("0 2", ""));
  sink.end();
  EXPECT_TRUE(sink.good());
  EXPECT_EQ(out.str(),
            "prime_row,hexachordal_combinatorials,tetrachordal_combinatorials,"
            "trichordal_combinatorials\n"
            "\"0 1\",\"P6\",\"I4 RI4\",\"\"\n"
            "\"0 2\",\"\",\"I4 RI4\",\"\"\n");
}

TEST(RecordSinkTest, CsvHeaderWithoutRecords) {
  std::ostringstream out;
  CsvRecordSink sink(out);
  sink.begin();
  sink.end();
  EXPECT_EQ(out.str(), std::string(RowAnalysis::csvHeader()) + "\n");
}

TEST(RecordSinkTest, JsonLinesOneObjectPerLine) {
  std::ostringstream out;
  JsonLinesRecordSink sink(out);
  sink.begin();
  sink.write(sampleRecord("0 1", "P6"));
  sink.write(sampleRecord("0 2", ""));
  sink.end();
  EXPECT_EQ(out.str(),
            "{\"prime_row\":\"0 1\",\"hexachordal_combinatorials\":\"P6\","
            "\"tetrachordal_combinatorials\":\"I4 RI4\",\"trichordal_combinatorials\":\"\"}\n"
            "{\"prime_row\":\"0 2\",\"hexachordal_combinatorials\":\"\","
            "\"tetrachordal_combinatorials\":\"I4 RI4\",\"trichordal_combinatorials\":\"\"}\n");
}

TEST(RecordSinkTest, TextSeparatesRecordsWithBlankLine) {
  std::ostringstream out;
  TextRecordSink sink(out);
  RowAnalysis first = sampleRecord("0 1", "P6");
  RowAnalysis second = sampleRecord("0 2", "");
  sink.begin();
  sink.write(first);
  sink.write(second);
  sink.end();
  EXPECT_EQ(out.str(), first.toText() + "\n" + second.toText());
}

TEST(RecordSinkTest, FactoryPicksSinkType) {
  std::ostringstream out;
  auto csv = makeRecordSink(OutputFormat::Csv, out);
  EXPECT_NE(dynamic_cast<CsvRecordSink*>(csv.get()), nullptr);
  auto json = makeRecordSink(OutputFormat::JsonLines, out);
  EXPECT_NE(dynamic_cast<JsonLinesRecordSink*>(json.get()), nullptr);
  auto text = makeRecordSink(OutputFormat::Text, out);
  EXPECT_NE(dynamic_cast<TextRecordSink*>(text.get()), nullptr);
}

TEST(RecordSinkTest, GoodReflectsStreamState) {
  std::ostringstream out;
  JsonLinesRecordSink sink(out);
  EXPECT_TRUE(sink.good());
  out.setstate(std::ios::badbit);
  EXPECT_FALSE(sink.good());
}

}  // namespace
}  // namespace tonerow
