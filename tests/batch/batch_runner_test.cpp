// Tests for batch/batch_runner.h -- bulk enumeration driver.

#include "batch/batch_runner.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

#include "enumerate/row_enumerator.h"

namespace tonerow {
namespace {

/// Sink that keeps records in memory and can be told to fail.
class CollectingSink : public RecordSink {
 public:
  void begin() override { ++begin_calls; }
  void write(const RowAnalysis& analysis) override {
    records.push_back(analysis);
    if (fail_after > 0 && records.size() >= fail_after) failed = true;
  }
  void flush() override { ++flush_calls; }
  void end() override {
    ++end_calls;
    flush();
  }
  bool good() const override { return !failed; }

  std::vector<RowAnalysis> records;
  size_t fail_after = 0;
  bool failed = false;
  int begin_calls = 0;
  int flush_calls = 0;
  int end_calls = 0;
};

/// Read everything written to a temporary progress stream.
std::string drain(FILE* stream) {
  std::rewind(stream);
  std::string text;
  char buf[256];
  size_t count = 0;
  while ((count = std::fread(buf, 1, sizeof(buf), stream)) > 0) {
    text.append(buf, count);
  }
  return text;
}

TEST(BatchRunnerTest, LimitStopsEarly) {
  CollectingSink sink;
  BatchOptions options;
  options.limit = 3;
  BatchResult result = runBatch(options, sink);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.rows_processed, 3u);
  ASSERT_EQ(sink.records.size(), 3u);
  EXPECT_EQ(sink.records[0].prime_row, "0 1 2 3 4 5 6 7 8 9 10 11");
  EXPECT_EQ(sink.records[0].hexachordal, "I11 P6 RI5");
  EXPECT_EQ(sink.records[1].prime_row, "0 1 2 3 4 5 6 7 8 9 11 10");
  EXPECT_EQ(sink.records[2].prime_row, "0 1 2 3 4 5 6 7 8 10 9 11");
  EXPECT_EQ(sink.begin_calls, 1);
  EXPECT_EQ(sink.end_calls, 1);
}

TEST(BatchRunnerTest, OffsetResumesMidSequence) {
  CollectingSink sink;
  BatchOptions options;
  options.offset = 100;
  options.limit = 1;
  BatchResult result = runBatch(options, sink);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(sink.records.size(), 1u);
  EXPECT_EQ(sink.records[0].prime_row, "0 1 2 3 4 5 6 11 7 10 8 9");
}

TEST(BatchRunnerTest, LimitClampedToRemainingRows) {
  CollectingSink sink;
  BatchOptions options;
  options.offset = kTotalRowsStartingAtZero - 2;
  options.limit = 50;
  BatchResult result = runBatch(options, sink);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.rows_processed, 2u);
  EXPECT_EQ(sink.records.back().prime_row, "0 11 10 9 8 7 6 5 4 3 2 1");
}

TEST(BatchRunnerTest, OffsetPastEndFails) {
  CollectingSink sink;
  BatchOptions options;
  options.offset = kTotalRowsStartingAtZero;
  BatchResult result = runBatch(options, sink);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.rows_processed, 0u);
  EXPECT_FALSE(result.error_message.empty());
  EXPECT_EQ(sink.begin_calls, 0);
}

TEST(BatchRunnerTest, FlushesAtBatchBoundaries) {
  CollectingSink sink;
  BatchOptions options;
  options.limit = 10;
  options.batch_size = 4;
  ASSERT_TRUE(runBatch(options, sink).success);
  // Two full batches, then the flush from end().
  EXPECT_EQ(sink.flush_calls, 3);
}

TEST(BatchRunnerTest, ZeroBatchSizeFlushesEveryRecord) {
  CollectingSink sink;
  BatchOptions options;
  options.limit = 3;
  options.batch_size = 0;
  ASSERT_TRUE(runBatch(options, sink).success);
  EXPECT_EQ(sink.flush_calls, 4);
}

TEST(BatchRunnerTest, SinkFailureStopsRun) {
  FILE* progress = std::tmpfile();
  ASSERT_NE(progress, nullptr);
  CollectingSink sink;
  sink.fail_after = 2;
  BatchOptions options;
  options.limit = 10;
  options.progress_stream = progress;
  BatchResult result = runBatch(options, sink);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.rows_processed, 2u);
  EXPECT_EQ(sink.end_calls, 0);
  EXPECT_NE(drain(progress).find("[ERROR] Failed to write record 2"), std::string::npos);
  std::fclose(progress);
}

TEST(BatchRunnerTest, ProgressAndSuccessLines) {
  FILE* progress = std::tmpfile();
  ASSERT_NE(progress, nullptr);
  CollectingSink sink;
  BatchOptions options;
  options.limit = 8;
  options.progress = true;
  options.progress_stream = progress;
  ASSERT_TRUE(runBatch(options, sink).success);
  std::string text = drain(progress);
  std::fclose(progress);
  EXPECT_NE(text.find("\r[PROGRESS] 50.0% complete (4 rows processed)"), std::string::npos);
  EXPECT_NE(text.find("\r[PROGRESS] 100.0% complete (8 rows processed)"), std::string::npos);
  EXPECT_NE(text.find("\n[SUCCESS] 100% complete - Processed all 8 tone rows\n"),
            std::string::npos);
}

TEST(BatchRunnerTest, NoProgressOutputWhenDisabled) {
  FILE* progress = std::tmpfile();
  ASSERT_NE(progress, nullptr);
  CollectingSink sink;
  BatchOptions options;
  options.limit = 5;
  options.progress_stream = progress;
  ASSERT_TRUE(runBatch(options, sink).success);
  EXPECT_TRUE(drain(progress).empty());
  std::fclose(progress);
}

TEST(BatchRunnerTest, CsvSinkEndToEnd) {
  std::ostringstream out;
  CsvRecordSink sink(out);
  BatchOptions options;
  options.limit = 2;
  ASSERT_TRUE(runBatch(options, sink).success);
  std::string text = out.str();
  EXPECT_EQ(text.rfind("prime_row,", 0), 0u);
  EXPECT_NE(text.find("\"0 1 2 3 4 5 6 7 8 9 11 10\""), std::string::npos);
  size_t lines = 0;
  for (char chr : text) {
    if (chr == '\n') ++lines;
  }
  EXPECT_EQ(lines, 3u);
}

}  // namespace
}  // namespace tonerow
