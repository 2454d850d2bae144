// Implementation of the bulk enumeration driver.

#include "batch/batch_runner.h"

#include <algorithm>

#include "analysis/row_analysis.h"
#include "enumerate/row_enumerator.h"
#include "row/tone_row.h"

namespace tonerow {

namespace {

/// @brief Overwrite the progress line in place.
void reportProgress(FILE* stream, uint64_t processed, uint64_t total) {
  double percentage = total > 0 ? (static_cast<double>(processed) / total) * 100.0 : 100.0;
  std::fprintf(stream, "\r[PROGRESS] %.1f%% complete (%llu rows processed)", percentage,
               static_cast<unsigned long long>(processed));
  std::fflush(stream);
}

}  // namespace

BatchResult runBatch(const BatchOptions& options, RecordSink& sink) {
  BatchResult result;
  FILE* progress_stream = options.progress_stream ? options.progress_stream : stderr;

  if (options.offset >= kTotalRowsStartingAtZero) {
    result.error_message = "offset " + std::to_string(options.offset) +
                           " is past the last row (" +
                           std::to_string(kTotalRowsStartingAtZero) + ")";
    return result;
  }

  RowEnumerator enumerator;
  enumerator.skip(options.offset);

  const uint64_t total = options.limit > 0
                             ? std::min(options.limit, enumerator.remaining())
                             : enumerator.remaining();
  const uint32_t batch_size = std::max<uint32_t>(options.batch_size, 1);
  // One progress update per 0.1% keeps the line readable on full runs.
  const uint64_t progress_step = std::max<uint64_t>(total / 1000, 1);

  sink.begin();
  uint32_t batch_count = 0;
  RowArray permutation;
  while (result.rows_processed < total && enumerator.next(permutation)) {
    sink.write(analyzeRow(ToneRow::fromPermutation(permutation)));
    ++result.rows_processed;

    if (++batch_count >= batch_size) {
      sink.flush();
      batch_count = 0;
    }
    if (!sink.good()) {
      if (options.progress) std::fprintf(progress_stream, "\n");
      std::fprintf(progress_stream, "[ERROR] Failed to write record %llu\n",
                   static_cast<unsigned long long>(result.rows_processed));
      result.error_message = "record sink failed after " +
                             std::to_string(result.rows_processed) + " rows";
      return result;
    }
    if (options.progress &&
        (result.rows_processed % progress_step == 0 || result.rows_processed == total)) {
      reportProgress(progress_stream, result.rows_processed, total);
    }
  }
  sink.end();

  if (!sink.good()) {
    result.error_message = "record sink failed while finishing output";
    return result;
  }

  if (options.progress) {
    std::fprintf(progress_stream, "\n[SUCCESS] 100%% complete - Processed all %llu tone rows\n",
                 static_cast<unsigned long long>(result.rows_processed));
  }
  result.success = true;
  return result;
}

}  // namespace tonerow
