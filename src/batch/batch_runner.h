// Batch runner -- drives the enumerator through the analyzer and hands each
// record to a sink, with batching and progress reporting.

#ifndef TONEROW_BATCH_BATCH_RUNNER_H
#define TONEROW_BATCH_BATCH_RUNNER_H

#include <cstdint>
#include <cstdio>
#include <string>

#include "batch/record_sink.h"

namespace tonerow {

/// Options for a bulk enumeration run.
struct BatchOptions {
  uint64_t limit = 0;         ///< Rows to analyze (0 = every remaining row).
  uint64_t offset = 0;        ///< Rows to skip before the first analyzed row.
  uint32_t batch_size = 100;  ///< Records between sink flushes (0 treated as 1).
  bool progress = false;      ///< Emit a progress line (every 0.1%).
  FILE* progress_stream = stderr;
};

/// Outcome of a bulk run.
struct BatchResult {
  bool success = false;
  uint64_t rows_processed = 0;
  std::string error_message;
};

/// @brief Analyze enumerated rows and write every record to the sink.
///
/// Stops with a failure as soon as the sink reports an error; records
/// already written stay written.
///
/// @param options Range, batching and progress settings.
/// @param sink Destination for records.
/// @return Number of rows processed and any failure.
BatchResult runBatch(const BatchOptions& options, RecordSink& sink);

}  // namespace tonerow

#endif  // TONEROW_BATCH_BATCH_RUNNER_H
