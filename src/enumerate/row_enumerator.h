// Row enumerator -- lazily produces every twelve-tone row that starts on
// pitch class 0, one permutation at a time.

#ifndef TONEROW_ENUMERATE_ROW_ENUMERATOR_H
#define TONEROW_ENUMERATE_ROW_ENUMERATOR_H

#include <cstdint>

#include "core/pitch_class.h"

namespace tonerow {

/// Number of rows starting on pitch class 0 (11!).
constexpr uint64_t kTotalRowsStartingAtZero = 39916800;

/// @brief Lazy generator over all rows with pitch class 0 in position 0.
///
/// Rows come out in lexicographic order of positions 1-11: the first is
/// 0 1 2 ... 11, the second 0 1 2 ... 9 11 10, the last 0 11 10 ... 1. Only the
/// current permutation is held. The sequence is consumed once; construct a
/// new enumerator to start over.
///
/// @code
///   RowEnumerator enumerator;
///   RowArray row;
///   while (enumerator.next(row)) {
///     ToneRow tone_row = ToneRow::fromPermutation(row);
///   }
/// @endcode
class RowEnumerator {
 public:
  RowEnumerator();

  /// @brief Produce the next row.
  /// @param out Receives the row when one is available.
  /// @return False once all rows have been produced.
  bool next(RowArray& out);

  /// @brief Discard up to count rows without producing them.
  /// @return Number of rows actually skipped (smaller only at the end).
  uint64_t skip(uint64_t count);

  /// @brief Rows produced or skipped so far.
  uint64_t produced() const { return produced_; }

  /// @brief Rows still to come.
  uint64_t remaining() const { return kTotalRowsStartingAtZero - produced_; }

  /// @brief True once the sequence is exhausted.
  bool done() const { return exhausted_; }

 private:
  /// Step current_ to the next permutation; marks exhaustion after the last.
  void advance();

  RowArray current_{};
  uint64_t produced_ = 0;
  bool exhausted_ = false;
};

}  // namespace tonerow

#endif  // TONEROW_ENUMERATE_ROW_ENUMERATOR_H
