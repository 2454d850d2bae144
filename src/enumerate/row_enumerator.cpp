/// @file
/// @brief Lexicographic enumeration of rows starting on pitch class 0.

#include "enumerate/row_enumerator.h"

#include <algorithm>

namespace tonerow {

namespace {

/// @brief Factorials 0!..11! for skipping whole permutation blocks.
constexpr uint64_t kFactorials[12] = {1,      1,       2,        6,         24,       120,
                                      720,    5040,    40320,    362880,    3628800,  39916800};

}  // namespace

RowEnumerator::RowEnumerator() {
  for (int idx = 0; idx < kAggregateSize; ++idx) {
    current_[idx] = static_cast<PitchClass>(idx);
  }
}

bool RowEnumerator::next(RowArray& out) {
  if (exhausted_) return false;
  out = current_;
  advance();
  return true;
}

void RowEnumerator::advance() {
  ++produced_;
  // Position 0 stays fixed; permute positions 1-11 only.
  if (!std::next_permutation(current_.begin() + 1, current_.end())) {
    exhausted_ = true;
  }
}

uint64_t RowEnumerator::skip(uint64_t count) {
  if (exhausted_ || count == 0) return 0;
  uint64_t target = std::min(count, remaining());

  // Decode the target rank in the factorial number system, which maps a
  // lexicographic index straight to its permutation.
  uint64_t rank = produced_ + target;
  if (rank >= kTotalRowsStartingAtZero) {
    produced_ = kTotalRowsStartingAtZero;
    exhausted_ = true;
    return target;
  }

  PitchClass pool[kAggregateSize - 1];
  for (int idx = 0; idx < kAggregateSize - 1; ++idx) {
    pool[idx] = static_cast<PitchClass>(idx + 1);
  }
  int pool_size = kAggregateSize - 1;
  uint64_t residual = rank;
  for (int pos = 1; pos < kAggregateSize; ++pos) {
    uint64_t block = kFactorials[kAggregateSize - 1 - pos];
    auto choice = static_cast<int>(residual / block);
    residual %= block;
    current_[pos] = pool[choice];
    std::copy(pool + choice + 1, pool + pool_size, pool + choice);
    --pool_size;
  }

  produced_ = rank;
  return target;
}

}  // namespace tonerow
