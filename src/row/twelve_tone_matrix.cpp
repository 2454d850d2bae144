/// @file
/// @brief Twelve-tone matrix construction and rendering.

#include "row/twelve_tone_matrix.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace tonerow {

TwelveToneMatrix TwelveToneMatrix::build(const RowArray& prime_row) {
  TwelveToneMatrix matrix;
  matrix.cells_[0] = prime_row;

  // Inversion of the prime row itself, used only to derive each row's interval.
  RowArray inversion_row{};
  for (int idx = 0; idx < kAggregateSize; ++idx) {
    inversion_row[idx] = invertPitchClass(prime_row[idx]);
  }

  for (int row_idx = 1; row_idx < kAggregateSize; ++row_idx) {
    int transposition = intervalBetween(inversion_row[0], inversion_row[row_idx]);
    for (int col_idx = 0; col_idx < kAggregateSize; ++col_idx) {
      matrix.cells_[row_idx][col_idx] = transposePitchClass(prime_row[col_idx], transposition);
    }
  }
  return matrix;
}

RowArray TwelveToneMatrix::column(int col_idx) const {
  RowArray result{};
  for (int row_idx = 0; row_idx < kAggregateSize; ++row_idx) {
    result[row_idx] = cells_[row_idx][col_idx];
  }
  return result;
}

RowArray TwelveToneMatrix::reversedRow(int row_idx) const {
  RowArray result = cells_[row_idx];
  std::reverse(result.begin(), result.end());
  return result;
}

RowArray TwelveToneMatrix::reversedColumn(int col_idx) const {
  RowArray result = column(col_idx);
  std::reverse(result.begin(), result.end());
  return result;
}

std::string TwelveToneMatrix::toText() const {
  // Levels are measured from the reference forms' first notes. For a row the
  // P and R levels coincide, as do the I and RI levels for a column.
  const PitchClass origin = cells_[0][0];
  std::ostringstream oss;
  char buf[16];

  oss << "     ";
  for (int col_idx = 0; col_idx < kAggregateSize; ++col_idx) {
    std::snprintf(buf, sizeof(buf), "%5s", ("I" + std::to_string(intervalBetween(
                                                     origin, cells_[0][col_idx]))).c_str());
    oss << buf;
  }
  oss << "\n";

  for (int row_idx = 0; row_idx < kAggregateSize; ++row_idx) {
    int level = intervalBetween(origin, cells_[row_idx][0]);
    std::snprintf(buf, sizeof(buf), "%-5s", ("P" + std::to_string(level)).c_str());
    oss << buf;
    for (int col_idx = 0; col_idx < kAggregateSize; ++col_idx) {
      std::snprintf(buf, sizeof(buf), "%5d", static_cast<int>(cells_[row_idx][col_idx]));
      oss << buf;
    }
    oss << "  R" << level << "\n";
  }

  oss << "     ";
  for (int col_idx = 0; col_idx < kAggregateSize; ++col_idx) {
    std::snprintf(buf, sizeof(buf), "%5s", ("RI" + std::to_string(intervalBetween(
                                                      origin, cells_[0][col_idx]))).c_str());
    oss << buf;
  }
  oss << "\n";
  return oss.str();
}

}  // namespace tonerow
