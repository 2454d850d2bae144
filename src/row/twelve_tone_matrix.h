// Twelve-tone matrix -- the 12x12 table of all transposed prime forms
// (rows) and inversion forms (columns) of a prime row.

#ifndef TONEROW_ROW_TWELVE_TONE_MATRIX_H
#define TONEROW_ROW_TWELVE_TONE_MATRIX_H

#include <array>
#include <string>

#include "core/pitch_class.h"

namespace tonerow {

/// @brief Immutable 12x12 twelve-tone matrix.
///
/// Row 0 is the prime row. Row i is the prime row transposed so that its
/// first note equals the i-th note of the prime row's inversion, so column 0
/// reads the inversion top-to-bottom. Every row and column is a permutation
/// of the aggregate.
///
/// All accessors return copies; the backing table is never exposed.
class TwelveToneMatrix {
 public:
  /// @brief Build the matrix for a prime row.
  /// @param prime_row A valid twelve-tone row (caller validates).
  /// @return Fully populated matrix.
  static TwelveToneMatrix build(const RowArray& prime_row);

  /// @brief Cell value at (row_idx, col_idx), both in [0, 11].
  PitchClass at(int row_idx, int col_idx) const { return cells_[row_idx][col_idx]; }

  /// @brief Matrix row read left-to-right (a prime form).
  RowArray row(int row_idx) const { return cells_[row_idx]; }

  /// @brief Matrix column read top-to-bottom (an inversion form).
  RowArray column(int col_idx) const;

  /// @brief Matrix row read right-to-left (a retrograde form).
  RowArray reversedRow(int row_idx) const;

  /// @brief Matrix column read bottom-to-top (a retrograde-inversion form).
  RowArray reversedColumn(int col_idx) const;

  /// @brief Render the matrix as a grid with form labels on each margin.
  ///
  /// P labels run down the left edge, R labels down the right, I labels
  /// across the top and RI labels across the bottom.
  std::string toText() const;

 private:
  TwelveToneMatrix() = default;

  std::array<RowArray, kAggregateSize> cells_{};
};

}  // namespace tonerow

#endif  // TONEROW_ROW_TWELVE_TONE_MATRIX_H
