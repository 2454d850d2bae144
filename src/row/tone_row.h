// Twelve-tone row model -- validated prime row with its cached matrix and
// the four canonical derived forms.

#ifndef TONEROW_ROW_TONE_ROW_H
#define TONEROW_ROW_TONE_ROW_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/pitch_class.h"
#include "row/twelve_tone_matrix.h"

namespace tonerow {

/// Reasons a row construction or transposition can fail.
enum class RowError : uint8_t {
  None,
  WrongLength,           ///< Not exactly twelve values.
  PitchClassOutOfRange,  ///< A value outside [0, 11].
  DuplicatePitchClass,   ///< A pitch class appears more than once.
  InvalidToken,          ///< Text input contained an unparseable token.
  IntervalOutOfRange     ///< Transposition interval outside [-11, 11].
};

/// @brief Convert RowError to a short identifier string.
/// @param error The error kind.
/// @return Null-terminated string (e.g. "wrong_length").
const char* rowErrorToString(RowError error);

/// @brief Check whether an error means the row itself is not a twelve-tone row.
/// @return True for every kind except None and IntervalOutOfRange.
bool isInvalidRowError(RowError error);

/// @brief Check a value sequence against the twelve-tone row invariant.
/// @param values Candidate row.
/// @return RowError::None when the values are a permutation of {0..11}.
///
/// Length is checked first, then range, then duplicates.
RowError validateRow(const std::vector<int>& values);

struct ToneRowResult;

/// @brief A validated twelve-tone row (P0) and its twelve-tone matrix.
///
/// Immutable once constructed. The matrix is built once at construction and
/// every derived form is sliced from it.
class ToneRow {
 public:
  /// @brief Validate values and build a row.
  /// @param values Exactly twelve distinct pitch classes.
  /// @return Result holding the row, or the failure kind and message.
  static ToneRowResult create(const std::vector<int>& values);

  /// @brief Build a row from a permutation already known to be valid.
  ///
  /// Used by the enumerator, whose output is a permutation by construction.
  /// @param permutation A permutation of {0..11}.
  static ToneRow fromPermutation(const RowArray& permutation);

  /// @brief Prime form P0 (matrix row 0).
  RowArray prime() const { return matrix_.row(0); }

  /// @brief Inversion I0 (matrix column 0).
  RowArray inversion() const { return matrix_.column(0); }

  /// @brief Retrograde R0 (P0 reversed).
  RowArray retrograde() const { return matrix_.reversedRow(0); }

  /// @brief Retrograde-inversion RI0 (I0 reversed).
  RowArray retrogradeInversion() const { return matrix_.reversedColumn(0); }

  /// @brief The cached twelve-tone matrix.
  const TwelveToneMatrix& matrix() const { return matrix_; }

  /// @brief Prime row as space-separated pitch classes ("0 11 3 ...").
  std::string toString() const;

  bool operator==(const ToneRow& other) const { return prime() == other.prime(); }
  bool operator!=(const ToneRow& other) const { return !(*this == other); }

 private:
  explicit ToneRow(const RowArray& prime_row);

  TwelveToneMatrix matrix_;
};

/// Outcome of building a ToneRow from untrusted input.
struct ToneRowResult {
  bool success = false;
  std::optional<ToneRow> row;
  RowError error = RowError::None;
  std::string error_message;
};

/// @brief Parse a row from text.
///
/// Tokens are separated by whitespace and/or commas and may be integers,
/// the "t"/"e" shorthand, or note names (see pitchClassFromString).
///
/// @param text Row text such as "0 11 3 4 8 7 9 5 6 1 2 10" or "C B D# E ...".
/// @return Result holding the row, or InvalidToken / a validation failure.
ToneRowResult parseRow(std::string_view text);

/// @brief Transpose a row by an interval.
///
/// The row is validated first (InvalidRow kinds), then the interval must lie
/// in [-11, 11] (IntervalOutOfRange). Interval 0 is allowed; +/-12 is not.
///
/// @param values Row to transpose.
/// @param interval Semitones in [-11, 11].
/// @return Result holding the transposed row.
ToneRowResult transposeRow(const std::vector<int>& values, int interval);

/// @brief Format any twelve-element form as space-separated pitch classes.
std::string rowArrayToString(const RowArray& row);

}  // namespace tonerow

#endif  // TONEROW_ROW_TONE_ROW_H
