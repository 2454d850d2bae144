/// @file
/// @brief ToneRow validation, construction, parsing, and transposition.

#include "row/tone_row.h"

#include <bitset>

namespace tonerow {

namespace {

/// @brief Build a failed result with a formatted message.
ToneRowResult makeFailure(RowError error, const std::string& detail) {
  ToneRowResult result;
  result.success = false;
  result.error = error;
  result.error_message = detail;
  return result;
}

/// @brief Human-readable failure message for a validation error.
std::string describeValidationError(RowError error, const std::vector<int>& values) {
  switch (error) {
    case RowError::WrongLength:
      return "row must contain 12 pitch classes, got " + std::to_string(values.size());
    case RowError::PitchClassOutOfRange:
      for (int value : values) {
        if (!isPitchClass(value)) {
          return "pitch class " + std::to_string(value) + " is outside 0-11";
        }
      }
      break;
    case RowError::DuplicatePitchClass: {
      std::bitset<kAggregateSize> seen;
      for (int value : values) {
        if (seen.test(static_cast<size_t>(value))) {
          return "pitch class " + std::to_string(value) + " appears more than once";
        }
        seen.set(static_cast<size_t>(value));
      }
      break;
    }
    default:
      break;
  }
  return rowErrorToString(error);
}

}  // namespace

const char* rowErrorToString(RowError error) {
  switch (error) {
    case RowError::None:                 return "none";
    case RowError::WrongLength:          return "wrong_length";
    case RowError::PitchClassOutOfRange: return "pitch_class_out_of_range";
    case RowError::DuplicatePitchClass:  return "duplicate_pitch_class";
    case RowError::InvalidToken:         return "invalid_token";
    case RowError::IntervalOutOfRange:   return "interval_out_of_range";
  }
  return "unknown";
}

bool isInvalidRowError(RowError error) {
  return error != RowError::None && error != RowError::IntervalOutOfRange;
}

RowError validateRow(const std::vector<int>& values) {
  if (values.size() != static_cast<size_t>(kAggregateSize)) {
    return RowError::WrongLength;
  }
  for (int value : values) {
    if (!isPitchClass(value)) return RowError::PitchClassOutOfRange;
  }
  // Twelve in-range values with no repeats cover the aggregate exactly.
  std::bitset<kAggregateSize> seen;
  for (int value : values) {
    if (seen.test(static_cast<size_t>(value))) return RowError::DuplicatePitchClass;
    seen.set(static_cast<size_t>(value));
  }
  return RowError::None;
}

ToneRow::ToneRow(const RowArray& prime_row) : matrix_(TwelveToneMatrix::build(prime_row)) {}

ToneRowResult ToneRow::create(const std::vector<int>& values) {
  RowError error = validateRow(values);
  if (error != RowError::None) {
    return makeFailure(error, describeValidationError(error, values));
  }

  RowArray prime_row{};
  for (int idx = 0; idx < kAggregateSize; ++idx) {
    prime_row[idx] = static_cast<PitchClass>(values[idx]);
  }

  ToneRowResult result;
  result.success = true;
  result.row = ToneRow(prime_row);
  return result;
}

ToneRow ToneRow::fromPermutation(const RowArray& permutation) {
  return ToneRow(permutation);
}

std::string ToneRow::toString() const {
  return rowArrayToString(prime());
}

ToneRowResult parseRow(std::string_view text) {
  std::vector<int> values;
  size_t pos = 0;
  while (pos < text.size()) {
    // Separators: whitespace and commas.
    while (pos < text.size() &&
           (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' ||
            text[pos] == '\r' || text[pos] == ',')) {
      ++pos;
    }
    if (pos >= text.size()) break;

    size_t start = pos;
    while (pos < text.size() && text[pos] != ' ' && text[pos] != '\t' &&
           text[pos] != '\n' && text[pos] != '\r' && text[pos] != ',') {
      ++pos;
    }
    std::string_view token = text.substr(start, pos - start);

    auto pitch = pitchClassFromString(token);
    if (!pitch) {
      // Out-of-range integers are a range problem, not a syntax problem.
      bool all_digits = token.find_first_not_of("0123456789") == std::string_view::npos;
      if (all_digits && token.size() <= 9) {
        values.push_back(std::stoi(std::string(token)));
        continue;
      }
      return makeFailure(RowError::InvalidToken,
                         "unrecognized pitch class '" + std::string(token) + "'");
    }
    values.push_back(static_cast<int>(*pitch));
  }
  return ToneRow::create(values);
}

ToneRowResult transposeRow(const std::vector<int>& values, int interval) {
  RowError error = validateRow(values);
  if (error != RowError::None) {
    return makeFailure(error, describeValidationError(error, values));
  }
  if (interval < -(kAggregateSize - 1) || interval > kAggregateSize - 1) {
    return makeFailure(RowError::IntervalOutOfRange,
                       "interval " + std::to_string(interval) + " is outside -11..11");
  }

  std::vector<int> transposed;
  transposed.reserve(values.size());
  for (int value : values) {
    transposed.push_back(transposePitchClass(static_cast<PitchClass>(value), interval));
  }
  return ToneRow::create(transposed);
}

std::string rowArrayToString(const RowArray& row) {
  std::string result;
  for (int idx = 0; idx < kAggregateSize; ++idx) {
    if (idx > 0) result += ' ';
    result += std::to_string(static_cast<int>(row[idx]));
  }
  return result;
}

}  // namespace tonerow
