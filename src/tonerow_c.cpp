// Implementation of C API for FFI bindings.

#include "tonerow_c.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "analysis/row_analysis.h"
#include "row/tone_row.h"

#ifndef TONEROW_VERSION
#define TONEROW_VERSION "0.1.0"
#endif

namespace {

/// @brief Map a row failure onto the C error codes.
TonerowError toCError(tonerow::RowError error) {
  switch (error) {
    case tonerow::RowError::None:                 return TONEROW_OK;
    case tonerow::RowError::WrongLength:          return TONEROW_ERROR_WRONG_LENGTH;
    case tonerow::RowError::PitchClassOutOfRange: return TONEROW_ERROR_OUT_OF_RANGE;
    case tonerow::RowError::DuplicatePitchClass:  return TONEROW_ERROR_DUPLICATE;
    case tonerow::RowError::InvalidToken:         return TONEROW_ERROR_INVALID_PARAM;
    case tonerow::RowError::IntervalOutOfRange:   return TONEROW_ERROR_INTERVAL_OUT_OF_RANGE;
  }
  return TONEROW_ERROR_INVALID_PARAM;
}

/// @brief malloc-backed copy of a string (caller frees with free()).
char* duplicateString(const std::string& text) {
  auto* copy = static_cast<char*>(malloc(text.size() + 1));
  if (copy) memcpy(copy, text.c_str(), text.size() + 1);
  return copy;
}

/// @brief Build a row from C input.
tonerow::ToneRowResult createRow(const int* values, size_t length) {
  return tonerow::ToneRow::create(std::vector<int>(values, values + length));
}

}  // namespace

extern "C" {

// ============================================================================
// Analysis
// ============================================================================

TonerowError tonerow_analyze(const int* values, size_t length, TonerowAnalysis* out) {
  if (!values || !out) {
    return TONEROW_ERROR_INVALID_PARAM;
  }

  tonerow::ToneRowResult created = createRow(values, length);
  if (!created.success) {
    return toCError(created.error);
  }

  tonerow::RowAnalysis analysis = tonerow::analyzeRow(*created.row);
  TonerowAnalysis filled;
  filled.prime_row = duplicateString(analysis.prime_row);
  filled.hexachordal = duplicateString(analysis.hexachordal);
  filled.tetrachordal = duplicateString(analysis.tetrachordal);
  filled.trichordal = duplicateString(analysis.trichordal);
  if (!filled.prime_row || !filled.hexachordal || !filled.tetrachordal || !filled.trichordal) {
    tonerow_free_analysis(&filled);
    return TONEROW_ERROR_INVALID_PARAM;
  }
  *out = filled;
  return TONEROW_OK;
}

void tonerow_free_analysis(TonerowAnalysis* analysis) {
  if (!analysis) return;
  free(analysis->prime_row);
  free(analysis->hexachordal);
  free(analysis->tetrachordal);
  free(analysis->trichordal);
  analysis->prime_row = nullptr;
  analysis->hexachordal = nullptr;
  analysis->tetrachordal = nullptr;
  analysis->trichordal = nullptr;
}

TonerowError tonerow_matrix(const int* values, size_t length, uint8_t out_cells[144]) {
  if (!values || !out_cells) {
    return TONEROW_ERROR_INVALID_PARAM;
  }

  tonerow::ToneRowResult created = createRow(values, length);
  if (!created.success) {
    return toCError(created.error);
  }

  const tonerow::TwelveToneMatrix& matrix = created.row->matrix();
  for (int row_idx = 0; row_idx < tonerow::kAggregateSize; ++row_idx) {
    for (int col_idx = 0; col_idx < tonerow::kAggregateSize; ++col_idx) {
      out_cells[row_idx * tonerow::kAggregateSize + col_idx] = matrix.at(row_idx, col_idx);
    }
  }
  return TONEROW_OK;
}

TonerowError tonerow_transpose(const int* values, size_t length, int interval,
                               int out_values[12]) {
  if (!values || !out_values) {
    return TONEROW_ERROR_INVALID_PARAM;
  }

  tonerow::ToneRowResult transposed =
      tonerow::transposeRow(std::vector<int>(values, values + length), interval);
  if (!transposed.success) {
    return toCError(transposed.error);
  }

  tonerow::RowArray prime = transposed.row->prime();
  for (int idx = 0; idx < tonerow::kAggregateSize; ++idx) {
    out_values[idx] = prime[idx];
  }
  return TONEROW_OK;
}

// ============================================================================
// Error Handling
// ============================================================================

const char* tonerow_error_string(TonerowError error) {
  switch (error) {
    case TONEROW_OK:                          return "OK";
    case TONEROW_ERROR_INVALID_PARAM:         return "Invalid parameter";
    case TONEROW_ERROR_WRONG_LENGTH:          return "Row must contain exactly 12 pitch classes";
    case TONEROW_ERROR_OUT_OF_RANGE:          return "Pitch class outside 0-11";
    case TONEROW_ERROR_DUPLICATE:             return "Pitch class repeated in row";
    case TONEROW_ERROR_INTERVAL_OUT_OF_RANGE: return "Transposition interval outside -11..11";
  }
  return "Unknown error";
}

// ============================================================================
// Utilities
// ============================================================================

const char* tonerow_version(void) {
  return TONEROW_VERSION;
}

}  // extern "C"
