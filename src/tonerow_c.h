// C API for FFI bindings.

#ifndef TONEROW_C_H
#define TONEROW_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Error Definitions
// ============================================================================

/// @brief Error codes returned by API functions.
typedef enum {
  TONEROW_OK = 0,
  TONEROW_ERROR_INVALID_PARAM = 1,
  TONEROW_ERROR_WRONG_LENGTH = 2,
  TONEROW_ERROR_OUT_OF_RANGE = 3,
  TONEROW_ERROR_DUPLICATE = 4,
  TONEROW_ERROR_INTERVAL_OUT_OF_RANGE = 5,
} TonerowError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief Analysis of one row. Strings are owned by the struct.
typedef struct {
  char* prime_row;     ///< "0 11 3 4 ..."
  char* hexachordal;   ///< Sorted labels, space-separated (may be empty)
  char* tetrachordal;
  char* trichordal;
} TonerowAnalysis;

// ============================================================================
// Analysis
// ============================================================================

/// @brief Analyze a row given as twelve integers.
/// @param values Pointer to the pitch classes
/// @param length Number of values (must be 12)
/// @param out Receives the analysis (free with tonerow_free_analysis)
/// @return TONEROW_OK on success; out is untouched on failure
TonerowError tonerow_analyze(const int* values, size_t length, TonerowAnalysis* out);

/// @brief Release the strings held by an analysis.
/// @param analysis Analysis filled by tonerow_analyze (fields reset to NULL)
void tonerow_free_analysis(TonerowAnalysis* analysis);

/// @brief Build the 12x12 matrix of a row.
/// @param values Pointer to the pitch classes
/// @param length Number of values (must be 12)
/// @param out_cells Receives 144 cells in row-major order
/// @return TONEROW_OK on success
TonerowError tonerow_matrix(const int* values, size_t length, uint8_t out_cells[144]);

/// @brief Transpose a row.
/// @param values Pointer to the pitch classes
/// @param length Number of values (must be 12)
/// @param interval Semitones in [-11, 11]
/// @param out_values Receives the twelve transposed pitch classes
/// @return TONEROW_OK on success
TonerowError tonerow_transpose(const int* values, size_t length, int interval,
                               int out_values[12]);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* tonerow_error_string(TonerowError error);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* tonerow_version(void);

#ifdef __cplusplus
}
#endif

#endif  // TONEROW_C_H
