// Transformation labels -- the 48 serial forms (P, R, I, RI at twelve
// levels) named relative to a reference row.

#ifndef TONEROW_ROW_TRANSFORMATION_H
#define TONEROW_ROW_TRANSFORMATION_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/pitch_class.h"
#include "row/tone_row.h"

namespace tonerow {

/// Serial operation applied to the reference row.
enum class TransformKind : uint8_t {
  Prime,
  Retrograde,
  Inversion,
  RetrogradeInversion
};

/// All four kinds in label order P, R, I, RI.
constexpr TransformKind kAllTransformKinds[4] = {
    TransformKind::Prime, TransformKind::Retrograde, TransformKind::Inversion,
    TransformKind::RetrogradeInversion};

/// @brief Label prefix for a kind ("P", "R", "I", "RI").
const char* transformKindPrefix(TransformKind kind);

/// @brief Descriptive name for a kind ("prime", "retrograde", ...).
const char* transformKindToString(TransformKind kind);

/// @brief A transformation label such as P6 or RI11.
///
/// The level is the interval from the reference form's first note (P0, R0,
/// I0 or RI0 respectively) to the transformed form's first note.
struct Transformation {
  TransformKind kind = TransformKind::Prime;
  uint8_t level = 0;

  /// @brief Label text: prefix followed by the level without leading zeros.
  std::string toString() const;

  bool operator==(const Transformation& other) const {
    return kind == other.kind && level == other.level;
  }
  bool operator!=(const Transformation& other) const { return !(*this == other); }
};

/// @brief Parse a label such as "P0", "R11", "RI5".
///
/// Strict: uppercase prefix, level 0-11 with no sign or leading zero, no
/// surrounding whitespace.
/// @return The transformation, or nullopt when the text is not a label.
std::optional<Transformation> parseTransformation(std::string_view text);

/// @brief First note of a kind's reference form (P0, R0, I0 or RI0).
PitchClass referenceFirstNote(const ToneRow& row, TransformKind kind);

/// @brief Level of a form of the given kind, measured from its reference form.
/// @param form_first_note First note of the transformed form.
/// @return (form_first_note - reference first note + 12) mod 12.
uint8_t transformationLevel(const ToneRow& row, TransformKind kind,
                            PitchClass form_first_note);

/// @brief The idx-th matrix form of a kind: row idx (P), reversed row idx (R),
/// column idx (I) or reversed column idx (RI).
RowArray matrixForm(const TwelveToneMatrix& matrix, TransformKind kind, int idx);

/// @brief Realize the form named by a label.
///
/// Picks the matrix row (P), reversed row (R), column (I) or reversed column
/// (RI) whose level equals the label's level.
RowArray applyTransformation(const ToneRow& row, const Transformation& transformation);

/// @brief Sort label strings in plain lexical order ("I11" before "I3").
void sortLabels(std::vector<std::string>& labels);

/// @brief Join labels with single spaces.
std::string joinLabels(const std::vector<std::string>& labels);

}  // namespace tonerow

#endif  // TONEROW_ROW_TRANSFORMATION_H
