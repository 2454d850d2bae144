/// @file
/// @brief Transformation label formatting, parsing, and realization.

#include "row/transformation.h"

#include <algorithm>

namespace tonerow {

const char* transformKindPrefix(TransformKind kind) {
  switch (kind) {
    case TransformKind::Prime:               return "P";
    case TransformKind::Retrograde:          return "R";
    case TransformKind::Inversion:           return "I";
    case TransformKind::RetrogradeInversion: return "RI";
  }
  return "?";
}

const char* transformKindToString(TransformKind kind) {
  switch (kind) {
    case TransformKind::Prime:               return "prime";
    case TransformKind::Retrograde:          return "retrograde";
    case TransformKind::Inversion:           return "inversion";
    case TransformKind::RetrogradeInversion: return "retrograde_inversion";
  }
  return "unknown";
}

std::string Transformation::toString() const {
  return transformKindPrefix(kind) + std::to_string(static_cast<int>(level));
}

std::optional<Transformation> parseTransformation(std::string_view text) {
  Transformation result;
  std::string_view digits;
  // "RI" must be tested before "R".
  if (text.substr(0, 2) == "RI") {
    result.kind = TransformKind::RetrogradeInversion;
    digits = text.substr(2);
  } else if (!text.empty() && text[0] == 'R') {
    result.kind = TransformKind::Retrograde;
    digits = text.substr(1);
  } else if (!text.empty() && text[0] == 'P') {
    result.kind = TransformKind::Prime;
    digits = text.substr(1);
  } else if (!text.empty() && text[0] == 'I') {
    result.kind = TransformKind::Inversion;
    digits = text.substr(1);
  } else {
    return std::nullopt;
  }

  if (digits.empty() || digits.size() > 2) return std::nullopt;
  if (digits.size() == 2 && digits[0] == '0') return std::nullopt;
  int level = 0;
  for (char chr : digits) {
    if (chr < '0' || chr > '9') return std::nullopt;
    level = level * 10 + (chr - '0');
  }
  if (!isPitchClass(level)) return std::nullopt;

  result.level = static_cast<uint8_t>(level);
  return result;
}

PitchClass referenceFirstNote(const ToneRow& row, TransformKind kind) {
  switch (kind) {
    case TransformKind::Prime:               return row.prime()[0];
    case TransformKind::Retrograde:          return row.retrograde()[0];
    case TransformKind::Inversion:           return row.inversion()[0];
    case TransformKind::RetrogradeInversion: return row.retrogradeInversion()[0];
  }
  return row.prime()[0];
}

uint8_t transformationLevel(const ToneRow& row, TransformKind kind,
                            PitchClass form_first_note) {
  return static_cast<uint8_t>(intervalBetween(referenceFirstNote(row, kind), form_first_note));
}

RowArray matrixForm(const TwelveToneMatrix& matrix, TransformKind kind, int idx) {
  switch (kind) {
    case TransformKind::Prime:               return matrix.row(idx);
    case TransformKind::Retrograde:          return matrix.reversedRow(idx);
    case TransformKind::Inversion:           return matrix.column(idx);
    case TransformKind::RetrogradeInversion: return matrix.reversedColumn(idx);
  }
  return matrix.row(idx);
}

RowArray applyTransformation(const ToneRow& row, const Transformation& transformation) {
  for (int idx = 0; idx < kAggregateSize; ++idx) {
    RowArray form = matrixForm(row.matrix(), transformation.kind, idx);
    if (transformationLevel(row, transformation.kind, form[0]) == transformation.level) {
      return form;
    }
  }
  // Unreachable for a level in [0, 11]: each kind covers all twelve levels.
  return row.prime();
}

void sortLabels(std::vector<std::string>& labels) {
  std::sort(labels.begin(), labels.end());
}

std::string joinLabels(const std::vector<std::string>& labels) {
  std::string result;
  for (size_t idx = 0; idx < labels.size(); ++idx) {
    if (idx > 0) result += ' ';
    result += labels[idx];
  }
  return result;
}

}  // namespace tonerow
