// Combinatoriality detector -- scans the 48 serial forms of a row and
// reports those combinatorial with P0 at a given segment granularity.

#ifndef TONEROW_ANALYSIS_COMBINATORIALITY_H
#define TONEROW_ANALYSIS_COMBINATORIALITY_H

#include <cstdint>
#include <string>
#include <vector>

#include "analysis/segment_partition.h"
#include "row/tone_row.h"
#include "row/transformation.h"

namespace tonerow {

/// How a candidate form's partition is compared with P0's partition.
enum class MatchRule : uint8_t {
  FirstSegmentDisjoint,  ///< First segments share no pitch class (hexachords).
  SegmentMultiset        ///< Same unordered collection of segment sets.
};

/// Detection behaviour for one (segment size, operation kind) pair.
struct DetectionRule {
  MatchRule match = MatchRule::SegmentMultiset;
  bool exclude_identity_level = true;  ///< Drop level 0 even when it matches.
};

/// @brief Rule table lookup.
///
/// Hexachords use first-segment disjointness and drop level 0 for every kind.
/// Tetrachords and trichords use multiset matching; P and R drop level 0 but
/// I and RI keep it.
DetectionRule detectionRule(SegmentSize size, TransformKind kind);

/// Combinatorial forms of one row at one granularity, grouped by kind.
struct CombinatorialSet {
  SegmentSize size = SegmentSize::Hexachord;
  std::vector<Transformation> prime;
  std::vector<Transformation> retrograde;
  std::vector<Transformation> inversion;
  std::vector<Transformation> retrograde_inversion;

  /// @brief Forms detected for one kind, in matrix scan order.
  const std::vector<Transformation>& forKind(TransformKind kind) const;

  /// @brief All forms, P then R then I then RI, each in matrix scan order.
  std::vector<Transformation> all() const;

  /// @brief Labels of all() in the same order.
  std::vector<std::string> labels() const;

  /// @brief Labels of all() in lexical order.
  std::vector<std::string> sortedLabels() const;

  /// @brief Total number of detected forms.
  size_t count() const;

  /// @brief Check whether a specific form was detected.
  bool contains(const Transformation& transformation) const;
};

/// @brief Detect combinatorial forms of a single operation kind.
///
/// Scans the twelve matrix forms of the kind (rows, reversed rows, columns or
/// reversed columns) in matrix order against P0.
/// @return Matching forms in scan order.
std::vector<Transformation> detectKind(const ToneRow& row, SegmentSize size,
                                       TransformKind kind);

/// @brief Detect combinatorial forms of every kind at one granularity.
CombinatorialSet detectCombinatorials(const ToneRow& row, SegmentSize size);

/// @brief Detected labels at one granularity in lexical order.
std::vector<std::string> detectLabels(const ToneRow& row, SegmentSize size);

}  // namespace tonerow

#endif  // TONEROW_ANALYSIS_COMBINATORIALITY_H
