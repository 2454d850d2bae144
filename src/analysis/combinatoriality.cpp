/// @file
/// @brief Combinatoriality detection across all 48 serial forms.

#include "analysis/combinatoriality.h"

#include <algorithm>

namespace tonerow {

namespace {

/// @brief Apply a match rule to a candidate partition.
bool partitionMatches(MatchRule rule, const Partition& candidate, const Partition& reference) {
  switch (rule) {
    case MatchRule::FirstSegmentDisjoint:
      return firstSegmentsDisjoint(candidate, reference);
    case MatchRule::SegmentMultiset:
      return matchesAsMultiset(candidate, reference);
  }
  return false;
}

std::vector<Transformation>& mutableForKind(CombinatorialSet& set, TransformKind kind) {
  switch (kind) {
    case TransformKind::Prime:               return set.prime;
    case TransformKind::Retrograde:          return set.retrograde;
    case TransformKind::Inversion:           return set.inversion;
    case TransformKind::RetrogradeInversion: return set.retrograde_inversion;
  }
  return set.prime;
}

}  // namespace

DetectionRule detectionRule(SegmentSize size, TransformKind kind) {
  DetectionRule rule;
  if (size == SegmentSize::Hexachord) {
    rule.match = MatchRule::FirstSegmentDisjoint;
    rule.exclude_identity_level = true;
    return rule;
  }
  rule.match = MatchRule::SegmentMultiset;
  rule.exclude_identity_level =
      (kind == TransformKind::Prime || kind == TransformKind::Retrograde);
  return rule;
}

// ---------------------------------------------------------------------------
// CombinatorialSet
// ---------------------------------------------------------------------------

const std::vector<Transformation>& CombinatorialSet::forKind(TransformKind kind) const {
  switch (kind) {
    case TransformKind::Prime:               return prime;
    case TransformKind::Retrograde:          return retrograde;
    case TransformKind::Inversion:           return inversion;
    case TransformKind::RetrogradeInversion: return retrograde_inversion;
  }
  return prime;
}

std::vector<Transformation> CombinatorialSet::all() const {
  std::vector<Transformation> result;
  result.reserve(count());
  for (TransformKind kind : kAllTransformKinds) {
    const auto& forms = forKind(kind);
    result.insert(result.end(), forms.begin(), forms.end());
  }
  return result;
}

std::vector<std::string> CombinatorialSet::labels() const {
  std::vector<std::string> result;
  result.reserve(count());
  for (const auto& transformation : all()) {
    result.push_back(transformation.toString());
  }
  return result;
}

std::vector<std::string> CombinatorialSet::sortedLabels() const {
  std::vector<std::string> result = labels();
  sortLabels(result);
  return result;
}

size_t CombinatorialSet::count() const {
  return prime.size() + retrograde.size() + inversion.size() + retrograde_inversion.size();
}

bool CombinatorialSet::contains(const Transformation& transformation) const {
  const auto& forms = forKind(transformation.kind);
  return std::find(forms.begin(), forms.end(), transformation) != forms.end();
}

// ---------------------------------------------------------------------------
// Detection
// ---------------------------------------------------------------------------

std::vector<Transformation> detectKind(const ToneRow& row, SegmentSize size,
                                       TransformKind kind) {
  const DetectionRule rule = detectionRule(size, kind);
  const Partition reference = partitionRow(row.prime(), size);
  const PitchClass reference_first = referenceFirstNote(row, kind);

  std::vector<Transformation> result;
  for (int idx = 0; idx < kAggregateSize; ++idx) {
    RowArray form = matrixForm(row.matrix(), kind, idx);
    if (!partitionMatches(rule.match, partitionRow(form, size), reference)) continue;

    auto level = static_cast<uint8_t>(intervalBetween(reference_first, form[0]));
    if (level == 0 && rule.exclude_identity_level) continue;

    result.push_back({kind, level});
  }
  return result;
}

CombinatorialSet detectCombinatorials(const ToneRow& row, SegmentSize size) {
  CombinatorialSet set;
  set.size = size;
  for (TransformKind kind : kAllTransformKinds) {
    mutableForKind(set, kind) = detectKind(row, size, kind);
  }
  return set;
}

std::vector<std::string> detectLabels(const ToneRow& row, SegmentSize size) {
  return detectCombinatorials(row, size).sortedLabels();
}

}  // namespace tonerow
