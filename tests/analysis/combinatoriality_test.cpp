// Tests for analysis/combinatoriality.h -- detection over all 48 forms.

#include "analysis/combinatoriality.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace tonerow {
namespace {

using Labels = std::vector<std::string>;

ToneRow rowOf(const RowArray& prime) { return ToneRow::fromPermutation(prime); }

const RowArray kIdentity = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};
// Hexachordally all-combinatorial (set class 6-20).
const RowArray kHexatonic = {0, 1, 4, 5, 8, 9, 2, 3, 6, 7, 10, 11};
const RowArray kWebernOp21 = {0, 11, 3, 4, 8, 7, 9, 5, 6, 1, 2, 10};
const RowArray kBergLyricSuite = {0, 11, 7, 4, 2, 9, 3, 8, 10, 1, 5, 6};
const RowArray kSchoenbergOp26 = {0, 11, 9, 10, 6, 7, 5, 4, 2, 3, 1, 8};
// Every tetrachord is symmetric about pitch class 0.
const RowArray kInversionallySymmetric = {0, 1, 11, 6, 2, 10, 3, 9, 4, 8, 5, 7};

// ---------------------------------------------------------------------------
// Rule table
// ---------------------------------------------------------------------------

TEST(CombinatorialityTest, HexachordRuleForEveryKind) {
  for (TransformKind kind : kAllTransformKinds) {
    DetectionRule rule = detectionRule(SegmentSize::Hexachord, kind);
    EXPECT_EQ(rule.match, MatchRule::FirstSegmentDisjoint);
    EXPECT_TRUE(rule.exclude_identity_level);
  }
}

TEST(CombinatorialityTest, SmallerSegmentRules) {
  for (SegmentSize size : {SegmentSize::Tetrachord, SegmentSize::Trichord}) {
    EXPECT_EQ(detectionRule(size, TransformKind::Prime).match, MatchRule::SegmentMultiset);
    EXPECT_TRUE(detectionRule(size, TransformKind::Prime).exclude_identity_level);
    EXPECT_TRUE(detectionRule(size, TransformKind::Retrograde).exclude_identity_level);
    EXPECT_FALSE(detectionRule(size, TransformKind::Inversion).exclude_identity_level);
    EXPECT_FALSE(
        detectionRule(size, TransformKind::RetrogradeInversion).exclude_identity_level);
  }
}

// ---------------------------------------------------------------------------
// Hexachordal
// ---------------------------------------------------------------------------

TEST(CombinatorialityTest, IdentityHexachordal) {
  CombinatorialSet set = detectCombinatorials(rowOf(kIdentity), SegmentSize::Hexachord);
  EXPECT_EQ(set.size, SegmentSize::Hexachord);
  EXPECT_EQ(set.labels(), (Labels{"P6", "I11", "RI5"}));
  EXPECT_TRUE(set.retrograde.empty());
  EXPECT_EQ(set.sortedLabels(), (Labels{"I11", "P6", "RI5"}));
}

TEST(CombinatorialityTest, HexatonicRowIsAllCombinatorial) {
  CombinatorialSet set = detectCombinatorials(rowOf(kHexatonic), SegmentSize::Hexachord);
  EXPECT_EQ(set.count(), 11u);
  for (const char* label :
       {"P2", "P6", "P10", "R4", "R8", "I3", "I7", "I11", "RI1", "RI5", "RI9"}) {
    auto transformation = parseTransformation(label);
    ASSERT_TRUE(transformation.has_value());
    EXPECT_TRUE(set.contains(*transformation)) << label;
  }
  EXPECT_FALSE(set.contains({TransformKind::Retrograde, 0}));
}

TEST(CombinatorialityTest, HexachordScanOrderFollowsMatrix) {
  ToneRow row = rowOf(kWebernOp21);
  std::vector<Transformation> primes = detectKind(row, SegmentSize::Hexachord,
                                                  TransformKind::Prime);
  ASSERT_EQ(primes.size(), 3u);
  EXPECT_EQ(primes[0].toString(), "P6");
  EXPECT_EQ(primes[1].toString(), "P10");
  EXPECT_EQ(primes[2].toString(), "P2");
}

TEST(CombinatorialityTest, WebernHexachordal) {
  EXPECT_EQ(detectLabels(rowOf(kWebernOp21), SegmentSize::Hexachord),
            (Labels{"I1", "I5", "I9", "P10", "P2", "P6", "R4", "R8", "RI11", "RI3", "RI7"}));
}

TEST(CombinatorialityTest, BergHexachordal) {
  EXPECT_EQ(detectLabels(rowOf(kBergLyricSuite), SegmentSize::Hexachord),
            (Labels{"I5", "P6", "RI11"}));
}

TEST(CombinatorialityTest, NonCombinatorialRowHasNoHexachordalForms) {
  EXPECT_TRUE(detectLabels(rowOf(kSchoenbergOp26), SegmentSize::Hexachord).empty());
}

// ---------------------------------------------------------------------------
// Tetrachordal and trichordal
// ---------------------------------------------------------------------------

TEST(CombinatorialityTest, IdentityTetrachordal) {
  EXPECT_EQ(detectLabels(rowOf(kIdentity), SegmentSize::Tetrachord),
            (Labels{"I11", "I3", "I7", "P4", "P8", "R4", "R8", "RI11", "RI3", "RI7"}));
}

TEST(CombinatorialityTest, IdentityTrichordal) {
  EXPECT_EQ(detectLabels(rowOf(kIdentity), SegmentSize::Trichord),
            (Labels{"I11", "I2", "I5", "I8", "P3", "P6", "P9", "R3", "R6", "R9", "RI11",
                    "RI2", "RI5", "RI8"}));
}

TEST(CombinatorialityTest, PrimeLevelZeroNeverReported) {
  // P0 trivially matches its own partition at every granularity.
  for (SegmentSize size : kAllSegmentSizes) {
    CombinatorialSet set = detectCombinatorials(rowOf(kWebernOp21), size);
    EXPECT_FALSE(set.contains({TransformKind::Prime, 0})) << segmentSizeToString(size);
  }
}

TEST(CombinatorialityTest, InversionLevelZeroKeptForTetrachords) {
  ToneRow row = rowOf(kInversionallySymmetric);
  EXPECT_EQ(detectLabels(row, SegmentSize::Tetrachord), (Labels{"I0", "RI0"}));
  EXPECT_TRUE(detectLabels(row, SegmentSize::Hexachord).empty());
  EXPECT_TRUE(detectLabels(row, SegmentSize::Trichord).empty());
}

TEST(CombinatorialityTest, FamousRowsAtSmallerSegments) {
  EXPECT_TRUE(detectLabels(rowOf(kWebernOp21), SegmentSize::Tetrachord).empty());
  EXPECT_EQ(detectLabels(rowOf(kWebernOp21), SegmentSize::Trichord),
            (Labels{"I1", "I7", "P6", "R6", "RI1", "RI7"}));
  EXPECT_EQ(detectLabels(rowOf(kBergLyricSuite), SegmentSize::Tetrachord),
            (Labels{"I11", "I5", "P6", "R6", "RI11", "RI5"}));
  EXPECT_EQ(detectLabels(rowOf(kSchoenbergOp26), SegmentSize::Tetrachord),
            (Labels{"I4", "RI4"}));
}

TEST(CombinatorialityTest, DetectedFormsSatisfyTheirRule) {
  ToneRow row = rowOf(kHexatonic);
  for (SegmentSize size : kAllSegmentSizes) {
    Partition reference = partitionRow(row.prime(), size);
    for (const Transformation& form : detectCombinatorials(row, size).all()) {
      Partition candidate = partitionRow(applyTransformation(row, form), size);
      if (size == SegmentSize::Hexachord) {
        EXPECT_TRUE(firstSegmentsDisjoint(candidate, reference)) << form.toString();
      } else {
        EXPECT_TRUE(matchesAsMultiset(candidate, reference)) << form.toString();
      }
    }
  }
}

TEST(CombinatorialityTest, AllConcatenatesKindsInOrder) {
  CombinatorialSet set = detectCombinatorials(rowOf(kIdentity), SegmentSize::Trichord);
  std::vector<Transformation> all = set.all();
  ASSERT_EQ(all.size(), set.count());
  EXPECT_EQ(all.front().toString(), "P9");
  EXPECT_EQ(all.back().toString(), "RI11");
  EXPECT_EQ(set.forKind(TransformKind::Retrograde).size(), 3u);
}

}  // namespace
}  // namespace tonerow
