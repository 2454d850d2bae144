// Tests for analysis/segment_partition.h -- slicing and unordered comparison.

#include "analysis/segment_partition.h"

#include <gtest/gtest.h>

#include <initializer_list>

namespace tonerow {
namespace {

constexpr RowArray kIdentity = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};

SegmentSet setOf(std::initializer_list<int> pcs) {
  SegmentSet set = 0;
  for (int pc : pcs) set = static_cast<SegmentSet>(set | (1u << pc));
  return set;
}

TEST(SegmentPartitionTest, SizeHelpers) {
  EXPECT_EQ(segmentLength(SegmentSize::Hexachord), 6);
  EXPECT_EQ(segmentCount(SegmentSize::Hexachord), 2);
  EXPECT_EQ(segmentCount(SegmentSize::Tetrachord), 3);
  EXPECT_EQ(segmentCount(SegmentSize::Trichord), 4);
  EXPECT_STREQ(segmentSizeToString(SegmentSize::Tetrachord), "tetrachord");
}

TEST(SegmentPartitionTest, MakeSegmentSetIgnoresOrder) {
  const PitchClass forward[] = {2, 7, 11};
  const PitchClass backward[] = {11, 7, 2};
  EXPECT_EQ(makeSegmentSet(forward, 3), makeSegmentSet(backward, 3));
  EXPECT_EQ(makeSegmentSet(forward, 3), 0x0884);
  EXPECT_TRUE(segmentContains(0x0884, 7));
  EXPECT_FALSE(segmentContains(0x0884, 8));
}

TEST(SegmentPartitionTest, PartitionIsContiguous) {
  Partition hex = partitionRow(kIdentity, SegmentSize::Hexachord);
  ASSERT_EQ(hex.size(), 2u);
  EXPECT_EQ(hex[0], setOf({0, 1, 2, 3, 4, 5}));
  EXPECT_EQ(hex[1], setOf({6, 7, 8, 9, 10, 11}));

  Partition tri = partitionRow({0, 11, 3, 4, 8, 7, 9, 5, 6, 1, 2, 10}, SegmentSize::Trichord);
  ASSERT_EQ(tri.size(), 4u);
  EXPECT_EQ(tri[0], setOf({0, 3, 11}));
  EXPECT_EQ(tri[1], setOf({4, 7, 8}));
  EXPECT_EQ(tri[2], setOf({5, 6, 9}));
  EXPECT_EQ(tri[3], setOf({1, 2, 10}));
}

TEST(SegmentPartitionTest, SegmentsCoverAggregate) {
  for (SegmentSize size : kAllSegmentSizes) {
    SegmentSet combined = 0;
    for (SegmentSet segment : partitionRow({4, 9, 0, 7, 2, 11, 5, 10, 1, 8, 3, 6}, size)) {
      EXPECT_EQ(combined & segment, 0);
      combined = static_cast<SegmentSet>(combined | segment);
    }
    EXPECT_EQ(combined, kAggregateMask) << segmentSizeToString(size);
  }
}

TEST(SegmentPartitionTest, MultisetIgnoresSegmentPosition) {
  Partition reference = {setOf({0, 1, 2, 3}), setOf({4, 5, 6, 7}), setOf({8, 9, 10, 11})};
  Partition rotated = {setOf({8, 9, 10, 11}), setOf({0, 1, 2, 3}), setOf({4, 5, 6, 7})};
  EXPECT_TRUE(matchesAsMultiset(rotated, reference));
  EXPECT_TRUE(matchesAsMultiset(reference, reference));
}

TEST(SegmentPartitionTest, MultisetRejectsDifferentSets) {
  Partition reference = {setOf({0, 1, 2, 3}), setOf({4, 5, 6, 7}), setOf({8, 9, 10, 11})};
  Partition other = {setOf({0, 1, 2, 4}), setOf({3, 5, 6, 7}), setOf({8, 9, 10, 11})};
  EXPECT_FALSE(matchesAsMultiset(other, reference));
}

TEST(SegmentPartitionTest, MultisetRejectsSizeMismatchAndLeftovers) {
  Partition reference = {setOf({0, 1, 2}), setOf({3, 4, 5})};
  Partition longer = {setOf({0, 1, 2}), setOf({3, 4, 5}), setOf({6, 7, 8})};
  EXPECT_FALSE(matchesAsMultiset(longer, reference));
  EXPECT_FALSE(matchesAsMultiset(reference, longer));
  EXPECT_TRUE(matchesAsMultiset({}, {}));
}

TEST(SegmentPartitionTest, MultisetCountsRepeats) {
  Partition reference = {setOf({0, 1}), setOf({0, 1}), setOf({2, 3})};
  Partition candidate = {setOf({0, 1}), setOf({2, 3}), setOf({2, 3})};
  EXPECT_FALSE(matchesAsMultiset(candidate, reference));
  EXPECT_FALSE(matchesAsMultiset(reference, candidate));
}

TEST(SegmentPartitionTest, FirstSegmentsDisjoint) {
  Partition reference = partitionRow(kIdentity, SegmentSize::Hexachord);
  Partition complement =
      partitionRow({6, 7, 8, 9, 10, 11, 0, 1, 2, 3, 4, 5}, SegmentSize::Hexachord);
  Partition overlapping =
      partitionRow({5, 6, 7, 8, 9, 10, 11, 0, 1, 2, 3, 4}, SegmentSize::Hexachord);
  EXPECT_TRUE(firstSegmentsDisjoint(complement, reference));
  EXPECT_FALSE(firstSegmentsDisjoint(overlapping, reference));
  EXPECT_FALSE(firstSegmentsDisjoint(reference, reference));
  EXPECT_FALSE(firstSegmentsDisjoint({}, reference));
}

}  // namespace
}  // namespace tonerow
