// Segment partition engine -- slices a twelve-note form into equal
// contiguous segments and compares partitions as unordered collections.

#ifndef TONEROW_ANALYSIS_SEGMENT_PARTITION_H
#define TONEROW_ANALYSIS_SEGMENT_PARTITION_H

#include <cstdint>
#include <vector>

#include "core/pitch_class.h"

namespace tonerow {

/// Segment granularity for combinatoriality analysis (notes per segment).
enum class SegmentSize : uint8_t {
  Trichord = 3,
  Tetrachord = 4,
  Hexachord = 6
};

/// All analyzed granularities, coarsest first.
constexpr SegmentSize kAllSegmentSizes[3] = {
    SegmentSize::Hexachord, SegmentSize::Tetrachord, SegmentSize::Trichord};

/// @brief Convert SegmentSize to a name ("hexachord", "tetrachord", "trichord").
const char* segmentSizeToString(SegmentSize size);

/// @brief Number of notes in one segment.
constexpr int segmentLength(SegmentSize size) { return static_cast<int>(size); }

/// @brief Number of segments a twelve-note form splits into (2, 3 or 4).
constexpr int segmentCount(SegmentSize size) { return kAggregateSize / segmentLength(size); }

/// Unordered pitch-class set as a 12-bit mask (bit n set = pitch class n present).
using SegmentSet = uint16_t;

/// Mask with all twelve pitch classes present.
constexpr SegmentSet kAggregateMask = 0x0FFF;

/// Ordered segments of one form; position is kept, order within a segment is not.
using Partition = std::vector<SegmentSet>;

/// @brief Build the set for a run of pitch classes.
/// @param begin Pointer to the first pitch class.
/// @param count Number of pitch classes to include.
SegmentSet makeSegmentSet(const PitchClass* begin, int count);

/// @brief Check membership of a pitch class in a segment set.
constexpr bool segmentContains(SegmentSet set, PitchClass pc) {
  return (set >> pc) & 1u;
}

/// @brief Split a form into consecutive, non-overlapping segments.
/// @param form Twelve-note form.
/// @param size Segment granularity.
/// @return segmentCount(size) sets in form order.
Partition partitionRow(const RowArray& form, SegmentSize size);

/// @brief Compare two partitions as unordered collections of sets.
///
/// Each reference segment, in order, is matched to and removed from the
/// remaining candidate segments by set equality; the comparison fails as soon
/// as a reference segment has no remaining equal candidate, and also fails
/// when candidates are left over.
///
/// @param candidate Partition of the transformed form.
/// @param reference Partition of the reference row.
/// @return True when both hold exactly the same collection of sets.
bool matchesAsMultiset(const Partition& candidate, const Partition& reference);

/// @brief Check whether the first segments of two partitions share no pitch class.
///
/// For hexachords this is the classical combinatoriality test: a first
/// hexachord disjoint from the reference's first hexachord is its complement.
bool firstSegmentsDisjoint(const Partition& candidate, const Partition& reference);

}  // namespace tonerow

#endif  // TONEROW_ANALYSIS_SEGMENT_PARTITION_H
