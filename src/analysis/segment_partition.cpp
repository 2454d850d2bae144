/// @file
/// @brief Segment partitioning and partition comparison.

#include "analysis/segment_partition.h"

#include <cstddef>

namespace tonerow {

const char* segmentSizeToString(SegmentSize size) {
  switch (size) {
    case SegmentSize::Trichord:   return "trichord";
    case SegmentSize::Tetrachord: return "tetrachord";
    case SegmentSize::Hexachord:  return "hexachord";
  }
  return "unknown";
}

SegmentSet makeSegmentSet(const PitchClass* begin, int count) {
  SegmentSet set = 0;
  for (int idx = 0; idx < count; ++idx) {
    set = static_cast<SegmentSet>(set | (1u << begin[idx]));
  }
  return set;
}

Partition partitionRow(const RowArray& form, SegmentSize size) {
  const int length = segmentLength(size);
  Partition partition;
  partition.reserve(static_cast<size_t>(segmentCount(size)));
  for (int start = 0; start < kAggregateSize; start += length) {
    partition.push_back(makeSegmentSet(form.data() + start, length));
  }
  return partition;
}

bool matchesAsMultiset(const Partition& candidate, const Partition& reference) {
  if (candidate.size() != reference.size()) return false;

  // Greedy removal is exact here: set equality is an equivalence relation,
  // so any equal candidate is as good as any other.
  Partition remaining = candidate;
  for (SegmentSet wanted : reference) {
    bool found = false;
    for (size_t idx = 0; idx < remaining.size(); ++idx) {
      if (remaining[idx] == wanted) {
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(idx));
        found = true;
        break;
      }
    }
    if (!found) return false;
  }
  return remaining.empty();
}

bool firstSegmentsDisjoint(const Partition& candidate, const Partition& reference) {
  if (candidate.empty() || reference.empty()) return false;
  return (candidate.front() & reference.front()) == 0;
}

}  // namespace tonerow
