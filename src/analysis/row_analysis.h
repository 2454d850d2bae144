// Row analysis record -- assembles the three combinatoriality results for
// one row into the presentation record and its text/CSV/JSON renderings.

#ifndef TONEROW_ANALYSIS_ROW_ANALYSIS_H
#define TONEROW_ANALYSIS_ROW_ANALYSIS_H

#include <string>
#include <vector>

#include "analysis/combinatoriality.h"
#include "row/tone_row.h"

namespace tonerow {

/// Complete combinatoriality analysis of one prime row.
///
/// Each label field holds lexically sorted labels joined by single spaces;
/// an empty string means no combinatorial form at that granularity.
struct RowAnalysis {
  std::string prime_row;     ///< "0 11 3 4 8 7 9 5 6 1 2 10"
  std::string hexachordal;   ///< e.g. "I11 P6 RI5"
  std::string tetrachordal;
  std::string trichordal;

  /// @brief Label field for a granularity.
  const std::string& labelsFor(SegmentSize size) const;

  /// @brief Column names matching toCsvRow().
  static const char* csvHeader();

  /// @brief All four fields double-quoted and comma-separated.
  std::string toCsvRow() const;

  /// @brief Four labelled lines for terminal output.
  std::string toText() const;

  /// @brief Flat JSON object with the four fields (compact).
  std::string toJson() const;
};

/// @brief Run the detector at all three granularities and assemble the record.
RowAnalysis analyzeRow(const ToneRow& row);

}  // namespace tonerow

#endif  // TONEROW_ANALYSIS_ROW_ANALYSIS_H
