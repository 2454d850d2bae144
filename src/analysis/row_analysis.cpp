// Implementation of row analysis assembly and rendering.

#include "analysis/row_analysis.h"

#include <sstream>

#include "core/json_helpers.h"

namespace tonerow {

const std::string& RowAnalysis::labelsFor(SegmentSize size) const {
  switch (size) {
    case SegmentSize::Hexachord:  return hexachordal;
    case SegmentSize::Tetrachord: return tetrachordal;
    case SegmentSize::Trichord:   return trichordal;
  }
  return hexachordal;
}

const char* RowAnalysis::csvHeader() {
  return "prime_row,hexachordal_combinatorials,tetrachordal_combinatorials,"
         "trichordal_combinatorials";
}

std::string RowAnalysis::toCsvRow() const {
  // Fields never contain quotes: digits, labels and spaces only.
  std::ostringstream oss;
  oss << '"' << prime_row << "\","
      << '"' << hexachordal << "\","
      << '"' << tetrachordal << "\","
      << '"' << trichordal << '"';
  return oss.str();
}

std::string RowAnalysis::toText() const {
  std::ostringstream oss;
  oss << "Prime Row:                   " << prime_row << "\n";
  oss << "Hexachordal Combinatorials:  " << hexachordal << "\n";
  oss << "Tetrachordal Combinatorials: " << tetrachordal << "\n";
  oss << "Trichordal Combinatorials:   " << trichordal << "\n";
  return oss.str();
}

std::string RowAnalysis::toJson() const {
  JsonWriter writer;
  writer.beginObject();
  writer.key("prime_row");
  writer.value(prime_row);
  writer.key("hexachordal_combinatorials");
  writer.value(hexachordal);
  writer.key("tetrachordal_combinatorials");
  writer.value(tetrachordal);
  writer.key("trichordal_combinatorials");
  writer.value(trichordal);
  writer.endObject();
  return writer.toString();
}

RowAnalysis analyzeRow(const ToneRow& row) {
  RowAnalysis analysis;
  analysis.prime_row = row.toString();
  analysis.hexachordal = joinLabels(detectLabels(row, SegmentSize::Hexachord));
  analysis.tetrachordal = joinLabels(detectLabels(row, SegmentSize::Tetrachord));
  analysis.trichordal = joinLabels(detectLabels(row, SegmentSize::Trichord));
  return analysis;
}

}  // namespace tonerow
