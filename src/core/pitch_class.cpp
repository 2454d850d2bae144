/// @file
/// @brief Pitch-class name conversion.

#include "core/pitch_class.h"

#include <cctype>

namespace tonerow {

namespace {

/// @brief Natural note letters mapped to pitch class (A-G).
constexpr int kLetterPitchClass[7] = {9, 11, 0, 2, 4, 5, 7};

/// @brief Parse a note name such as "C", "F#", "Bb" (uppercase letter required).
std::optional<PitchClass> parseNoteName(std::string_view token) {
  char letter = token[0];
  if (letter < 'A' || letter > 'G') return std::nullopt;

  int value = kLetterPitchClass[letter - 'A'];
  for (size_t pos = 1; pos < token.size(); ++pos) {
    if (token[pos] == '#') {
      ++value;
    } else if (token[pos] == 'b') {
      --value;
    } else {
      return std::nullopt;
    }
  }
  return normalizePitchClass(value);
}

}  // namespace

const char* pitchClassName(PitchClass pc) {
  return kPitchClassNames[normalizePitchClass(pc)];
}

std::optional<PitchClass> pitchClassFromString(std::string_view token) {
  if (token.empty()) return std::nullopt;

  if (token == "t") return 10;
  if (token == "e") return 11;

  if (std::isdigit(static_cast<unsigned char>(token[0]))) {
    // No leading zeros, at most two digits.
    if (token.size() > 2 || (token.size() == 2 && token[0] == '0')) return std::nullopt;
    int value = 0;
    for (char chr : token) {
      if (!std::isdigit(static_cast<unsigned char>(chr))) return std::nullopt;
      value = value * 10 + (chr - '0');
    }
    if (!isPitchClass(value)) return std::nullopt;
    return static_cast<PitchClass>(value);
  }

  return parseNoteName(token);
}

}  // namespace tonerow
