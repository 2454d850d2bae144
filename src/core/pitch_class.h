// Pitch-class arithmetic for twelve-tone analysis -- mod 12 normalization,
// transposition, inversion, and note name conversion.

#ifndef TONEROW_CORE_PITCH_CLASS_H
#define TONEROW_CORE_PITCH_CLASS_H

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tonerow {

/// Pitch class in [0, 11] (C=0).
using PitchClass = uint8_t;

/// Number of pitch classes in the aggregate.
constexpr int kAggregateSize = 12;

/// Ordered sequence of twelve pitch classes (a row, or a matrix line).
using RowArray = std::array<PitchClass, kAggregateSize>;

/// Sharp-spelled note names for pitch classes 0-11.
constexpr const char* kPitchClassNames[kAggregateSize] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

/// @brief Reduce any integer to its non-negative residue mod 12.
/// @param value Integer value (may be negative or >= 12).
/// @return Pitch class in [0, 11].
///
/// Examples: 14 -> 2, -1 -> 11, -12 -> 0.
constexpr PitchClass normalizePitchClass(int value) {
  return static_cast<PitchClass>(((value % kAggregateSize) + kAggregateSize) % kAggregateSize);
}

/// @brief Transpose a pitch class by an interval in semitones.
/// @param pc Pitch class to move.
/// @param interval Semitones (any sign, any size).
/// @return Transposed pitch class in [0, 11].
constexpr PitchClass transposePitchClass(PitchClass pc, int interval) {
  return normalizePitchClass(static_cast<int>(pc) + interval);
}

/// @brief Mirror a pitch class around 0: (12 - pc) mod 12.
constexpr PitchClass invertPitchClass(PitchClass pc) {
  return normalizePitchClass(-static_cast<int>(pc));
}

/// @brief Ascending interval from one pitch class to another, in [0, 11].
constexpr int intervalBetween(PitchClass from, PitchClass to) {
  return normalizePitchClass(static_cast<int>(to) - static_cast<int>(from));
}

/// @brief Check whether an integer is already a valid pitch class.
constexpr bool isPitchClass(int value) {
  return value >= 0 && value < kAggregateSize;
}

/// @brief Get the note name for a pitch class.
/// @param pc Pitch class (reduced mod 12 first).
/// @return Null-terminated name such as "C#".
const char* pitchClassName(PitchClass pc);

/// @brief Parse a single pitch-class token.
///
/// Accepts decimal integers "0".."11", the lowercase serial shorthand "t" (10)
/// and "e" (11), and sharp or flat note names ("C", "F#", "Bb"). Note names
/// must start with an uppercase letter so that "e" stays unambiguous.
///
/// @param token Token without surrounding whitespace.
/// @return Parsed pitch class, or nullopt when the token is not recognized.
std::optional<PitchClass> pitchClassFromString(std::string_view token);

}  // namespace tonerow

#endif  // TONEROW_CORE_PITCH_CLASS_H
