// Basic types for chord-space exploration -- pitch classes, spelled notes,
// spelling preferences, and the error taxonomy shared by every module.

#ifndef CHORDMAP_CORE_BASIC_TYPES_H
#define CHORDMAP_CORE_BASIC_TYPES_H

#include <cstdint>
#include <string>

namespace chordmap {

/// Pitch class in [0, 12). C=0, C#/Db=1, ..., B=11.
using PitchClass = uint8_t;

/// Number of pitch classes in 12-tone equal temperament.
constexpr int kPitchClassCount = 12;

/// Octave used for root-position voicings when none is given (C4 = MIDI 60).
constexpr int kDefaultOctave = 4;

/// Letter name of a note. Ordered C..B so that letter arithmetic is mod 7.
enum class Letter : uint8_t { C = 0, D, E, F, G, A, B };

/// Number of letter names.
constexpr int kLetterCount = 7;

/// Natural pitch class of each letter (C D E F G A B).
constexpr int kLetterPitchClass[kLetterCount] = {0, 2, 4, 5, 7, 9, 11};

/// @brief A tone with octave discarded, spelled for display.
///
/// Two notes with the same pitch class but different spelling are
/// enharmonically equal but not identical. Arithmetic always goes through
/// pitchClass(); the spelling is only carried for display.
struct Note {
  Letter letter = Letter::C;
  int8_t accidental = 0;  // +1 sharp, -1 flat, +2 double sharp, -2 double flat

  /// @brief Pitch class of this spelling.
  PitchClass pitchClass() const {
    int value = kLetterPitchClass[static_cast<int>(letter)] + accidental;
    return static_cast<PitchClass>(((value % 12) + 12) % 12);
  }

  /// @brief Identity: same letter and same accidental.
  bool operator==(const Note& other) const {
    return letter == other.letter && accidental == other.accidental;
  }

  bool operator!=(const Note& other) const { return !(*this == other); }
};

/// @brief True if both notes sound the same pitch class.
inline bool enharmonicallyEqual(const Note& lhs, const Note& rhs) {
  return lhs.pitchClass() == rhs.pitchClass();
}

/// @brief A spelled note placed in a specific octave.
struct PitchedNote {
  Note note;
  int octave = kDefaultOctave;

  /// @brief MIDI note number (C4 = 60). B#3 and C4 both map to 60.
  int midiNumber() const {
    return (octave + 1) * 12 + kLetterPitchClass[static_cast<int>(note.letter)] +
           note.accidental;
  }

  bool operator==(const PitchedNote& other) const {
    return note == other.note && octave == other.octave;
  }

  bool operator!=(const PitchedNote& other) const { return !(*this == other); }
};

/// Which enharmonic spelling to prefer for black-key pitch classes.
enum class SpellingPreference : uint8_t {
  Unspecified,  ///< No preference given (ambiguous for black keys).
  Sharp,
  Flat,
  ContextKey    ///< Follow a supplied key signature.
};

/// @brief Error taxonomy. Every condition is local and recoverable.
enum class TheoryError : uint8_t {
  None,
  InvalidFormula,     ///< Malformed chord or scale formula.
  SpellingAmbiguous,  ///< No preference and both spellings equally valid.
  UnknownNode,        ///< Session API misuse (node missing or not adjacent).
  EmptyPivotSet,      ///< Empty pivot over a pool above the safety limit.
  UnknownSymbol,      ///< Root, quality, or scale symbol did not resolve.
  SessionEnded        ///< Exploration call on a session that was ended.
};

/// @brief Convert a TheoryError to a stable name.
const char* theoryErrorToString(TheoryError error);

/// @brief Convert a Letter to its uppercase character.
char letterToChar(Letter letter);

/// @brief Convert a SpellingPreference to a string.
const char* spellingPreferenceToString(SpellingPreference preference);

/// @brief Parse a spelling preference: "sharp", "flat", "key".
/// @return Unspecified on unrecognized input.
SpellingPreference spellingPreferenceFromString(const std::string& str);

/// @brief Shift a letter by a number of steps (mod 7, negative allowed).
inline Letter letterAdd(Letter letter, int steps) {
  int value = (static_cast<int>(letter) + steps) % kLetterCount;
  if (value < 0) value += kLetterCount;
  return static_cast<Letter>(value);
}

/// @brief Ascending letter steps from lhs to rhs (0-6).
inline int letterDistance(Letter lhs, Letter rhs) {
  int diff = (static_cast<int>(rhs) - static_cast<int>(lhs)) % kLetterCount;
  return diff < 0 ? diff + kLetterCount : diff;
}

}  // namespace chordmap

#endif  // CHORDMAP_CORE_BASIC_TYPES_H
