// Pitch-space utilities -- modular pitch-class arithmetic, enharmonic
// spelling, and note-name parsing.

#ifndef CHORDMAP_CORE_PITCH_UTILS_H
#define CHORDMAP_CORE_PITCH_UTILS_H

#include <cstdint>
#include <string>

#include "core/basic_types.h"

namespace chordmap {

// ---------------------------------------------------------------------------
// Interval constants (semitones)
// ---------------------------------------------------------------------------

namespace interval {

constexpr int kUnison = 0;
constexpr int kMinor2nd = 1;
constexpr int kMajor2nd = 2;
constexpr int kMinor3rd = 3;
constexpr int kMajor3rd = 4;
constexpr int kPerfect4th = 5;
constexpr int kTritone = 6;
constexpr int kPerfect5th = 7;
constexpr int kMinor6th = 8;
constexpr int kMajor6th = 9;
constexpr int kMinor7th = 10;
constexpr int kMajor7th = 11;
constexpr int kOctave = 12;

}  // namespace interval

// ---------------------------------------------------------------------------
// Note names
// ---------------------------------------------------------------------------

/// Sharp spellings for pitch classes 0-11 (C=0).
constexpr const char* kSharpNoteNames[] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

/// Flat spellings for pitch classes 0-11 (C=0).
constexpr const char* kFlatNoteNames[] = {
    "C", "Db", "D", "Eb", "E", "F", "Gb", "G", "Ab", "A", "Bb", "B"};

/// True if the pitch class is a white key (has a natural spelling).
constexpr bool kNaturalPitchClass[12] = {
    true, false, true, false, true, true, false, true, false, true, false, true};

/// Largest accidental accepted by the note grammar (double sharp / flat).
constexpr int kMaxAccidental = 2;

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

/// @brief Result of a spelling request that may be ambiguous.
struct SpellResult {
  Note note;
  bool success = false;
  TheoryError error = TheoryError::None;
  std::string error_message;
};

/// @brief Result of parsing a note symbol.
struct NoteResult {
  Note note;
  bool success = false;
  TheoryError error = TheoryError::None;
  std::string error_message;
};

// ---------------------------------------------------------------------------
// Pitch-class arithmetic
// ---------------------------------------------------------------------------

/// @brief Reduce any integer to a pitch class in [0, 12). Never fails.
/// @param value Any integer (negative values wrap upward).
/// @return value mod 12, always non-negative.
inline PitchClass normalize(int value) {
  int reduced = value % kPitchClassCount;
  if (reduced < 0) reduced += kPitchClassCount;
  return static_cast<PitchClass>(reduced);
}

/// @brief Ascending semitone count from a to b: (b - a) mod 12.
/// @return Directed distance in [0, 12).
inline int distance(PitchClass from, PitchClass to) {
  return normalize(static_cast<int>(to) - static_cast<int>(from));
}

/// @brief Shortest distance between two pitch classes in either direction.
/// @return Value in [0, 6].
inline int shortestDistance(PitchClass lhs, PitchClass rhs) {
  int up = distance(lhs, rhs);
  int down = distance(rhs, lhs);
  return up < down ? up : down;
}

/// @brief Transpose a pitch class by a signed number of semitones.
inline PitchClass transposePitchClass(PitchClass pc, int semitones) {
  return normalize(static_cast<int>(pc) + semitones);
}

// ---------------------------------------------------------------------------
// Spelling
// ---------------------------------------------------------------------------

/// @brief Spell a pitch class, reporting ambiguity instead of guessing.
///
/// White-key pitch classes always spell as naturals. Black keys spell with a
/// sharp or flat according to the preference. With Unspecified (or
/// ContextKey, which needs a key -- see harmony/key.h) both spellings are
/// equally valid and the result carries TheoryError::SpellingAmbiguous.
///
/// @param pc Pitch class (values outside [0, 12) are normalized).
/// @param preference Sharp or Flat.
/// @return SpellResult with success = false on ambiguity.
SpellResult spellStrict(int pc, SpellingPreference preference);

/// @brief Spell a pitch class, applying the default policy on ambiguity.
///
/// Identical to spellStrict() except that an ambiguous request resolves to
/// the sharp spelling. Never fails.
Note spell(int pc, SpellingPreference preference = SpellingPreference::Sharp);

/// @brief Spell a pitch class on a fixed letter.
/// @param pc Target pitch class.
/// @param letter Letter the spelling must use.
/// @param out Output note; written only on success.
/// @return False if reaching pc from letter needs more than a double accidental.
bool spellOnLetter(int pc, Letter letter, Note& out);

/// @brief Preference implied by a note's own spelling (flat if it has flats).
SpellingPreference preferenceOf(const Note& note);

// ---------------------------------------------------------------------------
// Note names
// ---------------------------------------------------------------------------

/// @brief Parse a note symbol such as "C", "f#", "Bb", "Ebb", "Fx", "C♯".
/// @param symbol Letter A-G (either case) followed by accidentals:
///        '#', 's' or "♯" raise; 'b' or "♭" lower; 'x' is a double sharp.
/// @return NoteResult; UnknownSymbol on any other input or on more than a
///         double accidental.
NoteResult parseNote(const std::string& symbol);

/// @brief Render a note in ASCII ("C#", "Bb", "Fx", "Ebb").
std::string noteToString(const Note& note);

/// @brief Render a pitched note ("C4", "F#3", "Bb5").
std::string pitchedNoteToString(const PitchedNote& pitched);

/// @brief Place a note in the lowest octave whose MIDI number is >= floor_midi.
/// @param note Spelled note.
/// @param floor_midi Lower bound (inclusive) on the resulting MIDI number.
PitchedNote placeAtOrAbove(const Note& note, int floor_midi);

}  // namespace chordmap

#endif  // CHORDMAP_CORE_PITCH_UTILS_H
