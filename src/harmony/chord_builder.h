// Chord construction -- building chords from root + formula, inversion with
// octave re-voicing, spelling, sonority keys, and chord symbols.

#ifndef CHORDMAP_HARMONY_CHORD_BUILDER_H
#define CHORDMAP_HARMONY_CHORD_BUILDER_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/pitch_class_set.h"
#include "harmony/chord_types.h"
#include "harmony/key.h"

namespace chordmap {

/// @brief Result of building a chord. No partially built chord is exposed:
///        on failure `chord` is default-constructed.
struct ChordResult {
  Chord chord;
  bool success = false;
  TheoryError error = TheoryError::None;
  std::string error_message;
};

/// @brief Build a root-position chord.
/// @param root Spelled root.
/// @param formula Shared formula; re-validated here.
/// @param octave Octave of the root (default C4 octave).
/// @return ChordResult; InvalidFormula if formula is null or malformed.
ChordResult buildChord(const Note& root, const ChordFormulaPtr& formula,
                       int octave = kDefaultOctave);

/// @brief Invert a chord by n steps.
///
/// The formula's offset sequence is rotated left by n mod formula length
/// (negative n rotates right), counted from the chord's current inversion.
/// Root, formula and pitch-class content are unchanged; soundingNotes()
/// re-derives the voicing from the new bass.
Chord invertChord(const Chord& chord, int steps);

/// @brief Chord tones in formula order, spelled from the root.
///
/// Each tone takes the letter of its chord degree above the root (third,
/// fifth, ...), so C minor spells C Eb G and F# major spells F# A# C#.
/// Tones that would need more than a double accidental fall back to the
/// root's accidental direction.
std::vector<Note> chordTones(const Chord& chord);

/// @brief Sounding notes from the bass upward, strictly ascending.
///
/// The bass is the tone at the rotated lowest position, kept at its
/// root-position pitch. Each following tone is raised by octaves until it
/// lies above the previous one. C major, first inversion, octave 4:
/// E4 G4 C5.
std::vector<PitchedNote> soundingNotes(const Chord& chord);

/// @brief Lowest sounding note.
PitchedNote bassNote(const Chord& chord);

/// @brief Sounding notes re-spelled in a context key (bass upward).
std::vector<Note> spellAll(const Chord& chord, const KeySignature& key_sig);

/// @brief Sounding notes spelled with an explicit preference (bass upward).
std::vector<Note> spellAll(const Chord& chord, SpellingPreference preference);

/// @brief Unordered pitch-class content; invariant under inversion.
PitchClassSet sonorityKey(const Chord& chord);

/// @brief True if both chords sound the same pitch-class set.
bool sameSonority(const Chord& lhs, const Chord& rhs);

/// @brief Display symbol: "C maj7"; inversions add the bass: "C maj/E".
std::string chordSymbol(const Chord& chord);

/// @brief Split a compact symbol such as "C#m7" into root and quality.
/// @param symbol Letter, accidentals ('#', 'b', 'x', "♯", "♭"), then quality.
/// @param root Output root part ("C#").
/// @param quality Output quality part ("m7"), possibly empty.
/// @return False if the symbol does not start with a note letter.
bool splitChordSymbol(const std::string& symbol, std::string& root, std::string& quality);

/// @brief Every root-position chord in the table with exactly this sonority.
/// @param table Quality table to search.
/// @param pitch_classes Target sonority.
/// @param preference Spelling for black-key roots.
/// @return Matches ordered by root pitch class, then quality name.
std::vector<Chord> identifyChords(const ChordQualityTable& table,
                                  const PitchClassSet& pitch_classes,
                                  SpellingPreference preference = SpellingPreference::Sharp);

}  // namespace chordmap

#endif  // CHORDMAP_HARMONY_CHORD_BUILDER_H
