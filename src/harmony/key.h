// Key signatures -- diatonic key spelling, accidental direction, and key
// relationships used for context-key note spelling.

#ifndef CHORDMAP_HARMONY_KEY_H
#define CHORDMAP_HARMONY_KEY_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/pitch_utils.h"

namespace chordmap {

/// @brief A key signature: spelled tonic plus mode.
///
/// The tonic keeps its spelling so that Gb major and F# major stay distinct
/// (they spell their scales with different letters).
struct KeySignature {
  Note tonic;
  bool is_minor = false;

  bool operator==(const KeySignature& other) const {
    return tonic == other.tonic && is_minor == other.is_minor;
  }

  bool operator!=(const KeySignature& other) const {
    return !(*this == other);
  }
};

/// @brief Spell the seven diatonic notes of a key with consecutive letters.
///
/// Major keys use the major scale, minor keys the natural minor scale.
/// F major -> F G A Bb C D E; D minor -> D E F G A Bb C.
std::vector<Note> keyScaleNotes(const KeySignature& key_sig);

/// @brief Net accidental count of the key signature.
/// @return Positive for sharps (G major = 1), negative for flats (F major = -1).
int keyAccidentalCount(const KeySignature& key_sig);

/// @brief Accidental direction implied by the key.
/// @return Flat for flat keys; Sharp for sharp keys and for C major / A minor.
SpellingPreference keyPreference(const KeySignature& key_sig);

/// @brief Spell a pitch class following a key's convention.
///
/// Diatonic pitch classes take the key's own spelling (pc 10 in F major is
/// Bb, pc 5 in F# major is E#). Chromatic pitch classes follow the key's
/// accidental direction.
Note spellInKey(int pc, const KeySignature& key_sig);

/// @brief Spell with an explicit preference; ContextKey uses key_sig.
/// @param pc Pitch class.
/// @param preference Sharp, Flat, ContextKey or Unspecified (sharp default).
/// @param key_sig Key consulted only for ContextKey.
Note spell(int pc, SpellingPreference preference, const KeySignature& key_sig);

/// @brief Relative major/minor (same key signature, different tonic).
KeySignature getRelative(const KeySignature& key_sig);

/// @brief Parallel major/minor (same tonic, opposite mode).
KeySignature getParallel(const KeySignature& key_sig);

/// @brief Dominant key (perfect 5th above, same mode).
KeySignature getDominant(const KeySignature& key_sig);

/// @brief Subdominant key (perfect 4th above, same mode).
KeySignature getSubdominant(const KeySignature& key_sig);

/// @brief Result of parsing a key signature.
struct KeyResult {
  KeySignature key;
  bool success = false;
  TheoryError error = TheoryError::None;
  std::string error_message;
};

/// @brief Parse a key signature from a string.
/// @param str "C_major", "g_minor", "Bb_major", "eb_minor", or a bare note
///        name (major assumed). The mode suffix is case-insensitive.
/// @return KeyResult; UnknownSymbol on an unparsable tonic or mode.
KeyResult keySignatureFromString(const std::string& str);

/// @brief Convert a key signature to a string such as "Bb_major".
std::string keySignatureToString(const KeySignature& key_sig);

}  // namespace chordmap

#endif  // CHORDMAP_HARMONY_KEY_H
