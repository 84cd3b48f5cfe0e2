// Scale model -- scales as tonic + parent formula + mode index, with the
// relative-mode and parallel-mode operations kept distinct.

#ifndef CHORDMAP_HARMONY_SCALE_H
#define CHORDMAP_HARMONY_SCALE_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/pitch_class_set.h"
#include "harmony/chord_builder.h"
#include "harmony/chord_types.h"
#include "harmony/scale_types.h"

namespace chordmap {

/// @brief A scale: spelled tonic + parent formula + mode index.
///
/// The effective offsets are the parent formula rotated by mode_index (see
/// rotateScaleOffsets). `bias` is the accidental direction used to spell
/// degrees that cannot be spelled by consecutive letters; it is fixed when
/// the scale is built and inherited by every mode and transposition.
///
/// `anchor` is the spelled tonic at mode `anchor_mode`. Relative modes
/// spell their tonic from the anchor rather than from the current tonic,
/// so rotating away and back restores the original spelling.
struct Scale {
  Note tonic;
  ScaleFormulaPtr formula;
  int mode_index = 0;
  SpellingPreference bias = SpellingPreference::Sharp;
  Note anchor;
  int anchor_mode = 0;

  /// @brief Structural equality: tonic spelling, formula, mode index.
  /// The anchor is a spelling hint and does not take part.
  bool operator==(const Scale& other) const;
  bool operator!=(const Scale& other) const { return !(*this == other); }
};

/// @brief Result of building a scale.
struct ScaleResult {
  Scale scale;
  bool success = false;
  TheoryError error = TheoryError::None;
  std::string error_message;
};

/// @brief Build a scale in its base mode (mode index 0).
/// @return InvalidFormula if formula is null or malformed.
ScaleResult buildScale(const Note& tonic, const ScaleFormulaPtr& formula);

/// @brief Offsets from the scale's own tonic (the rotated formula).
std::vector<int> scaleOffsets(const Scale& scale);

/// @brief Relative mode: rotate by k and move the tonic to degree k.
///
/// Pitch-class content is unchanged: mode(C major, 1) is D Dorian.
/// Negative k rotates backwards; mode(mode(s, k), n - k) == s.
Scale mode(const Scale& scale, int k);

/// @brief Parallel mode: rotate by k but keep the tonic.
///
/// parallelMode(C major, 1) is C Dorian (C D Eb F G A Bb), a different
/// pitch-class set from the parent.
Scale parallelMode(const Scale& scale, int k);

/// @brief Same formula and mode on a new tonic.
Scale transpose(const Scale& scale, const Note& tonic);

/// @brief Spelled degree notes, tonic first.
///
/// Seven-degree scales use consecutive letters (F major -> ... Bb ...;
/// C Dorian -> ... Eb ... Bb). Other sizes spell with the scale's bias.
std::vector<Note> degrees(const Scale& scale);

/// @brief Pitch-class content of the scale.
PitchClassSet scalePitchClasses(const Scale& scale);

/// @brief True if pc (any integer, normalized) is a scale degree.
bool contains(const Scale& scale, int pc);

/// @brief Find the 0-based degree of a pitch class.
/// @param out_degree Output: degree index when found.
/// @return False if pc is not in the scale.
bool degreeOf(const Scale& scale, int pc, int& out_degree);

/// @brief Chord built by stacking scale thirds on a degree.
///
/// Takes every other degree starting at `degree` (0-based, any integer
/// reduced mod size), `voices` tones in total, and resolves the resulting
/// offsets against the chord table (exact offsets first, then pitch-class
/// content). C major, degree 1, 3 voices -> D min.
/// @return UnknownSymbol when no table quality matches; InvalidFormula
///         when voices < 2.
ChordResult diatonicChord(const Scale& scale, int degree, int voices,
                          const ChordQualityTable& table);

/// @brief Display name: "C major", or the matching table name for modes
///        ("D dorian"), or "<tonic> <formula> mode <k>" when none matches.
std::string scaleName(const Scale& scale, const ScaleFormulaTable& table);

}  // namespace chordmap

#endif  // CHORDMAP_HARMONY_SCALE_H
