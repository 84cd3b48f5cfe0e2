// Chord types -- chord formulas, the injectable chord-quality table, and the
// immutable Chord value.

#ifndef CHORDMAP_HARMONY_CHORD_TYPES_H
#define CHORDMAP_HARMONY_CHORD_TYPES_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/interval.h"
#include "core/pitch_class_set.h"

namespace chordmap {

/// @brief Ordered semitone offsets from a root, with a symbolic name.
///
/// Offsets may exceed an octave (a ninth is 14) so that extended chords
/// voice naturally; membership comparisons always reduce mod 12. A formula
/// is immutable once validated and shared by every chord of that quality.
struct ChordFormula {
  std::string name;       ///< Short symbol, e.g. "maj7".
  std::string long_name;  ///< Display name, e.g. "Major 7th".
  std::vector<int> offsets;

  /// @brief Number of chord tones.
  size_t size() const { return offsets.size(); }

  /// @brief Pitch classes sounded when the formula is applied to root.
  PitchClassSet pitchClassesFrom(int root) const;

  /// @brief Offsets reduced to directionless intervals.
  IntervalSet intervalSet() const { return IntervalSet::fromOffsets(offsets); }
};

using ChordFormulaPtr = std::shared_ptr<const ChordFormula>;

/// @brief Result of validating or looking up a formula.
struct FormulaResult {
  ChordFormulaPtr formula;
  bool success = false;
  TheoryError error = TheoryError::None;
  std::string error_message;
};

/// Fewest distinct tones a chord formula may have.
constexpr int kMinChordTones = 2;

/// Largest semitone offset a formula may use (four octaves).
constexpr int kMaxFormulaOffset = 48;

/// @brief Check formula offsets shared by chord and scale formulas.
/// @param offsets Semitone offsets in formula order.
/// @param min_distinct Minimum number of distinct pitch classes.
/// @param why Output: reason when invalid.
/// @return False on an offset outside [0, kMaxFormulaOffset], a duplicate
///         mod 12, or too few tones.
bool validateFormulaOffsets(const std::vector<int>& offsets, int min_distinct,
                            std::string& why);

/// @brief Validate offsets and build a shared formula.
///
/// Fails with InvalidFormula when the name is empty, an offset is negative,
/// fewer than 2 distinct offsets are given, or two offsets coincide mod 12.
FormulaResult makeChordFormula(const std::string& name, const std::string& long_name,
                               const std::vector<int>& offsets);

/// @brief Name-to-formula configuration table for chord qualities.
///
/// Ships with defaults() but is plain data: callers add or replace
/// qualities and aliases without touching engine code.
class ChordQualityTable {
 public:
  ChordQualityTable() = default;

  /// @brief Table holding every built-in quality and alias.
  static ChordQualityTable defaults();

  /// @brief Validate and insert (or replace) a quality.
  FormulaResult add(const std::string& name, const std::string& long_name,
                    const std::vector<int>& offsets);

  /// @brief Register an alternative symbol for an existing quality.
  /// @return False if target is not a known quality name.
  bool addAlias(const std::string& alias, const std::string& target);

  /// @brief Resolve a quality symbol (name first, then alias).
  /// @return The formula, or nullptr if the symbol is unknown.
  ChordFormulaPtr find(const std::string& symbol) const;

  /// @brief All qualities ordered by name.
  std::vector<ChordFormulaPtr> all() const;

  /// @brief All quality names, ordered.
  std::vector<std::string> names() const;

  size_t size() const { return formulas_.size(); }

 private:
  std::map<std::string, ChordFormulaPtr> formulas_;
  std::map<std::string, std::string> aliases_;
};

/// @brief A chord: spelled root + shared formula + inversion index.
///
/// Immutable after construction by the chord builder. Equality is
/// structural (root spelling, formula, inversion, octave); use
/// sameSonority() to compare pitch-class content only.
struct Chord {
  Note root;
  ChordFormulaPtr formula;
  uint8_t inversion = 0;           ///< 0 = root position, N = Nth inversion.
  int octave = kDefaultOctave;     ///< Octave of the root in root position.

  bool operator==(const Chord& other) const;
  bool operator!=(const Chord& other) const { return !(*this == other); }
};

/// @brief True if two formulas have the same name and offsets.
bool sameFormula(const ChordFormulaPtr& lhs, const ChordFormulaPtr& rhs);

}  // namespace chordmap

#endif  // CHORDMAP_HARMONY_CHORD_TYPES_H
