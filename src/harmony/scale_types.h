// Scale formulas and the injectable scale-formula table.

#ifndef CHORDMAP_HARMONY_SCALE_TYPES_H
#define CHORDMAP_HARMONY_SCALE_TYPES_H

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/pitch_class_set.h"

namespace chordmap {

/// @brief Ascending semitone offsets from a tonic within one octave.
///
/// The first offset is always 0 and offsets are strictly ascending below 12,
/// so rotation into modes stays well defined.
struct ScaleFormula {
  std::string name;       ///< Table key, e.g. "dorian".
  std::string long_name;  ///< Display name, e.g. "Dorian".
  std::vector<int> offsets;

  /// @brief Number of scale degrees.
  size_t size() const { return offsets.size(); }

  /// @brief Pitch classes of the formula applied to tonic.
  PitchClassSet pitchClassesFrom(int tonic) const;
};

using ScaleFormulaPtr = std::shared_ptr<const ScaleFormula>;

/// @brief Result of validating or looking up a scale formula.
struct ScaleFormulaResult {
  ScaleFormulaPtr formula;
  bool success = false;
  TheoryError error = TheoryError::None;
  std::string error_message;
};

/// Fewest degrees a scale formula may have.
constexpr int kMinScaleDegrees = 2;

/// @brief Validate offsets and build a shared scale formula.
///
/// Fails with InvalidFormula on an empty name, a first offset other than 0,
/// offsets that are not strictly ascending within [0, 12), or fewer than
/// 2 degrees.
ScaleFormulaResult makeScaleFormula(const std::string& name, const std::string& long_name,
                                    const std::vector<int>& offsets);

/// @brief Offsets of the kth rotation: (offsets[(i+k) mod n] - offsets[k]) mod 12.
/// @param offsets Base offsets (0 first, ascending).
/// @param k Rotation (any integer, reduced mod n).
std::vector<int> rotateScaleOffsets(const std::vector<int>& offsets, int k);

/// @brief Name-to-formula configuration table for scales.
class ScaleFormulaTable {
 public:
  ScaleFormulaTable() = default;

  /// @brief Table holding the built-in scales and aliases.
  static ScaleFormulaTable defaults();

  /// @brief Validate and insert (or replace) a scale.
  ScaleFormulaResult add(const std::string& name, const std::string& long_name,
                         const std::vector<int>& offsets);

  /// @brief Register an alternative name for an existing scale.
  /// @return False if target is unknown.
  bool addAlias(const std::string& alias, const std::string& target);

  /// @brief Resolve a scale name (name first, then alias, case-insensitive).
  /// @return The formula, or nullptr if unknown.
  ScaleFormulaPtr find(const std::string& symbol) const;

  /// @brief First scale (by name) whose offsets equal the given sequence.
  /// @return nullptr if no entry matches.
  ScaleFormulaPtr findByOffsets(const std::vector<int>& offsets) const;

  /// @brief All scale names, ordered.
  std::vector<std::string> names() const;

  size_t size() const { return formulas_.size(); }

 private:
  std::map<std::string, ScaleFormulaPtr> formulas_;
  std::map<std::string, std::string> aliases_;
};

}  // namespace chordmap

#endif  // CHORDMAP_HARMONY_SCALE_TYPES_H
