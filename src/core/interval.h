// Interval calculus -- named intervals, inversion, enharmonic naming, and
// interval-set operations for formula comparison.

#ifndef CHORDMAP_CORE_INTERVAL_H
#define CHORDMAP_CORE_INTERVAL_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/pitch_class_set.h"

namespace chordmap {

/// Direction flag separating formula intervals from melodic motion.
enum class IntervalDirection : uint8_t {
  None,        ///< Directionless (chord/scale formulas).
  Ascending,
  Descending
};

/// Naming style for interval-quality lookup.
enum class IntervalNaming : uint8_t {
  Plain,       ///< Canonical table: minor/major/perfect, 6 = tritone.
  Augmented,   ///< Prefer the augmented alternative where one exists.
  Diminished,  ///< Prefer the diminished alternative where one exists.
  Spelled      ///< Derive from letter distance (needs two spelled notes).
};

/// @brief An interval reduced to one octave.
///
/// The semitone distance is the only key for equality. The quality name is
/// derived from it (name()) and cannot be set independently.
struct Interval {
  uint8_t semitones = 0;  // [0, 12)
  IntervalDirection direction = IntervalDirection::None;

  /// @brief Canonical quality name, e.g. "minor third".
  const char* name() const;

  bool isDirected() const { return direction != IntervalDirection::None; }

  /// @brief Semitones with sign: negative when descending.
  int signedSemitones() const {
    return direction == IntervalDirection::Descending ? -static_cast<int>(semitones)
                                                      : static_cast<int>(semitones);
  }

  bool operator==(const Interval& other) const { return semitones == other.semitones; }
  bool operator!=(const Interval& other) const { return semitones != other.semitones; }
};

/// @brief Directionless interval of the given size (reduced mod 12).
Interval makeInterval(int semitones);

/// @brief Directed interval: the sign of semitones gives the direction.
///
/// The magnitude is reduced to a simple interval, so -15 becomes a
/// descending minor third. Zero is treated as ascending.
Interval makeDirectedInterval(int semitones);

/// @brief Directionless interval from a up to b (pitch-class distance).
Interval intervalBetween(const Note& from, const Note& to);

/// @brief Directed melodic interval between two placed notes.
Interval intervalBetween(const PitchedNote& from, const PitchedNote& to);

/// @brief Classic interval inversion: (12 - semitones) mod 12.
///
/// Unison inverts to the octave, which reduces back to semitone 0, so
/// unison is a fixed point. Direction is kept unchanged. invert is an
/// involution: invert(invert(i)) == i.
Interval invert(const Interval& ivl);

/// @brief Quality name for an interval size.
/// @param semitones Interval size (negative and compound values are reduced).
/// @param naming Plain, Augmented or Diminished (Spelled falls back to Plain).
/// @return Name such as "major third" or "augmented fourth".
const char* intervalName(int semitones, IntervalNaming naming = IntervalNaming::Plain);

/// @brief Interval name derived from two spellings (letter steps + semitones).
///
/// C->D# is an "augmented second", C->Eb a "minor third", C->Cb a
/// "diminished unison".
std::string spelledIntervalName(const Note& from, const Note& to);

/// @brief Name the interval between two notes in the requested style.
std::string describeInterval(const Note& from, const Note& to,
                             IntervalNaming naming = IntervalNaming::Plain);

/// @brief Reduce a compound or negative interval to [0, 11].
///
/// Examples: 19 -> 7, -3 -> 3, 24 -> 0.
int compoundToSimple(int semitones);

/// @brief True for unison, perfect 4th and perfect 5th (after reduction).
bool isPerfectInterval(int semitones);

/// @brief A set of directionless interval sizes, used to compare formulas.
class IntervalSet {
 public:
  IntervalSet() = default;

  /// @brief Build from formula offsets (each reduced mod 12).
  static IntervalSet fromOffsets(const std::vector<int>& offsets);

  void insert(const Interval& ivl) { members_.insert(ivl.semitones); }
  bool contains(const Interval& ivl) const { return members_.contains(ivl.semitones); }
  bool contains(int semitones) const { return members_.contains(semitones); }
  int size() const { return members_.size(); }

  IntervalSet unionWith(const IntervalSet& other) const;
  IntervalSet intersectionWith(const IntervalSet& other) const;
  bool isSubsetOf(const IntervalSet& other) const {
    return members_.isSubsetOf(other.members_);
  }

  /// @brief Members as directionless intervals, smallest first.
  std::vector<Interval> toVector() const;

  bool operator==(const IntervalSet& other) const { return members_ == other.members_; }
  bool operator!=(const IntervalSet& other) const { return members_ != other.members_; }

 private:
  PitchClassSet members_;
};

}  // namespace chordmap

#endif  // CHORDMAP_CORE_INTERVAL_H
