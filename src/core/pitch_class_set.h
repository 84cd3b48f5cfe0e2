// Unordered set of pitch classes stored as a 12-bit mask.

#ifndef CHORDMAP_CORE_PITCH_CLASS_SET_H
#define CHORDMAP_CORE_PITCH_CLASS_SET_H

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace chordmap {

/// @brief A set of pitch classes (a sonority), independent of voicing.
///
/// Bit i is set when pitch class i is a member. Values outside [0, 12) are
/// normalized on insertion, so the set never holds an out-of-range class.
class PitchClassSet {
 public:
  PitchClassSet() = default;
  PitchClassSet(std::initializer_list<int> pitch_classes);

  /// @brief Construct directly from a 12-bit mask (higher bits ignored).
  static PitchClassSet fromMask(uint16_t mask);

  /// @brief Set containing every pitch class.
  static PitchClassSet chromatic();

  void insert(int pc);
  void erase(int pc);
  bool contains(int pc) const;

  /// @brief Number of members (0-12).
  int size() const;
  bool empty() const { return mask_ == 0; }
  uint16_t mask() const { return mask_; }

  /// @brief True if every member of this set is also in other.
  bool isSubsetOf(const PitchClassSet& other) const {
    return (mask_ & ~other.mask_) == 0;
  }

  bool isSupersetOf(const PitchClassSet& other) const { return other.isSubsetOf(*this); }

  PitchClassSet unionWith(const PitchClassSet& other) const;
  PitchClassSet intersectionWith(const PitchClassSet& other) const;

  /// @brief Every member shifted by semitones (mod 12).
  PitchClassSet transposed(int semitones) const;

  /// @brief Members in ascending pitch-class order.
  std::vector<PitchClass> toVector() const;

  /// @brief Comma-separated members, e.g. "0,4,7".
  std::string toString() const;

  bool operator==(const PitchClassSet& other) const { return mask_ == other.mask_; }
  bool operator!=(const PitchClassSet& other) const { return mask_ != other.mask_; }
  bool operator<(const PitchClassSet& other) const { return mask_ < other.mask_; }

 private:
  uint16_t mask_ = 0;
};

}  // namespace chordmap

#endif  // CHORDMAP_CORE_PITCH_CLASS_SET_H
