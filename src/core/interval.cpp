/// @file
/// @brief Interval naming, inversion, and interval-set utilities.

#include "core/interval.h"

#include <cstdlib>

#include "core/pitch_utils.h"

namespace chordmap {

namespace {

/// @brief Canonical names indexed by simple interval (0-11 semitones).
constexpr const char* kIntervalNames[12] = {
    "perfect unison",  // 0
    "minor second",    // 1
    "major second",    // 2
    "minor third",     // 3
    "major third",     // 4
    "perfect fourth",  // 5
    "tritone",         // 6
    "perfect fifth",   // 7
    "minor sixth",     // 8
    "major sixth",     // 9
    "minor seventh",   // 10
    "major seventh"    // 11
};

/// @brief Augmented alternatives (nullptr = none; fall back to canonical).
constexpr const char* kAugmentedNames[12] = {
    nullptr,             // 0
    "augmented unison",  // 1
    nullptr,             // 2
    "augmented second",  // 3
    nullptr,             // 4
    "augmented third",   // 5
    "augmented fourth",  // 6
    nullptr,             // 7
    "augmented fifth",   // 8
    nullptr,             // 9
    "augmented sixth",   // 10
    nullptr              // 11
};

/// @brief Diminished alternatives (nullptr = none; fall back to canonical).
constexpr const char* kDiminishedNames[12] = {
    "diminished second",   // 0
    nullptr,               // 1
    "diminished third",    // 2
    nullptr,               // 3
    "diminished fourth",   // 4
    nullptr,               // 5
    "diminished fifth",    // 6
    "diminished sixth",    // 7
    nullptr,               // 8
    "diminished seventh",  // 9
    nullptr,               // 10
    "diminished octave"    // 11
};

constexpr const char* kNumberNames[7] = {
    "unison", "second", "third", "fourth", "fifth", "sixth", "seventh"};

/// Semitones of the perfect or major interval for each number (unison..7th).
constexpr int kReferenceSemitones[7] = {0, 2, 4, 5, 7, 9, 11};

/// @brief True for unison, fourth and fifth (perfect-class numbers).
bool isPerfectNumber(int number_index) {
  return number_index == 0 || number_index == 3 || number_index == 4;
}

}  // namespace

const char* Interval::name() const { return intervalName(semitones); }

Interval makeInterval(int semitones) {
  Interval result;
  result.semitones = normalize(semitones);
  return result;
}

Interval makeDirectedInterval(int semitones) {
  Interval result;
  result.semitones = static_cast<uint8_t>(compoundToSimple(semitones));
  result.direction = semitones < 0 ? IntervalDirection::Descending : IntervalDirection::Ascending;
  return result;
}

Interval intervalBetween(const Note& from, const Note& to) {
  return makeInterval(distance(from.pitchClass(), to.pitchClass()));
}

Interval intervalBetween(const PitchedNote& from, const PitchedNote& to) {
  return makeDirectedInterval(to.midiNumber() - from.midiNumber());
}

Interval invert(const Interval& ivl) {
  Interval result = ivl;
  result.semitones = normalize(kPitchClassCount - static_cast<int>(ivl.semitones));
  return result;
}

int compoundToSimple(int semitones) {
  return std::abs(semitones) % 12;
}

const char* intervalName(int semitones, IntervalNaming naming) {
  int simple = normalize(semitones);
  if (naming == IntervalNaming::Augmented && kAugmentedNames[simple] != nullptr) {
    return kAugmentedNames[simple];
  }
  if (naming == IntervalNaming::Diminished && kDiminishedNames[simple] != nullptr) {
    return kDiminishedNames[simple];
  }
  return kIntervalNames[simple];
}

std::string spelledIntervalName(const Note& from, const Note& to) {
  int number_index = letterDistance(from.letter, to.letter);
  int semis = distance(from.pitchClass(), to.pitchClass());
  int diff = semis - kReferenceSemitones[number_index];
  // Wrap so that e.g. C->Cb (11 vs 0) reads as one semitone below unison.
  if (diff > 6) diff -= 12;
  if (diff < -6) diff += 12;

  const char* quality = nullptr;
  if (isPerfectNumber(number_index)) {
    switch (diff) {
      case 0:  quality = "perfect"; break;
      case 1:  quality = "augmented"; break;
      case -1: quality = "diminished"; break;
      case 2:  quality = "doubly augmented"; break;
      case -2: quality = "doubly diminished"; break;
      default: break;
    }
  } else {
    switch (diff) {
      case 0:  quality = "major"; break;
      case -1: quality = "minor"; break;
      case 1:  quality = "augmented"; break;
      case -2: quality = "diminished"; break;
      case 2:  quality = "doubly augmented"; break;
      case -3: quality = "doubly diminished"; break;
      default: break;
    }
  }

  if (quality == nullptr) return intervalName(semis);
  return std::string(quality) + " " + kNumberNames[number_index];
}

std::string describeInterval(const Note& from, const Note& to, IntervalNaming naming) {
  if (naming == IntervalNaming::Spelled) return spelledIntervalName(from, to);
  return intervalName(distance(from.pitchClass(), to.pitchClass()), naming);
}

bool isPerfectInterval(int semitones) {
  int simple = compoundToSimple(semitones);
  return simple == interval::kUnison ||
         simple == interval::kPerfect4th ||
         simple == interval::kPerfect5th;
}

IntervalSet IntervalSet::fromOffsets(const std::vector<int>& offsets) {
  IntervalSet result;
  for (int offset : offsets) result.members_.insert(offset);
  return result;
}

IntervalSet IntervalSet::unionWith(const IntervalSet& other) const {
  IntervalSet result;
  result.members_ = members_.unionWith(other.members_);
  return result;
}

IntervalSet IntervalSet::intersectionWith(const IntervalSet& other) const {
  IntervalSet result;
  result.members_ = members_.intersectionWith(other.members_);
  return result;
}

std::vector<Interval> IntervalSet::toVector() const {
  std::vector<Interval> result;
  for (PitchClass semis : members_.toVector()) result.push_back(makeInterval(semis));
  return result;
}

}  // namespace chordmap
