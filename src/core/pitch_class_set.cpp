// Implementation of the 12-bit pitch-class set.

#include "core/pitch_class_set.h"

#include "core/pitch_utils.h"

namespace chordmap {

namespace {

constexpr uint16_t kFullMask = 0x0FFF;

}  // namespace

PitchClassSet::PitchClassSet(std::initializer_list<int> pitch_classes) {
  for (int pc : pitch_classes) insert(pc);
}

PitchClassSet PitchClassSet::fromMask(uint16_t mask) {
  PitchClassSet result;
  result.mask_ = mask & kFullMask;
  return result;
}

PitchClassSet PitchClassSet::chromatic() { return fromMask(kFullMask); }

void PitchClassSet::insert(int pc) {
  mask_ = static_cast<uint16_t>(mask_ | (1u << normalize(pc)));
}

void PitchClassSet::erase(int pc) {
  mask_ = static_cast<uint16_t>(mask_ & ~(1u << normalize(pc)));
}

bool PitchClassSet::contains(int pc) const {
  return (mask_ & (1u << normalize(pc))) != 0;
}

int PitchClassSet::size() const {
  int count = 0;
  for (uint16_t bits = mask_; bits != 0; bits = static_cast<uint16_t>(bits & (bits - 1))) {
    ++count;
  }
  return count;
}

PitchClassSet PitchClassSet::unionWith(const PitchClassSet& other) const {
  return fromMask(static_cast<uint16_t>(mask_ | other.mask_));
}

PitchClassSet PitchClassSet::intersectionWith(const PitchClassSet& other) const {
  return fromMask(static_cast<uint16_t>(mask_ & other.mask_));
}

PitchClassSet PitchClassSet::transposed(int semitones) const {
  PitchClassSet result;
  for (int pc = 0; pc < kPitchClassCount; ++pc) {
    if (contains(pc)) result.insert(pc + semitones);
  }
  return result;
}

std::vector<PitchClass> PitchClassSet::toVector() const {
  std::vector<PitchClass> result;
  result.reserve(static_cast<size_t>(size()));
  for (int pc = 0; pc < kPitchClassCount; ++pc) {
    if (contains(pc)) result.push_back(static_cast<PitchClass>(pc));
  }
  return result;
}

std::string PitchClassSet::toString() const {
  std::string result;
  for (PitchClass pc : toVector()) {
    if (!result.empty()) result += ',';
    result += std::to_string(pc);
  }
  return result;
}

}  // namespace chordmap
