// Implementation of the scale model.

#include "harmony/scale.h"

#include "core/pitch_utils.h"
#include "harmony/key.h"

namespace chordmap {

namespace {

/// Number of degrees that are spelled with consecutive letters.
constexpr size_t kHeptatonicSize = 7;

/// @brief Reduce a rotation into [0, n).
int wrapIndex(int value, int size) {
  if (size <= 0) return 0;
  int result = value % size;
  return result < 0 ? result + size : result;
}

/// @brief Accidental bias implied by a tonic and formula.
///
/// Accidental tonics keep their own direction. Natural tonics follow the
/// key signature of the major or minor key the formula most resembles.
SpellingPreference biasFor(const Note& tonic, const std::vector<int>& offsets) {
  if (tonic.accidental != 0) return preferenceOf(tonic);
  bool has_minor_third = false;
  bool has_major_third = false;
  for (int offset : offsets) {
    if (offset == 3) has_minor_third = true;
    if (offset == 4) has_major_third = true;
  }
  KeySignature key_sig{tonic, has_minor_third && !has_major_third};
  return keyPreference(key_sig);
}

}  // namespace

bool Scale::operator==(const Scale& other) const {
  if (tonic != other.tonic || mode_index != other.mode_index) return false;
  if (formula == other.formula) return true;
  if (!formula || !other.formula) return false;
  return formula->name == other.formula->name && formula->offsets == other.formula->offsets;
}

ScaleResult buildScale(const Note& tonic, const ScaleFormulaPtr& formula) {
  ScaleResult result;
  if (!formula) {
    result.error = TheoryError::InvalidFormula;
    result.error_message = "Scale formula is missing";
    return result;
  }

  ScaleFormulaResult checked = makeScaleFormula(formula->name, formula->long_name,
                                                formula->offsets);
  if (!checked.success) {
    result.error = checked.error;
    result.error_message = checked.error_message;
    return result;
  }

  result.scale.tonic = tonic;
  result.scale.formula = formula;
  result.scale.mode_index = 0;
  result.scale.bias = biasFor(tonic, formula->offsets);
  result.scale.anchor = tonic;
  result.scale.anchor_mode = 0;
  result.success = true;
  return result;
}

std::vector<int> scaleOffsets(const Scale& scale) {
  if (!scale.formula) return {};
  return rotateScaleOffsets(scale.formula->offsets, scale.mode_index);
}

Scale mode(const Scale& scale, int k) {
  Scale result = parallelMode(scale, k);
  if (!scale.formula || scale.formula->size() == 0) return result;
  result.anchor = scale.anchor;
  result.anchor_mode = scale.anchor_mode;

  // Spell the new tonic as a degree of the anchor scale.
  int size = static_cast<int>(scale.formula->size());
  Scale anchored = scale;
  anchored.tonic = scale.anchor;
  anchored.mode_index = scale.anchor_mode;
  std::vector<Note> spelled = degrees(anchored);
  result.tonic = spelled[wrapIndex(result.mode_index - scale.anchor_mode, size)];
  return result;
}

Scale parallelMode(const Scale& scale, int k) {
  Scale result = scale;
  if (!scale.formula || scale.formula->size() == 0) return result;
  result.mode_index = wrapIndex(scale.mode_index + k, static_cast<int>(scale.formula->size()));
  result.anchor = result.tonic;
  result.anchor_mode = result.mode_index;
  return result;
}

Scale transpose(const Scale& scale, const Note& tonic) {
  Scale result = scale;
  result.tonic = tonic;
  result.anchor = tonic;
  result.anchor_mode = scale.mode_index;
  if (scale.formula) result.bias = biasFor(tonic, scaleOffsets(scale));
  return result;
}

std::vector<Note> degrees(const Scale& scale) {
  std::vector<Note> result;
  std::vector<int> offsets = scaleOffsets(scale);
  result.reserve(offsets.size());

  PitchClass tonic_pc = scale.tonic.pitchClass();
  for (size_t idx = 0; idx < offsets.size(); ++idx) {
    if (idx == 0) {
      result.push_back(scale.tonic);
      continue;
    }
    int pc = tonic_pc + offsets[idx];
    Note spelled;
    if (offsets.size() == kHeptatonicSize &&
        spellOnLetter(pc, letterAdd(scale.tonic.letter, static_cast<int>(idx)), spelled)) {
      result.push_back(spelled);
    } else {
      result.push_back(spell(pc, scale.bias));
    }
  }
  return result;
}

PitchClassSet scalePitchClasses(const Scale& scale) {
  PitchClassSet result;
  for (int offset : scaleOffsets(scale)) result.insert(scale.tonic.pitchClass() + offset);
  return result;
}

bool contains(const Scale& scale, int pc) {
  return scalePitchClasses(scale).contains(pc);
}

bool degreeOf(const Scale& scale, int pc, int& out_degree) {
  PitchClass target = normalize(pc);
  std::vector<int> offsets = scaleOffsets(scale);
  for (size_t idx = 0; idx < offsets.size(); ++idx) {
    if (normalize(scale.tonic.pitchClass() + offsets[idx]) == target) {
      out_degree = static_cast<int>(idx);
      return true;
    }
  }
  return false;
}

ChordResult diatonicChord(const Scale& scale, int degree, int voices,
                          const ChordQualityTable& table) {
  ChordResult result;
  std::vector<int> offsets = scaleOffsets(scale);
  if (offsets.empty() || voices < kMinChordTones) {
    result.error = TheoryError::InvalidFormula;
    result.error_message = "Diatonic chord needs a scale and at least 2 voices";
    return result;
  }

  int size = static_cast<int>(offsets.size());
  int base = wrapIndex(degree, size);
  std::vector<Note> spelled = degrees(scale);
  const Note& root = spelled[base];

  // Absolute semitones above the chord root, ascending through octaves.
  std::vector<int> stacked;
  int root_offset = offsets[base];
  for (int voice = 0; voice < voices; ++voice) {
    int step = base + voice * 2;
    int octave = step / size;
    stacked.push_back(offsets[step % size] + octave * 12 - root_offset);
  }

  PitchClassSet wanted;
  for (int offset : stacked) wanted.insert(root.pitchClass() + offset);

  ChordFormulaPtr match;
  for (const auto& formula : table.all()) {
    if (formula->offsets == stacked) {
      match = formula;
      break;
    }
  }
  if (!match) {
    for (const auto& formula : table.all()) {
      if (formula->offsets.front() == 0 &&
          formula->pitchClassesFrom(root.pitchClass()) == wanted) {
        match = formula;
        break;
      }
    }
  }
  if (!match) {
    result.error = TheoryError::UnknownSymbol;
    result.error_message = "No chord quality matches degree " + std::to_string(base) +
                           " (" + wanted.toString() + ")";
    return result;
  }
  return buildChord(root, match);
}

std::string scaleName(const Scale& scale, const ScaleFormulaTable& table) {
  std::string tonic = noteToString(scale.tonic);
  if (!scale.formula) return tonic;
  if (scale.mode_index == 0) return tonic + " " + scale.formula->name;

  ScaleFormulaPtr named = table.findByOffsets(scaleOffsets(scale));
  if (named) return tonic + " " + named->name;
  return tonic + " " + scale.formula->name + " mode " + std::to_string(scale.mode_index);
}

}  // namespace chordmap
