// Implementation of scale formulas and the default scale table.

#include "harmony/scale_types.h"

#include <cctype>
#include <cstdio>

#include "core/pitch_utils.h"
#include "harmony/chord_types.h"

namespace chordmap {

namespace {

struct ScaleSpec {
  const char* name;
  const char* long_name;
  std::vector<int> offsets;
};

const std::vector<ScaleSpec>& builtinScales() {
  static const std::vector<ScaleSpec> kScales = {
      {"major", "Major", {0, 2, 4, 5, 7, 9, 11}},
      {"natural_minor", "Natural Minor", {0, 2, 3, 5, 7, 8, 10}},
      {"harmonic_minor", "Harmonic Minor", {0, 2, 3, 5, 7, 8, 11}},
      {"melodic_minor", "Melodic Minor", {0, 2, 3, 5, 7, 9, 11}},
      {"ionian", "Ionian", {0, 2, 4, 5, 7, 9, 11}},
      {"dorian", "Dorian", {0, 2, 3, 5, 7, 9, 10}},
      {"phrygian", "Phrygian", {0, 1, 3, 5, 7, 8, 10}},
      {"lydian", "Lydian", {0, 2, 4, 6, 7, 9, 11}},
      {"mixolydian", "Mixolydian", {0, 2, 4, 5, 7, 9, 10}},
      {"aeolian", "Aeolian", {0, 2, 3, 5, 7, 8, 10}},
      {"locrian", "Locrian", {0, 1, 3, 5, 6, 8, 10}},
      {"major_pentatonic", "Major Pentatonic", {0, 2, 4, 7, 9}},
      {"minor_pentatonic", "Minor Pentatonic", {0, 3, 5, 7, 10}},
      {"blues", "Blues", {0, 3, 5, 6, 7, 10}},
      {"whole_tone", "Whole Tone", {0, 2, 4, 6, 8, 10}},
  };
  return kScales;
}

constexpr const char* kBuiltinAliases[][2] = {
    {"minor", "natural_minor"},       {"harmonic", "harmonic_minor"},
    {"melodic", "melodic_minor"},     {"pentatonic", "major_pentatonic"},
    {"minor_pent", "minor_pentatonic"}, {"major_pent", "major_pentatonic"},
    {"whole", "whole_tone"},
};

std::string toLower(const std::string& str) {
  std::string result = str;
  for (auto& chr : result) chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
  return result;
}

}  // namespace

PitchClassSet ScaleFormula::pitchClassesFrom(int tonic) const {
  PitchClassSet result;
  for (int offset : offsets) result.insert(tonic + offset);
  return result;
}

ScaleFormulaResult makeScaleFormula(const std::string& name, const std::string& long_name,
                                    const std::vector<int>& offsets) {
  ScaleFormulaResult result;
  auto fail = [&](const std::string& why) {
    result.error = TheoryError::InvalidFormula;
    result.error_message = "Invalid scale formula '" + name + "': " + why;
    return result;
  };

  if (name.empty()) return fail("empty name");

  std::string why;
  if (!validateFormulaOffsets(offsets, kMinScaleDegrees, why)) return fail(why);
  if (offsets.front() != 0) return fail("first offset must be 0");
  for (size_t idx = 1; idx < offsets.size(); ++idx) {
    if (offsets[idx] <= offsets[idx - 1] || offsets[idx] >= kPitchClassCount) {
      return fail("offsets must ascend within one octave");
    }
  }

  auto formula = std::make_shared<ScaleFormula>();
  formula->name = name;
  formula->long_name = long_name.empty() ? name : long_name;
  formula->offsets = offsets;

  result.formula = formula;
  result.success = true;
  return result;
}

std::vector<int> rotateScaleOffsets(const std::vector<int>& offsets, int k) {
  std::vector<int> rotated;
  if (offsets.empty()) return rotated;
  int len = static_cast<int>(offsets.size());
  int shift = ((k % len) + len) % len;
  rotated.reserve(offsets.size());
  for (int idx = 0; idx < len; ++idx) {
    rotated.push_back(normalize(offsets[(idx + shift) % len] - offsets[shift]));
  }
  return rotated;
}

ScaleFormulaTable ScaleFormulaTable::defaults() {
  ScaleFormulaTable table;
  for (const auto& entry : builtinScales()) {
    ScaleFormulaResult added = table.add(entry.name, entry.long_name, entry.offsets);
    if (!added.success) {
      std::fprintf(stderr, "[ScaleFormulaTable] %s\n", added.error_message.c_str());
    }
  }
  for (const auto& alias : kBuiltinAliases) {
    if (!table.addAlias(alias[0], alias[1])) {
      std::fprintf(stderr, "[ScaleFormulaTable] alias '%s' targets unknown scale '%s'\n",
                   alias[0], alias[1]);
    }
  }
  return table;
}

ScaleFormulaResult ScaleFormulaTable::add(const std::string& name,
                                          const std::string& long_name,
                                          const std::vector<int>& offsets) {
  ScaleFormulaResult result = makeScaleFormula(toLower(name), long_name, offsets);
  if (result.success) {
    formulas_[result.formula->name] = result.formula;
    aliases_.erase(result.formula->name);
  }
  return result;
}

bool ScaleFormulaTable::addAlias(const std::string& alias, const std::string& target) {
  std::string key = toLower(target);
  if (formulas_.find(key) == formulas_.end()) return false;
  aliases_[toLower(alias)] = key;
  return true;
}

ScaleFormulaPtr ScaleFormulaTable::find(const std::string& symbol) const {
  std::string key = toLower(symbol);
  auto direct = formulas_.find(key);
  if (direct != formulas_.end()) return direct->second;

  auto alias = aliases_.find(key);
  if (alias == aliases_.end()) return nullptr;
  auto target = formulas_.find(alias->second);
  return target != formulas_.end() ? target->second : nullptr;
}

ScaleFormulaPtr ScaleFormulaTable::findByOffsets(const std::vector<int>& offsets) const {
  for (const auto& entry : formulas_) {
    if (entry.second->offsets == offsets) return entry.second;
  }
  return nullptr;
}

std::vector<std::string> ScaleFormulaTable::names() const {
  std::vector<std::string> result;
  result.reserve(formulas_.size());
  for (const auto& entry : formulas_) result.push_back(entry.first);
  return result;
}

}  // namespace chordmap
