// Implementation of chord formulas and the default chord-quality table.

#include "harmony/chord_types.h"

#include <cstdio>

#include "core/pitch_utils.h"

namespace chordmap {

namespace {

/// @brief Built-in quality definition.
struct QualitySpec {
  const char* name;
  const char* long_name;
  std::vector<int> offsets;
};

/// @brief Built-in qualities. Extended chords keep compound offsets.
const std::vector<QualitySpec>& builtinQualities() {
  static const std::vector<QualitySpec> kQualities = {
      {"maj", "Major", {0, 4, 7}},
      {"maj6", "Major 6th", {0, 4, 7, 9}},
      {"maj7", "Major 7th", {0, 4, 7, 11}},
      {"maj9", "Major 9th", {0, 4, 7, 11, 14}},
      {"maj11", "Major 11th", {0, 4, 7, 11, 14, 17}},
      {"maj13", "Major 13th", {0, 4, 7, 11, 14, 17, 21}},
      {"min", "Minor", {0, 3, 7}},
      {"min6", "Minor 6th", {0, 3, 7, 9}},
      {"min7", "Minor 7th", {0, 3, 7, 10}},
      {"minMaj7", "Minor Major 7th", {0, 3, 7, 11}},
      {"min9", "Minor 9th", {0, 3, 7, 10, 14}},
      {"min11", "Minor 11th", {0, 3, 7, 10, 14, 17}},
      {"min13", "Minor 13th", {0, 3, 7, 10, 14, 17, 21}},
      {"minMaj7b13", "Minor Major 7th Flat 13th", {0, 3, 7, 11, 20}},
      {"dom7", "Dominant 7th", {0, 4, 7, 10}},
      {"aug", "Augmented", {0, 4, 8}},
      {"aug7", "Augmented 7th", {0, 4, 8, 10}},
      {"augMaj7", "Augmented Major 7th", {0, 4, 8, 11}},
      {"dim", "Diminished", {0, 3, 6}},
      {"dim7", "Diminished 7th", {0, 3, 6, 9}},
      {"hdim7", "Half-Diminished 7th", {0, 3, 6, 10}},
      {"sus2", "Suspended 2nd", {0, 2, 7}},
      {"sus4", "Suspended 4th", {0, 5, 7}},
  };
  return kQualities;
}

/// @brief Built-in aliases: {alias, canonical name}.
constexpr const char* kBuiltinAliases[][2] = {
    {"", "maj"},         {"M", "maj"},          {"major", "maj"},
    {"m", "min"},        {"minor", "min"},      {"-", "min"},
    {"6", "maj6"},       {"M7", "maj7"},        {"\xCE\x94", "maj7"},  // Greek capital delta
    {"M9", "maj9"},      {"m6", "min6"},        {"m7", "min7"},
    {"-7", "min7"},      {"mM7", "minMaj7"},    {"m9", "min9"},
    {"m11", "min11"},    {"m13", "min13"},      {"mM7b13", "minMaj7b13"},
    {"7", "dom7"},       {"+", "aug"},          {"+7", "aug7"},
    {"augM7", "augMaj7"}, {"\xC2\xB0", "dim"},  // degree sign
    {"\xC2\xB0" "7", "dim7"},
    {"m7b5", "hdim7"},   {"\xC3\xB8", "hdim7"},  // o with stroke
    {"sus", "sus4"},
};

}  // namespace

PitchClassSet ChordFormula::pitchClassesFrom(int root) const {
  PitchClassSet result;
  for (int offset : offsets) result.insert(root + offset);
  return result;
}

bool validateFormulaOffsets(const std::vector<int>& offsets, int min_distinct,
                            std::string& why) {
  PitchClassSet seen;
  for (int offset : offsets) {
    if (offset < 0) {
      why = "negative offset " + std::to_string(offset);
      return false;
    }
    if (offset > kMaxFormulaOffset) {
      why = "offset " + std::to_string(offset) + " above " + std::to_string(kMaxFormulaOffset);
      return false;
    }
    if (seen.contains(offset)) {
      why = "duplicate offset " + std::to_string(offset) + " (mod 12)";
      return false;
    }
    seen.insert(offset);
  }
  if (seen.size() < min_distinct) {
    why = "fewer than " + std::to_string(min_distinct) + " distinct offsets";
    return false;
  }
  return true;
}

FormulaResult makeChordFormula(const std::string& name, const std::string& long_name,
                               const std::vector<int>& offsets) {
  FormulaResult result;
  auto fail = [&](const std::string& why) {
    result.error = TheoryError::InvalidFormula;
    result.error_message = "Invalid chord formula '" + name + "': " + why;
    return result;
  };

  if (name.empty()) return fail("empty name");

  std::string why;
  if (!validateFormulaOffsets(offsets, kMinChordTones, why)) return fail(why);

  auto formula = std::make_shared<ChordFormula>();
  formula->name = name;
  formula->long_name = long_name.empty() ? name : long_name;
  formula->offsets = offsets;

  result.formula = formula;
  result.success = true;
  return result;
}

ChordQualityTable ChordQualityTable::defaults() {
  ChordQualityTable table;
  for (const auto& entry : builtinQualities()) {
    FormulaResult added = table.add(entry.name, entry.long_name, entry.offsets);
    if (!added.success) {
      std::fprintf(stderr, "[ChordQualityTable] %s\n", added.error_message.c_str());
    }
  }
  for (const auto& alias : kBuiltinAliases) {
    if (!table.addAlias(alias[0], alias[1])) {
      std::fprintf(stderr, "[ChordQualityTable] alias '%s' targets unknown quality '%s'\n",
                   alias[0], alias[1]);
    }
  }
  return table;
}

FormulaResult ChordQualityTable::add(const std::string& name, const std::string& long_name,
                                     const std::vector<int>& offsets) {
  FormulaResult result = makeChordFormula(name, long_name, offsets);
  if (result.success) {
    formulas_[name] = result.formula;
    // A real quality shadows any alias with the same spelling.
    aliases_.erase(name);
  }
  return result;
}

bool ChordQualityTable::addAlias(const std::string& alias, const std::string& target) {
  if (formulas_.find(target) == formulas_.end()) return false;
  aliases_[alias] = target;
  return true;
}

ChordFormulaPtr ChordQualityTable::find(const std::string& symbol) const {
  auto direct = formulas_.find(symbol);
  if (direct != formulas_.end()) return direct->second;

  auto alias = aliases_.find(symbol);
  if (alias == aliases_.end()) return nullptr;
  auto target = formulas_.find(alias->second);
  return target != formulas_.end() ? target->second : nullptr;
}

std::vector<ChordFormulaPtr> ChordQualityTable::all() const {
  std::vector<ChordFormulaPtr> result;
  result.reserve(formulas_.size());
  for (const auto& entry : formulas_) result.push_back(entry.second);
  return result;
}

std::vector<std::string> ChordQualityTable::names() const {
  std::vector<std::string> result;
  result.reserve(formulas_.size());
  for (const auto& entry : formulas_) result.push_back(entry.first);
  return result;
}

bool sameFormula(const ChordFormulaPtr& lhs, const ChordFormulaPtr& rhs) {
  if (lhs == rhs) return true;
  if (!lhs || !rhs) return false;
  return lhs->name == rhs->name && lhs->offsets == rhs->offsets;
}

bool Chord::operator==(const Chord& other) const {
  return root == other.root && inversion == other.inversion && octave == other.octave &&
         sameFormula(formula, other.formula);
}

}  // namespace chordmap
