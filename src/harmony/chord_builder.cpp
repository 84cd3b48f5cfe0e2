// Implementation of chord construction, inversion, and spelling.

#include "harmony/chord_builder.h"

#include "core/pitch_utils.h"

namespace chordmap {

namespace {

/// Letter steps above the root for each simple offset (0-11).
/// b5 and #5 stay fifths, 9 is a sixth (also used for the dim7 seventh).
constexpr int kSimpleDegreeSteps[12] = {0, 1, 1, 2, 2, 3, 4, 4, 4, 5, 6, 6};

/// Letter steps for compound offsets 12-23 (b9, 9, #9, 10, 11, #11, 12, b13, 13, ...).
constexpr int kCompoundDegreeSteps[12] = {0, 1, 1, 1, 2, 3, 3, 4, 5, 5, 6, 6};

/// @brief Letter steps above the root for a formula offset.
int degreeSteps(int offset) {
  if (offset >= 12 && offset < 24) return kCompoundDegreeSteps[offset - 12];
  return kSimpleDegreeSteps[normalize(offset)];
}

/// @brief Spell one chord tone relative to the root.
Note spellChordTone(const Note& root, int offset) {
  PitchClass target = normalize(root.pitchClass() + offset);
  Note result;
  if (spellOnLetter(target, letterAdd(root.letter, degreeSteps(offset)), result)) {
    return result;
  }
  return spell(target, preferenceOf(root));
}

/// @brief Index into the formula of the i-th sounding note.
size_t rotatedIndex(const Chord& chord, size_t position) {
  return (static_cast<size_t>(chord.inversion) + position) % chord.formula->size();
}

}  // namespace

ChordResult buildChord(const Note& root, const ChordFormulaPtr& formula, int octave) {
  ChordResult result;
  if (!formula) {
    result.error = TheoryError::InvalidFormula;
    result.error_message = "Chord formula is missing";
    return result;
  }

  FormulaResult checked = makeChordFormula(formula->name, formula->long_name, formula->offsets);
  if (!checked.success) {
    result.error = checked.error;
    result.error_message = checked.error_message;
    return result;
  }

  result.chord.root = root;
  result.chord.formula = formula;
  result.chord.inversion = 0;
  result.chord.octave = octave;
  result.success = true;
  return result;
}

Chord invertChord(const Chord& chord, int steps) {
  Chord result = chord;
  if (!chord.formula || chord.formula->size() == 0) return result;

  int length = static_cast<int>(chord.formula->size());
  int rotated = (static_cast<int>(chord.inversion) + steps) % length;
  if (rotated < 0) rotated += length;
  result.inversion = static_cast<uint8_t>(rotated);
  return result;
}

std::vector<Note> chordTones(const Chord& chord) {
  std::vector<Note> tones;
  if (!chord.formula) return tones;
  tones.reserve(chord.formula->size());
  for (int offset : chord.formula->offsets) {
    tones.push_back(spellChordTone(chord.root, offset));
  }
  return tones;
}

std::vector<PitchedNote> soundingNotes(const Chord& chord) {
  std::vector<PitchedNote> notes;
  if (!chord.formula || chord.formula->size() == 0) return notes;

  std::vector<Note> tones = chordTones(chord);
  int root_midi = PitchedNote{chord.root, chord.octave}.midiNumber();

  notes.reserve(tones.size());
  int previous_midi = 0;
  for (size_t pos = 0; pos < tones.size(); ++pos) {
    size_t idx = rotatedIndex(chord, pos);
    int midi = root_midi + chord.formula->offsets[idx];
    if (pos > 0) {
      // Octave-wrap rule: anything not above the previous note moves up.
      while (midi <= previous_midi) midi += 12;
    }
    notes.push_back(placeAtOrAbove(tones[idx], midi));
    previous_midi = midi;
  }
  return notes;
}

PitchedNote bassNote(const Chord& chord) {
  std::vector<PitchedNote> notes = soundingNotes(chord);
  if (notes.empty()) return PitchedNote{chord.root, chord.octave};
  return notes.front();
}

std::vector<Note> spellAll(const Chord& chord, const KeySignature& key_sig) {
  std::vector<Note> result;
  for (const PitchedNote& pitched : soundingNotes(chord)) {
    result.push_back(spellInKey(pitched.note.pitchClass(), key_sig));
  }
  return result;
}

std::vector<Note> spellAll(const Chord& chord, SpellingPreference preference) {
  std::vector<Note> result;
  for (const PitchedNote& pitched : soundingNotes(chord)) {
    result.push_back(spell(pitched.note.pitchClass(), preference));
  }
  return result;
}

PitchClassSet sonorityKey(const Chord& chord) {
  if (!chord.formula) return PitchClassSet();
  return chord.formula->pitchClassesFrom(chord.root.pitchClass());
}

bool sameSonority(const Chord& lhs, const Chord& rhs) {
  return sonorityKey(lhs) == sonorityKey(rhs);
}

std::string chordSymbol(const Chord& chord) {
  std::string result = noteToString(chord.root);
  if (!chord.formula) return result;
  result += ' ';
  result += chord.formula->name;
  if (chord.inversion != 0) {
    result += '/';
    result += noteToString(bassNote(chord).note);
  }
  return result;
}

bool splitChordSymbol(const std::string& symbol, std::string& root, std::string& quality) {
  if (symbol.empty()) return false;
  char first = static_cast<char>(symbol[0] & ~0x20);  // uppercase ASCII letter
  if (first < 'A' || first > 'G') return false;

  size_t pos = 1;
  while (pos < symbol.size()) {
    if (symbol[pos] == '#' || symbol[pos] == 'b' || symbol[pos] == 'x') {
      ++pos;
    } else if (symbol.compare(pos, 3, "\xE2\x99\xAF") == 0 ||
               symbol.compare(pos, 3, "\xE2\x99\xAD") == 0) {
      pos += 3;
    } else {
      break;
    }
  }
  root = symbol.substr(0, pos);
  quality = symbol.substr(pos);
  return true;
}

std::vector<Chord> identifyChords(const ChordQualityTable& table,
                                  const PitchClassSet& pitch_classes,
                                  SpellingPreference preference) {
  std::vector<Chord> matches;
  std::vector<ChordFormulaPtr> formulas = table.all();
  for (int root = 0; root < kPitchClassCount; ++root) {
    for (const auto& formula : formulas) {
      if (formula->pitchClassesFrom(root) != pitch_classes) continue;
      ChordResult built = buildChord(spell(root, preference), formula);
      if (built.success) matches.push_back(built.chord);
    }
  }
  return matches;
}

}  // namespace chordmap
