// Implementation of key signature spelling and key relationships.

#include "harmony/key.h"

#include <cctype>

namespace chordmap {

namespace {

constexpr int kMajorKeySteps[7] = {0, 2, 4, 5, 7, 9, 11};
constexpr int kMinorKeySteps[7] = {0, 2, 3, 5, 7, 8, 10};

/// @brief Shift a spelled tonic by semitones and letter steps together.
Note shiftTonic(const Note& tonic, int semitones, int letter_steps) {
  Letter letter = letterAdd(tonic.letter, letter_steps);
  Note result;
  if (spellOnLetter(tonic.pitchClass() + semitones, letter, result)) return result;
  return spell(tonic.pitchClass() + semitones, preferenceOf(tonic));
}

}  // namespace

std::vector<Note> keyScaleNotes(const KeySignature& key_sig) {
  const int* steps = key_sig.is_minor ? kMinorKeySteps : kMajorKeySteps;
  std::vector<Note> notes;
  notes.reserve(7);
  for (int deg = 0; deg < 7; ++deg) {
    notes.push_back(shiftTonic(key_sig.tonic, steps[deg], deg));
  }
  return notes;
}

int keyAccidentalCount(const KeySignature& key_sig) {
  int count = 0;
  for (const Note& note : keyScaleNotes(key_sig)) count += note.accidental;
  return count;
}

SpellingPreference keyPreference(const KeySignature& key_sig) {
  return keyAccidentalCount(key_sig) < 0 ? SpellingPreference::Flat
                                         : SpellingPreference::Sharp;
}

Note spellInKey(int pc, const KeySignature& key_sig) {
  PitchClass norm = normalize(pc);
  for (const Note& note : keyScaleNotes(key_sig)) {
    if (note.pitchClass() == norm) return note;
  }
  return spell(norm, keyPreference(key_sig));
}

Note spell(int pc, SpellingPreference preference, const KeySignature& key_sig) {
  if (preference == SpellingPreference::ContextKey) return spellInKey(pc, key_sig);
  return spell(pc, preference);
}

KeySignature getRelative(const KeySignature& key_sig) {
  if (key_sig.is_minor) {
    // Relative major: a minor third up, two letters up.
    return {shiftTonic(key_sig.tonic, 3, 2), false};
  }
  // Relative minor: a minor third down (= major sixth up, five letters up).
  return {shiftTonic(key_sig.tonic, 9, 5), true};
}

KeySignature getParallel(const KeySignature& key_sig) {
  return {key_sig.tonic, !key_sig.is_minor};
}

KeySignature getDominant(const KeySignature& key_sig) {
  return {shiftTonic(key_sig.tonic, 7, 4), key_sig.is_minor};
}

KeySignature getSubdominant(const KeySignature& key_sig) {
  return {shiftTonic(key_sig.tonic, 5, 3), key_sig.is_minor};
}

KeyResult keySignatureFromString(const std::string& str) {
  KeyResult result;

  auto underscore_pos = str.find('_');
  std::string note_part = str.substr(0, underscore_pos);
  std::string mode_part;
  if (underscore_pos != std::string::npos) mode_part = str.substr(underscore_pos + 1);

  std::string lower_mode;
  lower_mode.reserve(mode_part.size());
  for (char chr : mode_part) {
    lower_mode.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(chr))));
  }

  NoteResult tonic = parseNote(note_part);
  if (!tonic.success) {
    result.error = tonic.error;
    result.error_message = "Unknown key: '" + str + "'";
    return result;
  }
  if (!lower_mode.empty() && lower_mode != "major" && lower_mode != "minor") {
    result.error = TheoryError::UnknownSymbol;
    result.error_message = "Unknown key mode: '" + mode_part + "'";
    return result;
  }

  result.key.tonic = tonic.note;
  result.key.is_minor = (lower_mode == "minor");
  result.success = true;
  return result;
}

std::string keySignatureToString(const KeySignature& key_sig) {
  std::string result = noteToString(key_sig.tonic);
  result += key_sig.is_minor ? "_minor" : "_major";
  return result;
}

}  // namespace chordmap
