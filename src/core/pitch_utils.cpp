/// @file
/// @brief Pitch-class spelling, note parsing, and note-name formatting.

#include "core/pitch_utils.h"

#include <cctype>

namespace chordmap {

namespace {

/// @brief Parse a letter character (either case) into a Letter.
bool letterFromChar(char chr, Letter& out) {
  switch (std::toupper(static_cast<unsigned char>(chr))) {
    case 'C': out = Letter::C; return true;
    case 'D': out = Letter::D; return true;
    case 'E': out = Letter::E; return true;
    case 'F': out = Letter::F; return true;
    case 'G': out = Letter::G; return true;
    case 'A': out = Letter::A; return true;
    case 'B': out = Letter::B; return true;
    default: return false;
  }
}

/// @brief Note for a black key spelled from the letter below (sharp).
Note sharpSpelling(PitchClass pc) {
  for (int idx = 0; idx < kLetterCount; ++idx) {
    if (kLetterPitchClass[idx] == pc) return {static_cast<Letter>(idx), 0};
  }
  for (int idx = 0; idx < kLetterCount; ++idx) {
    if (normalize(kLetterPitchClass[idx] + 1) == pc) return {static_cast<Letter>(idx), 1};
  }
  return {Letter::C, 0};
}

/// @brief Note for a black key spelled from the letter above (flat).
Note flatSpelling(PitchClass pc) {
  for (int idx = 0; idx < kLetterCount; ++idx) {
    if (kLetterPitchClass[idx] == pc) return {static_cast<Letter>(idx), 0};
  }
  for (int idx = 0; idx < kLetterCount; ++idx) {
    if (normalize(kLetterPitchClass[idx] - 1) == pc) return {static_cast<Letter>(idx), -1};
  }
  return {Letter::C, 0};
}

}  // namespace

SpellResult spellStrict(int pc, SpellingPreference preference) {
  SpellResult result;
  PitchClass norm = normalize(pc);

  if (kNaturalPitchClass[norm]) {
    result.note = sharpSpelling(norm);
    result.success = true;
    return result;
  }

  switch (preference) {
    case SpellingPreference::Sharp:
      result.note = sharpSpelling(norm);
      result.success = true;
      return result;
    case SpellingPreference::Flat:
      result.note = flatSpelling(norm);
      result.success = true;
      return result;
    case SpellingPreference::Unspecified:
    case SpellingPreference::ContextKey:
      break;
  }

  result.error = TheoryError::SpellingAmbiguous;
  result.error_message = std::string("Pitch class ") + std::to_string(norm) +
                         " spells as both " + kSharpNoteNames[norm] + " and " +
                         kFlatNoteNames[norm];
  return result;
}

Note spell(int pc, SpellingPreference preference) {
  SpellResult strict = spellStrict(pc, preference);
  if (strict.success) return strict.note;
  // Ambiguous: the documented default is the sharp spelling.
  return sharpSpelling(normalize(pc));
}

bool spellOnLetter(int pc, Letter letter, Note& out) {
  int offset = distance(static_cast<PitchClass>(kLetterPitchClass[static_cast<int>(letter)]),
                        normalize(pc));
  // Map [0, 12) onto [-6, 5] so the accidental is the smaller adjustment.
  if (offset >= 6) offset -= 12;
  if (offset > kMaxAccidental || offset < -kMaxAccidental) return false;
  out.letter = letter;
  out.accidental = static_cast<int8_t>(offset);
  return true;
}

SpellingPreference preferenceOf(const Note& note) {
  return note.accidental < 0 ? SpellingPreference::Flat : SpellingPreference::Sharp;
}

NoteResult parseNote(const std::string& symbol) {
  NoteResult result;
  auto fail = [&]() {
    result.success = false;
    result.error = TheoryError::UnknownSymbol;
    result.error_message = "Unknown note symbol: '" + symbol + "'";
    return result;
  };

  if (symbol.empty()) return fail();

  Letter letter = Letter::C;
  if (!letterFromChar(symbol[0], letter)) return fail();

  int accidental = 0;
  size_t pos = 1;
  while (pos < symbol.size()) {
    char chr = symbol[pos];
    if (chr == '#' || chr == 's') {
      ++accidental;
      ++pos;
    } else if (chr == 'b') {
      --accidental;
      ++pos;
    } else if (chr == 'x') {
      accidental += 2;
      ++pos;
    } else if (symbol.compare(pos, 3, "\xE2\x99\xAF") == 0) {  // U+266F sharp
      ++accidental;
      pos += 3;
    } else if (symbol.compare(pos, 3, "\xE2\x99\xAD") == 0) {  // U+266D flat
      --accidental;
      pos += 3;
    } else {
      return fail();
    }
  }

  if (accidental > kMaxAccidental || accidental < -kMaxAccidental) return fail();

  result.note = {letter, static_cast<int8_t>(accidental)};
  result.success = true;
  return result;
}

std::string noteToString(const Note& note) {
  std::string result(1, letterToChar(note.letter));
  if (note.accidental == 2) {
    result += 'x';
  } else if (note.accidental > 0) {
    result.append(static_cast<size_t>(note.accidental), '#');
  } else if (note.accidental < 0) {
    result.append(static_cast<size_t>(-note.accidental), 'b');
  }
  return result;
}

std::string pitchedNoteToString(const PitchedNote& pitched) {
  return noteToString(pitched.note) + std::to_string(pitched.octave);
}

PitchedNote placeAtOrAbove(const Note& note, int floor_midi) {
  PitchedNote placed{note, 0};
  // Octave arithmetic on the letter's natural pitch keeps B#/Cb in the
  // octave their letter belongs to.
  int natural = kLetterPitchClass[static_cast<int>(note.letter)] + note.accidental;
  int octave = (floor_midi - natural) / 12 - 1;
  placed.octave = octave;
  while (placed.midiNumber() < floor_midi) ++placed.octave;
  while (placed.midiNumber() - 12 >= floor_midi) --placed.octave;
  return placed;
}

}  // namespace chordmap
