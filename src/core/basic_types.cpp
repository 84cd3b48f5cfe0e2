// Implementation of enum-to-string and string-to-enum conversions.

#include "core/basic_types.h"

namespace chordmap {

const char* theoryErrorToString(TheoryError error) {
  switch (error) {
    case TheoryError::None:              return "None";
    case TheoryError::InvalidFormula:    return "InvalidFormula";
    case TheoryError::SpellingAmbiguous: return "SpellingAmbiguous";
    case TheoryError::UnknownNode:       return "UnknownNode";
    case TheoryError::EmptyPivotSet:     return "EmptyPivotSet";
    case TheoryError::UnknownSymbol:     return "UnknownSymbol";
    case TheoryError::SessionEnded:      return "SessionEnded";
  }
  return "Unknown";
}

char letterToChar(Letter letter) {
  switch (letter) {
    case Letter::C: return 'C';
    case Letter::D: return 'D';
    case Letter::E: return 'E';
    case Letter::F: return 'F';
    case Letter::G: return 'G';
    case Letter::A: return 'A';
    case Letter::B: return 'B';
  }
  return '?';
}

const char* spellingPreferenceToString(SpellingPreference preference) {
  switch (preference) {
    case SpellingPreference::Unspecified: return "unspecified";
    case SpellingPreference::Sharp:       return "sharp";
    case SpellingPreference::Flat:        return "flat";
    case SpellingPreference::ContextKey:  return "key";
  }
  return "unknown";
}

SpellingPreference spellingPreferenceFromString(const std::string& str) {
  if (str == "sharp") return SpellingPreference::Sharp;
  if (str == "flat") return SpellingPreference::Flat;
  if (str == "key") return SpellingPreference::ContextKey;
  return SpellingPreference::Unspecified;
}

}  // namespace chordmap
