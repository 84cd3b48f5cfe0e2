// Tests for core/pitch_utils.h -- modular arithmetic, spelling, note parsing.

#include "core/pitch_utils.h"

#include <gtest/gtest.h>

namespace chordmap {
namespace {

// ---------------------------------------------------------------------------
// normalize / distance
// ---------------------------------------------------------------------------

TEST(NormalizeTest, ReducesAnyInteger) {
  EXPECT_EQ(normalize(0), 0);
  EXPECT_EQ(normalize(12), 0);
  EXPECT_EQ(normalize(25), 1);
  EXPECT_EQ(normalize(-1), 11);
  EXPECT_EQ(normalize(-13), 11);
  EXPECT_EQ(normalize(-24), 0);
}

TEST(DistanceTest, AscendingCount) {
  EXPECT_EQ(distance(0, 7), 7);
  EXPECT_EQ(distance(7, 0), 5);
  EXPECT_EQ(distance(11, 1), 2);
  EXPECT_EQ(distance(5, 5), 0);
}

TEST(DistanceTest, SymmetryForAllPitchClasses) {
  for (int from = 0; from < kPitchClassCount; ++from) {
    for (int to = 0; to < kPitchClassCount; ++to) {
      int forward = distance(static_cast<PitchClass>(from), static_cast<PitchClass>(to));
      int backward = distance(static_cast<PitchClass>(to), static_cast<PitchClass>(from));
      EXPECT_GE(forward, 0);
      EXPECT_LT(forward, 12);
      EXPECT_EQ((forward + backward) % 12, 0) << from << " " << to;
      if (from == to) {
        EXPECT_EQ(forward, 0);
      }
    }
  }
}

TEST(ShortestDistanceTest, TakesShorterWay) {
  EXPECT_EQ(shortestDistance(0, 11), 1);
  EXPECT_EQ(shortestDistance(0, 6), 6);
  EXPECT_EQ(shortestDistance(7, 9), 2);
}

// ---------------------------------------------------------------------------
// spell
// ---------------------------------------------------------------------------

TEST(SpellTest, WhiteKeysAlwaysNatural) {
  for (auto pref : {SpellingPreference::Sharp, SpellingPreference::Flat,
                    SpellingPreference::Unspecified}) {
    SpellResult result = spellStrict(4, pref);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.note, (Note{Letter::E, 0}));
  }
}

TEST(SpellTest, SharpAndFlatPreferences) {
  EXPECT_EQ(spell(10, SpellingPreference::Sharp), (Note{Letter::A, 1}));
  EXPECT_EQ(spell(10, SpellingPreference::Flat), (Note{Letter::B, -1}));
  EXPECT_EQ(spell(1, SpellingPreference::Flat), (Note{Letter::D, -1}));
}

TEST(SpellTest, AmbiguousWithoutPreference) {
  SpellResult result = spellStrict(6, SpellingPreference::Unspecified);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TheoryError::SpellingAmbiguous);
  EXPECT_FALSE(result.error_message.empty());
}

TEST(SpellTest, DefaultIsSharp) {
  EXPECT_EQ(spell(6, SpellingPreference::Unspecified), (Note{Letter::F, 1}));
  EXPECT_EQ(spell(3), (Note{Letter::D, 1}));
}

TEST(SpellTest, SpellOnLetter) {
  Note out;
  ASSERT_TRUE(spellOnLetter(5, Letter::E, out));
  EXPECT_EQ(out, (Note{Letter::E, 1}));  // E#
  ASSERT_TRUE(spellOnLetter(0, Letter::D, out));
  EXPECT_EQ(out, (Note{Letter::D, -2}));  // Dbb
  EXPECT_FALSE(spellOnLetter(6, Letter::C, out));  // would need a triple sharp
}

// ---------------------------------------------------------------------------
// parseNote / noteToString
// ---------------------------------------------------------------------------

TEST(ParseNoteTest, AcceptsAccidentalForms) {
  EXPECT_EQ(parseNote("C").note, (Note{Letter::C, 0}));
  EXPECT_EQ(parseNote("c#").note, (Note{Letter::C, 1}));
  EXPECT_EQ(parseNote("Bb").note, (Note{Letter::B, -1}));
  EXPECT_EQ(parseNote("Fx").note, (Note{Letter::F, 2}));
  EXPECT_EQ(parseNote("Ebb").note, (Note{Letter::E, -2}));
  EXPECT_EQ(parseNote("Gs").note, (Note{Letter::G, 1}));
  EXPECT_EQ(parseNote("F\xE2\x99\xAF").note, (Note{Letter::F, 1}));
  EXPECT_EQ(parseNote("A\xE2\x99\xAD").note, (Note{Letter::A, -1}));
}

TEST(ParseNoteTest, RejectsUnknownSymbols) {
  for (const char* bad : {"", "H", "C#b#x", "Cbbb", "C7", "#C"}) {
    NoteResult result = parseNote(bad);
    EXPECT_FALSE(result.success) << bad;
    EXPECT_EQ(result.error, TheoryError::UnknownSymbol) << bad;
  }
}

TEST(NoteToStringTest, AsciiRendering) {
  EXPECT_EQ(noteToString({Letter::C, 1}), "C#");
  EXPECT_EQ(noteToString({Letter::B, -1}), "Bb");
  EXPECT_EQ(noteToString({Letter::F, 2}), "Fx");
  EXPECT_EQ(noteToString({Letter::E, -2}), "Ebb");
  EXPECT_EQ(pitchedNoteToString({{Letter::C, 0}, 5}), "C5");
}

TEST(NoteToStringTest, ParseRoundTrip) {
  for (const char* text : {"C", "C#", "Db", "Fx", "Abb", "B"}) {
    NoteResult parsed = parseNote(text);
    ASSERT_TRUE(parsed.success);
    EXPECT_EQ(noteToString(parsed.note), text);
  }
}

// ---------------------------------------------------------------------------
// placeAtOrAbove
// ---------------------------------------------------------------------------

TEST(PlaceAtOrAboveTest, LowestPlacementNotBelowFloor) {
  PitchedNote placed = placeAtOrAbove({Letter::E, 0}, 60);
  EXPECT_EQ(placed.octave, 4);
  EXPECT_EQ(placed.midiNumber(), 64);

  placed = placeAtOrAbove({Letter::C, 0}, 61);
  EXPECT_EQ(placed.octave, 5);
  EXPECT_EQ(placed.midiNumber(), 72);
}

TEST(PlaceAtOrAboveTest, LetterOctaveForEnharmonics) {
  PitchedNote placed = placeAtOrAbove({Letter::B, 1}, 60);
  EXPECT_EQ(placed.midiNumber(), 60);
  EXPECT_EQ(placed.octave, 3);
}

}  // namespace
}  // namespace chordmap
