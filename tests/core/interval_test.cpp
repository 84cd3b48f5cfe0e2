// Tests for core/interval.h -- interval names, inversion, compound reduction,
// spelled naming, and interval sets.

#include "core/interval.h"

#include <gtest/gtest.h>

#include <string>

namespace chordmap {
namespace {

// ---------------------------------------------------------------------------
// compoundToSimple
// ---------------------------------------------------------------------------

TEST(CompoundToSimpleTest, SimpleIntervalsUnchanged) {
  EXPECT_EQ(compoundToSimple(0), 0);
  EXPECT_EQ(compoundToSimple(7), 7);
  EXPECT_EQ(compoundToSimple(11), 11);
}

TEST(CompoundToSimpleTest, CompoundIntervalsReduced) {
  EXPECT_EQ(compoundToSimple(12), 0);   // Octave -> unison
  EXPECT_EQ(compoundToSimple(14), 2);   // Ninth -> second
  EXPECT_EQ(compoundToSimple(19), 7);   // Compound 5th -> P5
  EXPECT_EQ(compoundToSimple(24), 0);
}

TEST(CompoundToSimpleTest, NegativeIntervals) {
  EXPECT_EQ(compoundToSimple(-3), 3);
  EXPECT_EQ(compoundToSimple(-19), 7);
}

// ---------------------------------------------------------------------------
// intervalName
// ---------------------------------------------------------------------------

TEST(IntervalNameTest, CanonicalTable) {
  EXPECT_STREQ(intervalName(0), "perfect unison");
  EXPECT_STREQ(intervalName(1), "minor second");
  EXPECT_STREQ(intervalName(3), "minor third");
  EXPECT_STREQ(intervalName(4), "major third");
  EXPECT_STREQ(intervalName(5), "perfect fourth");
  EXPECT_STREQ(intervalName(6), "tritone");
  EXPECT_STREQ(intervalName(7), "perfect fifth");
  EXPECT_STREQ(intervalName(10), "minor seventh");
  EXPECT_STREQ(intervalName(11), "major seventh");
}

TEST(IntervalNameTest, CompoundReducedBeforeNaming) {
  EXPECT_STREQ(intervalName(15), "minor third");
  EXPECT_STREQ(intervalName(19), "perfect fifth");
}

TEST(IntervalNameTest, EnharmonicAlternatives) {
  EXPECT_STREQ(intervalName(6, IntervalNaming::Augmented), "augmented fourth");
  EXPECT_STREQ(intervalName(6, IntervalNaming::Diminished), "diminished fifth");
  EXPECT_STREQ(intervalName(8, IntervalNaming::Augmented), "augmented fifth");
  EXPECT_STREQ(intervalName(9, IntervalNaming::Diminished), "diminished seventh");
  EXPECT_STREQ(intervalName(1, IntervalNaming::Augmented), "augmented unison");
}

TEST(IntervalNameTest, AlternativeFallsBackToCanonical) {
  EXPECT_STREQ(intervalName(7, IntervalNaming::Augmented), "perfect fifth");
  EXPECT_STREQ(intervalName(4, IntervalNaming::Spelled), "major third");
}

// ---------------------------------------------------------------------------
// Interval values
// ---------------------------------------------------------------------------

TEST(IntervalTest, EqualityBySemitonesOnly) {
  Interval plain = makeInterval(7);
  Interval directed = makeDirectedInterval(-7);
  EXPECT_EQ(plain, directed);
  EXPECT_FALSE(plain.isDirected());
  EXPECT_TRUE(directed.isDirected());
  EXPECT_EQ(directed.signedSemitones(), -7);
}

TEST(IntervalTest, NameDerivedFromSemitones) {
  EXPECT_STREQ(makeInterval(16).name(), "major third");
}

TEST(IntervalTest, BetweenNotesIsAscending) {
  Interval ivl = intervalBetween(Note{Letter::G, 0}, Note{Letter::C, 0});
  EXPECT_EQ(ivl.semitones, 5);
  EXPECT_EQ(ivl.direction, IntervalDirection::None);
}

TEST(IntervalTest, BetweenPitchedNotesIsDirected) {
  Interval down = intervalBetween(PitchedNote{{Letter::G, 0}, 4}, PitchedNote{{Letter::C, 0}, 4});
  EXPECT_EQ(down.semitones, 7);
  EXPECT_EQ(down.direction, IntervalDirection::Descending);
  EXPECT_EQ(down.signedSemitones(), -7);
}

// ---------------------------------------------------------------------------
// invert
// ---------------------------------------------------------------------------

TEST(InvertTest, ClassicRule) {
  EXPECT_EQ(invert(makeInterval(3)).semitones, 9);
  EXPECT_EQ(invert(makeInterval(7)).semitones, 5);
  EXPECT_EQ(invert(makeInterval(6)).semitones, 6);
}

TEST(InvertTest, UnisonInvertsToOctaveWhichReducesToUnison) {
  EXPECT_EQ(invert(makeInterval(0)).semitones, 0);
}

TEST(InvertTest, InvolutionForEveryInterval) {
  for (int semis = 0; semis < 12; ++semis) {
    Interval ivl = makeInterval(semis);
    EXPECT_EQ(invert(invert(ivl)), ivl) << semis;
    Interval directed = makeDirectedInterval(-semis);
    Interval twice = invert(invert(directed));
    EXPECT_EQ(twice, directed);
    EXPECT_EQ(twice.direction, directed.direction);
  }
}

// ---------------------------------------------------------------------------
// spelledIntervalName
// ---------------------------------------------------------------------------

TEST(SpelledIntervalNameTest, LetterDistanceDecidesNumber) {
  Note c{Letter::C, 0};
  EXPECT_EQ(spelledIntervalName(c, Note{Letter::D, 1}), "augmented second");
  EXPECT_EQ(spelledIntervalName(c, Note{Letter::E, -1}), "minor third");
  EXPECT_EQ(spelledIntervalName(c, Note{Letter::G, 0}), "perfect fifth");
  EXPECT_EQ(spelledIntervalName(c, Note{Letter::G, -1}), "diminished fifth");
  EXPECT_EQ(spelledIntervalName(c, Note{Letter::F, 1}), "augmented fourth");
  EXPECT_EQ(spelledIntervalName(c, Note{Letter::C, -1}), "diminished unison");
  EXPECT_EQ(spelledIntervalName(Note{Letter::B, 0}, Note{Letter::A, -1}),
            "diminished seventh");
}

TEST(SpelledIntervalNameTest, DescribeSelectsStyle) {
  Note c{Letter::C, 0};
  Note f_sharp{Letter::F, 1};
  EXPECT_EQ(describeInterval(c, f_sharp), "tritone");
  EXPECT_EQ(describeInterval(c, f_sharp, IntervalNaming::Spelled), "augmented fourth");
  EXPECT_EQ(describeInterval(c, f_sharp, IntervalNaming::Diminished), "diminished fifth");
}

// ---------------------------------------------------------------------------
// isPerfectInterval
// ---------------------------------------------------------------------------

TEST(IsPerfectIntervalTest, UnisonFourthFifth) {
  EXPECT_TRUE(isPerfectInterval(0));
  EXPECT_TRUE(isPerfectInterval(5));
  EXPECT_TRUE(isPerfectInterval(19));
  EXPECT_FALSE(isPerfectInterval(6));
  EXPECT_FALSE(isPerfectInterval(4));
}

// ---------------------------------------------------------------------------
// IntervalSet
// ---------------------------------------------------------------------------

TEST(IntervalSetTest, FromOffsetsReducesCompound) {
  IntervalSet set = IntervalSet::fromOffsets({0, 4, 7, 14});
  EXPECT_EQ(set.size(), 4);
  EXPECT_TRUE(set.contains(2));
  EXPECT_TRUE(set.contains(makeInterval(4)));
  EXPECT_FALSE(set.contains(3));
}

TEST(IntervalSetTest, UnionIntersectionSubset) {
  IntervalSet triad = IntervalSet::fromOffsets({0, 4, 7});
  IntervalSet seventh = IntervalSet::fromOffsets({0, 4, 7, 11});
  IntervalSet minor = IntervalSet::fromOffsets({0, 3, 7});

  EXPECT_TRUE(triad.isSubsetOf(seventh));
  EXPECT_FALSE(seventh.isSubsetOf(triad));
  EXPECT_EQ(triad.unionWith(minor).size(), 4);
  EXPECT_EQ(triad.intersectionWith(minor), IntervalSet::fromOffsets({0, 7}));

  std::vector<Interval> members = seventh.toVector();
  ASSERT_EQ(members.size(), 4u);
  EXPECT_EQ(members[3].semitones, 11);
}

}  // namespace
}  // namespace chordmap
