// Tests for graph/chord_graph_engine.h -- branching, ranking, navigation,
// and session lifecycle.

#include "graph/chord_graph_engine.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "harmony/chord_builder.h"

namespace chordmap {
namespace {

constexpr const char* kCMajorId = "0,4,7|maj|0";
constexpr const char* kCMaj7Id = "0,4,7,11|maj7|0";
constexpr const char* kAMin7Id = "0,4,7,9|min7|0";
constexpr const char* kAMinId = "0,4,9|min|0";
constexpr const char* kFMaj7Id = "0,4,5,9|maj7|0";

class ChordGraphEngineTest : public ::testing::Test {
 protected:
  Chord make(Letter letter, const char* quality) {
    ChordResult result = buildChord(Note{letter, 0}, table_.find(quality));
    EXPECT_TRUE(result.success) << quality;
    return result.chord;
  }

  CandidatePool pool(std::initializer_list<const char*> qualities) {
    CandidatePool result;
    for (const char* quality : qualities) result.formulas.push_back(table_.find(quality));
    return result;
  }

  CandidatePool fullPool() {
    CandidatePool result;
    result.formulas = table_.all();
    return result;
  }

  static std::vector<std::string> ids(const BranchResult& result) {
    std::vector<std::string> out;
    for (const auto& candidate : result.candidates) out.push_back(candidate.node_id);
    return out;
  }

  ChordQualityTable table_ = ChordQualityTable::defaults();
};

// ---------------------------------------------------------------------------
// startAt
// ---------------------------------------------------------------------------

TEST_F(ChordGraphEngineTest, StartPositionsSession) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  EXPECT_EQ(map.state(), SessionState::Positioned);
  EXPECT_EQ(map.current(), kCMajorId);
  ASSERT_EQ(map.nodeCount(), 1u);
  EXPECT_EQ(map.edgeCount(), 0u);
  EXPECT_EQ(map.findNode(kCMajorId)->visit_count, 1);
  EXPECT_EQ(engine.pivotNotes(map, kCMajorId), (PitchClassSet{0, 4, 7}));
  EXPECT_TRUE(engine.pivotNotes(map, "missing").empty());
}

// ---------------------------------------------------------------------------
// branch
// ---------------------------------------------------------------------------

TEST_F(ChordGraphEngineTest, RanksWorkedExample) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  BranchResult result =
      engine.branch(map, kCMajorId, PitchClassSet{0, 4}, pool({"maj", "min", "maj7", "min7"}));
  ASSERT_TRUE(result.success) << result.error_message;

  EXPECT_EQ(ids(result), (std::vector<std::string>{kCMaj7Id, kAMin7Id, kAMinId, kFMaj7Id}));
  EXPECT_DOUBLE_EQ(result.candidates[0].breakdown.score, 10.0);
  EXPECT_DOUBLE_EQ(result.candidates[1].breakdown.score, 10.0);
  EXPECT_NEAR(result.candidates[2].breakdown.score, 16.0 / 3.0, 1e-9);
  EXPECT_DOUBLE_EQ(result.candidates[3].breakdown.score, 5.0);
  EXPECT_EQ(chordSymbol(result.candidates[2].chord), "A min");

  EXPECT_EQ(map.nodeCount(), 5u);
  EXPECT_EQ(map.edgeCount(), 4u);
  ASSERT_NE(map.findEdge(kCMajorId, kAMinId), nullptr);
  EXPECT_EQ(map.findNode(kAMinId)->visit_count, 0);
  EXPECT_EQ(map.findNode(kFMaj7Id)->first_seen_order, 4);
}

TEST_F(ChordGraphEngineTest, SourceSonorityExcludedByDefault) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  BranchResult result = engine.branch(map, kCMajorId, PitchClassSet{0, 4}, pool({"maj"}));
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.candidates.empty());
  EXPECT_EQ(map.edgeCount(), 0u);
}

TEST_F(ChordGraphEngineTest, SelfLoopWhenAllowed) {
  GraphConfig config;
  config.allow_self_loop = true;
  ChordGraphEngine engine(config);
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  BranchResult result = engine.branch(map, kCMajorId, PitchClassSet{0, 4}, pool({"maj"}));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(ids(result), (std::vector<std::string>{kCMajorId}));
  EXPECT_NE(map.findEdge(kCMajorId, kCMajorId), nullptr);
  EXPECT_EQ(map.nodeCount(), 1u);
}

TEST_F(ChordGraphEngineTest, EveryCandidateKeepsPivots) {
  ChordGraphEngine engine;
  const std::vector<PitchClassSet> pivot_sets = {
      PitchClassSet{0}, PitchClassSet{4, 7}, PitchClassSet{1}, PitchClassSet{0, 3, 7},
      PitchClassSet{2, 5, 11}};
  for (const auto& pivots : pivot_sets) {
    ExploredMap map = engine.startAt(make(Letter::C, "maj"));
    BranchResult result = engine.branch(map, kCMajorId, pivots, fullPool());
    ASSERT_TRUE(result.success) << pivots.toString();
    EXPECT_FALSE(result.candidates.empty()) << pivots.toString();
    for (const auto& candidate : result.candidates) {
      EXPECT_TRUE(pivots.isSubsetOf(sonorityKey(candidate.chord)))
          << pivots.toString() << " " << chordSymbol(candidate.chord);
      EXPECT_NE(sonorityKey(candidate.chord), (PitchClassSet{0, 4, 7}));
    }
  }
}

TEST_F(ChordGraphEngineTest, RankingIsMonotoneInScore) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::D, "min7"));
  BranchResult result = engine.branch(map, map.current(), PitchClassSet{5}, fullPool());
  ASSERT_TRUE(result.success);
  ASSERT_GT(result.candidates.size(), 1u);
  for (size_t idx = 1; idx < result.candidates.size(); ++idx) {
    EXPECT_GE(result.candidates[idx - 1].breakdown.score,
              result.candidates[idx].breakdown.score);
  }
}

TEST_F(ChordGraphEngineTest, PivotsOutsideSourceAreAllowed) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  BranchResult result = engine.branch(map, kCMajorId, PitchClassSet{1}, pool({"maj"}));
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.candidates.size(), 3u);
  for (const auto& candidate : result.candidates) {
    EXPECT_TRUE(sonorityKey(candidate.chord).contains(1));
  }
}

TEST_F(ChordGraphEngineTest, BranchIsIdempotent) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  CandidatePool candidates = pool({"maj", "min", "maj7", "min7"});
  BranchResult first = engine.branch(map, kCMajorId, PitchClassSet{0, 4}, candidates);
  size_t nodes = map.nodeCount();
  size_t edges = map.edgeCount();

  BranchResult second = engine.branch(map, kCMajorId, PitchClassSet{0, 4}, candidates);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(ids(first), ids(second));
  EXPECT_EQ(map.nodeCount(), nodes);
  EXPECT_EQ(map.edgeCount(), edges);
}

TEST_F(ChordGraphEngineTest, EdgeScoreIsLastWriteWins) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  ASSERT_TRUE(engine.branch(map, kCMajorId, PitchClassSet{0, 4}, pool({"maj7"})).success);
  EXPECT_DOUBLE_EQ(map.findEdge(kCMajorId, kCMaj7Id)->score, 10.0);

  ASSERT_TRUE(engine.branch(map, kCMajorId, PitchClassSet{0}, pool({"maj7"})).success);
  const ChordGraphEdge* edge = map.findEdge(kCMajorId, kCMaj7Id);
  ASSERT_NE(edge, nullptr);
  EXPECT_DOUBLE_EQ(edge->score, 9.5);
  EXPECT_EQ(edge->pivots, (PitchClassSet{0}));
  // Cmaj7, Fmaj7 from the first branch; C#maj7 and Abmaj7 added by the second.
  EXPECT_EQ(map.edgeCount(), 4u);
}

TEST_F(ChordGraphEngineTest, SymmetricChordsCollapseToOneNode) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  BranchResult result = engine.branch(map, kCMajorId, PitchClassSet{0}, pool({"aug"}));
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.candidates.size(), 1u);
  EXPECT_EQ(result.candidates[0].node_id, "0,4,8|aug|0");
  EXPECT_EQ(chordSymbol(result.candidates[0].chord), "C aug");
}

TEST_F(ChordGraphEngineTest, RootTieBreakUsesCircularDistance) {
  // B maj and F# min mirror each other around C aug, so their scores tie.
  // B is one semitone away going down, F# is six either way.
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "aug"));
  BranchResult result =
      engine.branch(map, "0,4,8|aug|0", PitchClassSet{6}, pool({"maj", "min"}));
  ASSERT_TRUE(result.success) << result.error_message;

  std::vector<std::string> order = ids(result);
  auto b_major = std::find(order.begin(), order.end(), "3,6,11|maj|0");
  auto f_sharp_minor = std::find(order.begin(), order.end(), "1,6,9|min|0");
  ASSERT_NE(b_major, order.end());
  ASSERT_NE(f_sharp_minor, order.end());
  EXPECT_DOUBLE_EQ(result.candidates[b_major - order.begin()].breakdown.score,
                   result.candidates[f_sharp_minor - order.begin()].breakdown.score);
  EXPECT_LT(b_major, f_sharp_minor);
}

TEST_F(ChordGraphEngineTest, MergeSonoritiesSharesNode) {
  CandidatePool candidates = pool({"maj6", "min7"});

  ChordGraphEngine separate;
  ExploredMap split = separate.startAt(make(Letter::C, "maj"));
  EXPECT_EQ(separate.branch(split, split.current(), PitchClassSet{0, 4}, candidates)
                .candidates.size(),
            2u);

  GraphConfig config;
  config.merge_sonorities = true;
  ChordGraphEngine merged(config);
  ExploredMap map = merged.startAt(make(Letter::C, "maj"));
  EXPECT_EQ(map.current(), "0,4,7");
  BranchResult result = merged.branch(map, map.current(), PitchClassSet{0, 4}, candidates);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.candidates.size(), 1u);
  EXPECT_EQ(result.candidates[0].node_id, "0,4,7,9");
  EXPECT_EQ(chordSymbol(result.candidates[0].chord), "C maj6");
}

TEST_F(ChordGraphEngineTest, WeightsChangeRanking) {
  GraphConfig config;
  config.weights = ScoringWeights{1.0, 0.0, 0.0};
  ChordGraphEngine engine(config);
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  BranchResult result =
      engine.branch(map, kCMajorId, PitchClassSet{0, 4}, pool({"maj", "min", "maj7", "min7"}));
  ASSERT_TRUE(result.success);
  ASSERT_FALSE(result.candidates.empty());
  EXPECT_EQ(result.candidates[0].node_id, kAMinId);
}

TEST_F(ChordGraphEngineTest, RestrictedRootsAndSpelling) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  CandidatePool candidates = pool({"maj"});
  candidates.roots = PitchClassSet{1, 3};
  candidates.spelling = SpellingPreference::Flat;
  BranchResult result = engine.branch(map, kCMajorId, PitchClassSet(), candidates);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.candidates.size(), 2u);
  for (const auto& candidate : result.candidates) {
    EXPECT_EQ(candidate.chord.root.accidental, -1);
  }
}

TEST_F(ChordGraphEngineTest, BranchFromNonCurrentNode) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  ASSERT_TRUE(engine.branch(map, kCMajorId, PitchClassSet{0, 4}, pool({"min"})).success);
  BranchResult result = engine.branch(map, kAMinId, PitchClassSet{9}, pool({"maj"}));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(map.current(), kCMajorId);
  EXPECT_EQ(engine.neighbors(map, kAMinId).size(), result.candidates.size());
}

// ---------------------------------------------------------------------------
// branch errors
// ---------------------------------------------------------------------------

TEST_F(ChordGraphEngineTest, UnknownSourceNode) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  BranchResult result = engine.branch(map, "0,3,7|min|0", PitchClassSet{0}, pool({"maj"}));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TheoryError::UnknownNode);
}

TEST_F(ChordGraphEngineTest, EmptyPivotsWithinLimitEnumerate) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  BranchResult result = engine.branch(map, kCMajorId, PitchClassSet(), pool({"maj", "min"}));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.candidates.size(), 23u);
}

TEST_F(ChordGraphEngineTest, EmptyPivotsOverLimitFail) {
  GraphConfig config;
  config.empty_pivot_limit = 20;
  ChordGraphEngine engine(config);
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  BranchResult result = engine.branch(map, kCMajorId, PitchClassSet(), pool({"maj", "min"}));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TheoryError::EmptyPivotSet);
  EXPECT_EQ(map.nodeCount(), 1u);

  // A non-empty pivot set is never limited.
  EXPECT_TRUE(engine.branch(map, kCMajorId, PitchClassSet{0}, pool({"maj", "min"})).success);
}

TEST_F(ChordGraphEngineTest, FailedBranchLeavesMapUnchanged) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  CandidatePool candidates = pool({"maj7", "min"});
  candidates.formulas.push_back(nullptr);
  BranchResult result = engine.branch(map, kCMajorId, PitchClassSet{0, 4}, candidates);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TheoryError::InvalidFormula);
  EXPECT_TRUE(result.candidates.empty());
  EXPECT_EQ(map.nodeCount(), 1u);
  EXPECT_EQ(map.edgeCount(), 0u);
}

// ---------------------------------------------------------------------------
// Navigation
// ---------------------------------------------------------------------------

TEST_F(ChordGraphEngineTest, MoveAlongEdgeAndBack) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  ASSERT_TRUE(
      engine.branch(map, kCMajorId, PitchClassSet{0, 4}, pool({"min", "maj7"})).success);

  MoveResult moved = engine.moveTo(map, kAMinId);
  ASSERT_TRUE(moved.success) << moved.error_message;
  EXPECT_EQ(moved.node_id, kAMinId);
  EXPECT_EQ(map.current(), kAMinId);
  EXPECT_EQ(map.findNode(kAMinId)->visit_count, 1);
  EXPECT_EQ(map.history(), (std::vector<std::string>{kCMajorId}));

  MoveResult back = engine.back(map);
  ASSERT_TRUE(back.success);
  EXPECT_EQ(back.node_id, kCMajorId);
  EXPECT_EQ(map.current(), kCMajorId);
  EXPECT_EQ(map.findNode(kCMajorId)->visit_count, 2);
  EXPECT_TRUE(map.history().empty());

  MoveResult again = engine.back(map);
  EXPECT_FALSE(again.success);
  EXPECT_EQ(again.error, TheoryError::UnknownNode);
}

TEST_F(ChordGraphEngineTest, MoveRequiresEdgeFromCurrent) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  ASSERT_TRUE(
      engine.branch(map, kCMajorId, PitchClassSet{0, 4}, pool({"min", "maj7"})).success);
  ASSERT_TRUE(engine.moveTo(map, kAMinId).success);

  // Known node, but no edge from A minor.
  MoveResult sideways = engine.moveTo(map, kCMaj7Id);
  EXPECT_FALSE(sideways.success);
  EXPECT_EQ(sideways.error, TheoryError::UnknownNode);
  EXPECT_EQ(map.current(), kAMinId);
  EXPECT_EQ(map.findNode(kCMaj7Id)->visit_count, 0);

  MoveResult missing = engine.moveTo(map, "nowhere");
  EXPECT_FALSE(missing.success);
  EXPECT_EQ(missing.error, TheoryError::UnknownNode);
  EXPECT_EQ(map.nodeCount(), 4u);
}

TEST_F(ChordGraphEngineTest, MoveOnIdleMapFails) {
  ChordGraphEngine engine;
  ExploredMap map;
  MoveResult result = engine.moveTo(map, kCMajorId);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TheoryError::UnknownNode);
}

TEST_F(ChordGraphEngineTest, NeighborsOrderedByScore) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  ASSERT_TRUE(engine.branch(map, kCMajorId, PitchClassSet{0, 4},
                            pool({"min7", "maj7", "min", "maj"}))
                  .success);
  std::vector<ChordGraphEdge> edges = engine.neighbors(map, kCMajorId);
  ASSERT_EQ(edges.size(), 4u);
  EXPECT_EQ(edges[0].to, kCMaj7Id);
  EXPECT_EQ(edges[1].to, kAMin7Id);
  EXPECT_EQ(edges[2].to, kAMinId);
  EXPECT_EQ(edges[3].to, kFMaj7Id);
  EXPECT_TRUE(engine.neighbors(map, kAMinId).empty());
}

// ---------------------------------------------------------------------------
// Session lifecycle
// ---------------------------------------------------------------------------

TEST_F(ChordGraphEngineTest, EndedSessionRejectsExploration) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  ASSERT_TRUE(engine.branch(map, kCMajorId, PitchClassSet{0, 4}, pool({"min"})).success);
  ASSERT_TRUE(engine.moveTo(map, kAMinId).success);
  engine.endSession(map);
  EXPECT_EQ(map.state(), SessionState::Ended);

  EXPECT_EQ(engine.branch(map, kAMinId, PitchClassSet{0}, pool({"maj"})).error,
            TheoryError::SessionEnded);
  EXPECT_EQ(engine.moveTo(map, kCMajorId).error, TheoryError::SessionEnded);
  EXPECT_EQ(engine.back(map).error, TheoryError::SessionEnded);

  // The recorded graph stays readable.
  EXPECT_EQ(map.current(), kAMinId);
  EXPECT_EQ(map.nodeCount(), 2u);
  EXPECT_EQ(engine.neighbors(map, kCMajorId).size(), 1u);
  EXPECT_EQ(snapshot(map).state, SessionState::Ended);
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

TEST_F(ChordGraphEngineTest, BranchResultJson) {
  ChordGraphEngine engine;
  ExploredMap map = engine.startAt(make(Letter::C, "maj"));
  BranchResult result = engine.branch(map, kCMajorId, PitchClassSet{0, 4}, pool({"maj7"}));
  ASSERT_TRUE(result.success);
  std::string json = branchResultToJson(result);
  EXPECT_EQ(json.front(), '[');
  EXPECT_NE(json.find(R"("id":"0,4,7,11|maj7|0")"), std::string::npos);
  EXPECT_NE(json.find(R"("symbol":"C maj7")"), std::string::npos);
  EXPECT_NE(json.find(R"("pitch_classes":[0,4,7,11])"), std::string::npos);
  EXPECT_NE(json.find(R"("voice_leading_cost":0)"), std::string::npos);
  EXPECT_NE(json.find(R"("shared_notes":3)"), std::string::npos);

  EXPECT_EQ(branchResultToJson(BranchResult()), "[]");
}

}  // namespace
}  // namespace chordmap
