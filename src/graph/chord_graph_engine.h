// Chord graph engine -- lazy mind-map exploration of chord space.
//
// A session starts at one chord. branch() enumerates a bounded candidate
// pool, keeps chords that retain the chosen pivot notes, ranks them by
// pleasantness and records the edges in the ExploredMap. moveTo() and
// back() walk the recorded graph.

#ifndef CHORDMAP_GRAPH_CHORD_GRAPH_ENGINE_H
#define CHORDMAP_GRAPH_CHORD_GRAPH_ENGINE_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/pitch_class_set.h"
#include "graph/explored_map.h"
#include "graph/pleasantness.h"
#include "harmony/chord_types.h"

namespace chordmap {

/// Default safety limit for an empty pivot set.
constexpr int kDefaultEmptyPivotLimit = 500;

/// @brief Engine configuration.
struct GraphConfig {
  ScoringWeights weights;
  int empty_pivot_limit = kDefaultEmptyPivotLimit;  ///< Max unfiltered candidates with no pivots.
  bool allow_self_loop = false;   ///< Keep candidates with the source's own sonority.
  bool merge_sonorities = false;  ///< Node identity by pitch-class set only.
  bool verbose = false;           ///< Diagnostics to stderr.
};

/// @brief Formulas x roots to enumerate in one branch.
struct CandidatePool {
  std::vector<ChordFormulaPtr> formulas;
  PitchClassSet roots = PitchClassSet::chromatic();
  /// Root spelling; Unspecified follows the source chord's root.
  SpellingPreference spelling = SpellingPreference::Unspecified;

  /// @brief Number of chords enumerated before filtering.
  int unfilteredCount() const { return static_cast<int>(formulas.size()) * roots.size(); }
};

/// @brief One ranked neighbor.
struct RankedCandidate {
  Chord chord;
  std::string node_id;
  ScoreBreakdown breakdown;
};

/// @brief Result of branch(): ranked best first.
struct BranchResult {
  std::vector<RankedCandidate> candidates;
  bool success = false;
  TheoryError error = TheoryError::None;
  std::string error_message;
};

/// @brief Result of moveTo() and back().
struct MoveResult {
  std::string node_id;  ///< New current node.
  bool success = false;
  TheoryError error = TheoryError::None;
  std::string error_message;
};

/// @brief Serialize ranked candidates to a JSON array.
std::string branchResultToJson(const BranchResult& result, bool pretty = false);

/// @brief Stateless engine; all session state lives in ExploredMap.
///
/// Failed operations leave the map unchanged.
class ChordGraphEngine {
 public:
  explicit ChordGraphEngine(const GraphConfig& config = GraphConfig());

  const GraphConfig& config() const { return config_; }

  /// @brief Create a session positioned on chord.
  ExploredMap startAt(const Chord& chord) const;

  /// @brief Node id this engine assigns to chord.
  std::string nodeId(const Chord& chord) const;

  /// @brief Pitch classes of a chord, from which callers pick pivots.
  PitchClassSet pivotNotes(const Chord& chord) const;

  /// @brief Pitch classes of a node in the map; empty if unknown.
  PitchClassSet pivotNotes(const ExploredMap& map, const std::string& node_id) const;

  /// @brief Rank and record neighbors of from_id that keep the pivots.
  ///
  /// Candidates are every formula of the pool on every root of the pool, in
  /// root position. Survivors contain all pivots and (unless
  /// allow_self_loop) differ in sonority from the source. Ranking: score
  /// descending, then fewer pitch classes, then nearer root, then formula
  /// name, then root pitch class. Root nearness is the shortest circular
  /// distance (0-6), not the directed distance(), so a root a semitone
  /// below ranks with one a semitone above.
  /// Candidates mapping to the same node keep the best-ranked entry.
  /// Pivots need not belong to the source chord.
  /// @return UnknownNode if from_id is absent; EmptyPivotSet if pivots are
  ///         empty and the pool exceeds empty_pivot_limit; InvalidFormula
  ///         for a null pool formula; SessionEnded after endSession().
  BranchResult branch(ExploredMap& map, const std::string& from_id,
                      const PitchClassSet& pivots, const CandidatePool& pool) const;

  /// @brief Move along a recorded edge from the current node.
  /// @return UnknownNode if no edge current -> node_id exists.
  MoveResult moveTo(ExploredMap& map, const std::string& node_id) const;

  /// @brief Return to the previous position.
  /// @return UnknownNode when there is no history.
  MoveResult back(ExploredMap& map) const;

  /// @brief Close the session. Later exploration calls fail with SessionEnded.
  void endSession(ExploredMap& map) const;

  /// @brief Outgoing edges of a node, best score first (ties by target id).
  std::vector<ChordGraphEdge> neighbors(const ExploredMap& map,
                                        const std::string& node_id) const;

 private:
  GraphConfig config_;
};

}  // namespace chordmap

#endif  // CHORDMAP_GRAPH_CHORD_GRAPH_ENGINE_H
