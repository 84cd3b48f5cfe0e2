// Implementation of the chord graph engine.

#include "graph/chord_graph_engine.h"

#include <algorithm>
#include <cstdio>
#include <set>

#include "core/json_helpers.h"
#include "core/pitch_utils.h"
#include "harmony/chord_builder.h"

namespace chordmap {

namespace {

/// @brief Candidate with its ranking keys precomputed.
struct ScoredCandidate {
  RankedCandidate ranked;
  PitchClassSet pitch_classes;
  int root_distance = 0;
};

/// @brief Ranking order for branch results.
bool rankBefore(const ScoredCandidate& lhs, const ScoredCandidate& rhs) {
  if (lhs.ranked.breakdown.score != rhs.ranked.breakdown.score) {
    return lhs.ranked.breakdown.score > rhs.ranked.breakdown.score;
  }
  if (lhs.pitch_classes.size() != rhs.pitch_classes.size()) {
    return lhs.pitch_classes.size() < rhs.pitch_classes.size();
  }
  if (lhs.root_distance != rhs.root_distance) return lhs.root_distance < rhs.root_distance;
  const std::string& lhs_name = lhs.ranked.chord.formula->name;
  const std::string& rhs_name = rhs.ranked.chord.formula->name;
  if (lhs_name != rhs_name) return lhs_name < rhs_name;
  return lhs.ranked.chord.root.pitchClass() < rhs.ranked.chord.root.pitchClass();
}

template <typename ResultT>
ResultT failWith(TheoryError error, const std::string& message) {
  ResultT result;
  result.error = error;
  result.error_message = message;
  return result;
}

}  // namespace

std::string branchResultToJson(const BranchResult& result, bool pretty) {
  JsonWriter writer;
  writer.beginArray();
  for (const auto& candidate : result.candidates) {
    writer.beginObject();
    writer.field("id", candidate.node_id);
    writer.field("symbol", chordSymbol(candidate.chord));
    writer.key("pitch_classes");
    writer.beginArray();
    for (PitchClass pc : sonorityKey(candidate.chord).toVector()) {
      writer.value(static_cast<int>(pc));
    }
    writer.endArray();
    writer.field("score", candidate.breakdown.score);
    writer.field("pivot_ratio", candidate.breakdown.pivot_ratio);
    writer.field("voice_leading_cost", candidate.breakdown.voice_leading_cost);
    writer.field("shared_notes", candidate.breakdown.shared_notes);
    writer.endObject();
  }
  writer.endArray();
  return pretty ? writer.toPrettyString() : writer.toString();
}

ChordGraphEngine::ChordGraphEngine(const GraphConfig& config) : config_(config) {}

ExploredMap ChordGraphEngine::startAt(const Chord& chord) const {
  ExploredMap map;
  std::string id = nodeId(chord);
  ChordGraphNode& node = map.upsertNode(id, chord);
  node.visit_count = 1;
  map.current_ = id;
  map.state_ = SessionState::Positioned;
  if (config_.verbose) {
    std::fprintf(stderr, "[ChordGraph] start at %s (%s)\n", chordSymbol(chord).c_str(),
                 id.c_str());
  }
  return map;
}

std::string ChordGraphEngine::nodeId(const Chord& chord) const {
  return makeNodeId(chord, config_.merge_sonorities);
}

PitchClassSet ChordGraphEngine::pivotNotes(const Chord& chord) const {
  return sonorityKey(chord);
}

PitchClassSet ChordGraphEngine::pivotNotes(const ExploredMap& map,
                                           const std::string& node_id) const {
  const ChordGraphNode* node = map.findNode(node_id);
  return node ? node->pitch_classes : PitchClassSet();
}

BranchResult ChordGraphEngine::branch(ExploredMap& map, const std::string& from_id,
                                      const PitchClassSet& pivots,
                                      const CandidatePool& pool) const {
  if (map.state() == SessionState::Ended) {
    return failWith<BranchResult>(TheoryError::SessionEnded, "Session has ended");
  }
  const ChordGraphNode* from = map.findNode(from_id);
  if (!from) {
    return failWith<BranchResult>(TheoryError::UnknownNode, "Unknown node: " + from_id);
  }
  if (pivots.empty() && pool.unfilteredCount() > config_.empty_pivot_limit) {
    return failWith<BranchResult>(
        TheoryError::EmptyPivotSet,
        "Empty pivot set over " + std::to_string(pool.unfilteredCount()) +
            " candidates exceeds limit " + std::to_string(config_.empty_pivot_limit));
  }
  for (const auto& formula : pool.formulas) {
    if (!formula) {
      return failWith<BranchResult>(TheoryError::InvalidFormula,
                                    "Candidate pool contains a null formula");
    }
  }

  // Copies: the map is not touched until every candidate is ranked.
  const Chord source = from->chord;
  const PitchClassSet source_set = from->pitch_classes;
  const PitchClass source_root = source.root.pitchClass();
  SpellingPreference spelling = pool.spelling;
  if (spelling != SpellingPreference::Sharp && spelling != SpellingPreference::Flat) {
    spelling = preferenceOf(source.root);
  }

  std::vector<ScoredCandidate> scored;
  for (const auto& formula : pool.formulas) {
    for (PitchClass root : pool.roots.toVector()) {
      PitchClassSet candidate_set = formula->pitchClassesFrom(root);
      if (!pivots.isSubsetOf(candidate_set)) continue;
      if (!config_.allow_self_loop && candidate_set == source_set) continue;

      ChordResult built = buildChord(spell(root, spelling), formula, source.octave);
      if (!built.success) {
        return failWith<BranchResult>(built.error, built.error_message);
      }

      ScoredCandidate entry;
      entry.ranked.chord = built.chord;
      entry.ranked.node_id = nodeId(built.chord);
      entry.ranked.breakdown = scoreCandidate(pivots, source_set, candidate_set,
                                              config_.weights);
      entry.pitch_classes = candidate_set;
      entry.root_distance = shortestDistance(source_root, root);
      scored.push_back(entry);
    }
  }
  std::stable_sort(scored.begin(), scored.end(), rankBefore);

  BranchResult result;
  std::set<std::string> seen;
  for (const auto& entry : scored) {
    if (!seen.insert(entry.ranked.node_id).second) continue;
    result.candidates.push_back(entry.ranked);
  }

  size_t nodes_before = map.nodeCount();
  for (const auto& candidate : result.candidates) {
    map.upsertNode(candidate.node_id, candidate.chord);
    map.upsertEdge(from_id, candidate.node_id, pivots, candidate.breakdown.score);
  }

  if (config_.verbose) {
    std::fprintf(stderr, "[ChordGraph] branch from %s pivots {%s}: %zu candidates, %zu new nodes\n",
                 from_id.c_str(), pivots.toString().c_str(), result.candidates.size(),
                 map.nodeCount() - nodes_before);
  }
  result.success = true;
  return result;
}

MoveResult ChordGraphEngine::moveTo(ExploredMap& map, const std::string& node_id) const {
  if (map.state() == SessionState::Ended) {
    return failWith<MoveResult>(TheoryError::SessionEnded, "Session has ended");
  }
  if (map.state() == SessionState::Idle || !map.findEdge(map.current(), node_id)) {
    return failWith<MoveResult>(TheoryError::UnknownNode,
                                "No edge from '" + map.current() + "' to '" + node_id + "'");
  }

  map.history_.push_back(map.current_);
  map.current_ = node_id;
  map.nodes_[node_id].visit_count++;
  if (config_.verbose) {
    std::fprintf(stderr, "[ChordGraph] move to %s\n", node_id.c_str());
  }

  MoveResult result;
  result.node_id = node_id;
  result.success = true;
  return result;
}

MoveResult ChordGraphEngine::back(ExploredMap& map) const {
  if (map.state() == SessionState::Ended) {
    return failWith<MoveResult>(TheoryError::SessionEnded, "Session has ended");
  }
  if (map.history_.empty()) {
    return failWith<MoveResult>(TheoryError::UnknownNode, "No previous position");
  }

  map.current_ = map.history_.back();
  map.history_.pop_back();
  map.nodes_[map.current_].visit_count++;
  if (config_.verbose) {
    std::fprintf(stderr, "[ChordGraph] back to %s\n", map.current_.c_str());
  }

  MoveResult result;
  result.node_id = map.current_;
  result.success = true;
  return result;
}

void ChordGraphEngine::endSession(ExploredMap& map) const {
  map.state_ = SessionState::Ended;
  if (config_.verbose) {
    std::fprintf(stderr, "[ChordGraph] session ended: %zu nodes, %zu edges\n",
                 map.nodeCount(), map.edgeCount());
  }
}

std::vector<ChordGraphEdge> ChordGraphEngine::neighbors(const ExploredMap& map,
                                                        const std::string& node_id) const {
  std::vector<ChordGraphEdge> result;
  for (const auto& entry : map.edges()) {
    if (entry.first.first == node_id) result.push_back(entry.second);
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const ChordGraphEdge& lhs, const ChordGraphEdge& rhs) {
                     if (lhs.score != rhs.score) return lhs.score > rhs.score;
                     return lhs.to < rhs.to;
                   });
  return result;
}

}  // namespace chordmap
