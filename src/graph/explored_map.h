// Explored map -- the session-scoped chord graph: nodes keyed by a
// content-derived id, directed scored edges, and the current position.

#ifndef CHORDMAP_GRAPH_EXPLORED_MAP_H
#define CHORDMAP_GRAPH_EXPLORED_MAP_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/pitch_class_set.h"
#include "harmony/chord_types.h"

namespace chordmap {

class ChordGraphEngine;

/// Lifecycle of an exploration session.
enum class SessionState : uint8_t {
  Idle,        ///< No current node (default-constructed map).
  Positioned,  ///< Current node set.
  Ended        ///< Closed explicitly; exploration calls are rejected.
};

/// @brief Convert a SessionState to a string.
const char* sessionStateToString(SessionState state);

/// @brief Stable node identifier derived from chord content.
///
/// "<pitch classes>|<formula>|<inversion>", e.g. "0,4,7|maj|0". With
/// merge_sonorities the id is the pitch-class set alone ("0,4,7"), so every
/// chord of the same sonority shares one node.
std::string makeNodeId(const Chord& chord, bool merge_sonorities = false);

/// @brief A graph vertex wrapping a canonical chord.
struct ChordGraphNode {
  std::string id;
  Chord chord;                   ///< First chord seen with this id.
  PitchClassSet pitch_classes;
  int visit_count = 0;           ///< Times the session moved onto this node.
  int first_seen_order = 0;      ///< 0 for the start node, then 1, 2, ...
};

/// @brief A directed edge created by branch().
struct ChordGraphEdge {
  std::string from;
  std::string to;
  PitchClassSet pivots;  ///< Pivot set of the branch that last scored this edge.
  double score = 0.0;    ///< Last-write-wins.
};

/// @brief Session graph with arena-plus-index storage.
///
/// Nodes live in a map keyed by id, so revisiting a chord reuses the
/// existing node. Edges are keyed by (from, to) and never duplicated.
/// Only ChordGraphEngine mutates a map.
class ExploredMap {
 public:
  ExploredMap() = default;

  SessionState state() const { return state_; }

  /// @brief Id of the current node; empty when Idle.
  const std::string& current() const { return current_; }

  /// @brief Node by id, or nullptr.
  const ChordGraphNode* findNode(const std::string& id) const;

  /// @brief Edge by endpoints, or nullptr.
  const ChordGraphEdge* findEdge(const std::string& from, const std::string& to) const;

  bool hasNode(const std::string& id) const { return findNode(id) != nullptr; }

  const std::map<std::string, ChordGraphNode>& nodes() const { return nodes_; }
  const std::map<std::pair<std::string, std::string>, ChordGraphEdge>& edges() const {
    return edges_;
  }

  size_t nodeCount() const { return nodes_.size(); }
  size_t edgeCount() const { return edges_.size(); }

  /// @brief Previous positions, oldest first (used by back()).
  const std::vector<std::string>& history() const { return history_; }

 private:
  friend class ChordGraphEngine;

  /// @brief Insert a node if absent; returns the stored node either way.
  ChordGraphNode& upsertNode(const std::string& id, const Chord& chord);

  /// @brief Insert an edge or overwrite its score and pivots.
  void upsertEdge(const std::string& from, const std::string& to,
                  const PitchClassSet& pivots, double score);

  std::map<std::string, ChordGraphNode> nodes_;
  std::map<std::pair<std::string, std::string>, ChordGraphEdge> edges_;
  std::string current_;
  std::vector<std::string> history_;
  SessionState state_ = SessionState::Idle;
  int next_order_ = 0;
};

/// @brief Node entry of a snapshot.
struct SnapshotNode {
  std::string id;
  std::string symbol;  ///< chordSymbol() of the node chord.
  PitchClassSet pitch_classes;
  int visit_count = 0;
  int first_seen_order = 0;
};

/// @brief Plain record of a map for external rendering.
struct MapSnapshot {
  std::vector<SnapshotNode> nodes;   ///< Ordered by first_seen_order.
  std::vector<ChordGraphEdge> edges; ///< Ordered by (from, to).
  std::string current;
  SessionState state = SessionState::Idle;
};

/// @brief Capture the map's nodes, edges and current position.
MapSnapshot snapshot(const ExploredMap& map);

/// @brief Serialize a snapshot to JSON.
/// @param pretty Indented output when true.
std::string snapshotToJson(const MapSnapshot& snap, bool pretty = false);

}  // namespace chordmap

#endif  // CHORDMAP_GRAPH_EXPLORED_MAP_H
