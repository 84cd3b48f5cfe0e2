// Implementation of the explored map and its snapshot.

#include "graph/explored_map.h"

#include <algorithm>

#include "core/json_helpers.h"
#include "harmony/chord_builder.h"

namespace chordmap {

namespace {

void writePitchClasses(JsonWriter& writer, const PitchClassSet& set) {
  writer.beginArray();
  for (PitchClass pc : set.toVector()) writer.value(static_cast<int>(pc));
  writer.endArray();
}

}  // namespace

const char* sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::Idle:       return "idle";
    case SessionState::Positioned: return "positioned";
    case SessionState::Ended:      return "ended";
  }
  return "unknown";
}

std::string makeNodeId(const Chord& chord, bool merge_sonorities) {
  std::string id = sonorityKey(chord).toString();
  if (merge_sonorities) return id;
  id += '|';
  id += chord.formula ? chord.formula->name : std::string();
  id += '|';
  id += std::to_string(chord.inversion);
  return id;
}

const ChordGraphNode* ExploredMap::findNode(const std::string& id) const {
  auto iter = nodes_.find(id);
  return iter != nodes_.end() ? &iter->second : nullptr;
}

const ChordGraphEdge* ExploredMap::findEdge(const std::string& from,
                                            const std::string& to) const {
  auto iter = edges_.find(std::make_pair(from, to));
  return iter != edges_.end() ? &iter->second : nullptr;
}

ChordGraphNode& ExploredMap::upsertNode(const std::string& id, const Chord& chord) {
  auto iter = nodes_.find(id);
  if (iter != nodes_.end()) return iter->second;

  ChordGraphNode node;
  node.id = id;
  node.chord = chord;
  node.pitch_classes = sonorityKey(chord);
  node.first_seen_order = next_order_++;
  return nodes_.emplace(id, node).first->second;
}

void ExploredMap::upsertEdge(const std::string& from, const std::string& to,
                             const PitchClassSet& pivots, double score) {
  ChordGraphEdge& edge = edges_[std::make_pair(from, to)];
  edge.from = from;
  edge.to = to;
  edge.pivots = pivots;
  edge.score = score;
}

MapSnapshot snapshot(const ExploredMap& map) {
  MapSnapshot snap;
  snap.current = map.current();
  snap.state = map.state();

  for (const auto& entry : map.nodes()) {
    const ChordGraphNode& node = entry.second;
    snap.nodes.push_back(SnapshotNode{node.id, chordSymbol(node.chord), node.pitch_classes,
                                      node.visit_count, node.first_seen_order});
  }
  std::sort(snap.nodes.begin(), snap.nodes.end(),
            [](const SnapshotNode& lhs, const SnapshotNode& rhs) {
              return lhs.first_seen_order < rhs.first_seen_order;
            });

  // The edge map is already ordered by (from, to).
  for (const auto& entry : map.edges()) snap.edges.push_back(entry.second);
  return snap;
}

std::string snapshotToJson(const MapSnapshot& snap, bool pretty) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("state", sessionStateToString(snap.state));
  if (snap.current.empty()) {
    writer.key("current");
    writer.valueNull();
  } else {
    writer.field("current", snap.current);
  }

  writer.key("nodes");
  writer.beginArray();
  for (const auto& node : snap.nodes) {
    writer.beginObject();
    writer.field("id", node.id);
    writer.field("symbol", node.symbol);
    writer.key("pitch_classes");
    writePitchClasses(writer, node.pitch_classes);
    writer.field("visit_count", node.visit_count);
    writer.field("first_seen_order", node.first_seen_order);
    writer.endObject();
  }
  writer.endArray();

  writer.key("edges");
  writer.beginArray();
  for (const auto& edge : snap.edges) {
    writer.beginObject();
    writer.field("from", edge.from);
    writer.field("to", edge.to);
    writer.key("pivots");
    writePitchClasses(writer, edge.pivots);
    writer.field("score", edge.score);
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return pretty ? writer.toPrettyString() : writer.toString();
}

}  // namespace chordmap
