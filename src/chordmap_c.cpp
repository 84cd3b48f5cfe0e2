// Implementation of C API for WASM and FFI bindings.

#include "chordmap_c.h"

#include <cstdlib>
#include <cstring>
#include <string>

#include "chord_map.h"
#include "core/basic_types.h"
#include "graph/chord_graph_engine.h"
#include "graph/explored_map.h"

namespace {

constexpr const char* kVersion = "0.1.0";

/// @brief Internal state held per ChordmapHandle.
struct ChordmapInstance {
  chordmap::TheoryConfig config = chordmap::defaultTheoryConfig();
  chordmap::ExploredMap map;
  chordmap::GraphConfig session_graph;  ///< Graph settings fixed at chordmap_start.
  chordmap::BranchResult last_branch;
  std::string current;
  std::string last_error;
  bool has_session = false;
  bool has_branch = false;
};

ChordmapError toErrorCode(chordmap::TheoryError error) {
  switch (error) {
    case chordmap::TheoryError::None:              return CHORDMAP_OK;
    case chordmap::TheoryError::InvalidFormula:    return CHORDMAP_ERROR_INVALID_FORMULA;
    case chordmap::TheoryError::SpellingAmbiguous: return CHORDMAP_ERROR_SPELLING_AMBIGUOUS;
    case chordmap::TheoryError::UnknownNode:       return CHORDMAP_ERROR_UNKNOWN_NODE;
    case chordmap::TheoryError::EmptyPivotSet:     return CHORDMAP_ERROR_EMPTY_PIVOT_SET;
    case chordmap::TheoryError::UnknownSymbol:     return CHORDMAP_ERROR_UNKNOWN_SYMBOL;
    case chordmap::TheoryError::SessionEnded:      return CHORDMAP_ERROR_SESSION_ENDED;
  }
  return CHORDMAP_ERROR_INVALID_PARAM;
}

/// @brief Record a failure on the instance and return its code.
ChordmapError fail(ChordmapInstance* instance, chordmap::TheoryError error,
                   const std::string& message) {
  instance->last_error = message;
  return toErrorCode(error);
}

ChordmapJsonData* makeJsonData(const std::string& json) {
  auto* result = static_cast<ChordmapJsonData*>(malloc(sizeof(ChordmapJsonData)));
  if (!result) return nullptr;

  result->length = json.size();
  result->json = static_cast<char*>(malloc(result->length + 1));
  if (!result->json) {
    free(result);
    return nullptr;
  }

  memcpy(result->json, json.c_str(), result->length + 1);
  return result;
}

chordmap::ChordGraphEngine engineFor(const ChordmapInstance* instance) {
  return chordmap::ChordGraphEngine(instance->session_graph);
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

ChordmapHandle chordmap_create(void) {
  return new ChordmapInstance();
}

void chordmap_destroy(ChordmapHandle handle) {
  delete static_cast<ChordmapInstance*>(handle);
}

ChordmapError chordmap_load_config(ChordmapHandle handle, const char* json, size_t length) {
  if (!handle || !json) return CHORDMAP_ERROR_INVALID_PARAM;
  auto* instance = static_cast<ChordmapInstance*>(handle);

  chordmap::ConfigResult loaded = chordmap::theoryConfigFromJson(json, length);
  if (!loaded.success) return fail(instance, loaded.error, loaded.error_message);

  instance->config = loaded.config;
  instance->last_error.clear();
  return CHORDMAP_OK;
}

// ============================================================================
// Exploration
// ============================================================================

ChordmapError chordmap_start(ChordmapHandle handle, const char* root, const char* quality,
                             int inversion) {
  if (!handle || !root || !quality) return CHORDMAP_ERROR_INVALID_PARAM;
  auto* instance = static_cast<ChordmapInstance*>(handle);

  chordmap::ChordResult built = chordmap::buildChord(root, quality, instance->config.chords);
  if (!built.success) return fail(instance, built.error, built.error_message);

  chordmap::Chord chord = chordmap::invertChord(built.chord, inversion);
  instance->session_graph = instance->config.graph;
  instance->map = engineFor(instance).startAt(chord);
  instance->has_session = true;
  instance->has_branch = false;
  instance->last_branch = chordmap::BranchResult();
  instance->last_error.clear();
  return CHORDMAP_OK;
}

ChordmapError chordmap_branch(ChordmapHandle handle, const uint8_t* pivots, size_t pivot_count,
                              const char* const* qualities, size_t quality_count) {
  if (!handle) return CHORDMAP_ERROR_INVALID_PARAM;
  if (pivot_count > 0 && !pivots) return CHORDMAP_ERROR_INVALID_PARAM;
  if (quality_count > 0 && !qualities) return CHORDMAP_ERROR_INVALID_PARAM;
  auto* instance = static_cast<ChordmapInstance*>(handle);
  if (!instance->has_session) return CHORDMAP_ERROR_NO_SESSION;

  chordmap::PitchClassSet pivot_set;
  for (size_t idx = 0; idx < pivot_count; ++idx) {
    if (pivots[idx] >= chordmap::kPitchClassCount) return CHORDMAP_ERROR_INVALID_PARAM;
    pivot_set.insert(pivots[idx]);
  }

  chordmap::CandidatePool pool;
  if (quality_count == 0) {
    pool.formulas = instance->config.chords.all();
  } else {
    for (size_t idx = 0; idx < quality_count; ++idx) {
      if (!qualities[idx]) return CHORDMAP_ERROR_INVALID_PARAM;
      chordmap::ChordFormulaPtr formula = instance->config.chords.find(qualities[idx]);
      if (!formula) {
        return fail(instance, chordmap::TheoryError::UnknownSymbol,
                    std::string("Unknown chord quality: '") + qualities[idx] + "'");
      }
      pool.formulas.push_back(formula);
    }
  }

  chordmap::BranchResult result =
      engineFor(instance).branch(instance->map, instance->map.current(), pivot_set, pool);
  if (!result.success) return fail(instance, result.error, result.error_message);

  instance->last_branch = result;
  instance->has_branch = true;
  instance->last_error.clear();
  return CHORDMAP_OK;
}

ChordmapError chordmap_move(ChordmapHandle handle, const char* node_id) {
  if (!handle || !node_id) return CHORDMAP_ERROR_INVALID_PARAM;
  auto* instance = static_cast<ChordmapInstance*>(handle);
  if (!instance->has_session) return CHORDMAP_ERROR_NO_SESSION;

  chordmap::MoveResult moved = engineFor(instance).moveTo(instance->map, node_id);
  if (!moved.success) return fail(instance, moved.error, moved.error_message);
  instance->last_error.clear();
  return CHORDMAP_OK;
}

ChordmapError chordmap_back(ChordmapHandle handle) {
  if (!handle) return CHORDMAP_ERROR_INVALID_PARAM;
  auto* instance = static_cast<ChordmapInstance*>(handle);
  if (!instance->has_session) return CHORDMAP_ERROR_NO_SESSION;

  chordmap::MoveResult moved = engineFor(instance).back(instance->map);
  if (!moved.success) return fail(instance, moved.error, moved.error_message);
  instance->last_error.clear();
  return CHORDMAP_OK;
}

ChordmapError chordmap_end(ChordmapHandle handle) {
  if (!handle) return CHORDMAP_ERROR_INVALID_PARAM;
  auto* instance = static_cast<ChordmapInstance*>(handle);
  if (!instance->has_session) return CHORDMAP_ERROR_NO_SESSION;

  engineFor(instance).endSession(instance->map);
  return CHORDMAP_OK;
}

const char* chordmap_current(ChordmapHandle handle) {
  if (!handle) return "";
  auto* instance = static_cast<ChordmapInstance*>(handle);
  instance->current = instance->map.current();
  return instance->current.c_str();
}

// ============================================================================
// Output Retrieval
// ============================================================================

ChordmapJsonData* chordmap_get_branch(ChordmapHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<ChordmapInstance*>(handle);
  if (!instance->has_branch) return nullptr;
  return makeJsonData(chordmap::branchResultToJson(instance->last_branch));
}

ChordmapJsonData* chordmap_get_snapshot(ChordmapHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<ChordmapInstance*>(handle);
  if (!instance->has_session) return nullptr;
  return makeJsonData(chordmap::snapshotToJson(chordmap::snapshot(instance->map)));
}

ChordmapJsonData* chordmap_describe_chord(ChordmapHandle handle, const char* root,
                                          const char* quality, int inversion) {
  if (!handle || !root || !quality) return nullptr;
  auto* instance = static_cast<ChordmapInstance*>(handle);

  chordmap::ChordResult built = chordmap::buildChord(root, quality, instance->config.chords);
  if (!built.success) {
    fail(instance, built.error, built.error_message);
    return nullptr;
  }
  chordmap::Chord chord = chordmap::invertChord(built.chord, inversion);
  return makeJsonData(chordmap::chordDescriptionToJson(chordmap::describe(chord)));
}

ChordmapJsonData* chordmap_describe_scale(ChordmapHandle handle, const char* tonic,
                                          const char* name, int mode) {
  if (!handle || !tonic || !name) return nullptr;
  auto* instance = static_cast<ChordmapInstance*>(handle);

  chordmap::ScaleResult built = chordmap::buildScale(tonic, name, instance->config.scales);
  if (!built.success) {
    fail(instance, built.error, built.error_message);
    return nullptr;
  }
  chordmap::Scale scale = chordmap::mode(built.scale, mode);
  return makeJsonData(
      chordmap::scaleDescriptionToJson(chordmap::describe(scale, instance->config.scales)));
}

void chordmap_free_json(ChordmapJsonData* data) {
  if (data) {
    free(data->json);
    free(data);
  }
}

// ============================================================================
// Error Handling
// ============================================================================

const char* chordmap_error_string(ChordmapError error) {
  switch (error) {
    case CHORDMAP_OK:
      return "OK";
    case CHORDMAP_ERROR_INVALID_PARAM:
      return "Invalid parameter";
    case CHORDMAP_ERROR_INVALID_FORMULA:
      return "Invalid chord or scale formula";
    case CHORDMAP_ERROR_SPELLING_AMBIGUOUS:
      return "Ambiguous spelling";
    case CHORDMAP_ERROR_UNKNOWN_NODE:
      return "Unknown node or no edge from the current node";
    case CHORDMAP_ERROR_EMPTY_PIVOT_SET:
      return "Empty pivot set over too many candidates";
    case CHORDMAP_ERROR_UNKNOWN_SYMBOL:
      return "Unknown note, quality, or scale symbol";
    case CHORDMAP_ERROR_SESSION_ENDED:
      return "Session has ended";
    case CHORDMAP_ERROR_NO_SESSION:
      return "No session started";
    default:
      return "Unknown error";
  }
}

const char* chordmap_last_error(ChordmapHandle handle) {
  if (!handle) return "";
  return static_cast<ChordmapInstance*>(handle)->last_error.c_str();
}

// ============================================================================
// Utilities
// ============================================================================

const char* chordmap_version(void) {
  return kVersion;
}
