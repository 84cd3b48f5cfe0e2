// C API for WASM and FFI bindings.

#ifndef CHORDMAP_C_H
#define CHORDMAP_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to an exploration session plus its configuration.
typedef void* ChordmapHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  CHORDMAP_OK = 0,
  CHORDMAP_ERROR_INVALID_PARAM = 1,
  CHORDMAP_ERROR_INVALID_FORMULA = 2,
  CHORDMAP_ERROR_SPELLING_AMBIGUOUS = 3,
  CHORDMAP_ERROR_UNKNOWN_NODE = 4,
  CHORDMAP_ERROR_EMPTY_PIVOT_SET = 5,
  CHORDMAP_ERROR_UNKNOWN_SYMBOL = 6,
  CHORDMAP_ERROR_SESSION_ENDED = 7,
  CHORDMAP_ERROR_NO_SESSION = 8,
} ChordmapError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief JSON output.
typedef struct {
  char* json;     ///< NUL-terminated JSON string
  size_t length;  ///< String length
} ChordmapJsonData;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a handle with the default configuration and no session.
/// @return Handle (must be freed with chordmap_destroy)
ChordmapHandle chordmap_create(void);

/// @brief Destroy a handle.
/// @param handle Handle to destroy
void chordmap_destroy(ChordmapHandle handle);

/// @brief Replace the configuration from a flat JSON object.
///
/// Keys: w1, w2, w3, empty_pivot_limit, allow_self_loop, merge_sonorities,
/// verbose, "chord.<name>": [offsets], "scale.<name>": [offsets].
/// Any running session is kept. Graph settings (weights, limits, flags)
/// take effect at the next chordmap_start so node ids stay stable within a
/// session; chord and scale tables apply to later calls immediately.
/// @return CHORDMAP_OK, or CHORDMAP_ERROR_INVALID_FORMULA (config unchanged)
ChordmapError chordmap_load_config(ChordmapHandle handle, const char* json, size_t length);

// ============================================================================
// Exploration
// ============================================================================

/// @brief Start a new session at a chord (replaces any previous session).
/// @param root Root symbol, e.g. "C#"
/// @param quality Quality symbol, e.g. "maj7"
/// @param inversion Inversion index (reduced mod chord size)
ChordmapError chordmap_start(ChordmapHandle handle, const char* root, const char* quality,
                             int inversion);

/// @brief Branch from the current node.
/// @param pivots Pitch classes (0-11) to keep; may be NULL when pivot_count is 0
/// @param pivot_count Number of pivots
/// @param qualities Quality symbols of the candidate pool; NULL/0 = every quality
/// @param quality_count Number of qualities
ChordmapError chordmap_branch(ChordmapHandle handle, const uint8_t* pivots, size_t pivot_count,
                              const char* const* qualities, size_t quality_count);

/// @brief Move along an edge from the current node.
ChordmapError chordmap_move(ChordmapHandle handle, const char* node_id);

/// @brief Return to the previous node.
ChordmapError chordmap_back(ChordmapHandle handle);

/// @brief End the session; the snapshot stays available.
ChordmapError chordmap_end(ChordmapHandle handle);

/// @brief Current node id.
/// @return Id (owned by the handle, valid until the next call), "" if none
const char* chordmap_current(ChordmapHandle handle);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Ranked result of the last successful branch.
/// @return JSON array (must be freed with chordmap_free_json), NULL if none
ChordmapJsonData* chordmap_get_branch(ChordmapHandle handle);

/// @brief Snapshot of the session graph.
/// @return JSON object (must be freed with chordmap_free_json), NULL if no session
ChordmapJsonData* chordmap_get_snapshot(ChordmapHandle handle);

/// @brief Describe a chord.
/// @return JSON object (must be freed with chordmap_free_json), NULL on error
ChordmapJsonData* chordmap_describe_chord(ChordmapHandle handle, const char* root,
                                          const char* quality, int inversion);

/// @brief Describe a scale, optionally as its relative mode.
/// @return JSON object (must be freed with chordmap_free_json), NULL on error
ChordmapJsonData* chordmap_describe_scale(ChordmapHandle handle, const char* tonic,
                                          const char* name, int mode);

/// @brief Free JSON data.
/// @param data Pointer returned by a chordmap_get_* or chordmap_describe_* call
void chordmap_free_json(ChordmapJsonData* data);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* chordmap_error_string(ChordmapError error);

/// @brief Detailed message of the last failed call on this handle.
/// @return Message (owned by the handle), "" if the last call succeeded
const char* chordmap_last_error(ChordmapHandle handle);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* chordmap_version(void);

#ifdef __cplusplus
}
#endif

#endif  // CHORDMAP_C_H
