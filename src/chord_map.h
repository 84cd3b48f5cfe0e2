// Library facade: symbol-level construction, configuration loading, and
// describe() records for rendering chords and scales.

#ifndef CHORDMAP_CHORD_MAP_H
#define CHORDMAP_CHORD_MAP_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/pitch_class_set.h"
#include "graph/chord_graph_engine.h"
#include "harmony/chord_builder.h"
#include "harmony/chord_types.h"
#include "harmony/key.h"
#include "harmony/scale.h"
#include "harmony/scale_types.h"

namespace chordmap {

/// @brief Every caller-overridable table and setting.
struct TheoryConfig {
  ChordQualityTable chords;
  ScaleFormulaTable scales;
  GraphConfig graph;
};

/// @brief Built-in tables with default graph settings.
TheoryConfig defaultTheoryConfig();

/// @brief Result of loading a configuration.
struct ConfigResult {
  TheoryConfig config;
  bool success = false;
  TheoryError error = TheoryError::None;
  std::string error_message;
};

/// @brief Apply a flat JSON object on top of a base configuration.
///
/// Recognized keys: "w1", "w2", "w3", "empty_pivot_limit",
/// "allow_self_loop", "merge_sonorities", "verbose", "chord.<name>" and
/// "scale.<name>" (arrays of offsets). Unknown keys are ignored.
/// @return InvalidFormula naming the key when a table entry is rejected;
///         InvalidFormula as well when the text is not a JSON object.
ConfigResult theoryConfigFromJson(const char* json, size_t length,
                                  const TheoryConfig& base = defaultTheoryConfig());

/// @brief Build a root-position chord from symbols ("C#", "maj7").
/// @return UnknownSymbol if either symbol does not resolve.
ChordResult buildChord(const std::string& root_symbol, const std::string& quality_symbol,
                       const ChordQualityTable& table, int octave = kDefaultOctave);

/// @brief Build a chord from a compact symbol ("C#m7", "Bbmaj7", "F").
ChordResult parseChordSymbol(const std::string& symbol, const ChordQualityTable& table);

/// @brief Build a scale from symbols ("D", "dorian").
/// @return UnknownSymbol if either symbol does not resolve.
ScaleResult buildScale(const std::string& tonic_symbol, const std::string& scale_symbol,
                       const ScaleFormulaTable& table);

/// @brief Rendering record for a chord.
struct ChordDescription {
  std::string symbol;
  std::string formula_name;
  std::string long_name;
  int inversion = 0;
  std::vector<PitchedNote> sounding;   ///< Bass upward.
  std::vector<Note> tones;             ///< Formula order from the root.
  std::vector<std::string> intervals;  ///< Interval of each tone above the root.
  PitchClassSet pitch_classes;
};

/// @brief Rendering record for a scale.
struct ScaleDescription {
  std::string name;
  std::string formula_name;
  int mode_index = 0;
  std::vector<Note> degrees;
  std::vector<std::string> intervals;  ///< Interval of each degree above the tonic.
  PitchClassSet pitch_classes;
};

ChordDescription describe(const Chord& chord);

ScaleDescription describe(const Scale& scale, const ScaleFormulaTable& table);

std::string chordDescriptionToJson(const ChordDescription& desc, bool pretty = false);

std::string scaleDescriptionToJson(const ScaleDescription& desc, bool pretty = false);

}  // namespace chordmap

#endif  // CHORDMAP_CHORD_MAP_H
