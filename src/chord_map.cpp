// Implementation of the library facade.

#include "chord_map.h"

#include <cmath>
#include <cstdio>

#include "core/interval.h"
#include "core/json_helpers.h"
#include "core/json_parser.h"
#include "core/pitch_utils.h"

namespace chordmap {

namespace {

constexpr const char kChordPrefix[] = "chord.";
constexpr const char kScalePrefix[] = "scale.";

bool hasPrefix(const std::string& str, const char* prefix, size_t prefix_len) {
  return str.size() > prefix_len && str.compare(0, prefix_len, prefix) == 0;
}

/// @brief Offsets of a "chord." / "scale." entry; false unless an integer array.
bool readOffsets(const JsonValue& value, std::vector<int>& offsets) {
  if (value.type != JsonValue::NumberArray) return false;
  for (double number : value.array_val) {
    if (std::floor(number) != number || !fitsInt(number)) return false;
  }
  offsets = value.asIntArray();
  return true;
}

ConfigResult configFailure(const std::string& message) {
  ConfigResult result;
  result.error = TheoryError::InvalidFormula;
  result.error_message = message;
  return result;
}

void writeNotes(JsonWriter& writer, const std::vector<Note>& notes) {
  writer.beginArray();
  for (const auto& note : notes) writer.value(noteToString(note));
  writer.endArray();
}

void writeStrings(JsonWriter& writer, const std::vector<std::string>& strings) {
  writer.beginArray();
  for (const auto& str : strings) writer.value(str);
  writer.endArray();
}

void writePitchClassArray(JsonWriter& writer, const PitchClassSet& set) {
  writer.beginArray();
  for (PitchClass pc : set.toVector()) writer.value(static_cast<int>(pc));
  writer.endArray();
}

}  // namespace

TheoryConfig defaultTheoryConfig() {
  TheoryConfig config;
  config.chords = ChordQualityTable::defaults();
  config.scales = ScaleFormulaTable::defaults();
  return config;
}

ConfigResult theoryConfigFromJson(const char* json, size_t length, const TheoryConfig& base) {
  if (!json) return configFailure("Config text is missing");

  JsonParseResult parsed = parseJsonObject(json, length);
  if (!parsed.success) return configFailure("Config is not a JSON object: " + parsed.error_message);

  ConfigResult result;
  result.config = base;
  TheoryConfig& config = result.config;
  const auto& kv = parsed.values;

  auto it = kv.find("w1");
  if (it != kv.end()) config.graph.weights.w1 = it->second.asDouble(config.graph.weights.w1);
  it = kv.find("w2");
  if (it != kv.end()) config.graph.weights.w2 = it->second.asDouble(config.graph.weights.w2);
  it = kv.find("w3");
  if (it != kv.end()) config.graph.weights.w3 = it->second.asDouble(config.graph.weights.w3);

  it = kv.find("empty_pivot_limit");
  if (it != kv.end()) {
    int limit = it->second.asInt(config.graph.empty_pivot_limit);
    if (limit >= 0) config.graph.empty_pivot_limit = limit;
  }

  it = kv.find("allow_self_loop");
  if (it != kv.end()) config.graph.allow_self_loop = it->second.asBool(false);
  it = kv.find("merge_sonorities");
  if (it != kv.end()) config.graph.merge_sonorities = it->second.asBool(false);
  it = kv.find("verbose");
  if (it != kv.end()) config.graph.verbose = it->second.asBool(false);

  const size_t chord_len = sizeof(kChordPrefix) - 1;
  const size_t scale_len = sizeof(kScalePrefix) - 1;
  for (const auto& entry : kv) {
    const std::string& key = entry.first;
    if (!hasPrefix(key, kChordPrefix, chord_len) && !hasPrefix(key, kScalePrefix, scale_len)) {
      continue;
    }

    std::vector<int> offsets;
    if (!readOffsets(entry.second, offsets)) {
      return configFailure("Config key '" + key + "' must be an array of integer offsets");
    }

    if (hasPrefix(key, kChordPrefix, chord_len)) {
      FormulaResult added = config.chords.add(key.substr(chord_len), "", offsets);
      if (!added.success) {
        return configFailure("Config key '" + key + "': " + added.error_message);
      }
    } else {
      ScaleFormulaResult added = config.scales.add(key.substr(scale_len), "", offsets);
      if (!added.success) {
        return configFailure("Config key '" + key + "': " + added.error_message);
      }
    }
    if (config.graph.verbose) {
      std::fprintf(stderr, "[Config] loaded %s (%zu offsets)\n", key.c_str(), offsets.size());
    }
  }

  result.success = true;
  return result;
}

ChordResult buildChord(const std::string& root_symbol, const std::string& quality_symbol,
                       const ChordQualityTable& table, int octave) {
  ChordResult result;
  NoteResult root = parseNote(root_symbol);
  if (!root.success) {
    result.error = root.error;
    result.error_message = root.error_message;
    return result;
  }

  ChordFormulaPtr formula = table.find(quality_symbol);
  if (!formula) {
    result.error = TheoryError::UnknownSymbol;
    result.error_message = "Unknown chord quality: '" + quality_symbol + "'";
    return result;
  }
  return buildChord(root.note, formula, octave);
}

ChordResult parseChordSymbol(const std::string& symbol, const ChordQualityTable& table) {
  std::string root;
  std::string quality;
  if (!splitChordSymbol(symbol, root, quality)) {
    ChordResult result;
    result.error = TheoryError::UnknownSymbol;
    result.error_message = "Unknown chord symbol: '" + symbol + "'";
    return result;
  }
  return buildChord(root, quality, table);
}

ScaleResult buildScale(const std::string& tonic_symbol, const std::string& scale_symbol,
                       const ScaleFormulaTable& table) {
  ScaleResult result;
  NoteResult tonic = parseNote(tonic_symbol);
  if (!tonic.success) {
    result.error = tonic.error;
    result.error_message = tonic.error_message;
    return result;
  }

  ScaleFormulaPtr formula = table.find(scale_symbol);
  if (!formula) {
    result.error = TheoryError::UnknownSymbol;
    result.error_message = "Unknown scale: '" + scale_symbol + "'";
    return result;
  }
  return buildScale(tonic.note, formula);
}

ChordDescription describe(const Chord& chord) {
  ChordDescription desc;
  desc.symbol = chordSymbol(chord);
  desc.inversion = chord.inversion;
  desc.sounding = soundingNotes(chord);
  desc.tones = chordTones(chord);
  desc.pitch_classes = sonorityKey(chord);
  if (chord.formula) {
    desc.formula_name = chord.formula->name;
    desc.long_name = chord.formula->long_name;
  }
  for (const auto& tone : desc.tones) {
    desc.intervals.push_back(spelledIntervalName(chord.root, tone));
  }
  return desc;
}

ScaleDescription describe(const Scale& scale, const ScaleFormulaTable& table) {
  ScaleDescription desc;
  desc.name = scaleName(scale, table);
  desc.mode_index = scale.mode_index;
  desc.degrees = degrees(scale);
  desc.pitch_classes = scalePitchClasses(scale);
  if (scale.formula) desc.formula_name = scale.formula->name;
  for (const auto& degree : desc.degrees) {
    desc.intervals.push_back(spelledIntervalName(scale.tonic, degree));
  }
  return desc;
}

std::string chordDescriptionToJson(const ChordDescription& desc, bool pretty) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("symbol", desc.symbol);
  writer.field("formula", desc.formula_name);
  writer.field("long_name", desc.long_name);
  writer.field("inversion", desc.inversion);

  writer.key("notes");
  writer.beginArray();
  for (const auto& pitched : desc.sounding) writer.value(pitchedNoteToString(pitched));
  writer.endArray();

  writer.key("tones");
  writeNotes(writer, desc.tones);
  writer.key("intervals");
  writeStrings(writer, desc.intervals);
  writer.key("pitch_classes");
  writePitchClassArray(writer, desc.pitch_classes);
  writer.endObject();
  return pretty ? writer.toPrettyString() : writer.toString();
}

std::string scaleDescriptionToJson(const ScaleDescription& desc, bool pretty) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("name", desc.name);
  writer.field("formula", desc.formula_name);
  writer.field("mode", desc.mode_index);
  writer.key("degrees");
  writeNotes(writer, desc.degrees);
  writer.key("intervals");
  writeStrings(writer, desc.intervals);
  writer.key("pitch_classes");
  writePitchClassArray(writer, desc.pitch_classes);
  writer.endObject();
  return pretty ? writer.toPrettyString() : writer.toString();
}

}  // namespace chordmap
