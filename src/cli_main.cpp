/// @file
/// @brief CLI entry point for the chordmap explorer.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "chord_map.h"
#include "core/basic_types.h"
#include "core/pitch_utils.h"
#include "graph/chord_graph_engine.h"
#include "harmony/key.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string chord_root;
  std::string chord_quality;
  int inversion = 0;
  std::string scale_tonic;
  std::string scale_name;
  int mode = 0;
  bool parallel_mode = false;
  std::string branch_pivots;
  bool branch_requested = false;
  std::string pool;
  int limit = 10;
  std::string identify;
  std::string config_path;
  std::string key;
  bool json_output = false;
  bool list = false;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("chordmap_cli - chord and scale explorer\n\n");
  std::printf("Usage: chordmap_cli [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --chord ROOT QUALITY   Describe a chord (e.g. --chord C maj7)\n");
  std::printf("  --inversion N          Chord inversion (negative allowed)\n");
  std::printf("  --scale TONIC NAME     Describe a scale (e.g. --scale C major)\n");
  std::printf("  --mode K               Relative mode K of the scale (C major, 1 -> D dorian)\n");
  std::printf("  --parallel-mode K      Parallel mode K of the scale (C major, 1 -> C dorian)\n");
  std::printf("  --branch PCS           Branch from --chord keeping pitch classes (e.g. 0,4)\n");
  std::printf("  --pool LIST            Candidate qualities (e.g. maj,min,maj7); default all\n");
  std::printf("  --limit N              Show at most N candidates (default 10, 0 = all)\n");
  std::printf("  --identify PCS         Name chords with exactly these pitch classes\n");
  std::printf("  --key KEY              Spell chord notes in a key (e.g. Bb_major)\n");
  std::printf("  --config FILE          Load JSON configuration\n");
  std::printf("  --list                 List chord qualities and scales\n");
  std::printf("  --json                 JSON output\n");
  std::printf("  --verbose              Log exploration steps to stderr\n");
  std::printf("  --help                 Show this help\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @return False if --help was requested (caller should exit cleanly).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 ||
        std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(argv[idx], "--chord") == 0 && idx + 2 < argc) {
      opts.chord_root = argv[++idx];
      opts.chord_quality = argv[++idx];
    } else if (std::strcmp(argv[idx], "--inversion") == 0 && idx + 1 < argc) {
      opts.inversion = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--scale") == 0 && idx + 2 < argc) {
      opts.scale_tonic = argv[++idx];
      opts.scale_name = argv[++idx];
    } else if (std::strcmp(argv[idx], "--mode") == 0 && idx + 1 < argc) {
      opts.mode = std::atoi(argv[++idx]);
      opts.parallel_mode = false;
    } else if (std::strcmp(argv[idx], "--parallel-mode") == 0 && idx + 1 < argc) {
      opts.mode = std::atoi(argv[++idx]);
      opts.parallel_mode = true;
    } else if (std::strcmp(argv[idx], "--branch") == 0 && idx + 1 < argc) {
      opts.branch_pivots = argv[++idx];
      opts.branch_requested = true;
    } else if (std::strcmp(argv[idx], "--pool") == 0 && idx + 1 < argc) {
      opts.pool = argv[++idx];
    } else if (std::strcmp(argv[idx], "--limit") == 0 && idx + 1 < argc) {
      opts.limit = std::atoi(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--identify") == 0 && idx + 1 < argc) {
      opts.identify = argv[++idx];
    } else if (std::strcmp(argv[idx], "--key") == 0 && idx + 1 < argc) {
      opts.key = argv[++idx];
    } else if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--list") == 0) {
      opts.list = true;
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else {
      std::fprintf(stderr, "Warning: ignoring argument '%s'\n", argv[idx]);
    }
  }
  return true;
}

/// @brief Split "a,b,c" into its non-empty parts.
std::vector<std::string> splitList(const std::string& list) {
  std::vector<std::string> parts;
  std::stringstream stream(list);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (!item.empty()) parts.push_back(item);
  }
  return parts;
}

/// @brief Parse "0,4,7" into a pitch-class set.
bool parsePitchClasses(const std::string& list, chordmap::PitchClassSet& out) {
  for (const auto& part : splitList(list)) {
    char* end = nullptr;
    long value = std::strtol(part.c_str(), &end, 10);
    if (end == part.c_str() || *end != '\0') return false;
    out.insert(static_cast<int>(value));
  }
  return true;
}

/// @brief Read a whole file into a string.
bool readFile(const std::string& path, std::string& out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

std::string joinNotes(const std::vector<chordmap::Note>& notes) {
  std::string result;
  for (const auto& note : notes) {
    if (!result.empty()) result += ' ';
    result += chordmap::noteToString(note);
  }
  return result;
}

void printChord(const chordmap::Chord& chord, const CliOptions& opts,
                const chordmap::KeySignature* key_sig) {
  chordmap::ChordDescription desc = chordmap::describe(chord);
  if (opts.json_output) {
    std::printf("%s\n", chordmap::chordDescriptionToJson(desc, true).c_str());
    return;
  }

  std::printf("%s (%s)\n", desc.symbol.c_str(), desc.long_name.c_str());
  std::string sounding;
  for (const auto& pitched : desc.sounding) {
    if (!sounding.empty()) sounding += ' ';
    sounding += chordmap::pitchedNoteToString(pitched);
  }
  std::printf("  notes:         %s\n", sounding.c_str());
  std::printf("  tones:         %s\n", joinNotes(desc.tones).c_str());
  std::printf("  pitch classes: {%s}\n", desc.pitch_classes.toString().c_str());
  for (size_t idx = 0; idx < desc.tones.size(); ++idx) {
    std::printf("  %-4s %s\n", chordmap::noteToString(desc.tones[idx]).c_str(),
                desc.intervals[idx].c_str());
  }
  if (key_sig) {
    std::printf("  in %s:   %s\n", chordmap::keySignatureToString(*key_sig).c_str(),
                joinNotes(chordmap::spellAll(chord, *key_sig)).c_str());
  }
}

void printScale(const chordmap::Scale& scale, const chordmap::TheoryConfig& config,
                const CliOptions& opts) {
  chordmap::ScaleDescription desc = chordmap::describe(scale, config.scales);
  if (opts.json_output) {
    std::printf("%s\n", chordmap::scaleDescriptionToJson(desc, true).c_str());
    return;
  }

  std::printf("%s\n", desc.name.c_str());
  std::printf("  degrees:       %s\n", joinNotes(desc.degrees).c_str());
  std::printf("  pitch classes: {%s}\n", desc.pitch_classes.toString().c_str());
  for (size_t idx = 0; idx < desc.degrees.size(); ++idx) {
    chordmap::ChordResult triad = chordmap::diatonicChord(scale, static_cast<int>(idx), 3,
                                                          config.chords);
    std::printf("  %zu %-4s %-20s %s\n", idx + 1,
                chordmap::noteToString(desc.degrees[idx]).c_str(), desc.intervals[idx].c_str(),
                triad.success ? chordmap::chordSymbol(triad.chord).c_str() : "-");
  }
}

int runBranch(const chordmap::Chord& source, const chordmap::TheoryConfig& config,
              const CliOptions& opts) {
  chordmap::PitchClassSet pivots;
  if (!parsePitchClasses(opts.branch_pivots, pivots)) {
    std::fprintf(stderr, "Error: invalid pitch-class list '%s'\n", opts.branch_pivots.c_str());
    return 1;
  }

  chordmap::CandidatePool pool;
  if (opts.pool.empty()) {
    pool.formulas = config.chords.all();
  } else {
    for (const auto& name : splitList(opts.pool)) {
      chordmap::ChordFormulaPtr formula = config.chords.find(name);
      if (!formula) {
        std::fprintf(stderr, "Error: unknown chord quality '%s'\n", name.c_str());
        return 1;
      }
      pool.formulas.push_back(formula);
    }
  }

  chordmap::ChordGraphEngine engine(config.graph);
  chordmap::ExploredMap map = engine.startAt(source);
  chordmap::BranchResult result = engine.branch(map, map.current(), pivots, pool);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s (%s)\n", result.error_message.c_str(),
                 chordmap::theoryErrorToString(result.error));
    return 1;
  }

  if (opts.limit > 0 && result.candidates.size() > static_cast<size_t>(opts.limit)) {
    result.candidates.resize(static_cast<size_t>(opts.limit));
  }

  if (opts.json_output) {
    std::printf("%s\n", chordmap::branchResultToJson(result, true).c_str());
    return 0;
  }

  std::printf("Branch from %s keeping {%s}:\n", chordmap::chordSymbol(source).c_str(),
              pivots.toString().c_str());
  for (size_t idx = 0; idx < result.candidates.size(); ++idx) {
    const auto& cand = result.candidates[idx];
    std::printf("  %2zu. %-12s score %6.2f  (shared %d, voice leading %d)\n", idx + 1,
                chordmap::chordSymbol(cand.chord).c_str(), cand.breakdown.score,
                cand.breakdown.shared_notes, cand.breakdown.voice_leading_cost);
  }
  return 0;
}

int runIdentify(const chordmap::TheoryConfig& config, const CliOptions& opts) {
  chordmap::PitchClassSet target;
  if (!parsePitchClasses(opts.identify, target)) {
    std::fprintf(stderr, "Error: invalid pitch-class list '%s'\n", opts.identify.c_str());
    return 1;
  }
  std::vector<chordmap::Chord> matches = chordmap::identifyChords(config.chords, target);
  if (matches.empty()) {
    std::printf("No chord matches {%s}\n", target.toString().c_str());
    return 0;
  }
  for (const auto& chord : matches) {
    std::printf("%s\n", chordmap::chordSymbol(chord).c_str());
  }
  return 0;
}

void printList(const chordmap::TheoryConfig& config) {
  std::printf("Chord qualities:\n");
  for (const auto& formula : config.chords.all()) {
    std::string offsets;
    for (int offset : formula->offsets) {
      if (!offsets.empty()) offsets += ',';
      offsets += std::to_string(offset);
    }
    std::printf("  %-12s %-28s [%s]\n", formula->name.c_str(), formula->long_name.c_str(),
                offsets.c_str());
  }
  std::printf("Scales:\n");
  for (const auto& name : config.scales.names()) std::printf("  %s\n", name.c_str());
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) return 0;

  chordmap::TheoryConfig config = chordmap::defaultTheoryConfig();
  if (!opts.config_path.empty()) {
    std::string text;
    if (!readFile(opts.config_path, text)) {
      std::fprintf(stderr, "Error: failed to read %s\n", opts.config_path.c_str());
      return 1;
    }
    chordmap::ConfigResult loaded = chordmap::theoryConfigFromJson(text.c_str(), text.size());
    if (!loaded.success) {
      std::fprintf(stderr, "Error: %s\n", loaded.error_message.c_str());
      return 1;
    }
    config = loaded.config;
  }
  if (opts.verbose) config.graph.verbose = true;

  chordmap::KeySignature key_sig;
  bool has_key = false;
  if (!opts.key.empty()) {
    chordmap::KeyResult parsed = chordmap::keySignatureFromString(opts.key);
    if (!parsed.success) {
      std::fprintf(stderr, "Error: %s\n", parsed.error_message.c_str());
      return 1;
    }
    key_sig = parsed.key;
    has_key = true;
  }

  bool did_something = false;
  if (opts.list) {
    printList(config);
    did_something = true;
  }

  if (!opts.identify.empty()) {
    if (runIdentify(config, opts) != 0) return 1;
    did_something = true;
  }

  if (!opts.chord_root.empty()) {
    chordmap::ChordResult built =
        chordmap::buildChord(opts.chord_root, opts.chord_quality, config.chords);
    if (!built.success) {
      std::fprintf(stderr, "Error: %s\n", built.error_message.c_str());
      return 1;
    }
    chordmap::Chord chord = chordmap::invertChord(built.chord, opts.inversion);
    if (opts.branch_requested) {
      if (runBranch(chord, config, opts) != 0) return 1;
    } else {
      printChord(chord, opts, has_key ? &key_sig : nullptr);
    }
    did_something = true;
  } else if (opts.branch_requested) {
    std::fprintf(stderr, "Error: --branch needs a source --chord\n");
    return 1;
  }

  if (!opts.scale_tonic.empty()) {
    chordmap::ScaleResult built =
        chordmap::buildScale(opts.scale_tonic, opts.scale_name, config.scales);
    if (!built.success) {
      std::fprintf(stderr, "Error: %s\n", built.error_message.c_str());
      return 1;
    }
    chordmap::Scale scale = opts.parallel_mode ? chordmap::parallelMode(built.scale, opts.mode)
                                               : chordmap::mode(built.scale, opts.mode);
    printScale(scale, config, opts);
    did_something = true;
  }

  if (!did_something) {
    printUsage();
    return 1;
  }
  return 0;
}
