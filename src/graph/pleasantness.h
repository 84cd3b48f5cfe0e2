// Pleasantness scoring for chord transitions -- pivot coverage, greedy
// voice-leading cost, and shared-tone count combined with caller weights.

#ifndef CHORDMAP_GRAPH_PLEASANTNESS_H
#define CHORDMAP_GRAPH_PLEASANTNESS_H

#include "core/pitch_class_set.h"

namespace chordmap {

/// @brief Weights of the scoring rule (defaults w1=2, w2=1, w3=3).
struct ScoringWeights {
  double w1 = 2.0;  ///< Pivot coverage |pivots| / |candidate|.
  double w2 = 1.0;  ///< Voice-leading cost (subtracted).
  double w3 = 3.0;  ///< Shared pitch classes with the source.
};

/// @brief Individual terms of a score, kept for display.
struct ScoreBreakdown {
  double pivot_ratio = 0.0;
  int voice_leading_cost = 0;
  int shared_notes = 0;
  double score = 0.0;
};

/// @brief Greedy nearest-neighbor voice-leading cost.
///
/// Each source pitch class is paired with the nearest candidate pitch class
/// (shortest way round, 0-6 semitones) and the distances are summed. The
/// circular shortestDistance() is used instead of the directed distance()
/// so that a voice moving down a semitone costs 1, not 11. This is an
/// approximation of optimal voice leading: several source tones may pair
/// with the same target.
/// @return 0 if either set is empty.
int voiceLeadingCost(const PitchClassSet& source, const PitchClassSet& candidate);

/// @brief |source ∩ candidate|.
int sharedNoteCount(const PitchClassSet& source, const PitchClassSet& candidate);

/// @brief score = w1*|pivots|/|candidate| - w2*voiceLeadingCost + w3*shared.
ScoreBreakdown scoreCandidate(const PitchClassSet& pivots, const PitchClassSet& source,
                              const PitchClassSet& candidate,
                              const ScoringWeights& weights);

}  // namespace chordmap

#endif  // CHORDMAP_GRAPH_PLEASANTNESS_H
