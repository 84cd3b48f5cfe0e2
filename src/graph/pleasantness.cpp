// Implementation of transition scoring.

#include "graph/pleasantness.h"

#include <vector>

#include "core/pitch_utils.h"

namespace chordmap {

int voiceLeadingCost(const PitchClassSet& source, const PitchClassSet& candidate) {
  if (source.empty() || candidate.empty()) return 0;

  std::vector<PitchClass> targets = candidate.toVector();
  int total = 0;
  for (PitchClass from : source.toVector()) {
    int best = kPitchClassCount;
    for (PitchClass to : targets) {
      int dist = shortestDistance(from, to);
      if (dist < best) best = dist;
    }
    total += best;
  }
  return total;
}

int sharedNoteCount(const PitchClassSet& source, const PitchClassSet& candidate) {
  return source.intersectionWith(candidate).size();
}

ScoreBreakdown scoreCandidate(const PitchClassSet& pivots, const PitchClassSet& source,
                              const PitchClassSet& candidate,
                              const ScoringWeights& weights) {
  ScoreBreakdown result;
  if (!candidate.empty()) {
    result.pivot_ratio = static_cast<double>(pivots.size()) / candidate.size();
  }
  result.voice_leading_cost = voiceLeadingCost(source, candidate);
  result.shared_notes = sharedNoteCount(source, candidate);
  result.score = weights.w1 * result.pivot_ratio -
                 weights.w2 * result.voice_leading_cost +
                 weights.w3 * result.shared_notes;
  return result;
}

}  // namespace chordmap
