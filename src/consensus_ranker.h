// consensus_ranker.h
#pragma once
#include "types.h"
#include "mip_backend.h"
#include <string>
#include <vector>

namespace slotopt {

struct ConsensusParams {
  int max_rank = 4;                 // fallback default for unranked = (1 + max_rank) / 2
  long long time_limit_ms = 0;
  bool log_search = false;
  bool verbose = false;
  SolveControl* control = nullptr;
};

struct RankAggregate {
  // Kemeny distance of the consensus order; +inf when degenerate or when
  // optimality could not be certified.
  double score = 0.0;
  // Per candidate, lower is better: loss counts (exact) or mean ranks (fallback).
  std::vector<double> standing;
  bool exact = false;
  Failure failure = Failure::none;  // solver_fault / aborted only
  std::string message;
};

// ranks[voter][candidate]; 0 = unranked. Zero voters or zero candidates give
// score +inf and a neutral standing.
RankAggregate aggregate_ranks(const std::vector<std::vector<int>>& ranks,
                              const ConsensusParams& params,
                              const MipFactory& factory);

// Rescales standings to [0,1], best -> 1, worst -> 0, all equal -> 0.5.
std::vector<double> popularity_from_standing(const std::vector<double>& standing);

struct PopularityResult {
  std::vector<double> popularity;   // per catalog slot
  double score = 0.0;
  bool exact = false;
  Failure failure = Failure::none;
  std::string message;
};

// Drops all-zero rows, then aggregates. No usable voter -> uniform 0.5, score 0.
PopularityResult slot_popularity(const PreferenceTable& prefs,
                                 int num_slots,
                                 const ConsensusParams& params,
                                 const MipFactory& factory);

} // namespace slotopt
