// satisfaction.h
#pragma once
#include "types.h"
#include <random>
#include <vector>

namespace slotopt {

// satisfaction = max(0, (max_rank + 1 - rank) - popularity + noise), 0 for rank 0.
// Noise is uniform in [noise_min, noise_max) and only breaks ties.
class SatisfactionModel {
public:
  SatisfactionModel(int max_rank, double noise_min, double noise_max, unsigned long long seed);

  // Draws one noise sample for every ranked pair.
  double score(int rank, double popularity);

  // [course][slot]; rows follow prefs, columns follow popularity.
  SatisfactionMatrix build_matrix(const PreferenceTable& prefs,
                                  const std::vector<double>& popularity);

private:
  int scale_;  // max_rank + 1
  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> noise_;
};

} // namespace slotopt
