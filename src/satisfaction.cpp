#include "satisfaction.h"

#include <algorithm>

namespace slotopt
{

    SatisfactionModel::SatisfactionModel(int max_rank, double noise_min, double noise_max,
                                         unsigned long long seed)
        : scale_(max_rank + 1), rng_(seed), noise_(noise_min, noise_max)
    {
    }

    double SatisfactionModel::score(int rank, double popularity)
    {
        // never credit a slot the course did not ask for
        if (rank == 0)
            return 0.0;
        const double base = static_cast<double>(scale_ - rank);
        return std::max(0.0, base - popularity + noise_(rng_));
    }

    SatisfactionMatrix SatisfactionModel::build_matrix(const PreferenceTable &prefs,
                                                       const std::vector<double> &popularity)
    {
        const int num_slots = static_cast<int>(popularity.size());
        SatisfactionMatrix m(prefs.size(), std::vector<double>(num_slots, 0.0));

        // slot-major draw order; part of the seed contract
        for (int s = 0; s < num_slots; ++s)
        {
            for (std::size_t c = 0; c < prefs.size(); ++c)
            {
                const auto &ranks = prefs[c].ranks;
                const int rank = s < static_cast<int>(ranks.size()) ? ranks[s] : 0;
                m[c][s] = score(rank, popularity[s]);
            }
        }
        return m;
    }

} // namespace slotopt
