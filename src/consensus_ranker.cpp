#include "consensus_ranker.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace slotopt
{

    namespace
    {
        const double kInf = std::numeric_limits<double>::infinity();

        // Mean of non-zero ranks per candidate; unranked candidates sit mid-scale.
        std::vector<double> mean_rank_standing(const std::vector<std::vector<int>> &ranks,
                                               int n_candidates, int max_rank)
        {
            const double midpoint = (1.0 + max_rank) / 2.0;
            std::vector<double> out(n_candidates, midpoint);
            for (int c = 0; c < n_candidates; ++c)
            {
                double sum = 0.0;
                int n = 0;
                for (const auto &voter : ranks)
                {
                    if (voter[c] > 0)
                    {
                        sum += voter[c];
                        ++n;
                    }
                }
                if (n > 0)
                    out[c] = sum / n;
            }
            return out;
        }
    } // namespace

    RankAggregate aggregate_ranks(const std::vector<std::vector<int>> &ranks,
                                  const ConsensusParams &params,
                                  const MipFactory &factory)
    {
        RankAggregate out;
        const int n_voters = static_cast<int>(ranks.size());
        const int n = n_voters > 0 ? static_cast<int>(ranks.front().size()) : 0;

        if (n_voters == 0 || n == 0)
        {
            out.score = kInf;
            out.standing.assign(n, 0.0);
            return out;
        }
        for (int v = 0; v < n_voters; ++v)
        {
            if (static_cast<int>(ranks[v].size()) != n)
                throw MalformedInput("Voter " + std::to_string(v) + " ranks " + std::to_string(ranks[v].size()) +
                                     " candidates, expected " + std::to_string(n));
        }

        // Objective: for each voter and each pair that voter orders strictly,
        // count the precedence variable that contradicts the voter.
        // Precedence counts are gathered first so ties-only input skips the solve.
        std::vector<std::vector<int>> disagree(n, std::vector<int>(n, 0)); // [i][j] weight on x(i,j)
        bool any_term = false;
        for (const auto &voter : ranks)
        {
            for (int i = 0; i < n; ++i)
            {
                if (voter[i] <= 0)
                    continue;
                for (int j = i + 1; j < n; ++j)
                {
                    if (voter[j] <= 0 || voter[i] == voter[j])
                        continue;
                    if (voter[i] < voter[j])
                        disagree[j][i] += 1; // voter puts i first; x(j,i) disagrees
                    else
                        disagree[i][j] += 1;
                    any_term = true;
                }
            }
        }

        if (!any_term)
        {
            out.score = 0.0;
            out.standing.assign(n, 0.0);
            out.exact = true;
            return out;
        }

        std::unique_ptr<MipModel> model = factory ? factory() : nullptr;
        if (!model)
        {
            out.failure = Failure::solver_fault;
            out.message = "MIP backend unavailable for consensus ranking";
            return out;
        }

        std::vector<std::vector<int>> x(n, std::vector<int>(n, -1));
        for (int i = 0; i < n; ++i)
            for (int j = 0; j < n; ++j)
                if (i != j)
                    x[i][j] = model->add_bool_var("x_" + std::to_string(i) + "_" + std::to_string(j));

        std::vector<MipTerm> objective;
        for (int i = 0; i < n; ++i)
            for (int j = 0; j < n; ++j)
                if (disagree[i][j] > 0)
                    objective.push_back({x[i][j], static_cast<double>(disagree[i][j])});
        model->set_objective(objective, /*maximize=*/false);

        // Exactly one direction per pair.
        int n_constraints = 0;
        for (int i = 0; i < n; ++i)
            for (int j = i + 1; j < n; ++j)
            {
                model->add_constraint({{x[i][j], 1.0}, {x[j][i], 1.0}}, 1.0, 1.0,
                                      "pair_" + std::to_string(i) + "_" + std::to_string(j));
                ++n_constraints;
            }

        // No 3-cycles. Rotations of a cycle are the same constraint, so anchor
        // each cycle at its smallest candidate.
        for (int i = 0; i < n; ++i)
            for (int j = i + 1; j < n; ++j)
                for (int k = i + 1; k < n; ++k)
                {
                    if (k == j)
                        continue;
                    model->add_constraint({{x[i][j], 1.0}, {x[j][k], 1.0}, {x[k][i], 1.0}},
                                          -MipModel::infinity(), 2.0,
                                          "cycle_" + std::to_string(i) + "_" + std::to_string(j) + "_" + std::to_string(k));
                    ++n_constraints;
                }

        if (params.verbose)
        {
            std::cout << "[consensus] voters=" << n_voters
                      << " candidates=" << n
                      << " vars=" << n * (n - 1)
                      << " constraints=" << n_constraints
                      << " tl=" << params.time_limit_ms << "ms\n";
        }

        MipSolveParams sp;
        sp.time_limit_ms = params.time_limit_ms;
        sp.log_search = params.log_search;
        sp.control = params.control;
        const MipSolution sol = model->solve(sp);

        switch (sol.status)
        {
        case MipStatus::optimal:
            break;
        case MipStatus::feasible:
        case MipStatus::not_solved:
            std::cerr << "[consensus] optimality not certified (" << mip_status_name(sol.status)
                      << " after " << sol.wall_ms << "ms); using mean ranks\n";
            out.score = kInf;
            out.standing = mean_rank_standing(ranks, n, params.max_rank);
            return out;
        case MipStatus::aborted:
            out.failure = Failure::aborted;
            out.message = "consensus ranking aborted";
            return out;
        default:
            out.failure = Failure::solver_fault;
            out.message = std::string("consensus ranking solver returned ") + mip_status_name(sol.status);
            return out;
        }

        out.standing.assign(n, 0.0);
        for (int i = 0; i < n; ++i)
            for (int j = 0; j < n; ++j)
                if (i != j && sol.values[x[i][j]] > 0.5)
                    out.standing[j] += 1.0; // i precedes j
        out.score = std::round(sol.objective);
        out.exact = true;

        if (params.verbose)
        {
            std::cout << "[consensus] kemeny_score=" << out.score
                      << " wall=" << sol.wall_ms << "ms\n";
        }
        return out;
    }

    std::vector<double> popularity_from_standing(const std::vector<double> &standing)
    {
        std::vector<double> pop(standing.size(), 0.5);
        if (standing.empty())
            return pop;
        const auto mm = std::minmax_element(standing.begin(), standing.end());
        const double lo = *mm.first, hi = *mm.second;
        if (hi == lo)
            return pop;
        for (std::size_t i = 0; i < standing.size(); ++i)
            pop[i] = (hi - standing[i]) / (hi - lo);
        return pop;
    }

    PopularityResult slot_popularity(const PreferenceTable &prefs,
                                     int num_slots,
                                     const ConsensusParams &params,
                                     const MipFactory &factory)
    {
        PopularityResult out;

        std::vector<std::vector<int>> voters;
        voters.reserve(prefs.size());
        for (const auto &row : prefs)
        {
            if (std::any_of(row.ranks.begin(), row.ranks.end(), [](int r)
                            { return r != 0; }))
                voters.push_back(row.ranks);
        }

        if (voters.empty() || num_slots == 0)
        {
            if (params.verbose)
                std::cout << "[consensus] no ranked preferences; uniform popularity\n";
            out.popularity.assign(num_slots, 0.5);
            out.score = 0.0;
            return out;
        }

        const RankAggregate agg = aggregate_ranks(voters, params, factory);
        if (agg.failure != Failure::none)
        {
            out.failure = agg.failure;
            out.message = agg.message;
            return out;
        }
        out.popularity = popularity_from_standing(agg.standing);
        out.score = agg.score;
        out.exact = agg.exact;
        return out;
    }

} // namespace slotopt
