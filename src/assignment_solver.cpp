#include "assignment_solver.h"

#include <algorithm>
#include <iostream>

namespace slotopt
{

    int day_pattern_floor(int num_courses, int num_patterns)
    {
        if (num_patterns <= 0)
            return 0;
        const int ceil_share = (num_courses + num_patterns - 1) / num_patterns;
        return std::max(0, ceil_share - 1);
    }

    std::pair<int, int> start_time_band(int num_courses, int num_start_times)
    {
        if (num_start_times <= 0)
            return {0, num_courses};
        const int lo = num_courses / num_start_times;
        return {lo, lo + 2};
    }

    AssignmentOutcome solve_assignment(const SlotCatalog &catalog,
                                       const std::vector<std::string> &courses,
                                       const SatisfactionMatrix &satisfaction,
                                       const std::vector<bool> &voting_course,
                                       const AssignmentParams &params,
                                       const MipFactory &factory)
    {
        AssignmentOutcome out;
        const int C = static_cast<int>(courses.size());
        const int S = catalog.size();

        if (static_cast<int>(satisfaction.size()) != C || static_cast<int>(voting_course.size()) != C)
            throw MalformedInput("Satisfaction matrix / voting flags do not match the course list.");
        for (const auto &row : satisfaction)
            if (static_cast<int>(row.size()) != S)
                throw MalformedInput("Satisfaction matrix row does not match the slot catalog.");

        if (C == 0)
            return out;

        std::unique_ptr<MipModel> model = factory ? factory() : nullptr;
        if (!model)
        {
            out.failure = Failure::solver_fault;
            out.message = "MIP backend unavailable for assignment";
            return out;
        }

        // x[s][c] == 1 iff course c meets in slot s
        std::vector<std::vector<int>> x(S, std::vector<int>(C, -1));
        for (int s = 0; s < S; ++s)
            for (int c = 0; c < C; ++c)
                x[s][c] = model->add_bool_var("x[" + std::to_string(s) + "," + std::to_string(c) + "]");

        std::vector<MipTerm> objective;
        objective.reserve(static_cast<std::size_t>(S) * C);
        for (int s = 0; s < S; ++s)
            for (int c = 0; c < C; ++c)
                objective.push_back({x[s][c], satisfaction[c][s]});
        model->set_objective(objective, /*maximize=*/true);

        const double inf = MipModel::infinity();

        // 1) one slot per course
        for (int c = 0; c < C; ++c)
        {
            std::vector<MipTerm> row;
            for (int s = 0; s < S; ++s)
                row.push_back({x[s][c], 1.0});
            model->add_constraint(row, 1.0, 1.0, "one_slot_" + courses[c]);
        }

        auto group_terms = [&](const std::vector<int> &slots)
        {
            std::vector<MipTerm> row;
            for (int s : slots)
                for (int c = 0; c < C; ++c)
                    row.push_back({x[s][c], 1.0});
            return row;
        };

        // 2) day pattern floor
        const auto &patterns = catalog.pattern_groups();
        const int pattern_min = day_pattern_floor(C, static_cast<int>(patterns.size()));
        for (std::size_t p = 0; p < patterns.size(); ++p)
            model->add_constraint(group_terms(patterns[p]), pattern_min, inf,
                                  "pattern_" + catalog.day_patterns()[p]);

        // 3) start time band
        const auto &starts = catalog.start_time_groups();
        const auto band = start_time_band(C, static_cast<int>(starts.size()));
        for (std::size_t t = 0; t < starts.size(); ++t)
            model->add_constraint(group_terms(starts[t]), band.first, band.second,
                                  "start_" + catalog.start_times()[t]);

        // 4) exclusion slot
        int barred = 0;
        if (catalog.has_exclusion_slot() && params.exclusion_policy != ExclusionPolicy::off)
        {
            const int ex = catalog.exclusion_index();
            std::vector<MipTerm> row;
            for (int c = 0; c < C; ++c)
            {
                if (params.exclusion_policy == ExclusionPolicy::all || voting_course[c])
                    row.push_back({x[ex][c], 1.0});
            }
            barred = static_cast<int>(row.size());
            if (!row.empty())
                model->add_constraint(row, 0.0, 0.0, "exclusion_" + catalog.at(ex).code);
        }

        if (params.verbose)
        {
            std::cout << "[assignment] courses=" << C
                      << " slots=" << S
                      << " pattern_min=" << pattern_min
                      << " start_band=[" << band.first << "," << band.second << "]"
                      << " barred_from_exclusion=" << barred
                      << " tl=" << params.time_limit_ms << "ms\n";
        }

        MipSolveParams sp;
        sp.time_limit_ms = params.time_limit_ms;
        sp.log_search = params.log_search;
        sp.control = params.control;
        const MipSolution sol = model->solve(sp);
        out.wall_ms = sol.wall_ms;

        switch (sol.status)
        {
        case MipStatus::optimal:
            break;
        case MipStatus::feasible:
        case MipStatus::not_solved:
        case MipStatus::infeasible:
            out.failure = Failure::infeasible_or_unsolved;
            out.message = std::string("Optimization failed: solver status ") + mip_status_name(sol.status);
            return out;
        case MipStatus::aborted:
            out.failure = Failure::aborted;
            out.message = "Optimization aborted";
            return out;
        default:
            out.failure = Failure::solver_fault;
            out.message = std::string("Solver fault: ") + mip_status_name(sol.status);
            return out;
        }

        // ---- Extract solution ----
        out.slot_of_course.assign(C, -1);
        for (int c = 0; c < C; ++c)
        {
            for (int s = 0; s < S; ++s)
            {
                if (sol.values[x[s][c]] > 0.5)
                {
                    if (out.slot_of_course[c] >= 0)
                    {
                        out.slot_of_course.clear();
                        out.failure = Failure::solver_fault;
                        out.message = "Solver returned two slots for course " + courses[c];
                        return out;
                    }
                    out.slot_of_course[c] = s;
                }
            }
            if (out.slot_of_course[c] < 0)
            {
                out.slot_of_course.clear();
                out.failure = Failure::solver_fault;
                out.message = "Solver returned no slot for course " + courses[c];
                return out;
            }
        }

        out.entries.reserve(C);
        for (int c = 0; c < C; ++c)
        {
            const int s = out.slot_of_course[c];
            const TimeSlot &slot = catalog.at(s);
            out.entries.push_back({courses[c], slot.code, slot.label, satisfaction[c][s]});
            out.satisfaction_total += satisfaction[c][s];
        }

        if (params.verbose)
        {
            std::cout << "[assignment] satisfaction_total=" << out.satisfaction_total
                      << " wall=" << out.wall_ms << "ms\n";
        }
        return out;
    }

} // namespace slotopt
