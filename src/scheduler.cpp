#include "scheduler.h"

#include <iostream>
#include <unordered_map>
#include <unordered_set>

#include "assignment_solver.h"
#include "consensus_ranker.h"
#include "input_tables.h"
#include "satisfaction.h"
#include "stats_reporter.h"
#include "utils.h"

namespace slotopt
{

    const char *failure_name(Failure f)
    {
        switch (f)
        {
        case Failure::none:
            return "none";
        case Failure::infeasible_or_unsolved:
            return "infeasible_or_unsolved";
        case Failure::solver_fault:
            return "solver_fault";
        case Failure::aborted:
            return "aborted";
        }
        return "unknown";
    }

    std::vector<bool> voting_courses(const ScheduleRequest &req)
    {
        std::unordered_set<std::string> voting_faculty;
        for (const auto &f : req.faculty)
            if (f.voting)
                voting_faculty.insert(f.name);

        std::unordered_map<std::string, std::string> faculty_of;
        for (const auto &cf : req.courses)
            faculty_of.emplace(cf.course, cf.faculty);

        std::vector<bool> out(req.preferences.size(), false);
        for (std::size_t c = 0; c < req.preferences.size(); ++c)
        {
            auto it = faculty_of.find(req.preferences[c].course);
            out[c] = it != faculty_of.end() && voting_faculty.count(it->second) > 0;
        }
        return out;
    }

    static ScheduleOutcome failed(Failure f, const std::string &msg)
    {
        std::cerr << "[scheduler] " << failure_name(f) << ": " << msg << "\n";
        ScheduleOutcome out;
        out.failure = f;
        out.message = msg;
        return out;
    }

    ScheduleOutcome optimize_schedule(const ScheduleRequest &req,
                                      const SchedulerConfig &cfg,
                                      const MipFactory &factory,
                                      SolveControl *control)
    {
        const SlotCatalog &catalog = cfg.catalog;
        const int num_courses = static_cast<int>(req.preferences.size());

        ScheduleResult result;
        if (num_courses == 0)
        {
            if (cfg.verbose)
                std::cout << "[scheduler] no courses; nothing to schedule\n";
            for (const auto &s : catalog.slots())
                result.slot_popularity[s.code] = 0.5;
            result.stats = compute_stats(catalog, {}, cfg.balance_limit);
            ScheduleOutcome out;
            out.result = std::move(result);
            return out;
        }

        // throws MalformedInput; warnings go to stderr
        validate_request(req, cfg);

        if (control && control->cancelled())
            return failed(Failure::aborted, "cancelled before start");

        const long long t0 = NowMillis();

        // ---- Consensus popularity ----
        ConsensusParams cp;
        cp.max_rank = cfg.max_rank;
        cp.time_limit_ms = cfg.consensus_time_limit_ms;
        cp.log_search = cfg.log_search;
        cp.verbose = cfg.verbose;
        cp.control = control;
        const PopularityResult pop = slot_popularity(req.preferences, catalog.size(), cp, factory);
        if (pop.failure != Failure::none)
            return failed(pop.failure, pop.message);

        result.kemeny_score = pop.score;
        for (int s = 0; s < catalog.size(); ++s)
            result.slot_popularity[catalog.at(s).code] = pop.popularity[s];

        // ---- Satisfaction ----
        SatisfactionModel model(cfg.max_rank, cfg.noise_min, cfg.noise_max, cfg.seed);
        const SatisfactionMatrix sat = model.build_matrix(req.preferences, pop.popularity);

        // ---- Assignment ----
        std::vector<std::string> courses;
        courses.reserve(num_courses);
        for (const auto &p : req.preferences)
            courses.push_back(p.course);

        AssignmentParams ap;
        ap.time_limit_ms = cfg.assignment_time_limit_ms;
        ap.log_search = cfg.log_search;
        ap.verbose = cfg.verbose;
        ap.exclusion_policy = cfg.exclusion_policy;
        ap.control = control;
        const AssignmentOutcome asg = solve_assignment(catalog, courses, sat, voting_courses(req), ap, factory);
        if (asg.failure != Failure::none)
            return failed(asg.failure, asg.message);

        result.entries = asg.entries;
        result.satisfaction_total = asg.satisfaction_total;
        result.solve_time_ms = asg.wall_ms;
        result.stats = compute_stats(catalog, asg.slot_of_course, cfg.balance_limit);

        if (cfg.verbose)
        {
            std::cout << "[scheduler] courses=" << num_courses
                      << " total=" << result.satisfaction_total
                      << " elapsed=" << (NowMillis() - t0) << "ms\n";
        }

        ScheduleOutcome out;
        out.result = std::move(result);
        return out;
    }

    ScheduleOutcome optimize_schedule(const ScheduleRequest &req,
                                      const SchedulerConfig &cfg,
                                      SolveControl *control)
    {
        return optimize_schedule(req, cfg, ortools_mip_factory(cfg.mip_solver), control);
    }

} // namespace slotopt
