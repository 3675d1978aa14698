#include "config.h"

#include <vector>

namespace slotopt
{

    ExclusionPolicy parse_exclusion_policy(const std::string &s)
    {
        if (s == "voting")
            return ExclusionPolicy::voting;
        if (s == "all")
            return ExclusionPolicy::all;
        if (s == "off")
            return ExclusionPolicy::off;
        throw MalformedInput("EXCLUSION_POLICY must be one of voting|all|off, got '" + s + "'");
    }

    const char *exclusion_policy_name(ExclusionPolicy p)
    {
        switch (p)
        {
        case ExclusionPolicy::voting:
            return "voting";
        case ExclusionPolicy::all:
            return "all";
        case ExclusionPolicy::off:
            return "off";
        }
        return "voting";
    }

    static SlotCatalog parse_catalog(const json &slots_json, const std::string &exclusion_code)
    {
        if (!slots_json.is_array())
            throw MalformedInput("SLOTS must be an array.");
        std::vector<TimeSlot> slots;
        slots.reserve(slots_json.size());
        for (const auto &s : slots_json)
        {
            if (!s.is_object())
                throw MalformedInput("SLOTS entries must be objects.");
            TimeSlot t;
            t.code = s.value("code", std::string{});
            t.label = s.value("label", std::string{});
            t.day_pattern = s.value("days", std::string{});
            t.start = s.value("start", std::string{});
            t.end = s.value("end", std::string{});
            slots.push_back(std::move(t));
        }
        return SlotCatalog(std::move(slots), exclusion_code);
    }

    SchedulerConfig parse_config(const json &j)
    {
        if (!j.is_object())
            throw MalformedInput("Config must be a JSON object.");

        SchedulerConfig c;
        try
        {
            c.mip_solver = j.value("MIP_SOLVER", c.mip_solver);
            c.consensus_time_limit_ms = j.value("CONSENSUS_TIME_LIMIT_MS", c.consensus_time_limit_ms);
            c.assignment_time_limit_ms = j.value("ASSIGNMENT_TIME_LIMIT_MS", c.assignment_time_limit_ms);
            c.seed = j.value("SEED", c.seed);
            c.max_rank = j.value("MAX_RANK", c.max_rank);
            c.noise_min = j.value("NOISE_MIN", c.noise_min);
            c.noise_max = j.value("NOISE_MAX", c.noise_max);
            c.exclusion_policy = parse_exclusion_policy(
                j.value("EXCLUSION_POLICY", std::string(exclusion_policy_name(c.exclusion_policy))));
            c.balance_limit = j.value("BALANCE_LIMIT", c.balance_limit);
            c.log_search = j.value("LOG_SEARCH", c.log_search);
            c.verbose = j.value("VERBOSE", c.verbose);

            const std::string exclusion = j.value("EXCLUSION_SLOT", std::string("s10"));
            if (j.contains("SLOTS"))
                c.catalog = parse_catalog(j["SLOTS"], exclusion);
            else if (exclusion != "s10")
                c.catalog = SlotCatalog(SlotCatalog::reference().slots(), exclusion);
        }
        catch (const json::type_error &e)
        {
            throw MalformedInput(std::string("Config value has the wrong type: ") + e.what());
        }

        if (c.mip_solver.empty())
            throw MalformedInput("MIP_SOLVER must not be empty.");
        if (c.consensus_time_limit_ms < 0 || c.assignment_time_limit_ms < 0)
            throw MalformedInput("Time limits must be >= 0 (0 = unlimited).");
        if (c.max_rank < 1)
            throw MalformedInput("MAX_RANK must be >= 1.");
        if (!(c.noise_min >= 0.0 && c.noise_min <= c.noise_max && c.noise_max <= 1.0))
            throw MalformedInput("Noise range must satisfy 0 <= NOISE_MIN <= NOISE_MAX <= 1.");
        if (c.balance_limit < 0)
            throw MalformedInput("BALANCE_LIMIT must be >= 0.");
        return c;
    }

} // namespace slotopt
