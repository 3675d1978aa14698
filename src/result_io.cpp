#include "result_io.h"

#include <cmath>
#include <iomanip>
#include <ostream>

namespace slotopt
{

    static json ordered_counts(const std::vector<std::pair<std::string, int>> &counts)
    {
        // array of pairs keeps catalog order ("9:00" before "1:30")
        json arr = json::array();
        for (const auto &kv : counts)
            arr.push_back({{"key", kv.first}, {"count", kv.second}});
        return arr;
    }

    json to_json(const ScheduleStats &st)
    {
        json j;
        j["pattern_counts"] = ordered_counts(st.pattern_counts);
        j["time_counts"] = ordered_counts(st.start_time_counts);
        j["slot_counts"] = st.slot_counts;
        j["balance_diff"] = st.balance_diff;
        j["time_diff"] = st.time_diff;
        j["balance_ok"] = st.balance_ok;
        j["time_ok"] = st.time_ok;
        return j;
    }

    json to_json(const ScheduleResult &r)
    {
        json results = json::array();
        for (const auto &e : r.entries)
        {
            results.push_back({{"course", e.course},
                               {"slot", e.slot_code},
                               {"time", e.time_label},
                               {"satisfaction", e.satisfaction}});
        }

        json j;
        j["results"] = std::move(results);
        j["satisfaction_total"] = r.satisfaction_total;
        // JSON has no infinity
        if (std::isfinite(r.kemeny_score))
            j["kemeny_score"] = r.kemeny_score;
        else
            j["kemeny_score"] = nullptr;
        j["slot_popularity"] = r.slot_popularity;
        j["solve_time_ms"] = r.solve_time_ms;
        j["stats"] = to_json(r.stats);
        return j;
    }

    void print_summary(std::ostream &os, const ScheduleResult &r, int balance_limit)
    {
        const auto &st = r.stats;
        os << "\n# Optimization results\n";
        os << "Total satisfaction: " << std::fixed << std::setprecision(1) << r.satisfaction_total << "\n";
        os << "Solve time: " << r.solve_time_ms << " ms\n";
        os << "Kemeny score: ";
        if (std::isfinite(r.kemeny_score))
            os << std::setprecision(0) << r.kemeny_score << "\n";
        else
            os << "n/a (consensus not certified)\n";
        for (const auto &kv : st.pattern_counts)
            os << kv.first << " courses: " << kv.second << "\n";
        os << "Day balance difference: " << st.balance_diff << " (limit: <=" << balance_limit << ")\n";
        os << "Time balance difference: " << st.time_diff << " (limit: <=" << balance_limit << ")\n";
        os << "Day pattern balance: " << (st.balance_ok ? "✓" : "✗") << "\n";
        os << "Start time balance: " << (st.time_ok ? "✓" : "✗") << "\n";

        os << "\n" << std::left << std::setw(16) << "course"
           << std::setw(8) << "slot"
           << std::setw(20) << "time"
           << std::right << std::setw(14) << "satisfaction" << "\n";
        for (const auto &e : r.entries)
        {
            os << std::left << std::setw(16) << e.course
               << std::setw(8) << e.slot_code
               << std::setw(20) << e.time_label
               << std::right << std::setw(14) << std::fixed << std::setprecision(2) << e.satisfaction
               << "\n";
        }
        os << std::endl;
    }

} // namespace slotopt
