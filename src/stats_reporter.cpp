#include "stats_reporter.h"

#include <algorithm>

namespace slotopt
{

    static int spread(const std::vector<std::pair<std::string, int>> &counts)
    {
        if (counts.empty())
            return 0;
        int lo = counts.front().second, hi = lo;
        for (const auto &kv : counts)
        {
            lo = std::min(lo, kv.second);
            hi = std::max(hi, kv.second);
        }
        return hi - lo;
    }

    ScheduleStats compute_stats(const SlotCatalog &catalog,
                                const std::vector<int> &slot_of_course,
                                int balance_limit)
    {
        ScheduleStats st;
        st.slot_counts.assign(catalog.size(), 0);
        for (int s : slot_of_course)
            st.slot_counts.at(s) += 1;

        auto group_counts = [&](const std::vector<std::string> &names,
                                const std::vector<std::vector<int>> &groups)
        {
            std::vector<std::pair<std::string, int>> out;
            out.reserve(names.size());
            for (std::size_t g = 0; g < names.size(); ++g)
            {
                int n = 0;
                for (int s : groups[g])
                    n += st.slot_counts[s];
                out.emplace_back(names[g], n);
            }
            return out;
        };

        st.pattern_counts = group_counts(catalog.day_patterns(), catalog.pattern_groups());
        st.start_time_counts = group_counts(catalog.start_times(), catalog.start_time_groups());

        // with two patterns this is |MWF - TT|
        st.balance_diff = spread(st.pattern_counts);
        st.time_diff = spread(st.start_time_counts);
        st.balance_ok = st.balance_diff <= balance_limit;
        st.time_ok = st.time_diff <= balance_limit;
        return st;
    }

} // namespace slotopt
