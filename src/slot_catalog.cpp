#include "slot_catalog.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace slotopt
{

    namespace
    {
        // index of name in names, appending a new group if unseen
        int group_index(std::vector<std::string> &names,
                        std::vector<std::vector<int>> &groups,
                        const std::string &name)
        {
            auto it = std::find(names.begin(), names.end(), name);
            if (it != names.end())
                return static_cast<int>(it - names.begin());
            names.push_back(name);
            groups.emplace_back();
            return static_cast<int>(names.size()) - 1;
        }
    } // namespace

    SlotCatalog::SlotCatalog(std::vector<TimeSlot> slots, const std::string &exclusion_code)
        : slots_(std::move(slots))
    {
        if (slots_.empty())
            throw MalformedInput("Slot catalog is empty.");

        std::unordered_set<std::string> seen;
        for (std::size_t i = 0; i < slots_.size(); ++i)
        {
            TimeSlot &s = slots_[i];
            if (s.code.empty())
                throw MalformedInput("Slot " + std::to_string(i + 1) + " has no code.");
            if (!seen.insert(s.code).second)
                throw MalformedInput("Duplicate slot code: " + s.code);
            if (s.day_pattern.empty())
                throw MalformedInput("Slot " + s.code + " has no day pattern.");
            if (s.start.empty())
                throw MalformedInput("Slot " + s.code + " has no start time.");

            s.ordinal = static_cast<int>(i) + 1;
            if (s.label.empty())
                s.label = s.day_pattern + " " + s.start + "-" + s.end;

            const int idx = static_cast<int>(i);
            const int pg = group_index(pattern_names_, pattern_groups_, s.day_pattern);
            const int sg = group_index(start_names_, start_groups_, s.start);
            pattern_groups_[pg].push_back(idx);
            start_groups_[sg].push_back(idx);
        }

        if (!exclusion_code.empty())
        {
            exclusion_idx_ = index_of(exclusion_code);
            if (exclusion_idx_ < 0)
                throw MalformedInput("Exclusion slot '" + exclusion_code + "' is not in the catalog.");
        }
    }

    SlotCatalog SlotCatalog::reference()
    {
        std::vector<TimeSlot> slots = {
            {1, "s1", "MWF 9:00-10:15", "M/W/F", "9:00", "10:15"},
            {2, "s2", "TT 9:00-10:15", "T/TH", "9:00", "10:15"},
            {3, "s3", "MWF 10:30-11:45", "M/W/F", "10:30", "11:45"},
            {4, "s4", "TT 10:30-11:45", "T/TH", "10:30", "11:45"},
            {5, "s5", "MWF 12:00-1:15", "M/W/F", "12:00", "1:15"},
            {6, "s6", "TT 12:00-1:15", "T/TH", "12:00", "1:15"},
            {7, "s7", "MWF 1:30-2:45", "M/W/F", "1:30", "2:45"},
            {8, "s8", "TT 1:30-2:45", "T/TH", "1:30", "2:45"},
            {9, "s9", "MWF 3:00-4:15", "M/W/F", "3:00", "4:15"},
            {10, "s10", "TT 3:00-4:15", "T/TH", "3:00", "4:15"},
        };
        return SlotCatalog(std::move(slots), "s10");
    }

    int SlotCatalog::index_of(const std::string &code) const
    {
        for (int i = 0; i < size(); ++i)
            if (slots_[i].code == code)
                return i;
        return -1;
    }

} // namespace slotopt
