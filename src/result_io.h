// result_io.h
#pragma once
#include <iosfwd>
#include <nlohmann/json.hpp>

#include "types.h"

namespace slotopt {

using json = nlohmann::json;

// {results, satisfaction_total, kemeny_score (null if infinite),
//  slot_popularity, solve_time_ms, stats}
json to_json(const ScheduleResult& r);
json to_json(const ScheduleStats& st);

// Optimization log plus the assignment table.
void print_summary(std::ostream& os, const ScheduleResult& r, int balance_limit);

} // namespace slotopt
