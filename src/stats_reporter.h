// stats_reporter.h
#pragma once
#include "types.h"
#include "slot_catalog.h"
#include <vector>

namespace slotopt {

// slot_of_course holds a catalog index per course.
ScheduleStats compute_stats(const SlotCatalog& catalog,
                            const std::vector<int>& slot_of_course,
                            int balance_limit);

} // namespace slotopt
