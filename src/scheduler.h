// scheduler.h
#pragma once
#include "types.h"
#include "config.h"
#include "mip_backend.h"
#include <string>
#include <vector>

namespace slotopt {

// Course indices (into req.preferences) whose faculty is voting-eligible.
std::vector<bool> voting_courses(const ScheduleRequest& req);

// Consensus ranking, satisfaction, assignment and statistics for one request.
// Depends only on req, cfg (including its seed) and the backend; no state
// survives the call. Zero courses give an empty successful result without
// touching the backend.
ScheduleOutcome optimize_schedule(const ScheduleRequest& req,
                                  const SchedulerConfig& cfg,
                                  const MipFactory& factory,
                                  SolveControl* control = nullptr);

// Same, with the OR-Tools backend named by cfg.mip_solver.
ScheduleOutcome optimize_schedule(const ScheduleRequest& req,
                                  const SchedulerConfig& cfg,
                                  SolveControl* control = nullptr);

} // namespace slotopt
