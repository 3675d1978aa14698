// assignment_solver.h
#pragma once
#include "types.h"
#include "config.h"
#include "mip_backend.h"
#include "slot_catalog.h"
#include <string>
#include <utility>
#include <vector>

namespace slotopt {

struct AssignmentParams {
  long long time_limit_ms = 0;
  bool log_search = false;
  bool verbose = false;
  ExclusionPolicy exclusion_policy = ExclusionPolicy::voting;
  SolveControl* control = nullptr;
};

struct AssignmentOutcome {
  Failure failure = Failure::none;
  std::string message;
  std::vector<int> slot_of_course;        // catalog index, parallel to courses
  std::vector<AssignmentEntry> entries;   // course order
  double satisfaction_total = 0.0;
  long long wall_ms = 0;
};

// Lower bound per day pattern: ceil(C / patterns) - 1, never below 0.
int day_pattern_floor(int num_courses, int num_patterns);
// Closed band per start time: [floor(C / starts), floor(C / starts) + 2].
std::pair<int, int> start_time_band(int num_courses, int num_start_times);

// Maximizes total satisfaction, one slot per course, subject to the day-pattern
// floor, the start-time band and the exclusion rule. Anything short of a
// certified optimum is reported as a failure with no entries.
AssignmentOutcome solve_assignment(const SlotCatalog& catalog,
                                   const std::vector<std::string>& courses,
                                   const SatisfactionMatrix& satisfaction,
                                   const std::vector<bool>& voting_course,
                                   const AssignmentParams& params,
                                   const MipFactory& factory);

} // namespace slotopt
