// types.h
#pragma once
#include <vector>
#include <string>
#include <map>
#include <optional>
#include <stdexcept>

namespace slotopt {

// Thrown when an input table or config cannot be read into the expected shape.
class MalformedInput : public std::runtime_error {
public:
  explicit MalformedInput(const std::string& msg) : std::runtime_error(msg) {}
};

struct TimeSlot {
  int ordinal = 0;          // 1-based position in the catalog
  std::string code;         // "s1".."s10"
  std::string label;        // "MWF 9:00-10:15"
  std::string day_pattern;  // "M/W/F" or "T/TH"
  std::string start;        // "9:00"
  std::string end;          // "10:15"
};

struct FacultyMember {
  std::string name;
  double adjustment = 0.0;  // carried through, not used by the optimizer
  bool voting = false;
};

struct CourseFaculty {
  std::string course;
  std::string faculty;
};

// One row per course; ranks are in catalog order. 0 = unranked, 1 = best.
struct PreferenceRow {
  std::string course;
  std::vector<int> ranks;
};

using FacultyRoster = std::vector<FacultyMember>;
using CourseFacultyMap = std::vector<CourseFaculty>;
using PreferenceTable = std::vector<PreferenceRow>;

// Per-request context. Everything the optimizer reads comes through here.
struct ScheduleRequest {
  FacultyRoster faculty;
  CourseFacultyMap courses;
  PreferenceTable preferences;
};

// [course][slot] in preference-row / catalog order.
using SatisfactionMatrix = std::vector<std::vector<double>>;

struct AssignmentEntry {
  std::string course;
  std::string slot_code;
  std::string time_label;
  double satisfaction = 0.0;
};

struct ScheduleStats {
  std::vector<std::pair<std::string, int>> pattern_counts;     // catalog order
  std::vector<std::pair<std::string, int>> start_time_counts;  // catalog order
  std::vector<int> slot_counts;                                // per catalog slot
  int balance_diff = 0;  // |MWF - TT| (max - min over patterns)
  int time_diff = 0;     // max - min over start times
  bool balance_ok = true;
  bool time_ok = true;
};

struct ScheduleResult {
  std::vector<AssignmentEntry> entries;
  double satisfaction_total = 0.0;
  double kemeny_score = 0.0;                 // +inf when no exact consensus
  std::map<std::string, double> slot_popularity;
  long long solve_time_ms = 0;
  ScheduleStats stats;
};

enum class Failure {
  none,
  infeasible_or_unsolved,
  solver_fault,
  aborted
};

struct ScheduleOutcome {
  Failure failure = Failure::none;
  std::string message;
  std::optional<ScheduleResult> result;  // empty on any failure
  bool ok() const { return failure == Failure::none && result.has_value(); }
};

const char* failure_name(Failure f);

} // namespace slotopt
