// config.h
#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "slot_catalog.h"

namespace slotopt {

using json = nlohmann::json;

enum class ExclusionPolicy {
  voting,  // bar voting-faculty courses, only when any are in the pool
  all,     // bar every course
  off
};

struct SchedulerConfig {
  std::string mip_solver = "SCIP";
  long long consensus_time_limit_ms = 30000;
  long long assignment_time_limit_ms = 60000;
  unsigned long long seed = 12345;
  int max_rank = 4;               // satisfaction scale S = max_rank + 1
  double noise_min = 0.1;
  double noise_max = 1.0;
  ExclusionPolicy exclusion_policy = ExclusionPolicy::voting;
  int balance_limit = 2;          // reporting only
  bool log_search = false;
  bool verbose = true;
  SlotCatalog catalog = SlotCatalog::reference();
};

// Reads UPPER_CASE keys; anything missing keeps its default.
// Throws MalformedInput on out-of-range values.
SchedulerConfig parse_config(const json& j);

ExclusionPolicy parse_exclusion_policy(const std::string& s);
const char* exclusion_policy_name(ExclusionPolicy p);

} // namespace slotopt
