// slot_catalog.h
#pragma once
#include "types.h"
#include <string>
#include <vector>

namespace slotopt {

// Fixed set of schedulable slots plus the groupings the balance constraints use.
// Groups are kept in order of first appearance in the slot list.
class SlotCatalog {
public:
  // Throws MalformedInput on empty/duplicate codes or an unknown exclusion code.
  // An empty exclusion_code means no slot is reserved.
  SlotCatalog(std::vector<TimeSlot> slots, const std::string& exclusion_code);

  // Ten MWF/TT slots, 9:00 to 3:00, exclusion slot s10 (TT 3:00-4:15).
  static SlotCatalog reference();

  int size() const { return static_cast<int>(slots_.size()); }
  const std::vector<TimeSlot>& slots() const { return slots_; }
  const TimeSlot& at(int idx) const { return slots_.at(idx); }

  // -1 if unknown
  int index_of(const std::string& code) const;

  const std::vector<std::string>& day_patterns() const { return pattern_names_; }
  const std::vector<std::string>& start_times() const { return start_names_; }
  // slot indices per day pattern / start time, parallel to the name vectors
  const std::vector<std::vector<int>>& pattern_groups() const { return pattern_groups_; }
  const std::vector<std::vector<int>>& start_time_groups() const { return start_groups_; }

  bool has_exclusion_slot() const { return exclusion_idx_ >= 0; }
  int exclusion_index() const { return exclusion_idx_; }

private:
  std::vector<TimeSlot> slots_;
  std::vector<std::string> pattern_names_;
  std::vector<std::vector<int>> pattern_groups_;
  std::vector<std::string> start_names_;
  std::vector<std::vector<int>> start_groups_;
  int exclusion_idx_ = -1;
};

} // namespace slotopt
