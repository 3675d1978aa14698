// input_tables.h
#pragma once
#include <istream>
#include <string>
#include <vector>

#include "types.h"
#include "config.h"
#include "slot_catalog.h"

namespace slotopt {

// Comma separated cells per non-blank line; cells are trimmed and unquoted.
std::vector<std::vector<std::string>> read_csv_rows(std::istream& in);

// Columns: Name, Adjustment, Voting (Voting > 0 means eligible). Header row optional.
FacultyRoster parse_faculty(std::istream& in, const std::string& source);
// Columns: Course, Faculty. Header row optional.
CourseFacultyMap parse_courses(std::istream& in, const std::string& source);
// Columns: Course, then one rank per catalog slot. A header row may list the
// slot codes in any order; without one, columns follow catalog order.
PreferenceTable parse_preferences(std::istream& in, const SlotCatalog& catalog,
                                  const std::string& source);

FacultyRoster load_faculty_csv(const std::string& path);
CourseFacultyMap load_courses_csv(const std::string& path);
PreferenceTable load_preferences_csv(const std::string& path, const SlotCatalog& catalog);

// Hard errors throw MalformedInput; soft issues are reported on stderr.
// Returns the number of warnings emitted.
int validate_request(const ScheduleRequest& req, const SchedulerConfig& cfg);

} // namespace slotopt
