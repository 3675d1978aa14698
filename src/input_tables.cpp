#include "input_tables.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace slotopt
{

    namespace
    {
        [[noreturn]] void fail(const std::string &msg)
        {
            throw MalformedInput(msg);
        }

        std::string trim(const std::string &s)
        {
            std::size_t b = 0, e = s.size();
            while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
                ++b;
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
                --e;
            return s.substr(b, e - b);
        }

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string where(const std::string &source, std::size_t row)
        {
            return source + " row " + std::to_string(row + 1);
        }

        double parse_number(const std::string &cell, const std::string &ctx)
        {
            if (cell.empty())
                fail(ctx + ": empty value");
            std::size_t used = 0;
            double v = 0.0;
            try
            {
                v = std::stod(cell, &used);
            }
            catch (const std::exception &)
            {
                fail(ctx + ": '" + cell + "' is not a number");
            }
            if (used != cell.size() || !std::isfinite(v))
                fail(ctx + ": '" + cell + "' is not a number");
            return v;
        }

        // Spreadsheet exports write "2.0"; accept integral floats, blank = 0.
        int parse_rank(const std::string &cell, const std::string &ctx)
        {
            if (cell.empty())
                return 0;
            const double v = parse_number(cell, ctx);
            if (v != std::floor(v))
                fail(ctx + ": rank '" + cell + "' is not an integer");
            if (v < 0)
                fail(ctx + ": rank " + cell + " is negative");
            if (v > std::numeric_limits<int>::max())
                fail(ctx + ": rank '" + cell + "' is out of range");
            return static_cast<int>(v);
        }

        bool parse_flag(const std::string &cell, const std::string &ctx)
        {
            const std::string l = lower(cell);
            if (l == "true" || l == "yes" || l == "y")
                return true;
            if (l.empty() || l == "false" || l == "no" || l == "n")
                return false;
            return parse_number(cell, ctx) > 0;
        }

        // true if row 0 is a header whose first cell is `first_col`
        bool has_header(const std::vector<std::vector<std::string>> &rows, const std::string &first_col)
        {
            return !rows.empty() && !rows.front().empty() && lower(rows.front().front()) == lower(first_col);
        }

        std::ifstream open_or_fail(const std::string &path)
        {
            std::ifstream in(path);
            if (!in)
                fail("Cannot open file: " + path);
            return in;
        }
    } // namespace

    std::vector<std::vector<std::string>> read_csv_rows(std::istream &in)
    {
        std::vector<std::vector<std::string>> rows;
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (trim(line).empty())
                continue;

            std::vector<std::string> cells;
            std::string cur;
            bool quoted = false;
            for (std::size_t i = 0; i < line.size(); ++i)
            {
                const char ch = line[i];
                if (ch == '"')
                {
                    if (quoted && i + 1 < line.size() && line[i + 1] == '"')
                    {
                        cur.push_back('"');
                        ++i;
                    }
                    else
                    {
                        quoted = !quoted;
                    }
                }
                else if (ch == ',' && !quoted)
                {
                    cells.push_back(trim(cur));
                    cur.clear();
                }
                else
                {
                    cur.push_back(ch);
                }
            }
            cells.push_back(trim(cur));
            rows.push_back(std::move(cells));
        }
        return rows;
    }

    FacultyRoster parse_faculty(std::istream &in, const std::string &source)
    {
        const auto rows = read_csv_rows(in);
        FacultyRoster out;
        const std::size_t first = has_header(rows, "Name") ? 1 : 0;
        for (std::size_t r = first; r < rows.size(); ++r)
        {
            const auto &row = rows[r];
            const std::string ctx = where(source, r);
            if (row.size() != 3)
                fail(ctx + ": expected 3 columns (Name, Adjustment, Voting), got " + std::to_string(row.size()));
            FacultyMember f;
            f.name = row[0];
            if (f.name.empty())
                fail(ctx + ": missing faculty name");
            f.adjustment = row[1].empty() ? 0.0 : parse_number(row[1], ctx + " Adjustment");
            f.voting = parse_flag(row[2], ctx + " Voting");
            out.push_back(std::move(f));
        }
        return out;
    }

    CourseFacultyMap parse_courses(std::istream &in, const std::string &source)
    {
        const auto rows = read_csv_rows(in);
        CourseFacultyMap out;
        const std::size_t first = has_header(rows, "Course") ? 1 : 0;
        for (std::size_t r = first; r < rows.size(); ++r)
        {
            const auto &row = rows[r];
            const std::string ctx = where(source, r);
            if (row.size() != 2)
                fail(ctx + ": expected 2 columns (Course, Faculty), got " + std::to_string(row.size()));
            if (row[0].empty())
                fail(ctx + ": missing course id");
            out.push_back({row[0], row[1]});
        }
        return out;
    }

    PreferenceTable parse_preferences(std::istream &in, const SlotCatalog &catalog,
                                      const std::string &source)
    {
        const auto rows = read_csv_rows(in);
        const int n_slots = catalog.size();

        // column (1-based after Course) -> catalog index
        std::vector<int> column_slot(n_slots);
        for (int s = 0; s < n_slots; ++s)
            column_slot[s] = s;

        std::size_t first = 0;
        if (has_header(rows, "Course"))
        {
            const auto &hdr = rows.front();
            if (static_cast<int>(hdr.size()) != n_slots + 1)
                fail(source + " header: expected Course plus " + std::to_string(n_slots) +
                     " slot columns, got " + std::to_string(hdr.size()) + " columns");
            std::unordered_set<int> seen;
            for (int col = 0; col < n_slots; ++col)
            {
                const int idx = catalog.index_of(hdr[col + 1]);
                if (idx < 0)
                    fail(source + " header: unknown slot code '" + hdr[col + 1] + "'");
                if (!seen.insert(idx).second)
                    fail(source + " header: slot code '" + hdr[col + 1] + "' repeated");
                column_slot[col] = idx;
            }
            first = 1;
        }

        PreferenceTable out;
        for (std::size_t r = first; r < rows.size(); ++r)
        {
            const auto &row = rows[r];
            const std::string ctx = where(source, r);
            if (static_cast<int>(row.size()) != n_slots + 1)
                fail(ctx + ": expected " + std::to_string(n_slots + 1) + " columns, got " +
                     std::to_string(row.size()));
            PreferenceRow p;
            p.course = row[0];
            if (p.course.empty())
                fail(ctx + ": missing course id");
            p.ranks.assign(n_slots, 0);
            for (int col = 0; col < n_slots; ++col)
                p.ranks[column_slot[col]] = parse_rank(row[col + 1], ctx + " column " + std::to_string(col + 2));
            out.push_back(std::move(p));
        }
        return out;
    }

    FacultyRoster load_faculty_csv(const std::string &path)
    {
        auto in = open_or_fail(path);
        return parse_faculty(in, path);
    }

    CourseFacultyMap load_courses_csv(const std::string &path)
    {
        auto in = open_or_fail(path);
        return parse_courses(in, path);
    }

    PreferenceTable load_preferences_csv(const std::string &path, const SlotCatalog &catalog)
    {
        auto in = open_or_fail(path);
        return parse_preferences(in, catalog, path);
    }

    int validate_request(const ScheduleRequest &req, const SchedulerConfig &cfg)
    {
        const int n_slots = cfg.catalog.size();
        int warnings = 0;

        std::unordered_set<std::string> seen;
        int above_scale = 0;
        for (std::size_t i = 0; i < req.preferences.size(); ++i)
        {
            const auto &p = req.preferences[i];
            if (p.course.empty())
                fail("Preference row " + std::to_string(i + 1) + " has no course id.");
            if (!seen.insert(p.course).second)
                fail("Duplicate course in preferences: " + p.course);
            if (static_cast<int>(p.ranks.size()) != n_slots)
                fail("Course " + p.course + " ranks " + std::to_string(p.ranks.size()) +
                     " slots, catalog has " + std::to_string(n_slots));
            for (int r : p.ranks)
            {
                if (r < 0)
                    fail("Course " + p.course + " has a negative rank.");
                if (r > cfg.max_rank)
                    ++above_scale;
            }
        }
        if (above_scale > 0)
        {
            std::cerr << "⚠️  " << above_scale << " ranks exceed MAX_RANK=" << cfg.max_rank
                      << "; they score at most the noise term.\n";
            ++warnings;
        }

        std::unordered_map<std::string, std::string> faculty_of;
        for (const auto &cf : req.courses)
        {
            if (!faculty_of.emplace(cf.course, cf.faculty).second)
                fail("Course " + cf.course + " is mapped to faculty twice.");
        }

        std::unordered_set<std::string> roster;
        for (const auto &f : req.faculty)
        {
            if (!roster.insert(f.name).second)
                fail("Duplicate faculty name: " + f.name);
        }

        int unmapped = 0;
        int unknown_faculty = 0;
        for (const auto &p : req.preferences)
        {
            auto it = faculty_of.find(p.course);
            if (it == faculty_of.end())
                ++unmapped;
            else if (!roster.count(it->second))
                ++unknown_faculty;
        }
        if (unmapped > 0)
        {
            std::cerr << "⚠️  " << unmapped << " courses have no faculty mapping; treated as non-voting.\n";
            ++warnings;
        }
        if (unknown_faculty > 0)
        {
            std::cerr << "⚠️  " << unknown_faculty << " courses name faculty missing from the roster; treated as non-voting.\n";
            ++warnings;
        }
        return warnings;
    }

} // namespace slotopt
