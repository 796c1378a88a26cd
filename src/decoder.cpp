#include "decoder.h"

#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace shift_roster
{
    Roster decode_roster(const SolveResult &result, const AssignmentGrid &grid, int night_shift)
    {
        Roster out;
        if (!result.feasible())
            return out;

        out.solution_found = true;
        out.loads.resize(grid.num_physicians());
        for (int p = 0; p < grid.num_physicians(); ++p)
            out.loads[p].physician = p;

        out.days.reserve(grid.num_days());
        for (int d = 0; d < grid.num_days(); ++d)
        {
            DayRoster day;
            day.day = d;
            day.shifts.reserve(grid.num_shifts());
            for (int s = 0; s < grid.num_shifts(); ++s)
            {
                ShiftRoster shift;
                shift.shift = s;
                for (int p = 0; p < grid.num_physicians(); ++p)
                {
                    if (!result.bool_value(grid.at(p, d, s)))
                        continue;
                    shift.physicians.push_back(p);
                    out.loads[p].total_shifts += 1;
                    if (s == night_shift)
                        out.loads[p].night_shifts += 1;
                }
                day.shifts.push_back(std::move(shift));
            }
            out.days.push_back(std::move(day));
        }
        return out;
    }

    StatsSummary summarize_stats(const SolveResult &result)
    {
        StatsSummary s;
        s.status = status_name(result.status());
        s.conflicts = result.stats().conflicts;
        s.branches = result.stats().branches;
        s.wall_time_seconds = result.stats().wall_time_seconds;
        s.objective = result.feasible() ? result.objective_value() : 0.0;
        return s;
    }

    std::string format_report(const Roster &roster, const StatsSummary &stats)
    {
        std::ostringstream out;
        if (roster.solution_found)
        {
            out << "Solution found:\n";
            for (const auto &day : roster.days)
            {
                out << "Day " << (day.day + 1) << ":\n";
                for (const auto &shift : day.shifts)
                {
                    out << "  Shift " << (shift.shift + 1) << ":";
                    for (int p : shift.physicians)
                        out << " P" << (p + 1);
                    out << "\n";
                }
                out << "\n";
            }
        }
        else
        {
            out << "No solution found.\n";
        }

        out << "\nStatistics\n";
        out << "  - Status    : " << stats.status << "\n";
        out << "  - Conflicts : " << stats.conflicts << "\n";
        out << "  - Branches  : " << stats.branches << "\n";
        out << "  - Wall time : " << stats.wall_time_seconds << " s\n";
        return out.str();
    }

    json report_to_json(const Roster &roster, const StatsSummary &stats)
    {
        json out;
        out["solution_found"] = roster.solution_found;
        if (!roster.solution_found)
            out["error"] = "No solution found";

        json days = json::array();
        for (const auto &day : roster.days)
        {
            json shifts = json::array();
            for (const auto &shift : day.shifts)
                shifts.push_back({{"shift", shift.shift}, {"physicians", shift.physicians}});
            days.push_back({{"day", day.day}, {"shifts", std::move(shifts)}});
        }

        json loads = json::array();
        for (const auto &l : roster.loads)
        {
            loads.push_back({{"physician", l.physician},
                             {"total_shifts", l.total_shifts},
                             {"night_shifts", l.night_shifts}});
        }

        out["days"] = std::move(days);
        out["loads"] = std::move(loads);
        out["statistics"] = {{"status", stats.status},
                             {"conflicts", stats.conflicts},
                             {"branches", stats.branches},
                             {"wall_time_seconds", stats.wall_time_seconds},
                             {"objective", stats.objective}};
        return out;
    }

} // namespace shift_roster
