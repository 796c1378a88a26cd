// decoder.h
#pragma once
#include "grid.h"
#include "solver.h"

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace shift_roster
{
    struct ShiftRoster
    {
        int shift = 0;
        std::vector<int> physicians; // ascending ids
    };

    struct DayRoster
    {
        int day = 0;
        std::vector<ShiftRoster> shifts; // ascending shift ids
    };

    struct PhysicianLoad
    {
        int physician = 0;
        int total_shifts = 0;
        int night_shifts = 0;
    };

    struct Roster
    {
        bool solution_found = false;
        std::vector<DayRoster> days;      // empty when no solution was found
        std::vector<PhysicianLoad> loads; // recomputed from the decoded values
    };

    struct StatsSummary
    {
        std::string status;
        int64_t conflicts = 0;
        int64_t branches = 0;
        double wall_time_seconds = 0.0;
        double objective = 0.0;
    };

    // Reads grid values only when the result carries a solution.
    Roster decode_roster(const SolveResult &result, const AssignmentGrid &grid, int night_shift);

    StatsSummary summarize_stats(const SolveResult &result);

    // Day/shift numbers and physician ids are shown 1-indexed ("P3").
    std::string format_report(const Roster &roster, const StatsSummary &stats);

    nlohmann::json report_to_json(const Roster &roster, const StatsSummary &stats);

} // namespace shift_roster
