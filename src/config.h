// config.h
#pragma once
#include "solver.h"
#include "types.h"

#include <string>
#include <nlohmann/json.hpp>

namespace shift_roster
{
    struct SchedulerConfig
    {
        RosterConfig roster;
        SolveOptions solve;
        bool verbose = false;
        bool validate_solution = true; // re-check decoded rosters against every policy
    };

    // Defaults derived from the counts: the last two physicians are senior,
    // shifts 0 and 1 are peak, shift 2 is the night shift when it exists.
    RosterConfig make_roster_config(int physicians, int shifts, int days);

    // Throws ConfigError on non-positive counts or out-of-range indices.
    void validate_config(const RosterConfig &cfg);

    // Uppercase keys (NUM_PHYSICIANS, PEAK_SHIFTS, ...); missing keys keep their defaults.
    RosterConfig load_roster_config(const nlohmann::json &j);
    SchedulerConfig load_scheduler_config(const nlohmann::json &j);
    SchedulerConfig load_scheduler_config_file(const std::string &path);

} // namespace shift_roster
