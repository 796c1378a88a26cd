// validation.h
#pragma once
#include "decoder.h"
#include "types.h"

#include <vector>

namespace shift_roster
{
    // Independent re-check of a decoded roster. Each validator throws
    // RosterViolation naming the first broken policy instance, including
    // rosters that reference shifts or physicians outside their bounds.

    void validate_roster(const Roster &roster, const RosterConfig &cfg);

    void validate_roster_shape(const Roster &roster, const RosterConfig &cfg);
    void validate_coverage(const Roster &roster, const std::vector<Shift> &shifts, const CoverageRule &rule);
    void validate_one_shift_per_day(const Roster &roster, int num_physicians);
    void validate_inter_day_rest(const Roster &roster, int night_shift, int morning_shift, RestBoundary boundary);
    void validate_equal_night_load(const Roster &roster, int num_physicians, int night_shift);
    void validate_seniority(const Roster &roster, const std::vector<Physician> &physicians, int night_shift);
    void validate_weekend_mirroring(const Roster &roster, const std::vector<Day> &days);

} // namespace shift_roster
