// constraints.h
#pragma once
#include "grid.h"
#include "model.h"
#include "types.h"

#include <vector>

namespace shift_roster
{
    // Tags attached to every constraint, one per policy family.
    extern const char *const kCoverageTag;
    extern const char *const kOneShiftPerDayTag;
    extern const char *const kRestTag;
    extern const char *const kNightFairnessTag;
    extern const char *const kSeniorityTag;
    extern const char *const kWeekendTag;

    // Every function validates its indices against the grid first (ConfigError),
    // then appends constraints to `model`. Each returns the number of constraints added.

    // sum_p x(p,d,s) >= min_baseline for every (d, s); >= min_peak on peak shifts.
    int add_shift_coverage(ConstraintModel &model, const AssignmentGrid &grid, const CoverageRule &rule);

    // sum_s x(p,d,s) <= 1.
    int add_one_shift_per_day(ConstraintModel &model, const AssignmentGrid &grid);

    // x(p,d,night) + x(p,(d+1) mod D,morning) <= 1 for d < last_day_index.
    // kWrapAround additionally covers (last day -> day 0).
    int add_inter_day_rest(ConstraintModel &model, const AssignmentGrid &grid,
                           int night_shift, int morning_shift,
                           RestBoundary boundary = RestBoundary::kReference);

    // night_shift_count(p1) == night_shift_count(p2).
    int add_equal_night_load(ConstraintModel &model, const AssignmentGrid &grid,
                             int night_shift,
                             FairnessEncoding encoding = FairnessEncoding::kPairwise);

    // x(p,d,night) == 0 for physicians that are not night_shift_eligible.
    int add_seniority_exclusion(ConstraintModel &model, const AssignmentGrid &grid,
                                const std::vector<Physician> &physicians, int night_shift);

    // x(p,a,s) == x(p,b,s) for every pair (a, b) inside the horizon.
    int add_weekend_mirroring(ConstraintModel &model, const AssignmentGrid &grid,
                              const std::vector<WeekendPair> &pairs);

    // Whole catalog in the order above.
    int add_all_policies(ConstraintModel &model, const AssignmentGrid &grid, const RosterConfig &cfg);

} // namespace shift_roster
