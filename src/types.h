// types.h
#pragma once
#include <vector>
#include <string>
#include <optional>

namespace shift_roster
{
    // Sentinel for "no such shift" (e.g. a roster with fewer than three shifts has no night).
    constexpr int kNoShift = -1;

    enum class ShiftRole
    {
        kMorning,
        kDay,
        kNight
    };

    struct Physician
    {
        int id = 0;
        bool night_shift_eligible = true; // false for senior physicians
    };

    struct Day
    {
        int id = 0;
        std::optional<int> weekend_partner; // the other day of a weekend pair, if any
    };

    struct Shift
    {
        int id = 0;
        ShiftRole role = ShiftRole::kDay;
        bool peak = false;
    };

    // Saturday/Sunday style pair whose assignments must be identical.
    struct WeekendPair
    {
        int first = 5;
        int second = 6;
    };

    struct CoverageRule
    {
        std::vector<int> peak_shifts{0, 1};
        int min_peak = 2;     // per peak shift and day
        int min_baseline = 1; // per shift and day
    };

    // kReference never checks the (last day -> day 0) pair; kWrapAround does.
    enum class RestBoundary
    {
        kReference,
        kWrapAround
    };

    // kPairwise posts one equality per physician pair, kChain only (p, p+1).
    enum class FairnessEncoding
    {
        kPairwise,
        kChain
    };

    struct RosterConfig
    {
        int num_physicians = 10;
        int num_shifts = 3;
        int num_days = 7;
        std::vector<int> senior_physicians{8, 9}; // excluded from night shifts
        int night_shift = 2;                      // kNoShift disables night rules
        int morning_shift = 0;
        CoverageRule coverage;
        std::vector<WeekendPair> weekend_pairs{WeekendPair{}};
        RestBoundary rest_boundary = RestBoundary::kReference;
        FairnessEncoding fairness_encoding = FairnessEncoding::kPairwise;
    };

    const char *role_name(ShiftRole role);

    // Materialize the configured roster as domain entities.
    std::vector<Physician> make_physicians(const RosterConfig &cfg);
    std::vector<Day> make_days(const RosterConfig &cfg);
    std::vector<Shift> make_shifts(const RosterConfig &cfg);

} // namespace shift_roster
