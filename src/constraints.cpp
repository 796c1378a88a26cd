#include "constraints.h"
#include "errors.h"

#include <string>
#include <utility>
#include <vector>

namespace shift_roster
{
    const char *const kCoverageTag = "coverage";
    const char *const kOneShiftPerDayTag = "one_shift_per_day";
    const char *const kRestTag = "rest";
    const char *const kNightFairnessTag = "night_fairness";
    const char *const kSeniorityTag = "seniority";
    const char *const kWeekendTag = "weekend";

    namespace
    {
        bool has_night(int night_shift) { return night_shift != kNoShift; }

        void require_night(const AssignmentGrid &grid, int night_shift, const std::string &what)
        {
            if (has_night(night_shift))
                grid.require_shift(night_shift, what);
        }

        bool is_peak(const CoverageRule &rule, int s)
        {
            for (int p : rule.peak_shifts)
                if (p == s)
                    return true;
            return false;
        }

    } // namespace

    int add_shift_coverage(ConstraintModel &model, const AssignmentGrid &grid, const CoverageRule &rule)
    {
        if (rule.min_baseline < 0)
            throw ConfigError("coverage: baseline minimum must be >= 0, got " + std::to_string(rule.min_baseline));
        if (rule.min_peak < 0)
            throw ConfigError("coverage: peak minimum must be >= 0, got " + std::to_string(rule.min_peak));
        for (int s : rule.peak_shifts)
            grid.require_shift(s, "coverage peak shift");

        int added = 0;
        for (int d = 0; d < grid.num_days(); ++d)
        {
            for (int s = 0; s < grid.num_shifts(); ++s)
            {
                model.add_greater_or_equal(grid.shift_headcount(d, s), rule.min_baseline, kCoverageTag);
                ++added;
            }
            for (int s : rule.peak_shifts)
            {
                model.add_greater_or_equal(grid.shift_headcount(d, s), rule.min_peak, kCoverageTag);
                ++added;
            }
        }
        return added;
    }

    int add_one_shift_per_day(ConstraintModel &model, const AssignmentGrid &grid)
    {
        int added = 0;
        for (int p = 0; p < grid.num_physicians(); ++p)
        {
            for (int d = 0; d < grid.num_days(); ++d)
            {
                model.add_less_or_equal(grid.daily_load(p, d), 1, kOneShiftPerDayTag);
                ++added;
            }
        }
        return added;
    }

    int add_inter_day_rest(ConstraintModel &model, const AssignmentGrid &grid,
                           int night_shift, int morning_shift, RestBoundary boundary)
    {
        require_night(grid, night_shift, "rest night shift");
        grid.require_shift(morning_shift, "rest morning shift");
        if (!has_night(night_shift))
            return 0;

        const int num_days = grid.num_days();
        // With a single day the wrapped successor is the same day, already
        // handled by the one-shift-per-day rule.
        const int last_checked = (boundary == RestBoundary::kWrapAround && num_days > 1)
                                     ? num_days
                                     : grid.last_day_index();

        int added = 0;
        for (int p = 0; p < grid.num_physicians(); ++p)
        {
            for (int d = 0; d < last_checked; ++d)
            {
                const int next = (d + 1) % num_days;
                LinearExpr e;
                e.add_term(grid.at(p, d, night_shift)).add_term(grid.at(p, next, morning_shift));
                model.add_less_or_equal(std::move(e), 1, kRestTag);
                ++added;
            }
        }
        return added;
    }

    int add_equal_night_load(ConstraintModel &model, const AssignmentGrid &grid,
                             int night_shift, FairnessEncoding encoding)
    {
        require_night(grid, night_shift, "night fairness");
        if (!has_night(night_shift))
            return 0;

        std::vector<LinearExpr> nights;
        nights.reserve(grid.num_physicians());
        for (int p = 0; p < grid.num_physicians(); ++p)
            nights.push_back(grid.night_shift_count(p, night_shift));

        int added = 0;
        const int n = grid.num_physicians();
        if (encoding == FairnessEncoding::kChain)
        {
            for (int p = 0; p + 1 < n; ++p)
            {
                model.add_equality(nights[p], nights[p + 1], kNightFairnessTag);
                ++added;
            }
            return added;
        }

        for (int p1 = 0; p1 < n; ++p1)
        {
            for (int p2 = p1 + 1; p2 < n; ++p2)
            {
                model.add_equality(nights[p1], nights[p2], kNightFairnessTag);
                ++added;
            }
        }
        return added;
    }

    int add_seniority_exclusion(ConstraintModel &model, const AssignmentGrid &grid,
                                const std::vector<Physician> &physicians, int night_shift)
    {
        require_night(grid, night_shift, "seniority night shift");
        for (const auto &ph : physicians)
            grid.require_physician(ph.id, "seniority");
        if (!has_night(night_shift))
            return 0;

        int added = 0;
        for (int d = 0; d < grid.num_days(); ++d)
        {
            for (const auto &ph : physicians)
            {
                if (ph.night_shift_eligible)
                    continue;
                model.add_equality(LinearExpr::var(grid.at(ph.id, d, night_shift)), 0, kSeniorityTag);
                ++added;
            }
        }
        return added;
    }

    int add_weekend_mirroring(ConstraintModel &model, const AssignmentGrid &grid,
                              const std::vector<WeekendPair> &pairs)
    {
        for (const auto &wp : pairs)
        {
            if (wp.first < 0 || wp.second < 0)
                throw ConfigError("weekend pair has a negative day index (" + std::to_string(wp.first) +
                                  ", " + std::to_string(wp.second) + ")");
            if (wp.first == wp.second)
                throw ConfigError("weekend pair must name two different days, got " + std::to_string(wp.first));
            if (grid.has_day(wp.first) != grid.has_day(wp.second))
                throw ConfigError("weekend pair (" + std::to_string(wp.first) + ", " + std::to_string(wp.second) +
                                  ") straddles the horizon of " + std::to_string(grid.num_days()) + " days");
        }

        int added = 0;
        for (const auto &wp : pairs)
        {
            // A weekend that is not part of the horizon imposes nothing.
            if (!grid.has_day(wp.first))
                continue;
            for (int p = 0; p < grid.num_physicians(); ++p)
            {
                for (int s = 0; s < grid.num_shifts(); ++s)
                {
                    model.add_equality(LinearExpr::var(grid.at(p, wp.first, s)),
                                       LinearExpr::var(grid.at(p, wp.second, s)), kWeekendTag);
                    ++added;
                }
            }
        }
        return added;
    }

    int add_all_policies(ConstraintModel &model, const AssignmentGrid &grid, const RosterConfig &cfg)
    {
        int added = 0;
        added += add_shift_coverage(model, grid, cfg.coverage);
        added += add_one_shift_per_day(model, grid);
        added += add_inter_day_rest(model, grid, cfg.night_shift, cfg.morning_shift, cfg.rest_boundary);
        added += add_equal_night_load(model, grid, cfg.night_shift, cfg.fairness_encoding);
        added += add_seniority_exclusion(model, grid, make_physicians(cfg), cfg.night_shift);
        added += add_weekend_mirroring(model, grid, cfg.weekend_pairs);
        return added;
    }

} // namespace shift_roster
