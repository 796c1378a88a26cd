#include "validation.h"
#include "errors.h"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace shift_roster
{
    namespace
    {
        [[noreturn]] void fail(const std::string &msg)
        {
            throw RosterViolation(msg);
        }

        bool works(const ShiftRoster &shift, int p)
        {
            return std::binary_search(shift.physicians.begin(), shift.physicians.end(), p);
        }

        std::string slot(int d, int s)
        {
            return "day " + std::to_string(d + 1) + " shift " + std::to_string(s + 1);
        }

        const ShiftRoster &shift_of(const DayRoster &day, int s)
        {
            if (s < 0 || s >= static_cast<int>(day.shifts.size()))
                fail("Day " + std::to_string(day.day + 1) + " has no shift " + std::to_string(s + 1));
            return day.shifts[s];
        }

        void require_known(int p, int num_physicians, int d, int s)
        {
            if (p < 0 || p >= num_physicians)
                fail("Unknown physician " + std::to_string(p) + " on " + slot(d, s));
        }

        std::vector<int> night_counts(const Roster &roster, int num_physicians, int night_shift)
        {
            std::vector<int> counts(num_physicians, 0);
            for (const auto &day : roster.days)
            {
                for (int p : shift_of(day, night_shift).physicians)
                {
                    require_known(p, num_physicians, day.day, night_shift);
                    counts[p] += 1;
                }
            }
            return counts;
        }

    } // namespace

    void validate_roster(const Roster &roster, const RosterConfig &cfg)
    {
        if (!roster.solution_found)
            return; // nothing to check

        validate_roster_shape(roster, cfg);
        validate_coverage(roster, make_shifts(cfg), cfg.coverage);
        validate_one_shift_per_day(roster, cfg.num_physicians);
        validate_inter_day_rest(roster, cfg.night_shift, cfg.morning_shift, cfg.rest_boundary);
        validate_equal_night_load(roster, cfg.num_physicians, cfg.night_shift);
        validate_seniority(roster, make_physicians(cfg), cfg.night_shift);
        validate_weekend_mirroring(roster, make_days(cfg));
    }

    void validate_roster_shape(const Roster &roster, const RosterConfig &cfg)
    {
        if (static_cast<int>(roster.days.size()) != cfg.num_days)
            fail("Roster has " + std::to_string(roster.days.size()) + " days, expected " +
                 std::to_string(cfg.num_days));
        for (std::size_t d = 0; d < roster.days.size(); ++d)
        {
            const auto &day = roster.days[d];
            if (day.day != static_cast<int>(d))
                fail("Roster days out of order at position " + std::to_string(d));
            if (static_cast<int>(day.shifts.size()) != cfg.num_shifts)
                fail("Day " + std::to_string(d + 1) + " has " + std::to_string(day.shifts.size()) +
                     " shifts, expected " + std::to_string(cfg.num_shifts));
            for (std::size_t s = 0; s < day.shifts.size(); ++s)
            {
                const auto &ps = day.shifts[s].physicians;
                if (day.shifts[s].shift != static_cast<int>(s))
                    fail("Shifts out of order on day " + std::to_string(d + 1));
                if (!std::is_sorted(ps.begin(), ps.end()) ||
                    std::adjacent_find(ps.begin(), ps.end()) != ps.end())
                    fail("Physicians not strictly ascending on " + slot(day.day, day.shifts[s].shift));
                for (int p : ps)
                    if (p < 0 || p >= cfg.num_physicians)
                        fail("Unknown physician " + std::to_string(p) + " on " + slot(day.day, day.shifts[s].shift));
            }
        }
    }

    void validate_coverage(const Roster &roster, const std::vector<Shift> &shifts, const CoverageRule &rule)
    {
        for (const auto &day : roster.days)
        {
            for (const auto &shift : shifts)
            {
                const int need = shift.peak ? std::max(rule.min_peak, rule.min_baseline) : rule.min_baseline;
                const int have = static_cast<int>(shift_of(day, shift.id).physicians.size());
                if (have < need)
                {
                    std::ostringstream oss;
                    oss << "Under-covered " << slot(day.day, shift.id) << " (" << role_name(shift.role)
                        << "): " << have << " < " << need;
                    fail(oss.str());
                }
            }
        }
    }

    void validate_one_shift_per_day(const Roster &roster, int num_physicians)
    {
        for (const auto &day : roster.days)
        {
            std::vector<int> load(num_physicians, 0);
            for (const auto &shift : day.shifts)
            {
                for (int p : shift.physicians)
                {
                    require_known(p, num_physicians, day.day, shift.shift);
                    if (++load[p] > 1)
                        fail("Physician P" + std::to_string(p + 1) + " works more than one shift on day " +
                             std::to_string(day.day + 1));
                }
            }
        }
    }

    void validate_inter_day_rest(const Roster &roster, int night_shift, int morning_shift, RestBoundary boundary)
    {
        if (night_shift == kNoShift)
            return;
        const int num_days = static_cast<int>(roster.days.size());
        const int last_checked = (boundary == RestBoundary::kWrapAround && num_days > 1) ? num_days : num_days - 1;
        for (int d = 0; d < last_checked; ++d)
        {
            const auto &night = shift_of(roster.days[d], night_shift);
            const auto &morning = shift_of(roster.days[(d + 1) % num_days], morning_shift);
            for (int p : night.physicians)
            {
                if (works(morning, p))
                    fail("Physician P" + std::to_string(p + 1) + " works the night of day " +
                         std::to_string(d + 1) + " and the following morning");
            }
        }
    }

    void validate_equal_night_load(const Roster &roster, int num_physicians, int night_shift)
    {
        if (night_shift == kNoShift || num_physicians < 1)
            return;
        const auto counts = night_counts(roster, num_physicians, night_shift);
        for (int p = 1; p < num_physicians; ++p)
        {
            if (counts[p] != counts[0])
                fail("Unequal night load: P1 has " + std::to_string(counts[0]) + ", P" + std::to_string(p + 1) +
                     " has " + std::to_string(counts[p]));
        }
    }

    void validate_seniority(const Roster &roster, const std::vector<Physician> &physicians, int night_shift)
    {
        if (night_shift == kNoShift)
            return;
        for (const auto &day : roster.days)
        {
            const auto &night = shift_of(day, night_shift);
            for (const auto &ph : physicians)
            {
                if (!ph.night_shift_eligible && works(night, ph.id))
                    fail("Senior physician P" + std::to_string(ph.id + 1) + " assigned the night of day " +
                         std::to_string(day.day + 1));
            }
        }
    }

    void validate_weekend_mirroring(const Roster &roster, const std::vector<Day> &days)
    {
        if (days.size() != roster.days.size())
            fail("Roster has " + std::to_string(roster.days.size()) + " days, calendar has " +
                 std::to_string(days.size()));
        for (const auto &day : days)
        {
            // each pair is checked once, from its earlier day
            if (!day.weekend_partner || *day.weekend_partner < day.id)
                continue;
            const int partner = *day.weekend_partner;
            if (partner >= static_cast<int>(days.size()))
                fail("Day " + std::to_string(day.id + 1) + " paired with day " + std::to_string(partner + 1) +
                     " outside the roster");
            const auto &a = roster.days[day.id];
            const auto &b = roster.days[partner];
            if (a.shifts.size() != b.shifts.size())
                fail("Weekend days " + std::to_string(day.id + 1) + " and " + std::to_string(partner + 1) +
                     " have different shift counts");
            for (std::size_t s = 0; s < a.shifts.size(); ++s)
            {
                if (a.shifts[s].physicians != b.shifts[s].physicians)
                    fail("Weekend days " + std::to_string(day.id + 1) + " and " + std::to_string(partner + 1) +
                         " differ on shift " + std::to_string(s + 1));
            }
        }
    }

} // namespace shift_roster
