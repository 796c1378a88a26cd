#include "types.h"
#include "errors.h"

#include <algorithm>
#include <string>

namespace shift_roster
{
    const char *role_name(ShiftRole role)
    {
        switch (role)
        {
        case ShiftRole::kMorning:
            return "morning";
        case ShiftRole::kDay:
            return "day";
        case ShiftRole::kNight:
            return "night";
        }
        return "unknown";
    }

    std::vector<Physician> make_physicians(const RosterConfig &cfg)
    {
        std::vector<Physician> out;
        out.reserve(std::max(0, cfg.num_physicians));
        for (int p = 0; p < cfg.num_physicians; ++p)
        {
            const bool senior = std::find(cfg.senior_physicians.begin(), cfg.senior_physicians.end(), p) !=
                                cfg.senior_physicians.end();
            out.push_back({p, !senior});
        }
        return out;
    }

    std::vector<Day> make_days(const RosterConfig &cfg)
    {
        std::vector<Day> out;
        out.reserve(std::max(0, cfg.num_days));
        for (int d = 0; d < cfg.num_days; ++d)
            out.push_back({d, std::nullopt});

        for (const auto &wp : cfg.weekend_pairs)
        {
            const bool first_in = wp.first >= 0 && wp.first < cfg.num_days;
            const bool second_in = wp.second >= 0 && wp.second < cfg.num_days;
            // pairs outside the horizon leave both days unpaired
            if (!first_in && !second_in)
                continue;
            if (first_in != second_in || wp.first == wp.second)
                throw ConfigError("Weekend pair (" + std::to_string(wp.first) + ", " + std::to_string(wp.second) +
                                  ") does not name two days of a " + std::to_string(cfg.num_days) + "-day horizon");
            if (out[wp.first].weekend_partner || out[wp.second].weekend_partner)
                throw ConfigError("Day " + std::to_string(wp.first) + " or " + std::to_string(wp.second) +
                                  " already has a weekend partner");
            out[wp.first].weekend_partner = wp.second;
            out[wp.second].weekend_partner = wp.first;
        }
        return out;
    }

    std::vector<Shift> make_shifts(const RosterConfig &cfg)
    {
        std::vector<Shift> out;
        out.reserve(std::max(0, cfg.num_shifts));
        const auto &peaks = cfg.coverage.peak_shifts;
        for (int s = 0; s < cfg.num_shifts; ++s)
        {
            Shift sh;
            sh.id = s;
            if (s == cfg.night_shift)
                sh.role = ShiftRole::kNight;
            else if (s == cfg.morning_shift)
                sh.role = ShiftRole::kMorning;
            else
                sh.role = ShiftRole::kDay;
            sh.peak = std::find(peaks.begin(), peaks.end(), s) != peaks.end();
            out.push_back(sh);
        }
        return out;
    }

} // namespace shift_roster
