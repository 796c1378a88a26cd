#include "config.h"
#include "errors.h"

#include <algorithm>
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace shift_roster
{
    namespace
    {
        [[noreturn]] void fail(const std::string &msg)
        {
            throw ConfigError(msg);
        }

        std::vector<int> int_list(const json &j, const char *key)
        {
            const json &v = j.at(key);
            if (!v.is_array())
                fail(std::string(key) + " must be an array of integers.");
            std::vector<int> out;
            out.reserve(v.size());
            for (const auto &x : v)
            {
                if (!x.is_number_integer())
                    fail(std::string(key) + " must contain only integers.");
                out.push_back(x.get<int>());
            }
            return out;
        }

        std::vector<WeekendPair> weekend_pairs(const json &v)
        {
            if (!v.is_array())
                fail("WEEKEND_PAIRS must be an array of [day, day] pairs.");
            std::vector<WeekendPair> out;
            for (const auto &pair : v)
            {
                if (!pair.is_array() || pair.size() != 2 || !pair[0].is_number_integer() ||
                    !pair[1].is_number_integer())
                    fail("WEEKEND_PAIRS entries must be [day, day] integer pairs.");
                out.push_back({pair[0].get<int>(), pair[1].get<int>()});
            }
            return out;
        }

        FairnessEncoding parse_encoding(const std::string &s)
        {
            if (s == "pairwise")
                return FairnessEncoding::kPairwise;
            if (s == "chain")
                return FairnessEncoding::kChain;
            fail("FAIRNESS_ENCODING must be \"pairwise\" or \"chain\", got \"" + s + "\"");
        }

        RosterConfig parse_roster(const json &j)
        {
            if (!j.is_object())
                fail("Roster configuration must be a JSON object.");

            RosterConfig cfg = make_roster_config(j.value("NUM_PHYSICIANS", 10),
                                                  j.value("NUM_SHIFTS", 3),
                                                  j.value("NUM_DAYS", 7));

            if (j.contains("SENIOR_PHYSICIANS"))
                cfg.senior_physicians = int_list(j, "SENIOR_PHYSICIANS");
            if (j.contains("PEAK_SHIFTS"))
                cfg.coverage.peak_shifts = int_list(j, "PEAK_SHIFTS");
            if (j.contains("NIGHT_SHIFT"))
                cfg.night_shift = j["NIGHT_SHIFT"].is_null() ? kNoShift : j["NIGHT_SHIFT"].get<int>();
            if (j.contains("WEEKEND_PAIRS"))
                cfg.weekend_pairs = weekend_pairs(j["WEEKEND_PAIRS"]);

            cfg.morning_shift = j.value("MORNING_SHIFT", cfg.morning_shift);
            cfg.coverage.min_peak = j.value("MIN_PEAK_COVERAGE", cfg.coverage.min_peak);
            cfg.coverage.min_baseline = j.value("MIN_BASELINE_COVERAGE", cfg.coverage.min_baseline);
            cfg.rest_boundary = j.value("REST_WRAPS_WEEK", false) ? RestBoundary::kWrapAround
                                                                  : RestBoundary::kReference;
            cfg.fairness_encoding = parse_encoding(j.value("FAIRNESS_ENCODING", std::string("pairwise")));

            validate_config(cfg);
            return cfg;
        }

        SchedulerConfig parse_scheduler(const json &j)
        {
            SchedulerConfig c;
            c.roster = parse_roster(j);
            c.solve.time_limit_seconds = j.value("TIME_LIMIT_SECONDS", 0.0);
            c.solve.num_workers = j.value("NUM_WORKERS", 8);
            c.solve.random_seed = j.value("RANDOM_SEED", 0);
            c.solve.log_search = j.value("LOG_SEARCH", false);
            c.verbose = j.value("VERBOSE", false);
            c.validate_solution = j.value("VALIDATE_SOLUTION", true);

            if (c.solve.time_limit_seconds < 0)
                fail("TIME_LIMIT_SECONDS must be >= 0.");
            if (c.solve.num_workers < 0)
                fail("NUM_WORKERS must be >= 0.");
            return c;
        }

    } // namespace

    RosterConfig make_roster_config(int physicians, int shifts, int days)
    {
        RosterConfig cfg;
        cfg.num_physicians = physicians;
        cfg.num_shifts = shifts;
        cfg.num_days = days;

        cfg.senior_physicians.clear();
        for (int p = std::max(0, physicians - 2); p < physicians; ++p)
            cfg.senior_physicians.push_back(p);

        cfg.coverage.peak_shifts.clear();
        for (int s : {0, 1})
            if (s < shifts)
                cfg.coverage.peak_shifts.push_back(s);

        cfg.night_shift = (shifts > 2) ? 2 : kNoShift;
        return cfg;
    }

    void validate_config(const RosterConfig &cfg)
    {
        if (cfg.num_physicians <= 0)
            fail("NUM_PHYSICIANS must be positive, got " + std::to_string(cfg.num_physicians));
        if (cfg.num_shifts <= 0)
            fail("NUM_SHIFTS must be positive, got " + std::to_string(cfg.num_shifts));
        if (cfg.num_days <= 0)
            fail("NUM_DAYS must be positive, got " + std::to_string(cfg.num_days));

        std::set<int> seen;
        for (int p : cfg.senior_physicians)
        {
            if (p < 0 || p >= cfg.num_physicians)
                fail("Senior physician index " + std::to_string(p) + " out of range [0, " +
                     std::to_string(cfg.num_physicians) + ")");
            if (!seen.insert(p).second)
                fail("Senior physician index " + std::to_string(p) + " listed twice.");
        }

        for (int s : cfg.coverage.peak_shifts)
        {
            if (s < 0 || s >= cfg.num_shifts)
                fail("Peak shift index " + std::to_string(s) + " out of range [0, " +
                     std::to_string(cfg.num_shifts) + ")");
        }
        if (cfg.coverage.min_peak < 0)
            fail("MIN_PEAK_COVERAGE must be >= 0, got " + std::to_string(cfg.coverage.min_peak));
        if (cfg.coverage.min_baseline < 0)
            fail("MIN_BASELINE_COVERAGE must be >= 0, got " + std::to_string(cfg.coverage.min_baseline));

        if (cfg.night_shift != kNoShift && (cfg.night_shift < 0 || cfg.night_shift >= cfg.num_shifts))
            fail("NIGHT_SHIFT index " + std::to_string(cfg.night_shift) + " out of range.");
        if (cfg.morning_shift < 0 || cfg.morning_shift >= cfg.num_shifts)
            fail("MORNING_SHIFT index " + std::to_string(cfg.morning_shift) + " out of range.");
        if (cfg.night_shift != kNoShift && cfg.night_shift == cfg.morning_shift)
            fail("NIGHT_SHIFT and MORNING_SHIFT must differ.");

        std::set<int> paired;
        for (const auto &wp : cfg.weekend_pairs)
        {
            if (wp.first < 0 || wp.second < 0)
                fail("WEEKEND_PAIRS entries must be non-negative day indices.");
            if (wp.first == wp.second)
                fail("WEEKEND_PAIRS entries must name two different days.");
            const bool first_in = wp.first < cfg.num_days, second_in = wp.second < cfg.num_days;
            if (first_in != second_in)
                fail("WEEKEND_PAIRS entry [" + std::to_string(wp.first) + ", " + std::to_string(wp.second) +
                     "] has one day outside NUM_DAYS=" + std::to_string(cfg.num_days));
            if (!first_in)
                continue;
            // a day has at most one weekend partner
            if (!paired.insert(wp.first).second || !paired.insert(wp.second).second)
                fail("WEEKEND_PAIRS entry [" + std::to_string(wp.first) + ", " + std::to_string(wp.second) +
                     "] reuses a day that is already paired.");
        }
    }

    RosterConfig load_roster_config(const json &j)
    {
        try
        {
            return parse_roster(j);
        }
        catch (const json::exception &e)
        {
            fail(std::string("Malformed roster configuration: ") + e.what());
        }
    }

    SchedulerConfig load_scheduler_config(const json &j)
    {
        try
        {
            return parse_scheduler(j);
        }
        catch (const json::exception &e)
        {
            fail(std::string("Malformed scheduler configuration: ") + e.what());
        }
    }

    SchedulerConfig load_scheduler_config_file(const std::string &path)
    {
        std::ifstream in(path);
        if (!in)
            fail("Cannot open config file: " + path);
        json j;
        try
        {
            in >> j;
        }
        catch (const json::parse_error &e)
        {
            fail("Cannot parse config file " + path + ": " + e.what());
        }
        return load_scheduler_config(j);
    }

} // namespace shift_roster
