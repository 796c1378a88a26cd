// test_utils.h
#pragma once
#include "decoder.h"
#include "errors.h"
#include "grid.h"
#include "model.h"
#include "solver.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace shift_roster
{
    namespace testing_utils
    {
        // Backend that never searches: it hands back a fixed status and
        // whatever values `fill` writes for the model's variables.
        class FakeSolver : public SolverBackend
        {
        public:
            using Fill = std::function<void(const ConstraintModel &, std::vector<int64_t> &)>;

            FakeSolver(SolveStatus status, Fill fill = nullptr) : status_(status), fill_(std::move(fill)) {}

            std::string name() const override { return "fake"; }

            SolveResult solve(const ConstraintModel &model, const SolveOptions &) override
            {
                ++calls;
                if (fault)
                    throw SolverFault("fake engine out of memory");
                std::vector<int64_t> values;
                if (has_solution(status_))
                {
                    values.assign(model.num_vars(), 0);
                    if (fill_)
                        fill_(model, values);
                }
                SolveStats stats;
                stats.conflicts = 3;
                stats.branches = 17;
                stats.wall_time_seconds = 0.25;
                return SolveResult(status_, std::move(values), 0.0, stats);
            }

            int calls = 0;
            bool fault = false;

        private:
            SolveStatus status_;
            Fill fill_;
        };

        inline bool satisfies(const LinearConstraint &c, const std::vector<int64_t> &values)
        {
            const int64_t v = c.expr.evaluate([&](VarId id) { return values[id]; });
            return c.lo <= v && v <= c.hi;
        }

        // Number of linear constraints violated by a full assignment.
        inline int count_violations(const ConstraintModel &model, const std::vector<int64_t> &values)
        {
            int bad = 0;
            for (const auto &c : model.linear_constraints())
                if (!satisfies(c, values))
                    ++bad;
            return bad;
        }

        // Sets x(p, d, s) = 1 in a value vector addressed by grid variable ids.
        inline void assign(const AssignmentGrid &grid, std::vector<int64_t> &values, int p, int d, int s)
        {
            values[grid.at(p, d, s)] = 1;
        }

        inline Roster make_roster(const std::vector<std::vector<std::vector<int>>> &days)
        {
            Roster r;
            r.solution_found = true;
            for (std::size_t d = 0; d < days.size(); ++d)
            {
                DayRoster day;
                day.day = static_cast<int>(d);
                for (std::size_t s = 0; s < days[d].size(); ++s)
                    day.shifts.push_back({static_cast<int>(s), days[d][s]});
                r.days.push_back(std::move(day));
            }
            return r;
        }

    } // namespace testing_utils
} // namespace shift_roster
