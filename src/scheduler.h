// scheduler.h
#pragma once
#include "config.h"
#include "decoder.h"
#include "solver.h"

#include <cstddef>
#include <string>

namespace shift_roster
{
    struct ScheduleOutcome
    {
        SolveStatus status = SolveStatus::kUnknown;
        Roster roster;
        StatsSummary stats;
        std::string report;
        std::size_t num_vars = 0;
        std::size_t num_constraints = 0;
    };

    // One scheduling run: grid, policies, objective, solve, decode.
    // Every call builds its own model, so one Scheduler may serve concurrent
    // callers as long as the backend allows it.
    class Scheduler
    {
    public:
        explicit Scheduler(SolverBackend &backend) : backend_(backend) {}

        // Throws ConfigError before solving, SolverFault if the engine fails,
        // RosterViolation if validation is on and the decoded roster breaks a policy.
        ScheduleOutcome run(const SchedulerConfig &cfg) const;

    private:
        SolverBackend &backend_;
    };

    // Convenience entry point backed by CP-SAT.
    ScheduleOutcome schedule_roster(const SchedulerConfig &cfg);

} // namespace shift_roster
