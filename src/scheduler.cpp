#include "scheduler.h"
#include "constraints.h"
#include "cp_sat_solver.h"
#include "errors.h"
#include "grid.h"
#include "model.h"
#include "objective.h"
#include "utils.h"
#include "validation.h"

#include <iostream>
#include <utility>

namespace shift_roster
{
    ScheduleOutcome Scheduler::run(const SchedulerConfig &cfg) const
    {
        const RosterConfig &roster_cfg = cfg.roster;
        validate_config(roster_cfg);

        const long long t0 = NowMillis();

        // ---- Model ----
        ConstraintModel model;
        const AssignmentGrid grid = build_grid(model, roster_cfg.num_physicians, roster_cfg.num_days,
                                               roster_cfg.num_shifts);
        add_all_policies(model, grid, roster_cfg);
        build_fairness_objective(model, grid);

        if (cfg.verbose)
        {
            std::cout << "[scheduler] physicians=" << roster_cfg.num_physicians
                      << " days=" << roster_cfg.num_days
                      << " shifts=" << roster_cfg.num_shifts
                      << " vars=" << model.num_vars()
                      << " constraints=" << model.num_constraints() << "\n";
            for (const auto &shift : make_shifts(roster_cfg))
            {
                std::cout << "[scheduler]   shift " << (shift.id + 1) << ": " << role_name(shift.role)
                          << (shift.peak ? " (peak)" : "") << "\n";
            }
            for (const char *tag : {kCoverageTag, kOneShiftPerDayTag, kRestTag, kNightFairnessTag,
                                    kSeniorityTag, kWeekendTag, kObjectiveTag})
            {
                std::cout << "[scheduler]   " << tag << ": " << model.count_tagged(tag) << "\n";
            }
        }

        // ---- Solve ----
        const long long t1 = NowMillis();
        SolveResult result = [&]() {
            try
            {
                return backend_.solve(model, cfg.solve);
            }
            catch (const SolverFault &e)
            {
                std::cerr << "[scheduler] " << backend_.name() << " failed: " << e.what() << "\n";
                throw;
            }
        }();
        const long long t2 = NowMillis();

        // ---- Decode ----
        ScheduleOutcome out;
        out.status = result.status();
        out.num_vars = static_cast<std::size_t>(model.num_vars());
        out.num_constraints = model.num_constraints();
        out.roster = decode_roster(result, grid, roster_cfg.night_shift);
        out.stats = summarize_stats(result);

        if (cfg.validate_solution)
            validate_roster(out.roster, roster_cfg);

        out.report = format_report(out.roster, out.stats);

        if (cfg.verbose)
        {
            std::cout << "[scheduler] status=" << out.stats.status
                      << " objective=" << out.stats.objective
                      << " build=" << (t1 - t0) << "ms"
                      << " solve=" << (t2 - t1) << "ms\n";
        }
        return out;
    }

    ScheduleOutcome schedule_roster(const SchedulerConfig &cfg)
    {
        CpSatSolver solver;
        return Scheduler(solver).run(cfg);
    }

} // namespace shift_roster
