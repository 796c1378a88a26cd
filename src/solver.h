// solver.h
#pragma once
#include "model.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace shift_roster
{
    enum class SolveStatus
    {
        kOptimal,
        kFeasible,
        kInfeasible,
        kUnknown // timeout, stop request, or undecided
    };

    const char *status_name(SolveStatus status);
    inline bool has_solution(SolveStatus s) { return s == SolveStatus::kOptimal || s == SolveStatus::kFeasible; }

    struct SolveOptions
    {
        double time_limit_seconds = 0.0; // <= 0 means no limit
        int num_workers = 8;
        int random_seed = 0;
        bool log_search = false;
        std::atomic<bool> *stop = nullptr; // set to true from another thread to end the search early
    };

    struct SolveStats
    {
        int64_t conflicts = 0;
        int64_t branches = 0;
        double wall_time_seconds = 0.0;
    };

    class SolveResult
    {
    public:
        SolveResult(SolveStatus status, std::vector<int64_t> values, double objective_value, SolveStats stats);

        SolveStatus status() const { return status_; }
        bool feasible() const { return has_solution(status_); }

        // Only valid for OPTIMAL/FEASIBLE results; throws std::logic_error otherwise.
        int64_t value_of(VarId v) const;
        bool bool_value(VarId v) const { return value_of(v) != 0; }

        double objective_value() const { return objective_value_; }
        const SolveStats &stats() const { return stats_; }

    private:
        SolveStatus status_;
        std::vector<int64_t> values_;
        double objective_value_;
        SolveStats stats_;
    };

    // Boundary to a constraint solving engine. Implementations translate the
    // model, run one blocking search and report back; they hold no roster logic.
    class SolverBackend
    {
    public:
        virtual ~SolverBackend() = default;
        virtual std::string name() const = 0;
        virtual SolveResult solve(const ConstraintModel &model, const SolveOptions &opts) = 0;
    };

} // namespace shift_roster
