#include "solver.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace shift_roster
{
    const char *status_name(SolveStatus status)
    {
        switch (status)
        {
        case SolveStatus::kOptimal:
            return "OPTIMAL";
        case SolveStatus::kFeasible:
            return "FEASIBLE";
        case SolveStatus::kInfeasible:
            return "INFEASIBLE";
        case SolveStatus::kUnknown:
            return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    SolveResult::SolveResult(SolveStatus status, std::vector<int64_t> values, double objective_value, SolveStats stats)
        : status_(status), values_(std::move(values)), objective_value_(objective_value), stats_(stats)
    {
    }

    int64_t SolveResult::value_of(VarId v) const
    {
        if (!feasible())
            throw std::logic_error(std::string("value_of called on a result with status ") + status_name(status_));
        if (v < 0 || v >= static_cast<VarId>(values_.size()))
            throw std::out_of_range("value_of: unknown variable id " + std::to_string(v));
        return values_[v];
    }

} // namespace shift_roster
