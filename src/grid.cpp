#include "grid.h"
#include "errors.h"

#include <utility>

namespace shift_roster
{
    AssignmentGrid::AssignmentGrid(int physicians, int days, int shifts, std::vector<VarId> vars)
        : physicians_(physicians), days_(days), shifts_(shifts), vars_(std::move(vars))
    {
        if (static_cast<long long>(vars_.size()) != static_cast<long long>(physicians_) * days_ * shifts_)
            throw ConfigError("Assignment grid size does not match its dimensions.");
    }

    VarId AssignmentGrid::checked_at(int p, int d, int s) const
    {
        require_physician(p, "grid lookup");
        require_day(d, "grid lookup");
        require_shift(s, "grid lookup");
        return at(p, d, s);
    }

    void AssignmentGrid::require_physician(int p, const std::string &what) const
    {
        if (!has_physician(p))
            throw ConfigError(what + ": physician index " + std::to_string(p) +
                              " outside [0, " + std::to_string(physicians_) + ")");
    }

    void AssignmentGrid::require_day(int d, const std::string &what) const
    {
        if (!has_day(d))
            throw ConfigError(what + ": day index " + std::to_string(d) +
                              " outside [0, " + std::to_string(days_) + ")");
    }

    void AssignmentGrid::require_shift(int s, const std::string &what) const
    {
        if (!has_shift(s))
            throw ConfigError(what + ": shift index " + std::to_string(s) +
                              " outside [0, " + std::to_string(shifts_) + ")");
    }

    LinearExpr AssignmentGrid::night_shift_count(int p, int night_shift) const
    {
        LinearExpr e;
        for (int d = 0; d < days_; ++d)
            e.add_term(at(p, d, night_shift));
        return e;
    }

    LinearExpr AssignmentGrid::total_shift_count(int p) const
    {
        LinearExpr e;
        for (int d = 0; d < days_; ++d)
            for (int s = 0; s < shifts_; ++s)
                e.add_term(at(p, d, s));
        return e;
    }

    LinearExpr AssignmentGrid::shift_headcount(int d, int s) const
    {
        LinearExpr e;
        for (int p = 0; p < physicians_; ++p)
            e.add_term(at(p, d, s));
        return e;
    }

    LinearExpr AssignmentGrid::daily_load(int p, int d) const
    {
        LinearExpr e;
        for (int s = 0; s < shifts_; ++s)
            e.add_term(at(p, d, s));
        return e;
    }

    std::string grid_var_name(int p, int d, int s)
    {
        return "shift_p" + std::to_string(p) + "_d" + std::to_string(d) + "_s" + std::to_string(s);
    }

    AssignmentGrid build_grid(ConstraintModel &model, int physicians, int days, int shifts)
    {
        if (physicians <= 0)
            throw ConfigError("Physician count must be positive, got " + std::to_string(physicians));
        if (days <= 0)
            throw ConfigError("Day count must be positive, got " + std::to_string(days));
        if (shifts <= 0)
            throw ConfigError("Shift count must be positive, got " + std::to_string(shifts));

        std::vector<VarId> vars;
        vars.reserve(static_cast<std::size_t>(physicians) * days * shifts);
        for (int p = 0; p < physicians; ++p)
            for (int d = 0; d < days; ++d)
                for (int s = 0; s < shifts; ++s)
                    vars.push_back(model.new_bool_var(grid_var_name(p, d, s)));

        return AssignmentGrid(physicians, days, shifts, std::move(vars));
    }

} // namespace shift_roster
