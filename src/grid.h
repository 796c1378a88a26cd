// grid.h
#pragma once
#include "model.h"

#include <string>
#include <vector>

namespace shift_roster
{
    // Dense physicians x days x shifts array of boolean decision variables.
    class AssignmentGrid
    {
    public:
        AssignmentGrid(int physicians, int days, int shifts, std::vector<VarId> vars);

        int num_physicians() const { return physicians_; }
        int num_days() const { return days_; }
        int num_shifts() const { return shifts_; }
        int last_day_index() const { return days_ - 1; }

        // Unchecked O(1) lookup.
        VarId at(int p, int d, int s) const { return vars_[(p * days_ + d) * shifts_ + s]; }
        // Throws ConfigError when (p, d, s) is outside the grid.
        VarId checked_at(int p, int d, int s) const;

        bool has_physician(int p) const { return p >= 0 && p < physicians_; }
        bool has_day(int d) const { return d >= 0 && d < days_; }
        bool has_shift(int s) const { return s >= 0 && s < shifts_; }

        void require_physician(int p, const std::string &what) const;
        void require_day(int d, const std::string &what) const;
        void require_shift(int s, const std::string &what) const;

        // Derived aggregates, rebuilt on every call.
        LinearExpr night_shift_count(int p, int night_shift) const;
        LinearExpr total_shift_count(int p) const;
        LinearExpr shift_headcount(int d, int s) const;
        LinearExpr daily_load(int p, int d) const;

        const std::vector<VarId> &vars() const { return vars_; }

    private:
        int physicians_;
        int days_;
        int shifts_;
        std::vector<VarId> vars_;
    };

    std::string grid_var_name(int p, int d, int s);

    // One boolean per (p, d, s), named shift_p{p}_d{d}_s{s}. Throws ConfigError on non-positive counts.
    AssignmentGrid build_grid(ConstraintModel &model, int physicians, int days, int shifts);

} // namespace shift_roster
