#include "objective.h"

#include <string>

namespace shift_roster
{
    const char *const kObjectiveTag = "objective";

    FairnessObjective build_fairness_objective(ConstraintModel &model, const AssignmentGrid &grid)
    {
        const int n = grid.num_physicians();
        // A physician works at most every (day, shift) slot.
        const int64_t max_total = static_cast<int64_t>(grid.num_days()) * grid.num_shifts();

        std::vector<LinearExpr> totals;
        totals.reserve(n);
        for (int p = 0; p < n; ++p)
            totals.push_back(grid.total_shift_count(p));

        FairnessObjective out;
        out.pairs.reserve(static_cast<std::size_t>(n) * (n - 1) / 2);
        for (int p1 = 0; p1 < n; ++p1)
        {
            for (int p2 = p1 + 1; p2 < n; ++p2)
            {
                const std::string suffix = "_p" + std::to_string(p1) + "_p" + std::to_string(p2);
                const VarId diff = model.new_int_var(-max_total, max_total, "total_diff" + suffix);
                const VarId square = model.new_int_var(0, max_total * max_total, "total_diff_sq" + suffix);

                LinearExpr d = totals[p1] - totals[p2];
                d.add_term(diff, -1);
                model.add_equality(std::move(d), 0, kObjectiveTag);
                model.add_product_equality(square, LinearExpr::var(diff), LinearExpr::var(diff), kObjectiveTag);

                out.pairs.push_back({p1, p2, diff, square});
                out.expr.add_term(square);
            }
        }

        model.minimize(out.expr);
        return out;
    }

    int64_t evaluate_fairness(const std::vector<int> &totals)
    {
        int64_t sum = 0;
        for (std::size_t i = 0; i < totals.size(); ++i)
        {
            for (std::size_t j = i + 1; j < totals.size(); ++j)
            {
                const int64_t d = static_cast<int64_t>(totals[i]) - totals[j];
                sum += d * d;
            }
        }
        return sum;
    }

} // namespace shift_roster
