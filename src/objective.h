// objective.h
#pragma once
#include "grid.h"
#include "model.h"

#include <cstdint>
#include <vector>

namespace shift_roster
{
    extern const char *const kObjectiveTag;

    // Auxiliaries of one physician pair: diff = total(p1) - total(p2), square = diff * diff.
    struct PairAuxiliary
    {
        int p1;
        int p2;
        VarId diff;
        VarId square;
    };

    struct FairnessObjective
    {
        std::vector<PairAuxiliary> pairs;
        LinearExpr expr; // sum of squares, already set as the model objective
    };

    // Minimize sum over p1 < p2 of (total_shift_count(p1) - total_shift_count(p2))^2,
    // linearized through one difference and one product-equality square per pair.
    FairnessObjective build_fairness_objective(ConstraintModel &model, const AssignmentGrid &grid);

    // Same quantity computed from per-physician totals.
    int64_t evaluate_fairness(const std::vector<int> &totals);

} // namespace shift_roster
