// cp_sat_solver.h
#pragma once
#include "solver.h"

namespace shift_roster
{
    // SolverBackend on top of the OR-Tools CP-SAT engine.
    class CpSatSolver : public SolverBackend
    {
    public:
        std::string name() const override { return "cp-sat"; }
        SolveResult solve(const ConstraintModel &model, const SolveOptions &opts) override;
    };

} // namespace shift_roster
