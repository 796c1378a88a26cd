#include "cp_sat_solver.h"
#include "errors.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <ortools/sat/cp_model.h>
#include <ortools/sat/cp_model.pb.h>
#include <ortools/sat/cp_model_solver.h>
#include <ortools/sat/model.h>
#include <ortools/sat/sat_parameters.pb.h>
#include <ortools/util/sorted_interval_list.h>
#include <ortools/util/time_limit.h>

using operations_research::Domain;
using operations_research::TimeLimit;
using operations_research::sat::CpModelBuilder;
using operations_research::sat::CpSolverResponse;
using operations_research::sat::CpSolverStatus;
using operations_research::sat::IntVar;
using operations_research::sat::SatParameters;
namespace sat = operations_research::sat;

namespace shift_roster
{
    namespace
    {
        sat::LinearExpr to_cp_expr(const LinearExpr &expr, const std::vector<IntVar> &vars)
        {
            sat::LinearExpr out(expr.constant);
            for (const auto &t : expr.terms)
                out += sat::LinearExpr::Term(vars[t.var], t.coeff);
            return out;
        }

        // Replace open bounds by the range the expression can actually reach,
        // CP-SAT rejects domains touching the int64 limits.
        Domain bounded_domain(const LinearConstraint &c, const ConstraintModel &model)
        {
            int64_t reach_lo = c.expr.constant, reach_hi = c.expr.constant;
            for (const auto &t : c.expr.terms)
            {
                const VarInfo &v = model.var(t.var);
                const int64_t a = t.coeff * v.lo, b = t.coeff * v.hi;
                reach_lo += std::min(a, b);
                reach_hi += std::max(a, b);
            }
            int64_t lo = c.lo, hi = c.hi;
            if (lo == std::numeric_limits<int64_t>::min())
                lo = std::min(reach_lo, hi);
            if (hi == std::numeric_limits<int64_t>::max())
                hi = std::max(reach_hi, lo);
            return Domain(lo, hi);
        }

        SolveStatus map_status(const CpSolverResponse &response)
        {
            switch (response.status())
            {
            case CpSolverStatus::OPTIMAL:
                return SolveStatus::kOptimal;
            case CpSolverStatus::FEASIBLE:
                return SolveStatus::kFeasible;
            case CpSolverStatus::INFEASIBLE:
                return SolveStatus::kInfeasible;
            case CpSolverStatus::UNKNOWN:
                return SolveStatus::kUnknown;
            case CpSolverStatus::MODEL_INVALID:
                throw SolverFault("CP-SAT rejected the model: " + response.solution_info());
            default:
                throw SolverFault("CP-SAT returned unexpected status " +
                                  sat::CpSolverStatus_Name(response.status()));
            }
        }

    } // namespace

    SolveResult CpSatSolver::solve(const ConstraintModel &model, const SolveOptions &opts)
    {
        // ---- Translate model ----
        CpModelBuilder cp_model;
        std::vector<IntVar> vars;
        vars.reserve(model.num_vars());
        for (const auto &info : model.vars())
        {
            if (info.is_bool)
                vars.push_back(IntVar(cp_model.NewBoolVar().WithName(info.name)));
            else
                vars.push_back(cp_model.NewIntVar(Domain(info.lo, info.hi)).WithName(info.name));
        }

        for (const auto &c : model.linear_constraints())
            cp_model.AddLinearConstraint(to_cp_expr(c.expr, vars), bounded_domain(c, model));

        for (const auto &c : model.product_constraints())
        {
            cp_model.AddMultiplicationEquality(to_cp_expr(LinearExpr::var(c.target), vars),
                                               to_cp_expr(c.left, vars),
                                               to_cp_expr(c.right, vars));
        }

        if (model.has_objective())
            cp_model.Minimize(to_cp_expr(model.objective(), vars));

        // ---- Search parameters ----
        SatParameters params;
        if (opts.time_limit_seconds > 0)
            params.set_max_time_in_seconds(opts.time_limit_seconds);
        if (opts.num_workers > 0)
            params.set_num_workers(opts.num_workers);
        params.set_random_seed(opts.random_seed);
        params.set_log_search_progress(opts.log_search);

        sat::Model sat_model;
        sat_model.Add(sat::NewSatParameters(params));
        if (opts.stop)
            sat_model.GetOrCreate<TimeLimit>()->RegisterExternalBooleanAsLimit(opts.stop);

        CpSolverResponse response;
        try
        {
            response = sat::SolveCpModel(cp_model.Build(), &sat_model);
        }
        catch (const std::exception &e)
        {
            throw SolverFault(std::string("CP-SAT failed: ") + e.what());
        }

        const SolveStatus status = map_status(response);

        SolveStats stats;
        stats.conflicts = response.num_conflicts();
        stats.branches = response.num_branches();
        stats.wall_time_seconds = response.wall_time();

        if (!has_solution(status))
        {
            if (opts.log_search)
            {
                std::cerr << "[cp_sat] no solution: status=" << status_name(status)
                          << " vars=" << model.num_vars()
                          << " constraints=" << model.num_constraints()
                          << " wall=" << stats.wall_time_seconds << "s\n";
            }
            return SolveResult(status, {}, 0.0, stats);
        }

        // ---- Extract solution ----
        std::vector<int64_t> values;
        values.reserve(vars.size());
        for (const auto &v : vars)
            values.push_back(sat::SolutionIntegerValue(response, v));

        return SolveResult(status, std::move(values), response.objective_value(), stats);
    }

} // namespace shift_roster
