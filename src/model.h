// model.h
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace shift_roster
{
    using VarId = int;

    struct VarInfo
    {
        std::string name;
        int64_t lo = 0;
        int64_t hi = 1;
        bool is_bool = true;
    };

    struct LinearTerm
    {
        VarId var;
        int64_t coeff;
    };

    struct LinearExpr
    {
        std::vector<LinearTerm> terms;
        int64_t constant = 0;

        LinearExpr &add_term(VarId var, int64_t coeff = 1);
        LinearExpr &operator+=(const LinearExpr &other);
        LinearExpr &operator-=(const LinearExpr &other);

        static LinearExpr sum(const std::vector<VarId> &vars);
        static LinearExpr var(VarId v) { return LinearExpr{}.add_term(v); }

        int64_t evaluate(const std::function<int64_t(VarId)> &value_of) const;
    };

    LinearExpr operator-(LinearExpr lhs, const LinearExpr &rhs);

    // lo <= expr <= hi
    struct LinearConstraint
    {
        LinearExpr expr;
        int64_t lo;
        int64_t hi;
        std::string tag; // policy family that posted it
    };

    // target == left * right
    struct ProductConstraint
    {
        VarId target;
        LinearExpr left;
        LinearExpr right;
        std::string tag;
    };

    // Solver-neutral model. The catalog and objective builder write into it,
    // a SolverBackend translates it for a concrete engine.
    class ConstraintModel
    {
    public:
        VarId new_bool_var(std::string name);
        VarId new_int_var(int64_t lo, int64_t hi, std::string name);

        void add_linear(LinearExpr expr, int64_t lo, int64_t hi, const std::string &tag);
        void add_greater_or_equal(LinearExpr expr, int64_t bound, const std::string &tag);
        void add_less_or_equal(LinearExpr expr, int64_t bound, const std::string &tag);
        void add_equality(LinearExpr expr, int64_t value, const std::string &tag);
        void add_equality(const LinearExpr &lhs, const LinearExpr &rhs, const std::string &tag);
        void add_product_equality(VarId target, LinearExpr left, LinearExpr right, const std::string &tag);

        void minimize(LinearExpr objective);

        int num_vars() const { return static_cast<int>(vars_.size()); }
        const VarInfo &var(VarId v) const;
        const std::vector<VarInfo> &vars() const { return vars_; }
        const std::vector<LinearConstraint> &linear_constraints() const { return linear_; }
        const std::vector<ProductConstraint> &product_constraints() const { return products_; }
        bool has_objective() const { return has_objective_; }
        const LinearExpr &objective() const { return objective_; }

        std::size_t num_constraints() const { return linear_.size() + products_.size(); }
        std::size_t count_tagged(const std::string &tag) const;

    private:
        void check_var(VarId v) const;
        void check_expr(const LinearExpr &expr) const;

        std::vector<VarInfo> vars_;
        std::vector<LinearConstraint> linear_;
        std::vector<ProductConstraint> products_;
        LinearExpr objective_;
        bool has_objective_ = false;
    };

} // namespace shift_roster
