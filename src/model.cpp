#include "model.h"
#include "errors.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace shift_roster
{
    LinearExpr &LinearExpr::add_term(VarId var, int64_t coeff)
    {
        terms.push_back({var, coeff});
        return *this;
    }

    LinearExpr &LinearExpr::operator+=(const LinearExpr &other)
    {
        terms.insert(terms.end(), other.terms.begin(), other.terms.end());
        constant += other.constant;
        return *this;
    }

    LinearExpr &LinearExpr::operator-=(const LinearExpr &other)
    {
        terms.reserve(terms.size() + other.terms.size());
        for (const auto &t : other.terms)
            terms.push_back({t.var, -t.coeff});
        constant -= other.constant;
        return *this;
    }

    LinearExpr LinearExpr::sum(const std::vector<VarId> &vars)
    {
        LinearExpr e;
        e.terms.reserve(vars.size());
        for (VarId v : vars)
            e.terms.push_back({v, 1});
        return e;
    }

    int64_t LinearExpr::evaluate(const std::function<int64_t(VarId)> &value_of) const
    {
        int64_t total = constant;
        for (const auto &t : terms)
            total += t.coeff * value_of(t.var);
        return total;
    }

    LinearExpr operator-(LinearExpr lhs, const LinearExpr &rhs)
    {
        lhs -= rhs;
        return lhs;
    }

    VarId ConstraintModel::new_bool_var(std::string name)
    {
        vars_.push_back({std::move(name), 0, 1, true});
        return static_cast<VarId>(vars_.size()) - 1;
    }

    VarId ConstraintModel::new_int_var(int64_t lo, int64_t hi, std::string name)
    {
        if (lo > hi)
            throw ConfigError("Empty domain [" + std::to_string(lo) + ", " + std::to_string(hi) + "] for " + name);
        vars_.push_back({std::move(name), lo, hi, false});
        return static_cast<VarId>(vars_.size()) - 1;
    }

    const VarInfo &ConstraintModel::var(VarId v) const
    {
        check_var(v);
        return vars_[v];
    }

    void ConstraintModel::check_var(VarId v) const
    {
        if (v < 0 || v >= num_vars())
            throw ConfigError("Unknown variable id " + std::to_string(v));
    }

    void ConstraintModel::check_expr(const LinearExpr &expr) const
    {
        for (const auto &t : expr.terms)
            check_var(t.var);
    }

    void ConstraintModel::add_linear(LinearExpr expr, int64_t lo, int64_t hi, const std::string &tag)
    {
        check_expr(expr);
        // Fold the constant into the bounds so backends only see pure sums.
        const int64_t c = expr.constant;
        expr.constant = 0;
        if (lo != std::numeric_limits<int64_t>::min())
            lo -= c;
        if (hi != std::numeric_limits<int64_t>::max())
            hi -= c;
        linear_.push_back({std::move(expr), lo, hi, tag});
    }

    void ConstraintModel::add_greater_or_equal(LinearExpr expr, int64_t bound, const std::string &tag)
    {
        add_linear(std::move(expr), bound, std::numeric_limits<int64_t>::max(), tag);
    }

    void ConstraintModel::add_less_or_equal(LinearExpr expr, int64_t bound, const std::string &tag)
    {
        add_linear(std::move(expr), std::numeric_limits<int64_t>::min(), bound, tag);
    }

    void ConstraintModel::add_equality(LinearExpr expr, int64_t value, const std::string &tag)
    {
        add_linear(std::move(expr), value, value, tag);
    }

    void ConstraintModel::add_equality(const LinearExpr &lhs, const LinearExpr &rhs, const std::string &tag)
    {
        add_linear(lhs - rhs, 0, 0, tag);
    }

    void ConstraintModel::add_product_equality(VarId target, LinearExpr left, LinearExpr right, const std::string &tag)
    {
        check_var(target);
        check_expr(left);
        check_expr(right);
        products_.push_back({target, std::move(left), std::move(right), tag});
    }

    void ConstraintModel::minimize(LinearExpr objective)
    {
        check_expr(objective);
        objective_ = std::move(objective);
        has_objective_ = true;
    }

    std::size_t ConstraintModel::count_tagged(const std::string &tag) const
    {
        const auto lin = std::count_if(linear_.begin(), linear_.end(),
                                       [&](const LinearConstraint &c) { return c.tag == tag; });
        const auto prod = std::count_if(products_.begin(), products_.end(),
                                        [&](const ProductConstraint &c) { return c.tag == tag; });
        return static_cast<std::size_t>(lin + prod);
    }

} // namespace shift_roster
