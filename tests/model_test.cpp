#include "errors.h"
#include "model.h"

#include <limits>

#include <gtest/gtest.h>

namespace shift_roster
{
    namespace
    {
        TEST(ConstraintModelTest, VariablesGetSequentialIds)
        {
            ConstraintModel m;
            EXPECT_EQ(m.new_bool_var("a"), 0);
            EXPECT_EQ(m.new_int_var(-3, 3, "b"), 1);
            ASSERT_EQ(m.num_vars(), 2);
            EXPECT_TRUE(m.var(0).is_bool);
            EXPECT_FALSE(m.var(1).is_bool);
            EXPECT_EQ(m.var(1).lo, -3);
            EXPECT_EQ(m.var(1).hi, 3);
            EXPECT_EQ(m.var(1).name, "b");
        }

        TEST(ConstraintModelTest, EmptyIntDomainIsRejected)
        {
            ConstraintModel m;
            EXPECT_THROW(m.new_int_var(2, 1, "x"), ConfigError);
            EXPECT_EQ(m.num_vars(), 0);
        }

        TEST(ConstraintModelTest, ConstantIsFoldedIntoBounds)
        {
            ConstraintModel m;
            const VarId x = m.new_bool_var("x");
            LinearExpr e = LinearExpr::var(x);
            e.constant = 2;
            m.add_greater_or_equal(e, 5, "t");

            ASSERT_EQ(m.linear_constraints().size(), 1u);
            const auto &c = m.linear_constraints()[0];
            EXPECT_EQ(c.expr.constant, 0);
            EXPECT_EQ(c.lo, 3);
            EXPECT_EQ(c.hi, std::numeric_limits<int64_t>::max());
        }

        TEST(ConstraintModelTest, EqualityOfTwoExpressionsIsDifferenceEqualZero)
        {
            ConstraintModel m;
            const VarId a = m.new_bool_var("a");
            const VarId b = m.new_bool_var("b");
            m.add_equality(LinearExpr::var(a), LinearExpr::var(b), "eq");

            const auto &c = m.linear_constraints().at(0);
            ASSERT_EQ(c.expr.terms.size(), 2u);
            EXPECT_EQ(c.expr.terms[0].var, a);
            EXPECT_EQ(c.expr.terms[0].coeff, 1);
            EXPECT_EQ(c.expr.terms[1].var, b);
            EXPECT_EQ(c.expr.terms[1].coeff, -1);
            EXPECT_EQ(c.lo, 0);
            EXPECT_EQ(c.hi, 0);
        }

        TEST(ConstraintModelTest, UnknownVariablesAreRejected)
        {
            ConstraintModel m;
            m.new_bool_var("a");
            EXPECT_THROW(m.add_less_or_equal(LinearExpr::var(7), 1, "t"), ConfigError);
            EXPECT_THROW(m.add_product_equality(3, LinearExpr::var(0), LinearExpr::var(0), "t"), ConfigError);
            EXPECT_THROW(m.minimize(LinearExpr::var(-1)), ConfigError);
            EXPECT_EQ(m.num_constraints(), 0u);
            EXPECT_FALSE(m.has_objective());
        }

        TEST(ConstraintModelTest, CountsConstraintsPerTag)
        {
            ConstraintModel m;
            const VarId a = m.new_bool_var("a");
            const VarId sq = m.new_int_var(0, 1, "sq");
            m.add_less_or_equal(LinearExpr::var(a), 1, "x");
            m.add_less_or_equal(LinearExpr::var(a), 1, "y");
            m.add_product_equality(sq, LinearExpr::var(a), LinearExpr::var(a), "x");

            EXPECT_EQ(m.num_constraints(), 3u);
            EXPECT_EQ(m.count_tagged("x"), 2u);
            EXPECT_EQ(m.count_tagged("y"), 1u);
            EXPECT_EQ(m.count_tagged("z"), 0u);
        }

        TEST(LinearExprTest, EvaluatesTermsAndConstant)
        {
            LinearExpr e;
            e.add_term(0, 2).add_term(1, -3);
            e.constant = 4;
            const std::vector<int64_t> v{5, 1};
            EXPECT_EQ(e.evaluate([&](VarId id) { return v[id]; }), 2 * 5 - 3 + 4);

            const LinearExpr d = e - LinearExpr::sum({0, 1});
            EXPECT_EQ(d.evaluate([&](VarId id) { return v[id]; }), 11 - 6);
        }

    } // namespace
} // namespace shift_roster
