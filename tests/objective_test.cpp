#include "objective.h"
#include "test_utils.h"

#include <gtest/gtest.h>

namespace shift_roster
{
    namespace
    {
        TEST(ObjectiveTest, OneDifferenceAndOneSquarePerPair)
        {
            ConstraintModel m;
            const AssignmentGrid g = build_grid(m, 3, 2, 2);
            const int grid_vars = m.num_vars();

            const FairnessObjective obj = build_fairness_objective(m, g);

            ASSERT_EQ(obj.pairs.size(), 3u);
            EXPECT_EQ(m.num_vars(), grid_vars + 6);
            EXPECT_EQ(m.product_constraints().size(), 3u);
            EXPECT_EQ(m.count_tagged(kObjectiveTag), 6u);

            const PairAuxiliary &first = obj.pairs[0];
            EXPECT_EQ(first.p1, 0);
            EXPECT_EQ(first.p2, 1);
            EXPECT_EQ(m.var(first.diff).lo, -4);
            EXPECT_EQ(m.var(first.diff).hi, 4);
            EXPECT_EQ(m.var(first.square).lo, 0);
            EXPECT_EQ(m.var(first.square).hi, 16);
        }

        TEST(ObjectiveTest, MinimizesSumOfSquares)
        {
            ConstraintModel m;
            const AssignmentGrid g = build_grid(m, 4, 2, 3);
            const FairnessObjective obj = build_fairness_objective(m, g);

            ASSERT_TRUE(m.has_objective());
            ASSERT_EQ(m.objective().terms.size(), 6u);
            for (std::size_t i = 0; i < obj.pairs.size(); ++i)
            {
                EXPECT_EQ(m.objective().terms[i].var, obj.pairs[i].square);
                EXPECT_EQ(m.objective().terms[i].coeff, 1);
            }

            for (const auto &pc : m.product_constraints())
            {
                ASSERT_EQ(pc.left.terms.size(), 1u);
                ASSERT_EQ(pc.right.terms.size(), 1u);
                EXPECT_EQ(pc.left.terms[0].var, pc.right.terms[0].var);
            }
        }

        TEST(ObjectiveTest, DifferenceTracksTotals)
        {
            ConstraintModel m;
            const AssignmentGrid g = build_grid(m, 2, 2, 2);
            const FairnessObjective obj = build_fairness_objective(m, g);
            const VarId diff = obj.pairs.at(0).diff;

            std::vector<int64_t> v(m.num_vars(), 0);
            testing_utils::assign(g, v, 0, 0, 0);
            testing_utils::assign(g, v, 0, 1, 1);

            v[diff] = 2;
            EXPECT_EQ(testing_utils::count_violations(m, v), 0);
            v[diff] = -2;
            EXPECT_EQ(testing_utils::count_violations(m, v), 1);
        }

        TEST(ObjectiveTest, SinglePhysicianHasEmptyObjective)
        {
            ConstraintModel m;
            const AssignmentGrid g = build_grid(m, 1, 7, 3);
            const FairnessObjective obj = build_fairness_objective(m, g);
            EXPECT_TRUE(obj.pairs.empty());
            EXPECT_TRUE(m.has_objective());
            EXPECT_TRUE(m.objective().terms.empty());
        }

        TEST(ObjectiveTest, EvaluateFairness)
        {
            EXPECT_EQ(evaluate_fairness({}), 0);
            EXPECT_EQ(evaluate_fairness({4}), 0);
            EXPECT_EQ(evaluate_fairness({3, 3, 3}), 0);
            EXPECT_EQ(evaluate_fairness({2, 0, 1}), 4 + 1 + 1);
            // squares, not absolute differences
            EXPECT_EQ(evaluate_fairness({0, 3}), 9);
        }

    } // namespace
} // namespace shift_roster
