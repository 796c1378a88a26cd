#include "decoder.h"
#include "test_utils.h"
#include "types.h"

#include <stdexcept>

#include <gtest/gtest.h>

namespace shift_roster
{
    namespace
    {
        SolveStats some_stats()
        {
            SolveStats s;
            s.conflicts = 12;
            s.branches = 345;
            s.wall_time_seconds = 0.5;
            return s;
        }

        class DecoderTest : public ::testing::Test
        {
        protected:
            DecoderTest() : grid(build_grid(model, 3, 2, 3)) {}

            SolveResult solved(SolveStatus status = SolveStatus::kOptimal) const
            {
                std::vector<int64_t> v(model.num_vars(), 0);
                // day 0: P3,P1 on shift 0, P2 on night; day 1: P2 on shift 1
                testing_utils::assign(grid, v, 2, 0, 0);
                testing_utils::assign(grid, v, 0, 0, 0);
                testing_utils::assign(grid, v, 1, 0, 2);
                testing_utils::assign(grid, v, 1, 1, 1);
                return SolveResult(status, v, 6.0, some_stats());
            }

            ConstraintModel model;
            AssignmentGrid grid;
        };

        TEST_F(DecoderTest, ListsPhysiciansInAscendingOrder)
        {
            const Roster r = decode_roster(solved(), grid, 2);
            ASSERT_TRUE(r.solution_found);
            ASSERT_EQ(r.days.size(), 2u);
            ASSERT_EQ(r.days[0].shifts.size(), 3u);

            EXPECT_EQ(r.days[0].shifts[0].physicians, (std::vector<int>{0, 2}));
            EXPECT_TRUE(r.days[0].shifts[1].physicians.empty());
            EXPECT_EQ(r.days[0].shifts[2].physicians, (std::vector<int>{1}));
            EXPECT_EQ(r.days[1].shifts[1].physicians, (std::vector<int>{1}));
            EXPECT_EQ(r.days[1].day, 1);
            EXPECT_EQ(r.days[1].shifts[2].shift, 2);
        }

        TEST_F(DecoderTest, RecomputesLoads)
        {
            const Roster r = decode_roster(solved(SolveStatus::kFeasible), grid, 2);
            ASSERT_EQ(r.loads.size(), 3u);
            EXPECT_EQ(r.loads[0].total_shifts, 1);
            EXPECT_EQ(r.loads[1].total_shifts, 2);
            EXPECT_EQ(r.loads[1].night_shifts, 1);
            EXPECT_EQ(r.loads[2].night_shifts, 0);

            const Roster no_night = decode_roster(solved(), grid, kNoShift);
            EXPECT_EQ(no_night.loads[1].night_shifts, 0);
        }

        TEST_F(DecoderTest, NonFeasibleStatusReadsNothing)
        {
            for (SolveStatus st : {SolveStatus::kInfeasible, SolveStatus::kUnknown})
            {
                const SolveResult res(st, {}, 0.0, some_stats());
                EXPECT_THROW(res.value_of(grid.at(0, 0, 0)), std::logic_error);

                const Roster r = decode_roster(res, grid, 2);
                EXPECT_FALSE(r.solution_found);
                EXPECT_TRUE(r.days.empty());
                EXPECT_TRUE(r.loads.empty());

                const std::string text = format_report(r, summarize_stats(res));
                EXPECT_EQ(text.rfind("No solution found.\n", 0), 0u);
                EXPECT_NE(text.find(status_name(st)), std::string::npos);
            }
        }

        TEST_F(DecoderTest, FormatsReport)
        {
            const SolveResult res = solved();
            const std::string text = format_report(decode_roster(res, grid, 2), summarize_stats(res));
            const std::string expected =
                "Solution found:\n"
                "Day 1:\n"
                "  Shift 1: P1 P3\n"
                "  Shift 2:\n"
                "  Shift 3: P2\n"
                "\n"
                "Day 2:\n"
                "  Shift 1:\n"
                "  Shift 2: P2\n"
                "  Shift 3:\n"
                "\n"
                "\n"
                "Statistics\n"
                "  - Status    : OPTIMAL\n"
                "  - Conflicts : 12\n"
                "  - Branches  : 345\n"
                "  - Wall time : 0.5 s\n";
            EXPECT_EQ(text, expected);
        }

        TEST_F(DecoderTest, SummarizesStatistics)
        {
            const StatsSummary s = summarize_stats(solved(SolveStatus::kFeasible));
            EXPECT_EQ(s.status, "FEASIBLE");
            EXPECT_EQ(s.conflicts, 12);
            EXPECT_EQ(s.branches, 345);
            EXPECT_DOUBLE_EQ(s.wall_time_seconds, 0.5);
            EXPECT_DOUBLE_EQ(s.objective, 6.0);
        }

        TEST_F(DecoderTest, DecodingIsDeterministic)
        {
            const SolveResult res = solved();
            const Roster a = decode_roster(res, grid, 2);
            const Roster b = decode_roster(res, grid, 2);
            EXPECT_EQ(format_report(a, summarize_stats(res)), format_report(b, summarize_stats(res)));
            EXPECT_EQ(report_to_json(a, summarize_stats(res)).dump(), report_to_json(b, summarize_stats(res)).dump());
        }

        TEST_F(DecoderTest, JsonCarriesStructuredRoster)
        {
            const SolveResult res = solved();
            const nlohmann::json j = report_to_json(decode_roster(res, grid, 2), summarize_stats(res));

            EXPECT_TRUE(j.at("solution_found").get<bool>());
            ASSERT_EQ(j.at("days").size(), 2u);
            EXPECT_EQ(j["days"][0]["shifts"][0]["physicians"], nlohmann::json::array({0, 2}));
            EXPECT_EQ(j["statistics"]["status"], "OPTIMAL");
            EXPECT_EQ(j["statistics"]["branches"], 345);
            EXPECT_EQ(j["loads"][1]["total_shifts"], 2);

            const SolveResult none(SolveStatus::kInfeasible, {}, 0.0, some_stats());
            const nlohmann::json k = report_to_json(decode_roster(none, grid, 2), summarize_stats(none));
            EXPECT_FALSE(k.at("solution_found").get<bool>());
            EXPECT_EQ(k.at("error"), "No solution found");
            EXPECT_TRUE(k.at("days").empty());
        }

        TEST(StatusTest, Names)
        {
            EXPECT_STREQ(status_name(SolveStatus::kOptimal), "OPTIMAL");
            EXPECT_STREQ(status_name(SolveStatus::kFeasible), "FEASIBLE");
            EXPECT_STREQ(status_name(SolveStatus::kInfeasible), "INFEASIBLE");
            EXPECT_STREQ(status_name(SolveStatus::kUnknown), "UNKNOWN");
            EXPECT_TRUE(has_solution(SolveStatus::kFeasible));
            EXPECT_FALSE(has_solution(SolveStatus::kUnknown));
        }

    } // namespace
} // namespace shift_roster
