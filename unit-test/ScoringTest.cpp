#include "gtest/gtest.h"
#include "judge/scoring.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;

class ScoringTest : public ::testing::Test {
protected:
    execution_result result(const string &id, verdict v) {
        execution_result r;
        r.test_case_id = id;
        r.verdict = v;
        r.exit_code = 0;
        return r;
    }
};

TEST_F(ScoringTest, WeightedPartialThreeOfFive) {
    challenge c = test::echo_challenge("sum", 3, 5);
    vector<execution_result> results = {
        result("t1", verdict::OK),
        result("t2", verdict::OK),
        result("t3", verdict::OK),
        result("t4", verdict::WRONG_ANSWER),
        result("t5", verdict::TIME_LIMIT_EXCEEDED),
    };

    graded_result graded = aggregate(c, results, "fp");
    EXPECT_EQ(graded.fingerprint, "fp");
    EXPECT_EQ(graded.passed, 3u);
    EXPECT_EQ(graded.total, 5u);
    EXPECT_EQ(graded.score, boost::rational<int>(3, 5));
    EXPECT_DOUBLE_EQ(graded.percentage(), 60.0);
    EXPECT_EQ(graded.verdict, verdict::WRONG_ANSWER);
}

TEST_F(ScoringTest, WeightsAreApplied) {
    challenge c = test::echo_challenge("sum", 2, 2);
    c.test_cases[0].weight = 1;
    c.test_cases[1].weight = 3;

    graded_result graded = aggregate(c, {result("t1", verdict::RUNTIME_ERROR), result("t2", verdict::OK)}, "fp");
    EXPECT_EQ(graded.score, boost::rational<int>(3, 4));
    EXPECT_EQ(graded.verdict, verdict::RUNTIME_ERROR);
}

TEST_F(ScoringTest, LargeWeightsKeepExactScore) {
    challenge c = test::echo_challenge("sum", 3, 3);
    for (auto &tc : c.test_cases) tc.weight = MAX_TEST_CASE_WEIGHT;

    graded_result graded = aggregate(c, {result("t1", verdict::OK), result("t2", verdict::OK), result("t3", verdict::WRONG_ANSWER)}, "fp");
    EXPECT_EQ(graded.score, boost::rational<int>(2, 3));

    // 权重之和超出 int 的题目无法计分
    for (auto &tc : c.test_cases) tc.weight = 1u << 31;
    EXPECT_THROW(aggregate(c, {result("t1", verdict::OK), result("t2", verdict::OK), result("t3", verdict::OK)}, "fp"),
                 invalid_argument);
}

TEST_F(ScoringTest, AllOrNothing) {
    challenge c = test::echo_challenge("sum", 2, 2, scoring_policy::ALL_OR_NOTHING);

    graded_result partial = aggregate(c, {result("t1", verdict::OK), result("t2", verdict::WRONG_ANSWER)}, "fp");
    EXPECT_EQ(partial.score, boost::rational<int>(0));
    EXPECT_EQ(partial.passed, 1u);

    graded_result full = aggregate(c, {result("t1", verdict::OK), result("t2", verdict::OK)}, "fp");
    EXPECT_EQ(full.score, boost::rational<int>(1));
    EXPECT_EQ(full.verdict, verdict::OK);
}

TEST_F(ScoringTest, ResultsFollowTestCaseOrder) {
    challenge c = test::echo_challenge("sum", 3, 3);
    graded_result graded = aggregate(c,
                                     {result("t3", verdict::OK), result("t1", verdict::OK), result("t2", verdict::NO_OUTPUT)},
                                     "fp");
    ASSERT_EQ(graded.results.size(), 3u);
    EXPECT_EQ(graded.results[0].test_case_id, "t1");
    EXPECT_EQ(graded.results[1].test_case_id, "t2");
    EXPECT_EQ(graded.results[2].test_case_id, "t3");
    EXPECT_EQ(graded.verdict, verdict::NO_OUTPUT);
}

TEST_F(ScoringTest, RejectsMismatchedResults) {
    challenge c = test::echo_challenge("sum", 2, 2);
    EXPECT_THROW(aggregate(c, {result("t1", verdict::OK)}, "fp"), invalid_argument);
    EXPECT_THROW(aggregate(c, {result("t1", verdict::OK), result("t9", verdict::OK)}, "fp"), invalid_argument);

    challenge empty = c;
    empty.test_cases.clear();
    EXPECT_THROW(aggregate(empty, {}, "fp"), invalid_argument);
}
