#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "store/memory_store.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;
using namespace grader::store;

class MemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.put_challenge(sum);
    }

    graded_result result_of(const string &fingerprint, unsigned passed) {
        graded_result result;
        result.fingerprint = fingerprint;
        result.verdict = passed == 5 ? verdict::OK : verdict::WRONG_ANSWER;
        result.passed = passed;
        result.total = 5;
        result.score = boost::rational<int>(passed, 5);
        return result;
    }

    challenge sum = test::echo_challenge("sum", 3, 5);
    memory_store store;
};

TEST_F(MemoryStoreTest, ChallengeVersionsAreImmutable) {
    EXPECT_EQ(store.latest_version("sum"), 1u);
    EXPECT_FALSE(store.latest_version("missing"));
    EXPECT_THROW(store.put_challenge(sum), validation_error);

    challenge next = sum;
    next.version = 2;
    next.test_cases.pop_back();
    store.put_challenge(next);
    EXPECT_EQ(store.latest_version("sum"), 2u);
    EXPECT_EQ(store.get_challenge("sum", 1).test_cases.size(), 5u);
    EXPECT_EQ(store.get_challenge("sum", 2).test_cases.size(), 4u);
    EXPECT_THROW(store.get_challenge("sum", 3), not_found_error);
}

TEST_F(MemoryStoreTest, RejectsInvalidChallenges) {
    challenge empty = test::echo_challenge("empty", 0, 0);
    EXPECT_THROW(store.put_challenge(empty), validation_error);

    challenge duplicated = test::echo_challenge("dup", 2, 2);
    duplicated.test_cases[1].id = duplicated.test_cases[0].id;
    EXPECT_THROW(store.put_challenge(duplicated), validation_error);

    challenge weightless = test::echo_challenge("weightless", 1, 1);
    weightless.test_cases[0].weight = 0;
    EXPECT_THROW(store.put_challenge(weightless), validation_error);

    challenge heavy = test::echo_challenge("heavy", 1, 1);
    heavy.test_cases[0].weight = MAX_TEST_CASE_WEIGHT + 1;
    EXPECT_THROW(store.put_challenge(heavy), validation_error);

    // 每个测试点的权重都合法，但是总和超出了 int 的范围
    challenge crowded = test::echo_challenge("crowded", 3000, 3000);
    for (auto &tc : crowded.test_cases) tc.weight = MAX_TEST_CASE_WEIGHT;
    EXPECT_THROW(store.put_challenge(crowded), validation_error);
    EXPECT_FALSE(store.latest_version("crowded"));

    challenge unevaluated = test::evaluated_challenge("unevaluated", 1, 1);
    unevaluated.evaluator.reset();
    EXPECT_THROW(store.put_challenge(unevaluated), validation_error);

    challenge blank = test::evaluated_challenge("blank", 1, 1);
    blank.evaluator->code.clear();
    EXPECT_THROW(store.put_challenge(blank), validation_error);

    store.put_challenge(test::evaluated_challenge("evaluated", 1, 1));
    EXPECT_TRUE(store.get_challenge("evaluated", 1).evaluator);
}

TEST_F(MemoryStoreTest, SubmissionLifecycle) {
    string id = test::create_pending(store, sum, "print(1)");
    EXPECT_EQ(store.get_submission(id).state, submission_state::PENDING);
    EXPECT_FALSE(store.get_result(id));

    store.mark_running(id, "fp");
    EXPECT_EQ(store.get_submission(id).state, submission_state::RUNNING);
    EXPECT_EQ(store.get_submission(id).fingerprint, "fp");

    EXPECT_EQ(store.mark_pending(id), 1u);
    EXPECT_EQ(store.mark_pending(id), 2u);
    EXPECT_EQ(store.get_submission(id).state, submission_state::PENDING);

    graded_result committed = store.commit_result(id, result_of("fp", 3));
    EXPECT_EQ(committed.passed, 3u);
    EXPECT_EQ(store.get_submission(id).state, submission_state::COMPLETED);

    // 已经完成的提交不会再被修改
    EXPECT_EQ(store.commit_result(id, result_of("fp", 5)).passed, 3u);
    EXPECT_EQ(store.mark_pending(id), 2u);
    store.mark_failed(id, "too late");
    EXPECT_EQ(store.get_submission(id).state, submission_state::COMPLETED);
    EXPECT_EQ(store.result_count(), 1u);
}

TEST_F(MemoryStoreTest, UnknownSubmission) {
    EXPECT_THROW(store.get_submission("missing"), not_found_error);
    EXPECT_THROW(store.get_result("missing"), not_found_error);
    EXPECT_THROW(store.mark_pending("missing"), not_found_error);
}

TEST_F(MemoryStoreTest, UnfinishedSubmissionsOldestFirst) {
    string a = test::create_pending(store, sum, "a");
    string b = test::create_pending(store, sum, "b");
    string c = test::create_pending(store, sum, "c");
    string d = test::create_pending(store, sum, "d");
    string e = test::create_pending(store, sum, "e");
    store.mark_running(b, "fp");
    store.commit_result(c, result_of("fp", 5));
    store.mark_failed(d, "sandbox is gone");

    vector<submission> unfinished = store.list_unfinished();
    ASSERT_EQ(unfinished.size(), 3u);
    EXPECT_EQ(unfinished[0].id, a);
    EXPECT_EQ(unfinished[1].id, b);
    EXPECT_EQ(unfinished[1].state, submission_state::RUNNING);
    EXPECT_EQ(unfinished[2].id, e);
}
