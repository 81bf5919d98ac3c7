#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "server/grading_service.hpp"
#include "test/fixtures.hpp"
#include "test/mock_sandbox.hpp"

using namespace std;
using namespace grader;
using namespace grader::server;
using grader::client::build_run_request;
using grader::client::build_run_response;

static const string echo_code = "print(input())";

/**
 * @brief 记录永久失败的监控器
 */
struct recording_monitor : public monitor {
    void submission_interrupted(const submission &, unsigned, bool permanent, const string &) override {
        if (permanent) ++permanent_failures;
    }

    void report_error(const string &) override {
        ++errors;
    }

    atomic<int> permanent_failures{0};
    atomic<int> errors{0};
};

class GradingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store->put_challenge(sum);
    }

    submission_request request(const string &code, const string &environment = "python") {
        submission_request req;
        req.creator = "alice";
        req.challenge_id = "sum";
        req.payload.code = code;
        req.payload.environment = environment;
        return req;
    }

    bool completed(const string &id) {
        return service.get_result(id).state == submission_state::COMPLETED;
    }

    challenge sum = test::echo_challenge("sum", 3, 5);
    shared_ptr<test::scripted_sandbox> sandbox = make_shared<test::scripted_sandbox>();
    shared_ptr<test::flaky_store> store = make_shared<test::flaky_store>();
    cache::result_cache cache{make_shared<cache::memory_cache>(64), chrono::minutes(10)};
    client::execution_client executor{sandbox, test::test_sandbox_config()};
    recording_monitor mon;
    grading_config config = test::test_grading_config();
    grading_orchestrator orchestrator{*store, *store, cache, executor, mon, config};
    grading_service service{*store, *store, orchestrator, executor, mon, config};
};

TEST_F(GradingServiceTest, RejectsInvalidSubmissions) {
    EXPECT_THROW(service.create_submission(request("")), validation_error);
    EXPECT_THROW(service.create_submission(request(string(config.max_code_size + 1, 'x'))), validation_error);
    EXPECT_THROW(service.create_submission(request("print('\xff')")), validation_error);
    EXPECT_THROW(service.create_submission(request(echo_code, "cobol")), validation_error);

    submission_request unknown = request(echo_code);
    unknown.challenge_id = "missing";
    EXPECT_THROW(service.create_submission(unknown), not_found_error);

    submission_request future = request(echo_code);
    future.challenge_version = 9;
    EXPECT_THROW(service.create_submission(future), not_found_error);

    challenge draft = test::echo_challenge("draft", 1, 1);
    draft.published = false;
    store->put_challenge(draft);
    submission_request unpublished = request(echo_code);
    unpublished.challenge_id = "draft";
    EXPECT_THROW(service.create_submission(unpublished), not_found_error);

    EXPECT_TRUE(store->list_unfinished().empty());
}

TEST_F(GradingServiceTest, CreatesPendingSubmissionOnLatestVersion) {
    challenge next = sum;
    next.version = 2;
    store->put_challenge(next);

    submission_receipt receipt = service.create_submission(request(echo_code));
    EXPECT_EQ(receipt.submit.challenge_version, 2u);
    EXPECT_EQ(receipt.submit.state, submission_state::PENDING);
    EXPECT_EQ(receipt.queue_position, 0u);
    EXPECT_FALSE(receipt.submit.id.empty());

    result_status status = service.get_result(receipt.submit.id);
    EXPECT_EQ(status.state, submission_state::PENDING);
    EXPECT_FALSE(status.result);
    EXPECT_EQ(status.queue_position, 0u);

    EXPECT_THROW(service.get_result("no-such-submission"), not_found_error);
}

TEST_F(GradingServiceTest, ReportsQueuePositions) {
    service.create_submission(request(echo_code));
    service.create_submission(request(echo_code + " "));
    submission_receipt third = service.create_submission(request(echo_code + "  "));
    EXPECT_EQ(third.queue_position, 1u);

    queue_status status = service.status();
    EXPECT_EQ(status.workers, 2u);
    EXPECT_EQ(status.active, 2u);
    EXPECT_EQ(status.waiting, 1u);
}

TEST_F(GradingServiceTest, GradesQueuedSubmissions) {
    service.start();
    submission_receipt first = service.create_submission(request(echo_code));
    submission_receipt second = service.create_submission(request(echo_code));

    ASSERT_TRUE(test::eventually([&] { return completed(first.submit.id) && completed(second.submit.id); }));

    result_status status = service.get_result(first.submit.id);
    ASSERT_TRUE(status.result);
    EXPECT_DOUBLE_EQ(status.result->percentage(), 60.0);
    EXPECT_FALSE(status.queue_position);
    EXPECT_TRUE(same_outcome(*status.result, *service.get_result(second.submit.id).result));
    EXPECT_EQ(sandbox->calls.load(), 5u);

    ASSERT_TRUE(test::eventually([&] { return service.status().active == 0; }));
    EXPECT_EQ(service.status().waiting, 0u);
}

TEST_F(GradingServiceTest, ResumesPendingSubmissions) {
    string a = test::create_pending(*store, sum, echo_code);
    string b = test::create_pending(*store, sum, "print(input().strip())");

    EXPECT_EQ(service.resume(), 2u);
    EXPECT_EQ(service.resume(), 0u);

    service.start();
    EXPECT_TRUE(test::eventually([&] { return completed(a) && completed(b); }));
}

TEST_F(GradingServiceTest, ResumesSubmissionsLeftRunning) {
    string interrupted = test::create_pending(*store, sum, echo_code);
    store->mark_running(interrupted, "fp");
    string waiting = test::create_pending(*store, sum, "print(input().strip())");

    // 轮询时跳过 running 的提交，它可能正在被其他进程评分
    EXPECT_EQ(service.resume(false), 1u);
    EXPECT_EQ(service.resume(), 1u);
    EXPECT_EQ(service.status().active + service.status().waiting, 2u);

    service.start();
    ASSERT_TRUE(test::eventually([&] { return completed(interrupted) && completed(waiting); }));
    EXPECT_EQ(service.get_result(interrupted).result->passed, 3u);
}

TEST_F(GradingServiceTest, RetriesAfterUnexpectedError) {
    atomic<int> failures{1};
    sandbox->program = [&failures](const build_run_request &request) -> build_run_response {
        if (failures.fetch_sub(1) > 0) throw runtime_error("malformed sandbox response");
        return test::scripted_sandbox::echo(request);
    };

    service.start();
    string id = service.create_submission(request(echo_code)).submit.id;

    ASSERT_TRUE(test::eventually([&] { return completed(id); }));
    EXPECT_EQ(store->get_submission(id).attempts, 1u);
    EXPECT_EQ(service.get_result(id).result->passed, 3u);
    EXPECT_EQ(mon.permanent_failures.load(), 0);
}

TEST_F(GradingServiceTest, RetriesAfterOutage) {
    atomic<bool> outage{true};
    sandbox->program = [&outage](const build_run_request &request) -> build_run_response {
        if (outage) throw network_error("connection refused");
        return test::scripted_sandbox::echo(request);
    };

    grading_config patient = config;
    patient.max_attempts = 1000;
    grading_orchestrator retrying_orchestrator(*store, *store, cache, executor, mon, patient);
    grading_service retrying(*store, *store, retrying_orchestrator, executor, mon, patient);

    retrying.start();
    string id = retrying.create_submission(request(echo_code)).submit.id;

    ASSERT_TRUE(test::eventually([&] { return store->get_submission(id).attempts >= 1; }));
    outage = false;

    ASSERT_TRUE(test::eventually([&] { return retrying.get_result(id).state == submission_state::COMPLETED; }));
    EXPECT_EQ(retrying.get_result(id).result->passed, 3u);
    EXPECT_EQ(mon.permanent_failures.load(), 0);
}

TEST_F(GradingServiceTest, FailsAfterMaxAttempts) {
    sandbox->program = [](const build_run_request &) -> build_run_response {
        throw network_error("connection refused");
    };

    service.start();
    string id = service.create_submission(request(echo_code)).submit.id;

    ASSERT_TRUE(test::eventually([&] { return service.get_result(id).state == submission_state::FAILED; }));
    EXPECT_EQ(store->get_submission(id).attempts, config.max_attempts);
    EXPECT_FALSE(service.get_result(id).result);
    ASSERT_TRUE(test::eventually([&] { return mon.permanent_failures.load() == 1; }));
    EXPECT_TRUE(test::eventually([&] { return mon.errors.load() >= 1; }));
}

TEST_F(GradingServiceTest, ListsSubmissionHistoryNewestFirst) {
    string first = test::create_pending(*store, sum, echo_code);
    string second = test::create_pending(*store, sum, echo_code + "\n");
    test::create_pending(*store, sum, echo_code, "python", "bob");

    vector<submission> history = service.list_submissions("sum", "alice");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].id, second);
    EXPECT_EQ(history[1].id, first);
}
