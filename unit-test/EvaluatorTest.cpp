#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/evaluator.hpp"
#include "test/fixtures.hpp"
#include "test/mock_sandbox.hpp"

using namespace std;
using namespace grader;
using grader::client::build_run_request;
using grader::client::build_run_response;
using json = nlohmann::json;

class EvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        program.environment = "python";
        program.code = test::EVALUATOR_CODE;
        program.time_limit = 2000;
        program.memory_limit = 128;

        tc.id = "t1";
        tc.input = "3\n";
        tc.expected_output = "9\n";
        tc.checker = checker_rule::EVALUATOR;

        payload.code = "print(int(input()) ** 2)";
        payload.environment = "python";
    }

    /**
     * @brief 评测程序在 stdout 输出 stdout_output 并以 status 退出
     */
    void respond(const string &stdout_output, int status = 0) {
        sandbox->program = [stdout_output, status](const build_run_request &request) {
            build_run_response response = test::scripted_sandbox::echo(request);
            response.run.stdout_output = stdout_output;
            response.run.status = status;
            return response;
        };
    }

    evaluator_program program;
    test_case tc;
    submission_payload payload;
    shared_ptr<test::scripted_sandbox> sandbox = make_shared<test::scripted_sandbox>();
    client::execution_client executor{sandbox, test::test_sandbox_config()};
};

TEST_F(EvaluatorTest, PrepareMayRewriteCode) {
    json seen;
    sandbox->program = test::scripted_sandbox::evaluating(test::EVALUATOR_CODE, [&seen](const json &request) -> json {
        seen = request;
        return {{"code", "import prelude\n" + request.at("code").get<string>()}, {"reason", ""}};
    });

    prepare_result prepared = evaluator(executor, program).prepare(payload);
    EXPECT_EQ(prepared.verdict, verdict::OK);
    EXPECT_EQ(prepared.code, "import prelude\nprint(int(input()) ** 2)");
    EXPECT_FALSE(prepared.reason);

    EXPECT_EQ(seen.at("action"), "prepare");
    EXPECT_EQ(seen.at("environment"), "python");
    EXPECT_EQ(seen.at("code"), payload.code);
}

TEST_F(EvaluatorTest, PrepareRejection) {
    respond(R"({"code": null, "reason": "module os is not allowed"})");

    prepare_result prepared = evaluator(executor, program).prepare(payload);
    EXPECT_EQ(prepared.verdict, verdict::PRE_CHECK_FAILED);
    ASSERT_TRUE(prepared.reason);
    EXPECT_EQ(*prepared.reason, "module os is not allowed");
}

TEST_F(EvaluatorTest, MalformedPrepareResponse) {
    respond("ok");
    EXPECT_EQ(evaluator(executor, program).prepare(payload).verdict, verdict::INVALID_OUTPUT_FORMAT);

    respond(R"({"reason": "forgot the code"})");
    EXPECT_EQ(evaluator(executor, program).prepare(payload).verdict, verdict::INVALID_OUTPUT_FORMAT);

    respond(R"({"code": 42})");
    EXPECT_EQ(evaluator(executor, program).prepare(payload).verdict, verdict::INVALID_OUTPUT_FORMAT);
}

TEST_F(EvaluatorTest, CheckReturnsEvaluatorVerdict) {
    json seen;
    sandbox->program = test::scripted_sandbox::evaluating(test::EVALUATOR_CODE, [&seen](const json &request) -> json {
        seen = request;
        return {{"verdict", "WRONG_ANSWER"}, {"reason", "expected 9, found 8"}};
    });

    compare_result result = evaluator(executor, program).check(tc, "8\n");
    EXPECT_EQ(result.verdict, verdict::WRONG_ANSWER);
    EXPECT_EQ(*result.reason, "expected 9, found 8");

    EXPECT_EQ(seen.at("action"), "check");
    EXPECT_EQ(seen.at("test_case"), "t1");
    EXPECT_EQ(seen.at("input"), "3\n");
    EXPECT_EQ(seen.at("expected_output"), "9\n");
    EXPECT_EQ(seen.at("output"), "8\n");

    // 评测程序可以判定选手输出的格式不合法
    respond(R"({"verdict": "INVALID_OUTPUT_FORMAT", "reason": "expected an integer"})");
    EXPECT_EQ(evaluator(executor, program).check(tc, "nine\n").verdict, verdict::INVALID_OUTPUT_FORMAT);
}

TEST_F(EvaluatorTest, UnparseableCheckResponse) {
    respond("Traceback (most recent call last):");
    EXPECT_EQ(evaluator(executor, program).check(tc, "9\n").verdict, verdict::INVALID_OUTPUT_FORMAT);

    respond(R"({"verdict": "MAYBE"})");
    EXPECT_EQ(evaluator(executor, program).check(tc, "9\n").verdict, verdict::INVALID_OUTPUT_FORMAT);

    respond(R"({"reason": "no verdict"})");
    compare_result result = evaluator(executor, program).check(tc, "9\n");
    EXPECT_EQ(result.verdict, verdict::INVALID_OUTPUT_FORMAT);
    EXPECT_TRUE(result.reason);
}

TEST_F(EvaluatorTest, BrokenEvaluatorIsSystemError) {
    respond(R"({"verdict": "OK"})", 1);
    EXPECT_EQ(evaluator(executor, program).check(tc, "9\n").verdict, verdict::SYSTEM_ERROR);
    EXPECT_EQ(evaluator(executor, program).prepare(payload).verdict, verdict::SYSTEM_ERROR);

    sandbox->program = [](const build_run_request &) {
        build_run_response response;
        response.error = "compile_error";
        response.details = {{"stderr", "IndentationError"}};
        return response;
    };
    compare_result result = evaluator(executor, program).check(tc, "9\n");
    EXPECT_EQ(result.verdict, verdict::SYSTEM_ERROR);
    EXPECT_NE(result.reason->find("IndentationError"), string::npos);

    sandbox->program = [](const build_run_request &) {
        build_run_response response;
        response.error = "environment_not_found";
        return response;
    };
    EXPECT_EQ(evaluator(executor, program).check(tc, "9\n").verdict, verdict::SYSTEM_ERROR);
}

TEST_F(EvaluatorTest, SandboxOutageInterrupts) {
    sandbox->program = [](const build_run_request &) -> build_run_response {
        throw network_error("connection refused");
    };
    EXPECT_THROW(evaluator(executor, program).prepare(payload), infrastructure_error);
    EXPECT_THROW(evaluator(executor, program).check(tc, "9\n"), infrastructure_error);
}

TEST_F(EvaluatorTest, ChallengeFileDeclaresEvaluator) {
    json j = json::parse(R"json({
        "id": "square",
        "version": 2,
        "evaluator": {"code": "import judge; judge.main()", "time_limit": 2000},
        "test_cases": [
            {"id": "t1", "input": "3\n", "expected_output": "9\n", "checker": "evaluator"},
            {"id": "t2", "input": "4\n", "expected_output": "16\n"}
        ]
    })json");
    challenge c = j.get<challenge>();
    ASSERT_TRUE(c.evaluator);
    EXPECT_EQ(c.evaluator->environment, "python");
    EXPECT_EQ(c.evaluator->code, test::EVALUATOR_CODE);
    EXPECT_EQ(c.evaluator->time_limit, 2000u);
    EXPECT_EQ(c.evaluator->memory_limit, 256u);
    EXPECT_EQ(c.test_cases[0].checker, checker_rule::EVALUATOR);
    EXPECT_EQ(c.test_cases[1].checker, checker_rule::IGNORE_WHITESPACE);
    EXPECT_NO_THROW(validate_challenge(c));

    EXPECT_EQ(json(c).at("evaluator").at("code"), test::EVALUATOR_CODE);
}
