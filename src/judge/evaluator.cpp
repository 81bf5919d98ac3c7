#include "judge/evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
using client::execution_outcome;

/**
 * @brief 评测程序本身出错，verdict 为记录到测试点上的评测结果
 */
struct evaluator_error : public grader_exception {
    evaluator_error(grader::verdict verdict, const string &message)
        : grader_exception(message), verdict(verdict) {}

    grader::verdict verdict;
};

evaluator::evaluator(client::execution_client &executor, const evaluator_program &program)
    : executor(executor), program(program) {}

json evaluator::run(const json &request) {
    client::execution_limits limits{program.time_limit, program.memory_limit};
    execution_outcome outcome;
    try {
        outcome = executor.execute(program.code, request.dump(), program.environment, limits);
    } catch (validation_error &ex) {
        throw evaluator_error(verdict::SYSTEM_ERROR, string("evaluator environment is unavailable: ") + ex.what());
    }

    switch (outcome.kind) {
        case execution_outcome::COMPILE_ERROR:
            throw evaluator_error(verdict::SYSTEM_ERROR, "evaluator does not compile: " + outcome.reason.value_or(""));
        case execution_outcome::TIMED_OUT:
            throw evaluator_error(verdict::SYSTEM_ERROR, "evaluator timed out");
        case execution_outcome::FINISHED:
            break;
    }
    if (outcome.exit_code != 0)
        throw evaluator_error(verdict::SYSTEM_ERROR,
                              fmt::format("evaluator exited with code {}: {}", outcome.exit_code, outcome.stderr_output));

    try {
        return json::parse(outcome.stdout_output);
    } catch (json::exception &ex) {
        throw evaluator_error(verdict::INVALID_OUTPUT_FORMAT, string("evaluator output is not JSON: ") + ex.what());
    }
}

prepare_result evaluator::prepare(const submission_payload &payload) {
    prepare_result result;
    try {
        json response = run({{"action", "prepare"},
                             {"environment", payload.environment},
                             {"code", payload.code}});
        string reason = get_value_def<string>(response, "", "reason");
        if (!reason.empty()) result.reason = reason;

        if (!response.is_object() || !response.count("code"))
            throw invalid_argument("evaluator response has no code");
        if (response.at("code").is_null()) {
            result.verdict = verdict::PRE_CHECK_FAILED;
            return result;
        }
        result.code = get_value<string>(response, "code");
        result.verdict = verdict::OK;
    } catch (evaluator_error &ex) {
        LOG(WARNING) << "Evaluator failed to prepare a submission: " << ex.what();
        result.verdict = ex.verdict;
        result.reason = ex.what();
    } catch (invalid_argument &ex) {
        LOG(WARNING) << "Evaluator returned a malformed prepare response: " << ex.what();
        result.verdict = verdict::INVALID_OUTPUT_FORMAT;
        result.reason = ex.what();
    }
    return result;
}

compare_result evaluator::check(const test_case &tc, const string &output) {
    compare_result result;
    try {
        json response = run({{"action", "check"},
                             {"test_case", tc.id},
                             {"input", tc.input},
                             {"expected_output", tc.expected_output},
                             {"output", output}});
        result.verdict = parse_verdict(get_value<string>(response, "verdict"));
        string reason = get_value_def<string>(response, "", "reason");
        if (!reason.empty()) result.reason = reason;
    } catch (evaluator_error &ex) {
        LOG(WARNING) << "Evaluator failed to check test case " << tc.id << ": " << ex.what();
        result.verdict = ex.verdict;
        result.reason = ex.what();
    } catch (invalid_argument &ex) {
        // 缺少 verdict 字段，或者 verdict 不是已知的评测结果
        LOG(WARNING) << "Evaluator returned a malformed check response for test case " << tc.id << ": " << ex.what();
        result.verdict = verdict::INVALID_OUTPUT_FORMAT;
        result.reason = ex.what();
    }
    return result;
}

}  // namespace grader
