#include "judge/classify.hpp"
#include "judge/compare.hpp"

namespace grader {
using namespace std;
using client::execution_outcome;

execution_result classify(const test_case &tc, execution_outcome outcome) {
    return classify(tc, move(outcome), [](const test_case &checked, const string &output) {
        return compare_output(checked.checker, checked.expected_output, output);
    });
}

execution_result classify(const test_case &tc, execution_outcome outcome, const output_checker &checker) {
    execution_result result;
    result.test_case_id = tc.id;
    result.exit_code = outcome.exit_code;
    result.stdout_output = move(outcome.stdout_output);
    result.stderr_output = move(outcome.stderr_output);
    result.time_used = outcome.time_used;
    result.memory_used = outcome.memory_used;
    result.reason = move(outcome.reason);

    switch (outcome.kind) {
        case execution_outcome::COMPILE_ERROR:
            result.verdict = verdict::COMPILATION_ERROR;
            return result;
        case execution_outcome::TIMED_OUT:
            result.verdict = verdict::TIME_LIMIT_EXCEEDED;
            return result;
        case execution_outcome::FINISHED:
            break;
    }

    if (result.time_used > tc.time_limit) {
        result.verdict = verdict::TIME_LIMIT_EXCEEDED;
    } else if (result.memory_used / 1024 > tc.memory_limit) {
        result.verdict = verdict::MEMORY_LIMIT_EXCEEDED;
    } else if (result.exit_code != 0) {
        result.verdict = verdict::RUNTIME_ERROR;
    } else if (result.stdout_output.empty()) {
        result.verdict = verdict::NO_OUTPUT;
    } else {
        compare_result compared = checker(tc, result.stdout_output);
        result.verdict = compared.verdict;
        if (compared.reason) result.reason = compared.reason;
    }
    return result;
}

execution_result rejected(const test_case &tc, verdict v, const optional<string> &reason) {
    execution_result result;
    result.test_case_id = tc.id;
    result.verdict = v;
    result.reason = reason;
    return result;
}

}  // namespace grader
