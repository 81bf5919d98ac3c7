#include "judge/compare.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <vector>

namespace grader {
using namespace std;

compare_result compare_exact(const string &expected, const string &actual) {
    compare_result result;
    if (expected == actual) {
        result.verdict = verdict::OK;
    } else {
        result.verdict = verdict::WRONG_ANSWER;
        auto mismatch = std::mismatch(expected.begin(), expected.end(), actual.begin(), actual.end());
        result.reason = fmt::format("output differs at byte {}", mismatch.first - expected.begin());
    }
    return result;
}

/**
 * @brief 按行切分，去掉每行末尾的空白，再去掉末尾的空行
 */
static vector<string> normalized_lines(const string &text) {
    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));
    for (auto &line : lines)
        boost::trim_right(line);
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return lines;
}

compare_result compare_ignore_whitespace(const string &expected, const string &actual) {
    compare_result result;
    vector<string> expected_lines = normalized_lines(expected);
    vector<string> actual_lines = normalized_lines(actual);

    size_t common = min(expected_lines.size(), actual_lines.size());
    for (size_t i = 0; i < common; ++i) {
        if (expected_lines[i] != actual_lines[i]) {
            result.verdict = verdict::WRONG_ANSWER;
            result.reason = fmt::format("line {} differs", i + 1);
            return result;
        }
    }
    if (expected_lines.size() != actual_lines.size()) {
        result.verdict = verdict::WRONG_ANSWER;
        result.reason = fmt::format("expected {} lines, got {}", expected_lines.size(), actual_lines.size());
        return result;
    }
    result.verdict = verdict::OK;
    return result;
}

compare_result compare_output(checker_rule rule, const string &expected, const string &actual) {
    switch (rule) {
        case checker_rule::EXACT:
            return compare_exact(expected, actual);
        case checker_rule::IGNORE_WHITESPACE:
            return compare_ignore_whitespace(expected, actual);
        case checker_rule::EVALUATOR:
            throw invalid_argument("evaluator checker needs the evaluator of the challenge");
    }
    throw invalid_argument("unknown checker rule");
}

}  // namespace grader
