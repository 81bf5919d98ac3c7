#include "judge/scoring.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace grader {
using namespace std;

graded_result aggregate(const challenge &c, vector<execution_result> results, const string &fingerprint) {
    if (c.test_cases.empty())
        throw invalid_argument("challenge " + c.id + " has no test cases");
    if (results.size() != c.test_cases.size())
        throw invalid_argument("expected " + std::to_string(c.test_cases.size()) + " execution results, got " + std::to_string(results.size()));

    unordered_map<string, execution_result *> by_id;
    for (auto &result : results)
        by_id[result.test_case_id] = &result;

    graded_result graded;
    graded.fingerprint = fingerprint;
    graded.total = c.test_cases.size();
    graded.verdict = verdict::OK;

    uint64_t total_weight = 0, passed_weight = 0;
    for (const test_case &tc : c.test_cases) {
        auto it = by_id.find(tc.id);
        if (it == by_id.end())
            throw invalid_argument("missing execution result for test case " + tc.id);
        execution_result &result = *it->second;

        total_weight += tc.weight;
        if (result.verdict == verdict::OK) {
            ++graded.passed;
            passed_weight += tc.weight;
        } else if (graded.verdict == verdict::OK) {
            graded.verdict = result.verdict;
        }
        graded.results.push_back(move(result));
    }

    // validate_challenge 保证了权重之和的范围，这里防止未经检查的题目破坏分数
    if (total_weight > static_cast<uint64_t>(numeric_limits<int>::max()))
        throw invalid_argument("total weight of challenge " + c.id + " does not fit in a score");

    switch (c.policy) {
        case scoring_policy::ALL_OR_NOTHING:
            graded.score = boost::rational<int>(graded.passed == graded.total ? 1 : 0);
            break;
        case scoring_policy::WEIGHTED_PARTIAL:
            graded.score = boost::rational<int>(static_cast<int>(passed_weight), static_cast<int>(total_weight));
            break;
    }
    return graded;
}

}  // namespace grader
