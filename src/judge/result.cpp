#include "judge/result.hpp"
#include <boost/rational.hpp>
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

double graded_result::percentage() const {
    return boost::rational_cast<double>(score) * 100;
}

void to_json(json &j, const execution_result &result) {
    j = {{"test_case_id", result.test_case_id},
         {"verdict", to_string(result.verdict)},
         {"exit_code", result.exit_code},
         {"stdout", result.stdout_output},
         {"stderr", result.stderr_output},
         {"time_used", result.time_used},
         {"memory_used", result.memory_used},
         {"reason", result.reason ? json(*result.reason) : json()}};
}

void from_json(const json &j, execution_result &result) {
    j.at("test_case_id").get_to(result.test_case_id);
    result.verdict = parse_verdict(j.at("verdict").get<string>());
    j.at("exit_code").get_to(result.exit_code);
    j.at("stdout").get_to(result.stdout_output);
    j.at("stderr").get_to(result.stderr_output);
    j.at("time_used").get_to(result.time_used);
    j.at("memory_used").get_to(result.memory_used);
    if (exists(j, "reason"))
        result.reason = j.at("reason").get<string>();
    else
        result.reason.reset();
}

void to_json(json &j, const graded_result &result) {
    j = {{"fingerprint", result.fingerprint},
         {"verdict", to_string(result.verdict)},
         {"score", {result.score.numerator(), result.score.denominator()}},
         {"percentage", result.percentage()},
         {"passed", result.passed},
         {"total", result.total},
         {"results", result.results},
         {"cached", result.cached}};
}

void from_json(const json &j, graded_result &result) {
    j.at("fingerprint").get_to(result.fingerprint);
    result.verdict = parse_verdict(j.at("verdict").get<string>());
    const json &score = j.at("score");
    result.score = boost::rational<int>(score.at(0).get<int>(), score.at(1).get<int>());
    j.at("passed").get_to(result.passed);
    j.at("total").get_to(result.total);
    j.at("results").get_to(result.results);
    result.cached = get_value_def<bool>(j, false, "cached");
}

static bool same_execution(const execution_result &a, const execution_result &b) {
    return a.test_case_id == b.test_case_id &&
           a.verdict == b.verdict &&
           a.exit_code == b.exit_code &&
           a.stdout_output == b.stdout_output &&
           a.stderr_output == b.stderr_output &&
           a.reason == b.reason;
}

bool same_outcome(const graded_result &a, const graded_result &b) {
    if (a.fingerprint != b.fingerprint || a.verdict != b.verdict || a.score != b.score ||
        a.passed != b.passed || a.total != b.total || a.results.size() != b.results.size())
        return false;
    for (size_t i = 0; i < a.results.size(); ++i)
        if (!same_execution(a.results[i], b.results[i]))
            return false;
    return true;
}

}  // namespace grader
