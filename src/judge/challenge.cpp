#include "judge/challenge.hpp"
#include <limits>
#include <set>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

const char *to_string(checker_rule rule) {
    switch (rule) {
        case checker_rule::EXACT:
            return "exact";
        case checker_rule::IGNORE_WHITESPACE:
            return "ignore-whitespace";
        case checker_rule::EVALUATOR:
            return "evaluator";
    }
    throw invalid_argument("Unrecognized checker rule");
}

checker_rule parse_checker_rule(const string &name) {
    if (name == "exact") return checker_rule::EXACT;
    if (name == "ignore-whitespace") return checker_rule::IGNORE_WHITESPACE;
    if (name == "evaluator") return checker_rule::EVALUATOR;
    throw invalid_argument("Unrecognized checker rule " + name);
}

const char *to_string(scoring_policy policy) {
    switch (policy) {
        case scoring_policy::ALL_OR_NOTHING:
            return "all-or-nothing";
        case scoring_policy::WEIGHTED_PARTIAL:
            return "weighted-partial";
    }
    throw invalid_argument("Unrecognized scoring policy");
}

scoring_policy parse_scoring_policy(const string &name) {
    if (name == "all-or-nothing") return scoring_policy::ALL_OR_NOTHING;
    if (name == "weighted-partial") return scoring_policy::WEIGHTED_PARTIAL;
    throw invalid_argument("Unrecognized scoring policy " + name);
}

void validate_challenge(const challenge &c) {
    if (c.id.empty())
        throw validation_error("challenge id must not be empty");
    if (c.test_cases.empty())
        throw validation_error("challenge " + c.id + " has no test cases");
    set<string> ids;
    uint64_t total_weight = 0;
    for (auto &tc : c.test_cases) {
        if (!ids.insert(tc.id).second)
            throw validation_error("duplicate test case id " + tc.id + " in challenge " + c.id);
        if (tc.weight == 0)
            throw validation_error("test case " + tc.id + " has zero weight");
        if (tc.weight > MAX_TEST_CASE_WEIGHT)
            throw validation_error("test case " + tc.id + " has weight " + std::to_string(tc.weight) +
                                   ", at most " + std::to_string(MAX_TEST_CASE_WEIGHT) + " is allowed");
        total_weight += tc.weight;
        if (tc.checker == checker_rule::EVALUATOR && !c.evaluator)
            throw validation_error("test case " + tc.id + " needs the evaluator of challenge " + c.id);
        if (tc.time_limit == 0 || tc.memory_limit == 0)
            throw validation_error("test case " + tc.id + " has no resource limit");
    }
    if (total_weight > static_cast<uint64_t>(numeric_limits<int>::max()))
        throw validation_error("total weight of challenge " + c.id + " is too large");
    if (c.evaluator) {
        if (c.evaluator->code.empty() || c.evaluator->environment.empty())
            throw validation_error("evaluator of challenge " + c.id + " has no code");
        if (c.evaluator->time_limit == 0 || c.evaluator->memory_limit == 0)
            throw validation_error("evaluator of challenge " + c.id + " has no resource limit");
    }
}

void to_json(json &j, const test_case &tc) {
    j = {{"id", tc.id},
         {"input", tc.input},
         {"expected_output", tc.expected_output},
         {"checker", to_string(tc.checker)},
         {"time_limit", tc.time_limit},
         {"memory_limit", tc.memory_limit},
         {"weight", tc.weight}};
}

void from_json(const json &j, test_case &tc) {
    j.at("id").get_to(tc.id);
    j.at("input").get_to(tc.input);
    j.at("expected_output").get_to(tc.expected_output);
    tc.checker = parse_checker_rule(get_value_def<string>(j, "ignore-whitespace", "checker"));
    tc.time_limit = get_value_def<uint64_t>(j, 1000, "time_limit");
    tc.memory_limit = get_value_def<uint64_t>(j, 256, "memory_limit");
    tc.weight = get_value_def<unsigned>(j, 1, "weight");
    if (tc.weight == 0)
        throw invalid_argument("Test case " + tc.id + " has zero weight");
}

void to_json(json &j, const evaluator_program &e) {
    j = {{"environment", e.environment},
         {"code", e.code},
         {"time_limit", e.time_limit},
         {"memory_limit", e.memory_limit}};
}

void from_json(const json &j, evaluator_program &e) {
    e.environment = get_value_def<string>(j, "python", "environment");
    j.at("code").get_to(e.code);
    e.time_limit = get_value_def<uint64_t>(j, 5000, "time_limit");
    e.memory_limit = get_value_def<uint64_t>(j, 256, "memory_limit");
}

void to_json(json &j, const challenge &c) {
    j = {{"id", c.id},
         {"version", c.version},
         {"published", c.published},
         {"test_cases", c.test_cases},
         {"scoring", to_string(c.policy)}};
    if (c.evaluator) j["evaluator"] = *c.evaluator;
}

void from_json(const json &j, challenge &c) {
    j.at("id").get_to(c.id);
    j.at("version").get_to(c.version);
    c.published = get_value_def<bool>(j, true, "published");
    j.at("test_cases").get_to(c.test_cases);
    c.policy = parse_scoring_policy(get_value_def<string>(j, "weighted-partial", "scoring"));
    if (exists(j, "evaluator"))
        c.evaluator = j.at("evaluator").get<evaluator_program>();
}

}  // namespace grader
