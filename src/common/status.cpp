#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> verdict_display = boost::assign::map_list_of
    (verdict::OK, "Accepted")
    (verdict::WRONG_ANSWER, "Wrong Answer")
    (verdict::INVALID_OUTPUT_FORMAT, "Invalid Output Format")
    (verdict::NO_OUTPUT, "No Output")
    (verdict::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (verdict::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (verdict::RUNTIME_ERROR, "Runtime Error")
    (verdict::COMPILATION_ERROR, "Compilation Error")
    (verdict::PRE_CHECK_FAILED, "Pre-check Failed")
    (verdict::SYSTEM_ERROR, "System Error");

static const unordered_map<verdict, const char *> verdict_names = boost::assign::map_list_of
    (verdict::OK, "OK")
    (verdict::WRONG_ANSWER, "WRONG_ANSWER")
    (verdict::INVALID_OUTPUT_FORMAT, "INVALID_OUTPUT_FORMAT")
    (verdict::NO_OUTPUT, "NO_OUTPUT")
    (verdict::TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED")
    (verdict::MEMORY_LIMIT_EXCEEDED, "MEMORY_LIMIT_EXCEEDED")
    (verdict::RUNTIME_ERROR, "RUNTIME_ERROR")
    (verdict::COMPILATION_ERROR, "COMPILATION_ERROR")
    (verdict::PRE_CHECK_FAILED, "PRE_CHECK_FAILED")
    (verdict::SYSTEM_ERROR, "SYSTEM_ERROR");

static const unordered_map<submission_state, const char *> state_names = boost::assign::map_list_of
    (submission_state::PENDING, "pending")
    (submission_state::RUNNING, "running")
    (submission_state::COMPLETED, "completed")
    (submission_state::FAILED, "failed");
// clang-format on

const char *get_display_message(verdict v) {
    return verdict_display.at(v);
}

const char *to_string(verdict v) {
    return verdict_names.at(v);
}

verdict parse_verdict(const string &name) {
    for (auto &[v, n] : verdict_names)
        if (name == n) return v;
    throw invalid_argument("Unrecognized verdict " + name);
}

const char *to_string(submission_state state) {
    return state_names.at(state);
}

submission_state parse_submission_state(const string &name) {
    for (auto &[s, n] : state_names)
        if (name == n) return s;
    throw invalid_argument("Unrecognized submission state " + name);
}

}  // namespace grader
