#include "monitor/log_monitor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "config.hpp"

namespace grader {
using namespace std;

void log_monitor::start_submission(const submission &submit) {
    LOG(INFO) << "Grading " << submit << " in " << submit.payload.environment;
}

void log_monitor::end_submission(const submission &submit, const graded_result &result) {
    LOG(INFO) << fmt::format("Graded {} [{}]: {} {}/{} ({:.1f}%){}",
                             submit.id, result.fingerprint, get_display_message(result.verdict),
                             result.passed, result.total, result.percentage(),
                             result.cached ? " from cache" : "");
    if (!DEBUG) return;
    for (auto &r : result.results)
        LOG(INFO) << fmt::format("  {} {} exit={} time={}ms memory={}KB{}",
                                 r.test_case_id, to_string(r.verdict), r.exit_code, r.time_used, r.memory_used,
                                 r.reason ? " " + *r.reason : "");
}

void log_monitor::submission_interrupted(const submission &submit, unsigned attempts, bool permanent, const string &reason) {
    if (permanent)
        LOG(ERROR) << submit << " failed after " << attempts << " attempts: " << reason;
    else
        LOG(WARNING) << submit << " interrupted (attempt " << attempts << "): " << reason;
}

void log_monitor::worker_state_changed(int worker_id, worker_state state, const string &information) {
    if (state == worker_state::CRASHED)
        LOG(ERROR) << "Worker " << worker_id << " has crashed: " << information;
    else
        DLOG(INFO) << "Worker " << worker_id << " is " << to_string(state);
}

void log_monitor::report_error(const string &message) {
    LOG(ERROR) << message;
}

}  // namespace grader
