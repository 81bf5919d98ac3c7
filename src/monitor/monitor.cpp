#include "monitor/monitor.hpp"
#include <glog/logging.h>

namespace grader {
using namespace std;

monitor::~monitor() {}

void monitor::start_submission(const submission &) {}

void monitor::end_submission(const submission &, const graded_result &) {}

void monitor::submission_interrupted(const submission &, unsigned, bool, const string &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::report_error(const string &) {}

void monitor_group::register_monitor(unique_ptr<monitor> &&m) {
    scoped_lock guard(mut);
    monitors.push_back(move(m));
}

void monitor_group::call_monitor(const function<void(monitor &)> &callback) {
    scoped_lock guard(mut);
    for (auto &m : monitors) {
        try {
            callback(*m);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Monitor crashed when reporting monitoring information, " << ex.what();
        }
    }
}

void monitor_group::start_submission(const submission &submit) {
    call_monitor([&](monitor &m) { m.start_submission(submit); });
}

void monitor_group::end_submission(const submission &submit, const graded_result &result) {
    call_monitor([&](monitor &m) { m.end_submission(submit, result); });
}

void monitor_group::submission_interrupted(const submission &submit, unsigned attempts, bool permanent, const string &reason) {
    call_monitor([&](monitor &m) { m.submission_interrupted(submit, attempts, permanent, reason); });
}

void monitor_group::worker_state_changed(int worker_id, worker_state state, const string &information) {
    call_monitor([&](monitor &m) { m.worker_state_changed(worker_id, state, information); });
}

void monitor_group::report_error(const string &message) {
    call_monitor([&](monitor &m) { m.report_error(message); });
}

const char *to_string(worker_state state) {
    switch (state) {
        case worker_state::START:
            return "start";
        case worker_state::GRADING:
            return "grading";
        case worker_state::IDLE:
            return "idle";
        case worker_state::STOPPED:
            return "stopped";
        case worker_state::CRASHED:
            return "crashed";
    }
    return "unknown";
}

}  // namespace grader
