#pragma once

#include "monitor/monitor.hpp"

namespace grader {

/**
 * @brief 把监控事件写入 glog 日志
 * 默认注册，部署时可以再注册上报到外部系统的监控器
 */
struct log_monitor : public monitor {
    void start_submission(const submission &submit) override;
    void end_submission(const submission &submit, const graded_result &result) override;
    void submission_interrupted(const submission &submit, unsigned attempts, bool permanent, const std::string &reason) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;
    void report_error(const std::string &message) override;
};

}  // namespace grader
