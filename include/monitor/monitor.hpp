#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "judge/result.hpp"
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief worker 线程的状态
 */
enum class worker_state {
    START,
    GRADING,
    IDLE,
    STOPPED,
    CRASHED
};

/**
 * @brief 执行监控行为
 * 默认实现什么都不做，子类只需要覆盖关心的事件
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报当前已经开始评分一个提交
     */
    virtual void start_submission(const submission &submit);

    /**
     * @brief 监控上报当前已经完成一个提交的评分
     * @param submit 提交
     * @param result 评分结果，cached 为真时表示直接复用了缓存
     */
    virtual void end_submission(const submission &submit, const graded_result &result);

    /**
     * @brief 监控上报一个提交的评分因基础设施故障中断
     * @param submit 提交
     * @param attempts 已经尝试的次数
     * @param permanent 重试次数是否已经耗尽，提交被标记为 failed
     */
    virtual void submission_interrupted(const submission &submit, unsigned attempts, bool permanent, const std::string &reason);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 上报需要人工处理的错误，比如不变量被破坏
     */
    virtual void report_error(const std::string &message);
};

/**
 * @brief 把事件转发给所有注册的监控器
 * 单个监控器出错不会影响其他监控器，也不会影响评分
 */
struct monitor_group : public monitor {
    void register_monitor(std::unique_ptr<monitor> &&m);

    void start_submission(const submission &submit) override;
    void end_submission(const submission &submit, const graded_result &result) override;
    void submission_interrupted(const submission &submit, unsigned attempts, bool permanent, const std::string &reason) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;
    void report_error(const std::string &message) override;

private:
    void call_monitor(const std::function<void(monitor &)> &callback);

    std::mutex mut;
    std::vector<std::unique_ptr<monitor>> monitors;
};

const char *to_string(worker_state state);

}  // namespace grader
