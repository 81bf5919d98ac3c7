#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>
#include "client/execution_client.hpp"
#include "common/concurrent_queue.hpp"
#include "config.hpp"
#include "judge/orchestrator.hpp"
#include "monitor/monitor.hpp"
#include "server/queue_positions.hpp"
#include "store/store.hpp"

namespace grader::server {

/**
 * @brief 创建提交的请求，已经通过了身份验证
 */
struct submission_request {
    /**
     * @brief 提交者的用户 id
     */
    std::string creator;

    std::string challenge_id;

    /**
     * @brief 题目版本，为空时使用最新版本
     */
    std::optional<std::uint32_t> challenge_version;

    submission_payload payload;
};

/**
 * @brief 创建提交的回执
 */
struct submission_receipt {
    submission submit;

    /**
     * @brief 排队位置，0 表示正在评分
     */
    std::size_t queue_position = 0;
};

/**
 * @brief 查询提交评分结果的返回值
 * 1. completed：result 为评分结果
 * 2. pending、running：queue_position 为排队位置（如果提交在队列中）
 * 3. failed：重试次数耗尽
 */
struct result_status {
    submission_state state = submission_state::PENDING;

    std::optional<graded_result> result;

    std::optional<std::size_t> queue_position;
};

/**
 * @brief 评分队列的状态
 */
struct queue_status {
    std::size_t workers = 0;
    std::size_t active = 0;
    std::size_t waiting = 0;
};

/**
 * @brief 评分服务
 * 对外提供创建提交、查询结果、查询提交历史、查询队列状态的接口，
 * 对内维护评分队列和 worker 线程：
 * 1. 提交创建后立即持久化为 pending 并入队，由 worker 异步评分
 * 2. 评分因基础设施故障中断时，等待 retry_delay 后重新入队，
 *    尝试次数达到 max_attempts 后提交被标记为 failed 并上报
 * 3. 启动时通过 resume 把数据库中所有没有评分结果的提交重新入队，
 *    包括上次退出时停留在 running 状态的提交
 * 4. 轮询模式下定期把其他进程写入的 pending 提交入队
 */
class grading_service {
public:
    grading_service(store::challenge_store &challenges,
                    store::submission_store &submissions,
                    grading_orchestrator &orchestrator,
                    client::execution_client &executor,
                    monitor &mon,
                    const grading_config &config);

    ~grading_service();

    /**
     * @brief 创建提交并入队
     * @throw validation_error 代码为空、过长、不是 UTF-8，或者运行环境不存在
     * @throw not_found_error 题目或题目版本不存在，或者题目未发布
     * @throw infrastructure_error 存储或沙箱不可用
     */
    submission_receipt create_submission(const submission_request &request);

    /**
     * @brief 查询提交的评分结果
     * @throw not_found_error 提交不存在
     */
    result_status get_result(const std::string &submission_id);

    /**
     * @brief 某个用户在某道题目上的提交历史，按创建时间从晚到早排列
     */
    std::vector<submission> list_submissions(const std::string &challenge_id, const std::string &creator);

    queue_status status();

    /**
     * @brief 启动 worker 线程和重试调度线程
     * @param poll 是否定期轮询数据库中的 pending 提交
     */
    void start(bool poll = false);

    /**
     * @brief 停止接受新的评分，等待 worker 处理完队列中的提交后返回
     */
    void stop();

    /**
     * @brief 把没有评分结果的提交按创建时间入队
     * @param include_running 是否包括 running 状态的提交。
     *        启动时为 true：running 的提交是上次退出时中断的评分；
     *        轮询时为 false：running 的提交可能正在被其他进程评分
     * @return 新入队的提交数
     */
    std::size_t resume(bool include_running = true);

    /**
     * @brief 评分一个提交，由 worker 调用
     */
    void process(int worker_id, const std::string &submission_id);

private:
    /**
     * @brief 提交入队，已经在队列中或者等待重试的提交不会重复入队
     * @return 排队位置
     */
    std::size_t enqueue(const std::string &submission_id);

    /**
     * @brief 评分中断后决定重试还是放弃
     * 尝试次数耗尽时把提交标记为 failed 并上报
     * @return 是否需要在 retry_delay 之后重试
     */
    bool handle_interruption(const std::string &submission_id, const std::string &reason);

    void schedule_retry(const std::string &submission_id);

    void retry_loop();

    void poll_loop();

    store::challenge_store &challenges;
    store::submission_store &submissions;
    grading_orchestrator &orchestrator;
    client::execution_client &executor;
    monitor &mon;
    grading_config config;

    queue_positions positions;
    concurrent_queue<std::string> task_queue;

    // 已经入队或者正在评分的提交，防止同一个提交被重复评分
    std::mutex queue_mutex;
    std::set<std::string> queued;

    // 等待重试的提交，键为重新入队的时间
    std::mutex retry_mutex;
    std::condition_variable retry_cond;
    std::multimap<std::chrono::steady_clock::time_point, std::string> retries;

    std::atomic<bool> stopping{false};
    std::vector<std::thread> threads;
};

}  // namespace grader::server
