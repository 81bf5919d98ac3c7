#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <thread>
#include "cache/memory_cache.hpp"
#include "config.hpp"
#include "judge/challenge.hpp"
#include "store/memory_store.hpp"

namespace grader::test {

/**
 * @brief 构造一道配合 scripted_sandbox::echo 使用的题目
 * 测试点 t1 ~ t{total} 的输入为 "case i"，前 passing 个测试点的期望输出与输入相同，
 * 其余测试点的期望输出无法被 echo 程序产生。
 */
challenge echo_challenge(const std::string &id, unsigned passing, unsigned total,
                         scoring_policy policy = scoring_policy::WEIGHTED_PARTIAL);

/**
 * @brief 测试中评测程序的代码，scripted_sandbox::evaluating 据此区分评测程序和选手程序
 */
extern const std::string EVALUATOR_CODE;

/**
 * @brief 与 echo_challenge 相同，但是所有测试点交给评测程序 EVALUATOR_CODE 判定
 */
challenge evaluated_challenge(const std::string &id, unsigned passing, unsigned total);

/**
 * @brief 行为与内置精确比较相同的评测程序
 * prepare 原样接受代码，check 在输出与期望输出相同时返回 OK
 */
nlohmann::json exact_evaluator(const nlohmann::json &request);

/**
 * @brief 创建一个 pending 的提交
 * @return 提交 id
 */
std::string create_pending(store::submission_store &store, const challenge &c, const std::string &code,
                           const std::string &environment = "python", const std::string &creator = "alice");

/**
 * @brief 单元测试使用的沙箱配置，重试间隔很短
 */
sandbox_config test_sandbox_config();

/**
 * @brief 单元测试使用的评分配置
 */
grading_config test_grading_config();

/**
 * @brief 等待异步评分满足条件
 * @return 超时之前条件是否成立
 */
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

/**
 * @brief 可以注入写入失败的内存存储
 */
struct flaky_store : public store::memory_store {
    /**
     * @brief 接下来多少次 commit_result 会失败
     */
    std::atomic<int> failing_commits{0};

    std::atomic<int> commits{0};

    graded_result commit_result(const std::string &id, const graded_result &result) override;
};

/**
 * @brief 写入时回调 on_put 的内存缓存
 */
struct recording_cache : public cache::memory_cache {
    recording_cache();

    void put(const std::string &key, const std::string &value, std::chrono::milliseconds ttl) override;

    std::function<void(const std::string &key)> on_put;

    std::atomic<int> puts{0};
};

/**
 * @brief 读写都会失败的缓存
 */
struct broken_cache : public cache::cache_backend {
    std::optional<std::string> get(const std::string &key) override;
    void put(const std::string &key, const std::string &value, std::chrono::milliseconds ttl) override;
    void erase(const std::string &key) override;
};

}  // namespace grader::test
