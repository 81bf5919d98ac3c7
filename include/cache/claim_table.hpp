#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "judge/result.hpp"

namespace grader::cache {

/**
 * @brief 一个指纹正在进行的评分
 * 第一个占用指纹的提交是 owner，负责执行评分并发布结果；
 * 同一时刻其他占用同一指纹的提交都在 flight 上等待。
 */
struct flight {
    std::mutex mut;
    std::condition_variable cond;

    /**
     * @brief owner 是否已经释放占用
     */
    bool done = false;

    /**
     * @brief owner 发布的结果，owner 失败时为空
     */
    std::optional<graded_result> result;
};

/**
 * @brief try_claim 的结果
 */
struct claim {
    std::string fingerprint;

    /**
     * @brief 是否成功占用了指纹
     * 为真时调用方必须在结束时调用 release，不论成功还是失败
     */
    bool owner = false;

    std::shared_ptr<flight> handle;

    /**
     * @brief 等待 owner 释放占用
     * 只能由非 owner 调用
     * @return owner 发布的结果，owner 失败时返回 nullopt
     */
    std::optional<graded_result> wait() const;

    /**
     * @brief 最多等待 timeout
     * @return owner 发布的结果；owner 失败或者等待超时返回 nullopt
     */
    std::optional<graded_result> wait_for(std::chrono::milliseconds timeout) const;
};

/**
 * @brief 指纹占用表，保证同一个指纹同时最多只有一个沙箱评分
 * 进程内所有 worker 共享一张表，占用和释放都是原子的
 */
class claim_table {
public:
    /**
     * @brief 尝试占用指纹
     * 如果指纹没有被占用，返回 owner 为真的 claim；
     * 否则返回指向已有 flight 的 claim，调用方可以在上面等待
     */
    claim try_claim(const std::string &fingerprint);

    /**
     * @brief 释放占用并唤醒所有等待者
     * @param c 由 try_claim 返回的 owner claim，非 owner 调用时不做任何事
     * @param result 评分成功时的结果，失败时为 nullopt
     */
    void release(const claim &c, const std::optional<graded_result> &result);

    /**
     * @brief 当前被占用的指纹数
     */
    std::size_t size();

private:
    std::mutex mut;
    std::unordered_map<std::string, std::shared_ptr<flight>> flights;
};

}  // namespace grader::cache
