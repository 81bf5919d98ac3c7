#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace grader::server {

/**
 * @brief 评分队列中每个提交的排队位置
 *
 * 每个入队的提交按照入队顺序获得一个递增的编号 id（从 1 开始），
 * 已经出队的提交数为 done，那么编号为 id 的提交前面还有
 * max(0, id - workers - done) 个提交在排队，位置为 0 表示正在评分。
 *
 * 可以被多个线程同时调用。
 */
class queue_positions {
public:
    explicit queue_positions(std::size_t workers);

    std::size_t workers() const;

    /**
     * @brief 正在评分的提交数
     */
    std::size_t active();

    /**
     * @brief 正在排队的提交数
     */
    std::size_t waiting();

    /**
     * @brief 提交入队
     * 同一个提交重复入队不会改变它的位置
     * @return 提交的排队位置
     */
    std::size_t push(const std::string &key);

    /**
     * @brief 提交评分结束，出队
     * 只有正在评分（位置为 0）的提交才能出队
     * @return 是否成功出队
     */
    bool pop(const std::string &key);

    /**
     * @brief 提交的排队位置，提交不在队列中时返回 nullopt
     */
    std::optional<std::size_t> position(const std::string &key);

private:
    std::size_t id_position(std::size_t id) const;

    const std::size_t worker_count;
    std::size_t counter = 0;
    std::size_t done = 0;
    std::unordered_map<std::string, std::size_t> ids;
    std::mutex mut;
};

}  // namespace grader::server
