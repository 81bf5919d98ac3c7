#pragma once

#include <cpp_redis/cpp_redis>
#include <functional>
#include <future>
#include <mutex>
#include <vector>
#include "config.hpp"

namespace grader::cache {

/**
 * @brief 表示一个 Redis 连接
 * cpp_redis::client 不能被多个线程同时使用，因此 execute 会加锁
 */
struct redis_conn {
    /**
     * @brief 根据 Redis 配置初始化 Redis 服务器连接
     */
    void init(const redis_config &config) noexcept;

    /**
     * @brief 在 callback 内发送 Redis 的操作
     * 该函数负责确保 Redis 连接会被建立。
     * 如果 Redis 服务器主动断开连接，那么这个函数将尝试重新创建连接，
     * 如果重试次数过多则抛出异常。
     * @param callback 你可以在 callback 内完成 Redis 的操作，并把需要等待的 reply 放进 replies
     * @note callback 可能因为重试被调用多次
     * @return replies 中各个操作的结果，顺序和放入 replies 的顺序一致
     * @throw network_error 无法连接或者操作失败次数过多
     */
    std::vector<cpp_redis::reply> execute(std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> callback);

    /**
     * @brief 尝试重连
     * @param force 真时强制重连
     */
    void reconnect(bool force = false);

private:
    redis_config config;
    std::mutex mut;
    cpp_redis::client redis_client;
};

}  // namespace grader::cache
