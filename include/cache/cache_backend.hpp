#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace grader::cache {

/**
 * @brief 键值缓存的存储后端
 * 缓存不是权威数据源，后端丢失数据只会导致重新计算
 * 实现必须可以被多个线程同时调用
 */
struct cache_backend {
    virtual ~cache_backend();

    /**
     * @brief 读取缓存项
     * @return 缓存项的值，不存在或者已经过期时返回 nullopt
     */
    virtual std::optional<std::string> get(const std::string &key) = 0;

    /**
     * @brief 写入缓存项，覆盖已有的值
     * @param ttl 缓存项的存活时间
     */
    virtual void put(const std::string &key, const std::string &value, std::chrono::milliseconds ttl) = 0;

    virtual void erase(const std::string &key) = 0;
};

}  // namespace grader::cache
