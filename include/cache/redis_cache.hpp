#pragma once

#include "cache/cache_backend.hpp"
#include "cache/redis_conn.hpp"

namespace grader::cache {

/**
 * @brief 以 Redis 为后端的缓存
 * 缓存项通过 SET key value PX ttl 写入，过期和淘汰交给 Redis 服务器（maxmemory-policy）处理
 */
class redis_cache : public cache_backend {
public:
    /**
     * @param prefix 所有键的前缀，用于和同一个 Redis 上的其他数据区分
     */
    redis_cache(const redis_config &config, const std::string &prefix);

    std::optional<std::string> get(const std::string &key) override;

    void put(const std::string &key, const std::string &value, std::chrono::milliseconds ttl) override;

    void erase(const std::string &key) override;

private:
    std::string prefix;
    redis_conn conn;
};

}  // namespace grader::cache
