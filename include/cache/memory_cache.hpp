#pragma once

#include <list>
#include <mutex>
#include <unordered_map>
#include "cache/cache_backend.hpp"

namespace grader::cache {

/**
 * @brief 进程内的 LRU 缓存，每个缓存项有独立的过期时间
 * 缓存项数超过 capacity 时淘汰最久没有被访问的项
 */
class memory_cache : public cache_backend {
public:
    explicit memory_cache(std::size_t capacity);

    std::optional<std::string> get(const std::string &key) override;

    void put(const std::string &key, const std::string &value, std::chrono::milliseconds ttl) override;

    void erase(const std::string &key) override;

    /**
     * @brief 当前保存的缓存项数，包括已过期但还没有被清除的项
     */
    std::size_t size();

private:
    struct entry {
        std::string key;
        std::string value;
        std::chrono::steady_clock::time_point expires_at;
    };

    std::size_t capacity;
    std::mutex mut;

    // 表头为最近访问的项
    std::list<entry> entries;
    std::unordered_map<std::string, std::list<entry>::iterator> index;
};

}  // namespace grader::cache
