#include "cache/redis_cache.hpp"
#include <algorithm>
#include <limits>
#include "common/exceptions.hpp"

namespace grader::cache {
using namespace std;

redis_cache::redis_cache(const redis_config &config, const string &prefix)
    : prefix(prefix) {
    conn.init(config);
}

optional<string> redis_cache::get(const string &key) {
    auto results = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(redis.get(prefix + key));
    });
    // 键不存在时 reply 为 null
    if (results.empty() || !results[0].is_string()) return nullopt;
    return results[0].as_string();
}

void redis_cache::put(const string &key, const string &value, chrono::milliseconds ttl) {
    // PX 只接受 32 位整数
    int px = static_cast<int>(min<chrono::milliseconds::rep>(ttl.count(), numeric_limits<int>::max()));
    if (px <= 0) throw invalid_argument("cache ttl must be positive");
    conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(redis.set_advanced(prefix + key, value, false, 0, true, px));
    });
}

void redis_cache::erase(const string &key) {
    conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(redis.del({prefix + key}));
    });
}

}  // namespace grader::cache
