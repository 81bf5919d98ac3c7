#include "cache/redis_conn.hpp"
#include <glog/logging.h>
#include <thread>
#include "common/exceptions.hpp"

namespace grader::cache {
using namespace std;

static bool connect_to_server(cpp_redis::client &redis_client, const redis_config &config) {
    LOG(INFO) << "Redis: Setup connection with server " << config.host << ":" << config.port;
    redis_client.connect(config.host, config.port,
                         [](const std::string &host, std::size_t port,
                            cpp_redis::connect_state status) {
                             if (status == cpp_redis::connect_state::dropped) {
                                 LOG(INFO) << "Redis: client disconnected from " << host
                                           << ":" << port;
                             }
                         });
    if (!config.password.empty()) {
        LOG(INFO) << "Redis: Trying to Auth";
        auto future = redis_client.auth(config.password);
        redis_client.sync_commit();
        LOG(INFO) << "Redis: Auth Reply: " << future.get();
    }
    if (redis_client.is_connected()) {
        LOG(INFO) << "Redis: Connecting to redis server succeeded " << config.host << ":" << config.port;
        return true;
    } else {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << config.host << ":" << config.port;
        return false;
    }
}

void redis_conn::reconnect(bool force) {
    int fail = 0;
    if (force && redis_client.is_connected())
        redis_client.disconnect(true);
    for (; !redis_client.is_connected() && fail < 5; ++fail) {
        LOG(INFO) << "Redis: Lost connection, trying to reconnect";
        if (fail > 0)
            this_thread::sleep_for(chrono::milliseconds(config.retry_interval));
        try {
            connect_to_server(redis_client, config);
        } catch (cpp_redis::redis_error &e) {
            LOG(WARNING) << "Redis: " << e.what();
        }
    }
    if (!redis_client.is_connected()) {
        throw network_error("unable to connect to redis server " + config.host);
    }
}

void redis_conn::init(const redis_config &config) noexcept {
    this->config = config;
}

vector<cpp_redis::reply> redis_conn::execute(function<void(cpp_redis::client &, vector<future<cpp_redis::reply>> &)> callback) {
    scoped_lock guard(mut);
    // cpp_redis 的 is_connected 似乎有问题，最后执行操作时的 reply 仍然是 network error
    // 因此这里也做个强制重连。
    reconnect(false);  // 先弱重连一次
    string message;
    for (int fail = 0; fail < 5; ++fail) {  // 错误尝试至多额外 4 次
        bool reconn = false;
        vector<future<cpp_redis::reply>> replies;
        vector<cpp_redis::reply> results;
        callback(redis_client, replies);
        DLOG(INFO) << "Syncing operations to server";
        redis_client.sync_commit();
        DLOG(INFO) << "Synced operations to server";
        for (auto &reply : replies) {  // 阻塞到所有操作完成为止
            cpp_redis::reply r = reply.get();
            // 如果有操作失败，则标记重试并保存错误信息
            if (r.is_error()) reconn = true, message = r.error();
            results.push_back(move(r));
        }
        if (!reconn) return results;
        reconnect(true);  // 操作失败，强制重连
    }
    // 失败次数过多，取消操作
    throw network_error("Redis: unable to finish execution: " + message);
}

}  // namespace grader::cache
