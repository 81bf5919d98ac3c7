#include "config.hpp"
#include <limits>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

bool DEBUG = false;

void from_json(const json &j, database_config &db) {
    j.at("host").get_to(db.host);
    db.port = get_value_def<unsigned>(j, 3306, "port");
    j.at("user").get_to(db.user);
    j.at("password").get_to(db.password);
    j.at("database").get_to(db.database);
}

void from_json(const json &j, redis_config &redis) {
    j.at("host").get_to(redis.host);
    redis.port = get_value_def<int>(j, 6379, "port");
    redis.retry_interval = get_value_def<unsigned>(j, 1000, "retry_interval");
    redis.password = get_value_def<string>(j, "", "password");
}

void from_json(const json &j, sandbox_config &sandbox) {
    sandbox_config def;
    j.at("url").get_to(sandbox.url);
    sandbox.timeout = chrono::milliseconds(get_value_def<int64_t>(j, def.timeout.count(), "timeout"));
    sandbox.retries = get_value_def<unsigned>(j, def.retries, "retries");
    sandbox.retry_interval = chrono::milliseconds(get_value_def<int64_t>(j, def.retry_interval.count(), "retry_interval"));
    sandbox.max_retry_interval = chrono::milliseconds(get_value_def<int64_t>(j, def.max_retry_interval.count(), "max_retry_interval"));
    sandbox.max_concurrency = get_value_def<size_t>(j, def.max_concurrency, "max_concurrency");
    sandbox.environments_ttl = chrono::seconds(get_value_def<int64_t>(j, def.environments_ttl.count(), "environments_ttl"));
}

void from_json(const json &j, cache_config &cache) {
    cache_config def;
    cache.backend = get_value_def<string>(j, def.backend, "backend");
    cache.ttl = chrono::seconds(get_value_def<int64_t>(j, def.ttl.count(), "ttl"));
    cache.capacity = get_value_def<size_t>(j, def.capacity, "capacity");
    cache.prefix = get_value_def<string>(j, def.prefix, "prefix");
}

void from_json(const json &j, grading_config &grading) {
    grading_config def;
    grading.workers = get_value_def<unsigned>(j, def.workers, "workers");
    grading.max_attempts = get_value_def<unsigned>(j, def.max_attempts, "max_attempts");
    grading.retry_delay = chrono::milliseconds(get_value_def<int64_t>(j, def.retry_delay.count(), "retry_delay"));
    grading.max_parallel_tests = get_value_def<size_t>(j, def.max_parallel_tests, "max_parallel_tests");
    grading.max_code_size = get_value_def<size_t>(j, def.max_code_size, "max_code_size");
    grading.claim_retries = get_value_def<unsigned>(j, def.claim_retries, "claim_retries");
    grading.poll_interval = chrono::milliseconds(get_value_def<int64_t>(j, def.poll_interval.count(), "poll_interval"));
}

void from_json(const json &j, configuration &config) {
    config.store = get_value_def<string>(j, "memory", "store");
    if (exists(j, "database")) j.at("database").get_to(config.database);
    if (exists(j, "redis")) j.at("redis").get_to(config.redis);
    j.at("sandbox").get_to(config.sandbox);
    if (exists(j, "cache")) j.at("cache").get_to(config.cache);
    if (exists(j, "grading")) j.at("grading").get_to(config.grading);
}

configuration load_configuration(const filesystem::path &path) {
    configuration config;
    try {
        json j = json::parse(read_file_content(path));
        j.get_to(config);
    } catch (json::exception &e) {
        throw invalid_argument("Configuration file " + path.string() + " is malformed: " + e.what());
    }

    if (config.store != "memory" && config.store != "mysql")
        throw invalid_argument("Unrecognized store " + config.store);
    if (config.cache.backend != "memory" && config.cache.backend != "redis")
        throw invalid_argument("Unrecognized cache backend " + config.cache.backend);
    if (config.sandbox.url.empty())
        throw invalid_argument("sandbox.url must not be empty");
    if (config.grading.workers == 0 || config.grading.max_parallel_tests == 0 || config.sandbox.max_concurrency == 0)
        throw invalid_argument("workers, max_parallel_tests and max_concurrency must be positive");
    if (config.grading.max_attempts == 0)
        throw invalid_argument("grading.max_attempts must be positive");
    // Redis 的 PX 参数是 32 位整数，单位为毫秒
    if (config.cache.ttl.count() <= 0 ||
        chrono::duration_cast<chrono::milliseconds>(config.cache.ttl).count() > numeric_limits<int>::max())
        throw invalid_argument("cache.ttl must be between 1 and " + std::to_string(numeric_limits<int>::max() / 1000) + " seconds");
    return config;
}

}  // namespace grader
