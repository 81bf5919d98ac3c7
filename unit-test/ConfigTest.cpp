#include "gtest/gtest.h"
#include <filesystem>
#include <fstream>
#include "config.hpp"

using namespace std;
using namespace grader;

class ConfigTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        filesystem::create_directories(dir);
    }

    filesystem::path write(const string &name, const string &content) {
        filesystem::path path = dir / name;
        ofstream fout(path);
        fout << content;
        return path;
    }

    static inline const filesystem::path dir = "/tmp/test/config";
};

TEST_F(ConfigTest, MinimalConfigurationUsesDefaults) {
    configuration config = load_configuration(write("minimal.json", R"({"sandbox": {"url": "http://localhost:8000"}})"));

    EXPECT_EQ(config.store, "memory");
    EXPECT_EQ(config.sandbox.url, "http://localhost:8000");
    EXPECT_EQ(config.sandbox.timeout, chrono::milliseconds(10000));
    EXPECT_EQ(config.sandbox.retries, 3u);
    EXPECT_EQ(config.cache.backend, "memory");
    EXPECT_EQ(config.cache.ttl, chrono::seconds(3600));
    EXPECT_EQ(config.grading.workers, 4u);
    EXPECT_EQ(config.grading.max_code_size, 65536u);
    EXPECT_EQ(config.grading.poll_interval, chrono::milliseconds(0));
}

TEST_F(ConfigTest, FullConfiguration) {
    configuration config = load_configuration(write("full.json", R"({
        "store": "mysql",
        "database": {"host": "db", "user": "grader", "password": "secret", "database": "grader"},
        "redis": {"host": "cache", "port": 6380},
        "sandbox": {"url": "http://sandbox:8000", "timeout": 3000, "retries": 1, "max_concurrency": 16, "environments_ttl": 60},
        "cache": {"backend": "redis", "ttl": 600, "prefix": "test:"},
        "grading": {"workers": 8, "max_attempts": 2, "retry_delay": 100, "max_parallel_tests": 3, "poll_interval": 500}
    })"));

    EXPECT_EQ(config.store, "mysql");
    EXPECT_EQ(config.database.host, "db");
    EXPECT_EQ(config.database.port, 3306u);
    EXPECT_EQ(config.redis.port, 6380);
    EXPECT_EQ(config.sandbox.timeout, chrono::milliseconds(3000));
    EXPECT_EQ(config.sandbox.retries, 1u);
    EXPECT_EQ(config.sandbox.max_concurrency, 16u);
    EXPECT_EQ(config.sandbox.environments_ttl, chrono::seconds(60));
    EXPECT_EQ(config.cache.backend, "redis");
    EXPECT_EQ(config.cache.prefix, "test:");
    EXPECT_EQ(config.grading.workers, 8u);
    EXPECT_EQ(config.grading.max_attempts, 2u);
    EXPECT_EQ(config.grading.retry_delay, chrono::milliseconds(100));
    EXPECT_EQ(config.grading.max_parallel_tests, 3u);
    EXPECT_EQ(config.grading.poll_interval, chrono::milliseconds(500));
}

TEST_F(ConfigTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(load_configuration(write("broken.json", "{")), invalid_argument);
    EXPECT_THROW(load_configuration(write("nosandbox.json", "{}")), invalid_argument);
    EXPECT_THROW(load_configuration(write("store.json", R"({"store": "sqlite", "sandbox": {"url": "x"}})")), invalid_argument);
    EXPECT_THROW(load_configuration(write("backend.json", R"({"cache": {"backend": "disk"}, "sandbox": {"url": "x"}})")), invalid_argument);
    EXPECT_THROW(load_configuration(write("workers.json", R"({"grading": {"workers": 0}, "sandbox": {"url": "x"}})")), invalid_argument);
    EXPECT_THROW(load_configuration(write("ttl.json", R"({"cache": {"ttl": 0}, "sandbox": {"url": "x"}})")), invalid_argument);
    // 超过 24 天的毫秒数无法放进 Redis 的 PX 参数
    EXPECT_THROW(load_configuration(write("long_ttl.json", R"({"cache": {"ttl": 2592000}, "sandbox": {"url": "x"}})")), invalid_argument);
    EXPECT_EQ(load_configuration(write("max_ttl.json", R"({"cache": {"ttl": 2147483}, "sandbox": {"url": "x"}})")).cache.ttl,
              chrono::seconds(2147483));
}
