#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

/**
 * 评分服务的配置
 * 配置文件为 JSON 格式，每一节对应一个结构体：
 * {
 *     "store": "mysql",
 *     "database": { "host": "...", "port": 3306, "user": "...", "password": "...", "database": "..." },
 *     "redis": { "host": "...", "port": 6379, "password": "", "retry_interval": 1000 },
 *     "sandbox": { "url": "http://sandbox:8000", "timeout": 10000, "retries": 3, ... },
 *     "cache": { "backend": "redis", "ttl": 3600, "capacity": 4096, "prefix": "grader:result:" },
 *     "grading": { "workers": 4, "max_attempts": 5, ... }
 * }
 * 除了 sandbox.url 以外的字段都有默认值
 */
namespace grader {

/**
 * @brief 调试模式，打开后输出 DLOG 级别的日志
 */
extern bool DEBUG;

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database_config {
    /**
     * @brief 数据库服务器的地址
     */
    std::string host = "localhost";

    unsigned port = 3306;

    /**
     * @brief 数据库服务器的账号
     */
    std::string user;

    /**
     * @brief 数据库服务器的密码
     */
    std::string password;

    /**
     * @brief 使用连接到的数据库服务器的哪一个数据库
     */
    std::string database;
};

/**
 * redis 的登录情况
 */
struct redis_config {
    /**
     * @brief redis 服务器地址
     */
    std::string host = "localhost";

    /**
     * @brief redis 服务器端口
     */
    int port = 6379;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval = 1000;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;
};

/**
 * @brief 沙箱服务的访问策略
 */
struct sandbox_config {
    /**
     * @brief 沙箱服务的根地址
     */
    std::string url;

    /**
     * @brief 单次沙箱调用的超时时间
     * 超时的测试点记为 TIME_LIMIT_EXCEEDED
     */
    std::chrono::milliseconds timeout{10000};

    /**
     * @brief 连接失败或者 5xx 时的最大重试次数
     */
    unsigned retries = 3;

    /**
     * @brief 第一次重试前的等待时间，之后每次翻倍
     */
    std::chrono::milliseconds retry_interval{200};

    /**
     * @brief 重试等待时间的上限
     */
    std::chrono::milliseconds max_retry_interval{5000};

    /**
     * @brief 同时发往沙箱的请求数上限
     */
    std::size_t max_concurrency = 8;

    /**
     * @brief 运行环境列表的缓存时间
     */
    std::chrono::seconds environments_ttl{300};
};

/**
 * @brief 评分结果缓存的配置
 */
struct cache_config {
    /**
     * @brief memory 或 redis
     */
    std::string backend = "memory";

    /**
     * @brief 缓存项的存活时间
     */
    std::chrono::seconds ttl{3600};

    /**
     * @brief memory 后端最多保存的缓存项数，超出后淘汰最久未使用的项
     */
    std::size_t capacity = 4096;

    /**
     * @brief redis 后端的键前缀
     */
    std::string prefix = "grader:result:";
};

/**
 * @brief 评分流程的配置
 */
struct grading_config {
    /**
     * @brief worker 线程数，也就是同时评分的提交数
     */
    unsigned workers = 4;

    /**
     * @brief 因为基础设施故障中断的评分最多尝试的次数，之后提交被标记为 failed
     */
    unsigned max_attempts = 5;

    /**
     * @brief 评分中断后重新排队前的等待时间
     */
    std::chrono::milliseconds retry_delay{5000};

    /**
     * @brief 单个提交同时运行的测试点数上限
     */
    std::size_t max_parallel_tests = 4;

    /**
     * @brief 选手代码的最大字节数
     */
    std::size_t max_code_size = 65536;

    /**
     * @brief 等待其他提交评分同一指纹失败后，重新尝试占用的次数
     */
    unsigned claim_retries = 3;

    /**
     * @brief 轮询数据库中 pending 提交的间隔，0 表示不轮询
     */
    std::chrono::milliseconds poll_interval{0};
};

/**
 * @brief 评分服务的全部配置
 */
struct configuration {
    /**
     * @brief 题目和提交的存储方式：memory 或 mysql
     */
    std::string store = "memory";

    database_config database;

    redis_config redis;

    sandbox_config sandbox;

    cache_config cache;

    grading_config grading;
};

void from_json(const nlohmann::json &j, database_config &config);
void from_json(const nlohmann::json &j, redis_config &config);
void from_json(const nlohmann::json &j, sandbox_config &config);
void from_json(const nlohmann::json &j, cache_config &config);
void from_json(const nlohmann::json &j, grading_config &config);
void from_json(const nlohmann::json &j, configuration &config);

/**
 * @brief 读取并校验配置文件
 * @throw std::invalid_argument 配置文件不合法
 * @throw std::runtime_error 配置文件无法读取
 */
configuration load_configuration(const std::filesystem::path &path);

}  // namespace grader
