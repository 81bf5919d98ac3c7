#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include "client/sandbox.hpp"
#include "common/semaphore.hpp"
#include "config.hpp"

namespace grader::client {

/**
 * @brief 运行选手程序时的资源限制
 */
struct execution_limits {
    /**
     * @brief 时间限制，单位为毫秒
     */
    std::uint64_t time_limit = 1000;

    /**
     * @brief 内存限制，单位为 MB
     */
    std::uint64_t memory_limit = 256;
};

/**
 * @brief 一次执行的结果，已经去掉了沙箱特有的错误格式
 */
struct execution_outcome {
    enum kind_t {
        /**
         * @brief 程序运行结束（不论返回值是否为 0）
         */
        FINISHED,

        /**
         * @brief 编译失败，没有运行
         */
        COMPILE_ERROR,

        /**
         * @brief 沙箱调用超时
         */
        TIMED_OUT
    };

    kind_t kind = FINISHED;

    int exit_code = -1;

    std::string stdout_output;

    std::string stderr_output;

    /**
     * @brief 运行用时，单位为毫秒
     */
    std::uint64_t time_used = 0;

    /**
     * @brief 运行内存，单位为 KB
     */
    std::uint64_t memory_used = 0;

    /**
     * @brief 编译错误信息或者超时说明
     */
    std::optional<std::string> reason;
};

/**
 * @brief 沙箱的类型化客户端
 * 负责：
 * 1. 单次调用的超时：超时的调用返回 TIMED_OUT，而不是抛出异常
 * 2. 网络错误和 5xx 的有限次指数退避重试，重试耗尽后抛出 infrastructure_error
 * 3. 全局并发上限：所有 worker 共享同一个信号量
 * 4. 把沙箱的错误格式翻译为评分流程能理解的结果
 */
class execution_client {
public:
    execution_client(std::shared_ptr<sandbox> sb, const sandbox_config &config);

    /**
     * @brief 在沙箱中编译并运行一份代码
     * @param code 选手代码
     * @param input 喂给 stdin 的数据
     * @param environment 运行环境名
     * @param limits 资源限制
     * @param timeout 本次调用的超时时间
     * @throw validation_error 沙箱不支持该运行环境
     * @throw infrastructure_error 沙箱持续不可用
     */
    execution_outcome execute(const std::string &code, const std::string &input, const std::string &environment,
                              const execution_limits &limits, std::chrono::milliseconds timeout);

    /**
     * @brief 使用配置中的默认超时时间执行
     */
    execution_outcome execute(const std::string &code, const std::string &input, const std::string &environment,
                              const execution_limits &limits);

    /**
     * @brief 沙箱支持的运行环境
     * 结果会缓存 environments_ttl，刷新失败时沿用旧的列表
     * @throw infrastructure_error 从未成功获取过环境列表，且沙箱不可用
     */
    std::set<std::string> environments();

    /**
     * @brief 当前正在进行的沙箱调用数
     */
    std::size_t in_flight();

private:
    template <typename F>
    auto with_retry(const std::string &operation, F &&f) -> decltype(f());

    std::shared_ptr<sandbox> sb;
    sandbox_config config;
    counting_semaphore permits;

    std::mutex environments_mutex;
    std::set<std::string> cached_environments;
    std::optional<std::chrono::steady_clock::time_point> environments_fetched_at;
};

}  // namespace grader::client
