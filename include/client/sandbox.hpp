#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include "common/exceptions.hpp"

/**
 * 这个头文件描述外部沙箱服务的接口
 * 沙箱负责编译并运行不可信的选手代码，我们只通过 build_and_run 和 list_environments 两个操作访问它。
 * 沙箱特有的错误格式只能出现在 client 命名空间内，不允许泄漏到评分流程中。
 */
namespace grader::client {

/**
 * @brief 沙箱运行选手程序时的资源限制
 */
struct run_limits {
    /**
     * @brief 时间限制，单位为秒
     */
    std::uint64_t time = 1;

    /**
     * @brief 内存限制，单位为 MB
     */
    std::uint64_t memory = 256;
};

/**
 * @brief 一次编译并运行的请求
 */
struct build_run_request {
    /**
     * @brief 沙箱环境名，比如 python、cpp
     */
    std::string environment;

    /**
     * @brief 主文件内容，也就是选手代码
     */
    std::string main_file;

    std::string stdin_input;

    run_limits limits;
};

/**
 * @brief 沙箱内一个进程（编译器或者选手程序）的运行情况
 */
struct run_output {
    /**
     * @brief 进程返回值
     */
    int status = 0;

    std::string stdout_output;

    std::string stderr_output;

    /**
     * @brief 运行用时，单位为毫秒
     */
    std::uint64_t time = 0;

    /**
     * @brief 运行内存，单位为 KB
     */
    std::uint64_t memory = 0;
};

/**
 * @brief 沙箱对编译运行请求的响应
 * 如果沙箱拒绝了请求，error 保存错误类型（比如 compile_error、environment_not_found），
 * details 保存沙箱给出的附加信息
 */
struct build_run_response {
    std::optional<std::string> error;

    nlohmann::json details;

    /**
     * @brief 编译过程的输出，解释型语言没有编译过程
     */
    std::optional<run_output> build;

    run_output run;
};

/**
 * @brief 沙箱请求超过了调用方给出的超时时间
 */
struct sandbox_timeout : public grader_exception {
    sandbox_timeout();
    explicit sandbox_timeout(const std::string &message);
};

/**
 * @brief 外部沙箱服务
 * 实现必须可以被多个线程同时调用
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 编译并运行一份代码
     * @param request 请求内容
     * @param timeout 本次调用的超时时间
     * @return 沙箱的响应，包括沙箱主动拒绝请求的情况
     * @throw sandbox_timeout 请求超时
     * @throw network_error 连接失败或者沙箱返回 5xx，可以重试
     * @throw infrastructure_error 沙箱返回了无法解析的响应
     */
    virtual build_run_response build_and_run(const build_run_request &request, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 列出沙箱支持的所有运行环境名
     * @throw network_error 连接失败或者沙箱返回 5xx，可以重试
     */
    virtual std::set<std::string> list_environments(std::chrono::milliseconds timeout) = 0;
};

void to_json(nlohmann::json &j, const build_run_request &request);

void from_json(const nlohmann::json &j, run_output &output);

void from_json(const nlohmann::json &j, build_run_response &response);

}  // namespace grader::client
