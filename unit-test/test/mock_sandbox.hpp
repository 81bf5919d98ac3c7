#pragma once

#include <gmock/gmock.h>
#include <atomic>
#include <functional>
#include <nlohmann/json.hpp>
#include "client/sandbox.hpp"

namespace grader::test {

/**
 * @brief 用于检查请求内容和错误处理的 mock 沙箱
 */
struct mock_sandbox : public client::sandbox {
    MOCK_METHOD(client::build_run_response, build_and_run,
                (const client::build_run_request &request, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(std::set<std::string>, list_environments, (std::chrono::milliseconds timeout), (override));
};

/**
 * @brief 按照 program 执行选手代码的假沙箱
 * 默认的 program 把 stdin 原样输出，所以测试点的输入输出相同时就会通过。
 * 记录调用次数和同时进行中的调用数的最大值。
 */
struct scripted_sandbox : public client::sandbox {
    typedef std::function<client::build_run_response(const client::build_run_request &)> program_t;

    /**
     * @brief 评测程序：读入 stdin 中的 JSON 请求，返回输出到 stdout 的 JSON 响应
     */
    typedef std::function<nlohmann::json(const nlohmann::json &request)> evaluator_t;

    scripted_sandbox();

    client::build_run_response build_and_run(const client::build_run_request &request, std::chrono::milliseconds timeout) override;

    std::set<std::string> list_environments(std::chrono::milliseconds timeout) override;

    /**
     * @brief 把 stdin 原样输出的程序
     */
    static client::build_run_response echo(const client::build_run_request &request);

    /**
     * @brief 主文件为 evaluator_code 的请求交给 evaluator 处理，其他请求按照 echo 处理
     */
    static program_t evaluating(const std::string &evaluator_code, evaluator_t evaluator);

    program_t program;

    std::set<std::string> environments;

    /**
     * @brief 每次调用的耗时，用于制造并发
     */
    std::chrono::milliseconds latency{0};

    std::atomic<std::size_t> calls{0};
    std::atomic<std::size_t> running{0};
    std::atomic<std::size_t> peak{0};
};

}  // namespace grader::test
