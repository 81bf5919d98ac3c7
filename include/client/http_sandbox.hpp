#pragma once

#include "client/sandbox.hpp"

namespace grader::client {

/**
 * @brief 通过 HTTP 访问的沙箱服务
 * 协议：
 * POST {url}/programs/build_run 编译并运行
 * GET {url}/environments 列出运行环境
 * 每次请求使用独立的 CURL 句柄，因此可以被多个线程同时调用
 */
struct http_sandbox : public sandbox {
    /**
     * @param url 沙箱服务的根地址，比如 http://sandbox:8000
     */
    explicit http_sandbox(const std::string &url);

    build_run_response build_and_run(const build_run_request &request, std::chrono::milliseconds timeout) override;

    std::set<std::string> list_environments(std::chrono::milliseconds timeout) override;

private:
    std::string url;
};

}  // namespace grader::client
