#include "client/http_sandbox.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <memory>
#include "common/json_utils.hpp"

namespace grader::client {
using namespace std;
using namespace nlohmann;

struct http_response {
    long status = 0;
    string body;
};

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

/**
 * @brief 发送一个 HTTP 请求
 * @param body 为空时发送 GET，否则以 JSON 格式 POST
 * @throw sandbox_timeout 请求超时
 * @throw network_error 连接失败
 */
static http_response perform(const string &url, const optional<string> &body, chrono::milliseconds timeout) {
    unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw network_error("unable to initialize curl");

    http_response response;
    curl_slist *raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers, curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (body) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT)
        throw sandbox_timeout(fmt::format("request to {} timed out after {}ms", url, timeout.count()));
    if (res != CURLE_OK)
        throw network_error(fmt::format("request to {} failed: {}", url, curl_easy_strerror(res)));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status >= 500)
        throw network_error(fmt::format("sandbox responded {} for {}", response.status, url));
    return response;
}

http_sandbox::http_sandbox(const string &url) : url(url) {
    while (!this->url.empty() && this->url.back() == '/')
        this->url.pop_back();
}

build_run_response http_sandbox::build_and_run(const build_run_request &request, chrono::milliseconds timeout) {
    json body = request;
    http_response response = perform(url + "/programs/build_run", body.dump(), timeout);
    DLOG(INFO) << "Sandbox build_run responded " << response.status;

    try {
        build_run_response result = json::parse(response.body).get<build_run_response>();
        if (!result.error && response.status >= 400)
            throw infrastructure_error(fmt::format("sandbox responded {} without error description", response.status));
        return result;
    } catch (json::exception &e) {
        throw infrastructure_error(fmt::format("unable to parse sandbox response ({}): {}", response.status, e.what()));
    } catch (invalid_argument &e) {
        throw infrastructure_error(fmt::format("unable to parse sandbox response ({}): {}", response.status, e.what()));
    }
}

set<string> http_sandbox::list_environments(chrono::milliseconds timeout) {
    http_response response = perform(url + "/environments", nullopt, timeout);
    if (response.status >= 400)
        throw infrastructure_error(fmt::format("sandbox responded {} when listing environments", response.status));

    set<string> environments;
    try {
        json j = json::parse(response.body);
        if (!j.is_object())
            throw infrastructure_error("environments list is not an object");
        for (auto it = j.begin(); it != j.end(); ++it)
            environments.insert(it.key());
    } catch (json::exception &e) {
        throw infrastructure_error(fmt::format("unable to parse environments list: {}", e.what()));
    }
    return environments;
}

}  // namespace grader::client
