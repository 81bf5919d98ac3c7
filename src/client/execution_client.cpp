#include "client/execution_client.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <thread>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace grader::client {
using namespace std;
using namespace nlohmann;

execution_client::execution_client(shared_ptr<sandbox> sb, const sandbox_config &config)
    : sb(move(sb)), config(config), permits(config.max_concurrency) {}

template <typename F>
auto execution_client::with_retry(const string &operation, F &&f) -> decltype(f()) {
    for (unsigned attempt = 0;; ++attempt) {
        try {
            semaphore_permit permit(permits);
            return f();
        } catch (network_error &ex) {
            if (attempt >= config.retries) {
                LOG(ERROR) << "Sandbox " << operation << " failed after " << attempt + 1 << " attempts: " << ex.what();
                throw infrastructure_error(fmt::format("sandbox unavailable: {}", ex.what()));
            }
            auto delay = backoff_delay(attempt, config.retry_interval, config.max_retry_interval);
            LOG(WARNING) << "Sandbox " << operation << " failed (" << ex.what() << "), retrying in " << delay.count() << "ms";
            this_thread::sleep_for(delay);
        }
    }
}

/**
 * @brief 从沙箱的编译错误信息中取出给选手看的部分
 */
static string compile_error_message(const json &details) {
    if (details.is_string()) return details.get<string>();
    if (details.is_object()) {
        string message = get_value_def<string>(details, "", "stderr");
        if (message.empty()) message = get_value_def<string>(details, "", "stdout");
        if (!message.empty()) return message;
    }
    return details.is_null() ? "" : details.dump();
}

execution_outcome execution_client::execute(const string &code, const string &input, const string &environment,
                                            const execution_limits &limits, chrono::milliseconds timeout) {
    build_run_request request;
    request.environment = environment;
    request.main_file = code;
    request.stdin_input = input;
    // 沙箱的时间限制以秒为单位，向上取整后多给一秒，是否超时由我们根据实际用时判定
    request.limits.time = limits.time_limit / 1000 + 1;
    request.limits.memory = limits.memory_limit;

    execution_outcome outcome;
    build_run_response response;
    try {
        response = with_retry("build_run", [&] { return sb->build_and_run(request, timeout); });
    } catch (sandbox_timeout &ex) {
        LOG(WARNING) << "Sandbox call timed out: " << ex.what();
        outcome.kind = execution_outcome::TIMED_OUT;
        outcome.time_used = timeout.count();
        outcome.reason = "sandbox call timed out";
        return outcome;
    }

    if (response.error) {
        if (*response.error == "compile_error") {
            outcome.kind = execution_outcome::COMPILE_ERROR;
            outcome.reason = compile_error_message(response.details);
            return outcome;
        } else if (*response.error == "environment_not_found") {
            throw validation_error("unknown environment " + environment);
        } else {
            throw infrastructure_error(fmt::format("sandbox rejected request: {} {}", *response.error, response.details.dump()));
        }
    }

    outcome.kind = execution_outcome::FINISHED;
    outcome.exit_code = response.run.status;
    outcome.stdout_output = move(response.run.stdout_output);
    outcome.stderr_output = move(response.run.stderr_output);
    outcome.time_used = response.run.time;
    outcome.memory_used = response.run.memory;
    return outcome;
}

execution_outcome execution_client::execute(const string &code, const string &input, const string &environment,
                                            const execution_limits &limits) {
    return execute(code, input, environment, limits, config.timeout);
}

set<string> execution_client::environments() {
    scoped_lock guard(environments_mutex);
    auto now = chrono::steady_clock::now();
    if (environments_fetched_at && now - *environments_fetched_at < config.environments_ttl)
        return cached_environments;

    try {
        cached_environments = with_retry("environments", [&] { return sb->list_environments(config.timeout); });
        environments_fetched_at = now;
    } catch (sandbox_timeout &ex) {
        if (!environments_fetched_at)
            throw infrastructure_error(fmt::format("unable to list sandbox environments: {}", ex.what()));
        LOG(WARNING) << "Listing sandbox environments timed out, using the stale list";
    } catch (infrastructure_error &ex) {
        if (!environments_fetched_at) throw;
        LOG(WARNING) << "Unable to refresh sandbox environments, using the stale list: " << ex.what();
    }
    return cached_environments;
}

size_t execution_client::in_flight() {
    return config.max_concurrency - permits.available();
}

}  // namespace grader::client
