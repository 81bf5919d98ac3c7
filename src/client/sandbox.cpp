#include "client/sandbox.hpp"
#include "common/json_utils.hpp"

namespace grader::client {
using namespace std;
using namespace nlohmann;

sandbox_timeout::sandbox_timeout()
    : grader_exception() {}

sandbox_timeout::sandbox_timeout(const string &message)
    : grader_exception(message) {}

sandbox::~sandbox() {}

void to_json(json &j, const build_run_request &request) {
    j = {{"build", {{"environment", request.environment},
                    {"main_file", {{"content", request.main_file}}}}},
         {"run", {{"stdin", request.stdin_input},
                  {"run_limits", {{"time", request.limits.time},
                                  {"memory", request.limits.memory}}}}}};
}

void from_json(const json &j, run_output &output) {
    output.status = get_value<int>(j, "status");
    output.stdout_output = get_value_def<string>(j, "", "stdout");
    output.stderr_output = get_value_def<string>(j, "", "stderr");
    output.time = get_value_def<uint64_t>(j, 0, "resource_usage", "time");
    output.memory = get_value_def<uint64_t>(j, 0, "resource_usage", "memory");
}

void from_json(const json &j, build_run_response &response) {
    if (exists(j, "error")) {
        response.error = j.at("error").get<string>();
        response.details = exists(j, "details") ? j.at("details") : json();
        return;
    }
    response.error.reset();
    if (exists(j, "build"))
        response.build = j.at("build").get<run_output>();
    else
        response.build.reset();
    j.at("run").get_to(response.run);
}

}  // namespace grader::client
