#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "client/execution_client.hpp"
#include "judge/challenge.hpp"
#include "judge/compare.hpp"
#include "judge/submission.hpp"

/**
 * 题目的评测程序
 *
 * 评测程序在沙箱中运行，从 stdin 读入一个 JSON 请求，向 stdout 输出一个 JSON 响应。
 * 每次运行只处理一个请求，请求的 action 字段决定操作：
 *
 * 1. prepare：运行测试点之前检查选手代码
 *    请求：{"action": "prepare", "environment": "python", "code": "..."}
 *    响应：{"code": "...", "reason": "..."}
 *    code 为 null 表示拒绝该提交，所有测试点记为 PRE_CHECK_FAILED；
 *    否则使用返回的 code 运行测试点，评测程序可以借此给选手代码加上固定的框架代码。
 *
 * 2. check：判定选手程序在一个测试点上的输出
 *    请求：{"action": "check", "test_case": "t1", "input": "...", "expected_output": "...", "output": "..."}
 *    响应：{"verdict": "OK", "reason": "..."}
 *    verdict 为 status.hpp 中评测结果的名字。
 *
 * 评测程序没有正常结束（编译失败、超时、返回值非零）时记为 SYSTEM_ERROR；
 * 正常结束但输出无法解析时记为 INVALID_OUTPUT_FORMAT。
 * 同一个题目版本的评测程序是确定的，所以这些结果和选手程序的结果一样会被缓存，不会重试。
 * 只有沙箱不可用（infrastructure_error）会中断评分。
 */
namespace grader {

/**
 * @brief prepare 操作的结果
 */
struct prepare_result {
    /**
     * @brief OK 表示可以运行测试点，否则为所有测试点的评测结果
     */
    grader::verdict verdict = grader::verdict::OK;

    /**
     * @brief 用于运行测试点的代码，verdict 为 OK 时有效
     */
    std::string code;

    std::optional<std::string> reason;
};

class evaluator {
public:
    evaluator(client::execution_client &executor, const evaluator_program &program);

    /**
     * @brief 检查选手代码
     * @throw infrastructure_error 沙箱不可用
     */
    prepare_result prepare(const submission_payload &payload);

    /**
     * @brief 判定选手程序在测试点 tc 上的输出
     * @throw infrastructure_error 沙箱不可用
     */
    compare_result check(const test_case &tc, const std::string &output);

private:
    /**
     * @brief 运行一次评测程序并解析输出
     * @throw evaluator_error 评测程序没有正常结束，或者输出不是 JSON
     */
    nlohmann::json run(const nlohmann::json &request);

    client::execution_client &executor;
    evaluator_program program;
};

}  // namespace grader
