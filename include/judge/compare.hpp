#pragma once

#include <optional>
#include <string>
#include "common/status.hpp"
#include "judge/challenge.hpp"

namespace grader {

/**
 * @brief 比较器的结果
 */
struct compare_result {
    /**
     * @brief 内置比较器只给出 OK 或 WRONG_ANSWER，评测程序可以给出其他结果
     */
    grader::verdict verdict = grader::verdict::WRONG_ANSWER;

    /**
     * @brief 不一致时的说明，比如第几行不同
     */
    std::optional<std::string> reason;
};

/**
 * @brief 精确比较，所有字节必须一致
 */
compare_result compare_exact(const std::string &expected, const std::string &actual);

/**
 * @brief 忽略行末空白和文末空行后逐行比较
 * \r\n 与 \n 视为相同
 */
compare_result compare_ignore_whitespace(const std::string &expected, const std::string &actual);

/**
 * @brief 根据测试点的比较方式比较选手输出
 * @throw std::invalid_argument 比较方式为 EVALUATOR，需要通过 evaluator::check 判定
 */
compare_result compare_output(checker_rule rule, const std::string &expected, const std::string &actual);

}  // namespace grader
