#pragma once

#include <functional>
#include <optional>
#include <string>
#include "client/execution_client.hpp"
#include "judge/challenge.hpp"
#include "judge/compare.hpp"
#include "judge/result.hpp"

namespace grader {

/**
 * @brief 判定选手输出的比较器
 */
typedef std::function<compare_result(const test_case &tc, const std::string &output)> output_checker;

/**
 * @brief 根据测试点要求判定一次执行的结果
 * 判定顺序：
 * 1. 编译错误：COMPILATION_ERROR
 * 2. 沙箱调用超时，或者用时超过时间限制：TIME_LIMIT_EXCEEDED
 * 3. 内存超过限制：MEMORY_LIMIT_EXCEEDED
 * 4. 返回值非零：RUNTIME_ERROR
 * 5. 没有任何输出：NO_OUTPUT
 * 6. 交给测试点的比较器判定：OK 或 WRONG_ANSWER
 */
execution_result classify(const test_case &tc, client::execution_outcome outcome);

/**
 * @brief 判定顺序与上面相同，第 6 步交给 checker 判定
 */
execution_result classify(const test_case &tc, client::execution_outcome outcome, const output_checker &checker);

/**
 * @brief 没有运行选手程序的测试点结果，比如提交没有通过评测程序的 prepare 检查
 */
execution_result rejected(const test_case &tc, verdict v, const std::optional<std::string> &reason);

}  // namespace grader
