#pragma once

#include <boost/rational.hpp>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 单个测试点的评测结果
 * 归属于一个提交，不会被其他提交共享
 */
struct execution_result {
    /**
     * @brief 对应 challenge.test_cases 中测试点的 id
     */
    std::string test_case_id;

    grader::verdict verdict = grader::verdict::SYSTEM_ERROR;

    /**
     * @brief 选手程序的返回值，没有运行（比如编译错误）时为 -1
     */
    int exit_code = -1;

    std::string stdout_output;

    std::string stderr_output;

    /**
     * @brief 运行用时
     * @note 单位为毫秒
     */
    std::uint64_t time_used = 0;

    /**
     * @brief 运行使用的内存
     * @note 单位为 KB
     */
    std::uint64_t memory_used = 0;

    /**
     * @brief 错误原因，比如编译器输出或者比较器的说明
     */
    std::optional<std::string> reason;
};

/**
 * @brief 整个提交的评分结果
 * 每个提交只写入一次，写入后不可修改
 */
struct graded_result {
    /**
     * @brief 计算该结果时使用的指纹
     */
    std::string fingerprint;

    /**
     * @brief 总体评测结果：全部通过为 OK，否则为第一个未通过测试点的结果
     */
    grader::verdict verdict = grader::verdict::SYSTEM_ERROR;

    /**
     * @brief 得分比例，范围是 0~1
     */
    boost::rational<int> score;

    std::size_t passed = 0;

    std::size_t total = 0;

    /**
     * @brief 按照题目测试点顺序排列的各测试点结果
     */
    std::vector<execution_result> results;

    /**
     * @brief 该提交是否直接复用了缓存中的结果
     * 不参与结果比较
     */
    bool cached = false;

    /**
     * @brief 以百分比表示的得分
     */
    double percentage() const;
};

/**
 * @brief 比较两个评分结果的内容是否一致，忽略 cached 标记
 */
bool same_outcome(const graded_result &a, const graded_result &b);

void to_json(nlohmann::json &j, const execution_result &result);
void from_json(const nlohmann::json &j, execution_result &result);

void to_json(nlohmann::json &j, const graded_result &result);
void from_json(const nlohmann::json &j, graded_result &result);

}  // namespace grader
