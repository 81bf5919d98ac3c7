#pragma once

#include <vector>
#include "judge/challenge.hpp"
#include "judge/result.hpp"

namespace grader {

/**
 * @brief 根据题目的计分方式汇总各测试点的结果
 *
 * 总体评测结果：全部测试点通过时为 OK，否则为按题目测试点顺序第一个未通过的测试点的结果。
 * 得分：
 * 1. ALL_OR_NOTHING：全部通过为 1，否则为 0
 * 2. WEIGHTED_PARTIAL：通过的测试点权重之和 / 总权重
 *
 * 结果只和 results 的内容有关，和测试点执行完成的先后顺序无关：
 * results 会按照 challenge.test_cases 的顺序重新排列。
 *
 * @param c 题目，提供测试点顺序、权重和计分方式
 * @param results 各测试点的执行结果，每个测试点恰好一个
 * @param fingerprint 写入评分结果的指纹
 * @throw std::invalid_argument 题目没有测试点，或者 results 和测试点对不上
 */
graded_result aggregate(const challenge &c, std::vector<execution_result> results, const std::string &fingerprint);

}  // namespace grader
