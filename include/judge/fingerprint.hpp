#pragma once

#include <string>
#include "judge/challenge.hpp"
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief 计算提交的指纹
 * 指纹只由题目 id、题目版本、运行环境、选手代码决定，是这几项的纯函数。
 * 字段按照固定顺序、带长度前缀地拼接后，通过 SHA-1 生成基于名字的 UUID (RFC 4122 v5)，
 * 因此字节完全相同的输入总是得到相同的指纹，而字段之间的边界不会产生歧义。
 *
 * 指纹相同的两个提交必然得到相同的评分结果，这是缓存和单飞去重的基础。
 *
 * @return 36 个字符的 UUID 字符串
 */
std::string compute_fingerprint(const std::string &challenge_id, std::uint32_t challenge_version, const submission_payload &payload);

std::string compute_fingerprint(const challenge &c, const submission_payload &payload);

}  // namespace grader
