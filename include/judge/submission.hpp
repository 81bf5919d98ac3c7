#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 选手提交的内容
 */
struct submission_payload {
    /**
     * @brief 选手代码
     */
    std::string code;

    /**
     * @brief 运行选手代码的沙箱环境名，比如 python、cpp
     */
    std::string environment;
};

/**
 * @brief 一个选手提交
 * 由提交存储独占，创建后只有评分流程会修改它的状态，永远不会被删除
 */
struct submission {
    /**
     * @brief 提交 id
     */
    std::string id;

    /**
     * @brief 提交者的用户 id
     */
    std::string creator;

    std::string challenge_id;

    std::uint32_t challenge_version = 0;

    submission_payload payload;

    /**
     * @brief 提交创建时间，毫秒级 Unix 时间戳
     */
    std::int64_t creation_timestamp = 0;

    submission_state state = submission_state::PENDING;

    /**
     * @brief 因为基础设施故障而中断的评分次数
     * 超过上限后提交被标记为 failed
     */
    unsigned attempts = 0;

    /**
     * @brief 评分时计算出的指纹，评分之前为空
     */
    std::string fingerprint;
};

void to_json(nlohmann::json &j, const submission &submit);

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.id << ":" << submit.challenge_id << "@" << submit.challenge_version << "]";
    return os;
}

}  // namespace grader
