#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示单个测试点或整个提交的评测结果
 */
enum class verdict {
    /**
     * @brief 选手程序通过了本测试点，或者整个提交通过了所有测试点
     */
    OK = 0,

    /**
     * @brief 答案错误
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 输出无法被比较器解析
     */
    INVALID_OUTPUT_FORMAT = 2,

    /**
     * @brief 选手程序正常退出但没有任何输出
     */
    NO_OUTPUT = 3,

    /**
     * @brief 选手程序运行时间超出限制
     * 沙箱请求本身超时也记为该结果，而不是让整个评分失败
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 选手程序运行内存超出限制
     */
    MEMORY_LIMIT_EXCEEDED = 5,

    /**
     * @brief 选手程序返回值非零
     */
    RUNTIME_ERROR = 6,

    /**
     * @brief 选手程序编译错误
     */
    COMPILATION_ERROR = 7,

    /**
     * @brief 提交在运行前的检查中被拒绝
     */
    PRE_CHECK_FAILED = 8,

    /**
     * @brief 沙箱返回了无法理解的结果
     */
    SYSTEM_ERROR = 9
};

/**
 * @brief 提交的生命周期
 * pending -> running -> completed | failed
 */
enum class submission_state {
    /**
     * @brief 等待评分，或者评分因基础设施故障中断后等待重试
     */
    PENDING = 0,

    /**
     * @brief 正在评分
     */
    RUNNING = 1,

    /**
     * @brief 评分完成，评分结果已经写入数据库，不会再改变
     */
    COMPLETED = 2,

    /**
     * @brief 重试次数耗尽，需要运维人员介入
     */
    FAILED = 3
};

const char *get_display_message(verdict);

/**
 * @brief 评测结果在数据库、缓存、沙箱协议中使用的名字，比如 WRONG_ANSWER
 */
const char *to_string(verdict);

/**
 * @brief 解析 to_string 产生的名字
 * @throw std::invalid_argument 名字不存在
 */
verdict parse_verdict(const std::string &name);

const char *to_string(submission_state);

submission_state parse_submission_state(const std::string &name);

}  // namespace grader
