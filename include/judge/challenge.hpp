#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含题目信息
 * 包含：
 * 1. test_case 类（表示一个测试点）
 * 2. scoring_policy（表示题目的计分方式）
 * 3. evaluator_program（表示题目附带的评测程序）
 * 4. challenge 类（表示一道题目的某个版本）
 */
namespace grader {

/**
 * @brief 比较选手输出和标准输出的方式
 */
enum class checker_rule {
    EXACT,             // 精确比较，所有字符必须一致
    IGNORE_WHITESPACE, // 忽略行末空格和文末空行
    EVALUATOR          // 交给题目的评测程序判定
};

/**
 * @brief 单个测试点的最大权重
 * 分数以 boost::rational<int> 保存，一道题目所有测试点的权重之和也不能超过 int 的范围
 */
constexpr unsigned MAX_TEST_CASE_WEIGHT = 1000000;

/**
 * @brief 表示一个测试点
 * 题目发布后测试点不允许修改，修改题目会产生一个新版本
 */
struct test_case {
    /**
     * @brief 测试点的 id，在同一个题目版本内唯一
     */
    std::string id;

    /**
     * @brief 喂给选手程序 stdin 的数据
     */
    std::string input;

    /**
     * @brief 期望选手程序在 stdout 输出的数据
     */
    std::string expected_output;

    checker_rule checker = checker_rule::IGNORE_WHITESPACE;

    /**
     * @brief 时间限制
     * @note 单位为毫秒
     */
    std::uint64_t time_limit = 1000;

    /**
     * @brief 内存限制
     * @note 单位为 MB
     */
    std::uint64_t memory_limit = 256;

    /**
     * @brief 测试点权重，WEIGHTED_PARTIAL 计分时使用
     * 取值范围为 1 ~ MAX_TEST_CASE_WEIGHT
     */
    unsigned weight = 1;
};

/**
 * @brief 题目的计分方式
 * 计分方式是一个封闭集合，每道题目选择其中一种
 */
enum class scoring_policy {
    /**
     * @brief 全部测试点通过得满分，否则得零分
     */
    ALL_OR_NOTHING,

    /**
     * @brief 按照通过的测试点的权重之和占总权重的比例给分
     */
    WEIGHTED_PARTIAL
};

/**
 * @brief 题目附带的评测程序
 * 评测程序和选手程序一样在沙箱中运行，见 judge/evaluator.hpp
 */
struct evaluator_program {
    /**
     * @brief 评测程序的运行环境
     */
    std::string environment = "python";

    std::string code;

    /**
     * @brief 单次运行评测程序的时间限制
     * @note 单位为毫秒
     */
    std::uint64_t time_limit = 5000;

    /**
     * @brief 单次运行评测程序的内存限制
     * @note 单位为 MB
     */
    std::uint64_t memory_limit = 256;
};

/**
 * @brief 一道题目的某个版本
 */
struct challenge {
    std::string id;

    /**
     * @brief 题目版本号，从 1 开始递增
     * 缓存的评分结果只对计算时使用的版本有效
     */
    std::uint32_t version = 1;

    /**
     * @brief 未发布的版本不接受提交
     */
    bool published = true;

    std::vector<test_case> test_cases;

    scoring_policy policy = scoring_policy::WEIGHTED_PARTIAL;

    /**
     * @brief 评测程序，为空时只能使用内置的比较方式
     * 存在评测程序时，每个提交在运行测试点之前都要经过评测程序的 prepare 检查
     */
    std::optional<evaluator_program> evaluator;
};

const char *to_string(checker_rule rule);
checker_rule parse_checker_rule(const std::string &name);

const char *to_string(scoring_policy policy);
scoring_policy parse_scoring_policy(const std::string &name);

/**
 * @brief 检查题目是否可以被发布
 * 题目必须至少有一个测试点，测试点 id 不能重复，
 * 权重必须在 1 ~ MAX_TEST_CASE_WEIGHT 之间，且权重之和不能超过 int 的范围，
 * 使用 EVALUATOR 比较方式的题目必须附带评测程序
 * @throw validation_error 题目不合法
 */
void validate_challenge(const challenge &c);

void to_json(nlohmann::json &j, const test_case &tc);
void from_json(const nlohmann::json &j, test_case &tc);

void to_json(nlohmann::json &j, const evaluator_program &e);
void from_json(const nlohmann::json &j, evaluator_program &e);

void to_json(nlohmann::json &j, const challenge &c);
void from_json(const nlohmann::json &j, challenge &c);

template <typename T>
T &operator<<(T &os, const challenge &c) {
    os << "Challenge[" << c.id << "@" << c.version << "]";
    return os;
}

}  // namespace grader
