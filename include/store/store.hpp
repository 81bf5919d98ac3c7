#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "judge/challenge.hpp"
#include "judge/result.hpp"
#include "judge/submission.hpp"

/**
 * 这个头文件包含评分服务的持久化接口
 * 1. challenge_store：题目仓库，读多写少，已发布的版本不可修改
 * 2. submission_store：提交记录，是评分结果的权威数据源
 * 实现必须可以被多个线程同时调用
 */
namespace grader::store {

struct challenge_store {
    virtual ~challenge_store();

    /**
     * @brief 读取题目的某个版本
     * @throw not_found_error 题目或版本不存在
     * @throw database_error 存储不可用
     */
    virtual challenge get_challenge(const std::string &id, std::uint32_t version) = 0;

    /**
     * @brief 题目的最新版本号
     * @return 题目不存在时返回 nullopt
     */
    virtual std::optional<std::uint32_t> latest_version(const std::string &id) = 0;

    /**
     * @brief 保存题目的一个新版本
     * 已经存在的版本永远不会被覆盖，修改题目必须产生新版本
     * @throw validation_error 题目不合法，或者该版本已经存在
     */
    virtual void put_challenge(const challenge &c) = 0;
};

struct submission_store {
    virtual ~submission_store();

    /**
     * @brief 保存一个新提交，状态为 pending
     * @throw validation_error 提交 id 已经存在
     */
    virtual void create_submission(const submission &submit) = 0;

    /**
     * @throw not_found_error 提交不存在
     */
    virtual submission get_submission(const std::string &id) = 0;

    /**
     * @brief 提交开始评分
     * @param fingerprint 评分使用的指纹
     */
    virtual void mark_running(const std::string &id, const std::string &fingerprint) = 0;

    /**
     * @brief 评分因为基础设施故障中断，提交回到 pending 状态
     * 已经完成的提交不受影响
     * @return 增加后的尝试次数
     */
    virtual unsigned mark_pending(const std::string &id) = 0;

    /**
     * @brief 尝试次数耗尽，提交被标记为 failed
     */
    virtual void mark_failed(const std::string &id, const std::string &reason) = 0;

    /**
     * @brief 在一个事务内写入评分结果并把提交标记为 completed
     * 每个提交的评分结果只写入一次：如果提交已经完成，不做任何修改。
     * @return 数据库中该提交最终的评分结果
     * @throw database_error 事务失败，没有任何修改被写入
     */
    virtual graded_result commit_result(const std::string &id, const graded_result &result) = 0;

    /**
     * @brief 读取已完成提交的评分结果
     * @return 提交未完成时返回 nullopt
     * @throw not_found_error 提交不存在
     */
    virtual std::optional<graded_result> get_result(const std::string &id) = 0;

    /**
     * @brief 所有还没有评分结果的提交（pending 或 running），按创建时间从早到晚排列
     * 进程在评分过程中退出时，提交会停留在 running 状态，重启后需要重新评分
     */
    virtual std::vector<submission> list_unfinished() = 0;

    /**
     * @brief 某个用户在某道题目上的提交历史，按创建时间从晚到早排列
     */
    virtual std::vector<submission> list_submissions(const std::string &challenge_id, const std::string &creator) = 0;
};

}  // namespace grader::store
