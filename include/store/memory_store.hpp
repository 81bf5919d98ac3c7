#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include "store/store.hpp"

namespace grader::store {

/**
 * @brief 保存在进程内存中的题目和提交
 * 用于单元测试和本地调试，进程退出后数据丢失
 */
class memory_store : public challenge_store, public submission_store {
public:
    challenge get_challenge(const std::string &id, std::uint32_t version) override;
    std::optional<std::uint32_t> latest_version(const std::string &id) override;
    void put_challenge(const challenge &c) override;

    void create_submission(const submission &submit) override;
    submission get_submission(const std::string &id) override;
    void mark_running(const std::string &id, const std::string &fingerprint) override;
    unsigned mark_pending(const std::string &id) override;
    void mark_failed(const std::string &id, const std::string &reason) override;
    graded_result commit_result(const std::string &id, const graded_result &result) override;
    std::optional<graded_result> get_result(const std::string &id) override;
    std::vector<submission> list_unfinished() override;
    std::vector<submission> list_submissions(const std::string &challenge_id, const std::string &creator) override;

    /**
     * @brief 已经写入的评分结果数
     */
    std::size_t result_count();

private:
    submission &find_submission(const std::string &id);

    std::mutex mut;

    // (题目 id, 版本) -> 题目
    std::map<std::pair<std::string, std::uint32_t>, challenge> challenges;

    std::unordered_map<std::string, submission> submissions;

    std::unordered_map<std::string, graded_result> results;
};

}  // namespace grader::store
