#pragma once

#include <mutex>
#include "store/mysql_conn.hpp"
#include "store/store.hpp"

namespace grader::store {

/**
 * @brief 保存在 MySQL 中的题目和提交，表结构见 script/schema.sql
 * 所有操作共享一个连接，通过互斥锁串行化
 */
class mysql_store : public challenge_store, public submission_store {
public:
    explicit mysql_store(const database_config &config);

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

private:
    submission get_submission_nolock(const std::string &id);
    std::optional<graded_result> get_result_nolock(const std::string &id);

    std::mutex mut;
    mysql_conn conn;
};

}  // namespace grader::store
