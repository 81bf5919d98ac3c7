#pragma once

#include <string>
#include <vector>
#include "cache/result_cache.hpp"
#include "client/execution_client.hpp"
#include "config.hpp"
#include "judge/challenge.hpp"
#include "judge/result.hpp"
#include "monitor/monitor.hpp"
#include "store/store.hpp"

/**
 * 评分流程
 *
 * 一个提交的评分流程如下：
 * 1. 读取提交：已完成的提交直接返回数据库中的结果，已失败的提交报告基础设施错误
 * 2. 读取提交对应的题目版本，题目不存在或者未发布时报告 not_found_error
 * 3. 计算指纹
 * 4. 缓存命中：直接把缓存的结果写入提交，不调用沙箱
 * 5. 缓存未命中：尝试占用指纹。
 *    如果其他提交正在评分同一个指纹，则等待它的结果；它失败时重新尝试占用（有限次）
 * 6. 占用成功：再查一次缓存，然后把提交标记为 running。
 *    题目附带评测程序时先由评测程序检查代码，未通过检查的提交不运行任何测试点；
 *    然后通过执行客户端并发运行所有测试点（不超过 max_parallel_tests）
 * 7. 按照题目的计分方式汇总结果
 * 8. 在一个事务内写入评分结果并把提交标记为 completed；写入成功后才写缓存，最后释放占用
 *
 * 基础设施故障（沙箱不可用、数据库不可用）会中断评分：提交回到 pending 状态，
 * 尝试次数加一，占用被释放但不发布结果，异常继续向上抛出。
 * 其他未预期的异常同样会把提交放回 pending，避免提交停留在 running 状态。
 * 重新调用 grade 最终会得到相同的评分结果。
 */
namespace grader {

class grading_orchestrator {
public:
    grading_orchestrator(store::challenge_store &challenges,
                         store::submission_store &submissions,
                         cache::result_cache &cache,
                         client::execution_client &executor,
                         monitor &mon,
                         const grading_config &config);

    /**
     * @brief 评分一个提交
     * @param submission_id 提交 id
     * @return 提交的评分结果
     * @throw not_found_error 提交、题目或题目版本不存在，或者题目未发布
     * @throw validation_error 沙箱不支持提交的运行环境，提交被标记为 failed
     * @throw infrastructure_error 评分因基础设施故障中断，提交回到 pending
     * @throw invariant_violation 同一个指纹得到了不同的评分结果
     */
    graded_result grade(const std::string &submission_id);

    /**
     * @brief 读取提交对应的已发布题目版本
     * @throw not_found_error 题目版本不存在或者未发布
     */
    challenge load_challenge(const std::string &challenge_id, std::uint32_t version);

private:
    graded_result grade_as_owner(const submission &submit, const challenge &c, const cache::claim &cl);

    std::vector<execution_result> run_test_cases(const challenge &c, const submission_payload &payload);

    /**
     * @brief 写入评分结果，失败时把提交放回 pending
     */
    graded_result commit(const submission &submit, const graded_result &result);

    /**
     * @brief 尽力把提交放回 pending 并上报
     */
    void interrupt(const submission &submit, const std::string &reason);

    store::challenge_store &challenges;
    store::submission_store &submissions;
    cache::result_cache &cache;
    client::execution_client &executor;
    monitor &mon;
    grading_config config;
};

}  // namespace grader
