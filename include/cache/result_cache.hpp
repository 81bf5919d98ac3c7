#pragma once

#include <memory>
#include "cache/cache_backend.hpp"
#include "cache/claim_table.hpp"
#include "judge/result.hpp"

namespace grader::cache {

/**
 * @brief 指纹到评分结果的缓存，以及保证单飞评分的指纹占用表
 *
 * 缓存不是权威数据源：
 * 1. 读缓存失败（后端不可用、内容无法解析）视为未命中
 * 2. 写缓存失败只记录日志，评分结果已经写入数据库
 * 只有一种情况不能容忍：同一个指纹缓存了内容不同的评分结果，这说明评分不是确定性的。
 */
class result_cache {
public:
    result_cache(std::shared_ptr<cache_backend> backend, std::chrono::milliseconds ttl);

    /**
     * @brief 查找指纹对应的评分结果
     * @return 缓存的结果，cached 标记为真；未命中返回 nullopt
     */
    std::optional<graded_result> get(const std::string &fingerprint);

    /**
     * @brief 写入评分结果
     * @throw invariant_violation 缓存中已经有该指纹的另一个不同的结果
     */
    void put(const std::string &fingerprint, const graded_result &result);

    claim try_claim(const std::string &fingerprint);

    void release(const claim &c, const std::optional<graded_result> &result);

    /**
     * @brief 当前被占用的指纹数
     */
    std::size_t claimed();

private:
    std::shared_ptr<cache_backend> backend;
    std::chrono::milliseconds ttl;
    claim_table claims;
};

}  // namespace grader::cache
