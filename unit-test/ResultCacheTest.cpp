#include "gtest/gtest.h"
#include "cache/result_cache.hpp"
#include "common/exceptions.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;
using namespace grader::cache;

class ResultCacheTest : public ::testing::Test {
protected:
    graded_result sample(const string &fingerprint, verdict v = verdict::OK) {
        graded_result result;
        result.fingerprint = fingerprint;
        result.verdict = v;
        result.score = v == verdict::OK ? 1 : 0;
        result.passed = v == verdict::OK ? 1 : 0;
        result.total = 1;
        execution_result er;
        er.test_case_id = "t1";
        er.verdict = v;
        er.exit_code = 0;
        er.stdout_output = "42\n";
        er.time_used = 12;
        er.memory_used = 2048;
        result.results.push_back(er);
        return result;
    }

    shared_ptr<memory_cache> backend = make_shared<memory_cache>(16);
    result_cache cache{backend, chrono::minutes(1)};
};

TEST_F(ResultCacheTest, MissThenHit) {
    EXPECT_FALSE(cache.get("fp"));

    cache.put("fp", sample("fp"));
    optional<graded_result> hit = cache.get("fp");
    ASSERT_TRUE(hit);
    EXPECT_TRUE(hit->cached);
    EXPECT_TRUE(same_outcome(*hit, sample("fp")));
    EXPECT_EQ(hit->results[0].stdout_output, "42\n");
}

TEST_F(ResultCacheTest, StoredResultIsNotMarkedCached) {
    graded_result result = sample("fp");
    result.cached = true;
    cache.put("fp", result);

    auto stored = nlohmann::json::parse(*backend->get("fp"));
    EXPECT_FALSE(stored.at("cached").get<bool>());
}

TEST_F(ResultCacheTest, IdenticalResultCanBeWrittenTwice) {
    cache.put("fp", sample("fp"));
    EXPECT_NO_THROW(cache.put("fp", sample("fp")));
}

TEST_F(ResultCacheTest, DivergentResultIsAnInvariantViolation) {
    cache.put("fp", sample("fp"));
    EXPECT_THROW(cache.put("fp", sample("fp", verdict::WRONG_ANSWER)), invariant_violation);
    // 原来的结果保持不变
    EXPECT_EQ(cache.get("fp")->verdict, verdict::OK);
}

TEST_F(ResultCacheTest, MalformedEntryIsAMiss) {
    backend->put("fp", "{not json", chrono::minutes(1));
    EXPECT_FALSE(cache.get("fp"));

    backend->put("fp", nlohmann::json(sample("other")).dump(), chrono::minutes(1));
    EXPECT_FALSE(cache.get("fp"));
}

TEST_F(ResultCacheTest, BackendFailuresAreTolerated) {
    result_cache broken(make_shared<test::broken_cache>(), chrono::minutes(1));
    EXPECT_FALSE(broken.get("fp"));
    EXPECT_NO_THROW(broken.put("fp", sample("fp")));
}

TEST_F(ResultCacheTest, ClaimsAreShared) {
    claim owner = cache.try_claim("fp");
    EXPECT_TRUE(owner.owner);
    EXPECT_FALSE(cache.try_claim("fp").owner);
    EXPECT_EQ(cache.claimed(), 1u);
    cache.release(owner, nullopt);
    EXPECT_EQ(cache.claimed(), 0u);
}
