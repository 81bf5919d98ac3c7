#include "gtest/gtest.h"
#include <atomic>
#include <thread>
#include "cache/claim_table.hpp"

using namespace std;
using namespace grader;
using namespace grader::cache;

static graded_result result_of(const string &fingerprint) {
    graded_result result;
    result.fingerprint = fingerprint;
    result.verdict = verdict::OK;
    result.score = 1;
    result.passed = result.total = 1;
    return result;
}

TEST(ClaimTableTest, FirstClaimOwns) {
    claim_table table;
    claim first = table.try_claim("fp");
    claim second = table.try_claim("fp");
    claim other = table.try_claim("other");

    EXPECT_TRUE(first.owner);
    EXPECT_FALSE(second.owner);
    EXPECT_TRUE(other.owner);
    EXPECT_EQ(first.handle, second.handle);
    EXPECT_EQ(table.size(), 2u);
}

TEST(ClaimTableTest, WaitersReceivePublishedResult) {
    claim_table table;
    claim owner = table.try_claim("fp");

    vector<thread> waiters;
    atomic<int> received{0};
    for (int i = 0; i < 4; ++i) {
        waiters.emplace_back([&] {
            claim c = table.try_claim("fp");
            ASSERT_FALSE(c.owner);
            optional<graded_result> result = c.wait();
            if (result && result->fingerprint == "fp") ++received;
        });
    }

    this_thread::sleep_for(chrono::milliseconds(20));
    table.release(owner, ::result_of("fp"));
    for (auto &th : waiters) th.join();

    EXPECT_EQ(received.load(), 4);
    EXPECT_EQ(table.size(), 0u);
}

TEST(ClaimTableTest, FailedOwnerWakesWaitersWithoutResult) {
    claim_table table;
    claim owner = table.try_claim("fp");
    claim waiter = table.try_claim("fp");

    table.release(owner, nullopt);
    EXPECT_FALSE(waiter.wait());

    // 释放之后可以重新占用
    EXPECT_TRUE(table.try_claim("fp").owner);
}

TEST(ClaimTableTest, OnlyOwnerCanRelease) {
    claim_table table;
    claim owner = table.try_claim("fp");
    claim waiter = table.try_claim("fp");

    table.release(waiter, ::result_of("fp"));
    EXPECT_EQ(table.size(), 1u);
    EXPECT_FALSE(waiter.wait_for(chrono::milliseconds(10)));

    table.release(owner, ::result_of("fp"));
    EXPECT_TRUE(waiter.wait_for(chrono::milliseconds(10)));
}

TEST(ClaimTableTest, ConcurrentClaimsHaveOneOwner) {
    claim_table table;
    atomic<int> owners{0};
    vector<thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&] {
            if (table.try_claim("fp").owner) ++owners;
        });
    for (auto &th : threads) th.join();
    EXPECT_EQ(owners.load(), 1);
}
