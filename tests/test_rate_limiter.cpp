#include <warden/core/rate_limiter.hpp>

#include <gtest/gtest.h>

using namespace warden;

TEST(RateLimiterTest, TokenBucketDrainsAndRefills) {
    KeyedRateLimiter limiter(KeyedRateLimiter::TOKEN_BUCKET, 3, 1);
    const int64_t t0 = 1000000;

    EXPECT_TRUE(limiter.try_acquire("proj1", t0));
    EXPECT_TRUE(limiter.try_acquire("proj1", t0));
    EXPECT_TRUE(limiter.try_acquire("proj1", t0));
    EXPECT_FALSE(limiter.try_acquire("proj1", t0));

    // One token per second
    EXPECT_FALSE(limiter.try_acquire("proj1", t0 + 500));
    EXPECT_TRUE(limiter.try_acquire("proj1", t0 + 1500));
    EXPECT_FALSE(limiter.try_acquire("proj1", t0 + 1500));
}

TEST(RateLimiterTest, KeysAreIndependent) {
    KeyedRateLimiter limiter(KeyedRateLimiter::TOKEN_BUCKET, 1, 1);
    EXPECT_TRUE(limiter.try_acquire("proj1", 0));
    EXPECT_FALSE(limiter.try_acquire("proj1", 0));
    EXPECT_TRUE(limiter.try_acquire("proj2", 0));
    EXPECT_EQ(limiter.size(), 2u);

    limiter.reset("proj1");
    EXPECT_EQ(limiter.size(), 1u);
    EXPECT_TRUE(limiter.try_acquire("proj1", 0));
}

TEST(RateLimiterTest, FixedWindowResetsAfterWindow) {
    KeyedRateLimiter limiter(KeyedRateLimiter::FIXED_WINDOW, 2, 10);
    EXPECT_TRUE(limiter.try_acquire("k", 0));
    EXPECT_TRUE(limiter.try_acquire("k", 1000));
    EXPECT_FALSE(limiter.try_acquire("k", 9999));
    EXPECT_TRUE(limiter.try_acquire("k", 10000));
}
