#include <gtest/gtest.h>
#include "subscout/daemon/rate_limiter.hpp"

using namespace subscout::daemon;
using namespace std::chrono_literals;

TEST(RateLimiterTest, AdmitsUpToLimitWithinWindow) {
    RateLimiter limiter(3, 60.0, false, 100);
    auto now = RateLimiter::Clock::now();

    auto first = limiter.hit("10.0.0.1", now);
    EXPECT_TRUE(first.allowed);
    EXPECT_EQ(first.remaining, 2);

    EXPECT_TRUE(limiter.hit("10.0.0.1", now + 1s).allowed);
    auto third = limiter.hit("10.0.0.1", now + 2s);
    EXPECT_TRUE(third.allowed);
    EXPECT_EQ(third.remaining, 0);

    auto fourth = limiter.hit("10.0.0.1", now + 3s);
    EXPECT_FALSE(fourth.allowed);
    EXPECT_NEAR(fourth.retry_after, 57.0, 0.01);
}

TEST(RateLimiterTest, WindowSlidesForward) {
    RateLimiter limiter(1, 10.0, false, 100);
    auto now = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.hit("k", now).allowed);
    EXPECT_FALSE(limiter.hit("k", now + 5s).allowed);
    EXPECT_TRUE(limiter.hit("k", now + 10s).allowed);
}

TEST(RateLimiterTest, KeysAreIndependent) {
    RateLimiter limiter(1, 60.0, false, 100);
    auto now = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.hit("a", now).allowed);
    EXPECT_TRUE(limiter.hit("b", now).allowed);
    EXPECT_FALSE(limiter.hit("a", now).allowed);
}

TEST(RateLimiterTest, SweepsExpiredKeys) {
    RateLimiter limiter(5, 1.0, false, 2);
    auto now = RateLimiter::Clock::now();

    limiter.hit("a", now);
    limiter.hit("b", now);
    limiter.hit("c", now);
    EXPECT_EQ(limiter.trackedKeys(), 3u);

    limiter.hit("d", now + 2s);
    EXPECT_EQ(limiter.trackedKeys(), 1u);
}

TEST(RateLimiterTest, IdentifiesClients) {
    RateLimiter trusting(1, 60.0, true, 10);
    EXPECT_EQ(trusting.identify("127.0.0.1", "203.0.113.7, 10.0.0.1"), "203.0.113.7");
    EXPECT_EQ(trusting.identify("127.0.0.1", ""), "127.0.0.1");

    RateLimiter direct(1, 60.0, false, 10);
    EXPECT_EQ(direct.identify("127.0.0.1", "203.0.113.7"), "127.0.0.1");
    EXPECT_EQ(direct.identify("", ""), "unknown");
}

TEST(RateLimiterTest, FormatsHeaders) {
    RateLimitDecision decision;
    decision.allowed = false;
    decision.remaining = 0;
    decision.reset_after = 12.2;
    decision.retry_after = 12.2;

    auto quota = RateLimiter::quotaHeaders(decision);
    ASSERT_EQ(quota.size(), 2u);
    EXPECT_EQ(quota[0].first, "X-RateLimit-Remaining");
    EXPECT_EQ(quota[0].second, "0");
    EXPECT_EQ(quota[1].second, "13");

    auto retry = RateLimiter::retryHeaders(decision);
    ASSERT_EQ(retry.size(), 1u);
    EXPECT_EQ(retry[0].first, "Retry-After");
    EXPECT_EQ(retry[0].second, "13");
}
