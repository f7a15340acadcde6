// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file test_validation_cache.cc
 * @brief Unit tests for the TTL cache and the sliding-window rate limiter
 */

#include <gtest/gtest.h>
#include "../src/core/validation/ValidationCache.h"
#include "../src/core/validation/RateLimiter.h"
#include <format>
#include <stdexcept>

using namespace KeyWarden;
using namespace std::chrono_literals;

// ============================================================================
// ValidationCache Tests
// ============================================================================

class ValidationCacheTest : public ::testing::Test {
protected:
    using Clock = ValidationCache<int>::Clock;

    ValidationCache<int> cache{1000ms, 10};
    Clock::time_point t0 = Clock::now();
};

TEST_F(ValidationCacheTest, MissThenHit) {
    EXPECT_FALSE(cache.get("k", t0).has_value());
    cache.put("k", 7, t0);

    auto value = cache.get("k", t0 + 10ms);
    ASSERT_TRUE(value.has_value()) << "Fresh entry should be served";
    EXPECT_EQ(*value, 7);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST_F(ValidationCacheTest, ExpiresAfterTtl) {
    cache.put("k", 1, t0);
    EXPECT_FALSE(cache.get("k", t0 + 1000ms).has_value()) << "Entry at exactly the TTL is stale";
    EXPECT_EQ(cache.size(), 0u) << "Stale entry is dropped on lookup";
}

TEST_F(ValidationCacheTest, PutReplacesAndRefreshes) {
    cache.put("k", 1, t0);
    cache.put("k", 2, t0 + 900ms);
    auto value = cache.get("k", t0 + 1500ms);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 2);
}

TEST_F(ValidationCacheTest, TrimsOldestToEightyPercent) {
    for (int i = 0; i < 10; ++i) {
        cache.put(std::format("k{}", i), i, t0 + std::chrono::milliseconds(i));
    }
    EXPECT_EQ(cache.size(), 10u);

    cache.put("k10", 10, t0 + 10ms);
    EXPECT_EQ(cache.size(), 8u);
    EXPECT_FALSE(cache.get("k0", t0 + 20ms).has_value()) << "Oldest entries go first";
    EXPECT_FALSE(cache.get("k2", t0 + 20ms).has_value());
    EXPECT_TRUE(cache.get("k3", t0 + 20ms).has_value());
    EXPECT_TRUE(cache.get("k10", t0 + 20ms).has_value());
}

TEST_F(ValidationCacheTest, EraseAndClear) {
    cache.put("a", 1, t0);
    cache.put("b", 2, t0);
    cache.erase("a");
    cache.erase("missing");
    EXPECT_EQ(cache.size(), 1u);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ValidationCacheTest, PurgeExpired) {
    cache.put("old", 1, t0);
    cache.put("new", 2, t0 + 800ms);
    cache.purge_expired(t0 + 1200ms);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.get("new", t0 + 1200ms).has_value());
}

TEST(ValidationCacheCapacityTest, ZeroCapacityIsClampedToOne) {
    ValidationCache<int> cache{1000ms, 0};
    EXPECT_EQ(cache.capacity(), 1u);
}

// ============================================================================
// RateLimiter Tests
// ============================================================================

class RateLimiterTest : public ::testing::Test {
protected:
    using Clock = RateLimiter::Clock;

    RateLimiter limiter{RateLimiter::Config{.max_requests = 3, .window = 1000ms, .max_buckets = 4}};
    Clock::time_point t0 = Clock::now();
};

TEST_F(RateLimiterTest, AllowsUpToLimitWithinWindow) {
    EXPECT_TRUE(limiter.try_acquire("key", t0));
    EXPECT_TRUE(limiter.try_acquire("key", t0 + 1ms));
    EXPECT_TRUE(limiter.try_acquire("key", t0 + 2ms));
    EXPECT_FALSE(limiter.try_acquire("key", t0 + 3ms)) << "Fourth request in the window is refused";
    EXPECT_EQ(limiter.remaining("key", t0 + 3ms), 0u);
}

TEST_F(RateLimiterTest, WindowSlides) {
    ASSERT_TRUE(limiter.try_acquire("key", t0));
    ASSERT_TRUE(limiter.try_acquire("key", t0 + 500ms));
    ASSERT_TRUE(limiter.try_acquire("key", t0 + 600ms));
    EXPECT_FALSE(limiter.try_acquire("key", t0 + 999ms));
    EXPECT_TRUE(limiter.try_acquire("key", t0 + 1000ms)) << "First request has left the window";
    EXPECT_FALSE(limiter.try_acquire("key", t0 + 1001ms));
}

TEST_F(RateLimiterTest, RefusedRequestsDoNotConsumeBudget) {
    for (int i = 0; i < 10; ++i) {
        (void)limiter.try_acquire("key", t0);
    }
    EXPECT_TRUE(limiter.try_acquire("key", t0 + 1000ms));
    EXPECT_EQ(limiter.remaining("key", t0 + 1000ms), 2u);
}

TEST_F(RateLimiterTest, BucketsAreIndependent) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.try_acquire("a", t0));
    }
    EXPECT_FALSE(limiter.try_acquire("a", t0));
    EXPECT_TRUE(limiter.try_acquire("b", t0));
    EXPECT_EQ(limiter.remaining("unseen", t0), 3u);
}

TEST_F(RateLimiterTest, BucketCountIsBounded) {
    for (int i = 0; i < 20; ++i) {
        (void)limiter.try_acquire(std::format("bucket-{}", i), t0 + std::chrono::milliseconds(i));
    }
    EXPECT_LE(limiter.bucket_count(), 4u);
}

TEST_F(RateLimiterTest, ResetClearsAllBuckets) {
    (void)limiter.try_acquire("a", t0);
    (void)limiter.try_acquire("b", t0);
    limiter.reset();
    EXPECT_EQ(limiter.bucket_count(), 0u);
}

TEST(RateLimiterConfigTest, RejectsZeroLimit) {
    EXPECT_THROW(RateLimiter(RateLimiter::Config{.max_requests = 0}), std::invalid_argument);
}
