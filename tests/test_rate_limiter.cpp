#include <gtest/gtest.h>
#include "server/rate_limiter.h"
#include <atomic>
#include <thread>
#include <chrono>
#include <vector>

using namespace shroud::server;

class RateLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.bucket_capacity = 10;
        config_.window = std::chrono::milliseconds(1000); // 10 requests per second
    }
    
    RateLimitConfig config_;
};

// ============================================================================
// TokenBucket Tests
// ============================================================================

TEST_F(RateLimiterTest, TokenBucket_InitialCapacity) {
    TokenBucket bucket(10, 1.0);
    EXPECT_EQ(bucket.getTokens(), 10.0);
}

TEST_F(RateLimiterTest, TokenBucket_ConsumeTokens) {
    TokenBucket bucket(10, 1.0);
    
    EXPECT_TRUE(bucket.tryConsume(1));
    EXPECT_NEAR(bucket.getTokens(), 9.0, 0.1);
    
    EXPECT_TRUE(bucket.tryConsume(5));
    EXPECT_NEAR(bucket.getTokens(), 4.0, 0.1);
}

TEST_F(RateLimiterTest, TokenBucket_InsufficientTokens) {
    TokenBucket bucket(5, 1.0);
    
    EXPECT_TRUE(bucket.tryConsume(5));
    EXPECT_FALSE(bucket.tryConsume(1));
}

TEST_F(RateLimiterTest, TokenBucket_Refill) {
    TokenBucket bucket(10, 10.0);
    
    EXPECT_TRUE(bucket.tryConsume(10));
    EXPECT_FALSE(bucket.tryConsume(1));
    
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    
    // ~5 tokens after 0.5 seconds
    EXPECT_TRUE(bucket.tryConsume(4));
}

TEST_F(RateLimiterTest, TokenBucket_RetryAfter) {
    TokenBucket bucket(10, 10.0);
    bucket.tryConsume(10);
    
    // ~100ms for one token
    uint64_t retry_ms = bucket.getRetryAfterMs();
    EXPECT_GT(retry_ms, 50u);
    EXPECT_LT(retry_ms, 150u);
}

// ============================================================================
// RateLimiter Tests
// ============================================================================

TEST_F(RateLimiterTest, RefillRateDerivedFromWindow) {
    RateLimitConfig cfg;
    cfg.bucket_capacity = 60;
    cfg.window = std::chrono::milliseconds(60000);
    EXPECT_DOUBLE_EQ(cfg.refillPerSecond(), 1.0);
}

TEST_F(RateLimiterTest, AllowRequest_BasicLimit) {
    RateLimiter limiter(config_);
    
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(limiter.allowRequest("sk-alpha")) 
            << "Request " << i << " should be allowed";
    }
    EXPECT_FALSE(limiter.allowRequest("sk-alpha"));
}

TEST_F(RateLimiterTest, AllowRequest_IndependentKeys) {
    RateLimiter limiter(config_);
    
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(limiter.allowRequest("sk-alpha"));
        EXPECT_TRUE(limiter.allowRequest("Bearer token-b"));
        EXPECT_TRUE(limiter.allowRequest("192.168.1.3"));
    }
    
    EXPECT_FALSE(limiter.allowRequest("sk-alpha"));
    EXPECT_FALSE(limiter.allowRequest("Bearer token-b"));
    EXPECT_FALSE(limiter.allowRequest("192.168.1.3"));
}

TEST_F(RateLimiterTest, GetRetryAfter) {
    RateLimiter limiter(config_);
    
    EXPECT_EQ(limiter.getRetryAfter("sk-alpha"), 0u);
    
    for (int i = 0; i < 10; ++i) {
        limiter.allowRequest("sk-alpha");
    }
    
    // With 10 req/sec the wait rounds up to one second
    EXPECT_EQ(limiter.getRetryAfter("sk-alpha"), 1u);
}

TEST_F(RateLimiterTest, CheckReportsBucketState) {
    RateLimiter limiter(config_);

    RateLimiter::Decision first = limiter.check("sk-alpha");
    EXPECT_TRUE(first.allowed);
    EXPECT_EQ(first.limit, 10u);
    EXPECT_EQ(first.remaining, 9u);
    EXPECT_EQ(first.retry_after_seconds, 0u);
    EXPECT_EQ(first.reset_seconds, 1u);

    for (int i = 0; i < 9; ++i) {
        limiter.check("sk-alpha");
    }
    RateLimiter::Decision rejected = limiter.check("sk-alpha");
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.remaining, 0u);
    EXPECT_EQ(rejected.retry_after_seconds, 1u);
    EXPECT_EQ(rejected.reset_seconds, 1u);
}

TEST_F(RateLimiterTest, Statistics) {
    RateLimiter limiter(config_);
    
    for (int i = 0; i < 5; ++i) {
        limiter.allowRequest("sk-alpha");
    }
    for (int i = 0; i < 5; ++i) {
        limiter.allowRequest("sk-beta");
    }
    
    auto stats = limiter.getStatistics();
    EXPECT_EQ(stats.total_requests, 10u);
    EXPECT_EQ(stats.allowed_requests, 10u);
    EXPECT_EQ(stats.rejected_requests, 0u);
    EXPECT_EQ(stats.active_buckets, 2u);
    
    for (int i = 0; i < 10; ++i) {
        limiter.allowRequest("sk-alpha");
    }
    
    stats = limiter.getStatistics();
    EXPECT_EQ(stats.total_requests, 20u);
    EXPECT_GE(stats.rejected_requests, 4u);
}

TEST_F(RateLimiterTest, Reset) {
    RateLimiter limiter(config_);
    
    for (int i = 0; i < 10; ++i) {
        limiter.allowRequest("sk-alpha");
    }
    EXPECT_FALSE(limiter.allowRequest("sk-alpha"));
    
    limiter.reset();
    
    EXPECT_TRUE(limiter.allowRequest("sk-alpha"));
    EXPECT_EQ(limiter.getStatistics().total_requests, 1u);
}

TEST_F(RateLimiterTest, CleanupDropsIdleBuckets) {
    config_.window = std::chrono::milliseconds(50);
    RateLimiter limiter(config_);
    
    limiter.allowRequest("sk-alpha");
    EXPECT_EQ(limiter.getStatistics().active_buckets, 1u);
    
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    limiter.cleanup();
    
    EXPECT_EQ(limiter.getStatistics().active_buckets, 0u);
}

TEST_F(RateLimiterTest, Concurrency) {
    config_.window = std::chrono::milliseconds(60000); // negligible refill
    RateLimiter limiter(config_);
    
    std::atomic<int> allowed{0};
    std::atomic<int> rejected{0};
    
    std::vector<std::thread> threads;
    for (int t = 0; t < 5; ++t) {
        threads.emplace_back([&limiter, &allowed, &rejected]() {
            for (int i = 0; i < 10; ++i) {
                if (limiter.allowRequest("sk-shared")) {
                    allowed++;
                } else {
                    rejected++;
                }
            }
        });
    }
    
    for (auto& thread : threads) {
        thread.join();
    }
    
    EXPECT_EQ(allowed.load(), 10);
    EXPECT_EQ(rejected.load(), 40);
}

TEST_F(RateLimiterTest, RefillOverTime) {
    RateLimiter limiter(config_);
    
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(limiter.allowRequest("sk-alpha"));
    }
    EXPECT_FALSE(limiter.allowRequest("sk-alpha"));
    
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(limiter.allowRequest("sk-alpha"));
    }
}
