#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace shroud {
namespace server {

/**
 * @brief Token bucket configuration
 *
 * max requests per window_ms; the bucket refills continuously at
 * max / window.
 */
struct RateLimitConfig {
    size_t bucket_capacity = 100;
    std::chrono::milliseconds window{60000};
    
    double refillPerSecond() const {
        return static_cast<double>(bucket_capacity) * 1000.0 / static_cast<double>(window.count());
    }
};

/// Continuous-refill bucket; one token per request
class TokenBucket {
public:
    TokenBucket(size_t capacity, double refill_rate);
    
    bool tryConsume(size_t tokens = 1);
    double getTokens() const;
    
    /// Time until the next token is available (milliseconds)
    uint64_t getRetryAfterMs() const;
    
    /// Time until the bucket is full again (milliseconds)
    uint64_t getFullInMs() const;
    
    void reset();

private:
    void refill();
    
    size_t capacity_;
    double tokens_;
    double refill_rate_;
    std::chrono::steady_clock::time_point last_refill_;
    mutable std::mutex mutex_;
};

/**
 * @brief Per-key request limiter
 *
 * The key is the caller's session key (API key, authorization header or
 * client IP). Buckets idle for longer than two windows are dropped.
 * Thread-safe.
 */
class RateLimiter {
public:
    /// Outcome of one request, enough to fill the X-RateLimit-* headers
    struct Decision {
        bool allowed = true;
        size_t limit = 0;
        size_t remaining = 0;
        uint32_t retry_after_seconds = 0;
        uint32_t reset_seconds = 0;
    };
    
    explicit RateLimiter(const RateLimitConfig& config = RateLimitConfig());
    
    /// Consumes one token for key and reports the bucket state afterwards
    Decision check(const std::string& key);
    
    bool allowRequest(const std::string& key) { return check(key).allowed; }
    
    /// Seconds until the key may send again (0 if not limited), rounded up
    uint32_t getRetryAfter(const std::string& key) const;
    
    struct Statistics {
        size_t total_requests = 0;
        size_t allowed_requests = 0;
        size_t rejected_requests = 0;
        size_t active_buckets = 0;
    };
    
    Statistics getStatistics() const;
    const RateLimitConfig& config() const { return config_; }
    
    void reset();
    void cleanup();

private:
    std::shared_ptr<TokenBucket> getOrCreateBucket(const std::string& key);
    void cleanupLocked();
    
    RateLimitConfig config_;
    
    std::unordered_map<std::string, std::shared_ptr<TokenBucket>> buckets_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_access_;
    
    Statistics stats_;
    mutable std::mutex mutex_;
    
    static constexpr uint32_t CLEANUP_INTERVAL_SECONDS = 300;
    std::chrono::steady_clock::time_point last_cleanup_;
};

} // namespace server
} // namespace shroud
