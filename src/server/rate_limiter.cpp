#include "server/rate_limiter.h"
#include "utils/logger.h"

#include <algorithm>
#include <functional>

namespace shroud {
namespace server {

// ============================================================================
// TokenBucket Implementation
// ============================================================================

TokenBucket::TokenBucket(size_t capacity, double refill_rate)
    : capacity_(capacity)
    , tokens_(static_cast<double>(capacity))
    , refill_rate_(refill_rate)
    , last_refill_(std::chrono::steady_clock::now())
{}

void TokenBucket::refill() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_refill_).count();
    
    if (elapsed > 0) {
        double tokens_to_add = (elapsed / 1000.0) * refill_rate_;
        tokens_ = std::min(static_cast<double>(capacity_), tokens_ + tokens_to_add);
        last_refill_ = now;
    }
}

bool TokenBucket::tryConsume(size_t tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    
    if (tokens_ >= static_cast<double>(tokens)) {
        tokens_ -= static_cast<double>(tokens);
        return true;
    }
    return false;
}

double TokenBucket::getTokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_;
}

uint64_t TokenBucket::getRetryAfterMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (tokens_ >= 1.0) {
        return 0;
    }
    double tokens_needed = 1.0 - tokens_;
    double seconds = tokens_needed / refill_rate_;
    return static_cast<uint64_t>(seconds * 1000.0);
}

uint64_t TokenBucket::getFullInMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    double missing = static_cast<double>(capacity_) - tokens_;
    if (missing <= 0.0) {
        return 0;
    }
    return static_cast<uint64_t>(missing / refill_rate_ * 1000.0);
}

void TokenBucket::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = static_cast<double>(capacity_);
    last_refill_ = std::chrono::steady_clock::now();
}

// ============================================================================
// RateLimiter Implementation
// ============================================================================

RateLimiter::RateLimiter(const RateLimitConfig& config)
    : config_(config)
    , last_cleanup_(std::chrono::steady_clock::now())
{
    SHROUD_INFO("Rate Limiter initialized: {} requests per {} ms",
        config_.bucket_capacity, config_.window.count());
}

std::shared_ptr<TokenBucket> RateLimiter::getOrCreateBucket(const std::string& key) {
    auto it = buckets_.find(key);
    if (it != buckets_.end()) {
        return it->second;
    }
    auto bucket = std::make_shared<TokenBucket>(config_.bucket_capacity, config_.refillPerSecond());
    buckets_[key] = bucket;
    return bucket;
}

RateLimiter::Decision RateLimiter::check(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    stats_.total_requests++;
    
    auto bucket = getOrCreateBucket(key);
    auto now = std::chrono::steady_clock::now();
    last_access_[key] = now;
    
    Decision decision;
    decision.limit = config_.bucket_capacity;
    decision.allowed = bucket->tryConsume(1);
    decision.remaining = static_cast<size_t>(bucket->getTokens());
    decision.reset_seconds = static_cast<uint32_t>((bucket->getFullInMs() + 999) / 1000);
    
    if (decision.allowed) {
        stats_.allowed_requests++;
    } else {
        stats_.rejected_requests++;
        decision.retry_after_seconds = std::max<uint32_t>(
            1, static_cast<uint32_t>((bucket->getRetryAfterMs() + 999) / 1000));
        // Keys are credentials; log a fingerprint only
        SHROUD_WARN("Rate limit exceeded for session key #{:016x}", std::hash<std::string>{}(key));
    }
    
    auto cleanup_elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - last_cleanup_).count();
    
    if (cleanup_elapsed >= CLEANUP_INTERVAL_SECONDS) {
        cleanupLocked();
        last_cleanup_ = now;
    }
    
    return decision;
}

uint32_t RateLimiter::getRetryAfter(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        return 0;
    }
    uint64_t retry_ms = it->second->getRetryAfterMs();
    return static_cast<uint32_t>((retry_ms + 999) / 1000);
}

RateLimiter::Statistics RateLimiter::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Statistics stats = stats_;
    stats.active_buckets = buckets_.size();
    return stats;
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    buckets_.clear();
    last_access_.clear();
    stats_ = Statistics();
    
    SHROUD_INFO("Rate Limiter reset");
}

void RateLimiter::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanupLocked();
}

void RateLimiter::cleanupLocked() {
    auto now = std::chrono::steady_clock::now();
    auto idle_limit = config_.window * 2;
    
    size_t removed = 0;
    for (auto it = last_access_.begin(); it != last_access_.end(); ) {
        if (now - it->second >= idle_limit) {
            buckets_.erase(it->first);
            it = last_access_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    
    if (removed > 0) {
        SHROUD_DEBUG("Rate Limiter cleanup: removed {} buckets", removed);
    }
}

} // namespace server
} // namespace shroud
