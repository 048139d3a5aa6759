#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace shroud {
namespace store {

/**
 * @brief Narrow key-value interface used for session and risk state
 *
 * Every operation is atomic for a single key. Failures of the backend are
 * reported as utils::StoreError. Implementations are safe to share between
 * threads.
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;
    
    virtual std::string name() const = 0;
    
    virtual std::optional<std::string> get(const std::string& key) = 0;
    
    /// ttl == nullopt stores without expiry
    virtual void set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::seconds> ttl) = 0;
    
    virtual int64_t incr(const std::string& key) = 0;
    virtual int64_t incrBy(const std::string& key, int64_t by) = 0;
    
    /// Returns false when the key does not exist
    virtual bool expire(const std::string& key, std::chrono::seconds ttl) = 0;
    
    /**
     * @brief Adds `by` and starts the expiry window if this created the key
     *
     * Single atomic operation: concurrent callers never under-count and the
     * TTL is set exactly when the window opens (or when the key somehow has
     * no TTL). Returns the new value.
     */
    virtual int64_t incrementWindowed(const std::string& key, int64_t by, std::chrono::seconds ttl) = 0;
    
    virtual int64_t hincrby(const std::string& key, const std::string& field, int64_t by) = 0;
    virtual std::optional<std::string> hget(const std::string& key, const std::string& field) = 0;
    
    /// Number of keys removed (0 or 1)
    virtual int64_t del(const std::string& key) = 0;
    
    virtual void close() = 0;
};

} // namespace store
} // namespace shroud
