#pragma once

#include "store/kv_store.h"

#include <list>
#include <mutex>
#include <unordered_map>

namespace shroud {
namespace store {

/**
 * @brief In-process store for development and single-instance deployments
 *
 * Expired keys are dropped lazily on access. Holds at most max_entries keys;
 * inserting a new key beyond that evicts the oldest-inserted one.
 */
class MemoryStore : public IKeyValueStore {
public:
    explicit MemoryStore(size_t max_entries = 10000);
    ~MemoryStore() override = default;
    
    std::string name() const override { return "memory"; }
    
    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> ttl) override;
    int64_t incr(const std::string& key) override;
    int64_t incrBy(const std::string& key, int64_t by) override;
    bool expire(const std::string& key, std::chrono::seconds ttl) override;
    int64_t incrementWindowed(const std::string& key, int64_t by, std::chrono::seconds ttl) override;
    int64_t hincrby(const std::string& key, const std::string& field, int64_t by) override;
    std::optional<std::string> hget(const std::string& key, const std::string& field) override;
    int64_t del(const std::string& key) override;
    void close() override;
    
    size_t size() const;
    
private:
    using Clock = std::chrono::steady_clock;
    
    struct Entry {
        std::optional<std::string> value;                     // string value
        std::unordered_map<std::string, std::string> fields;  // hash value
        std::optional<Clock::time_point> expires_at;
        std::list<std::string>::iterator order_it;
    };
    
    // Caller holds mutex_. Returns nullptr for missing or expired keys.
    Entry* findLive(const std::string& key);
    Entry& insert(const std::string& key);
    void erase(std::unordered_map<std::string, Entry>::iterator it);
    int64_t addLocked(const std::string& key, int64_t by, bool& created);
    
    size_t max_entries_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> insertion_order_;
};

} // namespace store
} // namespace shroud
