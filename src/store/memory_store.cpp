#include "store/memory_store.h"
#include "utils/errors.h"

#include <iterator>
#include <stdexcept>

namespace shroud {
namespace store {

namespace {

int64_t parseInteger(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int64_t v = std::stoll(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw utils::StoreError("Value at '" + key + "' is not an integer");
    }
}

} // namespace

MemoryStore::MemoryStore(size_t max_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries) {
}

MemoryStore::Entry* MemoryStore::findLive(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    if (it->second.expires_at && Clock::now() >= *it->second.expires_at) {
        erase(it);
        return nullptr;
    }
    return &it->second;
}

MemoryStore::Entry& MemoryStore::insert(const std::string& key) {
    while (entries_.size() >= max_entries_ && !insertion_order_.empty()) {
        auto oldest = entries_.find(insertion_order_.front());
        if (oldest == entries_.end()) {
            insertion_order_.pop_front();
            continue;
        }
        erase(oldest);
    }
    insertion_order_.push_back(key);
    Entry& entry = entries_[key];
    entry.order_it = std::prev(insertion_order_.end());
    return entry;
}

void MemoryStore::erase(std::unordered_map<std::string, Entry>::iterator it) {
    insertion_order_.erase(it->second.order_it);
    entries_.erase(it);
}

std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry) return std::nullopt;
    if (!entry->value) {
        throw utils::StoreError("Key '" + key + "' holds a hash");
    }
    return entry->value;
}

void MemoryStore::set(const std::string& key, const std::string& value,
                      std::optional<std::chrono::seconds> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry) entry = &insert(key);
    entry->value = value;
    entry->fields.clear();
    entry->expires_at = ttl ? std::optional<Clock::time_point>(Clock::now() + *ttl) : std::nullopt;
}

int64_t MemoryStore::addLocked(const std::string& key, int64_t by, bool& created) {
    Entry* entry = findLive(key);
    created = (entry == nullptr);
    if (!entry) {
        entry = &insert(key);
        entry->value = "0";
    }
    if (!entry->value) {
        throw utils::StoreError("Key '" + key + "' holds a hash");
    }
    int64_t next = parseInteger(key, *entry->value) + by;
    // Existing TTL is kept, as with Redis INCRBY
    entry->value = std::to_string(next);
    return next;
}

int64_t MemoryStore::incr(const std::string& key) {
    return incrBy(key, 1);
}

int64_t MemoryStore::incrBy(const std::string& key, int64_t by) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool created = false;
    return addLocked(key, by, created);
}

bool MemoryStore::expire(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry) return false;
    entry->expires_at = Clock::now() + ttl;
    return true;
}

int64_t MemoryStore::incrementWindowed(const std::string& key, int64_t by, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool created = false;
    int64_t value = addLocked(key, by, created);
    Entry* entry = findLive(key);
    if (entry && (created || !entry->expires_at)) {
        entry->expires_at = Clock::now() + ttl;
    }
    return value;
}

int64_t MemoryStore::hincrby(const std::string& key, const std::string& field, int64_t by) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry) entry = &insert(key);
    if (entry->value) {
        throw utils::StoreError("Key '" + key + "' holds a string");
    }
    auto& slot = entry->fields[field];
    int64_t next = (slot.empty() ? 0 : parseInteger(key + "." + field, slot)) + by;
    slot = std::to_string(next);
    return next;
}

std::optional<std::string> MemoryStore::hget(const std::string& key, const std::string& field) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry) return std::nullopt;
    if (entry->value) {
        throw utils::StoreError("Key '" + key + "' holds a string");
    }
    auto it = entry->fields.find(field);
    if (it == entry->fields.end()) return std::nullopt;
    return it->second;
}

int64_t MemoryStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return 0;
    bool live = !(it->second.expires_at && Clock::now() >= *it->second.expires_at);
    erase(it);
    return live ? 1 : 0;
}

void MemoryStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    insertion_order_.clear();
}

size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace store
} // namespace shroud
