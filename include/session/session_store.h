#pragma once

#include "store/kv_store.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace shroud {
namespace session {

/**
 * @brief Namespaced session and risk records on top of a key-value store
 *
 * Risk scores live under "risk:<id>", per-session counters in the hash
 * "session:<id>".
 */
class SessionStore {
public:
    explicit SessionStore(std::shared_ptr<store::IKeyValueStore> kv);
    
    std::optional<std::string> get(const std::string& session_id, const std::string& field);
    int64_t increment(const std::string& session_id, const std::string& field, int64_t amount = 1);
    
    /// Adds points atomically; the first increment of a window sets the TTL
    /// to ceil(window / 1s).
    int64_t incrementRisk(const std::string& session_id, int64_t points, std::chrono::milliseconds window);
    
    int64_t getRiskScore(const std::string& session_id);
    bool isBanned(const std::string& session_id, int64_t threshold);
    void clearRisk(const std::string& session_id);
    void clearSession(const std::string& session_id);
    
    static std::string riskKey(const std::string& session_id) { return "risk:" + session_id; }
    static std::string sessionKey(const std::string& session_id) { return "session:" + session_id; }
    
private:
    std::shared_ptr<store::IKeyValueStore> kv_;
};

} // namespace session
} // namespace shroud
