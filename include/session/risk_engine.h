#pragma once

#include "redaction/pii_types.h"
#include "session/session_store.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shroud {
namespace session {

struct RiskConfig {
    int64_t threshold = 100;
    std::chrono::milliseconds window{3600000};
};

struct RiskAssessment {
    int64_t score = 0;
    bool is_banned = false;
    int64_t points_added = 0;
};

/**
 * @brief Caller identity used to pick a session bucket
 */
struct RequestIdentity {
    std::optional<std::string> api_key;        // x-api-key
    std::optional<std::string> authorization;  // Authorization
    std::string ip;
};

/**
 * @brief Per-session PII exposure score and ban decision
 *
 * Scores accumulate in a rolling window kept by the store's TTL; a session
 * is banned while score >= threshold.
 */
class SessionRiskEngine {
public:
    SessionRiskEngine(std::shared_ptr<SessionStore> store, RiskConfig config);
    
    /// Zero entities is a read-only assessment
    RiskAssessment assessRisk(const std::string& session_id,
                              const std::vector<redaction::PiiEntity>& entities);
    
    bool isBanned(const std::string& session_id);
    int64_t getRiskScore(const std::string& session_id);
    void clearRisk(const std::string& session_id);
    
    const RiskConfig& config() const { return config_; }
    SessionStore& store() { return *store_; }
    
    /// x-api-key verbatim, else "auth:" + first 32 chars of base64(Authorization),
    /// else "ip:<address>"
    static std::string extractSessionId(const RequestIdentity& identity);
    
    static int64_t pointsFor(const std::vector<redaction::PiiEntity>& entities);
    
private:
    std::shared_ptr<SessionStore> store_;
    RiskConfig config_;
};

} // namespace session
} // namespace shroud
