#include "session/risk_engine.h"
#include "utils/crypto_utils.h"
#include "utils/logger.h"

#include <stdexcept>

namespace shroud {
namespace session {

SessionRiskEngine::SessionRiskEngine(std::shared_ptr<SessionStore> store, RiskConfig config)
    : store_(std::move(store))
    , config_(config) {
    if (!store_) {
        throw std::invalid_argument("SessionRiskEngine requires a session store");
    }
}

int64_t SessionRiskEngine::pointsFor(const std::vector<redaction::PiiEntity>& entities) {
    int64_t points = 0;
    for (const auto& e : entities) {
        points += redaction::PiiTypeUtils::riskWeight(e.type);
    }
    return points;
}

RiskAssessment SessionRiskEngine::assessRisk(const std::string& session_id,
                                             const std::vector<redaction::PiiEntity>& entities) {
    if (entities.empty()) {
        int64_t score = store_->getRiskScore(session_id);
        return {score, score >= config_.threshold, 0};
    }
    
    int64_t points = pointsFor(entities);
    int64_t score = store_->incrementRisk(session_id, points, config_.window);
    bool banned = score >= config_.threshold;
    
    if (banned && score - points < config_.threshold) {
        SHROUD_WARN("Session crossed risk threshold: score={} threshold={}", score, config_.threshold);
    } else {
        SHROUD_DEBUG("Session risk +{} -> {}", points, score);
    }
    return {score, banned, points};
}

bool SessionRiskEngine::isBanned(const std::string& session_id) {
    return store_->isBanned(session_id, config_.threshold);
}

int64_t SessionRiskEngine::getRiskScore(const std::string& session_id) {
    return store_->getRiskScore(session_id);
}

void SessionRiskEngine::clearRisk(const std::string& session_id) {
    store_->clearRisk(session_id);
}

std::string SessionRiskEngine::extractSessionId(const RequestIdentity& identity) {
    if (identity.api_key && !identity.api_key->empty()) {
        return *identity.api_key;
    }
    if (identity.authorization && !identity.authorization->empty()) {
        return "auth:" + utils::toBase64(*identity.authorization).substr(0, 32);
    }
    return "ip:" + identity.ip;
}

} // namespace session
} // namespace shroud
