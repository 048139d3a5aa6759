#include "session/session_store.h"
#include "utils/logger.h"

#include <stdexcept>

namespace shroud {
namespace session {

SessionStore::SessionStore(std::shared_ptr<store::IKeyValueStore> kv)
    : kv_(std::move(kv)) {
    if (!kv_) {
        throw std::invalid_argument("SessionStore requires a key-value store");
    }
}

std::optional<std::string> SessionStore::get(const std::string& session_id, const std::string& field) {
    return kv_->hget(sessionKey(session_id), field);
}

int64_t SessionStore::increment(const std::string& session_id, const std::string& field, int64_t amount) {
    return kv_->hincrby(sessionKey(session_id), field, amount);
}

int64_t SessionStore::incrementRisk(const std::string& session_id, int64_t points,
                                    std::chrono::milliseconds window) {
    auto window_seconds = std::chrono::seconds((window.count() + 999) / 1000);
    if (window_seconds.count() < 1) window_seconds = std::chrono::seconds(1);
    return kv_->incrementWindowed(riskKey(session_id), points, window_seconds);
}

int64_t SessionStore::getRiskScore(const std::string& session_id) {
    auto score = kv_->get(riskKey(session_id));
    if (!score) return 0;
    try {
        return std::stoll(*score);
    } catch (const std::exception&) {
        SHROUD_WARN("Discarding non-numeric risk score for session");
        return 0;
    }
}

bool SessionStore::isBanned(const std::string& session_id, int64_t threshold) {
    return getRiskScore(session_id) >= threshold;
}

void SessionStore::clearRisk(const std::string& session_id) {
    kv_->del(riskKey(session_id));
}

void SessionStore::clearSession(const std::string& session_id) {
    kv_->del(sessionKey(session_id));
    kv_->del(riskKey(session_id));
}

} // namespace session
} // namespace shroud
