#pragma once

#include "inference/token_classifier.h"
#include "redaction/entity_locator.h"
#include "redaction/pii_types.h"

#include <boost/asio/thread_pool.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shroud {
namespace redaction {

enum class FailStrategy {
    CLOSED,  // timeout propagates to the caller
    OPEN     // timeout returns the original text unredacted
};

std::string failStrategyToString(FailStrategy strategy);
/// Throws std::invalid_argument for anything but "closed" / "open"
FailStrategy failStrategyFromString(const std::string& value);

struct RedactionOptions {
    bool use_deterministic_replacement = true;
    std::string salt;
    int timeout_ms = 500;
    FailStrategy fail_strategy = FailStrategy::CLOSED;
};

/// Partial update for RedactionService::updateOptions; unset fields are kept
struct RedactionOptionsUpdate {
    std::optional<bool> use_deterministic_replacement;
    std::optional<std::string> salt;
    std::optional<int> timeout_ms;
    std::optional<FailStrategy> fail_strategy;
};

struct RedactionResult {
    std::string text;
    std::vector<PiiEntity> entities;
    int64_t processing_time_ms = 0;
};

struct DetectionResult {
    std::vector<PiiEntity> entities;
    std::vector<RawToken> tokens;
    int64_t processing_time_ms = 0;
};

/**
 * @brief Detects and replaces PII in a piece of text
 *
 * Classification runs on a small worker pool so the caller can give up after
 * timeout_ms. An abandoned classification finishes in the background and its
 * result is discarded. On timeout:
 * - FailStrategy::CLOSED rethrows utils::InferenceTimeoutError
 * - FailStrategy::OPEN returns the input unchanged with no entities and
 *   processing_time_ms == timeout_ms
 *
 * Any other classifier failure (utils::InferenceError) always propagates.
 * Replacements are applied right to left so earlier offsets stay valid.
 */
class RedactionService {
public:
    RedactionService(std::shared_ptr<inference::ITokenClassifier> classifier,
                     RedactionOptions options,
                     size_t inference_threads = 2);
    ~RedactionService();
    
    RedactionService(const RedactionService&) = delete;
    RedactionService& operator=(const RedactionService&) = delete;
    
    RedactionResult redact(const std::string& text) const;
    
    /// Diagnostic variant: entities and raw tokens, text untouched.
    /// Timeouts always propagate here regardless of the fail strategy.
    DetectionResult detect(const std::string& text) const;
    
    void updateOptions(const RedactionOptionsUpdate& update);
    RedactionOptions getOptions() const;
    
    const inference::ITokenClassifier& classifier() const { return *classifier_; }
    
    static std::string applyRedactions(const std::string& text,
                                       const std::vector<PiiEntity>& entities,
                                       const RedactionOptions& options);
    
private:
    DetectionResult runDetection(const std::string& text, int timeout_ms) const;
    std::vector<RawToken> classifyWithTimeout(const std::string& text, int timeout_ms) const;
    
    std::shared_ptr<inference::ITokenClassifier> classifier_;
    EntityLocator locator_;
    
    mutable std::mutex options_mutex_;
    RedactionOptions options_;
    
    mutable boost::asio::thread_pool pool_;
};

} // namespace redaction
} // namespace shroud
