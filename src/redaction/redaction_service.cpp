#include "redaction/redaction_service.h"
#include "redaction/replacement_generator.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include "utils/text_utils.h"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>

namespace shroud {
namespace redaction {

std::string failStrategyToString(FailStrategy strategy) {
    return strategy == FailStrategy::OPEN ? "open" : "closed";
}

FailStrategy failStrategyFromString(const std::string& value) {
    std::string v = utils::asciiLower(utils::trim(value));
    if (v == "closed") return FailStrategy::CLOSED;
    if (v == "open") return FailStrategy::OPEN;
    throw std::invalid_argument("Unknown fail strategy: " + value);
}

RedactionService::RedactionService(std::shared_ptr<inference::ITokenClassifier> classifier,
                                   RedactionOptions options,
                                   size_t inference_threads)
    : classifier_(std::move(classifier))
    , options_(std::move(options))
    , pool_(std::max<size_t>(1, inference_threads)) {
    if (!classifier_) {
        throw std::invalid_argument("RedactionService requires a token classifier");
    }
}

RedactionService::~RedactionService() {
    pool_.join();
}

RedactionResult RedactionService::redact(const std::string& text) const {
    if (utils::isBlank(text)) {
        return {text, {}, 0};
    }
    
    RedactionOptions opts = getOptions();
    
    DetectionResult detection;
    try {
        detection = runDetection(text, opts.timeout_ms);
    } catch (const utils::InferenceTimeoutError& e) {
        if (opts.fail_strategy == FailStrategy::CLOSED) {
            throw;
        }
        SHROUD_WARN("Inference timeout after {}ms - passing text through unredacted (fail-open)",
                    e.getTimeoutMs());
        return {text, {}, opts.timeout_ms};
    }
    
    if (detection.entities.empty()) {
        return {text, {}, detection.processing_time_ms};
    }
    
    RedactionResult result;
    result.text = applyRedactions(text, detection.entities, opts);
    result.entities = std::move(detection.entities);
    result.processing_time_ms = detection.processing_time_ms;
    return result;
}

DetectionResult RedactionService::detect(const std::string& text) const {
    if (utils::isBlank(text)) {
        return {};
    }
    return runDetection(text, getOptions().timeout_ms);
}

DetectionResult RedactionService::runDetection(const std::string& text, int timeout_ms) const {
    auto started = std::chrono::steady_clock::now();
    
    DetectionResult result;
    result.tokens = classifyWithTimeout(text, timeout_ms);
    result.entities = locator_.locate(result.tokens, text);
    result.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    
    for (const auto& e : result.entities) {
        SHROUD_DEBUG("Detected {} [{}, {}) confidence={:.2f} text='{}'",
                     PiiTypeUtils::toString(e.type), e.start, e.end, e.confidence, e.text);
    }
    return result;
}

std::vector<RawToken> RedactionService::classifyWithTimeout(const std::string& text, int timeout_ms) const {
    auto promise = std::make_shared<std::promise<std::vector<RawToken>>>();
    auto future = promise->get_future();
    
    // The task owns its inputs; a caller that gave up leaves it to finish alone
    boost::asio::post(pool_, [classifier = classifier_, text, promise]() {
        try {
            promise->set_value(classifier->classify(text));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    
    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        throw utils::InferenceTimeoutError(timeout_ms);
    }
    return future.get();
}

std::string RedactionService::applyRedactions(const std::string& text,
                                              const std::vector<PiiEntity>& entities,
                                              const RedactionOptions& options) {
    std::vector<const PiiEntity*> ordered;
    ordered.reserve(entities.size());
    for (const auto& e : entities) ordered.push_back(&e);
    std::sort(ordered.begin(), ordered.end(),
              [](const PiiEntity* a, const PiiEntity* b) { return a->start > b->start; });
    
    std::string result = text;
    for (const auto* e : ordered) {
        if (e->end > result.size() || e->start >= e->end) continue;
        std::string replacement = options.use_deterministic_replacement
            ? ReplacementGenerator::generate(e->text, e->type, options.salt)
            : ReplacementGenerator::simple(e->type);
        result.replace(e->start, e->end - e->start, replacement);
    }
    return result;
}

void RedactionService::updateOptions(const RedactionOptionsUpdate& update) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    if (update.use_deterministic_replacement) options_.use_deterministic_replacement = *update.use_deterministic_replacement;
    if (update.salt) options_.salt = *update.salt;
    if (update.timeout_ms) options_.timeout_ms = *update.timeout_ms;
    if (update.fail_strategy) options_.fail_strategy = *update.fail_strategy;
}

RedactionOptions RedactionService::getOptions() const {
    std::lock_guard<std::mutex> lock(options_mutex_);
    return options_;
}

} // namespace redaction
} // namespace shroud
