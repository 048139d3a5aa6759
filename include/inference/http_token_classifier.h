#pragma once

#include "inference/token_classifier.h"
#include "utils/http_client.h"
#include "utils/url.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace shroud {
namespace inference {

/**
 * @brief Token classifier backed by a remote token-classification endpoint
 *
 * POSTs {"inputs": text} and expects a JSON array of
 * {entity | entity_group, word, score, index?, start?, end?}. Character
 * offsets reported by the service are converted to UTF-8 byte offsets.
 * Transport failures, non-2xx statuses and malformed bodies throw
 * utils::InferenceError.
 */
class HttpTokenClassifier : public ITokenClassifier {
public:
    HttpTokenClassifier(const utils::Url& endpoint, const utils::HttpClient::Config& client_config);
    
    std::string name() const override { return "http"; }
    std::vector<redaction::RawToken> classify(const std::string& text) const override;
    
    const utils::Url& endpoint() const { return endpoint_; }
    
    /// Parses a response body against the text it was produced for
    static std::vector<redaction::RawToken> parseResponse(const nlohmann::json& body,
                                                          const std::string& text);
    
private:
    utils::Url endpoint_;
    utils::HttpClient client_;
};

} // namespace inference
} // namespace shroud
