#include "inference/http_token_classifier.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include "utils/text_utils.h"

#include <boost/system/system_error.hpp>

namespace shroud {
namespace inference {

using json = nlohmann::json;

HttpTokenClassifier::HttpTokenClassifier(const utils::Url& endpoint,
                                         const utils::HttpClient::Config& client_config)
    : endpoint_(endpoint)
    , client_(client_config) {
}

std::vector<redaction::RawToken> HttpTokenClassifier::classify(const std::string& text) const {
    json payload = {{"inputs", text}};
    
    utils::HttpClient::Response response;
    try {
        response = client_.postJson(endpoint_, payload.dump());
    } catch (const boost::system::system_error& e) {
        throw utils::InferenceError(std::string("Inference request failed: ") + e.what());
    }
    
    if (!response.ok()) {
        SHROUD_WARN("HttpTokenClassifier: endpoint returned {} {}", response.status_code, response.reason);
        throw utils::InferenceError("Inference endpoint returned HTTP " +
                                    std::to_string(response.status_code));
    }
    
    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded()) {
        throw utils::InferenceError("Inference endpoint returned invalid JSON");
    }
    return parseResponse(body, text);
}

std::vector<redaction::RawToken> HttpTokenClassifier::parseResponse(const json& body,
                                                                    const std::string& text) {
    const json* items = &body;
    // Batched pipelines wrap a single input's result in an outer array
    if (body.is_array() && body.size() == 1 && body[0].is_array()) {
        items = &body[0];
    }
    if (!items->is_array()) {
        throw utils::InferenceError("Inference response is not an array");
    }
    
    std::vector<redaction::RawToken> tokens;
    tokens.reserve(items->size());
    int position = 0;
    for (const auto& item : *items) {
        if (!item.is_object()) {
            throw utils::InferenceError("Inference response item is not an object");
        }
        
        redaction::RawToken token;
        try {
            bool aggregated = !item.contains("entity");
            if (aggregated) {
                token.label = item.value("entity_group", std::string("O"));
            } else {
                token.label = item["entity"].get<std::string>();
            }
            token.word = item.value("word", std::string());
            token.score = item.value("score", 0.0);
            // Aggregated groups are already whole entities and must not merge
            token.index = item.value("index", aggregated ? position * 2 : position);
            
            if (item.contains("start") && item["start"].is_number_unsigned() &&
                item.contains("end") && item["end"].is_number_unsigned()) {
                size_t start = utils::utf8ByteOffset(text, item["start"].get<size_t>());
                size_t end = utils::utf8ByteOffset(text, item["end"].get<size_t>());
                if (start < end) {
                    token.start = start;
                    token.end = end;
                }
            }
        } catch (const json::exception& e) {
            throw utils::InferenceError(std::string("Malformed inference token: ") + e.what());
        }
        tokens.push_back(std::move(token));
        ++position;
    }
    return tokens;
}

} // namespace inference
} // namespace shroud
