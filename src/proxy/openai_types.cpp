#include "proxy/openai_types.h"
#include "utils/errors.h"

namespace shroud {
namespace proxy {

using json = nlohmann::json;

json redactMessageContent(const json& content, const TextRedactor& redact) {
    if (content.is_string()) {
        return redact(content.get<std::string>());
    }
    
    if (content.is_array()) {
        json parts = json::array();
        for (const auto& part : content) {
            if (part.is_object() && part.value("type", std::string()) == "text" &&
                part.contains("text") && part["text"].is_string()) {
                json copy = part;
                copy["text"] = redact(part["text"].get<std::string>());
                parts.push_back(std::move(copy));
            } else {
                parts.push_back(part);
            }
        }
        return parts;
    }
    
    return content;
}

void validateChatRequest(const json& body) {
    if (!body.is_object() || !body.contains("messages") || !body["messages"].is_array()) {
        throw utils::ValidationError("Body must include \"messages\" array.");
    }
}

json redactMessages(const json& messages, const TextRedactor& redact) {
    json out = json::array();
    for (const auto& message : messages) {
        if (message.is_object() && message.contains("content")) {
            json copy = message;
            copy["content"] = redactMessageContent(message["content"], redact);
            out.push_back(std::move(copy));
        } else {
            out.push_back(message);
        }
    }
    return out;
}

json buildUpstreamRequest(const json& body, const json& redacted_messages, bool stream) {
    json out = body;
    out["stream"] = stream;
    out["messages"] = redacted_messages;
    return out;
}

void redactChatResponse(json& response, const TextRedactor& redact) {
    if (!response.is_object() || !response.contains("choices") || !response["choices"].is_array()) {
        return;
    }
    for (auto& choice : response["choices"]) {
        if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
            continue;
        }
        auto& message = choice["message"];
        if (!message.contains("content") || message["content"].is_null()) {
            continue;
        }
        if (message["content"].is_string() && message["content"].get<std::string>().empty()) {
            continue;
        }
        message["content"] = redactMessageContent(message["content"], redact);
    }
}

bool isStreamingRequest(const json& body) {
    return body.is_object() && body.contains("stream") &&
           body["stream"].is_boolean() && body["stream"].get<bool>();
}

} // namespace proxy
} // namespace shroud
