#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace shroud {
namespace proxy {

/// Redacts one piece of message text and returns the replacement text
using TextRedactor = std::function<std::string(const std::string&)>;

/**
 * @brief Redacts chat message content
 *
 * Content is either a string or an array of parts. Only parts with
 * type == "text" and a string "text" field are rewritten; every other part
 * (images, audio, tool payloads) and any other content shape is returned
 * unchanged.
 */
nlohmann::json redactMessageContent(const nlohmann::json& content, const TextRedactor& redact);

/// Throws utils::ValidationError unless body is an object with a "messages" array
void validateChatRequest(const nlohmann::json& body);

/// Redacts the content of every message that has one
nlohmann::json redactMessages(const nlohmann::json& messages, const TextRedactor& redact);

/// Copy of the client request with redacted messages and "stream" forced
nlohmann::json buildUpstreamRequest(const nlohmann::json& body,
                                    const nlohmann::json& redacted_messages,
                                    bool stream);

/// Redacts choices[].message.content of a non-streamed completion in place
void redactChatResponse(nlohmann::json& response, const TextRedactor& redact);

/// True only for a literal boolean true "stream" field
bool isStreamingRequest(const nlohmann::json& body);

} // namespace proxy
} // namespace shroud
