#include "proxy/sse_stream_transformer.h"
#include "utils/logger.h"
#include "utils/text_utils.h"

#include <cctype>

namespace shroud {
namespace proxy {

namespace {

const std::string kDataPrefix = "data:";
const std::string kDoneMarker = "[DONE]";

} // namespace

SseRedactionTransformer::SseRedactionTransformer(boost::asio::any_io_executor executor,
                                                 std::shared_ptr<const redaction::RedactionService> redaction,
                                                 Options options,
                                                 Sink sink)
    : redaction_(std::move(redaction))
    , options_(options)
    , sink_(std::move(sink))
    , flush_timer_(executor)
    , last_flush_at_(std::chrono::steady_clock::now()) {
}

bool SseRedactionTransformer::hasSentenceBoundary(const std::string& text) {
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '.' && c != '!' && c != '?') continue;
        if (i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1]))) {
            return true;
        }
    }
    return false;
}

size_t SseRedactionTransformer::estimateTokens(const std::string& text) {
    return (utils::utf8Length(text) + 3) / 4;
}

void SseRedactionTransformer::write(std::string_view chunk) {
    if (finished_ || aborted_) return;
    
    line_buffer_.append(chunk.data(), chunk.size());
    
    size_t pos = 0;
    size_t nl;
    while ((nl = line_buffer_.find('\n', pos)) != std::string::npos) {
        std::string line = line_buffer_.substr(pos, nl - pos);
        pos = nl + 1;
        processLine(std::move(line));
        if (aborted_) return;
    }
    line_buffer_.erase(0, pos);
    
    scheduleFlush();
}

void SseRedactionTransformer::finish() {
    if (finished_ || aborted_) return;
    flush_timer_.cancel();
    
    if (!line_buffer_.empty()) {
        std::string line = std::move(line_buffer_);
        line_buffer_.clear();
        processLine(std::move(line));
    }
    flushBuffer();
    finished_ = true;
}

void SseRedactionTransformer::abort() {
    aborted_ = true;
    flush_timer_.cancel();
    line_buffer_.clear();
    text_buffer_.clear();
    token_estimate_ = 0;
}

void SseRedactionTransformer::processLine(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    
    if (!utils::startsWith(line, kDataPrefix)) {
        emit(line.empty() ? "\n" : line + "\n");
        return;
    }
    
    std::string payload = utils::trim(line.substr(kDataPrefix.size()));
    
    if (payload == kDoneMarker) {
        flushBuffer();
        emit("data: [DONE]\n\n");
        return;
    }
    
    nlohmann::json data = nlohmann::json::parse(payload, nullptr, false);
    if (data.is_discarded()) {
        // Malformed frame: forwarded verbatim
        SHROUD_DEBUG("Passing through unparseable SSE data line ({} bytes)", payload.size());
        emit(line + "\n");
        return;
    }
    
    auto role_before = meta_.role;
    auto content = extractDeltaContent(data);
    if (!content || content->empty()) {
        // A forwarded frame that carried the role already announced it
        if (meta_.role && meta_.role != role_before) {
            role_emitted_ = true;
        }
        emit(line + "\n");
        return;
    }
    
    text_buffer_ += *content;
    token_estimate_ += estimateTokens(*content);
    
    if (shouldFlush()) {
        flushBuffer();
    }
}

std::optional<std::string> SseRedactionTransformer::extractDeltaContent(const nlohmann::json& data) {
    if (!data.is_object()) return std::nullopt;
    auto choices = data.find("choices");
    if (choices == data.end() || !choices->is_array() || choices->empty()) return std::nullopt;
    
    const auto& choice = (*choices)[0];
    if (!choice.is_object()) return std::nullopt;
    
    if (data.contains("id") && data["id"].is_string()) meta_.id = data["id"].get<std::string>();
    if (data.contains("model") && data["model"].is_string()) meta_.model = data["model"].get<std::string>();
    if (data.contains("created") && data["created"].is_number_integer()) meta_.created = data["created"].get<int64_t>();
    if (choice.contains("index") && choice["index"].is_number_integer()) meta_.index = choice["index"].get<int64_t>();
    
    auto delta = choice.find("delta");
    if (delta == choice.end() || !delta->is_object()) return std::nullopt;
    
    if (delta->contains("role") && (*delta)["role"].is_string()) {
        meta_.role = (*delta)["role"].get<std::string>();
    }
    
    auto content = delta->find("content");
    if (content == delta->end() || !content->is_string()) return std::nullopt;
    return content->get<std::string>();
}

bool SseRedactionTransformer::shouldFlush() const {
    if (hasSentenceBoundary(text_buffer_)) {
        return true;
    }
    if (token_estimate_ >= options_.max_tokens) {
        return true;
    }
    auto elapsed = std::chrono::steady_clock::now() - last_flush_at_;
    return elapsed >= std::chrono::milliseconds(options_.max_delay_ms);
}

void SseRedactionTransformer::scheduleFlush() {
    flush_timer_.cancel();
    if (text_buffer_.empty()) return;
    
    flush_timer_.expires_after(std::chrono::milliseconds(options_.max_delay_ms));
    flush_timer_.async_wait(
        [weak = weak_from_this()](const boost::system::error_code& ec) {
            if (auto self = weak.lock()) {
                self->onFlushTimer(ec);
            }
        });
}

void SseRedactionTransformer::onFlushTimer(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || aborted_ || finished_) {
        return;
    }
    try {
        flushBuffer();
    } catch (const std::exception& e) {
        SHROUD_ERROR("Timed stream flush failed: {}", e.what());
        if (on_error_) {
            on_error_(std::current_exception());
        }
    }
}

void SseRedactionTransformer::flushBuffer() {
    if (text_buffer_.empty()) return;
    
    std::string text = std::move(text_buffer_);
    text_buffer_.clear();
    token_estimate_ = 0;
    last_flush_at_ = std::chrono::steady_clock::now();
    
    auto result = redaction_->redact(text);
    if (!result.entities.empty() && on_entities_) {
        on_entities_(result.entities);
    }
    emit(formatChunk(result.text));
}

std::string SseRedactionTransformer::formatChunk(const std::string& text) {
    nlohmann::ordered_json delta;
    delta["content"] = text;
    if (meta_.role && !role_emitted_) {
        delta["role"] = *meta_.role;
        role_emitted_ = true;
    }
    
    nlohmann::ordered_json chunk;
    if (meta_.id) chunk["id"] = *meta_.id;
    chunk["object"] = "chat.completion.chunk";
    if (meta_.created) chunk["created"] = *meta_.created;
    if (meta_.model) chunk["model"] = *meta_.model;
    chunk["choices"] = nlohmann::ordered_json::array({
        {{"index", meta_.index.value_or(0)}, {"delta", delta}, {"finish_reason", nullptr}}
    });
    
    return "data: " + chunk.dump() + "\n\n";
}

void SseRedactionTransformer::emit(std::string out) {
    if (aborted_) return;
    sink_(std::move(out));
}

} // namespace proxy
} // namespace shroud
