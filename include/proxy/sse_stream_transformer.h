#pragma once

#include "redaction/pii_types.h"
#include "redaction/redaction_service.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shroud {
namespace proxy {

/**
 * @brief Re-segments an upstream chat-completion SSE stream for redaction
 *
 * Raw upstream bytes go in through write(); complete SSE output goes out
 * through the sink. Delta text is accumulated and flushed through the
 * RedactionService when any of these holds:
 * - the buffer contains a sentence boundary ('.', '!' or '?' followed by
 *   whitespace or end of buffer)
 * - the token estimate (length / 4, rounded up) reaches max_tokens
 * - max_delay_ms has passed since the last flush (checked on write, and
 *   enforced by a timer that is re-armed on every write)
 *
 * Non-data lines, unparseable data lines and deltas without text are passed
 * through unchanged. A flushed chunk is re-emitted as one
 * "data: {chat.completion.chunk}\n\n" frame reusing the last seen id, model,
 * created and choice index; the assistant role is attached to the first
 * emitted frame only.
 *
 * Not thread-safe: write(), finish(), abort() and the timer must all run on
 * the same executor (strand). Redaction errors during write()/finish() are
 * thrown; errors from a timer-driven flush go to the error handler.
 */
class SseRedactionTransformer : public std::enable_shared_from_this<SseRedactionTransformer> {
public:
    struct Options {
        size_t max_tokens = 20;
        int max_delay_ms = 200;
    };
    
    using Sink = std::function<void(std::string)>;
    using ErrorHandler = std::function<void(std::exception_ptr)>;
    using EntityHandler = std::function<void(const std::vector<redaction::PiiEntity>&)>;
    
    SseRedactionTransformer(boost::asio::any_io_executor executor,
                            std::shared_ptr<const redaction::RedactionService> redaction,
                            Options options,
                            Sink sink);
    
    void setErrorHandler(ErrorHandler handler) { on_error_ = std::move(handler); }
    void setEntityHandler(EntityHandler handler) { on_entities_ = std::move(handler); }
    
    /// Feeds raw upstream bytes; chunks need not align with lines
    void write(std::string_view chunk);
    
    /// End of upstream: processes a trailing partial line, then force-flushes
    void finish();
    
    /// Tears down: cancels the flush timer and drops all buffered state
    void abort();
    
    const std::string& bufferedText() const { return text_buffer_; }
    size_t pendingTokenEstimate() const { return token_estimate_; }
    bool finished() const { return finished_; }
    
    static bool hasSentenceBoundary(const std::string& text);
    static size_t estimateTokens(const std::string& text);
    
private:
    struct StreamMeta {
        std::optional<std::string> id;
        std::optional<std::string> model;
        std::optional<int64_t> created;
        std::optional<int64_t> index;
        std::optional<std::string> role;
    };
    
    void processLine(std::string line);
    std::optional<std::string> extractDeltaContent(const nlohmann::json& data);
    bool shouldFlush() const;
    void scheduleFlush();
    void onFlushTimer(const boost::system::error_code& ec);
    void flushBuffer();
    std::string formatChunk(const std::string& text);
    void emit(std::string out);
    
    std::shared_ptr<const redaction::RedactionService> redaction_;
    Options options_;
    Sink sink_;
    ErrorHandler on_error_;
    EntityHandler on_entities_;
    
    boost::asio::steady_timer flush_timer_;
    
    std::string line_buffer_;
    std::string text_buffer_;
    size_t token_estimate_ = 0;
    std::chrono::steady_clock::time_point last_flush_at_;
    StreamMeta meta_;
    bool role_emitted_ = false;
    bool finished_ = false;
    bool aborted_ = false;
};

} // namespace proxy
} // namespace shroud
