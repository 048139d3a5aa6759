#pragma once

#include "proxy/sse_stream_transformer.h"
#include "proxy/upstream_client.h"
#include "redaction/redaction_service.h"
#include "server/rate_limiter.h"
#include "session/risk_engine.h"

#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace shroud {
namespace proxy {

namespace beast = boost::beast;
namespace http = beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

/**
 * @brief A streamed chat completion that still has to be relayed
 *
 * The request has passed every gate and its messages are redacted;
 * upstream_body is the JSON to POST with "stream": true.
 */
struct StreamPlan {
    std::string session_id;
    std::string upstream_body;
};

/// Either a complete response or a stream hand-off
struct RouteResult {
    std::optional<Response> response;
    std::optional<StreamPlan> stream;
};

/**
 * @brief Request pipeline of the proxy
 *
 * rate limit -> session id -> ban gate -> input redaction -> upstream ->
 * output redaction -> client. Every redaction that finds entities is fed
 * to the risk engine under the caller's session id.
 *
 * Routes:
 * - POST   /v1/chat/completions
 * - POST   /debug/redact
 * - GET    /health, /v1/health
 * - GET    /v1/session/risk
 * - DELETE /v1/session/risk   (X-Admin-Token)
 *
 * Errors become {"error", "message", "statusCode"} bodies; 5xx answers
 * other than upstream errors hide the internal message.
 */
class ProxyController {
public:
    struct Config {
        std::string admin_token;
        SseRedactionTransformer::Options stream;
        std::string service_name = "shroud";
    };
    
    ProxyController(Config config,
                    std::shared_ptr<redaction::RedactionService> redaction,
                    std::shared_ptr<session::SessionRiskEngine> risk,
                    std::shared_ptr<server::RateLimiter> rate_limiter,
                    std::shared_ptr<UpstreamClient> upstream);
    
    RouteResult route(const Request& req, const std::string& peer_ip);
    
    /// Takes over the client connection and relays the upstream SSE stream
    void startStream(beast::tcp_stream client, const Request& req, StreamPlan plan);
    
    /// X-Forwarded-For first hop, else the socket peer
    static std::string clientIp(const Request& req, const std::string& peer_ip);
    
    /// Rate limit key: x-api-key, else Authorization, else client IP
    static std::string rateLimitKey(const Request& req, const std::string& ip);
    
    static session::RequestIdentity identityOf(const Request& req, const std::string& ip);
    
    static Response makeResponse(http::status status, const std::string& body, const Request& req);
    static Response makeErrorResponse(http::status status,
                                      const std::string& error,
                                      const std::string& message,
                                      const Request& req);
    
    static nlohmann::json entityToJson(const redaction::PiiEntity& entity);
    
private:
    RouteResult dispatch(const Request& req, const std::string& ip);
    
    RouteResult handleChatCompletions(const Request& req, const std::string& ip);
    Response handleDebugRedact(const Request& req);
    Response handleHealth(const Request& req, bool versioned);
    Response handleRiskGet(const Request& req, const std::string& ip);
    Response handleRiskDelete(const Request& req, const std::string& ip);
    
    /// Redacts text and charges any entities to the session
    std::string redactAndAssess(const std::string& text, const std::string& session_id);
    
    Config config_;
    std::shared_ptr<redaction::RedactionService> redaction_;
    std::shared_ptr<session::SessionRiskEngine> risk_;
    std::shared_ptr<server::RateLimiter> rate_limiter_;
    std::shared_ptr<UpstreamClient> upstream_;
};

} // namespace proxy
} // namespace shroud
