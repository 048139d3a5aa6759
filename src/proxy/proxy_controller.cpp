#include "proxy/proxy_controller.h"
#include "proxy/openai_types.h"
#include "proxy/stream_relay.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include "utils/text_utils.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace shroud {
namespace proxy {

using json = nlohmann::json;

namespace {

std::string isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

std::string pathOf(const Request& req) {
    std::string target(req.target());
    auto qpos = target.find('?');
    return qpos == std::string::npos ? target : target.substr(0, qpos);
}

// Value of one query parameter; no percent-decoding
std::optional<std::string> queryParam(const Request& req, const std::string& name) {
    std::string target(req.target());
    auto qpos = target.find('?');
    if (qpos == std::string::npos) return std::nullopt;
    
    std::string query = target.substr(qpos + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = pair.find('=');
        if (pair.substr(0, eq) == name) {
            return eq == std::string::npos ? std::string() : pair.substr(eq + 1);
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return std::nullopt;
}

std::optional<std::string> headerValue(const Request& req, beast::string_view name) {
    auto it = req.find(name);
    if (it == req.end() || it->value().empty()) return std::nullopt;
    return std::string(it->value());
}

} // namespace

ProxyController::ProxyController(Config config,
                                 std::shared_ptr<redaction::RedactionService> redaction,
                                 std::shared_ptr<session::SessionRiskEngine> risk,
                                 std::shared_ptr<server::RateLimiter> rate_limiter,
                                 std::shared_ptr<UpstreamClient> upstream)
    : config_(std::move(config))
    , redaction_(std::move(redaction))
    , risk_(std::move(risk))
    , rate_limiter_(std::move(rate_limiter))
    , upstream_(std::move(upstream)) {
}

std::string ProxyController::clientIp(const Request& req, const std::string& peer_ip) {
    auto forwarded = headerValue(req, "X-Forwarded-For");
    if (forwarded) {
        std::string first = utils::trim(forwarded->substr(0, forwarded->find(',')));
        if (!first.empty()) return first;
    }
    return peer_ip;
}

std::string ProxyController::rateLimitKey(const Request& req, const std::string& ip) {
    if (auto api_key = headerValue(req, "x-api-key")) return *api_key;
    if (auto auth = headerValue(req, "Authorization")) return *auth;
    return ip;
}

session::RequestIdentity ProxyController::identityOf(const Request& req, const std::string& ip) {
    session::RequestIdentity identity;
    identity.api_key = headerValue(req, "x-api-key");
    identity.authorization = headerValue(req, "Authorization");
    identity.ip = ip;
    return identity;
}

Response ProxyController::makeResponse(http::status status, const std::string& body, const Request& req) {
    Response res{status, req.version()};
    res.set(http::field::server, "shroud/1.0");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

Response ProxyController::makeErrorResponse(http::status status,
                                            const std::string& error,
                                            const std::string& message,
                                            const Request& req) {
    json body = {
        {"error", error},
        {"message", message},
        {"statusCode", static_cast<int>(status)}
    };
    return makeResponse(status, body.dump(), req);
}

json ProxyController::entityToJson(const redaction::PiiEntity& entity) {
    return {
        {"type", redaction::PiiTypeUtils::toString(entity.type)},
        {"text", entity.text},
        {"start", entity.start},
        {"end", entity.end},
        {"confidence", entity.confidence}
    };
}

RouteResult ProxyController::route(const Request& req, const std::string& peer_ip) {
    const std::string ip = clientIp(req, peer_ip);
    
    SHROUD_DEBUG("Request: {} {}", std::string(req.method_string()), std::string(req.target()));
    
    const auto limit = rate_limiter_->check(rateLimitKey(req, ip));
    auto withLimitHeaders = [&limit](RouteResult result) {
        if (result.response) {
            result.response->set("X-RateLimit-Limit", std::to_string(limit.limit));
            result.response->set("X-RateLimit-Remaining", std::to_string(limit.remaining));
            result.response->set("X-RateLimit-Reset", std::to_string(limit.reset_seconds));
        }
        return result;
    };
    if (!limit.allowed) {
        auto res = makeErrorResponse(http::status::too_many_requests, "Too Many Requests",
                                     "Rate limit exceeded. Please slow down.", req);
        res.set(http::field::retry_after, std::to_string(limit.retry_after_seconds));
        return withLimitHeaders({std::move(res), std::nullopt});
    }
    
    auto fail = [&](http::status status, const std::string& error, const std::string& message) {
        return withLimitHeaders({makeErrorResponse(status, error, message, req), std::nullopt});
    };
    
    try {
        return withLimitHeaders(dispatch(req, ip));
    } catch (const utils::ValidationError& e) {
        return fail(http::status::bad_request, "Bad Request", e.what());
    } catch (const utils::UpstreamError& e) {
        int status = e.getStatus() == 0 ? 502 : e.getStatus();
        return fail(static_cast<http::status>(status), "Upstream Error", e.getBody());
    } catch (const utils::InferenceTimeoutError& e) {
        SHROUD_ERROR("Redaction timed out after {} ms; request blocked", e.getTimeoutMs());
        return fail(http::status::service_unavailable, "Service Unavailable", "Internal Server Error");
    } catch (const utils::InferenceError& e) {
        SHROUD_ERROR("Inference failed: {}", e.what());
        return fail(http::status::bad_gateway, "Bad Gateway", "Internal Server Error");
    } catch (const utils::StoreError& e) {
        SHROUD_ERROR("Session store failed: {}", e.what());
        return fail(http::status::service_unavailable, "Service Unavailable", "Internal Server Error");
    } catch (const std::exception& e) {
        SHROUD_ERROR("Unhandled error for {}: {}", pathOf(req), e.what());
        return fail(http::status::internal_server_error, "Internal Server Error", "Internal Server Error");
    }
}

RouteResult ProxyController::dispatch(const Request& req, const std::string& ip) {
    const std::string path = pathOf(req);
    const auto method = req.method();
    
    if (path == "/v1/chat/completions" && method == http::verb::post) {
        return handleChatCompletions(req, ip);
    }
    if (path == "/debug/redact" && method == http::verb::post) {
        return {handleDebugRedact(req), std::nullopt};
    }
    if (path == "/health" && method == http::verb::get) {
        return {handleHealth(req, false), std::nullopt};
    }
    if (path == "/v1/health" && method == http::verb::get) {
        return {handleHealth(req, true), std::nullopt};
    }
    if (path == "/v1/session/risk" && method == http::verb::get) {
        return {handleRiskGet(req, ip), std::nullopt};
    }
    if (path == "/v1/session/risk" && method == http::verb::delete_) {
        return {handleRiskDelete(req, ip), std::nullopt};
    }
    
    return {makeErrorResponse(http::status::not_found, "Not Found",
                              "Route " + std::string(req.method_string()) + ":" + path + " not found", req),
            std::nullopt};
}

std::string ProxyController::redactAndAssess(const std::string& text, const std::string& session_id) {
    auto result = redaction_->redact(text);
    if (!result.entities.empty()) {
        risk_->store().increment(session_id, "entities", static_cast<int64_t>(result.entities.size()));
        auto assessment = risk_->assessRisk(session_id, result.entities);
        SHROUD_DEBUG("Redacted {} entities, session score {}", result.entities.size(), assessment.score);
    }
    return result.text;
}

RouteResult ProxyController::handleChatCompletions(const Request& req, const std::string& ip) {
    const std::string session_id = session::SessionRiskEngine::extractSessionId(identityOf(req, ip));
    
    if (risk_->isBanned(session_id)) {
        return {makeErrorResponse(http::status::forbidden, "Forbidden",
                                  "Session blocked due to excessive PII exposure. Please try again later.",
                                  req),
                std::nullopt};
    }
    
    json body = json::parse(req.body(), nullptr, false);
    if (body.is_discarded()) {
        throw utils::ValidationError("Body must be valid JSON.");
    }
    validateChatRequest(body);
    risk_->store().increment(session_id, "requests");
    
    TextRedactor redact = [this, &session_id](const std::string& text) {
        return redactAndAssess(text, session_id);
    };
    
    json messages = redactMessages(body["messages"], redact);
    const bool stream = isStreamingRequest(body);
    json upstream_request = buildUpstreamRequest(body, messages, stream);
    
    if (stream) {
        return {std::nullopt, StreamPlan{session_id, upstream_request.dump()}};
    }
    
    json response = upstream_->complete(upstream_request);
    redactChatResponse(response, redact);
    return {makeResponse(http::status::ok, response.dump(), req), std::nullopt};
}

void ProxyController::startStream(beast::tcp_stream client, const Request& req, StreamPlan plan) {
    StreamRelay::Config relay_config;
    relay_config.endpoint = upstream_->endpoint();
    relay_config.headers = upstream_->authHeaders();
    relay_config.timeout = upstream_->timeout();
    relay_config.stream = config_.stream;
    relay_config.ssl_ctx = upstream_->sslContext();
    
    std::make_shared<StreamRelay>(
        std::move(client),
        req.version(),
        std::move(relay_config),
        redaction_,
        risk_,
        std::move(plan.session_id),
        std::move(plan.upstream_body)
    )->start();
}

Response ProxyController::handleDebugRedact(const Request& req) {
    json body = json::parse(req.body(), nullptr, false);
    std::string text;
    if (body.is_object() && body.contains("text") && body["text"].is_string()) {
        text = body["text"].get<std::string>();
    }
    if (utils::isBlank(text)) {
        throw utils::ValidationError("Body must include a non-empty \"text\" field.");
    }
    
    auto result = redaction_->redact(text);
    
    json entities = json::array();
    for (const auto& entity : result.entities) {
        entities.push_back(entityToJson(entity));
    }
    
    json out = {
        {"input", text},
        {"redaction", {
            {"text", result.text},
            {"entities", entities},
            {"processingTimeMs", result.processing_time_ms}
        }}
    };
    
    if (body.contains("includeRaw") && body["includeRaw"].is_boolean() && body["includeRaw"].get<bool>()) {
        auto detection = redaction_->detect(text);
        json tokens = json::array();
        for (const auto& token : detection.tokens) {
            json t = {
                {"entity", token.label},
                {"word", token.word},
                {"score", token.score},
                {"index", token.index}
            };
            if (token.start && token.end) {
                t["start"] = *token.start;
                t["end"] = *token.end;
            }
            tokens.push_back(std::move(t));
        }
        out["raw"] = {
            {"classifier", redaction_->classifier().name()},
            {"tokens", tokens}
        };
    }
    
    return makeResponse(http::status::ok, out.dump(), req);
}

Response ProxyController::handleHealth(const Request& req, bool versioned) {
    json out = {
        {"status", "ok"},
        {"timestamp", isoTimestamp()}
    };
    if (versioned) {
        out["service"] = config_.service_name;
        out["upstreamProvider"] = "openai-compatible";
    }
    return makeResponse(http::status::ok, out.dump(), req);
}

Response ProxyController::handleRiskGet(const Request& req, const std::string& ip) {
    const std::string session_id = session::SessionRiskEngine::extractSessionId(identityOf(req, ip));
    int64_t score = risk_->getRiskScore(session_id);
    
    json out = {
        {"sessionId", session_id},
        {"score", score},
        {"threshold", risk_->config().threshold},
        {"banned", score >= risk_->config().threshold}
    };
    return makeResponse(http::status::ok, out.dump(), req);
}

Response ProxyController::handleRiskDelete(const Request& req, const std::string& ip) {
    if (config_.admin_token.empty()) {
        return makeErrorResponse(http::status::not_found, "Not Found", "Admin endpoints are disabled", req);
    }
    auto token = headerValue(req, "X-Admin-Token");
    if (!token || *token != config_.admin_token) {
        return makeErrorResponse(http::status::forbidden, "Forbidden", "Invalid admin token", req);
    }
    
    std::string session_id;
    auto requested = queryParam(req, "session");
    if (requested && !requested->empty()) {
        session_id = *requested;
    } else {
        session_id = session::SessionRiskEngine::extractSessionId(identityOf(req, ip));
    }
    
    risk_->clearRisk(session_id);
    SHROUD_INFO("Risk score cleared by admin request");
    
    json out = {{"sessionId", session_id}, {"cleared", true}};
    return makeResponse(http::status::ok, out.dump(), req);
}

} // namespace proxy
} // namespace shroud
