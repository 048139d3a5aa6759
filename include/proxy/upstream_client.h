#pragma once

#include "utils/http_client.h"
#include "utils/url.h"

#include <boost/asio/ssl/context.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace shroud {
namespace proxy {

/**
 * @brief OpenAI-compatible chat completion API
 *
 * Requests go to <base url>/chat/completions with a Bearer token when an
 * API key is configured. Errors are utils::UpstreamError: the upstream
 * status and body for non-2xx answers, status 0 for transport failures.
 * Never retried.
 */
class UpstreamClient {
public:
    struct Config {
        std::string base_url = "https://api.openai.com/v1";
        std::string api_key;
        uint32_t timeout_ms = 120000;
        bool verify_peer = true;
    };
    
    explicit UpstreamClient(const Config& config);
    
    /// Non-streaming completion; returns the parsed response body
    nlohmann::json complete(const nlohmann::json& request) const;
    
    const utils::Url& endpoint() const { return endpoint_; }
    utils::HttpClient::Headers authHeaders() const;
    std::chrono::milliseconds timeout() const { return std::chrono::milliseconds(config_.timeout_ms); }
    std::shared_ptr<boost::asio::ssl::context> sslContext() const { return ssl_ctx_; }
    
private:
    Config config_;
    utils::Url endpoint_;
    utils::HttpClient client_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
};

} // namespace proxy
} // namespace shroud
