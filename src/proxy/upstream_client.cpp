#include "proxy/upstream_client.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <boost/system/system_error.hpp>

namespace shroud {
namespace proxy {

namespace {

utils::HttpClient::Config clientConfig(const UpstreamClient::Config& config) {
    utils::HttpClient::Config cc;
    cc.request_timeout_ms = config.timeout_ms;
    cc.verify_peer = config.verify_peer;
    return cc;
}

} // namespace

UpstreamClient::UpstreamClient(const Config& config)
    : config_(config)
    , endpoint_(utils::Url::parse(config.base_url).withPath("chat/completions"))
    , client_(clientConfig(config))
    , ssl_ctx_(utils::HttpClient::makeSslContext(config.verify_peer)) {
}

utils::HttpClient::Headers UpstreamClient::authHeaders() const {
    utils::HttpClient::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + config_.api_key);
    }
    return headers;
}

nlohmann::json UpstreamClient::complete(const nlohmann::json& request) const {
    utils::HttpClient::Response response;
    try {
        response = client_.postJson(endpoint_, request.dump(), authHeaders());
    } catch (const boost::system::system_error& e) {
        SHROUD_ERROR("Upstream request to {} failed: {}", endpoint_.host, e.what());
        throw utils::UpstreamError(0, e.what());
    }
    
    if (!response.ok()) {
        SHROUD_WARN("Upstream returned {} {}", response.status_code, response.reason);
        throw utils::UpstreamError(response.status_code, response.body);
    }
    
    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded()) {
        throw utils::UpstreamError(0, "Upstream returned invalid JSON");
    }
    return body;
}

} // namespace proxy
} // namespace shroud
