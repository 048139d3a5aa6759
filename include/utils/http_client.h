#pragma once

#include "utils/url.h"

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace shroud {
namespace utils {

/**
 * @brief Blocking HTTP/1.1 client over Boost.Beast (plain TCP or TLS)
 *
 * One connection per request. Every step (resolve excluded) is bounded by
 * the request timeout through beast::tcp_stream expiry. Transport failures
 * throw boost::system::system_error; any HTTP status is returned as-is.
 * Safe to use from several threads: each call runs on its own io_context.
 */
class HttpClient {
public:
    struct Config {
        uint32_t connect_timeout_ms = 5000;
        uint32_t request_timeout_ms = 30000;
        bool verify_peer = true;
        std::string user_agent = "shroud/1.0";
    };
    
    struct Response {
        int status_code = 0;
        std::string reason;
        std::string content_type;
        std::string body;
        
        bool ok() const { return status_code >= 200 && status_code < 300; }
    };
    
    using Headers = std::vector<std::pair<std::string, std::string>>;
    
    explicit HttpClient(const Config& config);
    ~HttpClient();
    
    Response request(boost::beast::http::verb method,
                     const Url& url,
                     const std::string& body,
                     const Headers& headers = {}) const;
    
    Response postJson(const Url& url, const std::string& json_body, const Headers& headers = {}) const;
    
    const Config& config() const { return config_; }
    
    /// TLS client context with system trust store; peer verification optional
    static std::shared_ptr<boost::asio::ssl::context> makeSslContext(bool verify_peer);
    
private:
    Config config_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
};

} // namespace utils
} // namespace shroud
