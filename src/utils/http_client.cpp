#include "utils/http_client.h"
#include "utils/logger.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

namespace shroud {
namespace utils {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// Runs the io_context until the single pending operation completes
void await(net::io_context& ioc, beast::error_code& ec, const char* what) {
    ioc.run();
    ioc.restart();
    if (ec) {
        throw beast::system_error(ec, what);
    }
}

template<typename Stream>
HttpClient::Response exchange(Stream& stream,
                              net::io_context& ioc,
                              http::request<http::string_body>& req,
                              std::chrono::milliseconds timeout) {
    beast::error_code ec;
    
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    await(ioc, ec, "write");
    
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_read(stream, buffer, res, [&ec](beast::error_code e, std::size_t) { ec = e; });
    await(ioc, ec, "read");
    
    HttpClient::Response response;
    response.status_code = res.result_int();
    response.reason = std::string(res.reason());
    response.content_type = std::string(res[http::field::content_type]);
    response.body = std::move(res.body());
    return response;
}

} // namespace

HttpClient::HttpClient(const Config& config)
    : config_(config)
    , ssl_ctx_(makeSslContext(config.verify_peer)) {
}

HttpClient::~HttpClient() = default;

std::shared_ptr<ssl::context> HttpClient::makeSslContext(bool verify_peer) {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    ctx->set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1
    );
    ctx->set_default_verify_paths();
    ctx->set_verify_mode(verify_peer ? ssl::verify_peer : ssl::verify_none);
    return ctx;
}

HttpClient::Response HttpClient::postJson(const Url& url, const std::string& json_body,
                                          const Headers& headers) const {
    Headers all = headers;
    all.emplace_back("Content-Type", "application/json");
    return request(http::verb::post, url, json_body, all);
}

HttpClient::Response HttpClient::request(http::verb method,
                                         const Url& url,
                                         const std::string& body,
                                         const Headers& headers) const {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    auto const results = resolver.resolve(url.host, url.port);
    
    http::request<http::string_body> req{method, url.target(), 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, config_.user_agent);
    req.set(http::field::accept, "application/json");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    if (!body.empty()) {
        req.body() = body;
    }
    req.prepare_payload();
    
    const auto connect_timeout = std::chrono::milliseconds(config_.connect_timeout_ms);
    const auto request_timeout = std::chrono::milliseconds(config_.request_timeout_ms);
    beast::error_code ec;
    
    if (url.isTls()) {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, *ssl_ctx_);
        
        // SNI
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            throw beast::system_error(
                beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                "Failed to set SNI");
        }
        if (config_.verify_peer) {
            stream.set_verify_callback(ssl::host_name_verification(url.host));
        }
        
        beast::get_lowest_layer(stream).expires_after(connect_timeout);
        beast::get_lowest_layer(stream).async_connect(results,
            [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        await(ioc, ec, "connect");
        
        beast::get_lowest_layer(stream).expires_after(connect_timeout);
        stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
        await(ioc, ec, "handshake");
        
        Response response = exchange(stream, ioc, req, request_timeout);
        
        // Peers commonly skip close_notify; the response is already complete
        beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(1));
        stream.async_shutdown([](beast::error_code) {});
        ioc.run();
        return response;
    }
    
    beast::tcp_stream stream(ioc);
    stream.expires_after(connect_timeout);
    stream.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    await(ioc, ec, "connect");
    
    Response response = exchange(stream, ioc, req, request_timeout);
    
    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    return response;
}

} // namespace utils
} // namespace shroud
