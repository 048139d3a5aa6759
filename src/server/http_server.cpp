#include "server/http_server.h"
#include "proxy/proxy_controller.h"
#include "utils/logger.h"

#include <algorithm>

namespace shroud {
namespace server {

HttpServer::HttpServer(const Config& config, std::shared_ptr<proxy::ProxyController> controller)
    : config_(config)
    , controller_(std::move(controller))
    , ioc_(static_cast<int>(std::max<size_t>(1, config.num_threads)))
    , acceptor_(net::make_strand(ioc_))
{
    if (config_.num_threads == 0) {
        config_.num_threads = 1;
    }
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) {
        SHROUD_WARN("Server already running");
        return;
    }
    
    // Setup acceptor
    tcp::endpoint endpoint{net::ip::make_address(config_.host), config_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();
    
    SHROUD_INFO("HTTP Server listening on {}:{}", config_.host, bound_port_);
    
    running_ = true;
    
    doAccept();
    
    threads_.reserve(config_.num_threads);
    for (size_t i = 0; i < config_.num_threads; ++i) {
        threads_.emplace_back([this, i] {
            SHROUD_DEBUG("Worker thread {} started", i);
            ioc_.run();
            SHROUD_DEBUG("Worker thread {} stopped", i);
        });
    }
    
    SHROUD_INFO("HTTP Server started with {} worker threads", config_.num_threads);
}

void HttpServer::stop() {
    if (!running_) {
        return;
    }
    
    SHROUD_INFO("Stopping HTTP Server...");
    running_ = false;
    
    ioc_.stop();
    
    SHROUD_INFO("Waiting for worker threads to finish...");
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    
    // No handler runs any more, so the acceptor can be closed from here
    beast::error_code ec;
    acceptor_.close(ec);
    
    SHROUD_INFO("HTTP Server stopped");
}

void HttpServer::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&HttpServer::onAccept, this)
    );
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec != net::error::operation_aborted) {
            SHROUD_ERROR("Accept error: {}", ec.message());
        }
    } else {
        std::make_shared<Session>(std::move(socket), this)->start();
    }
    
    if (running_ && acceptor_.is_open()) {
        doAccept();
    }
}

// ============================================================================
// Session Implementation
// ============================================================================

HttpServer::Session::Session(tcp::socket socket, HttpServer* server)
    : stream_(std::move(socket))
    , server_(server)
{
    beast::error_code ec;
    auto remote = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        peer_ip_ = remote.address().to_string();
    }
}

void HttpServer::Session::start() {
    // Run on the connection's strand from the first handler on
    net::dispatch(
        stream_.get_executor(),
        beast::bind_front_handler(&Session::doRead, shared_from_this())
    );
}

void HttpServer::Session::doRead() {
    parser_ = std::make_unique<http::request_parser<http::string_body>>();
    parser_->body_limit(server_->config_.max_request_size_mb * 1024 * 1024);
    
    stream_.expires_after(std::chrono::milliseconds(server_->config_.request_timeout_ms));
    
    http::async_read(
        stream_,
        buffer_,
        *parser_,
        beast::bind_front_handler(&Session::onRead, shared_from_this())
    );
}

void HttpServer::Session::onRead(
    beast::error_code ec,
    std::size_t bytes_transferred
) {
    boost::ignore_unused(bytes_transferred);
    
    if (ec == http::error::end_of_stream) {
        // Client closed connection
        doClose();
        return;
    }
    
    if (ec == http::error::body_limit) {
        http::request<http::string_body> req = parser_->release();
        response_ = proxy::ProxyController::makeErrorResponse(
            http::status::payload_too_large, "Payload Too Large", "Request body is too large", req);
        response_.keep_alive(false);
        doWrite();
        return;
    }
    
    if (ec) {
        if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
            SHROUD_DEBUG("Read error: {}", ec.message());
        }
        return;
    }
    
    processRequest();
}

void HttpServer::Session::processRequest() {
    http::request<http::string_body> request = parser_->release();
    
    auto result = server_->controller_->route(request, peer_ip_);
    
    if (result.stream) {
        // The relay owns the connection from here on
        stream_.expires_never();
        server_->controller_->startStream(std::move(stream_), request, std::move(*result.stream));
        return;
    }
    
    response_ = std::move(*result.response);
    doWrite();
}

void HttpServer::Session::doWrite() {
    bool close = response_.need_eof();
    stream_.expires_after(std::chrono::milliseconds(server_->config_.request_timeout_ms));
    http::async_write(
        stream_,
        response_,
        beast::bind_front_handler(
            &Session::onWrite,
            shared_from_this(),
            close
        )
    );
}

void HttpServer::Session::onWrite(
    bool close,
    beast::error_code ec,
    std::size_t bytes_transferred
) {
    boost::ignore_unused(bytes_transferred);
    
    if (ec) {
        SHROUD_DEBUG("Write error: {}", ec.message());
        return;
    }
    
    if (close) {
        doClose();
        return;
    }
    
    // Read next request
    doRead();
}

void HttpServer::Session::doClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace server
} // namespace shroud
