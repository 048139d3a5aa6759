#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace shroud {
namespace proxy { class ProxyController; }

namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief Async HTTP server in front of the proxy controller
 * 
 * - Worker threads share one io_context
 * - One strand per connection; handlers on a connection never run concurrently
 * - Keep-alive connections; a streamed completion takes over its connection
 */
class HttpServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        uint16_t port = 3000;
        size_t num_threads = std::thread::hardware_concurrency();
        size_t max_request_size_mb = 10;
        uint32_t request_timeout_ms = 30000;
        
        Config() = default;
        Config(std::string h, uint16_t p, size_t threads = 0)
            : host(std::move(h)), port(p) {
            if (threads > 0) num_threads = threads;
        }
    };
    
    HttpServer(const Config& config, std::shared_ptr<proxy::ProxyController> controller);
    ~HttpServer();
    
    /// Binds and starts the worker threads (non-blocking)
    void start();
    
    /// Closes the acceptor, stops the io_context and joins the workers
    void stop();
    
    /// Blocks until the worker threads exit
    void wait();
    
    bool isRunning() const { return running_; }
    
    /// Bound port; differs from Config::port when that was 0
    uint16_t port() const { return bound_port_; }
    
private:
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket socket, HttpServer* server);
        void start();
        
    private:
        void doRead();
        void onRead(beast::error_code ec, std::size_t bytes_transferred);
        void processRequest();
        void doWrite();
        void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
        void doClose();
        
        beast::tcp_stream stream_;
        HttpServer* server_;
        beast::flat_buffer buffer_;
        std::unique_ptr<http::request_parser<http::string_body>> parser_;
        http::response<http::string_body> response_;
        std::string peer_ip_;
    };
    
    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);
    
    Config config_;
    std::shared_ptr<proxy::ProxyController> controller_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    uint16_t bound_port_ = 0;
};

} // namespace server
} // namespace shroud
