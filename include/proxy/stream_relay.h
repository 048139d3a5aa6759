#pragma once

#include "proxy/sse_stream_transformer.h"
#include "redaction/redaction_service.h"
#include "session/risk_engine.h"
#include "utils/http_client.h"
#include "utils/url.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace shroud {
namespace proxy {

/**
 * @brief Relays one streamed chat completion from the upstream to a client
 *
 * Connects to the upstream on the client connection's strand, POSTs the
 * request and reads the response body incrementally. A non-2xx answer is
 * read whole and returned to the client as a JSON error. A 2xx answer gets
 * text/event-stream headers once, then every transformer output chunk is
 * written as an HTTP chunk.
 *
 * Upstream reads pause while client writes are pending, so a slow client
 * cannot make the relay buffer without bound. Any failure on either side
 * tears down both connections and the transformer's flush timer.
 */
class StreamRelay : public std::enable_shared_from_this<StreamRelay> {
public:
    struct Config {
        utils::Url endpoint;
        utils::HttpClient::Headers headers;
        std::chrono::milliseconds timeout{120000};
        SseRedactionTransformer::Options stream;
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx;
    };
    
    StreamRelay(boost::beast::tcp_stream client,
                unsigned http_version,
                Config config,
                std::shared_ptr<const redaction::RedactionService> redaction,
                std::shared_ptr<session::SessionRiskEngine> risk,
                std::string session_id,
                std::string upstream_body);
    ~StreamRelay();
    
    void start();
    
private:
    using tcp = boost::asio::ip::tcp;
    using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
    
    // Runs f on whichever upstream stream is active
    template<typename F>
    void withUpstream(F&& f);
    
    void onResolve(boost::beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(boost::beast::error_code ec, tcp::resolver::results_type::endpoint_type);
    void onHandshake(boost::beast::error_code ec);
    void sendRequest();
    void onRequestWritten(boost::beast::error_code ec, std::size_t);
    void onHeader(boost::beast::error_code ec, std::size_t);
    
    void readErrorBody();
    void onErrorBody(boost::beast::error_code ec, std::size_t);
    
    void startStreaming();
    void onStreamHeaderWritten(boost::beast::error_code ec, std::size_t);
    void readBody();
    void onBody(boost::beast::error_code ec, std::size_t);
    void onUpstreamEnd();
    
    void enqueue(std::string data);
    void writeNext();
    void onChunkWritten(boost::beast::error_code ec, std::size_t);
    void writeLastChunk();
    void onLastChunkWritten(boost::beast::error_code ec, std::size_t);
    
    void sendError(int status, const std::string& error, const std::string& message);
    void onErrorSent(boost::beast::error_code ec, std::size_t);
    
    void fail(const std::string& where, const std::string& what);
    void teardown();
    
    boost::beast::tcp_stream client_;
    unsigned http_version_;
    Config config_;
    std::shared_ptr<const redaction::RedactionService> redaction_;
    std::shared_ptr<session::SessionRiskEngine> risk_;
    std::string session_id_;
    std::string upstream_body_;
    
    tcp::resolver resolver_;
    std::unique_ptr<boost::beast::tcp_stream> plain_;
    std::unique_ptr<TlsStream> tls_;
    
    boost::beast::flat_buffer upstream_buffer_;
    boost::beast::http::request<boost::beast::http::string_body> upstream_request_;
    boost::beast::http::response_parser<boost::beast::http::buffer_body> parser_;
    char read_buf_[8192];
    std::string error_body_;
    int upstream_status_ = 0;
    
    std::unique_ptr<boost::beast::http::response<boost::beast::http::empty_body>> stream_header_;
    std::unique_ptr<boost::beast::http::response_serializer<boost::beast::http::empty_body>> header_serializer_;
    std::unique_ptr<boost::beast::http::response<boost::beast::http::string_body>> error_response_;
    
    std::shared_ptr<SseRedactionTransformer> transformer_;
    std::deque<std::string> write_queue_;
    bool writing_ = false;
    bool read_paused_ = false;
    bool upstream_done_ = false;
    bool headers_sent_ = false;
    bool closed_ = false;
};

} // namespace proxy
} // namespace shroud
