#include "proxy/stream_relay.h"
#include "utils/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <limits>

namespace shroud {
namespace proxy {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

namespace {

constexpr size_t kMaxErrorBody = 64 * 1024;

bool isEndOfStream(const beast::error_code& ec) {
    return ec == http::error::end_of_stream ||
           ec == http::error::partial_message ||
           ec == net::error::eof;
}

} // namespace

StreamRelay::StreamRelay(beast::tcp_stream client,
                         unsigned http_version,
                         Config config,
                         std::shared_ptr<const redaction::RedactionService> redaction,
                         std::shared_ptr<session::SessionRiskEngine> risk,
                         std::string session_id,
                         std::string upstream_body)
    : client_(std::move(client))
    , http_version_(http_version)
    , config_(std::move(config))
    , redaction_(std::move(redaction))
    , risk_(std::move(risk))
    , session_id_(std::move(session_id))
    , upstream_body_(std::move(upstream_body))
    , resolver_(client_.get_executor()) {
    parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
}

StreamRelay::~StreamRelay() {
    SHROUD_DEBUG("Stream relay released");
}

template<typename F>
void StreamRelay::withUpstream(F&& f) {
    if (tls_) {
        f(*tls_);
    } else {
        f(*plain_);
    }
}

void StreamRelay::start() {
    if (config_.endpoint.isTls()) {
        tls_ = std::make_unique<TlsStream>(client_.get_executor(), *config_.ssl_ctx);
    } else {
        plain_ = std::make_unique<beast::tcp_stream>(client_.get_executor());
    }
    
    resolver_.async_resolve(
        config_.endpoint.host,
        config_.endpoint.port,
        beast::bind_front_handler(&StreamRelay::onResolve, shared_from_this())
    );
}

void StreamRelay::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (closed_) return;
    if (ec) {
        fail("resolve", ec.message());
        return;
    }
    
    withUpstream([this, &results](auto& stream) {
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        beast::get_lowest_layer(stream).async_connect(
            results,
            beast::bind_front_handler(&StreamRelay::onConnect, shared_from_this())
        );
    });
}

void StreamRelay::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (closed_) return;
    if (ec) {
        fail("connect", ec.message());
        return;
    }
    
    if (!tls_) {
        sendRequest();
        return;
    }
    
    if (!SSL_set_tlsext_host_name(tls_->native_handle(), config_.endpoint.host.c_str())) {
        fail("tls", "failed to set SNI host name");
        return;
    }
    tls_->set_verify_callback(ssl::host_name_verification(config_.endpoint.host));
    
    beast::get_lowest_layer(*tls_).expires_after(config_.timeout);
    tls_->async_handshake(
        ssl::stream_base::client,
        beast::bind_front_handler(&StreamRelay::onHandshake, shared_from_this())
    );
}

void StreamRelay::onHandshake(beast::error_code ec) {
    if (closed_) return;
    if (ec) {
        fail("tls handshake", ec.message());
        return;
    }
    sendRequest();
}

void StreamRelay::sendRequest() {
    upstream_request_.method(http::verb::post);
    upstream_request_.target(config_.endpoint.target());
    upstream_request_.version(11);
    upstream_request_.set(http::field::host, config_.endpoint.host);
    upstream_request_.set(http::field::user_agent, "shroud/1.0");
    upstream_request_.set(http::field::content_type, "application/json");
    upstream_request_.set(http::field::accept, "text/event-stream");
    for (const auto& [name, value] : config_.headers) {
        upstream_request_.set(name, value);
    }
    upstream_request_.body() = upstream_body_;
    upstream_request_.prepare_payload();
    
    withUpstream([this](auto& stream) {
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        http::async_write(
            stream,
            upstream_request_,
            beast::bind_front_handler(&StreamRelay::onRequestWritten, shared_from_this())
        );
    });
}

void StreamRelay::onRequestWritten(beast::error_code ec, std::size_t) {
    if (closed_) return;
    if (ec) {
        fail("upstream write", ec.message());
        return;
    }
    
    withUpstream([this](auto& stream) {
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        http::async_read_header(
            stream,
            upstream_buffer_,
            parser_,
            beast::bind_front_handler(&StreamRelay::onHeader, shared_from_this())
        );
    });
}

void StreamRelay::onHeader(beast::error_code ec, std::size_t) {
    if (closed_) return;
    if (ec) {
        fail("upstream read header", ec.message());
        return;
    }
    
    upstream_status_ = static_cast<int>(parser_.get().result_int());
    if (upstream_status_ < 200 || upstream_status_ >= 300) {
        SHROUD_WARN("Upstream stream request returned {}", upstream_status_);
        if (parser_.is_done()) {
            sendError(upstream_status_, "Upstream Error", error_body_);
        } else {
            readErrorBody();
        }
        return;
    }
    startStreaming();
}

void StreamRelay::readErrorBody() {
    parser_.get().body().data = read_buf_;
    parser_.get().body().size = sizeof(read_buf_);
    
    withUpstream([this](auto& stream) {
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        http::async_read_some(
            stream,
            upstream_buffer_,
            parser_,
            beast::bind_front_handler(&StreamRelay::onErrorBody, shared_from_this())
        );
    });
}

void StreamRelay::onErrorBody(beast::error_code ec, std::size_t) {
    if (closed_) return;
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    
    size_t n = sizeof(read_buf_) - parser_.get().body().size;
    if (error_body_.size() < kMaxErrorBody) {
        error_body_.append(read_buf_, std::min(n, kMaxErrorBody - error_body_.size()));
    }
    
    if (ec || parser_.is_done()) {
        if (ec && !isEndOfStream(ec)) {
            SHROUD_DEBUG("Upstream error body truncated: {}", ec.message());
        }
        sendError(upstream_status_, "Upstream Error", error_body_);
        return;
    }
    readErrorBody();
}

void StreamRelay::startStreaming() {
    stream_header_ = std::make_unique<http::response<http::empty_body>>(http::status::ok, http_version_);
    stream_header_->set(http::field::server, "shroud/1.0");
    stream_header_->set(http::field::content_type, "text/event-stream");
    stream_header_->set(http::field::cache_control, "no-cache");
    stream_header_->keep_alive(false);
    stream_header_->chunked(true);
    header_serializer_ = std::make_unique<http::response_serializer<http::empty_body>>(*stream_header_);
    
    headers_sent_ = true;
    client_.expires_after(config_.timeout);
    http::async_write_header(
        client_,
        *header_serializer_,
        beast::bind_front_handler(&StreamRelay::onStreamHeaderWritten, shared_from_this())
    );
}

void StreamRelay::onStreamHeaderWritten(beast::error_code ec, std::size_t) {
    if (closed_) return;
    if (ec) {
        fail("client write header", ec.message());
        return;
    }
    
    std::weak_ptr<StreamRelay> weak = weak_from_this();
    transformer_ = std::make_shared<SseRedactionTransformer>(
        client_.get_executor(),
        redaction_,
        config_.stream,
        [weak](std::string data) {
            if (auto self = weak.lock()) {
                self->enqueue(std::move(data));
            }
        });
    
    transformer_->setErrorHandler([weak](std::exception_ptr error) {
        auto self = weak.lock();
        if (!self) return;
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            self->fail("timed flush", e.what());
        }
    });
    
    auto risk = risk_;
    auto session_id = session_id_;
    transformer_->setEntityHandler([risk, session_id](const std::vector<redaction::PiiEntity>& entities) {
        risk->assessRisk(session_id, entities);
    });
    
    readBody();
}

void StreamRelay::readBody() {
    parser_.get().body().data = read_buf_;
    parser_.get().body().size = sizeof(read_buf_);
    
    withUpstream([this](auto& stream) {
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        http::async_read_some(
            stream,
            upstream_buffer_,
            parser_,
            beast::bind_front_handler(&StreamRelay::onBody, shared_from_this())
        );
    });
}

void StreamRelay::onBody(beast::error_code ec, std::size_t) {
    if (closed_) return;
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    
    size_t n = sizeof(read_buf_) - parser_.get().body().size;
    if (n > 0) {
        try {
            transformer_->write(std::string_view(read_buf_, n));
        } catch (const std::exception& e) {
            fail("stream redaction", e.what());
            return;
        }
        if (closed_) return;
    }
    
    if (ec) {
        if (isEndOfStream(ec)) {
            onUpstreamEnd();
        } else {
            fail("upstream read", ec.message());
        }
        return;
    }
    
    if (parser_.is_done()) {
        onUpstreamEnd();
        return;
    }
    
    if (writing_) {
        read_paused_ = true;
        return;
    }
    readBody();
}

void StreamRelay::onUpstreamEnd() {
    upstream_done_ = true;
    try {
        transformer_->finish();
    } catch (const std::exception& e) {
        fail("stream redaction", e.what());
        return;
    }
    if (!writing_) {
        writeLastChunk();
    }
}

void StreamRelay::enqueue(std::string data) {
    if (closed_) return;
    write_queue_.push_back(std::move(data));
    if (!writing_) {
        writeNext();
    }
}

void StreamRelay::writeNext() {
    writing_ = true;
    client_.expires_after(config_.timeout);
    net::async_write(
        client_,
        http::make_chunk(net::buffer(write_queue_.front())),
        beast::bind_front_handler(&StreamRelay::onChunkWritten, shared_from_this())
    );
}

void StreamRelay::onChunkWritten(beast::error_code ec, std::size_t) {
    if (closed_) return;
    writing_ = false;
    if (ec) {
        fail("client write", ec.message());
        return;
    }
    
    write_queue_.pop_front();
    if (!write_queue_.empty()) {
        writeNext();
        return;
    }
    if (upstream_done_) {
        writeLastChunk();
        return;
    }
    if (read_paused_) {
        read_paused_ = false;
        readBody();
    }
}

void StreamRelay::writeLastChunk() {
    writing_ = true;
    client_.expires_after(config_.timeout);
    net::async_write(
        client_,
        http::make_chunk_last(),
        beast::bind_front_handler(&StreamRelay::onLastChunkWritten, shared_from_this())
    );
}

void StreamRelay::onLastChunkWritten(beast::error_code ec, std::size_t) {
    if (closed_) return;
    writing_ = false;
    if (ec) {
        SHROUD_WARN("Stream relay: final chunk not delivered: {}", ec.message());
    } else {
        SHROUD_DEBUG("Stream relay completed");
    }
    teardown();
}

void StreamRelay::sendError(int status, const std::string& error, const std::string& message) {
    nlohmann::json body = {
        {"error", error},
        {"message", message},
        {"statusCode", status}
    };
    
    error_response_ = std::make_unique<http::response<http::string_body>>();
    error_response_->version(http_version_);
    error_response_->result(static_cast<unsigned>(status));
    error_response_->set(http::field::server, "shroud/1.0");
    error_response_->set(http::field::content_type, "application/json");
    error_response_->keep_alive(false);
    error_response_->body() = body.dump();
    error_response_->prepare_payload();
    
    headers_sent_ = true;
    client_.expires_after(config_.timeout);
    http::async_write(
        client_,
        *error_response_,
        beast::bind_front_handler(&StreamRelay::onErrorSent, shared_from_this())
    );
}

void StreamRelay::onErrorSent(beast::error_code ec, std::size_t) {
    if (ec) {
        SHROUD_WARN("Stream relay: error response not delivered: {}", ec.message());
    }
    teardown();
}

void StreamRelay::fail(const std::string& where, const std::string& what) {
    if (closed_) return;
    SHROUD_ERROR("Stream relay {} failed: {}", where, what);
    
    if (!headers_sent_) {
        // Nothing reached the client yet, so a clean error response is still possible
        withUpstream([](auto& stream) {
            beast::get_lowest_layer(stream).close();
        });
        sendError(502, "Upstream Error", what);
        return;
    }
    teardown();
}

void StreamRelay::teardown() {
    if (closed_) return;
    closed_ = true;
    
    if (transformer_) {
        transformer_->abort();
    }
    resolver_.cancel();
    
    if (tls_ || plain_) {
        withUpstream([](auto& stream) {
            beast::get_lowest_layer(stream).close();
        });
    }
    
    beast::error_code ec;
    client_.socket().shutdown(tcp::socket::shutdown_both, ec);
    client_.close();
}

} // namespace proxy
} // namespace shroud
