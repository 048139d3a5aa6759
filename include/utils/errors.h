#pragma once

#include <stdexcept>
#include <string>

namespace shroud {
namespace utils {

/**
 * @brief Thrown when the token classifier misses its deadline
 */
class InferenceTimeoutError : public std::runtime_error {
public:
    explicit InferenceTimeoutError(int timeout_ms)
        : std::runtime_error("Inference timeout exceeded: " + std::to_string(timeout_ms) + "ms")
        , timeout_ms_(timeout_ms)
    {}
    
    int getTimeoutMs() const { return timeout_ms_; }
    
private:
    int timeout_ms_;
};

/**
 * @brief Classifier transport or response failure (never fail-open)
 */
class InferenceError : public std::runtime_error {
public:
    explicit InferenceError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/**
 * @brief Non-2xx or transport failure from the chat API
 *
 * status is 0 for transport failures (connect, TLS, timeout).
 */
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(int status, const std::string& body)
        : std::runtime_error("Upstream error " + std::to_string(status))
        , status_(status)
        , body_(body)
    {}
    
    int getStatus() const { return status_; }
    const std::string& getBody() const { return body_; }
    
private:
    int status_;
    std::string body_;
};

/**
 * @brief Malformed client request, rejected before any upstream call
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message)
    {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/**
 * @brief Key-value backend failure (connection, protocol or server error)
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message)
    {}
};

} // namespace utils
} // namespace shroud
