#pragma once

#include <string>

namespace shroud {
namespace utils {

/// HMAC-SHA256(key, message) as lowercase hex. Throws std::runtime_error on OpenSSL failure.
std::string hmacSha256Hex(const std::string& key, const std::string& message);

/// Standard base64 (with '=' padding) via OpenSSL EVP_EncodeBlock
std::string toBase64(const std::string& data);

} // namespace utils
} // namespace shroud
