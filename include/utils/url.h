#pragma once

#include <string>

namespace shroud {
namespace utils {

/**
 * @brief Minimal absolute URL: scheme://[user[:password]@]host[:port][/path][?query]
 *
 * port falls back to the scheme default (http 80, https 443, redis 6379).
 * target is path plus query, "/" when both are empty.
 */
struct Url {
    std::string scheme;
    std::string user;
    std::string password;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    
    bool isTls() const { return scheme == "https" || scheme == "rediss"; }
    std::string target() const;
    
    /// Appends a path segment, avoiding a doubled '/'
    Url withPath(const std::string& suffix) const;
    
    /// Throws std::invalid_argument on malformed input
    static Url parse(const std::string& text);
};

} // namespace utils
} // namespace shroud
