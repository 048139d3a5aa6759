#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace YAML { class Node; }

namespace shroud {
namespace utils {

/// Recursive YAML -> JSON conversion (scalars become bool, integer, double or string)
nlohmann::json yamlToJson(const YAML::Node& node);

/// Loads a .yaml/.yml or .json file; nullopt when the file cannot be read or parsed
std::optional<nlohmann::json> loadConfigFile(const std::string& path);

/**
 * @brief Process configuration
 *
 * Values come from an optional YAML/JSON document and are overridden by
 * environment variables. load() validates everything at once and throws
 * ConfigError naming every invalid key.
 */
struct ProxyConfig {
    struct Server {
        std::string host = "0.0.0.0";
        uint16_t port = 3000;
        size_t worker_threads = 0;  // 0 = hardware concurrency
    } server;
    
    struct Upstream {
        std::string url = "https://api.openai.com/v1";
        std::string api_key;
        uint32_t timeout_ms = 120000;
    } upstream;
    
    struct Inference {
        std::string backend;  // "http" or "regex"
        std::string url;
        std::string patterns_file = "config/pii_patterns.yaml";
        int timeout_ms = 500;
        size_t threads = 2;
    } inference;
    
    struct Redaction {
        std::string salt = "dev-salt-change-in-production-1234567890";
        bool deterministic = true;
        std::string fail_strategy = "closed";
    } redaction;
    
    struct Store {
        std::string redis_url;
    } store;
    
    struct RateLimit {
        uint32_t max = 100;
        uint32_t window_ms = 60000;
    } rate_limit;
    
    struct Risk {
        int64_t threshold = 100;
        int64_t window_ms = 3600000;
    } risk;
    
    struct Stream {
        size_t max_tokens = 20;
        int max_delay_ms = 200;
    } stream;
    
    std::string admin_token;
    
    struct Logging {
        std::string level = "info";
        std::string file = "shroud.log";
        bool console = true;
        size_t max_file_size_mb = 10;
        size_t max_files = 3;
    } logging;
    
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
    
    /// std::getenv-backed lookup; empty variables count as unset
    static EnvLookup processEnv();
    
    static ProxyConfig load(const std::optional<nlohmann::json>& file, const EnvLookup& env);
    
    /// Non-secret view for startup logging
    nlohmann::json summary() const;
};

/// Strict boolean parsing: true/1/yes/y/on, false/0/no/n/off (case-insensitive)
std::optional<bool> parseBool(const std::string& value);

} // namespace utils
} // namespace shroud
