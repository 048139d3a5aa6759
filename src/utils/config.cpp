#include "utils/config.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include "utils/text_utils.h"
#include "utils/url.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace shroud {
namespace utils {

using json = nlohmann::json;

namespace {

constexpr size_t kMinSaltLength = 16;

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * Reads one setting from the file document ("a.b" paths) with the
 * environment taking precedence, and records a message for every value
 * that fails to parse.
 */
class SettingReader {
public:
    SettingReader(const std::optional<json>& file, const ProxyConfig::EnvLookup& env)
        : file_(file), env_(env) {}
    
    std::optional<std::string> raw(const std::string& path, const std::string& env_name) const {
        if (env_) {
            if (auto v = env_(env_name)) return v;
        }
        if (!file_) return std::nullopt;
        const json* node = &*file_;
        size_t start = 0;
        while (start <= path.size()) {
            size_t dot = path.find('.', start);
            std::string part = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            if (!node->is_object() || !node->contains(part)) return std::nullopt;
            node = &(*node)[part];
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
        if (node->is_null()) return std::nullopt;
        if (node->is_string()) return node->get<std::string>();
        if (node->is_boolean()) return node->get<bool>() ? "true" : "false";
        return node->dump();
    }
    
    void string(const std::string& path, const std::string& env_name, std::string& out) const {
        if (auto v = raw(path, env_name)) out = *v;
    }
    
    template<typename T>
    void integer(const std::string& path, const std::string& env_name, T& out, int64_t min_value,
                 int64_t max_value = std::numeric_limits<int64_t>::max()) {
        auto v = raw(path, env_name);
        if (!v) return;
        try {
            size_t pos = 0;
            long long parsed = std::stoll(trim(*v), &pos);
            if (pos != trim(*v).size() || parsed < min_value || parsed > max_value) {
                throw std::out_of_range(*v);
            }
            out = static_cast<T>(parsed);
        } catch (const std::exception&) {
            errors_.push_back(label(path, env_name) + " must be an integer in [" +
                              std::to_string(min_value) + ", " + std::to_string(max_value) +
                              "], got '" + *v + "'");
        }
    }
    
    void boolean(const std::string& path, const std::string& env_name, bool& out) {
        auto v = raw(path, env_name);
        if (!v) return;
        if (auto b = parseBool(*v)) {
            out = *b;
        } else {
            errors_.push_back(label(path, env_name) + " must be a boolean, got '" + *v + "'");
        }
    }
    
    void fail(const std::string& path, const std::string& env_name, const std::string& message) {
        errors_.push_back(label(path, env_name) + " " + message);
    }
    
    const std::vector<std::string>& errors() const { return errors_; }
    
private:
    static std::string label(const std::string& path, const std::string& env_name) {
        return path + " (" + env_name + ")";
    }
    
    const std::optional<json>& file_;
    const ProxyConfig::EnvLookup& env_;
    std::vector<std::string> errors_;
};

} // namespace

json yamlToJson(const YAML::Node& n) {
    if (!n) return nullptr;
    if (n.IsScalar()) {
        if (n.Tag() == "!") {
            // Quoted scalar stays a string
            return n.Scalar();
        }
        bool b = false;
        if (YAML::convert<bool>::decode(n, b)) return b;
        long long i = 0;
        if (YAML::convert<long long>::decode(n, i)) return i;
        double d = 0.0;
        if (YAML::convert<double>::decode(n, d)) return d;
        return n.Scalar();
    }
    if (n.IsSequence()) {
        json arr = json::array();
        for (const auto& it : n) arr.push_back(yamlToJson(it));
        return arr;
    }
    if (n.IsMap()) {
        json obj = json::object();
        for (auto it = n.begin(); it != n.end(); ++it) {
            obj[it->first.as<std::string>()] = yamlToJson(it->second);
        }
        return obj;
    }
    return nullptr;
}

std::optional<json> loadConfigFile(const std::string& path) {
    try {
        if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
            return yamlToJson(YAML::LoadFile(path));
        }
        std::ifstream f(path);
        if (!f.is_open()) return std::nullopt;
        json j;
        f >> j;
        return j;
    } catch (const YAML::Exception&) {
        return std::nullopt;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parseBool(const std::string& value) {
    std::string v = asciiLower(trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "y" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "n" || v == "off") return false;
    return std::nullopt;
}

ProxyConfig::EnvLookup ProxyConfig::processEnv() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v || !*v) return std::nullopt;
        return std::string(v);
    };
}

ProxyConfig ProxyConfig::load(const std::optional<json>& file, const EnvLookup& env) {
    ProxyConfig cfg;
    SettingReader r(file, env);
    
    r.string("server.host", "HOST", cfg.server.host);
    r.integer("server.port", "PORT", cfg.server.port, 1, 65535);
    r.integer("server.worker_threads", "WORKER_THREADS", cfg.server.worker_threads, 0, 1024);
    
    r.string("upstream.url", "UPSTREAM_URL", cfg.upstream.url);
    r.string("upstream.api_key", "UPSTREAM_API_KEY", cfg.upstream.api_key);
    r.integer("upstream.timeout_ms", "UPSTREAM_TIMEOUT_MS", cfg.upstream.timeout_ms, 1, 3600000);
    
    r.string("inference.backend", "INFERENCE_BACKEND", cfg.inference.backend);
    r.string("inference.url", "INFERENCE_URL", cfg.inference.url);
    r.string("inference.patterns_file", "PII_PATTERNS_FILE", cfg.inference.patterns_file);
    r.integer("inference.timeout_ms", "INFERENCE_TIMEOUT_MS", cfg.inference.timeout_ms, 1, 600000);
    r.integer("inference.threads", "INFERENCE_THREADS", cfg.inference.threads, 1, 256);
    
    r.string("redaction.salt", "SALT", cfg.redaction.salt);
    r.boolean("redaction.deterministic", "DETERMINISTIC_REPLACEMENT", cfg.redaction.deterministic);
    r.string("redaction.fail_strategy", "FAIL_STRATEGY", cfg.redaction.fail_strategy);
    
    r.string("store.redis_url", "REDIS_URL", cfg.store.redis_url);
    
    r.integer("rate_limit.max", "RATE_LIMIT_MAX", cfg.rate_limit.max, 1, 1000000);
    r.integer("rate_limit.window_ms", "RATE_LIMIT_WINDOW_MS", cfg.rate_limit.window_ms, 1, 86400000);
    
    r.integer("risk.threshold", "RISK_THRESHOLD", cfg.risk.threshold, 1);
    r.integer("risk.window_ms", "RISK_WINDOW_MS", cfg.risk.window_ms, 1);
    
    r.integer("stream.max_tokens", "STREAM_MAX_TOKENS", cfg.stream.max_tokens, 1, 100000);
    r.integer("stream.max_delay_ms", "STREAM_MAX_DELAY_MS", cfg.stream.max_delay_ms, 1, 600000);
    
    r.string("admin.token", "ADMIN_TOKEN", cfg.admin_token);
    
    r.string("logging.level", "LOG_LEVEL", cfg.logging.level);
    r.string("logging.file", "LOG_FILE", cfg.logging.file);
    r.boolean("logging.console", "LOG_CONSOLE", cfg.logging.console);
    r.integer("logging.max_file_size_mb", "LOG_MAX_FILE_SIZE_MB", cfg.logging.max_file_size_mb, 1, 10240);
    r.integer("logging.max_files", "LOG_MAX_FILES", cfg.logging.max_files, 1, 100);
    
    // Cross-field validation
    if (cfg.redaction.salt.size() < kMinSaltLength) {
        r.fail("redaction.salt", "SALT", "must be at least " + std::to_string(kMinSaltLength) + " characters");
    }
    
    std::string strategy = asciiLower(trim(cfg.redaction.fail_strategy));
    if (strategy != "closed" && strategy != "open") {
        r.fail("redaction.fail_strategy", "FAIL_STRATEGY", "must be 'closed' or 'open', got '" +
               cfg.redaction.fail_strategy + "'");
    }
    cfg.redaction.fail_strategy = strategy;
    
    if (Logger::parseLevel(cfg.logging.level)) {
        cfg.logging.level = asciiLower(trim(cfg.logging.level));
    } else {
        r.fail("logging.level", "LOG_LEVEL", "must be one of trace, debug, info, warn, error, critical, got '" +
               cfg.logging.level + "'");
    }
    
    auto checkUrl = [&](const std::string& value, const std::string& path, const std::string& env_name,
                        std::initializer_list<const char*> schemes) {
        try {
            Url u = Url::parse(value);
            for (const char* s : schemes) {
                if (u.scheme == s) return;
            }
            r.fail(path, env_name, "has unsupported scheme '" + u.scheme + "'");
        } catch (const std::invalid_argument& e) {
            r.fail(path, env_name, std::string("is not a valid URL: ") + e.what());
        }
    };
    
    checkUrl(cfg.upstream.url, "upstream.url", "UPSTREAM_URL", {"http", "https"});
    if (!cfg.inference.url.empty()) {
        checkUrl(cfg.inference.url, "inference.url", "INFERENCE_URL", {"http", "https"});
    }
    if (!cfg.store.redis_url.empty()) {
        checkUrl(cfg.store.redis_url, "store.redis_url", "REDIS_URL", {"redis"});
    }
    
    cfg.inference.backend = asciiLower(trim(cfg.inference.backend));
    if (cfg.inference.backend.empty()) {
        cfg.inference.backend = cfg.inference.url.empty() ? "regex" : "http";
    }
    if (cfg.inference.backend != "http" && cfg.inference.backend != "regex") {
        r.fail("inference.backend", "INFERENCE_BACKEND", "must be 'http' or 'regex', got '" +
               cfg.inference.backend + "'");
    } else if (cfg.inference.backend == "http" && cfg.inference.url.empty()) {
        r.fail("inference.url", "INFERENCE_URL", "is required when the http backend is selected");
    }
    
    if (!r.errors().empty()) {
        std::string message = "Invalid configuration:";
        for (const auto& e : r.errors()) {
            message += "\n  - " + e;
        }
        throw ConfigError(message);
    }
    return cfg;
}

json ProxyConfig::summary() const {
    return {
        {"server", {{"host", server.host}, {"port", server.port}, {"worker_threads", server.worker_threads}}},
        {"upstream", {{"url", upstream.url}, {"api_key_set", !upstream.api_key.empty()},
                      {"timeout_ms", upstream.timeout_ms}}},
        {"inference", {{"backend", inference.backend}, {"url", inference.url},
                       {"patterns_file", inference.patterns_file},
                       {"timeout_ms", inference.timeout_ms}, {"threads", inference.threads}}},
        {"redaction", {{"deterministic", redaction.deterministic},
                       {"fail_strategy", redaction.fail_strategy}}},
        {"store", {{"backend", store.redis_url.empty() ? "memory" : "redis"}}},
        {"rate_limit", {{"max", rate_limit.max}, {"window_ms", rate_limit.window_ms}}},
        {"risk", {{"threshold", risk.threshold}, {"window_ms", risk.window_ms}}},
        {"stream", {{"max_tokens", stream.max_tokens}, {"max_delay_ms", stream.max_delay_ms}}},
        {"admin_enabled", !admin_token.empty()},
        {"logging", {{"level", logging.level}, {"file", logging.file}, {"console", logging.console},
                     {"max_file_size_mb", logging.max_file_size_mb}, {"max_files", logging.max_files}}}
    };
}

} // namespace utils
} // namespace shroud
