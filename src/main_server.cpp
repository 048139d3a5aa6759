#include "inference/http_token_classifier.h"
#include "inference/regex_token_classifier.h"
#include "proxy/proxy_controller.h"
#include "proxy/upstream_client.h"
#include "redaction/redaction_service.h"
#include "server/http_server.h"
#include "server/rate_limiter.h"
#include "session/risk_engine.h"
#include "session/session_store.h"
#include "store/memory_store.h"
#include "store/redis_store.h"
#include "utils/config.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>

using namespace shroud;
using json = nlohmann::json;

namespace {

std::optional<std::string> findDefaultConfig() {
    for (const char* path : {"./config.yaml", "./config/shroud.yaml", "/etc/shroud/config.yaml"}) {
        std::ifstream f(path);
        if (f.good()) {
            return std::string(path);
        }
    }
    return std::nullopt;
}

std::shared_ptr<inference::ITokenClassifier> makeClassifier(const utils::ProxyConfig& cfg) {
    if (cfg.inference.backend == "http") {
        utils::HttpClient::Config client_config;
        client_config.request_timeout_ms = static_cast<uint32_t>(cfg.inference.timeout_ms) * 4;
        auto classifier = std::make_shared<inference::HttpTokenClassifier>(
            utils::Url::parse(cfg.inference.url), client_config);
        SHROUD_INFO("Token classifier: http ({})", cfg.inference.url);
        return classifier;
    }
    
    auto classifier = std::make_shared<inference::RegexTokenClassifier>();
    classifier->loadFromFile(cfg.inference.patterns_file);
    SHROUD_INFO("Token classifier: regex ({} patterns)", classifier->patternCount());
    return classifier;
}

std::shared_ptr<store::IKeyValueStore> makeStore(const utils::ProxyConfig& cfg) {
    if (cfg.store.redis_url.empty()) {
        SHROUD_INFO("Key-value store: in-memory");
        return std::make_shared<store::MemoryStore>();
    }
    
    store::RedisStore::Config redis_config;
    redis_config.url = cfg.store.redis_url;
    auto redis = std::make_shared<store::RedisStore>(redis_config);
    redis->connect();
    SHROUD_INFO("Key-value store: redis");
    return redis;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> config_path;
    std::optional<std::string> host_override;
    std::optional<uint16_t> port_override;
    std::optional<size_t> threads_override;
    
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--host" && i + 1 < argc) {
                host_override = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--threads" && i + 1 < argc) {
                threads_override = std::stoul(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  --config FILE   Load configuration from a YAML or JSON file\n"
                          << "  --host HOST     Listen address (default: 0.0.0.0)\n"
                          << "  --port PORT     Listen port (default: 3000)\n"
                          << "  --threads N     Number of worker threads (default: auto)\n"
                          << "  --help, -h      Show this help message\n"
                          << "Environment variables override file settings.\n";
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid command line: " << e.what() << "\n";
        return 1;
    }
    
    if (!config_path) {
        config_path = findDefaultConfig();
    }
    
    std::optional<json> file_config;
    if (config_path) {
        file_config = utils::loadConfigFile(*config_path);
        if (!file_config) {
            std::cerr << "Cannot load config file " << *config_path << "\n";
            return 1;
        }
    }
    
    utils::ProxyConfig cfg;
    try {
        cfg = utils::ProxyConfig::load(file_config, utils::ProxyConfig::processEnv());
    } catch (const utils::ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }
    if (host_override) cfg.server.host = *host_override;
    if (port_override) cfg.server.port = *port_override;
    if (threads_override) cfg.server.worker_threads = *threads_override;
    
    utils::Logger::Options log_options;
    log_options.level = utils::Logger::parseLevel(cfg.logging.level).value_or(utils::Logger::Level::INFO);
    log_options.file = cfg.logging.file;
    log_options.console = cfg.logging.console;
    log_options.max_file_size_mb = cfg.logging.max_file_size_mb;
    log_options.max_files = cfg.logging.max_files;
    utils::Logger::init(log_options);
    
    SHROUD_INFO("=== shroud PII redaction proxy ===");
    SHROUD_INFO("Version: 1.0.0");
    if (config_path) {
        SHROUD_INFO("Loaded configuration from {}", *config_path);
    }
    SHROUD_INFO("Configuration: {}", cfg.summary().dump());
    
    int exit_code = 0;
    try {
        // Phase 1: detection engine
        SHROUD_INFO("Initializing detection engine...");
        redaction::RedactionOptions options;
        options.use_deterministic_replacement = cfg.redaction.deterministic;
        options.salt = cfg.redaction.salt;
        options.timeout_ms = cfg.inference.timeout_ms;
        options.fail_strategy = redaction::failStrategyFromString(cfg.redaction.fail_strategy);
        
        auto redaction_service = std::make_shared<redaction::RedactionService>(
            makeClassifier(cfg), options, cfg.inference.threads);
        SHROUD_INFO("Redaction: deterministic={}, fail strategy={}, timeout={}ms",
                    options.use_deterministic_replacement,
                    redaction::failStrategyToString(options.fail_strategy),
                    options.timeout_ms);
        
        // Phase 2: infrastructure
        SHROUD_INFO("Initializing infrastructure...");
        auto kv = makeStore(cfg);
        
        // Phase 3: services
        SHROUD_INFO("Initializing services...");
        auto session_store = std::make_shared<session::SessionStore>(kv);
        session::RiskConfig risk_config;
        risk_config.threshold = cfg.risk.threshold;
        risk_config.window = std::chrono::milliseconds(cfg.risk.window_ms);
        auto risk_engine = std::make_shared<session::SessionRiskEngine>(session_store, risk_config);
        
        server::RateLimitConfig limit_config;
        limit_config.bucket_capacity = cfg.rate_limit.max;
        limit_config.window = std::chrono::milliseconds(cfg.rate_limit.window_ms);
        auto rate_limiter = std::make_shared<server::RateLimiter>(limit_config);
        
        proxy::UpstreamClient::Config upstream_config;
        upstream_config.base_url = cfg.upstream.url;
        upstream_config.api_key = cfg.upstream.api_key;
        upstream_config.timeout_ms = cfg.upstream.timeout_ms;
        auto upstream = std::make_shared<proxy::UpstreamClient>(upstream_config);
        
        proxy::ProxyController::Config controller_config;
        controller_config.admin_token = cfg.admin_token;
        controller_config.stream.max_tokens = cfg.stream.max_tokens;
        controller_config.stream.max_delay_ms = cfg.stream.max_delay_ms;
        auto controller = std::make_shared<proxy::ProxyController>(
            controller_config, redaction_service, risk_engine, rate_limiter, upstream);
        
        // Phase 4: server
        SHROUD_INFO("Starting HTTP server...");
        server::HttpServer::Config server_config(cfg.server.host, cfg.server.port, cfg.server.worker_threads);
        auto http_server = std::make_shared<server::HttpServer>(server_config, controller);
        http_server->start();
        
        SHROUD_INFO("Proxy ready, forwarding to {}", upstream->endpoint().host);
        SHROUD_INFO("Press Ctrl+C to shutdown");
        
        boost::asio::io_context signal_ioc;
        boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& ec, int signal) {
            if (!ec) {
                SHROUD_INFO("Received signal {}, shutting down...", signal);
            }
        });
        signal_ioc.run();
        
        http_server->stop();
        kv->close();
        SHROUD_INFO("Server shutdown complete");
    } catch (const utils::StoreError& e) {
        SHROUD_CRITICAL("Key-value store unavailable: {}", e.what());
        exit_code = 1;
    } catch (const std::exception& e) {
        SHROUD_CRITICAL("Fatal error: {}", e.what());
        exit_code = 1;
    }
    
    utils::Logger::shutdown();
    return exit_code;
}
