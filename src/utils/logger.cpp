#include "utils/logger.h"
#include "utils/text_utils.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <atomic>
#include <iostream>
#include <vector>

#ifdef ERROR
#undef ERROR
#endif

namespace shroud {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

spdlog::level::level_enum toSpdlogLevel(Logger::Level level) {
    switch (level) {
        case Logger::Level::TRACE: return spdlog::level::trace;
        case Logger::Level::DEBUG: return spdlog::level::debug;
        case Logger::Level::INFO: return spdlog::level::info;
        case Logger::Level::WARN: return spdlog::level::warn;
        case Logger::Level::ERROR: return spdlog::level::err;
        case Logger::Level::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

void Logger::init(const Options& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    std::string file_error;
    if (!options.file.empty()) {
        try {
            size_t max_bytes = (options.max_file_size_mb > 0 ? options.max_file_size_mb : 1) * 1024 * 1024;
            size_t max_files = options.max_files > 0 ? options.max_files : 1;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file, max_bytes, max_files));
        } catch (const spdlog::spdlog_ex& ex) {
            file_error = ex.what();
            if (!options.console) {
                // Never leave the process without any log output
                sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            }
        }
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("shroud", sinks.begin(), sinks.end());
    logger->set_level(toSpdlogLevel(options.level));
    try {
        logger->set_pattern(options.pattern);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Invalid log pattern, using default: " << ex.what() << std::endl;
        logger->set_pattern(Options{}.pattern);
    }
    logger->flush_on(spdlog::level::warn);

    auto previous = std::atomic_exchange(&logger_, logger);
    if (previous) {
        previous->flush();
    }
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        logger->warn("Log file '{}' unavailable, logging to console only: {}", options.file, file_error);
    }
    logger->debug("Logger initialized (level={}, file='{}')",
                  spdlog::level::to_string_view(logger->level()), options.file);
}

void Logger::shutdown() {
    auto logger = std::atomic_exchange(&logger_, std::shared_ptr<spdlog::logger>());
    if (logger) {
        logger->flush();
        spdlog::shutdown();
    }
}

bool Logger::isInitialized() {
    return std::atomic_load(&logger_) != nullptr;
}

void Logger::setLevel(Level level) {
    if (auto logger = std::atomic_load(&logger_)) {
        logger->set_level(toSpdlogLevel(level));
    }
}

std::optional<Logger::Level> Logger::parseLevel(const std::string& lvl) {
    std::string s = asciiLower(trim(lvl));
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info") return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error" || s == "err") return Level::ERROR;
    if (s == "critical" || s == "crit") return Level::CRITICAL;
    return std::nullopt;
}

} // namespace utils
} // namespace shroud
