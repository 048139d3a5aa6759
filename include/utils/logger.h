#pragma once

#ifdef ERROR
#undef ERROR
#endif

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace shroud {
namespace utils {

/**
 * Process-wide spdlog facade.
 *
 * Calls made before init() are dropped, so library code and tests can log
 * unconditionally. Message text must never carry raw request content: log
 * counts, types and ids, not the values that were redacted.
 */
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    struct Options {
        Level level = Level::INFO;
        bool console = true;
        // Empty file disables the file sink
        std::string file = "shroud.log";
        size_t max_file_size_mb = 10;
        size_t max_files = 3;
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";
    };

    static void init(const Options& options);
    static void shutdown();
    static bool isInitialized();

    static void setLevel(Level level);

    // nullopt for anything but trace/debug/info/warn(ing)/err(or)/crit(ical)
    static std::optional<Level> parseLevel(const std::string& lvl);

    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args);

private:
    template<typename FormatString, typename... Args>
    static void log(spdlog::level::level_enum level, FormatString&& fmt, Args&&... args) {
        // init() and shutdown() swap logger_ while other threads log
        auto logger = std::atomic_load(&logger_);
        if (logger && logger->should_log(level)) {
            logger->log(level, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
        }
    }

    static std::shared_ptr<spdlog::logger> logger_;
};

template<typename FormatString, typename... Args>
void Logger::trace(FormatString&& fmt, Args&&... args) {
    log(spdlog::level::trace, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::debug(FormatString&& fmt, Args&&... args) {
    log(spdlog::level::debug, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::info(FormatString&& fmt, Args&&... args) {
    log(spdlog::level::info, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::warn(FormatString&& fmt, Args&&... args) {
    log(spdlog::level::warn, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::error(FormatString&& fmt, Args&&... args) {
    log(spdlog::level::err, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::critical(FormatString&& fmt, Args&&... args) {
    log(spdlog::level::critical, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

} // namespace utils
} // namespace shroud

#define SHROUD_TRACE(...) ::shroud::utils::Logger::trace(__VA_ARGS__)
#define SHROUD_DEBUG(...) ::shroud::utils::Logger::debug(__VA_ARGS__)
#define SHROUD_INFO(...) ::shroud::utils::Logger::info(__VA_ARGS__)
#define SHROUD_WARN(...) ::shroud::utils::Logger::warn(__VA_ARGS__)
#define SHROUD_ERROR(...) ::shroud::utils::Logger::error(__VA_ARGS__)
#define SHROUD_CRITICAL(...) ::shroud::utils::Logger::critical(__VA_ARGS__)
