/**
 * @file logger.h
 * @brief Structured logging API for subdub
 *
 * Thin wrapper around spdlog. A run logs to the console and, optionally, to a
 * rotating file placed next to the rendered track.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace subdub {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";  // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

/**
 * @brief Initialize the logging system
 *
 * Calling again after a successful initialization only updates level and pattern.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Console-only initialization used before the config file is read
 */
bool initializeEarly();

/**
 * @brief Read the "logging" section of a JSON config file into `config`
 *
 * Fields absent from the file keep the values already in `config`.
 *
 * @return false if the file exists but cannot be parsed
 */
bool loadLogConfig(const std::string& configPath, LogConfig& config);

/**
 * @brief Flush pending messages and drop all sinks
 */
void shutdown();

/**
 * @brief Underlying spdlog logger, lazily initialized with defaults
 */
std::shared_ptr<spdlog::logger> getLogger();

/**
 * @brief Lowercase level name, the inverse of stringToLevel for canonical names
 */
std::string_view levelToString(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive, accepts "warning")
 *
 * @return Corresponding LogLevel, Info when unknown
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace subdub

#include <spdlog/spdlog.h>

// Every LOG_* call goes through the lazily created subdub logger.
#define SUBDUB_LOG_WITH(spdlog_macro, ...)          \
    do {                                            \
        auto logger = subdub::logging::getLogger(); \
        if (logger)                                 \
            spdlog_macro(logger, __VA_ARGS__);      \
    } while (0)

#define LOG_TRACE(...) SUBDUB_LOG_WITH(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) SUBDUB_LOG_WITH(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) SUBDUB_LOG_WITH(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) SUBDUB_LOG_WITH(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) SUBDUB_LOG_WITH(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) SUBDUB_LOG_WITH(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##level(__VA_ARGS__); \
    } while (0)

/**
 * @brief Log every N occurrences (rate limit for per-cue paths)
 */
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)
