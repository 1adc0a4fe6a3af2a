/**
 * @file logger.cpp
 * @brief spdlog-backed logging for subdub
 */

#include "logging/logger.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace subdub {
namespace logging {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

constexpr const char* kLoggerName = "subdub";

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::info;
    }
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized.load(std::memory_order_acquire)) {
        if (g_logger) {
            g_logger->set_level(toSpdlogLevel(config.level));
            g_logger->set_pattern(config.pattern);
        }
        return true;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.consoleOutput) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(toSpdlogLevel(config.level));
            if (!config.coloredOutput) {
                console_sink->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console_sink);
        }

        if (!config.filePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups);
            file_sink->set_level(toSpdlogLevel(config.level));
            sinks.push_back(file_sink);
        }

        g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        g_logger->set_level(toSpdlogLevel(config.level));
        g_logger->set_pattern(config.pattern);
        spdlog::set_default_logger(g_logger);

        // Warnings carry per-cue fallbacks; keep them on disk if the run dies later.
        g_logger->flush_on(spdlog::level::warn);

        g_initialized.store(true, std::memory_order_release);

        LOG_DEBUG("Logging initialized (level={})", levelToString(config.level));
        if (!config.filePath.empty()) {
            LOG_INFO("Logging to file: {}", config.filePath);
        }
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeEarly() {
    LogConfig config;
    config.coloredOutput = false;
    return initialize(config);
}

bool loadLogConfig(const std::string& configPath, LogConfig& config) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        return true;
    }

    try {
        nlohmann::json json;
        file >> json;

        if (!json.contains("logging") || !json["logging"].is_object()) {
            return true;
        }
        const auto& logSection = json["logging"];

        if (logSection.contains("level")) {
            config.level = stringToLevel(logSection["level"].get<std::string>());
        }
        if (logSection.contains("filePath")) {
            config.filePath = logSection["filePath"].get<std::string>();
        }
        if (logSection.contains("maxFileSize")) {
            config.maxFileSize = logSection["maxFileSize"].get<size_t>();
        }
        if (logSection.contains("maxBackups")) {
            config.maxBackups = logSection["maxBackups"].get<size_t>();
        }
        if (logSection.contains("consoleOutput")) {
            config.consoleOutput = logSection["consoleOutput"].get<bool>();
        }
        if (logSection.contains("coloredOutput")) {
            config.coloredOutput = logSection["coloredOutput"].get<bool>();
        }
        if (logSection.contains("pattern")) {
            config.pattern = logSection["pattern"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "Failed to parse logging config: " << ex.what() << std::endl;
        return false;
    }
    return true;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initialize();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    default:
        return "info";
    }
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error" || lower == "err")
        return LogLevel::Error;
    if (lower == "critical" || lower == "fatal")
        return LogLevel::Critical;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;

    return LogLevel::Info;
}

}  // namespace logging
}  // namespace subdub
