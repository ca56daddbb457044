/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for DevStore
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "devstore/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

namespace devstore {
namespace utilities {

namespace {
    // Global logger instance
    std::shared_ptr<spdlog::logger> g_logger;

    // Guards g_logger creation from concurrent first use
    std::mutex g_logger_mutex;

    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> create_logger(const std::string& log_file, LogLevel level) {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // File sink (rotating, 10MB per file, 3 files max)
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("devstore", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        return logger;
    }

    std::shared_ptr<spdlog::logger> get_logger() {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (!g_logger) {
            try {
                g_logger = create_logger("", LogLevel::INFO);
                spdlog::set_default_logger(g_logger);
            } catch (const spdlog::spdlog_ex& ex) {
                std::fprintf(stderr, "Log initialization failed: %s\n", ex.what());
                g_logger = spdlog::default_logger();
            }
        }
        return g_logger;
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    try {
        auto logger = create_logger(log_file, level);

        std::lock_guard<std::mutex> lock(g_logger_mutex);
        g_logger = logger;
        spdlog::set_default_logger(g_logger);

    } catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lowered = to_lowercase(trim_string(name));

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    auto logger = get_logger();

    switch (level) {
        case LogLevel::DEBUG:    logger->debug(message); break;
        case LogLevel::INFO:     logger->info(message); break;
        case LogLevel::WARN:     logger->warn(message); break;
        case LogLevel::ERROR:    logger->error(message); break;
        case LogLevel::CRITICAL: logger->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

// ============================================================================
// FILE I/O FUNCTIONS
// ============================================================================

std::optional<std::string> read_file(const std::string& file_path) {
    try {
        std::ifstream file(file_path, std::ios::in);
        if (!file.is_open()) {
            log_error("Failed to open file for reading: " + file_path);
            return std::nullopt;
        }

        std::ostringstream content;
        content << file.rdbuf();
        return content.str();

    } catch (const std::exception& ex) {
        log_error("Exception reading file " + file_path + ": " + ex.what());
        return std::nullopt;
    }
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::string trim_string(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });

    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

// ============================================================================
// ENVIRONMENT FUNCTIONS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

} // namespace utilities
} // namespace devstore
