/**
 * @file utilities.hpp
 * @brief Common utility functions for DevStore
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout DevStore:
 * - Logging and error reporting
 * - String manipulation
 * - File and environment helpers
 */

#pragma once

#include <string>
#include <optional>

namespace devstore {
namespace utilities {

/**
 * @brief Log levels for DevStore logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if the name is not recognised
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

} // namespace utilities
} // namespace devstore
