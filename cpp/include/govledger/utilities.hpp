/**
 * @file utilities.hpp
 * @brief Logging, time and file helpers shared by the ledger components
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every component logs through the "govledger" spdlog logger with a
 * "Component: message" prefix. The logger is created on first use from
 * GOVLEDGER_LOG_LEVEL and GOVLEDGER_LOG_FILE unless initialize_logging()
 * was called explicitly.
 */

#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace govledger {
namespace utilities {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to rotating log file (empty for console only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse log level name ("debug", "info", ...)
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Current wall-clock time in whole seconds since epoch
 */
uint64_t current_unix_seconds();

/**
 * @brief Format timestamp as ISO 8601 UTC (e.g. "2023-11-14T22:13:20Z")
 */
std::string format_timestamp(uint64_t timestamp);

/**
 * @brief Format duration in human-readable form (e.g. "72h", "1m 30s")
 */
std::string format_duration(uint64_t seconds);

/**
 * @brief Read entire file into string
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Replace a file's contents through a temporary sibling and rename
 *
 * Parent directories are created. Readers never observe a partially
 * written export.
 */
bool write_file(const std::string& file_path, const std::string& content);

/**
 * @brief SHA-256 of a file, streamed
 * @return Lowercase hex digest, or std::nullopt if unreadable
 */
std::optional<std::string> calculate_file_hash(const std::string& file_path);

std::string to_lowercase(const std::string& str);

std::string trim_string(const std::string& str);

/**
 * @brief Environment variable value, std::nullopt if unset or blank
 */
std::optional<std::string> env_value(const std::string& name);

/**
 * @brief Random identifier "<prefix>-<32 hex chars>" for admissions and tickets
 * @throws std::runtime_error if the system RNG fails
 */
std::string make_identifier(const std::string& prefix);

} // namespace utilities
} // namespace govledger
