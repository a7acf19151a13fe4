/**
 * @file utilities.cpp
 * @brief Implementation of shared ledger helpers
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "govledger/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace govledger {
namespace utilities {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
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

    std::shared_ptr<spdlog::logger> build_logger(const std::string& log_file, LogLevel level) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        // 10 MB per file, 3 files
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 10 * 1024 * 1024, 3));
        }

        auto logger = std::make_shared<spdlog::logger>("govledger", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(level));
        logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
        return logger;
    }

    // Caller holds g_logger_mutex
    void install_logger_locked(const std::string& log_file, LogLevel level) {
        try {
            g_logger = build_logger(log_file, level);
            spdlog::set_default_logger(g_logger);
        } catch (const spdlog::spdlog_ex& ex) {
            std::fprintf(stderr, "GovLedger log initialization failed: %s\n", ex.what());
            g_logger.reset();
        }
    }

    std::shared_ptr<spdlog::logger> get_logger() {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (!g_logger) {
            LogLevel level = LogLevel::INFO;
            if (auto name = env_value("GOVLEDGER_LOG_LEVEL")) {
                level = parse_log_level(*name).value_or(LogLevel::INFO);
            }
            install_logger_locked(env_value("GOVLEDGER_LOG_FILE").value_or(""), level);
        }
        return g_logger;
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    install_logger_locked(log_file, level);
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = to_lowercase(trim_string(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    auto logger = get_logger();
    if (!logger) {
        std::fprintf(stderr, "%s\n", message.c_str());
        return;
    }
    logger->log(to_spdlog_level(level), message);
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
// TIME FUNCTIONS
// ============================================================================

uint64_t current_unix_seconds() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

std::string format_timestamp(uint64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf{};
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string format_duration(uint64_t seconds) {
    uint64_t hours = seconds / 3600;
    uint64_t minutes = (seconds % 3600) / 60;
    uint64_t secs = seconds % 60;

    std::vector<std::string> parts;
    if (hours > 0) {
        parts.push_back(std::to_string(hours) + "h");
    }
    if (minutes > 0 || (hours > 0 && secs > 0)) {
        parts.push_back(std::to_string(minutes) + "m");
    }
    if (secs > 0 || parts.empty()) {
        parts.push_back(std::to_string(secs) + "s");
    }

    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) {
            result += " ";
        }
        result += part;
    }
    return result;
}

// ============================================================================
// FILE FUNCTIONS
// ============================================================================

std::optional<std::string> read_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        log_error("Utilities: Cannot open " + file_path + " for reading");
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        log_error("Utilities: Read of " + file_path + " failed");
        return std::nullopt;
    }
    return content.str();
}

bool write_file(const std::string& file_path, const std::string& content) {
    fs::path target(file_path);
    fs::path staging = target;
    staging += ".partial";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            log_error("Utilities: Cannot create directory for " + file_path + ": " + ec.message());
            return false;
        }
    }

    {
        std::ofstream file(staging, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file.is_open()) {
            log_error("Utilities: Cannot open " + staging.string() + " for writing");
            return false;
        }
        file << content;
        file.flush();
        if (!file.good()) {
            log_error("Utilities: Write of " + staging.string() + " failed");
            fs::remove(staging, ec);
            return false;
        }
    }

    fs::rename(staging, target, ec);
    if (ec) {
        log_error("Utilities: Cannot move " + staging.string() + " into place: " + ec.message());
        fs::remove(staging, ec);
        return false;
    }
    return true;
}

std::optional<std::string> calculate_file_hash(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        log_error("Utilities: Cannot open " + file_path + " for hashing");
        return std::nullopt;
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        log_error("Utilities: SHA-256 context initialization failed");
        return std::nullopt;
    }

    std::array<char, 64 * 1024> buffer;
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            log_error("Utilities: SHA-256 update failed for " + file_path);
            return std::nullopt;
        }
    }
    if (file.bad()) {
        log_error("Utilities: Read of " + file_path + " failed while hashing");
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        log_error("Utilities: SHA-256 finalization failed for " + file_path);
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

// ============================================================================
// STRING AND ENVIRONMENT FUNCTIONS
// ============================================================================

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim_string(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });

    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::optional<std::string> env_value(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    std::string trimmed = trim_string(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

std::string make_identifier(const std::string& prefix) {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("System random generator failed while creating " + prefix + " identifier");
    }

    std::ostringstream oss;
    oss << prefix << "-" << std::hex << std::setfill('0');
    for (unsigned char byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

} // namespace utilities
} // namespace govledger
