/**
 * @file ledger_config.cpp
 * @brief Implementation of ledger configuration and validation functions
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "govledger/ledger_config.hpp"
#include "govledger/errors.hpp"
#include "govledger/utilities.hpp"

#include <nlohmann/json.hpp>
#include <cctype>
#include <chrono>

using json = nlohmann::json;

namespace govledger {

namespace {

uint64_t parse_unsigned(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        unsigned long long parsed = std::stoull(value, &consumed, 10);
        if (consumed != value.size() || value.front() == '-') {
            throw InputError(name + " is not an unsigned integer: " + value);
        }
        return static_cast<uint64_t>(parsed);
    } catch (const std::logic_error&) {
        throw InputError(name + " is not an unsigned integer: " + value);
    }
}

Criticality parse_criticality(const std::string& name, const std::string& value) {
    auto level = string_to_criticality(utilities::trim_string(value));
    if (!level) {
        throw InputError(name + " is not a criticality level: " + value);
    }
    return *level;
}

std::filesystem::path ensure_directory(const std::filesystem::path& dir) {
    if (!std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
    return dir;
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

LedgerConfig config_from_json(const std::string& json_text) {
    LedgerConfig config;

    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw InputError(std::string("Invalid configuration JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw InputError("Configuration must be a JSON object");
    }

    try {
        if (j.contains("batch_size")) {
            config.batch_size = j.at("batch_size").get<size_t>();
        }
        if (j.contains("time_bucket_seconds")) {
            config.time_bucket_seconds = j.at("time_bucket_seconds").get<uint64_t>();
        }
        if (j.contains("append_max_attempts")) {
            config.append_max_attempts = j.at("append_max_attempts").get<size_t>();
        }
        if (j.contains("append_base_backoff_ms")) {
            config.append_base_backoff = std::chrono::milliseconds(
                j.at("append_base_backoff_ms").get<uint64_t>());
        }
        if (j.contains("verify_on_open")) {
            config.verify_on_open = j.at("verify_on_open").get<bool>();
        }
        if (j.contains("oversight_threshold")) {
            config.oversight_threshold = parse_criticality(
                "oversight_threshold", j.at("oversight_threshold").get<std::string>());
        }
        if (j.contains("approval_timeout_seconds")) {
            config.approval_timeout = std::chrono::seconds(
                j.at("approval_timeout_seconds").get<uint64_t>());
        }
        if (j.contains("approval_poll_interval_ms")) {
            config.approval_poll_interval = std::chrono::milliseconds(
                j.at("approval_poll_interval_ms").get<uint64_t>());
        }
        if (j.contains("worker_threads")) {
            config.worker_threads = j.at("worker_threads").get<size_t>();
        }
        if (j.contains("default_page_size")) {
            config.default_page_size = j.at("default_page_size").get<size_t>();
        }
        if (j.contains("max_page_size")) {
            config.max_page_size = j.at("max_page_size").get<size_t>();
        }
    } catch (const json::type_error& e) {
        throw InputError(std::string("Invalid configuration value: ") + e.what());
    }

    validate_config(config);
    return config;
}

LedgerConfig load_config(const std::string& path) {
    auto content = utilities::read_file(path);
    if (!content) {
        throw InputError("Cannot read configuration file: " + path);
    }

    LedgerConfig config = config_from_json(*content);
    apply_env_overrides(config);
    validate_config(config);

    utilities::log_info("LedgerConfig: Loaded configuration from " + path);
    return config;
}

void apply_env_overrides(LedgerConfig& config) {
    if (auto batch = utilities::env_value("GOVLEDGER_BATCH_SIZE")) {
        config.batch_size = static_cast<size_t>(parse_unsigned("GOVLEDGER_BATCH_SIZE", *batch));
    }

    if (auto timeout = utilities::env_value("GOVLEDGER_APPROVAL_TIMEOUT_SECONDS")) {
        config.approval_timeout = std::chrono::seconds(
            parse_unsigned("GOVLEDGER_APPROVAL_TIMEOUT_SECONDS", *timeout));
    }

    if (auto threshold = utilities::env_value("GOVLEDGER_OVERSIGHT_THRESHOLD")) {
        config.oversight_threshold = parse_criticality("GOVLEDGER_OVERSIGHT_THRESHOLD", *threshold);
    }

    if (auto workers = utilities::env_value("GOVLEDGER_WORKER_THREADS")) {
        config.worker_threads = static_cast<size_t>(parse_unsigned("GOVLEDGER_WORKER_THREADS", *workers));
    }
}

void validate_config(const LedgerConfig& config) {
    if (config.batch_size < 2) {
        throw InputError("batch_size must be at least 2");
    }
    if (config.time_bucket_seconds == 0) {
        throw InputError("time_bucket_seconds must be positive");
    }
    if (config.append_max_attempts == 0 || config.append_max_attempts > MAX_APPEND_ATTEMPTS) {
        throw InputError("append_max_attempts must be in [1, " + std::to_string(MAX_APPEND_ATTEMPTS) + "]");
    }
    if (config.append_base_backoff.count() < 0 || config.append_base_backoff > MAX_APPEND_BACKOFF) {
        throw InputError("append_base_backoff_ms must be in [0, "
                         + std::to_string(MAX_APPEND_BACKOFF.count()) + "]");
    }
    if (config.approval_timeout.count() <= 0) {
        throw InputError("approval_timeout must be positive");
    }
    if (config.approval_poll_interval.count() <= 0) {
        throw InputError("approval_poll_interval must be positive");
    }
    if (config.worker_threads == 0) {
        throw InputError("worker_threads must be positive");
    }
    if (config.default_page_size == 0 || config.default_page_size > config.max_page_size) {
        throw InputError("default_page_size must be in [1, max_page_size]");
    }
}

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    if (auto env_data_dir = utilities::env_value("GOVLEDGER_DATA_DIR")) {
        return ensure_directory(std::filesystem::path(*env_data_dir));
    }
    return ensure_directory(std::filesystem::path("/opt/govledger/var"));
}

std::filesystem::path get_database_directory() {
    return ensure_directory(get_data_directory() / "db");
}

std::filesystem::path get_key_directory() {
    return ensure_directory(get_data_directory() / "keys");
}

// ============================================================================
// Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    // Alphanumeric + underscore + hyphen + dot only
    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }

    return true;
}

bool validate_reference(const std::string& reference, size_t max_length) {
    if (reference.empty() || reference.length() > max_length) {
        return false;
    }

    for (char c : reference) {
        if (std::iscntrl(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    return true;
}

} // namespace govledger
