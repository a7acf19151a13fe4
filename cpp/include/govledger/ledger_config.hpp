/**
 * @file ledger_config.hpp
 * @brief Ledger configuration defaults, loading and validation
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "govledger/governance_record.hpp"

#include <cstdint>
#include <chrono>
#include <string>
#include <filesystem>

namespace govledger {

// ============================================================================
// Ledger Store
// ============================================================================

/// Entries per sealed Merkle batch
constexpr size_t DEFAULT_BATCH_SIZE = 1024;

/// Width of a time-index bucket
constexpr uint64_t DEFAULT_TIME_BUCKET_SECONDS = 3600;

/// Append attempts before a persistence failure becomes fatal
constexpr size_t DEFAULT_APPEND_MAX_ATTEMPTS = 5;

/// Upper bound accepted for append_max_attempts
constexpr size_t MAX_APPEND_ATTEMPTS = 16;

/// First retry delay; doubled on every further attempt
constexpr auto DEFAULT_APPEND_BASE_BACKOFF = std::chrono::milliseconds(50);

/// Ceiling for a single retry delay
constexpr auto MAX_APPEND_BACKOFF = std::chrono::milliseconds(30 * 1000);

/// Minimum retention, enforced by the archival collaborator (7 years)
constexpr auto DEFAULT_RETENTION = std::chrono::hours(24 * 365 * 7);

// ============================================================================
// Admission Gate
// ============================================================================

/// Records at or above this level require human approval
constexpr Criticality DEFAULT_OVERSIGHT_THRESHOLD = Criticality::HIGH;

/// Pending approvals resolve to REJECTED(ApprovalTimeout) after this wait
constexpr auto DEFAULT_APPROVAL_TIMEOUT = std::chrono::hours(72);

/// Interval between approval-channel polls
constexpr auto DEFAULT_APPROVAL_POLL_INTERVAL = std::chrono::seconds(30);

/// Admission worker threads
constexpr size_t DEFAULT_WORKER_THREADS = 4;

// ============================================================================
// Query Engine
// ============================================================================

constexpr size_t DEFAULT_PAGE_SIZE = 100;
constexpr size_t MAX_PAGE_SIZE = 1000;

// ============================================================================
// Input Limits
// ============================================================================

/// Maximum identifier length (partition, signer, solver, phase, category)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// Maximum upstream reference length
constexpr size_t MAX_REFERENCE_LENGTH = 256;

/**
 * @brief Runtime configuration for one ledger partition
 */
struct LedgerConfig {
    size_t batch_size = DEFAULT_BATCH_SIZE;
    uint64_t time_bucket_seconds = DEFAULT_TIME_BUCKET_SECONDS;
    size_t append_max_attempts = DEFAULT_APPEND_MAX_ATTEMPTS;
    std::chrono::milliseconds append_base_backoff = DEFAULT_APPEND_BASE_BACKOFF;
    bool verify_on_open = true;                 ///< Recompute the chain when a store opens

    Criticality oversight_threshold = DEFAULT_OVERSIGHT_THRESHOLD;
    std::chrono::seconds approval_timeout = DEFAULT_APPROVAL_TIMEOUT;
    std::chrono::milliseconds approval_poll_interval = DEFAULT_APPROVAL_POLL_INTERVAL;
    size_t worker_threads = DEFAULT_WORKER_THREADS;

    size_t default_page_size = DEFAULT_PAGE_SIZE;
    size_t max_page_size = MAX_PAGE_SIZE;
};

/**
 * @brief Parse configuration from JSON text; absent keys keep defaults
 * @param json_text JSON object
 * @return Parsed configuration
 * @throws InputError on malformed JSON or out-of-range values
 */
LedgerConfig config_from_json(const std::string& json_text);

/**
 * @brief Load configuration file, then apply environment overrides
 * @param path Path to JSON configuration file
 * @throws InputError if the file is unreadable or invalid
 */
LedgerConfig load_config(const std::string& path);

/**
 * @brief Apply GOVLEDGER_* environment overrides
 *
 * GOVLEDGER_BATCH_SIZE, GOVLEDGER_APPROVAL_TIMEOUT_SECONDS,
 * GOVLEDGER_OVERSIGHT_THRESHOLD, GOVLEDGER_WORKER_THREADS
 *
 * @throws InputError on unparsable values
 */
void apply_env_overrides(LedgerConfig& config);

/**
 * @brief Check configuration invariants
 * @throws InputError describing the first violated invariant
 */
void validate_config(const LedgerConfig& config);

// ============================================================================
// Directories
// ============================================================================

/**
 * @brief Get GovLedger data directory from environment or use default
 * @return Filesystem path to data directory (GOVLEDGER_DATA_DIR)
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get database directory (one SQLite file per partition)
 */
std::filesystem::path get_database_directory();

/**
 * @brief Get signing key directory
 */
std::filesystem::path get_key_directory();

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric plus '_', '-', '.')
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Validate upstream reference (printable, no control characters)
 */
bool validate_reference(const std::string& reference, size_t max_length = MAX_REFERENCE_LENGTH);

} // namespace govledger
