/**
 * @file ledger_storage.hpp
 * @brief SQLite persistence substrate for the ledger
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Tables:
 * - entries: committed entry bodies and chain hashes, addressed by sequence index
 * - append_journal: intent rows written before an entry is committed
 * - merkle_batches: sealed batch roots
 * - pending_approvals: admissions suspended on a human decision
 * - rejections: non-chained rejection log
 * - ledger_meta: settings fixed when the ledger was created (batch_size)
 *
 * Thread-safe; every call takes the connection mutex.
 */

#pragma once

#include "govledger/governance_record.hpp"
#include "govledger/merkle.hpp"

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <cstdint>

namespace govledger {

/**
 * @brief Entry row as stored on disk
 */
struct StoredEntry {
    uint64_t sequence_index = 0;
    std::string record_id;
    std::string body;               ///< LedgerEntry::serialize() output
    std::string chain_hash;         ///< Hex; verified by callers, not here
};

/**
 * @brief Append intent written before the entry transaction
 */
struct JournalRow {
    uint64_t sequence_index = 0;
    std::string record_id;
    std::string chain_hash;
    uint64_t started_at = 0;
};

/**
 * @brief Admission suspended on an approval ticket
 */
struct PendingApproval {
    std::string admission_id;
    std::string ticket_id;
    std::string record_json;        ///< GovernanceTuple::to_json()
    uint64_t waited_ms = 0;         ///< Monotonic wait already consumed
    uint64_t escalated_at = 0;      ///< Unix timestamp of escalation
};

/**
 * @brief Rejection log row
 */
struct RejectionRecord {
    int64_t id = 0;
    std::string admission_id;
    std::string record_id;
    std::string reason;
    std::string detail;
    std::string record_json;
    uint64_t rejected_at = 0;
};

/**
 * @brief LedgerStorage - SQLite-backed entry log and side tables
 */
class LedgerStorage {
public:
    /**
     * @brief Open (and in write mode, create) the database
     * @param database_path Path to SQLite database file
     * @param read_only Open without creating or writing anything
     * @throws PersistenceError if the database cannot be opened or initialized
     */
    explicit LedgerStorage(const std::string& database_path, bool read_only = false);

    ~LedgerStorage();

    LedgerStorage(const LedgerStorage&) = delete;
    LedgerStorage& operator=(const LedgerStorage&) = delete;
    LedgerStorage(LedgerStorage&&) = delete;
    LedgerStorage& operator=(LedgerStorage&&) = delete;

    // ========================================================================
    // Entry Log
    // ========================================================================

    /**
     * @brief Record the intent to append (journal row)
     * @return true if written, false on storage error
     */
    bool begin_append(const JournalRow& intent);

    /**
     * @brief Atomically insert the entry and clear its journal row
     * @param entry Entry with final chain hash
     * @param body Serialized entry body
     * @return true if committed, false on storage error (nothing written)
     */
    bool commit_append(const LedgerEntry& entry, const std::string& body);

    /**
     * @brief Delete journal rows left by appends that never committed
     * @return Discarded rows, or std::nullopt on storage error
     */
    std::optional<std::vector<JournalRow>> discard_unconfirmed();

    /**
     * @brief Journal rows currently present
     */
    std::vector<JournalRow> load_journal() const;

    /**
     * @brief All entry rows in ascending sequence order
     * @return Rows, or std::nullopt on storage error
     */
    std::optional<std::vector<StoredEntry>> load_entries() const;

    uint64_t entry_count() const;

    // ========================================================================
    // Merkle Batches
    // ========================================================================

    bool store_batch(const MerkleBatch& batch);

    std::vector<MerkleBatch> load_batches() const;

    // ========================================================================
    // Pending Approvals
    // ========================================================================

    bool save_pending(const PendingApproval& pending);

    bool update_pending_wait(const std::string& admission_id, uint64_t waited_ms);

    bool remove_pending(const std::string& admission_id);

    std::vector<PendingApproval> load_pending() const;

    // ========================================================================
    // Rejection Log
    // ========================================================================

    bool record_rejection(const RejectionRecord& rejection);

    std::vector<RejectionRecord> load_rejections() const;

    // ========================================================================
    // Ledger Metadata
    // ========================================================================

    /**
     * @brief Metadata value, std::nullopt if unset or the table is absent
     */
    std::optional<std::string> load_meta(const std::string& key) const;

    bool save_meta(const std::string& key, const std::string& value);

    // ========================================================================
    // Diagnostics
    // ========================================================================

    /**
     * @brief Message of the most recent SQLite failure
     */
    std::string last_error() const;

    const std::string& database_path() const { return database_path_; }

    bool is_read_only() const { return read_only_; }

private:
    std::string database_path_;
    bool read_only_;
    void* db_connection_;           ///< sqlite3* (opaque pointer)
    mutable std::mutex db_mutex_;
    mutable std::string last_error_;

    bool initialize_database();

    void capture_error() const;
};

} // namespace govledger
