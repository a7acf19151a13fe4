/**
 * @file ledger_storage.cpp
 * @brief Implementation of the SQLite persistence substrate
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Append-only entry log with journaled commits
 */

#include "govledger/ledger_storage.hpp"
#include "govledger/errors.hpp"
#include "govledger/utilities.hpp"

#include <sqlite3.h>

namespace govledger {

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

LedgerStorage::LedgerStorage(const std::string& database_path, bool read_only)
    : database_path_(database_path)
    , read_only_(read_only)
    , db_connection_(nullptr)
{
    sqlite3* db = nullptr;
    int flags = read_only_
        ? SQLITE_OPEN_READONLY
        : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    int rc = sqlite3_open_v2(database_path_.c_str(), &db, flags, nullptr);

    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) {
            sqlite3_close(db);
        }
        throw PersistenceError("Failed to open ledger database " + database_path_ + ": " + message);
    }

    db_connection_ = static_cast<void*>(db);

    if (!read_only_ && !initialize_database()) {
        std::string message = last_error_;
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw PersistenceError("Failed to initialize ledger schema: " + message);
    }
}

LedgerStorage::~LedgerStorage() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool LedgerStorage::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS entries (
            sequence_index INTEGER PRIMARY KEY,
            record_id TEXT NOT NULL UNIQUE,
            body TEXT NOT NULL,
            chain_hash TEXT NOT NULL,
            lifecycle_phase TEXT NOT NULL,
            category TEXT NOT NULL,
            record_type TEXT NOT NULL,
            criticality INTEGER NOT NULL,
            timestamp INTEGER NOT NULL,
            CONSTRAINT valid_index CHECK (sequence_index >= 0)
        );
        CREATE INDEX IF NOT EXISTS idx_entries_phase ON entries(lifecycle_phase);
        CREATE INDEX IF NOT EXISTS idx_entries_timestamp ON entries(timestamp);

        CREATE TABLE IF NOT EXISTS append_journal (
            sequence_index INTEGER PRIMARY KEY,
            record_id TEXT NOT NULL,
            chain_hash TEXT NOT NULL,
            started_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS merkle_batches (
            batch_index INTEGER PRIMARY KEY,
            first_sequence INTEGER NOT NULL,
            entry_count INTEGER NOT NULL,
            root TEXT NOT NULL,
            sealed_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS pending_approvals (
            admission_id TEXT PRIMARY KEY,
            ticket_id TEXT NOT NULL,
            record_json TEXT NOT NULL,
            waited_ms INTEGER NOT NULL,
            escalated_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS rejections (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            admission_id TEXT NOT NULL,
            record_id TEXT NOT NULL,
            reason TEXT NOT NULL,
            detail TEXT NOT NULL,
            record_json TEXT NOT NULL,
            rejected_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_rejections_record ON rejections(record_id);

        CREATE TABLE IF NOT EXISTS ledger_meta (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )";

    int rc = sqlite3_exec(db, schema, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            last_error_ = error_msg;
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

void LedgerStorage::capture_error() const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    last_error_ = db ? sqlite3_errmsg(db) : "database closed";
}

std::string LedgerStorage::last_error() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return last_error_;
}

// ============================================================================
// Entry Log
// ============================================================================

bool LedgerStorage::begin_append(const JournalRow& intent) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT OR REPLACE INTO append_journal
        (sequence_index, record_id, chain_hash, started_at)
        VALUES (?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        capture_error();
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(intent.sequence_index));
    sqlite3_bind_text(stmt, 2, intent.record_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, intent.chain_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(intent.started_at));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        capture_error();
        return false;
    }
    return true;
}

bool LedgerStorage::commit_append(const LedgerEntry& entry, const std::string& body) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    if (sqlite3_exec(db, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
        capture_error();
        return false;
    }

    const char* insert_sql = R"(
        INSERT INTO entries
        (sequence_index, record_id, body, chain_hash, lifecycle_phase,
         category, record_type, criticality, timestamp)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, insert_sql, -1, &stmt, nullptr);

    if (rc == SQLITE_OK) {
        std::string chain_hex = LedgerCrypto::hash_to_hex(entry.chain_hash);

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(entry.sequence_index));
        sqlite3_bind_text(stmt, 2, entry.record.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, body.c_str(), static_cast<int>(body.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, chain_hex.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, entry.record.lifecycle_phase.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, entry.record.category.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 7, entry.record.record_type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 8, static_cast<int>(entry.record.criticality_level));
        sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(entry.record.timestamp));

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        rc = (rc == SQLITE_DONE) ? SQLITE_OK : rc;
    }

    if (rc == SQLITE_OK) {
        const char* clear_sql = "DELETE FROM append_journal WHERE sequence_index = ?";
        rc = sqlite3_prepare_v2(db, clear_sql, -1, &stmt, nullptr);
        if (rc == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(entry.sequence_index));
            rc = sqlite3_step(stmt);
            sqlite3_finalize(stmt);
            rc = (rc == SQLITE_DONE) ? SQLITE_OK : rc;
        }
    }

    if (rc == SQLITE_OK) {
        rc = sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        capture_error();
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        return false;
    }

    return true;
}

std::optional<std::vector<JournalRow>> LedgerStorage::discard_unconfirmed() {
    std::vector<JournalRow> rows = load_journal();

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (rows.empty()) {
        return rows;
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    if (sqlite3_exec(db, "DELETE FROM append_journal", nullptr, nullptr, nullptr) != SQLITE_OK) {
        capture_error();
        return std::nullopt;
    }

    return rows;
}

std::vector<JournalRow> LedgerStorage::load_journal() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<JournalRow> rows;
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT sequence_index, record_id, chain_hash, started_at
        FROM append_journal
        ORDER BY sequence_index ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return rows;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        JournalRow row;
        row.sequence_index = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        row.record_id = column_text(stmt, 1);
        row.chain_hash = column_text(stmt, 2);
        row.started_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
        rows.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);
    return rows;
}

std::optional<std::vector<StoredEntry>> LedgerStorage::load_entries() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<StoredEntry> entries;
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT sequence_index, record_id, body, chain_hash
        FROM entries
        ORDER BY sequence_index ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return std::nullopt;
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        StoredEntry entry;
        entry.sequence_index = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        entry.record_id = column_text(stmt, 1);
        entry.body = column_text(stmt, 2);
        entry.chain_hash = column_text(stmt, 3);
        entries.push_back(std::move(entry));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        capture_error();
        return std::nullopt;
    }

    return entries;
}

uint64_t LedgerStorage::entry_count() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    const char* sql = "SELECT COUNT(*) FROM entries";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return 0;
    }

    uint64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

// ============================================================================
// Merkle Batches
// ============================================================================

bool LedgerStorage::store_batch(const MerkleBatch& batch) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT OR REPLACE INTO merkle_batches
        (batch_index, first_sequence, entry_count, root, sealed_at)
        VALUES (?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return false;
    }

    std::string root_hex = LedgerCrypto::hash_to_hex(batch.root);

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(batch.batch_index));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(batch.first_sequence));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(batch.entry_count));
    sqlite3_bind_text(stmt, 4, root_hex.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(batch.sealed_at));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        capture_error();
        return false;
    }
    return true;
}

std::vector<MerkleBatch> LedgerStorage::load_batches() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<MerkleBatch> batches;
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT batch_index, first_sequence, entry_count, root, sealed_at
        FROM merkle_batches
        ORDER BY batch_index ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return batches;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        MerkleBatch batch;
        batch.batch_index = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        batch.first_sequence = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        batch.entry_count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        // An undecodable root stays zero and fails every comparison
        auto root = LedgerCrypto::hex_to_hash(column_text(stmt, 3));
        batch.root = root ? *root : LedgerCrypto::zero_hash();
        batch.sealed_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        batches.push_back(batch);
    }

    sqlite3_finalize(stmt);
    return batches;
}

// ============================================================================
// Pending Approvals
// ============================================================================

bool LedgerStorage::save_pending(const PendingApproval& pending) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT OR REPLACE INTO pending_approvals
        (admission_id, ticket_id, record_json, waited_ms, escalated_at)
        VALUES (?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return false;
    }

    sqlite3_bind_text(stmt, 1, pending.admission_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, pending.ticket_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, pending.record_json.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(pending.waited_ms));
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(pending.escalated_at));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        capture_error();
        return false;
    }
    return true;
}

bool LedgerStorage::update_pending_wait(const std::string& admission_id, uint64_t waited_ms) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "UPDATE pending_approvals SET waited_ms = ? WHERE admission_id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(waited_ms));
    sqlite3_bind_text(stmt, 2, admission_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        capture_error();
        return false;
    }
    return true;
}

bool LedgerStorage::remove_pending(const std::string& admission_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "DELETE FROM pending_approvals WHERE admission_id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return false;
    }

    sqlite3_bind_text(stmt, 1, admission_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        capture_error();
        return false;
    }
    return true;
}

std::vector<PendingApproval> LedgerStorage::load_pending() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<PendingApproval> pending;
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT admission_id, ticket_id, record_json, waited_ms, escalated_at
        FROM pending_approvals
        ORDER BY escalated_at ASC, admission_id ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return pending;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        PendingApproval row;
        row.admission_id = column_text(stmt, 0);
        row.ticket_id = column_text(stmt, 1);
        row.record_json = column_text(stmt, 2);
        row.waited_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
        row.escalated_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        pending.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);
    return pending;
}

// ============================================================================
// Rejection Log
// ============================================================================

bool LedgerStorage::record_rejection(const RejectionRecord& rejection) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT INTO rejections
        (admission_id, record_id, reason, detail, record_json, rejected_at)
        VALUES (?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return false;
    }

    sqlite3_bind_text(stmt, 1, rejection.admission_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, rejection.record_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, rejection.reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, rejection.detail.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, rejection.record_json.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(rejection.rejected_at));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        capture_error();
        return false;
    }
    return true;
}

std::vector<RejectionRecord> LedgerStorage::load_rejections() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<RejectionRecord> rejections;
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT id, admission_id, record_id, reason, detail, record_json, rejected_at
        FROM rejections
        ORDER BY id ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return rejections;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        RejectionRecord row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.admission_id = column_text(stmt, 1);
        row.record_id = column_text(stmt, 2);
        row.reason = column_text(stmt, 3);
        row.detail = column_text(stmt, 4);
        row.record_json = column_text(stmt, 5);
        row.rejected_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
        rejections.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);
    return rejections;
}

// ============================================================================
// Ledger Metadata
// ============================================================================

std::optional<std::string> LedgerStorage::load_meta(const std::string& key) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    const char* sql = "SELECT value FROM ledger_meta WHERE key = ?";

    // Databases written before the table existed have no metadata
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = column_text(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return value;
}

bool LedgerStorage::save_meta(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    const char* sql = "INSERT OR REPLACE INTO ledger_meta (key, value) VALUES (?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        capture_error();
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        capture_error();
        return false;
    }
    return true;
}

} // namespace govledger
