/**
 * @file ledger_store.hpp
 * @brief Append-only, hash-chained ledger partition with Merkle batches
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Features:
 * - Chain hash linking each entry to its predecessor
 * - Journaled all-or-nothing appends with crash recovery
 * - Merkle batch sealing every N entries
 * - Secondary indices (category, phase, criticality, record type, time bucket)
 * - O(1) reads by sequence index
 *
 * Thread-safe. Appends are serialized by a single per-partition lock.
 */

#pragma once

#include "govledger/governance_record.hpp"
#include "govledger/ledger_config.hpp"
#include "govledger/ledger_storage.hpp"
#include "govledger/merkle.hpp"

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <memory>
#include <optional>
#include <functional>
#include <cstdint>

namespace govledger {

/**
 * @brief Filter dimensions backed by a secondary index
 */
enum class IndexDimension {
    CATEGORY,
    LIFECYCLE_PHASE,
    CRITICALITY,
    RECORD_TYPE
};

std::string index_dimension_to_string(IndexDimension dimension);

/**
 * @brief Diagnostic counters for one partition
 */
struct LedgerStats {
    std::string partition_id;
    uint64_t entry_count = 0;
    uint64_t sealed_batches = 0;
    uint64_t unsealed_entries = 0;          ///< Entries after the last sealed batch
    uint64_t approved_entries = 0;          ///< Entries carrying a human decision
    uint64_t first_timestamp = 0;
    uint64_t last_timestamp = 0;
    std::map<std::string, uint64_t> per_phase;
    std::map<std::string, uint64_t> per_criticality;
    std::map<std::string, uint64_t> per_category;

    std::string to_json() const;
};

/**
 * @brief Callback for the archival collaborator
 */
using BatchSealedCallback = std::function<void(const MerkleBatch&)>;

/**
 * @brief LedgerStore - One ledger partition
 */
class LedgerStore {
public:
    /**
     * @brief Open or create a partition
     * @param partition_id Partition identifier
     * @param database_path Path to SQLite database file
     * @param config Ledger configuration
     * @throws InputError if partition_id or config is invalid
     * @throws PersistenceError if the database cannot be opened or read
     * @throws IntegrityError if verify_on_open is set and the chain does not verify
     */
    LedgerStore(
        const std::string& partition_id,
        const std::string& database_path,
        const LedgerConfig& config = LedgerConfig{}
    );

    ~LedgerStore();

    // Disable copy and move
    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;
    LedgerStore(LedgerStore&&) = delete;
    LedgerStore& operator=(LedgerStore&&) = delete;

    // ========================================================================
    // Write Path
    // ========================================================================

    /**
     * @brief Append a record as the next entry
     *
     * Computes the chain hash, persists entry and hash atomically, then
     * extends the indices and seals a Merkle batch when a window completes.
     * Persistence failures are retried with exponential backoff.
     *
     * @param record Admitted record
     * @param approval Human decision, if the record was escalated
     * @return Committed entry
     * @throws InputError if the record id is already in the ledger
     * @throws PersistenceError if the entry could not be persisted
     */
    LedgerEntry append(
        const GovernanceTuple& record,
        const std::optional<ApprovalDecision>& approval = std::nullopt
    );

    /**
     * @brief Register a batch-sealed subscriber; called without locks held
     */
    void on_batch_sealed(BatchSealedCallback callback);

    // ========================================================================
    // Read Path
    // ========================================================================

    /**
     * @brief Entry at sequence index
     * @return Entry, or std::nullopt if out of range
     */
    std::optional<LedgerEntry> read(uint64_t sequence_index) const;

    /**
     * @brief Serialized body that was hashed into the chain
     */
    std::optional<std::string> body(uint64_t sequence_index) const;

    std::optional<Hash256> chain_hash_at(uint64_t sequence_index) const;

    /**
     * @brief Number of committed entries (next sequence index)
     */
    uint64_t size() const;

    bool contains_record(const std::string& record_id) const;

    /**
     * @brief Sequence indices whose dimension equals value, ascending
     */
    std::vector<uint64_t> lookup(IndexDimension dimension, const std::string& value) const;

    /**
     * @brief Sequence indices with from <= timestamp <= to, ascending
     */
    std::vector<uint64_t> lookup_time_range(uint64_t from, uint64_t to) const;

    // ========================================================================
    // Merkle Batches
    // ========================================================================

    std::vector<MerkleBatch> sealed_batches() const;

    /**
     * @brief Sealed batch containing the entry
     * @return Batch, or std::nullopt if the entry is not yet sealed
     */
    std::optional<MerkleBatch> batch_for(uint64_t sequence_index) const;

    /**
     * @brief Inclusion proof for a sealed entry
     */
    std::optional<MerkleProof> merkle_proof(uint64_t sequence_index) const;

    // ========================================================================
    // Maintenance
    // ========================================================================

    /**
     * @brief Regenerate indices and Merkle batches from the entry log
     */
    void rebuild_indices();

    LedgerStats stats() const;

    /**
     * @brief Export entries from `since` with chain hashes, plus a
     *        "<path>.manifest.json" carrying the file's SHA-256
     * @return true if both files were written
     */
    bool export_json(const std::string& path, uint64_t since = 0) const;

    /**
     * @brief Export the rejection log
     */
    bool export_rejections_json(const std::string& path) const;

    const std::string& partition_id() const { return partition_id_; }

    const LedgerConfig& config() const { return config_; }

    LedgerStorage& storage() { return *storage_; }

    /**
     * @brief chain[i] = SHA-256(body[i] || body[i-1] || chain[i-1])
     *
     * For i = 0 pass an empty previous body and the zero hash.
     */
    static Hash256 compute_chain_hash(
        const std::string& body,
        const std::string& previous_body,
        const Hash256& previous_chain_hash
    );

private:
    std::string partition_id_;
    LedgerConfig config_;
    std::unique_ptr<LedgerStorage> storage_;

    // Entry arena, addressed by sequence index
    std::vector<LedgerEntry> entries_;
    std::vector<std::string> bodies_;
    std::vector<Hash256> leaves_;
    std::set<std::string> record_ids_;

    // Derived state
    std::map<IndexDimension, std::map<std::string, std::vector<uint64_t>>> indices_;
    std::map<uint64_t, std::vector<uint64_t>> time_buckets_;
    std::vector<MerkleBatch> batches_;

    std::vector<BatchSealedCallback> batch_callbacks_;

    std::mutex append_mutex_;               ///< Serializes the write path
    mutable std::mutex state_mutex_;        ///< Guards arena and derived state
    std::mutex callbacks_mutex_;

    /**
     * @brief Record batch_size on first open, refuse a different one later
     * @throws InputError if the ledger was sealed with another batch size
     */
    void pin_batch_size();

    void recover();

    void persist_with_retry(const LedgerEntry& entry, const std::string& body);

    void index_entry_locked(const LedgerEntry& entry);

    std::optional<MerkleBatch> seal_if_complete_locked(uint64_t sealed_at);

    void rebuild_derived_locked();

    void reconcile_stored_batches();

    void notify_batch_sealed(const MerkleBatch& batch);
};

} // namespace govledger
