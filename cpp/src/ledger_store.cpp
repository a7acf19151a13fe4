/**
 * @file ledger_store.cpp
 * @brief Implementation of the append-only ledger partition
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Hash-chained entry log with Merkle batches and secondary indices
 */

#include "govledger/ledger_store.hpp"
#include "govledger/errors.hpp"
#include "govledger/utilities.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <thread>

using json = nlohmann::json;

namespace govledger {

std::string index_dimension_to_string(IndexDimension dimension) {
    switch (dimension) {
        case IndexDimension::CATEGORY: return "category";
        case IndexDimension::LIFECYCLE_PHASE: return "lifecycle_phase";
        case IndexDimension::CRITICALITY: return "criticality";
        case IndexDimension::RECORD_TYPE: return "record_type";
        default: return "unknown";
    }
}

std::string LedgerStats::to_json() const {
    json j;
    j["partition_id"] = partition_id;
    j["entry_count"] = entry_count;
    j["sealed_batches"] = sealed_batches;
    j["unsealed_entries"] = unsealed_entries;
    j["approved_entries"] = approved_entries;
    j["first_timestamp"] = first_timestamp;
    j["last_timestamp"] = last_timestamp;
    j["per_phase"] = per_phase;
    j["per_criticality"] = per_criticality;
    j["per_category"] = per_category;
    return j.dump(2);
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

LedgerStore::LedgerStore(
    const std::string& partition_id,
    const std::string& database_path,
    const LedgerConfig& config
)
    : partition_id_(partition_id)
    , config_(config)
{
    if (!validate_identifier(partition_id_)) {
        throw InputError("Invalid partition id: '" + partition_id_ + "'");
    }
    validate_config(config_);

    if (!LedgerCrypto::initialize()) {
        throw PersistenceError("Failed to initialize libsodium");
    }

    storage_ = std::make_unique<LedgerStorage>(database_path);

    pin_batch_size();
    recover();
}

LedgerStore::~LedgerStore() = default;

// ============================================================================
// Recovery
// ============================================================================

void LedgerStore::pin_batch_size() {
    auto stored = storage_->load_meta("batch_size");

    if (!stored) {
        if (!storage_->save_meta("batch_size", std::to_string(config_.batch_size))) {
            throw PersistenceError("Failed to record batch size: " + storage_->last_error());
        }
        return;
    }

    uint64_t sealed_with = 0;
    try {
        sealed_with = std::stoull(*stored);
    } catch (const std::exception&) {
        throw IntegrityError("Stored batch size '" + *stored + "' is not a number", 0);
    }

    if (sealed_with != config_.batch_size) {
        throw InputError("Partition " + partition_id_ + " was sealed with batch size "
                         + std::to_string(sealed_with) + ", configured "
                         + std::to_string(config_.batch_size));
    }
}

void LedgerStore::recover() {
    auto discarded = storage_->discard_unconfirmed();
    if (!discarded) {
        throw PersistenceError("Failed to clear append journal: " + storage_->last_error());
    }
    for (const auto& row : *discarded) {
        utilities::log_warn("LedgerStore: Discarded unconfirmed append #"
                            + std::to_string(row.sequence_index)
                            + " (record " + row.record_id + ")");
    }

    auto stored = storage_->load_entries();
    if (!stored) {
        throw PersistenceError("Failed to read entry log: " + storage_->last_error());
    }

    std::lock_guard<std::mutex> lock(state_mutex_);

    Hash256 previous_chain = LedgerCrypto::zero_hash();
    std::string previous_body;

    for (const auto& row : *stored) {
        uint64_t expected = entries_.size();

        if (row.sequence_index != expected) {
            throw IntegrityError("Sequence gap: expected #" + std::to_string(expected)
                                 + ", found #" + std::to_string(row.sequence_index), expected);
        }

        auto entry = LedgerEntry::deserialize(row.body);
        if (!entry || entry->sequence_index != row.sequence_index) {
            throw IntegrityError("Undecodable entry #" + std::to_string(expected), expected);
        }

        auto stored_hash = LedgerCrypto::hex_to_hash(row.chain_hash);
        if (!stored_hash) {
            throw IntegrityError("Undecodable chain hash at #" + std::to_string(expected), expected);
        }

        if (config_.verify_on_open) {
            Hash256 recomputed = compute_chain_hash(row.body, previous_body, previous_chain);
            if (!LedgerCrypto::constant_time_compare(recomputed, *stored_hash)) {
                utilities::log_critical("LedgerStore: Chain hash mismatch at #"
                                        + std::to_string(expected) + " in partition " + partition_id_);
                throw IntegrityError("Chain hash mismatch at #" + std::to_string(expected), expected);
            }
        }

        entry->chain_hash = *stored_hash;
        previous_chain = *stored_hash;
        previous_body = row.body;

        record_ids_.insert(entry->record.id);
        leaves_.push_back(MerkleTree::leaf_hash(row.body));
        bodies_.push_back(row.body);
        entries_.push_back(std::move(*entry));
    }

    rebuild_derived_locked();
    reconcile_stored_batches();

    utilities::log_info("LedgerStore: Opened partition " + partition_id_ + " with "
                        + std::to_string(entries_.size()) + " entries, "
                        + std::to_string(batches_.size()) + " sealed batches");
}

void LedgerStore::reconcile_stored_batches() {
    auto stored = storage_->load_batches();

    std::map<uint64_t, MerkleBatch> by_index;
    for (const auto& batch : stored) {
        by_index[batch.batch_index] = batch;
    }

    for (auto& batch : batches_) {
        auto it = by_index.find(batch.batch_index);

        if (it == by_index.end()) {
            utilities::log_warn("LedgerStore: Batch " + std::to_string(batch.batch_index)
                                + " missing from storage, rebuilt from entry log");
            if (!storage_->store_batch(batch)) {
                utilities::log_error("LedgerStore: Failed to persist rebuilt batch "
                                     + std::to_string(batch.batch_index) + ": " + storage_->last_error());
            }
            continue;
        }

        // A disagreeing root is evidence; leave it for the verifier
        if (!LedgerCrypto::constant_time_compare(it->second.root, batch.root)) {
            utilities::log_critical("LedgerStore: Batch " + std::to_string(batch.batch_index)
                                    + " root disagrees with the entry log in partition " + partition_id_);
            throw IntegrityError("Merkle root mismatch for batch " + std::to_string(batch.batch_index),
                                 batch.first_sequence);
        }

        batch.sealed_at = it->second.sealed_at;
    }

    if (stored.size() > batches_.size()) {
        utilities::log_warn("LedgerStore: Storage holds " + std::to_string(stored.size())
                            + " batch rows for " + std::to_string(batches_.size()) + " sealed batches");
    }
}

// ============================================================================
// Write Path
// ============================================================================

Hash256 LedgerStore::compute_chain_hash(
    const std::string& body,
    const std::string& previous_body,
    const Hash256& previous_chain_hash
) {
    std::vector<uint8_t> material;
    material.reserve(body.size() + previous_body.size() + previous_chain_hash.size());
    material.insert(material.end(), body.begin(), body.end());
    material.insert(material.end(), previous_body.begin(), previous_body.end());
    material.insert(material.end(), previous_chain_hash.begin(), previous_chain_hash.end());
    return LedgerCrypto::sha256(material);
}

LedgerEntry LedgerStore::append(
    const GovernanceTuple& record,
    const std::optional<ApprovalDecision>& approval
) {
    std::unique_lock<std::mutex> append_lock(append_mutex_);

    LedgerEntry entry;
    entry.record = record;
    entry.approval_decision = approval;

    std::string previous_body;
    Hash256 previous_chain = LedgerCrypto::zero_hash();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);

        if (record_ids_.count(record.id) > 0) {
            throw InputError("Record " + record.id + " is already in the ledger");
        }

        entry.sequence_index = entries_.size();
        if (!entries_.empty()) {
            previous_body = bodies_.back();
            previous_chain = entries_.back().chain_hash;
        }
    }

    std::string body = entry.serialize();
    entry.chain_hash = compute_chain_hash(body, previous_body, previous_chain);

    persist_with_retry(entry, body);

    std::optional<MerkleBatch> sealed;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);

        record_ids_.insert(entry.record.id);
        leaves_.push_back(MerkleTree::leaf_hash(body));
        bodies_.push_back(body);
        entries_.push_back(entry);
        index_entry_locked(entry);

        sealed = seal_if_complete_locked(utilities::current_unix_seconds());
    }

    utilities::log_info("LedgerStore: Appended #" + std::to_string(entry.sequence_index)
                        + " record " + entry.record.id + " to partition " + partition_id_);

    if (sealed) {
        // Batches are derived; a failed write is repaired on the next open
        if (!storage_->store_batch(*sealed)) {
            utilities::log_error("LedgerStore: Failed to persist batch "
                                 + std::to_string(sealed->batch_index) + ": " + storage_->last_error());
        }
        utilities::log_info("LedgerStore: Sealed batch " + std::to_string(sealed->batch_index)
                            + " root " + LedgerCrypto::hash_to_hex(sealed->root));
    }

    append_lock.unlock();

    if (sealed) {
        notify_batch_sealed(*sealed);
    }

    return entry;
}

void LedgerStore::persist_with_retry(const LedgerEntry& entry, const std::string& body) {
    JournalRow intent;
    intent.sequence_index = entry.sequence_index;
    intent.record_id = entry.record.id;
    intent.chain_hash = LedgerCrypto::hash_to_hex(entry.chain_hash);
    intent.started_at = utilities::current_unix_seconds();

    std::string failure;
    std::chrono::milliseconds backoff = config_.append_base_backoff;

    for (size_t attempt = 1; attempt <= config_.append_max_attempts; ++attempt) {
        if (storage_->begin_append(intent) && storage_->commit_append(entry, body)) {
            return;
        }

        failure = storage_->last_error();

        if (attempt < config_.append_max_attempts) {
            utilities::log_warn("LedgerStore: Append #" + std::to_string(entry.sequence_index)
                                + " attempt " + std::to_string(attempt) + " failed (" + failure
                                + "), retrying in " + std::to_string(backoff.count()) + "ms");
            std::this_thread::sleep_for(backoff);
            backoff = std::min(backoff * 2, MAX_APPEND_BACKOFF);
        }
    }

    utilities::log_critical("LedgerStore: Append #" + std::to_string(entry.sequence_index)
                            + " of record " + entry.record.id + " failed after "
                            + std::to_string(config_.append_max_attempts) + " attempts: " + failure);

    throw PersistenceError("Append of record " + entry.record.id + " failed after "
                           + std::to_string(config_.append_max_attempts) + " attempts: " + failure);
}

void LedgerStore::index_entry_locked(const LedgerEntry& entry) {
    const auto& record = entry.record;
    uint64_t seq = entry.sequence_index;

    indices_[IndexDimension::CATEGORY][record.category].push_back(seq);
    indices_[IndexDimension::LIFECYCLE_PHASE][record.lifecycle_phase].push_back(seq);
    indices_[IndexDimension::CRITICALITY][criticality_to_string(record.criticality_level)].push_back(seq);
    indices_[IndexDimension::RECORD_TYPE][record.record_type].push_back(seq);

    time_buckets_[record.timestamp / config_.time_bucket_seconds].push_back(seq);
}

std::optional<MerkleBatch> LedgerStore::seal_if_complete_locked(uint64_t sealed_at) {
    uint64_t n = config_.batch_size;
    uint64_t total = entries_.size();

    if (total == 0 || total % n != 0) {
        return std::nullopt;
    }

    MerkleBatch batch;
    batch.batch_index = total / n - 1;
    batch.first_sequence = batch.batch_index * n;
    batch.entry_count = n;
    batch.sealed_at = sealed_at;

    std::vector<Hash256> window(leaves_.begin() + static_cast<std::ptrdiff_t>(batch.first_sequence),
                                leaves_.begin() + static_cast<std::ptrdiff_t>(total));
    batch.root = MerkleTree::compute_root(window);

    batches_.push_back(batch);
    return batch;
}

void LedgerStore::rebuild_derived_locked() {
    std::map<uint64_t, uint64_t> sealed_times;
    for (const auto& batch : batches_) {
        sealed_times[batch.batch_index] = batch.sealed_at;
    }

    indices_.clear();
    time_buckets_.clear();
    batches_.clear();

    uint64_t n = config_.batch_size;
    uint64_t now = utilities::current_unix_seconds();

    for (const auto& entry : entries_) {
        index_entry_locked(entry);
    }

    for (uint64_t first = 0; first + n <= entries_.size(); first += n) {
        MerkleBatch batch;
        batch.batch_index = first / n;
        batch.first_sequence = first;
        batch.entry_count = n;

        auto it = sealed_times.find(batch.batch_index);
        batch.sealed_at = (it != sealed_times.end()) ? it->second : now;

        std::vector<Hash256> window(leaves_.begin() + static_cast<std::ptrdiff_t>(first),
                                    leaves_.begin() + static_cast<std::ptrdiff_t>(first + n));
        batch.root = MerkleTree::compute_root(window);

        batches_.push_back(batch);
    }
}

void LedgerStore::on_batch_sealed(BatchSealedCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    batch_callbacks_.push_back(std::move(callback));
}

void LedgerStore::notify_batch_sealed(const MerkleBatch& batch) {
    std::vector<BatchSealedCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = batch_callbacks_;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(batch);
        } catch (const std::exception& e) {
            utilities::log_error("LedgerStore: Batch-sealed subscriber failed: " + std::string(e.what()));
        }
    }
}

// ============================================================================
// Read Path
// ============================================================================

std::optional<LedgerEntry> LedgerStore::read(uint64_t sequence_index) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (sequence_index >= entries_.size()) {
        return std::nullopt;
    }
    return entries_[sequence_index];
}

std::optional<std::string> LedgerStore::body(uint64_t sequence_index) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (sequence_index >= bodies_.size()) {
        return std::nullopt;
    }
    return bodies_[sequence_index];
}

std::optional<Hash256> LedgerStore::chain_hash_at(uint64_t sequence_index) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (sequence_index >= entries_.size()) {
        return std::nullopt;
    }
    return entries_[sequence_index].chain_hash;
}

uint64_t LedgerStore::size() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return entries_.size();
}

bool LedgerStore::contains_record(const std::string& record_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return record_ids_.count(record_id) > 0;
}

std::vector<uint64_t> LedgerStore::lookup(IndexDimension dimension, const std::string& value) const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    auto dim_it = indices_.find(dimension);
    if (dim_it == indices_.end()) {
        return {};
    }

    auto value_it = dim_it->second.find(value);
    if (value_it == dim_it->second.end()) {
        return {};
    }

    return value_it->second;
}

std::vector<uint64_t> LedgerStore::lookup_time_range(uint64_t from, uint64_t to) const {
    std::vector<uint64_t> result;
    if (from > to) {
        return result;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);

    uint64_t first_bucket = from / config_.time_bucket_seconds;
    uint64_t last_bucket = to / config_.time_bucket_seconds;

    for (auto it = time_buckets_.lower_bound(first_bucket);
         it != time_buckets_.end() && it->first <= last_bucket; ++it) {
        for (uint64_t seq : it->second) {
            uint64_t timestamp = entries_[seq].record.timestamp;
            if (timestamp >= from && timestamp <= to) {
                result.push_back(seq);
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

// ============================================================================
// Merkle Batches
// ============================================================================

std::vector<MerkleBatch> LedgerStore::sealed_batches() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return batches_;
}

std::optional<MerkleBatch> LedgerStore::batch_for(uint64_t sequence_index) const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    uint64_t batch_index = sequence_index / config_.batch_size;
    if (batch_index >= batches_.size()) {
        return std::nullopt;
    }
    return batches_[batch_index];
}

std::optional<MerkleProof> LedgerStore::merkle_proof(uint64_t sequence_index) const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    uint64_t n = config_.batch_size;
    uint64_t batch_index = sequence_index / n;
    if (batch_index >= batches_.size()) {
        return std::nullopt;
    }

    uint64_t first = batch_index * n;
    std::vector<Hash256> window(leaves_.begin() + static_cast<std::ptrdiff_t>(first),
                                leaves_.begin() + static_cast<std::ptrdiff_t>(first + n));

    MerkleProof proof;
    proof.batch_index = batch_index;
    proof.leaf_index = sequence_index - first;
    proof.siblings = MerkleTree::build_proof(window, static_cast<size_t>(proof.leaf_index));
    return proof;
}

// ============================================================================
// Maintenance
// ============================================================================

void LedgerStore::rebuild_indices() {
    std::lock_guard<std::mutex> append_lock(append_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        rebuild_derived_locked();
        reconcile_stored_batches();
    }

    utilities::log_info("LedgerStore: Rebuilt indices and batches for partition " + partition_id_);
}

LedgerStats LedgerStore::stats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    LedgerStats stats;
    stats.partition_id = partition_id_;
    stats.entry_count = entries_.size();
    stats.sealed_batches = batches_.size();
    stats.unsealed_entries = entries_.size() - batches_.size() * config_.batch_size;

    for (const auto& entry : entries_) {
        const auto& record = entry.record;

        if (entry.approval_decision) {
            stats.approved_entries++;
        }
        if (stats.first_timestamp == 0 || record.timestamp < stats.first_timestamp) {
            stats.first_timestamp = record.timestamp;
        }
        stats.last_timestamp = std::max(stats.last_timestamp, record.timestamp);

        stats.per_phase[record.lifecycle_phase]++;
        stats.per_criticality[criticality_to_string(record.criticality_level)]++;
        stats.per_category[record.category]++;
    }

    return stats;
}

bool LedgerStore::export_json(const std::string& path, uint64_t since) const {
    json document;
    json entries = json::array();
    json batches = json::array();
    std::string last_chain_hash;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);

        for (uint64_t seq = since; seq < entries_.size(); ++seq) {
            entries.push_back(json::parse(entries_[seq].to_json()));
        }
        for (const auto& batch : batches_) {
            json b;
            b["batch_index"] = batch.batch_index;
            b["first_sequence"] = batch.first_sequence;
            b["entry_count"] = batch.entry_count;
            b["root"] = LedgerCrypto::hash_to_hex(batch.root);
            b["sealed_at"] = batch.sealed_at;
            batches.push_back(b);
        }
        if (!entries_.empty()) {
            last_chain_hash = LedgerCrypto::hash_to_hex(entries_.back().chain_hash);
        }
    }

    uint64_t entry_count = entries.size();

    document["partition_id"] = partition_id_;
    document["exported_at"] = utilities::current_unix_seconds();
    document["first_sequence"] = since;
    document["entries"] = std::move(entries);
    document["batches"] = std::move(batches);

    if (!utilities::write_file(path, document.dump(2))) {
        utilities::log_error("LedgerStore: Failed to write export " + path);
        return false;
    }

    auto file_hash = utilities::calculate_file_hash(path);
    if (!file_hash) {
        utilities::log_error("LedgerStore: Failed to hash export " + path);
        return false;
    }

    json manifest;
    manifest["file"] = path;
    manifest["sha256"] = *file_hash;
    manifest["partition_id"] = partition_id_;
    manifest["first_sequence"] = since;
    manifest["entry_count"] = entry_count;
    manifest["last_chain_hash"] = last_chain_hash;

    if (!utilities::write_file(path + ".manifest.json", manifest.dump(2))) {
        utilities::log_error("LedgerStore: Failed to write manifest for " + path);
        return false;
    }

    utilities::log_info("LedgerStore: Exported " + std::to_string(entry_count)
                        + " entries to " + path);
    return true;
}

bool LedgerStore::export_rejections_json(const std::string& path) const {
    json rejections = json::array();

    for (const auto& row : storage_->load_rejections()) {
        json r;
        r["id"] = row.id;
        r["admission_id"] = row.admission_id;
        r["record_id"] = row.record_id;
        r["reason"] = row.reason;
        r["detail"] = row.detail;
        r["rejected_at"] = row.rejected_at;
        json record = json::parse(row.record_json, nullptr, false);
        r["record"] = record.is_discarded() ? json(nullptr) : record;
        rejections.push_back(r);
    }

    json document;
    document["partition_id"] = partition_id_;
    document["rejections"] = std::move(rejections);

    return utilities::write_file(path, document.dump(2));
}

} // namespace govledger
