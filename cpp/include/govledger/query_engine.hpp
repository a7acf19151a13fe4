/**
 * @file query_engine.hpp
 * @brief Filtered, paginated, snapshot-consistent ledger queries with proofs
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A query fixes its snapshot (ledger size) at call time; the page token
 * carries that snapshot so later pages ignore entries appended since.
 * Identical ledger state, filter and token produce byte-identical pages.
 */

#pragma once

#include "govledger/governance_record.hpp"
#include "govledger/ledger_store.hpp"
#include "govledger/merkle.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace govledger {

enum class QueryStatus {
    OK,
    NOT_FOUND,
    INVALID_QUERY,
    INTEGRITY_PROOF_UNAVAILABLE
};

std::string query_status_to_string(QueryStatus status);

/**
 * @brief Conjunctive filter; unset fields match everything
 */
struct QueryFilter {
    std::optional<std::string> category;
    std::optional<std::string> lifecycle_phase;
    std::optional<std::string> record_type;
    std::optional<Criticality> criticality;
    std::optional<uint64_t> time_from;          ///< Inclusive, unix seconds
    std::optional<uint64_t> time_to;            ///< Inclusive, unix seconds

    size_t page_size = 0;                       ///< 0 selects the configured default
    std::string page_token;                     ///< Empty for the first page
    bool require_merkle_proof = false;          ///< Refuse chain-segment artifacts

    /**
     * @brief Stable digest of the filter fields (excludes page_token)
     */
    std::string fingerprint() const;
};

enum class ProofKind {
    MERKLE_BATCH,
    CHAIN_SEGMENT
};

/**
 * @brief Recompute chain hashes from anchor_index up to target_index
 *
 * anchor_previous_chain_hash is chain[anchor_index - 1] (zero for 0).
 */
struct ChainSegmentHint {
    uint64_t anchor_index = 0;
    Hash256 anchor_previous_chain_hash{};
    uint64_t target_index = 0;
    Hash256 target_chain_hash{};
};

/**
 * @brief Per-entry integrity artifact
 */
struct VerificationArtifact {
    ProofKind kind = ProofKind::CHAIN_SEGMENT;
    std::optional<MerkleProof> merkle_proof;
    std::optional<MerkleBatch> batch;           ///< Batch root the proof verifies against
    std::optional<ChainSegmentHint> chain_segment;
};

struct QueryResultEntry {
    LedgerEntry entry;
    VerificationArtifact artifact;
};

/**
 * @brief One page of results
 */
struct QueryPage {
    QueryStatus status = QueryStatus::OK;
    std::string message;
    std::vector<QueryResultEntry> entries;      ///< Ascending sequence order
    std::string next_page_token;                ///< Empty on the last page
    uint64_t snapshot_size = 0;

    /**
     * @brief Canonical JSON rendering (byte-stable)
     */
    std::string to_json() const;
};

/**
 * @brief QueryEngine - Read-side API over one ledger partition
 *
 * Thread-safe; holds no state of its own.
 */
class QueryEngine {
public:
    explicit QueryEngine(const LedgerStore& store);

    /**
     * @brief Run a filtered query
     */
    QueryPage query(const QueryFilter& filter) const;

    /**
     * @brief Single entry with its artifact
     */
    QueryPage get(uint64_t sequence_index, bool require_merkle_proof = false) const;

    /**
     * @brief Check an artifact against the entry it accompanies
     */
    bool verify_artifact(const QueryResultEntry& result) const;

    /**
     * @brief Check a Merkle proof for a serialized entry body
     */
    static bool verify_merkle(
        const std::string& body,
        const MerkleProof& proof,
        const Hash256& root
    );

private:
    const LedgerStore& store_;

    std::optional<VerificationArtifact> build_artifact(
        uint64_t sequence_index,
        uint64_t snapshot_size,
        bool require_merkle_proof
    ) const;

    static std::string encode_token(uint64_t snapshot_size, uint64_t next_sequence,
                                    const std::string& fingerprint);

    static bool decode_token(const std::string& token, uint64_t& snapshot_size,
                             uint64_t& next_sequence, std::string& fingerprint);
};

} // namespace govledger
