/**
 * @file merkle.hpp
 * @brief Merkle batch roots and inclusion proofs
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Leaves are SHA-256(0x00 || body), interior nodes SHA-256(0x01 || L || R).
 * A level with an odd node count pairs its last node with itself.
 */

#pragma once

#include "govledger/ledger_crypto.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace govledger {

/**
 * @brief Sealed, fixed-size window of consecutive entries
 */
struct MerkleBatch {
    uint64_t batch_index = 0;       ///< Batch number (first_sequence / N)
    uint64_t first_sequence = 0;    ///< Sequence index of leaf 0
    uint64_t entry_count = 0;       ///< Always N for a sealed batch
    Hash256 root{};                 ///< Merkle root over the entry bodies
    uint64_t sealed_at = 0;         ///< Unix timestamp of sealing
};

/**
 * @brief Inclusion proof of one entry in a sealed batch
 */
struct MerkleProof {
    uint64_t batch_index = 0;
    uint64_t leaf_index = 0;        ///< Position inside the batch
    std::vector<Hash256> siblings;  ///< Bottom-up sibling hashes
};

/**
 * @brief MerkleTree - Stateless Merkle helpers
 */
class MerkleTree {
public:
    static Hash256 leaf_hash(const std::string& body);

    static Hash256 node_hash(const Hash256& left, const Hash256& right);

    /**
     * @brief Root over leaf hashes
     * @return Zero hash when leaves is empty
     */
    static Hash256 compute_root(const std::vector<Hash256>& leaves);

    /**
     * @brief Sibling path for leaf at index
     * @return Siblings bottom-up; empty if index is out of range
     */
    static std::vector<Hash256> build_proof(const std::vector<Hash256>& leaves, size_t index);

    /**
     * @brief Recompute root from leaf and siblings and compare
     *
     * Left/right placement follows the parity of the index at each level.
     */
    static bool verify_proof(
        const Hash256& leaf,
        uint64_t index,
        const std::vector<Hash256>& siblings,
        const Hash256& root
    );
};

} // namespace govledger
