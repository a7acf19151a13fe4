/**
 * @file merkle.cpp
 * @brief Implementation of Merkle batch helpers
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "govledger/merkle.hpp"

namespace govledger {

namespace {

constexpr uint8_t LEAF_PREFIX = 0x00;
constexpr uint8_t NODE_PREFIX = 0x01;

std::vector<Hash256> next_level(const std::vector<Hash256>& level) {
    std::vector<Hash256> parents;
    parents.reserve((level.size() + 1) / 2);

    for (size_t i = 0; i < level.size(); i += 2) {
        const Hash256& left = level[i];
        const Hash256& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
        parents.push_back(MerkleTree::node_hash(left, right));
    }

    return parents;
}

} // namespace

Hash256 MerkleTree::leaf_hash(const std::string& body) {
    std::vector<uint8_t> data;
    data.reserve(body.size() + 1);
    data.push_back(LEAF_PREFIX);
    data.insert(data.end(), body.begin(), body.end());
    return LedgerCrypto::sha256(data);
}

Hash256 MerkleTree::node_hash(const Hash256& left, const Hash256& right) {
    std::vector<uint8_t> data;
    data.reserve(1 + left.size() + right.size());
    data.push_back(NODE_PREFIX);
    data.insert(data.end(), left.begin(), left.end());
    data.insert(data.end(), right.begin(), right.end());
    return LedgerCrypto::sha256(data);
}

Hash256 MerkleTree::compute_root(const std::vector<Hash256>& leaves) {
    if (leaves.empty()) {
        return LedgerCrypto::zero_hash();
    }

    std::vector<Hash256> level = leaves;
    while (level.size() > 1) {
        level = next_level(level);
    }
    return level.front();
}

std::vector<Hash256> MerkleTree::build_proof(const std::vector<Hash256>& leaves, size_t index) {
    std::vector<Hash256> siblings;
    if (index >= leaves.size()) {
        return siblings;
    }

    std::vector<Hash256> level = leaves;
    while (level.size() > 1) {
        size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
        if (sibling >= level.size()) {
            sibling = index;    // odd tail pairs with itself
        }
        siblings.push_back(level[sibling]);

        level = next_level(level);
        index /= 2;
    }

    return siblings;
}

bool MerkleTree::verify_proof(
    const Hash256& leaf,
    uint64_t index,
    const std::vector<Hash256>& siblings,
    const Hash256& root
) {
    Hash256 current = leaf;

    for (const auto& sibling : siblings) {
        if (index % 2 == 0) {
            current = node_hash(current, sibling);
        } else {
            current = node_hash(sibling, current);
        }
        index /= 2;
    }

    // Leftover index bits mean the proof is shorter than the tree
    if (index != 0) {
        return false;
    }

    return LedgerCrypto::constant_time_compare(current, root);
}

} // namespace govledger
