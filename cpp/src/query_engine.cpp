/**
 * @file query_engine.cpp
 * @brief Implementation of the ledger query engine
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "govledger/query_engine.hpp"
#include "govledger/canonical.hpp"
#include "govledger/utilities.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <iterator>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace govledger {

namespace {

std::vector<uint64_t> intersect(const std::vector<uint64_t>& a, const std::vector<uint64_t>& b) {
    std::vector<uint64_t> result;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(result));
    return result;
}

size_t merkle_proof_length(uint64_t batch_size) {
    size_t length = 0;
    for (uint64_t width = 1; width < batch_size; width *= 2) {
        length++;
    }
    return length;
}

QueryPage make_status(QueryStatus status, const std::string& message, uint64_t snapshot_size) {
    QueryPage page;
    page.status = status;
    page.message = message;
    page.snapshot_size = snapshot_size;
    return page;
}

json artifact_to_json(const VerificationArtifact& artifact) {
    json j;

    if (artifact.kind == ProofKind::MERKLE_BATCH && artifact.merkle_proof && artifact.batch) {
        j["kind"] = "merkle_batch";
        j["batch_index"] = artifact.batch->batch_index;
        j["first_sequence"] = artifact.batch->first_sequence;
        j["root"] = LedgerCrypto::hash_to_hex(artifact.batch->root);
        j["leaf_index"] = artifact.merkle_proof->leaf_index;

        json siblings = json::array();
        for (const auto& sibling : artifact.merkle_proof->siblings) {
            siblings.push_back(LedgerCrypto::hash_to_hex(sibling));
        }
        j["siblings"] = siblings;

    } else if (artifact.chain_segment) {
        j["kind"] = "chain_segment";
        j["anchor_index"] = artifact.chain_segment->anchor_index;
        j["anchor_previous_chain_hash"] =
            LedgerCrypto::hash_to_hex(artifact.chain_segment->anchor_previous_chain_hash);
        j["target_index"] = artifact.chain_segment->target_index;
        j["target_chain_hash"] = LedgerCrypto::hash_to_hex(artifact.chain_segment->target_chain_hash);
    }

    return j;
}

} // namespace

std::string query_status_to_string(QueryStatus status) {
    switch (status) {
        case QueryStatus::OK: return "Ok";
        case QueryStatus::NOT_FOUND: return "NotFound";
        case QueryStatus::INVALID_QUERY: return "InvalidQuery";
        case QueryStatus::INTEGRITY_PROOF_UNAVAILABLE: return "IntegrityProofUnavailable";
        default: return "Unknown";
    }
}

// ============================================================================
// QueryFilter / QueryPage
// ============================================================================

std::string QueryFilter::fingerprint() const {
    json j;
    j["category"] = category ? json(*category) : json(nullptr);
    j["lifecycle_phase"] = lifecycle_phase ? json(*lifecycle_phase) : json(nullptr);
    j["record_type"] = record_type ? json(*record_type) : json(nullptr);
    j["criticality"] = criticality ? json(criticality_to_string(*criticality)) : json(nullptr);
    j["time_from"] = time_from ? json(*time_from) : json(nullptr);
    j["time_to"] = time_to ? json(*time_to) : json(nullptr);
    j["page_size"] = page_size;
    j["require_merkle_proof"] = require_merkle_proof;

    Hash256 digest = LedgerCrypto::sha256(canonical::canonicalize(j));
    return LedgerCrypto::hash_to_hex(digest).substr(0, 16);
}

std::string QueryPage::to_json() const {
    json j;
    j["status"] = query_status_to_string(status);
    j["message"] = message;
    j["snapshot_size"] = snapshot_size;
    j["next_page_token"] = next_page_token;

    json items = json::array();
    for (const auto& result : entries) {
        json item;
        item["entry"] = json::parse(result.entry.to_json());
        item["proof"] = artifact_to_json(result.artifact);
        items.push_back(item);
    }
    j["entries"] = items;

    return canonical::canonicalize(j);
}

// ============================================================================
// QueryEngine
// ============================================================================

QueryEngine::QueryEngine(const LedgerStore& store)
    : store_(store)
{
}

QueryPage QueryEngine::query(const QueryFilter& filter) const {
    const LedgerConfig& config = store_.config();

    // Validate filter
    if (filter.time_from && filter.time_to && *filter.time_from > *filter.time_to) {
        return make_status(QueryStatus::INVALID_QUERY, "time_from is after time_to", 0);
    }
    if (filter.page_size > config.max_page_size) {
        return make_status(QueryStatus::INVALID_QUERY,
                           "page_size exceeds " + std::to_string(config.max_page_size), 0);
    }
    if ((filter.category && filter.category->empty())
        || (filter.lifecycle_phase && filter.lifecycle_phase->empty())
        || (filter.record_type && filter.record_type->empty())) {
        return make_status(QueryStatus::INVALID_QUERY, "Empty filter value", 0);
    }

    size_t page_size = filter.page_size == 0 ? config.default_page_size : filter.page_size;
    std::string fingerprint = filter.fingerprint();

    // Fix the snapshot
    uint64_t snapshot_size = store_.size();
    uint64_t start_sequence = 0;

    if (!filter.page_token.empty()) {
        std::string token_fingerprint;
        if (!decode_token(filter.page_token, snapshot_size, start_sequence, token_fingerprint)) {
            return make_status(QueryStatus::INVALID_QUERY, "Malformed page token", 0);
        }
        if (token_fingerprint != fingerprint) {
            return make_status(QueryStatus::INVALID_QUERY, "Page token belongs to a different filter", 0);
        }
        if (snapshot_size > store_.size() || start_sequence >= snapshot_size) {
            return make_status(QueryStatus::INVALID_QUERY, "Page token is out of range", 0);
        }
    }

    // Resolve candidates through the indices
    std::optional<std::vector<uint64_t>> candidates;
    auto narrow = [&candidates](std::vector<uint64_t> matches) {
        candidates = candidates ? intersect(*candidates, matches) : std::move(matches);
    };

    if (filter.category) {
        narrow(store_.lookup(IndexDimension::CATEGORY, *filter.category));
    }
    if (filter.lifecycle_phase) {
        narrow(store_.lookup(IndexDimension::LIFECYCLE_PHASE, *filter.lifecycle_phase));
    }
    if (filter.record_type) {
        narrow(store_.lookup(IndexDimension::RECORD_TYPE, *filter.record_type));
    }
    if (filter.criticality) {
        narrow(store_.lookup(IndexDimension::CRITICALITY, criticality_to_string(*filter.criticality)));
    }
    if (filter.time_from || filter.time_to) {
        narrow(store_.lookup_time_range(filter.time_from.value_or(0),
                                        filter.time_to.value_or(std::numeric_limits<uint64_t>::max())));
    }

    std::vector<uint64_t> matches;
    if (candidates) {
        for (uint64_t seq : *candidates) {
            if (seq >= start_sequence && seq < snapshot_size) {
                matches.push_back(seq);
            }
        }
    } else {
        for (uint64_t seq = start_sequence; seq < snapshot_size; ++seq) {
            matches.push_back(seq);
        }
    }

    if (matches.empty()) {
        return make_status(QueryStatus::NOT_FOUND, "No entries match the filter", snapshot_size);
    }

    QueryPage page;
    page.status = QueryStatus::OK;
    page.snapshot_size = snapshot_size;

    size_t count = std::min(page_size, matches.size());
    for (size_t i = 0; i < count; ++i) {
        uint64_t seq = matches[i];

        auto entry = store_.read(seq);
        auto artifact = build_artifact(seq, snapshot_size, filter.require_merkle_proof);

        if (!artifact) {
            return make_status(QueryStatus::INTEGRITY_PROOF_UNAVAILABLE,
                               "Entry #" + std::to_string(seq) + " is not in a sealed batch",
                               snapshot_size);
        }

        QueryResultEntry result;
        result.entry = *entry;
        result.artifact = *artifact;
        page.entries.push_back(std::move(result));
    }

    if (matches.size() > count) {
        page.next_page_token = encode_token(snapshot_size, matches[count], fingerprint);
    }

    utilities::log_debug("QueryEngine: Returned " + std::to_string(page.entries.size()) + " of "
                         + std::to_string(matches.size()) + " remaining matches at snapshot "
                         + std::to_string(snapshot_size));
    return page;
}

QueryPage QueryEngine::get(uint64_t sequence_index, bool require_merkle_proof) const {
    uint64_t snapshot_size = store_.size();

    auto entry = store_.read(sequence_index);
    if (!entry || sequence_index >= snapshot_size) {
        return make_status(QueryStatus::NOT_FOUND,
                           "No entry #" + std::to_string(sequence_index), snapshot_size);
    }

    auto artifact = build_artifact(sequence_index, snapshot_size, require_merkle_proof);
    if (!artifact) {
        return make_status(QueryStatus::INTEGRITY_PROOF_UNAVAILABLE,
                           "Entry #" + std::to_string(sequence_index) + " is not in a sealed batch",
                           snapshot_size);
    }

    QueryPage page;
    page.status = QueryStatus::OK;
    page.snapshot_size = snapshot_size;

    QueryResultEntry result;
    result.entry = *entry;
    result.artifact = *artifact;
    page.entries.push_back(std::move(result));
    return page;
}

std::optional<VerificationArtifact> QueryEngine::build_artifact(
    uint64_t sequence_index,
    uint64_t snapshot_size,
    bool require_merkle_proof
) const {
    uint64_t n = store_.config().batch_size;
    uint64_t anchor = (sequence_index / n) * n;
    bool sealed = anchor + n <= snapshot_size;

    size_t chain_cost = static_cast<size_t>(sequence_index - anchor + 1);
    bool use_merkle = sealed && (require_merkle_proof || merkle_proof_length(n) < chain_cost);

    VerificationArtifact artifact;

    if (use_merkle) {
        auto batch = store_.batch_for(sequence_index);
        auto proof = store_.merkle_proof(sequence_index);
        if (!batch || !proof) {
            return std::nullopt;
        }
        artifact.kind = ProofKind::MERKLE_BATCH;
        artifact.batch = *batch;
        artifact.merkle_proof = *proof;
        return artifact;
    }

    if (require_merkle_proof) {
        return std::nullopt;
    }

    ChainSegmentHint hint;
    hint.anchor_index = anchor;
    hint.anchor_previous_chain_hash = anchor == 0
        ? LedgerCrypto::zero_hash()
        : store_.chain_hash_at(anchor - 1).value_or(LedgerCrypto::zero_hash());
    hint.target_index = sequence_index;
    hint.target_chain_hash = store_.chain_hash_at(sequence_index).value_or(LedgerCrypto::zero_hash());

    artifact.kind = ProofKind::CHAIN_SEGMENT;
    artifact.chain_segment = hint;
    return artifact;
}

bool QueryEngine::verify_merkle(
    const std::string& body,
    const MerkleProof& proof,
    const Hash256& root
) {
    return MerkleTree::verify_proof(MerkleTree::leaf_hash(body), proof.leaf_index, proof.siblings, root);
}

bool QueryEngine::verify_artifact(const QueryResultEntry& result) const {
    const LedgerEntry& entry = result.entry;
    const VerificationArtifact& artifact = result.artifact;
    std::string body = entry.serialize();

    if (artifact.kind == ProofKind::MERKLE_BATCH) {
        if (!artifact.merkle_proof || !artifact.batch) {
            return false;
        }

        auto stored_batch = store_.batch_for(entry.sequence_index);
        if (!stored_batch
            || stored_batch->batch_index != artifact.batch->batch_index
            || !LedgerCrypto::constant_time_compare(stored_batch->root, artifact.batch->root)
            || artifact.batch->first_sequence + artifact.merkle_proof->leaf_index != entry.sequence_index) {
            return false;
        }

        return verify_merkle(body, *artifact.merkle_proof, artifact.batch->root);
    }

    if (!artifact.chain_segment) {
        return false;
    }

    const ChainSegmentHint& hint = *artifact.chain_segment;
    if (hint.target_index != entry.sequence_index || hint.anchor_index > hint.target_index) {
        return false;
    }

    Hash256 chain = hint.anchor_previous_chain_hash;
    std::string previous_body;
    if (hint.anchor_index > 0) {
        auto anchor_body = store_.body(hint.anchor_index - 1);
        if (!anchor_body) {
            return false;
        }
        previous_body = *anchor_body;
    }

    for (uint64_t seq = hint.anchor_index; seq <= hint.target_index; ++seq) {
        std::string current;
        if (seq == hint.target_index) {
            current = body;
        } else {
            auto stored = store_.body(seq);
            if (!stored) {
                return false;
            }
            current = *stored;
        }

        chain = LedgerStore::compute_chain_hash(current, previous_body, chain);
        previous_body = std::move(current);
    }

    return LedgerCrypto::constant_time_compare(chain, hint.target_chain_hash)
        && LedgerCrypto::constant_time_compare(chain, entry.chain_hash);
}

// ============================================================================
// Page Tokens
// ============================================================================

std::string QueryEngine::encode_token(
    uint64_t snapshot_size,
    uint64_t next_sequence,
    const std::string& fingerprint
) {
    std::string text = std::to_string(snapshot_size) + ":" + std::to_string(next_sequence)
                       + ":" + fingerprint;
    return LedgerCrypto::bytes_to_base64(std::vector<uint8_t>(text.begin(), text.end()));
}

bool QueryEngine::decode_token(
    const std::string& token,
    uint64_t& snapshot_size,
    uint64_t& next_sequence,
    std::string& fingerprint
) {
    auto bytes = LedgerCrypto::base64_to_bytes(token);
    if (!bytes) {
        return false;
    }

    std::string text(bytes->begin(), bytes->end());
    std::istringstream stream(text);
    std::string snapshot_part;
    std::string next_part;

    if (!std::getline(stream, snapshot_part, ':')
        || !std::getline(stream, next_part, ':')
        || !std::getline(stream, fingerprint)) {
        return false;
    }

    try {
        size_t consumed = 0;
        snapshot_size = std::stoull(snapshot_part, &consumed);
        if (consumed != snapshot_part.size()) {
            return false;
        }
        next_sequence = std::stoull(next_part, &consumed);
        if (consumed != next_part.size()) {
            return false;
        }
    } catch (const std::logic_error&) {
        return false;
    }

    return fingerprint.size() == 16;
}

} // namespace govledger
