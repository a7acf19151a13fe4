/**
 * @file record_builder.cpp
 * @brief Implementation of the deterministic record builder
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "govledger/record_builder.hpp"
#include "govledger/canonical.hpp"
#include "govledger/errors.hpp"
#include "govledger/ledger_config.hpp"
#include "govledger/utilities.hpp"

#include <vector>

namespace govledger {

RecordBuilder::RecordBuilder(const Signer& signer)
    : signer_(signer)
{
}

GovernanceTuple RecordBuilder::build_record(const RecordRequest& request) const {
    return build_record(request, utilities::current_unix_seconds());
}

GovernanceTuple RecordBuilder::build_record(const RecordRequest& request, uint64_t timestamp) const {
    // Validate request shape
    if (!request.inputs.is_object()) {
        throw InputError("Record inputs must be a JSON object");
    }
    if (!request.ranked_results.is_array()) {
        throw InputError("Ranked results must be a JSON array");
    }
    if (!validate_identifier(request.solver_identity)) {
        throw InputError("Invalid solver identity: '" + request.solver_identity + "'");
    }
    if (!validate_identifier(request.lifecycle_phase)) {
        throw InputError("Invalid lifecycle phase: '" + request.lifecycle_phase + "'");
    }
    if (!validate_identifier(request.category)) {
        throw InputError("Invalid category: '" + request.category + "'");
    }
    if (!validate_identifier(request.record_type)) {
        throw InputError("Invalid record type: '" + request.record_type + "'");
    }
    if (!validate_reference(request.upstream_ref)) {
        throw InputError("Record must reference exactly one upstream record");
    }

    std::string signer_id = signer_.signer_id();
    if (!validate_identifier(signer_id)) {
        throw SigningError("Signer has invalid id: '" + signer_id + "'");
    }

    std::string canonical_inputs = canonical::canonicalize(request.inputs);
    std::string canonical_results = canonical::canonicalize(request.ranked_results);

    GovernanceTuple record;
    record.seed = derive_seed(canonical_inputs, timestamp);
    record.input_hash = LedgerCrypto::sha256(canonical_inputs);
    record.solver_identity = request.solver_identity;
    record.ranked_results = canonical_results;
    record.result_hash = hash_results(canonical_results);
    record.lifecycle_phase = request.lifecycle_phase;
    record.criticality_level = request.criticality_level;
    record.timestamp = timestamp;
    record.signer_id = signer_id;
    record.category = request.category;
    record.record_type = request.record_type;
    record.upstream_ref = request.upstream_ref;

    Hash256 digest = signing_digest(record);
    record.signature = signer_.sign(std::vector<uint8_t>(digest.begin(), digest.end()));
    if (record.signature.empty()) {
        throw SigningError("Signer " + signer_id + " returned an empty signature");
    }

    record.id = compute_record_id(record);

    utilities::log_debug("RecordBuilder: Built " + record.summary());

    return record;
}

uint64_t RecordBuilder::derive_seed(const std::string& canonical_inputs, uint64_t timestamp) {
    std::vector<uint8_t> material(canonical_inputs.begin(), canonical_inputs.end());
    for (int shift = 56; shift >= 0; shift -= 8) {
        material.push_back(static_cast<uint8_t>((timestamp >> shift) & 0xFF));
    }

    Hash256 hash = LedgerCrypto::sha256(material);

    uint64_t seed = 0;
    for (size_t i = 0; i < 8; ++i) {
        seed = (seed << 8) | hash[i];
    }
    return seed;
}

Hash256 RecordBuilder::hash_results(const std::string& canonical_results) {
    return LedgerCrypto::sha256(canonical_results);
}

} // namespace govledger
