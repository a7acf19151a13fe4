/**
 * @file record_builder.hpp
 * @brief Deterministic construction of signed governance records
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Turns (inputs, ranked results, metadata) into a signed, reproducible
 * GovernanceTuple. Identical inputs and timestamp always yield the same
 * seed and input hash.
 */

#pragma once

#include "govledger/governance_record.hpp"
#include "govledger/signer.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace govledger {

/**
 * @brief Everything the builder needs apart from the clock and the key
 */
struct RecordRequest {
    nlohmann::json inputs = nlohmann::json::object();        ///< Solver input parameters (object)
    nlohmann::json ranked_results = nlohmann::json::array(); ///< Result candidates, best first (array)
    std::string solver_identity;
    std::string lifecycle_phase;
    Criticality criticality_level = Criticality::LOW;
    std::string category = "general";
    std::string record_type = "computation";
    std::string upstream_ref;                                ///< Upstream record this authorizes
};

/**
 * @brief RecordBuilder - Builds signed governance tuples
 *
 * Has no side effects beyond reading the clock and using the signer.
 * Thread-safe if the signer is.
 */
class RecordBuilder {
public:
    /**
     * @brief Construct builder around a signer (not owned)
     */
    explicit RecordBuilder(const Signer& signer);

    /**
     * @brief Build a record stamped with the current time
     * @throws InputError if the request cannot be canonicalized or is incomplete
     * @throws SigningError if the signer rejects the payload
     */
    GovernanceTuple build_record(const RecordRequest& request) const;

    /**
     * @brief Build a record with an explicit timestamp (unix seconds)
     */
    GovernanceTuple build_record(const RecordRequest& request, uint64_t timestamp) const;

    /**
     * @brief First 64 bits (big-endian) of SHA-256(canonical_inputs || timestamp)
     *
     * The timestamp is appended as 8 big-endian bytes.
     */
    static uint64_t derive_seed(const std::string& canonical_inputs, uint64_t timestamp);

    /**
     * @brief Recompute result_hash from a stored ranked_results string
     */
    static Hash256 hash_results(const std::string& canonical_results);

private:
    const Signer& signer_;
};

} // namespace govledger
