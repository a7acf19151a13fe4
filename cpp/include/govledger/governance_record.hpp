/**
 * @file governance_record.hpp
 * @brief Governance tuple and ledger entry definitions and serialization
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A GovernanceTuple is the signed, reproducible record of one computation or
 * decision. A LedgerEntry wraps a committed tuple with its sequence index,
 * chain hash and (when human review happened) the approval decision.
 */

#pragma once

#include "govledger/ledger_crypto.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace govledger {

/**
 * @brief Severity classification; ordered, compared against the oversight threshold
 */
enum class Criticality : uint8_t {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
    CRITICAL = 3
};

std::string criticality_to_string(Criticality level);

/**
 * @brief Parse criticality name, case-insensitive ("low", "HIGH", ...)
 * @return Criticality or std::nullopt if unknown
 */
std::optional<Criticality> string_to_criticality(const std::string& name);

/**
 * @brief Human decision attached to an escalated record
 */
struct ApprovalDecision {
    std::string ticket_id;          ///< Approval channel ticket
    std::string approver;           ///< Who approved
    std::string note;               ///< Free-text justification
    uint64_t decided_at = 0;        ///< Unix timestamp the gate observed the decision
};

/**
 * @brief Signed governance record
 *
 * Immutable once built: every field is covered by the record id, and
 * seed/input_hash/solver_identity/result_hash/lifecycle_phase/timestamp are
 * covered by the signature.
 */
struct GovernanceTuple {
    std::string id;                         ///< Content-derived record id (32 hex chars)
    uint64_t seed = 0;                      ///< First 64 bits of SHA-256(inputs || timestamp)
    Hash256 input_hash{};                   ///< SHA-256(canonical(inputs))
    std::string solver_identity;            ///< Solver that produced the results
    std::string ranked_results;             ///< Canonical JSON array, best first
    Hash256 result_hash{};                  ///< SHA-256(canonical(ranked_results))
    std::string lifecycle_phase;            ///< Phase the record was created in
    Criticality criticality_level = Criticality::LOW;
    uint64_t timestamp = 0;                 ///< Unix seconds
    std::vector<uint8_t> signature;         ///< Ed25519 over signing_digest()

    std::string signer_id;                  ///< Claimed signer
    std::string category;                   ///< Filter dimension (e.g. "propulsion")
    std::string record_type;                ///< "computation", "decision", "design_state", ...
    std::string upstream_ref;               ///< The one upstream record this authorizes

    /**
     * @brief Serialize record to canonical JSON
     */
    std::string to_json() const;

    /**
     * @brief Deserialize record from JSON
     * @return GovernanceTuple or std::nullopt if invalid
     */
    static std::optional<GovernanceTuple> from_json(const std::string& json);

    /**
     * @brief One-line description used for approval requests and logs
     */
    std::string summary() const;
};

/**
 * @brief Digest the signer signs
 *
 * SHA-256(seed || input_hash || solver_identity || result_hash ||
 * lifecycle_phase || timestamp); integers are 8-byte big-endian, strings
 * carry a 4-byte big-endian length prefix.
 */
Hash256 signing_digest(const GovernanceTuple& record);

/**
 * @brief Content-derived record id over the signing digest and the
 *        unsigned provenance fields
 */
std::string compute_record_id(const GovernanceTuple& record);

/**
 * @brief Committed ledger entry
 */
struct LedgerEntry {
    uint64_t sequence_index = 0;                        ///< Monotonic, gapless
    GovernanceTuple record;
    std::optional<ApprovalDecision> approval_decision;  ///< Present when human-approved
    Hash256 chain_hash{};                               ///< Running accumulator

    /**
     * @brief Canonical bytes hashed into the chain and Merkle leaves
     *
     * Covers sequence index, record and approval; excludes chain_hash.
     */
    std::string serialize() const;

    /**
     * @brief Parse canonical bytes produced by serialize()
     * @return Entry with zero chain_hash, or std::nullopt if invalid
     */
    static std::optional<LedgerEntry> deserialize(const std::string& body);

    /**
     * @brief Export form: serialized body plus hex chain hash
     */
    std::string to_json() const;
};

} // namespace govledger
