/**
 * @file integrity_verifier.hpp
 * @brief Offline recomputation of chain hashes and Merkle batch roots
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Opens a ledger database read-only, recomputes every chain hash from the
 * stored entry bodies and every sealed batch root, and reports the first
 * sequence index at which recomputation diverges. Nothing is ever repaired.
 */

#pragma once

#include "govledger/ledger_config.hpp"
#include "govledger/ledger_storage.hpp"
#include "govledger/signer.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace govledger {

enum class TamperKind {
    NONE,
    CHAIN_HASH_MISMATCH,        ///< Stored chain hash differs from recomputation
    SEQUENCE_GAP,               ///< Missing or inserted sequence index
    SEQUENCE_MISMATCH,          ///< Body carries a different index than its row
    UNDECODABLE_ENTRY,          ///< Body or stored hash cannot be parsed
    MERKLE_ROOT_MISMATCH,       ///< Sealed batch root differs or is missing
    SIGNATURE_INVALID           ///< Record signature or id does not verify
};

std::string tamper_kind_to_string(TamperKind kind);

struct IntegrityFinding {
    TamperKind kind = TamperKind::NONE;
    uint64_t sequence_index = 0;
    std::optional<uint64_t> batch_index;
    std::string detail;
};

/**
 * @brief Result of an integrity run
 */
struct IntegrityReport {
    std::string database_path;
    std::string database_fingerprint;           ///< SHA-256 of the database file
    uint64_t verified_at = 0;

    bool intact = true;
    uint64_t entries_checked = 0;
    uint64_t batches_checked = 0;
    uint64_t signatures_checked = 0;
    uint64_t divergent_entries = 0;             ///< Entries whose stored hash differs

    std::optional<uint64_t> first_mismatch;     ///< Tamper point
    TamperKind first_kind = TamperKind::NONE;
    std::string last_chain_hash;                ///< Head of the stored chain, for external anchoring

    std::vector<IntegrityFinding> findings;

    /**
     * @brief Human-readable certification report
     */
    std::string to_text() const;

    std::string to_json() const;

    /**
     * @brief Throw unless intact
     * @throws IntegrityError carrying first_mismatch
     */
    void require_intact() const;
};

/**
 * @brief IntegrityVerifier - Read-only ledger audit
 */
class IntegrityVerifier {
public:
    /**
     * @brief Open a ledger database read-only
     * @param database_path Path to SQLite database file
     * @param batch_size Merkle batch size; defaults to the size stored in the
     *        ledger, or DEFAULT_BATCH_SIZE for a ledger that predates it
     * @throws PersistenceError if the database cannot be opened
     * @throws InputError if batch_size contradicts the stored size
     */
    explicit IntegrityVerifier(const std::string& database_path,
                               std::optional<uint64_t> batch_size = std::nullopt);

    uint64_t batch_size() const { return batch_size_; }

    /**
     * @brief Also verify record signatures against these keys (not owned)
     */
    void set_key_directory(const KeyDirectory* keys);

    /**
     * @brief Recompute chain[0..n) from stored bodies
     */
    IntegrityReport verify_chain() const;

    /**
     * @brief Recompute every sealed batch root
     */
    IntegrityReport verify_batches() const;

    /**
     * @brief Chain, batches and (if keys are set) signatures
     */
    IntegrityReport verify_all() const;

private:
    LedgerStorage storage_;
    uint64_t batch_size_;
    const KeyDirectory* keys_;

    IntegrityReport new_report() const;

    void check_chain(const std::vector<StoredEntry>& entries, IntegrityReport& report) const;

    void check_batches(const std::vector<StoredEntry>& entries, IntegrityReport& report) const;

    static void add_finding(IntegrityReport& report, TamperKind kind, uint64_t sequence_index,
                            const std::string& detail,
                            std::optional<uint64_t> batch_index = std::nullopt);

    std::vector<StoredEntry> load_or_fail(IntegrityReport& report) const;
};

} // namespace govledger
