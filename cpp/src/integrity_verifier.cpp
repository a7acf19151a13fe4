/**
 * @file integrity_verifier.cpp
 * @brief Implementation of the offline integrity verifier
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "govledger/integrity_verifier.hpp"
#include "govledger/errors.hpp"
#include "govledger/governance_record.hpp"
#include "govledger/ledger_store.hpp"
#include "govledger/merkle.hpp"
#include "govledger/utilities.hpp"

#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace govledger {

std::string tamper_kind_to_string(TamperKind kind) {
    switch (kind) {
        case TamperKind::NONE: return "none";
        case TamperKind::CHAIN_HASH_MISMATCH: return "chain_hash_mismatch";
        case TamperKind::SEQUENCE_GAP: return "sequence_gap";
        case TamperKind::SEQUENCE_MISMATCH: return "sequence_mismatch";
        case TamperKind::UNDECODABLE_ENTRY: return "undecodable_entry";
        case TamperKind::MERKLE_ROOT_MISMATCH: return "merkle_root_mismatch";
        case TamperKind::SIGNATURE_INVALID: return "signature_invalid";
        default: return "unknown";
    }
}

// ============================================================================
// IntegrityReport
// ============================================================================

std::string IntegrityReport::to_text() const {
    std::ostringstream oss;

    oss << "================================================================\n";
    oss << "              GovLedger Integrity Certification\n";
    oss << "================================================================\n";
    oss << std::left;
    oss << std::setw(22) << "Database:" << database_path << "\n";
    oss << std::setw(22) << "File SHA-256:" << database_fingerprint << "\n";
    oss << std::setw(22) << "Verified at:" << utilities::format_timestamp(verified_at) << "\n";
    oss << "----------------------------------------------------------------\n";
    oss << std::setw(22) << "Entries checked:" << entries_checked << "\n";
    oss << std::setw(22) << "Batches checked:" << batches_checked << "\n";
    oss << std::setw(22) << "Signatures checked:" << signatures_checked << "\n";
    oss << std::setw(22) << "Chain head:" << (last_chain_hash.empty() ? "(empty ledger)" : last_chain_hash) << "\n";
    oss << "----------------------------------------------------------------\n";

    if (intact) {
        oss << "RESULT: INTACT\n";
        oss << "Every recomputed hash matches its stored value.\n";
    } else {
        oss << "RESULT: TAMPERED\n";
        oss << std::setw(22) << "First mismatch:" << "#" << first_mismatch.value_or(0)
            << " (" << tamper_kind_to_string(first_kind) << ")\n";
        oss << std::setw(22) << "Divergent entries:" << divergent_entries << "\n";
        oss << "Findings:\n";
        for (const auto& finding : findings) {
            oss << "  #" << finding.sequence_index;
            if (finding.batch_index) {
                oss << " [batch " << *finding.batch_index << "]";
            }
            oss << " " << tamper_kind_to_string(finding.kind) << ": " << finding.detail << "\n";
        }
        oss << "No correction attempted. Escalate to a ledger custodian.\n";
    }

    oss << "================================================================\n";
    return oss.str();
}

std::string IntegrityReport::to_json() const {
    json j;
    j["database_path"] = database_path;
    j["database_fingerprint"] = database_fingerprint;
    j["verified_at"] = verified_at;
    j["intact"] = intact;
    j["entries_checked"] = entries_checked;
    j["batches_checked"] = batches_checked;
    j["signatures_checked"] = signatures_checked;
    j["divergent_entries"] = divergent_entries;
    j["first_mismatch"] = first_mismatch ? json(*first_mismatch) : json(nullptr);
    j["first_kind"] = tamper_kind_to_string(first_kind);
    j["last_chain_hash"] = last_chain_hash;

    json items = json::array();
    for (const auto& finding : findings) {
        json f;
        f["kind"] = tamper_kind_to_string(finding.kind);
        f["sequence_index"] = finding.sequence_index;
        f["batch_index"] = finding.batch_index ? json(*finding.batch_index) : json(nullptr);
        f["detail"] = finding.detail;
        items.push_back(f);
    }
    j["findings"] = items;

    return j.dump(2);
}

void IntegrityReport::require_intact() const {
    if (intact) {
        return;
    }
    throw IntegrityError("Ledger " + database_path + " failed verification at #"
                         + std::to_string(first_mismatch.value_or(0)) + " ("
                         + tamper_kind_to_string(first_kind) + ")",
                         first_mismatch.value_or(0));
}

// ============================================================================
// IntegrityVerifier
// ============================================================================

IntegrityVerifier::IntegrityVerifier(const std::string& database_path, std::optional<uint64_t> batch_size)
    : storage_(database_path, true)
    , batch_size_(DEFAULT_BATCH_SIZE)
    , keys_(nullptr)
{
    std::optional<uint64_t> stored;
    if (auto value = storage_.load_meta("batch_size")) {
        try {
            stored = std::stoull(*value);
        } catch (const std::exception&) {
            throw InputError("Stored batch size '" + *value + "' is not a number");
        }
    }

    if (batch_size && stored && *batch_size != *stored) {
        throw InputError("Ledger was sealed with batch size " + std::to_string(*stored)
                         + ", not " + std::to_string(*batch_size));
    }

    if (batch_size) {
        batch_size_ = *batch_size;
    } else if (stored) {
        batch_size_ = *stored;
    }

    if (batch_size_ < 2) {
        throw InputError("batch_size must be at least 2");
    }
    if (!LedgerCrypto::initialize()) {
        throw PersistenceError("Failed to initialize libsodium");
    }
}

void IntegrityVerifier::set_key_directory(const KeyDirectory* keys) {
    keys_ = keys;
}

IntegrityReport IntegrityVerifier::new_report() const {
    IntegrityReport report;
    report.database_path = storage_.database_path();
    report.database_fingerprint = utilities::calculate_file_hash(storage_.database_path()).value_or("");
    report.verified_at = utilities::current_unix_seconds();
    return report;
}

void IntegrityVerifier::add_finding(
    IntegrityReport& report,
    TamperKind kind,
    uint64_t sequence_index,
    const std::string& detail,
    std::optional<uint64_t> batch_index
) {
    IntegrityFinding finding;
    finding.kind = kind;
    finding.sequence_index = sequence_index;
    finding.batch_index = batch_index;
    finding.detail = detail;
    report.findings.push_back(finding);

    report.intact = false;

    // A batch root only localizes tampering to its window; entry-level
    // findings take precedence as the tamper point
    bool batch_level = kind == TamperKind::MERKLE_ROOT_MISMATCH;
    if (!report.first_mismatch || (!batch_level && sequence_index < *report.first_mismatch)) {
        report.first_mismatch = sequence_index;
        report.first_kind = kind;
    }
}

std::vector<StoredEntry> IntegrityVerifier::load_or_fail(IntegrityReport& report) const {
    auto entries = storage_.load_entries();
    if (!entries) {
        // Unreadable entry table is reported as tampering at the origin
        add_finding(report, TamperKind::UNDECODABLE_ENTRY, 0,
                    "Entry table unreadable: " + storage_.last_error());
        return {};
    }
    return *entries;
}

void IntegrityVerifier::check_chain(const std::vector<StoredEntry>& entries, IntegrityReport& report) const {
    Hash256 recomputed = LedgerCrypto::zero_hash();
    std::string previous_body;
    uint64_t expected = 0;
    bool chain_diverged = false;

    for (const auto& row : entries) {
        report.entries_checked++;

        if (row.sequence_index != expected) {
            add_finding(report, TamperKind::SEQUENCE_GAP, expected,
                        "Expected #" + std::to_string(expected) + ", found #"
                        + std::to_string(row.sequence_index));
            expected = row.sequence_index;
        }

        auto entry = LedgerEntry::deserialize(row.body);
        if (!entry) {
            add_finding(report, TamperKind::UNDECODABLE_ENTRY, row.sequence_index,
                        "Entry body is not a valid ledger entry");
        } else if (entry->sequence_index != row.sequence_index) {
            add_finding(report, TamperKind::SEQUENCE_MISMATCH, row.sequence_index,
                        "Body carries sequence index " + std::to_string(entry->sequence_index));
        }

        recomputed = LedgerStore::compute_chain_hash(row.body, previous_body, recomputed);
        previous_body = row.body;

        auto stored = LedgerCrypto::hex_to_hash(row.chain_hash);
        if (!stored) {
            report.divergent_entries++;
            add_finding(report, TamperKind::UNDECODABLE_ENTRY, row.sequence_index,
                        "Stored chain hash is not 32 hex-encoded bytes");
        } else if (!LedgerCrypto::constant_time_compare(recomputed, *stored)) {
            report.divergent_entries++;
            // Later entries diverge as a consequence; report the first only
            if (!chain_diverged) {
                add_finding(report, TamperKind::CHAIN_HASH_MISMATCH, row.sequence_index,
                            "Recomputed " + LedgerCrypto::hash_to_hex(recomputed)
                            + ", stored " + row.chain_hash);
            }
            chain_diverged = true;
        }

        if (keys_ && entry) {
            report.signatures_checked++;
            Hash256 digest = signing_digest(entry->record);
            bool signature_ok = keys_->verify(entry->record.signer_id,
                                              std::vector<uint8_t>(digest.begin(), digest.end()),
                                              entry->record.signature);
            if (!signature_ok || compute_record_id(entry->record) != entry->record.id) {
                add_finding(report, TamperKind::SIGNATURE_INVALID, row.sequence_index,
                            "Record " + entry->record.id + " does not verify for signer "
                            + entry->record.signer_id);
            }
        }

        report.last_chain_hash = row.chain_hash;
        expected++;
    }
}

void IntegrityVerifier::check_batches(const std::vector<StoredEntry>& entries, IntegrityReport& report) const {
    std::vector<Hash256> leaves;
    leaves.reserve(entries.size());
    for (const auto& row : entries) {
        leaves.push_back(MerkleTree::leaf_hash(row.body));
    }

    auto batches = storage_.load_batches();
    std::vector<bool> seen(leaves.size() / batch_size_, false);

    for (const auto& batch : batches) {
        report.batches_checked++;

        uint64_t end = batch.first_sequence + batch.entry_count;
        if (batch.entry_count == 0 || end > leaves.size()) {
            add_finding(report, TamperKind::MERKLE_ROOT_MISMATCH, batch.first_sequence,
                        "Batch covers entries missing from the log", batch.batch_index);
            continue;
        }

        std::vector<Hash256> window(leaves.begin() + static_cast<std::ptrdiff_t>(batch.first_sequence),
                                    leaves.begin() + static_cast<std::ptrdiff_t>(end));
        Hash256 root = MerkleTree::compute_root(window);

        if (!LedgerCrypto::constant_time_compare(root, batch.root)) {
            add_finding(report, TamperKind::MERKLE_ROOT_MISMATCH, batch.first_sequence,
                        "Recomputed root " + LedgerCrypto::hash_to_hex(root)
                        + ", stored " + LedgerCrypto::hash_to_hex(batch.root), batch.batch_index);
        }

        if (batch.batch_index < seen.size()) {
            seen[batch.batch_index] = true;
        }
    }

    for (size_t index = 0; index < seen.size(); ++index) {
        if (!seen[index]) {
            add_finding(report, TamperKind::MERKLE_ROOT_MISMATCH, index * batch_size_,
                        "Sealed batch is missing from storage", index);
        }
    }
}

IntegrityReport IntegrityVerifier::verify_chain() const {
    IntegrityReport report = new_report();
    auto entries = load_or_fail(report);
    check_chain(entries, report);

    utilities::log_info("IntegrityVerifier: Chain check of " + report.database_path + ": "
                        + (report.intact ? "intact" : "tampered at #"
                           + std::to_string(report.first_mismatch.value_or(0))));
    return report;
}

IntegrityReport IntegrityVerifier::verify_batches() const {
    IntegrityReport report = new_report();
    auto entries = load_or_fail(report);
    report.entries_checked = entries.size();
    check_batches(entries, report);

    utilities::log_info("IntegrityVerifier: Batch check of " + report.database_path + ": "
                        + std::to_string(report.batches_checked) + " batches, "
                        + (report.intact ? "intact" : "mismatch"));
    return report;
}

IntegrityReport IntegrityVerifier::verify_all() const {
    IntegrityReport report = new_report();
    auto entries = load_or_fail(report);
    check_chain(entries, report);
    check_batches(entries, report);

    if (!report.intact) {
        utilities::log_error("IntegrityVerifier: " + report.database_path + " tampered at #"
                             + std::to_string(report.first_mismatch.value_or(0)) + " ("
                             + tamper_kind_to_string(report.first_kind) + ")");
    } else {
        utilities::log_info("IntegrityVerifier: " + report.database_path + " intact ("
                            + std::to_string(report.entries_checked) + " entries)");
    }
    return report;
}

} // namespace govledger
