/**
 * @file governance_record.cpp
 * @brief Implementation of governance record serialization
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "govledger/governance_record.hpp"
#include "govledger/utilities.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace govledger {

namespace {

void append_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void append_string(std::vector<uint8_t>& out, const std::string& value) {
    uint32_t length = static_cast<uint32_t>(value.size());
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((length >> shift) & 0xFF));
    }
    out.insert(out.end(), value.begin(), value.end());
}

json record_to_json(const GovernanceTuple& record) {
    json j;
    j["id"] = record.id;
    j["seed"] = record.seed;
    j["input_hash"] = LedgerCrypto::hash_to_hex(record.input_hash);
    j["solver_identity"] = record.solver_identity;
    j["ranked_results"] = record.ranked_results;
    j["result_hash"] = LedgerCrypto::hash_to_hex(record.result_hash);
    j["lifecycle_phase"] = record.lifecycle_phase;
    j["criticality_level"] = criticality_to_string(record.criticality_level);
    j["timestamp"] = record.timestamp;
    j["signature"] = LedgerCrypto::bytes_to_hex(record.signature);
    j["signer_id"] = record.signer_id;
    j["category"] = record.category;
    j["record_type"] = record.record_type;
    j["upstream_ref"] = record.upstream_ref;
    return j;
}

std::optional<GovernanceTuple> record_from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    GovernanceTuple record;
    record.id = j.at("id").get<std::string>();
    record.seed = j.at("seed").get<uint64_t>();
    record.solver_identity = j.at("solver_identity").get<std::string>();
    record.ranked_results = j.at("ranked_results").get<std::string>();
    record.lifecycle_phase = j.at("lifecycle_phase").get<std::string>();
    record.timestamp = j.at("timestamp").get<uint64_t>();
    record.signer_id = j.at("signer_id").get<std::string>();
    record.category = j.at("category").get<std::string>();
    record.record_type = j.at("record_type").get<std::string>();
    record.upstream_ref = j.at("upstream_ref").get<std::string>();

    auto input_hash = LedgerCrypto::hex_to_hash(j.at("input_hash").get<std::string>());
    auto result_hash = LedgerCrypto::hex_to_hash(j.at("result_hash").get<std::string>());
    auto signature = LedgerCrypto::hex_to_bytes(j.at("signature").get<std::string>());
    auto criticality = string_to_criticality(j.at("criticality_level").get<std::string>());

    if (!input_hash || !result_hash || !signature || !criticality) {
        return std::nullopt;
    }

    record.input_hash = *input_hash;
    record.result_hash = *result_hash;
    record.signature = *signature;
    record.criticality_level = *criticality;

    return record;
}

json approval_to_json(const ApprovalDecision& decision) {
    json j;
    j["ticket_id"] = decision.ticket_id;
    j["approver"] = decision.approver;
    j["note"] = decision.note;
    j["decided_at"] = decision.decided_at;
    return j;
}

ApprovalDecision approval_from_json(const json& j) {
    ApprovalDecision decision;
    decision.ticket_id = j.at("ticket_id").get<std::string>();
    decision.approver = j.at("approver").get<std::string>();
    decision.note = j.at("note").get<std::string>();
    decision.decided_at = j.at("decided_at").get<uint64_t>();
    return decision;
}

json entry_body_to_json(const LedgerEntry& entry) {
    json j;
    j["sequence_index"] = entry.sequence_index;
    j["record"] = record_to_json(entry.record);
    j["approval"] = entry.approval_decision
        ? approval_to_json(*entry.approval_decision)
        : json(nullptr);
    return j;
}

} // namespace

// ============================================================================
// Criticality
// ============================================================================

std::string criticality_to_string(Criticality level) {
    switch (level) {
        case Criticality::LOW: return "LOW";
        case Criticality::MEDIUM: return "MEDIUM";
        case Criticality::HIGH: return "HIGH";
        case Criticality::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::optional<Criticality> string_to_criticality(const std::string& name) {
    std::string lower = utilities::to_lowercase(name);
    if (lower == "low") return Criticality::LOW;
    if (lower == "medium") return Criticality::MEDIUM;
    if (lower == "high") return Criticality::HIGH;
    if (lower == "critical") return Criticality::CRITICAL;
    return std::nullopt;
}

// ============================================================================
// GovernanceTuple
// ============================================================================

std::string GovernanceTuple::to_json() const {
    return record_to_json(*this).dump();
}

std::optional<GovernanceTuple> GovernanceTuple::from_json(const std::string& json_str) {
    try {
        return record_from_json(json::parse(json_str));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string GovernanceTuple::summary() const {
    std::ostringstream oss;
    oss << "record " << id
        << " type=" << record_type
        << " category=" << category
        << " phase=" << lifecycle_phase
        << " criticality=" << criticality_to_string(criticality_level)
        << " solver=" << solver_identity
        << " signer=" << signer_id
        << " upstream=" << upstream_ref
        << " at=" << utilities::format_timestamp(timestamp);
    return oss.str();
}

Hash256 signing_digest(const GovernanceTuple& record) {
    std::vector<uint8_t> payload;
    payload.reserve(8 + 32 + 4 + record.solver_identity.size() + 32
                    + 4 + record.lifecycle_phase.size() + 8);

    append_u64(payload, record.seed);
    payload.insert(payload.end(), record.input_hash.begin(), record.input_hash.end());
    append_string(payload, record.solver_identity);
    payload.insert(payload.end(), record.result_hash.begin(), record.result_hash.end());
    append_string(payload, record.lifecycle_phase);
    append_u64(payload, record.timestamp);

    return LedgerCrypto::sha256(payload);
}

std::string compute_record_id(const GovernanceTuple& record) {
    Hash256 digest = signing_digest(record);

    std::vector<uint8_t> material(digest.begin(), digest.end());
    append_string(material, record.signer_id);
    append_string(material, record.category);
    append_string(material, record.record_type);
    append_string(material, record.upstream_ref);
    material.push_back(static_cast<uint8_t>(record.criticality_level));

    return LedgerCrypto::hash_to_hex(LedgerCrypto::sha256(material)).substr(0, 32);
}

// ============================================================================
// LedgerEntry
// ============================================================================

std::string LedgerEntry::serialize() const {
    return entry_body_to_json(*this).dump();
}

std::optional<LedgerEntry> LedgerEntry::deserialize(const std::string& body) {
    try {
        json j = json::parse(body);
        if (!j.is_object()) {
            return std::nullopt;
        }

        auto record = record_from_json(j.at("record"));
        if (!record) {
            return std::nullopt;
        }

        LedgerEntry entry;
        entry.sequence_index = j.at("sequence_index").get<uint64_t>();
        entry.record = std::move(*record);
        if (!j.at("approval").is_null()) {
            entry.approval_decision = approval_from_json(j.at("approval"));
        }
        entry.chain_hash = LedgerCrypto::zero_hash();

        return entry;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string LedgerEntry::to_json() const {
    json j = entry_body_to_json(*this);
    j["chain_hash"] = LedgerCrypto::hash_to_hex(chain_hash);
    return j.dump();
}

} // namespace govledger
