/**
 * @file canonical.hpp
 * @brief Canonical JSON encoding of record inputs and results
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Canonical form: object keys sorted bytewise, no insignificant whitespace,
 * integers without exponent, strict UTF-8. Identical values always produce
 * identical bytes.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace govledger {
namespace canonical {

/**
 * @brief Encode a JSON value canonically
 * @param value Value to encode
 * @return Canonical text
 * @throws InputError if the value holds non-finite numbers, binary data,
 *         discarded values or invalid UTF-8
 */
std::string canonicalize(const nlohmann::json& value);

/**
 * @brief Parse JSON text and encode it canonically
 *
 * Rejects documents that repeat a key inside one object, since their
 * field order cannot be normalized without dropping data.
 *
 * @param json_text JSON document
 * @return Canonical text
 * @throws InputError on parse errors, duplicate keys or values rejected
 *         by canonicalize()
 */
std::string canonicalize_text(const std::string& json_text);

/**
 * @brief Parse JSON text, rejecting duplicate keys
 * @throws InputError on parse errors or duplicate keys
 */
nlohmann::json parse_strict(const std::string& json_text);

} // namespace canonical
} // namespace govledger
