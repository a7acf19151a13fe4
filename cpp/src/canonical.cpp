/**
 * @file canonical.cpp
 * @brief Implementation of canonical JSON encoding
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "govledger/canonical.hpp"
#include "govledger/errors.hpp"

#include <cmath>
#include <set>
#include <vector>

using json = nlohmann::json;

namespace govledger {
namespace canonical {

namespace {

void check_canonicalizable(const json& value, const std::string& path) {
    switch (value.type()) {
        case json::value_t::object:
            for (auto it = value.begin(); it != value.end(); ++it) {
                check_canonicalizable(it.value(), path + "/" + it.key());
            }
            break;

        case json::value_t::array: {
            size_t index = 0;
            for (const auto& element : value) {
                check_canonicalizable(element, path + "/" + std::to_string(index++));
            }
            break;
        }

        case json::value_t::number_float: {
            double number = value.get<double>();
            if (!std::isfinite(number)) {
                throw InputError("Non-finite number at " + (path.empty() ? "/" : path));
            }
            break;
        }

        case json::value_t::binary:
            throw InputError("Binary value at " + (path.empty() ? "/" : path));

        case json::value_t::discarded:
            throw InputError("Discarded value at " + (path.empty() ? "/" : path));

        default:
            break;
    }
}

} // namespace

std::string canonicalize(const json& value) {
    check_canonicalizable(value, "");

    try {
        // nlohmann::json keeps object members in a std::map, so dump()
        // already emits keys in sorted order
        return value.dump(-1, ' ', false, json::error_handler_t::strict);
    } catch (const json::type_error& e) {
        throw InputError(std::string("Value is not canonicalizable: ") + e.what());
    }
}

json parse_strict(const std::string& json_text) {
    std::vector<std::set<std::string>> seen_keys;
    std::string duplicate;

    json::parser_callback_t callback =
        [&seen_keys, &duplicate](int /*depth*/, json::parse_event_t event, json& parsed) {
            switch (event) {
                case json::parse_event_t::object_start:
                    seen_keys.emplace_back();
                    break;
                case json::parse_event_t::object_end:
                    if (!seen_keys.empty()) {
                        seen_keys.pop_back();
                    }
                    break;
                case json::parse_event_t::key:
                    if (!seen_keys.empty() && parsed.is_string()) {
                        const auto& key = parsed.get_ref<const std::string&>();
                        if (!seen_keys.back().insert(key).second && duplicate.empty()) {
                            duplicate = key;
                        }
                    }
                    break;
                default:
                    break;
            }
            return true;
        };

    json value;
    try {
        value = json::parse(json_text, callback);
    } catch (const json::parse_error& e) {
        throw InputError(std::string("Malformed JSON: ") + e.what());
    }

    if (!duplicate.empty()) {
        throw InputError("Duplicate key '" + duplicate + "' cannot be normalized");
    }

    return value;
}

std::string canonicalize_text(const std::string& json_text) {
    return canonicalize(parse_strict(json_text));
}

} // namespace canonical
} // namespace govledger
