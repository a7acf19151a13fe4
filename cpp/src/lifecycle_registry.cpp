/**
 * @file lifecycle_registry.cpp
 * @brief Implementation of the lifecycle phase registry
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "govledger/lifecycle_registry.hpp"
#include "govledger/errors.hpp"
#include "govledger/ledger_config.hpp"
#include "govledger/utilities.hpp"

namespace govledger {

void LifecycleRegistry::open_phase(const std::string& partition_id, const std::string& phase) {
    if (!validate_identifier(partition_id)) {
        throw InputError("Invalid partition id: '" + partition_id + "'");
    }
    if (!validate_identifier(phase)) {
        throw InputError("Invalid lifecycle phase: '" + phase + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (open_[partition_id].insert(phase).second) {
        utilities::log_info("LifecycleRegistry: Opened phase " + phase + " in " + partition_id);
    }
}

bool LifecycleRegistry::close_phase(const std::string& partition_id, const std::string& phase) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = open_.find(partition_id);
    if (it == open_.end() || it->second.erase(phase) == 0) {
        return false;
    }

    utilities::log_info("LifecycleRegistry: Closed phase " + phase + " in " + partition_id);
    return true;
}

bool LifecycleRegistry::is_open(const std::string& partition_id, const std::string& phase) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = open_.find(partition_id);
    return it != open_.end() && it->second.count(phase) > 0;
}

std::vector<std::string> LifecycleRegistry::open_phases(const std::string& partition_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = open_.find(partition_id);
    if (it == open_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

} // namespace govledger
