/**
 * @file lifecycle_registry.hpp
 * @brief Open lifecycle phases per ledger partition
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>

namespace govledger {

/**
 * @brief LifecycleRegistry - Tracks which phases accept new records
 *
 * Unknown phases are closed. Thread-safe.
 */
class LifecycleRegistry {
public:
    LifecycleRegistry() = default;

    /**
     * @brief Open a phase for a partition
     * @throws InputError if either identifier is invalid
     */
    void open_phase(const std::string& partition_id, const std::string& phase);

    /**
     * @brief Close a phase
     * @return true if the phase was open
     */
    bool close_phase(const std::string& partition_id, const std::string& phase);

    bool is_open(const std::string& partition_id, const std::string& phase) const;

    /**
     * @brief Open phases of a partition, sorted
     */
    std::vector<std::string> open_phases(const std::string& partition_id) const;

private:
    std::map<std::string, std::set<std::string>> open_;
    mutable std::mutex mutex_;
};

} // namespace govledger
