/**
 * @file approval_channel.hpp
 * @brief Human-approval channel contract and in-memory implementation
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Also holds the monotonic clock abstraction used for approval timeouts.
 */

#pragma once

#include "govledger/governance_record.hpp"

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <chrono>

namespace govledger {

// ============================================================================
// Monotonic Clock
// ============================================================================

/**
 * @brief Monotonic time source for approval timeouts
 */
class MonotonicClock {
public:
    virtual ~MonotonicClock() = default;
    virtual std::chrono::steady_clock::time_point now() const = 0;
};

/**
 * @brief std::chrono::steady_clock
 */
class SteadyClock : public MonotonicClock {
public:
    std::chrono::steady_clock::time_point now() const override {
        return std::chrono::steady_clock::now();
    }
};

/**
 * @brief Manually advanced clock
 */
class ManualClock : public MonotonicClock {
public:
    ManualClock() : current_(std::chrono::steady_clock::time_point{}) {}

    std::chrono::steady_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    void advance(std::chrono::steady_clock::duration delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ += delta;
    }

private:
    std::chrono::steady_clock::time_point current_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Approval Channel
// ============================================================================

enum class DecisionStatus {
    PENDING,
    APPROVED,
    REJECTED
};

std::string decision_status_to_string(DecisionStatus status);

/**
 * @brief Result of polling a ticket
 */
struct ApprovalPoll {
    DecisionStatus status = DecisionStatus::PENDING;
    std::string approver;           ///< Set when decided
    std::string reason;             ///< Approval note or rejection reason
};

/**
 * @brief External human-decision collaborator
 */
class ApprovalChannel {
public:
    virtual ~ApprovalChannel() = default;

    /**
     * @brief Open a ticket for a record
     * @param record_summary One-line record description
     * @param criticality Record criticality
     * @return Ticket id
     */
    virtual std::string request_approval(
        const std::string& record_summary,
        Criticality criticality
    ) = 0;

    /**
     * @brief Current decision for a ticket
     */
    virtual ApprovalPoll poll_decision(const std::string& ticket_id) = 0;
};

/**
 * @brief InMemoryApprovalChannel - Tickets decided by direct calls
 *
 * Unknown tickets poll as REJECTED. Thread-safe.
 */
class InMemoryApprovalChannel : public ApprovalChannel {
public:
    InMemoryApprovalChannel() = default;

    std::string request_approval(
        const std::string& record_summary,
        Criticality criticality
    ) override;

    ApprovalPoll poll_decision(const std::string& ticket_id) override;

    /**
     * @brief Approve a pending ticket
     * @return false if the ticket is unknown or already decided
     */
    bool approve(const std::string& ticket_id, const std::string& approver, const std::string& note = "");

    /**
     * @brief Reject a pending ticket
     * @return false if the ticket is unknown or already decided
     */
    bool reject(const std::string& ticket_id, const std::string& approver, const std::string& reason);

    /**
     * @brief Tickets still awaiting a decision, in request order
     */
    std::vector<std::string> pending_tickets() const;

    /**
     * @brief Summary submitted with a ticket
     */
    std::string summary(const std::string& ticket_id) const;

    size_t request_count() const;

private:
    struct Ticket {
        std::string summary;
        Criticality criticality = Criticality::LOW;
        ApprovalPoll decision;
        uint64_t order = 0;
    };

    std::map<std::string, Ticket> tickets_;
    uint64_t next_order_ = 0;
    mutable std::mutex mutex_;

    bool decide(const std::string& ticket_id, DecisionStatus status,
                const std::string& approver, const std::string& reason);
};

} // namespace govledger
