/**
 * @file approval_channel.cpp
 * @brief Implementation of the in-memory approval channel
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "govledger/approval_channel.hpp"
#include "govledger/utilities.hpp"

#include <algorithm>

namespace govledger {

std::string decision_status_to_string(DecisionStatus status) {
    switch (status) {
        case DecisionStatus::PENDING: return "PENDING";
        case DecisionStatus::APPROVED: return "APPROVED";
        case DecisionStatus::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

std::string InMemoryApprovalChannel::request_approval(
    const std::string& record_summary,
    Criticality criticality
) {
    std::string ticket_id = utilities::make_identifier("ticket");

    std::lock_guard<std::mutex> lock(mutex_);

    Ticket ticket;
    ticket.summary = record_summary;
    ticket.criticality = criticality;
    ticket.order = next_order_++;
    tickets_[ticket_id] = ticket;

    utilities::log_info("InMemoryApprovalChannel: Opened " + ticket_id + " ("
                        + criticality_to_string(criticality) + ")");
    return ticket_id;
}

ApprovalPoll InMemoryApprovalChannel::poll_decision(const std::string& ticket_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tickets_.find(ticket_id);
    if (it == tickets_.end()) {
        ApprovalPoll unknown;
        unknown.status = DecisionStatus::REJECTED;
        unknown.reason = "unknown ticket";
        return unknown;
    }

    return it->second.decision;
}

bool InMemoryApprovalChannel::approve(
    const std::string& ticket_id,
    const std::string& approver,
    const std::string& note
) {
    return decide(ticket_id, DecisionStatus::APPROVED, approver, note);
}

bool InMemoryApprovalChannel::reject(
    const std::string& ticket_id,
    const std::string& approver,
    const std::string& reason
) {
    return decide(ticket_id, DecisionStatus::REJECTED, approver, reason);
}

bool InMemoryApprovalChannel::decide(
    const std::string& ticket_id,
    DecisionStatus status,
    const std::string& approver,
    const std::string& reason
) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tickets_.find(ticket_id);
    if (it == tickets_.end() || it->second.decision.status != DecisionStatus::PENDING) {
        return false;
    }

    it->second.decision.status = status;
    it->second.decision.approver = approver;
    it->second.decision.reason = reason;
    return true;
}

std::vector<std::string> InMemoryApprovalChannel::pending_tickets() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<uint64_t, std::string>> ordered;
    for (const auto& [ticket_id, ticket] : tickets_) {
        if (ticket.decision.status == DecisionStatus::PENDING) {
            ordered.emplace_back(ticket.order, ticket_id);
        }
    }
    std::sort(ordered.begin(), ordered.end());

    std::vector<std::string> result;
    for (const auto& item : ordered) {
        result.push_back(item.second);
    }
    return result;
}

std::string InMemoryApprovalChannel::summary(const std::string& ticket_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tickets_.find(ticket_id);
    return it == tickets_.end() ? "" : it->second.summary;
}

size_t InMemoryApprovalChannel::request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tickets_.size();
}

} // namespace govledger
