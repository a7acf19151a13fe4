/**
 * @file admission_gate.cpp
 * @brief Implementation of the admission state machine
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Signature, lifecycle and oversight checks ahead of the ledger append
 */

#include "govledger/admission_gate.hpp"
#include "govledger/errors.hpp"
#include "govledger/record_builder.hpp"
#include "govledger/utilities.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace govledger {

// ============================================================================
// Names
// ============================================================================

std::string admission_state_to_string(AdmissionState state) {
    switch (state) {
        case AdmissionState::RECEIVED: return "RECEIVED";
        case AdmissionState::SIGNATURE_VERIFIED: return "SIGNATURE_VERIFIED";
        case AdmissionState::LIFECYCLE_CHECKED: return "LIFECYCLE_CHECKED";
        case AdmissionState::AWAITING_APPROVAL: return "AWAITING_APPROVAL";
        case AdmissionState::APPROVED: return "APPROVED";
        case AdmissionState::APPENDED: return "APPENDED";
        case AdmissionState::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

std::string rejection_reason_to_string(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::NONE: return "None";
        case RejectionReason::INVALID_SIGNATURE: return "InvalidSignature";
        case RejectionReason::LIFECYCLE_CLOSED: return "LifecycleClosed";
        case RejectionReason::APPROVAL_TIMEOUT: return "ApprovalTimeout";
        case RejectionReason::APPROVAL_REJECTED: return "ApprovalRejected";
        case RejectionReason::WITHDRAWN: return "Withdrawn";
        case RejectionReason::DUPLICATE: return "Duplicate";
        default: return "Unknown";
    }
}

bool AdmissionResult::is_final() const {
    return state == AdmissionState::APPENDED || state == AdmissionState::REJECTED;
}

void AdmissionResult::require_appended() const {
    if (state == AdmissionState::APPENDED) {
        return;
    }
    if (state != AdmissionState::REJECTED) {
        throw std::logic_error("Admission " + admission_id + " is still "
                               + admission_state_to_string(state));
    }

    std::string message = "Admission " + admission_id + " rejected: " + detail;
    switch (reason) {
        case RejectionReason::INVALID_SIGNATURE:
            throw VerificationError(message);
        case RejectionReason::LIFECYCLE_CLOSED:
            throw LifecycleError(message);
        case RejectionReason::APPROVAL_TIMEOUT:
            throw ApprovalTimeoutError(message);
        case RejectionReason::APPROVAL_REJECTED:
            throw ApprovalRejectedError(message);
        default:
            throw InputError(message);
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

AdmissionGate::AdmissionGate(
    LedgerStore& store,
    const LifecycleRegistry& lifecycle,
    const KeyDirectory& keys,
    ApprovalChannel& channel,
    const LedgerConfig& config,
    std::shared_ptr<const MonotonicClock> clock
)
    : store_(store)
    , lifecycle_(lifecycle)
    , keys_(keys)
    , channel_(channel)
    , config_(config)
    , clock_(std::move(clock))
    , running_(false)
    , failed_(false)
{
    validate_config(config_);
    if (!clock_) {
        clock_ = std::make_shared<SteadyClock>();
    }
}

AdmissionGate::~AdmissionGate() {
    if (running_) {
        stop();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool AdmissionGate::start() {
    if (running_) {
        utilities::log_warn("AdmissionGate: Already running");
        return false;
    }

    try {
        io_context_.restart();

        // Create work guard to keep io_context running
        work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            io_context_.get_executor()
        );

        poll_timer_ = std::make_unique<asio::steady_timer>(io_context_);

        utilities::log_info("AdmissionGate: Starting " + std::to_string(config_.worker_threads)
                            + " worker threads for partition " + store_.partition_id());

        for (size_t i = 0; i < config_.worker_threads; ++i) {
            worker_threads_.emplace_back([this]() {
                try {
                    io_context_.run();
                } catch (const std::exception& e) {
                    utilities::log_error("AdmissionGate: Worker thread exception: " + std::string(e.what()));
                }
            });
        }

        running_ = true;
        schedule_poll();

        return true;

    } catch (const std::exception& e) {
        utilities::log_error("AdmissionGate: Exception during start: " + std::string(e.what()));
        return false;
    }
}

void AdmissionGate::stop() {
    if (!running_) {
        return;
    }

    utilities::log_info("AdmissionGate: Stopping...");

    // Refuse new submissions, then let the pool finish what was posted
    {
        std::unique_lock<std::mutex> lock(drain_mutex_);
        running_ = false;
        drained_.wait(lock, [this]() { return queued_ == 0; });
    }

    // Stop ASIO work; this also cancels the poll timer's wait
    work_guard_.reset();
    io_context_.stop();

    // Wait for worker threads
    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();
    poll_timer_.reset();

    utilities::log_info("AdmissionGate: Stopped with " + std::to_string(pending_count())
                        + " admission(s) awaiting approval");
}

bool AdmissionGate::is_running() const {
    return running_;
}

bool AdmissionGate::has_failed() const {
    return failed_;
}

void AdmissionGate::schedule_poll() {
    if (!running_ || !poll_timer_) {
        return;
    }

    poll_timer_->expires_after(config_.approval_poll_interval);
    poll_timer_->async_wait([this](const asio::error_code& ec) {
        if (ec || !running_) {
            return;
        }

        try {
            poll_pending();
        } catch (const std::exception& e) {
            utilities::log_error("AdmissionGate: Approval poll failed: " + std::string(e.what()));
        }

        schedule_poll();
    });
}

// ============================================================================
// Admission
// ============================================================================

std::shared_ptr<AdmissionGate::Admission> AdmissionGate::find(const std::string& admission_id) const {
    std::lock_guard<std::mutex> lock(admissions_mutex_);

    auto it = admissions_.find(admission_id);
    if (it == admissions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<AdmissionGate::Admission> AdmissionGate::register_admission(
    const GovernanceTuple& record,
    const std::string& admission_id
) {
    auto admission = std::make_shared<Admission>();
    admission->record = record;
    admission->result.admission_id = admission_id;
    admission->result.record_id = record.id;
    admission->future = admission->promise.get_future().share();

    std::lock_guard<std::mutex> lock(admissions_mutex_);
    admissions_[admission_id] = admission;
    return admission;
}

std::string AdmissionGate::receive(const GovernanceTuple& record) {
    if (failed_) {
        throw PersistenceError("Admission gate for partition " + store_.partition_id()
                               + " is in failed state");
    }

    std::string admission_id = utilities::make_identifier("adm");
    register_admission(record, admission_id);

    utilities::log_debug("AdmissionGate: " + admission_id + " RECEIVED record " + record.id);
    return admission_id;
}

AdmissionResult AdmissionGate::admit(const GovernanceTuple& record) {
    return process(receive(record));
}

AdmissionTicket AdmissionGate::submit(const GovernanceTuple& record) {
    {
        std::lock_guard<std::mutex> lock(drain_mutex_);
        if (!running_) {
            throw std::runtime_error("AdmissionGate is not running");
        }
        queued_++;
    }

    std::string admission_id;
    try {
        admission_id = receive(record);
    } catch (const std::exception&) {
        finish_queued();
        throw;
    }
    auto admission = find(admission_id);

    AdmissionTicket ticket;
    ticket.admission_id = admission_id;
    ticket.result = admission->future;

    asio::post(io_context_, [this, admission_id]() {
        try {
            process(admission_id);
        } catch (const std::exception& e) {
            // The admission's future already carries the failure
            utilities::log_error("AdmissionGate: " + admission_id + " failed: " + e.what());
        }
        finish_queued();
    });

    return ticket;
}

void AdmissionGate::finish_queued() {
    std::lock_guard<std::mutex> lock(drain_mutex_);
    queued_--;
    if (queued_ == 0) {
        drained_.notify_all();
    }
}

AdmissionResult AdmissionGate::process(const std::string& admission_id) {
    auto admission = find(admission_id);
    if (!admission) {
        throw InputError("Unknown admission " + admission_id);
    }

    {
        std::lock_guard<std::mutex> lock(admissions_mutex_);
        if (admission->result.state != AdmissionState::RECEIVED || admission->claimed) {
            return admission->result;
        }
        admission->claimed = true;
    }

    if (failed_) {
        PersistenceError error("Admission gate for partition " + store_.partition_id()
                               + " is in failed state");
        {
            std::lock_guard<std::mutex> lock(admissions_mutex_);
            if (!admission->settled) {
                admission->settled = true;
                admission->promise.set_exception(std::make_exception_ptr(error));
            }
        }
        throw error;
    }

    const GovernanceTuple& record = admission->record;

    // RECEIVED -> SIGNATURE_VERIFIED
    if (store_.contains_record(record.id)) {
        reject(admission, RejectionReason::DUPLICATE, "Record is already in the ledger");
        return *get_result(admission_id);
    }

    std::string detail;
    if (!verify_record(record, detail)) {
        reject(admission, RejectionReason::INVALID_SIGNATURE, detail);
        return *get_result(admission_id);
    }

    if (!advance(admission, AdmissionState::SIGNATURE_VERIFIED)) {
        return *get_result(admission_id);
    }

    // SIGNATURE_VERIFIED -> LIFECYCLE_CHECKED
    if (!lifecycle_.is_open(store_.partition_id(), record.lifecycle_phase)) {
        reject(admission, RejectionReason::LIFECYCLE_CLOSED,
               "Phase " + record.lifecycle_phase + " is not open in partition " + store_.partition_id());
        return *get_result(admission_id);
    }

    if (!advance(admission, AdmissionState::LIFECYCLE_CHECKED)) {
        return *get_result(admission_id);
    }

    // LIFECYCLE_CHECKED -> AWAITING_APPROVAL | APPROVED
    if (record.criticality_level >= config_.oversight_threshold) {
        escalate(admission);
        return *get_result(admission_id);
    }

    if (!advance(admission, AdmissionState::APPROVED)) {
        return *get_result(admission_id);
    }

    persist_pending(admission, "");
    commit(admission, std::nullopt);
    return *get_result(admission_id);
}

bool AdmissionGate::advance(const std::shared_ptr<Admission>& admission, AdmissionState next) {
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(admissions_mutex_);
        if (!admission->withdraw_requested) {
            admission->result.state = next;
            utilities::log_debug("AdmissionGate: " + admission->result.admission_id + " "
                                 + admission_state_to_string(next));
            return true;
        }
        reason = admission->withdraw_reason;
    }

    reject(admission, RejectionReason::WITHDRAWN, reason);
    return false;
}

bool AdmissionGate::verify_record(const GovernanceTuple& record, std::string& detail) const {
    if (!keys_.find(record.signer_id)) {
        detail = "Unknown signer " + record.signer_id;
        return false;
    }

    Hash256 digest = signing_digest(record);
    if (!keys_.verify(record.signer_id, std::vector<uint8_t>(digest.begin(), digest.end()),
                      record.signature)) {
        detail = "Signature does not verify for signer " + record.signer_id;
        return false;
    }

    Hash256 result_hash = RecordBuilder::hash_results(record.ranked_results);
    if (!LedgerCrypto::constant_time_compare(result_hash, record.result_hash)) {
        detail = "Ranked results do not match the signed result hash";
        return false;
    }

    if (compute_record_id(record) != record.id) {
        detail = "Record id does not match record content";
        return false;
    }

    return true;
}

bool AdmissionGate::withdraw(const std::string& admission_id, const std::string& reason) {
    auto admission = find(admission_id);
    if (!admission) {
        return false;
    }

    std::lock_guard<std::mutex> lock(admissions_mutex_);

    switch (admission->result.state) {
        case AdmissionState::RECEIVED:
        case AdmissionState::SIGNATURE_VERIFIED:
        case AdmissionState::LIFECYCLE_CHECKED:
            if (admission->escalating) {
                utilities::log_warn("AdmissionGate: " + admission_id
                                    + " is being escalated; withdraw through the approval channel");
                return false;
            }
            admission->withdraw_requested = true;
            admission->withdraw_reason = reason;
            utilities::log_info("AdmissionGate: Withdrawal requested for " + admission_id);
            return true;

        case AdmissionState::AWAITING_APPROVAL:
            utilities::log_warn("AdmissionGate: " + admission_id
                                + " is escalated; withdraw through the approval channel");
            return false;

        default:
            return false;
    }
}

// ============================================================================
// Escalation
// ============================================================================

void AdmissionGate::escalate(const std::shared_ptr<Admission>& admission) {
    const GovernanceTuple& record = admission->record;

    // Withdrawals are refused from here on; a ticket is never left without an admission
    std::string withdraw_reason;
    bool withdrawn = false;
    {
        std::lock_guard<std::mutex> lock(admissions_mutex_);
        if (admission->withdraw_requested) {
            withdrawn = true;
            withdraw_reason = admission->withdraw_reason;
        } else {
            admission->escalating = true;
        }
    }

    if (withdrawn) {
        reject(admission, RejectionReason::WITHDRAWN, withdraw_reason);
        return;
    }

    std::string ticket_id;
    try {
        ticket_id = channel_.request_approval(record.summary(), record.criticality_level);
    } catch (const std::exception& e) {
        reject(admission, RejectionReason::APPROVAL_REJECTED,
               std::string("Approval request failed: ") + e.what());
        return;
    }

    // Persisted before it becomes visible to poll_pending
    persist_pending(admission, ticket_id);

    {
        std::lock_guard<std::mutex> lock(admissions_mutex_);
        admission->result.state = AdmissionState::AWAITING_APPROVAL;
        admission->result.ticket_id = ticket_id;
        admission->prior_wait_ms = 0;
        admission->wait_started = clock_->now();
    }

    utilities::log_info("AdmissionGate: " + admission->result.admission_id + " AWAITING_APPROVAL on "
                        + ticket_id + " (" + criticality_to_string(record.criticality_level) + ")");
}

void AdmissionGate::persist_pending(const std::shared_ptr<Admission>& admission, const std::string& ticket_id) {
    PendingApproval pending;
    pending.admission_id = admission->result.admission_id;
    pending.ticket_id = ticket_id;
    pending.record_json = admission->record.to_json();
    pending.waited_ms = 0;
    pending.escalated_at = utilities::current_unix_seconds();

    std::string failure;
    std::chrono::milliseconds backoff = config_.append_base_backoff;

    for (size_t attempt = 1; attempt <= config_.append_max_attempts; ++attempt) {
        if (store_.storage().save_pending(pending)) {
            std::lock_guard<std::mutex> lock(admissions_mutex_);
            admission->persisted = true;
            return;
        }

        failure = store_.storage().last_error();

        if (attempt < config_.append_max_attempts) {
            utilities::log_warn("AdmissionGate: Persisting " + pending.admission_id + " attempt "
                                + std::to_string(attempt) + " failed (" + failure + "), retrying in "
                                + std::to_string(backoff.count()) + "ms");
            std::this_thread::sleep_for(backoff);
            backoff = std::min(backoff * 2, MAX_APPEND_BACKOFF);
        }
    }

    std::string message = "Admission " + pending.admission_id + " could not be persisted after "
                          + std::to_string(config_.append_max_attempts) + " attempts: " + failure;
    if (!ticket_id.empty()) {
        message += " (approval ticket " + ticket_id + " left open)";
    }

    PersistenceError error(message);
    halt(admission, message, std::make_exception_ptr(error));
    throw error;
}

uint64_t AdmissionGate::elapsed_wait_ms(const Admission& admission) const {
    auto delta = clock_->now() - admission.wait_started;
    auto delta_ms = std::chrono::duration_cast<std::chrono::milliseconds>(delta).count();
    return admission.prior_wait_ms + static_cast<uint64_t>(delta_ms > 0 ? delta_ms : 0);
}

size_t AdmissionGate::poll_pending() {
    std::lock_guard<std::mutex> poll_lock(poll_mutex_);

    // Approved records must not be appended behind a halted one
    if (failed_) {
        return 0;
    }

    std::vector<std::shared_ptr<Admission>> waiting;
    {
        std::lock_guard<std::mutex> lock(admissions_mutex_);
        for (const auto& item : admissions_) {
            if (item.second->result.state == AdmissionState::AWAITING_APPROVAL) {
                waiting.push_back(item.second);
            }
        }
    }

    auto timeout_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.approval_timeout).count());

    size_t resolved = 0;

    for (const auto& admission : waiting) {
        std::string admission_id;
        std::string ticket_id;
        uint64_t elapsed = 0;
        {
            std::lock_guard<std::mutex> lock(admissions_mutex_);
            admission_id = admission->result.admission_id;
            ticket_id = admission->result.ticket_id.value_or("");
            elapsed = elapsed_wait_ms(*admission);
        }

        // Timeout is checked before the decision
        if (elapsed >= timeout_ms) {
            reject(admission, RejectionReason::APPROVAL_TIMEOUT,
                   "No decision on " + ticket_id + " within "
                   + utilities::format_duration(timeout_ms / 1000));
            resolved++;
            continue;
        }

        ApprovalPoll poll;
        try {
            poll = channel_.poll_decision(ticket_id);
        } catch (const std::exception& e) {
            utilities::log_warn("AdmissionGate: Polling " + ticket_id + " failed: " + e.what());
            continue;
        }

        switch (poll.status) {
            case DecisionStatus::APPROVED: {
                {
                    std::lock_guard<std::mutex> lock(admissions_mutex_);
                    admission->result.state = AdmissionState::APPROVED;
                    admission->result.detail = poll.reason;
                }

                ApprovalDecision decision;
                decision.ticket_id = ticket_id;
                decision.approver = poll.approver;
                decision.note = poll.reason;
                decision.decided_at = utilities::current_unix_seconds();

                utilities::log_info("AdmissionGate: " + admission_id + " APPROVED by " + poll.approver);
                commit(admission, decision);
                resolved++;
                break;
            }

            case DecisionStatus::REJECTED:
                reject(admission, RejectionReason::APPROVAL_REJECTED,
                       poll.reason.empty() ? "Rejected by " + poll.approver : poll.reason);
                resolved++;
                break;

            case DecisionStatus::PENDING:
            default:
                if (!store_.storage().update_pending_wait(admission_id, elapsed)) {
                    utilities::log_warn("AdmissionGate: Failed to persist wait for " + admission_id);
                }
                break;
        }
    }

    return resolved;
}

size_t AdmissionGate::resume_pending() {
    size_t resumed = 0;

    for (const auto& pending : store_.storage().load_pending()) {
        if (find(pending.admission_id)) {
            continue;
        }

        auto record = GovernanceTuple::from_json(pending.record_json);
        if (!record) {
            utilities::log_error("AdmissionGate: Pending admission " + pending.admission_id
                                 + " holds an undecodable record");
            continue;
        }

        // Appended before the pending row could be cleared
        if (store_.contains_record(record->id)) {
            utilities::log_warn("AdmissionGate: Pending admission " + pending.admission_id
                                + " already appended, clearing");
            if (!store_.storage().remove_pending(pending.admission_id)) {
                utilities::log_warn("AdmissionGate: Failed to clear pending admission "
                                    + pending.admission_id + ": " + store_.storage().last_error());
            }
            continue;
        }

        auto admission = register_admission(*record, pending.admission_id);
        {
            std::lock_guard<std::mutex> lock(admissions_mutex_);
            admission->claimed = true;
            admission->persisted = true;
        }

        std::string detail;
        if (!verify_record(*record, detail)) {
            reject(admission, RejectionReason::INVALID_SIGNATURE, detail);
            continue;
        }

        // Approved without oversight; only the append is outstanding
        if (pending.ticket_id.empty()) {
            {
                std::lock_guard<std::mutex> lock(admissions_mutex_);
                admission->result.state = AdmissionState::APPROVED;
            }
            utilities::log_info("AdmissionGate: Resumed approved " + pending.admission_id
                                + ", retrying append");
            commit(admission, std::nullopt);
            resumed++;
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(admissions_mutex_);
            admission->result.state = AdmissionState::AWAITING_APPROVAL;
            admission->result.ticket_id = pending.ticket_id;
            admission->prior_wait_ms = pending.waited_ms;
            admission->wait_started = clock_->now();
        }

        utilities::log_info("AdmissionGate: Resumed " + pending.admission_id + " on "
                            + pending.ticket_id + " after " + std::to_string(pending.waited_ms) + "ms");
        resumed++;
    }

    return resumed;
}

// ============================================================================
// Final States
// ============================================================================

void AdmissionGate::commit(
    const std::shared_ptr<Admission>& admission,
    const std::optional<ApprovalDecision>& decision
) {
    LedgerEntry entry;

    try {
        entry = store_.append(admission->record, decision);

    } catch (const InputError& e) {
        // Lost the race against an identical record
        reject(admission, RejectionReason::DUPLICATE, e.what());
        return;

    } catch (const PersistenceError& e) {
        // The pending row stays so a restart can retry the approved record
        halt(admission, "Approved record " + admission->record.id + " could not be appended: " + e.what(),
             std::current_exception());
        throw;
    }

    std::string admission_id;
    bool persisted = false;
    {
        std::lock_guard<std::mutex> lock(admissions_mutex_);
        admission->result.state = AdmissionState::APPENDED;
        admission->result.sequence_index = entry.sequence_index;
        admission_id = admission->result.admission_id;
        persisted = admission->persisted;
    }

    if (persisted && !store_.storage().remove_pending(admission_id)) {
        utilities::log_warn("AdmissionGate: Failed to clear pending approval " + admission_id);
    }

    utilities::log_debug("AdmissionGate: " + admission_id + " APPENDED at #"
                         + std::to_string(entry.sequence_index));
    settle(admission);
}

void AdmissionGate::reject(
    const std::shared_ptr<Admission>& admission,
    RejectionReason reason,
    const std::string& detail
) {
    RejectionRecord rejection;
    bool persisted = false;
    {
        std::lock_guard<std::mutex> lock(admissions_mutex_);
        if (admission->result.is_final()) {
            return;
        }
        admission->result.state = AdmissionState::REJECTED;
        admission->result.reason = reason;
        admission->result.detail = detail;
        persisted = admission->persisted;

        rejection.admission_id = admission->result.admission_id;
        rejection.record_id = admission->record.id;
    }

    rejection.reason = rejection_reason_to_string(reason);
    rejection.detail = detail;
    rejection.record_json = admission->record.to_json();
    rejection.rejected_at = utilities::current_unix_seconds();

    if (!store_.storage().record_rejection(rejection)) {
        utilities::log_error("AdmissionGate: Failed to write rejection log for "
                             + rejection.admission_id + ": " + store_.storage().last_error());
    }
    if (persisted && !store_.storage().remove_pending(rejection.admission_id)) {
        utilities::log_warn("AdmissionGate: Failed to clear pending approval " + rejection.admission_id);
    }

    utilities::log_warn("AdmissionGate: " + rejection.admission_id + " REJECTED("
                        + rejection.reason + ") record " + rejection.record_id + ": " + detail);
    settle(admission);
}

void AdmissionGate::settle(const std::shared_ptr<Admission>& admission) {
    std::lock_guard<std::mutex> lock(admissions_mutex_);
    if (!admission->settled) {
        admission->settled = true;
        admission->promise.set_value(admission->result);
    }
}

void AdmissionGate::halt(
    const std::shared_ptr<Admission>& admission,
    const std::string& message,
    std::exception_ptr error
) {
    failed_ = true;
    utilities::log_critical("AdmissionGate: " + message + ", gate for partition "
                            + store_.partition_id() + " halted");

    std::lock_guard<std::mutex> lock(admissions_mutex_);
    if (!admission->settled) {
        admission->settled = true;
        admission->promise.set_exception(error);
    }
}

// ============================================================================
// Inspection
// ============================================================================

std::optional<AdmissionState> AdmissionGate::get_state(const std::string& admission_id) const {
    auto admission = find(admission_id);
    if (!admission) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(admissions_mutex_);
    return admission->result.state;
}

std::optional<AdmissionResult> AdmissionGate::get_result(const std::string& admission_id) const {
    auto admission = find(admission_id);
    if (!admission) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(admissions_mutex_);
    return admission->result;
}

std::optional<std::shared_future<AdmissionResult>> AdmissionGate::completion(
    const std::string& admission_id
) const {
    auto admission = find(admission_id);
    if (!admission) {
        return std::nullopt;
    }
    return admission->future;
}

size_t AdmissionGate::pending_count() const {
    std::lock_guard<std::mutex> lock(admissions_mutex_);

    size_t count = 0;
    for (const auto& item : admissions_) {
        if (item.second->result.state == AdmissionState::AWAITING_APPROVAL) {
            count++;
        }
    }
    return count;
}

std::vector<RejectionRecord> AdmissionGate::rejection_log() const {
    return store_.storage().load_rejections();
}

} // namespace govledger
