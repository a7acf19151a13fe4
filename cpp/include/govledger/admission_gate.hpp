/**
 * @file admission_gate.hpp
 * @brief Admission state machine gating ledger writes
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * RECEIVED -> SIGNATURE_VERIFIED -> LIFECYCLE_CHECKED
 *          -> {AWAITING_APPROVAL | APPROVED} -> APPENDED | REJECTED
 *
 * Validation runs on an asio worker pool; only the final append is
 * serialized (by the store's partition lock). Escalated records wait on
 * the approval channel without holding any lock. Every approved or
 * escalated admission is persisted before its append so a restart resumes
 * polling or retries the append.
 */

#pragma once

#include "govledger/approval_channel.hpp"
#include "govledger/governance_record.hpp"
#include "govledger/ledger_config.hpp"
#include "govledger/ledger_store.hpp"
#include "govledger/lifecycle_registry.hpp"
#include "govledger/signer.hpp"

#include <asio.hpp>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <memory>
#include <future>
#include <exception>
#include <atomic>
#include <condition_variable>
#include <thread>
#include <optional>
#include <cstdint>

namespace govledger {

enum class AdmissionState {
    RECEIVED,
    SIGNATURE_VERIFIED,
    LIFECYCLE_CHECKED,
    AWAITING_APPROVAL,
    APPROVED,
    APPENDED,
    REJECTED
};

enum class RejectionReason {
    NONE,
    INVALID_SIGNATURE,
    LIFECYCLE_CLOSED,
    APPROVAL_TIMEOUT,
    APPROVAL_REJECTED,
    WITHDRAWN,
    DUPLICATE
};

std::string admission_state_to_string(AdmissionState state);

std::string rejection_reason_to_string(RejectionReason reason);

/**
 * @brief Snapshot of one admission
 */
struct AdmissionResult {
    std::string admission_id;
    std::string record_id;
    AdmissionState state = AdmissionState::RECEIVED;
    RejectionReason reason = RejectionReason::NONE;
    std::string detail;                         ///< Rejection detail or approval note
    std::optional<uint64_t> sequence_index;     ///< Set once APPENDED
    std::optional<std::string> ticket_id;       ///< Set once escalated

    /**
     * @brief APPENDED or REJECTED
     */
    bool is_final() const;

    /**
     * @brief Throw the error matching a rejection
     *
     * InvalidSignature -> VerificationError, LifecycleClosed -> LifecycleError,
     * ApprovalTimeout -> ApprovalTimeoutError, ApprovalRejected ->
     * ApprovalRejectedError, Withdrawn/Duplicate -> InputError.
     * Does nothing for APPENDED.
     *
     * @throws std::logic_error if the admission is not final yet
     */
    void require_appended() const;
};

/**
 * @brief Handle for an asynchronous admission
 */
struct AdmissionTicket {
    std::string admission_id;
    std::shared_future<AdmissionResult> result;     ///< Resolves at APPENDED or REJECTED
};

/**
 * @brief AdmissionGate - Validates, escalates and commits records
 */
class AdmissionGate {
public:
    /**
     * @brief Construct gate for one ledger partition
     * @param store Ledger partition (not owned)
     * @param lifecycle Phase registry (not owned)
     * @param keys Trusted signer keys (not owned)
     * @param channel Human-approval channel (not owned)
     * @param config Thresholds, timeouts, worker count
     * @param clock Monotonic clock for approval timeouts
     */
    AdmissionGate(
        LedgerStore& store,
        const LifecycleRegistry& lifecycle,
        const KeyDirectory& keys,
        ApprovalChannel& channel,
        const LedgerConfig& config = LedgerConfig{},
        std::shared_ptr<const MonotonicClock> clock = std::make_shared<SteadyClock>()
    );

    ~AdmissionGate();

    // Disable copy and move
    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;
    AdmissionGate(AdmissionGate&&) = delete;
    AdmissionGate& operator=(AdmissionGate&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start worker threads and the approval poll timer
     * @return true if started
     */
    bool start();

    /**
     * @brief Stop the worker pool after every submitted admission was processed
     */
    void stop();

    bool is_running() const;

    /**
     * @brief true after an append exhausted its retries
     */
    bool has_failed() const;

    // ========================================================================
    // Admission
    // ========================================================================

    /**
     * @brief Register a record in RECEIVED state
     * @return Admission id
     * @throws PersistenceError if the gate has failed
     */
    std::string receive(const GovernanceTuple& record);

    /**
     * @brief Drive a received admission as far as it can go now
     *
     * Ends in APPENDED, REJECTED or AWAITING_APPROVAL. Only the first caller
     * drives an admission; later callers get its current snapshot.
     *
     * @throws InputError for an unknown admission id
     * @throws PersistenceError if the append could not be persisted
     */
    AdmissionResult process(const std::string& admission_id);

    /**
     * @brief receive() + process() on the calling thread
     */
    AdmissionResult admit(const GovernanceTuple& record);

    /**
     * @brief receive() and process on the worker pool
     * @throws PersistenceError if the gate has failed
     * @throws std::runtime_error if the gate is not running
     */
    AdmissionTicket submit(const GovernanceTuple& record);

    /**
     * @brief Withdraw an admission that has not been escalated yet
     * @return false once escalation has begun or the admission is final;
     *         escalated records are withdrawn by rejecting their ticket
     */
    bool withdraw(const std::string& admission_id, const std::string& reason = "withdrawn by submitter");

    // ========================================================================
    // Approval
    // ========================================================================

    /**
     * @brief Check timeouts and poll decisions for every escalated admission
     *
     * Runs periodically while started; callable directly.
     *
     * @return Number of admissions that reached a final state
     * @throws PersistenceError if an approved record could not be appended
     */
    size_t poll_pending();

    /**
     * @brief Reload admissions persisted by a previous process
     *
     * Escalated admissions return to AWAITING_APPROVAL; approved admissions
     * whose append never completed are appended now.
     *
     * @return Number of admissions resumed
     * @throws PersistenceError if a resumed append could not be persisted
     */
    size_t resume_pending();

    // ========================================================================
    // Inspection
    // ========================================================================

    std::optional<AdmissionState> get_state(const std::string& admission_id) const;

    std::optional<AdmissionResult> get_result(const std::string& admission_id) const;

    /**
     * @brief Future resolving when the admission becomes final
     */
    std::optional<std::shared_future<AdmissionResult>> completion(const std::string& admission_id) const;

    size_t pending_count() const;

    std::vector<RejectionRecord> rejection_log() const;

private:
    struct Admission {
        GovernanceTuple record;
        AdmissionResult result;
        bool claimed = false;                   ///< A thread is driving it out of RECEIVED
        bool escalating = false;                ///< Approval request in flight
        bool persisted = false;                 ///< Row in pending_approvals
        bool withdraw_requested = false;
        std::string withdraw_reason;
        uint64_t prior_wait_ms = 0;             ///< Wait consumed before a restart
        std::chrono::steady_clock::time_point wait_started;
        std::promise<AdmissionResult> promise;
        std::shared_future<AdmissionResult> future;
        bool settled = false;
    };

    LedgerStore& store_;
    const LifecycleRegistry& lifecycle_;
    const KeyDirectory& keys_;
    ApprovalChannel& channel_;
    LedgerConfig config_;
    std::shared_ptr<const MonotonicClock> clock_;

    std::map<std::string, std::shared_ptr<Admission>> admissions_;
    mutable std::mutex admissions_mutex_;
    std::mutex poll_mutex_;

    std::atomic<bool> running_;
    std::atomic<bool> failed_;

    // Admissions posted to the pool and not yet processed
    std::mutex drain_mutex_;
    std::condition_variable drained_;
    size_t queued_ = 0;

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::unique_ptr<asio::steady_timer> poll_timer_;
    std::vector<std::thread> worker_threads_;

    std::shared_ptr<Admission> find(const std::string& admission_id) const;

    std::shared_ptr<Admission> register_admission(const GovernanceTuple& record, const std::string& admission_id);

    /**
     * @brief Move to next state unless a withdrawal is pending
     * @return false if the admission was withdrawn instead
     */
    bool advance(const std::shared_ptr<Admission>& admission, AdmissionState next);

    bool verify_record(const GovernanceTuple& record, std::string& detail) const;

    void escalate(const std::shared_ptr<Admission>& admission);

    /**
     * @brief Write the pending row, retrying like an append
     * @throws PersistenceError after the last attempt; the gate is halted
     */
    void persist_pending(const std::shared_ptr<Admission>& admission, const std::string& ticket_id);

    /**
     * @brief Enter the failed state and fail the admission's future
     */
    void halt(const std::shared_ptr<Admission>& admission, const std::string& message,
              std::exception_ptr error);

    void finish_queued();

    void commit(const std::shared_ptr<Admission>& admission,
                const std::optional<ApprovalDecision>& decision);

    void reject(const std::shared_ptr<Admission>& admission,
                RejectionReason reason,
                const std::string& detail);

    void settle(const std::shared_ptr<Admission>& admission);

    uint64_t elapsed_wait_ms(const Admission& admission) const;

    void schedule_poll();
};

} // namespace govledger
