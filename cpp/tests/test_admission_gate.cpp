/**
 * @file test_admission_gate.cpp
 * @brief Unit tests for the AdmissionGate state machine
 *
 * Tests admission including:
 * - Signature and record id verification
 * - Lifecycle phase checks
 * - Human approval, rejection and timeout
 * - Withdrawal before escalation
 * - Resuming pending approvals after a restart
 * - Concurrent submission through the worker pool
 * - Draining the pool on stop
 * - Halting on persistence failure and retrying after a restart
 */

#include <gtest/gtest.h>
#include "govledger/admission_gate.hpp"
#include "govledger/errors.hpp"
#include "govledger/record_builder.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <set>
#include <thread>
#include <vector>

using namespace govledger;
using json = nlohmann::json;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class AdmissionGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(LedgerCrypto::initialize());

        test_dir_ = fs::temp_directory_path() / "govledger_gate_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        db_path_ = (test_dir_ / "ledger.db").string();

        signer_ = std::make_unique<Ed25519Signer>("solver-host-1");
        builder_ = std::make_unique<RecordBuilder>(*signer_);
        keys_.register_key(signer_->signer_id(), signer_->public_key());

        lifecycle_.open_phase("propulsion", "PhaseA");

        config_.batch_size = 4;
        config_.worker_threads = 3;
        config_.append_base_backoff = 1ms;

        clock_ = std::make_shared<ManualClock>();
        store_ = std::make_unique<LedgerStore>("propulsion", db_path_, config_);
        gate_ = std::make_unique<AdmissionGate>(*store_, lifecycle_, keys_, channel_, config_, clock_);
    }

    void TearDown() override {
        gate_.reset();
        store_.reset();
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    GovernanceTuple make_record(int n,
                                Criticality level = Criticality::LOW,
                                const std::string& phase = "PhaseA") {
        RecordRequest request;
        request.inputs = {{"mass", 100 + n}};
        request.ranked_results = json::array({"design-" + std::to_string(n)});
        request.solver_identity = "solverX-1.0";
        request.lifecycle_phase = phase;
        request.criticality_level = level;
        request.upstream_ref = "req-" + std::to_string(n);
        return builder_->build_record(request, 1700000000 + static_cast<uint64_t>(n));
    }

    void exec_sql(const std::string& sql) {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(db_path_.c_str(), &db), SQLITE_OK);
        char* error = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
        std::string message = error ? error : "";
        sqlite3_free(error);
        sqlite3_close(db);
        ASSERT_EQ(rc, SQLITE_OK) << message;
    }

    void reopen(const LedgerConfig& config) {
        gate_.reset();
        store_.reset();
        store_ = std::make_unique<LedgerStore>("propulsion", db_path_, config);
        gate_ = std::make_unique<AdmissionGate>(*store_, lifecycle_, keys_, channel_, config, clock_);
    }

    fs::path test_dir_;
    std::string db_path_;
    LedgerConfig config_;
    std::unique_ptr<Ed25519Signer> signer_;
    std::unique_ptr<RecordBuilder> builder_;
    KeyDirectory keys_;
    LifecycleRegistry lifecycle_;
    InMemoryApprovalChannel channel_;
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<LedgerStore> store_;
    std::unique_ptr<AdmissionGate> gate_;
};

// ============================================================================
// Direct Admission
// ============================================================================

TEST_F(AdmissionGateTest, LowCriticalityIsAppended) {
    AdmissionResult result = gate_->admit(make_record(1));

    EXPECT_EQ(result.state, AdmissionState::APPENDED);
    EXPECT_EQ(result.reason, RejectionReason::NONE);
    ASSERT_TRUE(result.sequence_index.has_value());
    EXPECT_EQ(*result.sequence_index, 0u);
    EXPECT_FALSE(result.ticket_id.has_value());
    EXPECT_EQ(store_->size(), 1u);
    EXPECT_EQ(channel_.request_count(), 0u);
    EXPECT_NO_THROW(result.require_appended());
}

TEST_F(AdmissionGateTest, SequentialAdmissionsKeepCommitOrder) {
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        GovernanceTuple record = make_record(i);
        ids.push_back(record.id);
        EXPECT_EQ(gate_->admit(record).sequence_index, static_cast<uint64_t>(i));
    }

    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(store_->read(i)->record.id, ids[i]);
    }
}

TEST_F(AdmissionGateTest, ReceiveStartsInReceivedState) {
    std::string admission_id = gate_->receive(make_record(1));

    EXPECT_EQ(admission_id.rfind("adm-", 0), 0u);
    EXPECT_EQ(gate_->get_state(admission_id), AdmissionState::RECEIVED);

    AdmissionResult result = gate_->process(admission_id);
    EXPECT_EQ(result.state, AdmissionState::APPENDED);

    // Processing again returns the settled result
    EXPECT_EQ(gate_->process(admission_id).sequence_index, result.sequence_index);
    EXPECT_EQ(store_->size(), 1u);
}

TEST_F(AdmissionGateTest, UnknownAdmissionThrows) {
    EXPECT_THROW(gate_->process("adm-missing"), InputError);
    EXPECT_FALSE(gate_->get_state("adm-missing").has_value());
}

TEST_F(AdmissionGateTest, CompletionFutureResolves) {
    std::string admission_id = gate_->receive(make_record(1));
    auto future = gate_->completion(admission_id);
    ASSERT_TRUE(future.has_value());

    gate_->process(admission_id);

    ASSERT_EQ(future->wait_for(0s), std::future_status::ready);
    EXPECT_EQ(future->get().state, AdmissionState::APPENDED);
}

// ============================================================================
// Signature Checks
// ============================================================================

TEST_F(AdmissionGateTest, UnknownSignerIsRejected) {
    Ed25519Signer stranger("rogue-host");
    RecordBuilder rogue(stranger);

    RecordRequest request;
    request.inputs = {{"mass", 1}};
    request.solver_identity = "solverX-1.0";
    request.lifecycle_phase = "PhaseA";
    request.upstream_ref = "req-rogue";

    AdmissionResult result = gate_->admit(rogue.build_record(request, 1700000000));

    EXPECT_EQ(result.state, AdmissionState::REJECTED);
    EXPECT_EQ(result.reason, RejectionReason::INVALID_SIGNATURE);
    EXPECT_EQ(store_->size(), 0u);
    EXPECT_THROW(result.require_appended(), VerificationError);
}

TEST_F(AdmissionGateTest, TamperedRecordIsRejected) {
    GovernanceTuple record = make_record(1);
    record.input_hash[0] ^= 0x01;

    AdmissionResult result = gate_->admit(record);
    EXPECT_EQ(result.reason, RejectionReason::INVALID_SIGNATURE);
}

TEST_F(AdmissionGateTest, SwappedResultsAreRejected) {
    GovernanceTuple record = make_record(1);
    record.ranked_results = R"(["design-forged"])";

    AdmissionResult result = gate_->admit(record);
    EXPECT_EQ(result.reason, RejectionReason::INVALID_SIGNATURE);
}

TEST_F(AdmissionGateTest, DowngradedCriticalityIsRejected) {
    GovernanceTuple record = make_record(1, Criticality::CRITICAL);
    record.criticality_level = Criticality::LOW;

    AdmissionResult result = gate_->admit(record);
    EXPECT_EQ(result.reason, RejectionReason::INVALID_SIGNATURE);
    EXPECT_EQ(channel_.request_count(), 0u);
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(AdmissionGateTest, RevokedSignerIsRejected) {
    GovernanceTuple record = make_record(1);
    keys_.revoke(signer_->signer_id());

    EXPECT_EQ(gate_->admit(record).reason, RejectionReason::INVALID_SIGNATURE);
}

// ============================================================================
// Lifecycle Checks
// ============================================================================

TEST_F(AdmissionGateTest, ClosedPhaseIsRejected) {
    lifecycle_.close_phase("propulsion", "PhaseA");

    AdmissionResult result = gate_->admit(make_record(1));
    EXPECT_EQ(result.state, AdmissionState::REJECTED);
    EXPECT_EQ(result.reason, RejectionReason::LIFECYCLE_CLOSED);
    EXPECT_THROW(result.require_appended(), LifecycleError);
}

TEST_F(AdmissionGateTest, UnknownPhaseIsRejected) {
    AdmissionResult result = gate_->admit(make_record(1, Criticality::LOW, "PhaseZ"));
    EXPECT_EQ(result.reason, RejectionReason::LIFECYCLE_CLOSED);
}

TEST_F(AdmissionGateTest, PhaseOpenInOtherPartitionOnly) {
    lifecycle_.open_phase("structures", "PhaseB");

    AdmissionResult result = gate_->admit(make_record(1, Criticality::LOW, "PhaseB"));
    EXPECT_EQ(result.reason, RejectionReason::LIFECYCLE_CLOSED);
}

// ============================================================================
// Human Oversight
// ============================================================================

TEST_F(AdmissionGateTest, ThresholdIsInclusive) {
    AdmissionResult medium = gate_->admit(make_record(1, Criticality::MEDIUM));
    EXPECT_EQ(medium.state, AdmissionState::APPENDED);

    AdmissionResult high = gate_->admit(make_record(2, Criticality::HIGH));
    EXPECT_EQ(high.state, AdmissionState::AWAITING_APPROVAL);
    ASSERT_TRUE(high.ticket_id.has_value());
    EXPECT_EQ(channel_.pending_tickets(), std::vector<std::string>{*high.ticket_id});
    EXPECT_EQ(gate_->pending_count(), 1u);
    EXPECT_THROW(high.require_appended(), std::logic_error);
}

TEST_F(AdmissionGateTest, ApprovedRecordIsAppendedWithDecision) {
    AdmissionResult escalated = gate_->admit(make_record(1, Criticality::CRITICAL));
    ASSERT_EQ(escalated.state, AdmissionState::AWAITING_APPROVAL);
    EXPECT_EQ(store_->storage().load_pending().size(), 1u);

    // Nothing decided yet
    EXPECT_EQ(gate_->poll_pending(), 0u);
    EXPECT_EQ(store_->size(), 0u);

    ASSERT_TRUE(channel_.approve(*escalated.ticket_id, "chief-engineer", "Reviewed at CDR"));
    EXPECT_EQ(gate_->poll_pending(), 1u);

    auto result = gate_->get_result(escalated.admission_id);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, AdmissionState::APPENDED);
    EXPECT_EQ(store_->size(), 1u);
    EXPECT_TRUE(store_->storage().load_pending().empty());

    auto entry = store_->read(0);
    ASSERT_TRUE(entry->approval_decision.has_value());
    EXPECT_EQ(entry->approval_decision->approver, "chief-engineer");
    EXPECT_EQ(entry->approval_decision->ticket_id, *escalated.ticket_id);
    EXPECT_EQ(entry->approval_decision->note, "Reviewed at CDR");
}

TEST_F(AdmissionGateTest, RejectedApprovalIsNotAppended) {
    AdmissionResult escalated = gate_->admit(make_record(1, Criticality::HIGH));
    ASSERT_TRUE(channel_.reject(*escalated.ticket_id, "chief-engineer", "Margins too thin"));

    EXPECT_EQ(gate_->poll_pending(), 1u);

    auto result = gate_->get_result(escalated.admission_id);
    EXPECT_EQ(result->state, AdmissionState::REJECTED);
    EXPECT_EQ(result->reason, RejectionReason::APPROVAL_REJECTED);
    EXPECT_EQ(result->detail, "Margins too thin");
    EXPECT_EQ(store_->size(), 0u);
    EXPECT_THROW(result->require_appended(), ApprovalRejectedError);
}

TEST_F(AdmissionGateTest, ApprovalTimesOutAfter72Hours) {
    uint64_t size_before = store_->size();

    AdmissionResult escalated = gate_->admit(make_record(1, Criticality::HIGH));
    ASSERT_EQ(escalated.state, AdmissionState::AWAITING_APPROVAL);

    clock_->advance(72h - 1s);
    EXPECT_EQ(gate_->poll_pending(), 0u);
    EXPECT_EQ(gate_->get_state(escalated.admission_id), AdmissionState::AWAITING_APPROVAL);

    clock_->advance(1s);
    EXPECT_EQ(gate_->poll_pending(), 1u);

    auto result = gate_->get_result(escalated.admission_id);
    EXPECT_EQ(result->state, AdmissionState::REJECTED);
    EXPECT_EQ(result->reason, RejectionReason::APPROVAL_TIMEOUT);
    EXPECT_EQ(store_->size(), size_before);
    EXPECT_EQ(gate_->pending_count(), 0u);
    EXPECT_THROW(result->require_appended(), ApprovalTimeoutError);
}

TEST_F(AdmissionGateTest, LateApprovalLosesToTimeout) {
    AdmissionResult escalated = gate_->admit(make_record(1, Criticality::HIGH));

    clock_->advance(80h);
    channel_.approve(*escalated.ticket_id, "chief-engineer");

    gate_->poll_pending();
    EXPECT_EQ(gate_->get_result(escalated.admission_id)->reason, RejectionReason::APPROVAL_TIMEOUT);
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(AdmissionGateTest, ApprovalOrderDecidesLedgerOrder) {
    GovernanceTuple first = make_record(1, Criticality::HIGH);
    GovernanceTuple second = make_record(2, Criticality::HIGH);

    AdmissionResult a = gate_->admit(first);
    AdmissionResult b = gate_->admit(second);
    ASSERT_EQ(a.state, AdmissionState::AWAITING_APPROVAL);
    ASSERT_EQ(b.state, AdmissionState::AWAITING_APPROVAL);

    // The later arrival is approved first and takes the first slot
    ASSERT_TRUE(channel_.approve(*b.ticket_id, "chief-engineer"));
    EXPECT_EQ(gate_->poll_pending(), 1u);
    EXPECT_EQ(gate_->get_result(b.admission_id)->sequence_index, 0u);
    EXPECT_EQ(gate_->get_state(a.admission_id), AdmissionState::AWAITING_APPROVAL);

    ASSERT_TRUE(channel_.approve(*a.ticket_id, "chief-engineer"));
    EXPECT_EQ(gate_->poll_pending(), 1u);
    EXPECT_EQ(gate_->get_result(a.admission_id)->sequence_index, 1u);

    EXPECT_EQ(store_->read(0)->record.id, second.id);
    EXPECT_EQ(store_->read(1)->record.id, first.id);
}

TEST_F(AdmissionGateTest, UnknownTicketCountsAsRejected) {
    class ForgetfulChannel : public ApprovalChannel {
    public:
        std::string request_approval(const std::string&, Criticality) override { return "ticket-lost"; }
        ApprovalPoll poll_decision(const std::string&) override {
            ApprovalPoll poll;
            poll.status = DecisionStatus::REJECTED;
            poll.reason = "unknown ticket";
            return poll;
        }
    } forgetful;

    AdmissionGate gate(*store_, lifecycle_, keys_, forgetful, config_, clock_);
    AdmissionResult escalated = gate.admit(make_record(1, Criticality::HIGH));
    gate.poll_pending();

    EXPECT_EQ(gate.get_result(escalated.admission_id)->reason, RejectionReason::APPROVAL_REJECTED);
}

TEST_F(AdmissionGateTest, FailingApprovalRequestRejects) {
    class BrokenChannel : public ApprovalChannel {
    public:
        std::string request_approval(const std::string&, Criticality) override {
            throw std::runtime_error("approval service unreachable");
        }
        ApprovalPoll poll_decision(const std::string&) override { return ApprovalPoll{}; }
    } broken;

    AdmissionGate gate(*store_, lifecycle_, keys_, broken, config_, clock_);
    AdmissionResult result = gate.admit(make_record(1, Criticality::CRITICAL));

    EXPECT_EQ(result.state, AdmissionState::REJECTED);
    EXPECT_EQ(result.reason, RejectionReason::APPROVAL_REJECTED);
}

// ============================================================================
// Withdrawal
// ============================================================================

TEST_F(AdmissionGateTest, WithdrawBeforeProcessing) {
    std::string admission_id = gate_->receive(make_record(1));
    EXPECT_TRUE(gate_->withdraw(admission_id, "superseded by rerun"));

    AdmissionResult result = gate_->process(admission_id);
    EXPECT_EQ(result.state, AdmissionState::REJECTED);
    EXPECT_EQ(result.reason, RejectionReason::WITHDRAWN);
    EXPECT_EQ(result.detail, "superseded by rerun");
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(AdmissionGateTest, WithdrawDuringApprovalRequestIsRefused) {
    class WithdrawingChannel : public InMemoryApprovalChannel {
    public:
        std::string request_approval(const std::string& summary, Criticality level) override {
            if (gate) {
                withdrawn = gate->withdraw(admission_id, "changed mind");
            }
            return InMemoryApprovalChannel::request_approval(summary, level);
        }

        AdmissionGate* gate = nullptr;
        std::string admission_id;
        bool withdrawn = true;
    } withdrawing;

    AdmissionGate gate(*store_, lifecycle_, keys_, withdrawing, config_, clock_);
    withdrawing.gate = &gate;
    withdrawing.admission_id = gate.receive(make_record(1, Criticality::HIGH));

    AdmissionResult result = gate.process(withdrawing.admission_id);

    // The ticket that was opened belongs to a live admission
    EXPECT_FALSE(withdrawing.withdrawn);
    EXPECT_EQ(result.state, AdmissionState::AWAITING_APPROVAL);
    ASSERT_EQ(withdrawing.pending_tickets().size(), 1u);
    EXPECT_EQ(*result.ticket_id, withdrawing.pending_tickets().front());
    EXPECT_TRUE(gate.rejection_log().empty());
}

TEST_F(AdmissionGateTest, WithdrawAfterEscalationIsRefused) {
    AdmissionResult escalated = gate_->admit(make_record(1, Criticality::HIGH));
    EXPECT_FALSE(gate_->withdraw(escalated.admission_id));
    EXPECT_EQ(gate_->get_state(escalated.admission_id), AdmissionState::AWAITING_APPROVAL);
}

TEST_F(AdmissionGateTest, WithdrawFinalOrUnknownIsRefused) {
    AdmissionResult appended = gate_->admit(make_record(1));
    EXPECT_FALSE(gate_->withdraw(appended.admission_id));
    EXPECT_FALSE(gate_->withdraw("adm-missing"));
}

// ============================================================================
// Duplicates and Rejection Log
// ============================================================================

TEST_F(AdmissionGateTest, DuplicateRecordIsRejected) {
    GovernanceTuple record = make_record(1);
    gate_->admit(record);

    AdmissionResult again = gate_->admit(record);
    EXPECT_EQ(again.state, AdmissionState::REJECTED);
    EXPECT_EQ(again.reason, RejectionReason::DUPLICATE);
    EXPECT_EQ(store_->size(), 1u);
    EXPECT_THROW(again.require_appended(), InputError);
}

TEST_F(AdmissionGateTest, RejectionsAreLogged) {
    lifecycle_.close_phase("propulsion", "PhaseA");
    GovernanceTuple record = make_record(1);
    AdmissionResult result = gate_->admit(record);

    auto log = gate_->rejection_log();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].admission_id, result.admission_id);
    EXPECT_EQ(log[0].record_id, record.id);
    EXPECT_EQ(log[0].reason, "LifecycleClosed");

    auto logged = GovernanceTuple::from_json(log[0].record_json);
    ASSERT_TRUE(logged.has_value());
    EXPECT_EQ(logged->id, record.id);
}

// ============================================================================
// Restart
// ============================================================================

TEST_F(AdmissionGateTest, ResumeKeepsConsumedWait) {
    AdmissionResult escalated = gate_->admit(make_record(1, Criticality::HIGH));

    clock_->advance(10h);
    gate_->poll_pending();

    // Restart the process: new gate, fresh clock
    gate_.reset();
    auto restarted_clock = std::make_shared<ManualClock>();
    AdmissionGate restarted(*store_, lifecycle_, keys_, channel_, config_, restarted_clock);

    EXPECT_EQ(restarted.resume_pending(), 1u);
    EXPECT_EQ(restarted.get_state(escalated.admission_id), AdmissionState::AWAITING_APPROVAL);
    EXPECT_EQ(restarted.resume_pending(), 0u);

    restarted_clock->advance(61h);
    EXPECT_EQ(restarted.poll_pending(), 0u);

    restarted_clock->advance(1h);
    EXPECT_EQ(restarted.poll_pending(), 1u);
    EXPECT_EQ(restarted.get_result(escalated.admission_id)->reason, RejectionReason::APPROVAL_TIMEOUT);
}

TEST_F(AdmissionGateTest, ResumedAdmissionCanBeApproved) {
    AdmissionResult escalated = gate_->admit(make_record(1, Criticality::HIGH));
    gate_.reset();

    AdmissionGate restarted(*store_, lifecycle_, keys_, channel_, config_, clock_);
    ASSERT_EQ(restarted.resume_pending(), 1u);

    channel_.approve(*escalated.ticket_id, "chief-engineer");
    EXPECT_EQ(restarted.poll_pending(), 1u);
    EXPECT_EQ(restarted.get_state(escalated.admission_id), AdmissionState::APPENDED);
    EXPECT_EQ(store_->size(), 1u);
}

// ============================================================================
// Worker Pool
// ============================================================================

TEST_F(AdmissionGateTest, ConcurrentSubmissionsAreGapless) {
    ASSERT_TRUE(gate_->start());
    EXPECT_TRUE(gate_->is_running());

    std::vector<AdmissionTicket> tickets;
    for (int i = 0; i < 3; ++i) {
        tickets.push_back(gate_->submit(make_record(i)));
    }

    std::set<uint64_t> indices;
    for (auto& ticket : tickets) {
        ASSERT_EQ(ticket.result.wait_for(10s), std::future_status::ready);
        AdmissionResult result = ticket.result.get();
        EXPECT_EQ(result.state, AdmissionState::APPENDED);
        indices.insert(*result.sequence_index);

        // The ledger slot holds the record that was admitted into it
        EXPECT_EQ(store_->read(*result.sequence_index)->record.id, result.record_id);
    }

    EXPECT_EQ(indices, (std::set<uint64_t>{0, 1, 2}));
    EXPECT_EQ(store_->size(), 3u);

    gate_->stop();
    EXPECT_FALSE(gate_->is_running());
}

TEST_F(AdmissionGateTest, ConcurrentProcessAppendsOnce) {
    for (int i = 0; i < 20; ++i) {
        std::string admission_id = gate_->receive(make_record(i));

        std::thread first([&]() { gate_->process(admission_id); });
        std::thread second([&]() { gate_->process(admission_id); });
        first.join();
        second.join();

        auto result = gate_->get_result(admission_id);
        EXPECT_EQ(result->state, AdmissionState::APPENDED);
        EXPECT_EQ(result->sequence_index, static_cast<uint64_t>(i));
        EXPECT_EQ(store_->size(), static_cast<uint64_t>(i + 1));
    }

    EXPECT_TRUE(gate_->rejection_log().empty());
}

TEST_F(AdmissionGateTest, ConcurrentProcessEscalatesOnce) {
    std::string admission_id = gate_->receive(make_record(1, Criticality::HIGH));

    std::thread first([&]() { gate_->process(admission_id); });
    std::thread second([&]() { gate_->process(admission_id); });
    first.join();
    second.join();

    EXPECT_EQ(gate_->get_state(admission_id), AdmissionState::AWAITING_APPROVAL);
    EXPECT_EQ(channel_.request_count(), 1u);
    EXPECT_EQ(store_->storage().load_pending().size(), 1u);
}

TEST_F(AdmissionGateTest, StopDrainsQueuedAdmissions) {
    config_.worker_threads = 1;
    reopen(config_);
    ASSERT_TRUE(gate_->start());

    std::vector<AdmissionTicket> tickets;
    for (int i = 0; i < 5; ++i) {
        tickets.push_back(gate_->submit(make_record(i)));
    }
    gate_->stop();

    for (auto& ticket : tickets) {
        ASSERT_EQ(ticket.result.wait_for(0s), std::future_status::ready);
        EXPECT_EQ(ticket.result.get().state, AdmissionState::APPENDED);
    }
    EXPECT_EQ(store_->size(), 5u);
    EXPECT_THROW(gate_->submit(make_record(9)), std::runtime_error);
}

TEST_F(AdmissionGateTest, SubmitRequiresRunningGate) {
    EXPECT_THROW(gate_->submit(make_record(1)), std::runtime_error);
}

TEST_F(AdmissionGateTest, StartTwiceFails) {
    ASSERT_TRUE(gate_->start());
    EXPECT_FALSE(gate_->start());
    gate_->stop();
}

TEST_F(AdmissionGateTest, PollTimerResolvesApprovals) {
    config_.approval_poll_interval = 10ms;
    gate_.reset();
    gate_ = std::make_unique<AdmissionGate>(*store_, lifecycle_, keys_, channel_, config_, clock_);
    ASSERT_TRUE(gate_->start());

    AdmissionTicket ticket = gate_->submit(make_record(1, Criticality::HIGH));

    // Wait until the worker has escalated
    for (int i = 0; i < 500 && channel_.pending_tickets().empty(); ++i) {
        std::this_thread::sleep_for(2ms);
    }
    ASSERT_EQ(channel_.pending_tickets().size(), 1u);
    channel_.approve(channel_.pending_tickets().front(), "chief-engineer");

    ASSERT_EQ(ticket.result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(ticket.result.get().state, AdmissionState::APPENDED);

    gate_->stop();
}

// ============================================================================
// Persistence Failure
// ============================================================================

TEST_F(AdmissionGateTest, PersistenceFailureHaltsGate) {
    config_.append_max_attempts = 2;
    gate_.reset();
    store_.reset();
    store_ = std::make_unique<LedgerStore>("propulsion", db_path_, config_);
    gate_ = std::make_unique<AdmissionGate>(*store_, lifecycle_, keys_, channel_, config_, clock_);

    sqlite3* blocker = nullptr;
    ASSERT_EQ(sqlite3_open(db_path_.c_str(), &blocker), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(blocker, "BEGIN EXCLUSIVE", nullptr, nullptr, nullptr), SQLITE_OK);

    std::string admission_id = gate_->receive(make_record(1));
    auto future = gate_->completion(admission_id);
    EXPECT_THROW(gate_->process(admission_id), PersistenceError);
    EXPECT_TRUE(gate_->has_failed());
    EXPECT_THROW(future->get(), PersistenceError);

    sqlite3_exec(blocker, "ROLLBACK", nullptr, nullptr, nullptr);
    sqlite3_close(blocker);

    // Halted until restarted
    EXPECT_THROW(gate_->receive(make_record(2)), PersistenceError);
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(AdmissionGateTest, HaltedAppendIsRetriedAfterRestart) {
    config_.append_max_attempts = 2;
    reopen(config_);

    exec_sql("CREATE TRIGGER block_append BEFORE INSERT ON entries "
             "BEGIN SELECT RAISE(ABORT, 'disk full'); END;");

    GovernanceTuple record = make_record(1);
    std::string admission_id = gate_->receive(record);
    EXPECT_THROW(gate_->process(admission_id), PersistenceError);
    EXPECT_TRUE(gate_->has_failed());
    EXPECT_EQ(store_->size(), 0u);

    // The approved record survives the halt
    auto pending = store_->storage().load_pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].admission_id, admission_id);
    EXPECT_TRUE(pending[0].ticket_id.empty());

    exec_sql("DROP TRIGGER block_append");
    reopen(config_);

    EXPECT_EQ(gate_->resume_pending(), 1u);
    EXPECT_EQ(gate_->get_state(admission_id), AdmissionState::APPENDED);
    ASSERT_EQ(store_->size(), 1u);
    EXPECT_EQ(store_->read(0)->record.id, record.id);
    EXPECT_TRUE(store_->storage().load_pending().empty());
}

TEST_F(AdmissionGateTest, UnpersistedEscalationHaltsGate) {
    config_.append_max_attempts = 2;
    reopen(config_);

    exec_sql("CREATE TRIGGER block_pending BEFORE INSERT ON pending_approvals "
             "BEGIN SELECT RAISE(ABORT, 'disk full'); END;");

    std::string admission_id = gate_->receive(make_record(1, Criticality::HIGH));
    auto future = gate_->completion(admission_id);

    EXPECT_THROW(gate_->process(admission_id), PersistenceError);
    EXPECT_TRUE(gate_->has_failed());
    EXPECT_THROW(future->get(), PersistenceError);
    EXPECT_EQ(gate_->pending_count(), 0u);

    // Decisions are not acted on while halted
    channel_.approve(channel_.pending_tickets().front(), "chief-engineer");
    EXPECT_EQ(gate_->poll_pending(), 0u);
    EXPECT_EQ(store_->size(), 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
