/**
 * @file ledger_demo.cpp
 * @brief End-to-end walkthrough of a governance ledger partition
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates:
 * - Building signed records from solver output
 * - Admission with lifecycle checks and human approval
 * - Paginated queries with per-entry proofs
 * - Offline verification of the database
 */

#include "govledger/admission_gate.hpp"
#include "govledger/approval_channel.hpp"
#include "govledger/integrity_verifier.hpp"
#include "govledger/ledger_store.hpp"
#include "govledger/lifecycle_registry.hpp"
#include "govledger/query_engine.hpp"
#include "govledger/record_builder.hpp"
#include "govledger/signer.hpp"
#include "govledger/utilities.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <memory>

using namespace govledger;
using json = nlohmann::json;
namespace fs = std::filesystem;

int main(int argc, char** argv) {
    fs::path work_dir = argc >= 2 ? fs::path(argv[1]) : fs::temp_directory_path() / "govledger_demo";

    try {
        std::cout << "\n=== GovLedger Demo ===\n\n";

        fs::remove_all(work_dir);
        fs::create_directories(work_dir);
        std::string db_path = (work_dir / "propulsion.db").string();

        utilities::initialize_logging((work_dir / "demo.log").string(), utilities::LogLevel::INFO);

        // Signing identity of the solver host
        Ed25519Signer signer("solver-host-1");
        KeyDirectory keys;
        keys.register_key(signer.signer_id(), signer.public_key());
        signer.save(work_dir);

        LifecycleRegistry lifecycle;
        lifecycle.open_phase("propulsion", "PhaseA");

        InMemoryApprovalChannel channel;

        LedgerConfig config;
        config.batch_size = 8;
        config.worker_threads = 2;

        LedgerStore store("propulsion", db_path, config);
        store.on_batch_sealed([](const MerkleBatch& batch) {
            std::cout << "  [sealed] batch " << batch.batch_index << " root "
                      << LedgerCrypto::hash_to_hex(batch.root) << "\n";
        });

        AdmissionGate gate(store, lifecycle, keys, channel, config);
        RecordBuilder builder(signer);

        // Routine records go straight through
        std::cout << "Admitting routine design computations...\n";
        for (int i = 0; i < 10; ++i) {
            RecordRequest request;
            request.inputs = {{"chamber_pressure_bar", 60 + i}, {"mixture_ratio", 2.4}};
            request.ranked_results = json::array({{{"design", "A" + std::to_string(i)}, {"score", 0.9}}});
            request.solver_identity = "nozzle-optimizer-2.1";
            request.lifecycle_phase = "PhaseA";
            request.category = "propulsion";
            request.upstream_ref = "req-" + std::to_string(i);

            AdmissionResult result = gate.admit(builder.build_record(request));
            std::cout << "  " << result.record_id << " -> " << admission_state_to_string(result.state)
                      << " #" << result.sequence_index.value_or(0) << "\n";
        }

        // A critical record waits for a human decision
        std::cout << "\nSubmitting critical design freeze...\n";
        RecordRequest freeze;
        freeze.inputs = {{"baseline", "A7"}};
        freeze.ranked_results = json::array({"A7"});
        freeze.solver_identity = "nozzle-optimizer-2.1";
        freeze.lifecycle_phase = "PhaseA";
        freeze.category = "propulsion";
        freeze.record_type = "design_state";
        freeze.criticality_level = Criticality::CRITICAL;
        freeze.upstream_ref = "req-freeze";

        AdmissionResult escalated = gate.admit(builder.build_record(freeze));
        std::cout << "  State: " << admission_state_to_string(escalated.state)
                  << " (ticket " << escalated.ticket_id.value_or("-") << ")\n";

        if (escalated.ticket_id) {
            channel.approve(*escalated.ticket_id, "chief-engineer", "Baseline A7 frozen for PDR");
            gate.poll_pending();
        }

        auto final_result = gate.get_result(escalated.admission_id);
        std::cout << "  After approval: " << admission_state_to_string(final_result->state) << "\n";

        // Records from a closed phase are refused
        lifecycle.close_phase("propulsion", "PhaseA");
        RecordRequest late = freeze;
        late.criticality_level = Criticality::LOW;
        late.upstream_ref = "req-late";
        AdmissionResult refused = gate.admit(builder.build_record(late));
        std::cout << "  Late record: " << admission_state_to_string(refused.state) << " ("
                  << rejection_reason_to_string(refused.reason) << ")\n";

        // Queries
        std::cout << "\nQuerying PhaseA propulsion records (page size 4)...\n";
        QueryEngine engine(store);

        QueryFilter filter;
        filter.category = "propulsion";
        filter.lifecycle_phase = "PhaseA";
        filter.page_size = 4;

        int page_number = 0;
        while (true) {
            QueryPage page = engine.query(filter);
            if (page.status != QueryStatus::OK) {
                std::cout << "  " << query_status_to_string(page.status) << ": " << page.message << "\n";
                break;
            }

            std::cout << "  Page " << ++page_number << ":";
            for (const auto& result : page.entries) {
                std::cout << " #" << result.entry.sequence_index
                          << (result.artifact.kind == ProofKind::MERKLE_BATCH ? "[M]" : "[C]")
                          << (engine.verify_artifact(result) ? "" : "!");
            }
            std::cout << "\n";

            if (page.next_page_token.empty()) {
                break;
            }
            filter.page_token = page.next_page_token;
        }

        std::cout << "\nLedger statistics:\n" << store.stats().to_json() << "\n";

        // Offline verification
        std::cout << "\nVerifying database offline...\n";
        IntegrityVerifier verifier(db_path, config.batch_size);
        verifier.set_key_directory(&keys);
        std::cout << verifier.verify_all().to_text();

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
