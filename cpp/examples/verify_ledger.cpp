/**
 * @file verify_ledger.cpp
 * @brief Offline integrity check of a ledger database
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Usage: govledger_verify <database> [--keys DIR] [--json] [--batch-size N]
 *
 * Exit status is 0 when the ledger is intact, 2 when tampering is found
 * and 1 on usage or I/O errors.
 */

#include "govledger/integrity_verifier.hpp"
#include "govledger/ledger_config.hpp"
#include "govledger/signer.hpp"
#include "govledger/utilities.hpp"

#include <iostream>
#include <optional>
#include <string>

using namespace govledger;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <database> [--keys DIR] [--json] [--batch-size N]\n";
    std::cerr << "  --keys DIR        Also verify record signatures against DIR/*.pub\n";
    std::cerr << "  --json            Print the report as JSON\n";
    std::cerr << "  --batch-size N    Merkle batch size the ledger was written with (default: the\n"
              << "                    size stored in the ledger, else " << DEFAULT_BATCH_SIZE << ")\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string database_path;
    std::string key_dir;
    bool as_json = false;
    std::optional<uint64_t> batch_size;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--json") {
            as_json = true;
        } else if (arg == "--keys" && i + 1 < argc) {
            key_dir = argv[++i];
        } else if (arg == "--batch-size" && i + 1 < argc) {
            try {
                batch_size = std::stoull(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid batch size: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (database_path.empty() && arg.rfind("--", 0) != 0) {
            database_path = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (database_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    // Reports go to stdout; keep the log quiet
    utilities::initialize_logging("", utilities::LogLevel::WARN);

    try {
        IntegrityVerifier verifier(database_path, batch_size);

        KeyDirectory keys;
        if (!key_dir.empty()) {
            size_t loaded = keys.load_directory(key_dir);
            if (loaded == 0) {
                std::cerr << "No public keys found in " << key_dir << "\n";
                return 1;
            }
            verifier.set_key_directory(&keys);
        }

        IntegrityReport report = verifier.verify_all();

        if (as_json) {
            std::cout << report.to_json() << "\n";
        } else {
            std::cout << report.to_text();
        }

        return report.intact ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
