/**
 * @file test_ledger_config.cpp
 * @brief Unit tests for ledger configuration and input validation
 */

#include <gtest/gtest.h>
#include "govledger/ledger_config.hpp"
#include "govledger/errors.hpp"
#include "govledger/utilities.hpp"
#include <filesystem>
#include <cstdlib>

using namespace govledger;
namespace fs = std::filesystem;

class LedgerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "govledger_config_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        clear_env();
    }

    void TearDown() override {
        clear_env();
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    static void clear_env() {
        unsetenv("GOVLEDGER_BATCH_SIZE");
        unsetenv("GOVLEDGER_APPROVAL_TIMEOUT_SECONDS");
        unsetenv("GOVLEDGER_OVERSIGHT_THRESHOLD");
        unsetenv("GOVLEDGER_WORKER_THREADS");
    }

    fs::path test_dir_;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(LedgerConfigTest, DefaultsAreValid) {
    LedgerConfig config;
    EXPECT_NO_THROW(validate_config(config));

    EXPECT_EQ(config.batch_size, 1024u);
    EXPECT_EQ(config.oversight_threshold, Criticality::HIGH);
    EXPECT_EQ(config.approval_timeout, std::chrono::hours(72));
    EXPECT_TRUE(config.verify_on_open);
}

// ============================================================================
// JSON Configuration
// ============================================================================

TEST_F(LedgerConfigTest, ParsesJsonOverrides) {
    LedgerConfig config = config_from_json(R"({
        "batch_size": 16,
        "append_max_attempts": 3,
        "append_base_backoff_ms": 10,
        "oversight_threshold": "critical",
        "approval_timeout_seconds": 3600,
        "worker_threads": 2,
        "verify_on_open": false
    })");

    EXPECT_EQ(config.batch_size, 16u);
    EXPECT_EQ(config.append_max_attempts, 3u);
    EXPECT_EQ(config.append_base_backoff, std::chrono::milliseconds(10));
    EXPECT_EQ(config.oversight_threshold, Criticality::CRITICAL);
    EXPECT_EQ(config.approval_timeout, std::chrono::seconds(3600));
    EXPECT_EQ(config.worker_threads, 2u);
    EXPECT_FALSE(config.verify_on_open);

    // Unset keys keep their defaults
    EXPECT_EQ(config.max_page_size, MAX_PAGE_SIZE);
}

TEST_F(LedgerConfigTest, RejectsMalformedJson) {
    EXPECT_THROW(config_from_json("{ not json"), InputError);
    EXPECT_THROW(config_from_json("[1, 2, 3]"), InputError);
}

TEST_F(LedgerConfigTest, RejectsWrongValueType) {
    EXPECT_THROW(config_from_json(R"({"batch_size": "large"})"), InputError);
    EXPECT_THROW(config_from_json(R"({"oversight_threshold": "urgent"})"), InputError);
}

TEST_F(LedgerConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(config_from_json(R"({"batch_size": 1})"), InputError);
    EXPECT_THROW(config_from_json(R"({"worker_threads": 0})"), InputError);
    EXPECT_THROW(config_from_json(R"({"default_page_size": 5000})"), InputError);
}

TEST_F(LedgerConfigTest, RetryPolicyIsBounded) {
    LedgerConfig config;

    config.append_max_attempts = MAX_APPEND_ATTEMPTS;
    EXPECT_NO_THROW(validate_config(config));

    config.append_max_attempts = 64;
    EXPECT_THROW(validate_config(config), InputError);

    config.append_max_attempts = DEFAULT_APPEND_MAX_ATTEMPTS;
    config.append_base_backoff = MAX_APPEND_BACKOFF + std::chrono::milliseconds(1);
    EXPECT_THROW(validate_config(config), InputError);

    config.append_base_backoff = std::chrono::milliseconds(-5);
    EXPECT_THROW(validate_config(config), InputError);

    EXPECT_THROW(config_from_json(R"({"append_max_attempts": 100})"), InputError);
}

TEST_F(LedgerConfigTest, LoadConfigFromFile) {
    std::string path = (test_dir_ / "ledger.json").string();
    ASSERT_TRUE(utilities::write_file(path, R"({"batch_size": 64})"));

    LedgerConfig config = load_config(path);
    EXPECT_EQ(config.batch_size, 64u);
}

TEST_F(LedgerConfigTest, LoadConfigMissingFileThrows) {
    EXPECT_THROW(load_config((test_dir_ / "missing.json").string()), InputError);
}

// ============================================================================
// Environment Overrides
// ============================================================================

TEST_F(LedgerConfigTest, EnvironmentOverridesFile) {
    std::string path = (test_dir_ / "ledger.json").string();
    ASSERT_TRUE(utilities::write_file(path, R"({"batch_size": 64, "worker_threads": 2})"));

    setenv("GOVLEDGER_BATCH_SIZE", "128", 1);
    setenv("GOVLEDGER_OVERSIGHT_THRESHOLD", "medium", 1);

    LedgerConfig config = load_config(path);
    EXPECT_EQ(config.batch_size, 128u);
    EXPECT_EQ(config.oversight_threshold, Criticality::MEDIUM);
    EXPECT_EQ(config.worker_threads, 2u);
}

TEST_F(LedgerConfigTest, EnvironmentRejectsGarbage) {
    LedgerConfig config;

    setenv("GOVLEDGER_WORKER_THREADS", "four", 1);
    EXPECT_THROW(apply_env_overrides(config), InputError);

    setenv("GOVLEDGER_WORKER_THREADS", "-4", 1);
    EXPECT_THROW(apply_env_overrides(config), InputError);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(LedgerConfigTest, ValidIdentifiers) {
    EXPECT_TRUE(validate_identifier("propulsion"));
    EXPECT_TRUE(validate_identifier("PhaseA"));
    EXPECT_TRUE(validate_identifier("nozzle-optimizer_2.1"));
}

TEST_F(LedgerConfigTest, InvalidIdentifiers) {
    EXPECT_FALSE(validate_identifier(""));
    EXPECT_FALSE(validate_identifier("has space"));
    EXPECT_FALSE(validate_identifier("slash/path"));
    EXPECT_FALSE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH + 1, 'a')));
    EXPECT_TRUE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH, 'a')));
}

TEST_F(LedgerConfigTest, References) {
    EXPECT_TRUE(validate_reference("urn:req:propulsion/42"));
    EXPECT_FALSE(validate_reference(""));
    EXPECT_FALSE(validate_reference("line\nbreak"));
    EXPECT_FALSE(validate_reference(std::string(MAX_REFERENCE_LENGTH + 1, 'r')));
}

TEST_F(LedgerConfigTest, DataDirectoryFollowsEnvironment) {
    setenv("GOVLEDGER_DATA_DIR", test_dir_.string().c_str(), 1);

    EXPECT_EQ(get_data_directory(), test_dir_);
    EXPECT_TRUE(fs::is_directory(get_database_directory()));
    EXPECT_TRUE(fs::is_directory(get_key_directory()));

    unsetenv("GOVLEDGER_DATA_DIR");
}

// ============================================================================
// Utilities
// ============================================================================

TEST_F(LedgerConfigTest, FormatDuration) {
    EXPECT_EQ(utilities::format_duration(0), "0s");
    EXPECT_EQ(utilities::format_duration(90), "1m 30s");
    EXPECT_EQ(utilities::format_duration(72 * 3600), "72h");
}

TEST_F(LedgerConfigTest, ParseLogLevel) {
    EXPECT_EQ(utilities::parse_log_level("warn"), utilities::LogLevel::WARN);
    EXPECT_EQ(utilities::parse_log_level("CRITICAL"), utilities::LogLevel::CRITICAL);
    EXPECT_FALSE(utilities::parse_log_level("verbose").has_value());
}

TEST_F(LedgerConfigTest, FileHashMatchesContent) {
    std::string path = (test_dir_ / "evidence.txt").string();
    ASSERT_TRUE(utilities::write_file(path, "abc"));

    auto hash = utilities::calculate_file_hash(path);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(*hash, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(LedgerConfigTest, WriteFileReplacesWithoutLeftovers) {
    std::string path = (test_dir_ / "exports" / "ledger.json").string();
    ASSERT_TRUE(utilities::write_file(path, "first"));
    ASSERT_TRUE(utilities::write_file(path, "second"));

    EXPECT_EQ(utilities::read_file(path).value_or(""), "second");
    EXPECT_FALSE(fs::exists(path + ".partial"));
    EXPECT_FALSE(utilities::calculate_file_hash((test_dir_ / "absent").string()).has_value());
}

TEST_F(LedgerConfigTest, BlankEnvironmentValueIsUnset) {
    setenv("GOVLEDGER_TEST_VALUE", "   ", 1);
    EXPECT_FALSE(utilities::env_value("GOVLEDGER_TEST_VALUE").has_value());

    setenv("GOVLEDGER_TEST_VALUE", " 12 ", 1);
    EXPECT_EQ(utilities::env_value("GOVLEDGER_TEST_VALUE").value_or(""), "12");
    unsetenv("GOVLEDGER_TEST_VALUE");
}

TEST_F(LedgerConfigTest, IdentifiersAreUnique) {
    std::string first = utilities::make_identifier("ticket");
    std::string second = utilities::make_identifier("ticket");

    EXPECT_EQ(first.rfind("ticket-", 0), 0u);
    EXPECT_EQ(first.size(), std::string("ticket-").size() + 32);
    EXPECT_NE(first, second);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
