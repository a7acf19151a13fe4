/**
 * @file test_ledger_crypto.cpp
 * @brief Unit tests for LedgerCrypto, Ed25519Signer and KeyDirectory
 *
 * Tests cryptographic primitives including:
 * - SHA-256 hashing
 * - Ed25519 signing and verification
 * - Hex and base64 encoding
 * - Signer key persistence
 * - Public key directory
 */

#include <gtest/gtest.h>
#include "govledger/ledger_crypto.hpp"
#include "govledger/signer.hpp"
#include "govledger/errors.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <algorithm>

using namespace govledger;
namespace fs = std::filesystem;

class LedgerCryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(LedgerCrypto::initialize());
    }
};

// ============================================================================
// Hashing Tests
// ============================================================================

TEST_F(LedgerCryptoTest, Sha256KnownVector) {
    Hash256 hash = LedgerCrypto::sha256(std::string("abc"));
    EXPECT_EQ(LedgerCrypto::hash_to_hex(hash),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(LedgerCryptoTest, Sha256EmptyInput) {
    Hash256 hash = LedgerCrypto::sha256(std::string());
    EXPECT_EQ(LedgerCrypto::hash_to_hex(hash),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(LedgerCryptoTest, Sha256StringAndBytesAgree) {
    std::string text = "governance evidence";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(LedgerCrypto::sha256(text), LedgerCrypto::sha256(bytes));
}

TEST_F(LedgerCryptoTest, ZeroHashIsAllZero) {
    Hash256 zero = LedgerCrypto::zero_hash();
    for (uint8_t byte : zero) {
        EXPECT_EQ(byte, 0);
    }
}

// ============================================================================
// Signature Tests
// ============================================================================

TEST_F(LedgerCryptoTest, SignAndVerify) {
    auto keypair = LedgerCrypto::generate_signing_keypair();
    std::vector<uint8_t> message = {1, 2, 3, 4, 5};

    auto signature = LedgerCrypto::sign_message(message, keypair.secret_key);
    ASSERT_TRUE(signature.has_value());
    EXPECT_EQ(signature->size(), crypto_sign_BYTES);

    EXPECT_TRUE(LedgerCrypto::verify_signature(message, *signature, keypair.public_key));
}

TEST_F(LedgerCryptoTest, VerifyRejectsModifiedMessage) {
    auto keypair = LedgerCrypto::generate_signing_keypair();
    std::vector<uint8_t> message = {1, 2, 3, 4, 5};
    auto signature = LedgerCrypto::sign_message(message, keypair.secret_key);
    ASSERT_TRUE(signature.has_value());

    message[0] ^= 0x01;
    EXPECT_FALSE(LedgerCrypto::verify_signature(message, *signature, keypair.public_key));
}

TEST_F(LedgerCryptoTest, VerifyRejectsWrongKey) {
    auto alice = LedgerCrypto::generate_signing_keypair();
    auto bob = LedgerCrypto::generate_signing_keypair();
    std::vector<uint8_t> message = {9, 8, 7};
    auto signature = LedgerCrypto::sign_message(message, alice.secret_key);
    ASSERT_TRUE(signature.has_value());

    EXPECT_FALSE(LedgerCrypto::verify_signature(message, *signature, bob.public_key));
}

TEST_F(LedgerCryptoTest, VerifyRejectsTruncatedSignature) {
    auto keypair = LedgerCrypto::generate_signing_keypair();
    std::vector<uint8_t> message = {1};
    auto signature = LedgerCrypto::sign_message(message, keypair.secret_key);
    ASSERT_TRUE(signature.has_value());

    signature->pop_back();
    EXPECT_FALSE(LedgerCrypto::verify_signature(message, *signature, keypair.public_key));
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST_F(LedgerCryptoTest, HexRoundTrip) {
    std::vector<uint8_t> bytes = {0x00, 0x7f, 0x80, 0xff};
    std::string hex = LedgerCrypto::bytes_to_hex(bytes);
    EXPECT_EQ(hex, "007f80ff");

    auto decoded = LedgerCrypto::hex_to_bytes(hex);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}

TEST_F(LedgerCryptoTest, HexRejectsOddLength) {
    EXPECT_FALSE(LedgerCrypto::hex_to_bytes("abc").has_value());
}

TEST_F(LedgerCryptoTest, HexToHashRequiresExactLength) {
    EXPECT_FALSE(LedgerCrypto::hex_to_hash("abcd").has_value());

    Hash256 hash = LedgerCrypto::sha256(std::string("x"));
    auto decoded = LedgerCrypto::hex_to_hash(LedgerCrypto::hash_to_hex(hash));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, hash);
}

TEST_F(LedgerCryptoTest, Base64RoundTrip) {
    std::vector<uint8_t> bytes = {'s', 'n', 'a', 'p', 0, 1, 2};
    auto decoded = LedgerCrypto::base64_to_bytes(LedgerCrypto::bytes_to_base64(bytes));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}

TEST_F(LedgerCryptoTest, ConstantTimeCompare) {
    std::vector<uint8_t> a = {1, 2, 3};
    std::vector<uint8_t> b = {1, 2, 3};
    std::vector<uint8_t> c = {1, 2, 4};
    std::vector<uint8_t> d = {1, 2};

    EXPECT_TRUE(LedgerCrypto::constant_time_compare(a, b));
    EXPECT_FALSE(LedgerCrypto::constant_time_compare(a, c));
    EXPECT_FALSE(LedgerCrypto::constant_time_compare(a, d));
}

// ============================================================================
// Signer Tests
// ============================================================================

class SignerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(LedgerCrypto::initialize());

        test_dir_ = fs::temp_directory_path() / "govledger_signer_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path test_dir_;
};

TEST_F(SignerTest, SignatureVerifiesWithPublicKey) {
    Ed25519Signer signer("solver-host-1");
    std::vector<uint8_t> message = {'r', 'e', 'c'};

    auto signature = signer.sign(message);
    EXPECT_TRUE(Ed25519Signer::verify(signer.public_key(), message, signature));
}

TEST_F(SignerTest, InvalidSignerIdThrows) {
    EXPECT_THROW(Ed25519Signer("bad id with spaces"), InputError);
    EXPECT_THROW(Ed25519Signer(""), InputError);
}

TEST_F(SignerTest, SaveAndLoad) {
    Ed25519Signer original("solver-host-1");
    ASSERT_TRUE(original.save(test_dir_));

    EXPECT_TRUE(fs::exists(test_dir_ / "solver-host-1_signing.key"));
    EXPECT_TRUE(fs::exists(test_dir_ / "solver-host-1.pub"));

    auto loaded = Ed25519Signer::load("solver-host-1", test_dir_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->public_key(), original.public_key());

    std::vector<uint8_t> message = {42};
    EXPECT_TRUE(Ed25519Signer::verify(original.public_key(), message, loaded->sign(message)));
}

#ifndef _WIN32
TEST_F(SignerTest, SigningKeyIsOwnerOnly) {
    Ed25519Signer signer("solver-host-1");
    ASSERT_TRUE(signer.save(test_dir_));

    auto perms = fs::status(test_dir_ / "solver-host-1_signing.key").permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}
#endif

TEST_F(SignerTest, LoadMissingSignerFails) {
    EXPECT_FALSE(Ed25519Signer::load("nobody", test_dir_).has_value());
}

TEST_F(SignerTest, LoadRejectsMismatchedKeyPair) {
    Ed25519Signer first("solver-host-1");
    Ed25519Signer second("solver-host-2");
    ASSERT_TRUE(first.save(test_dir_));
    ASSERT_TRUE(second.save(test_dir_));

    // Splice second's public key in front of first's secret key
    fs::path key_path = test_dir_ / "solver-host-1_signing.key";
    std::ifstream key_in(key_path, std::ios::binary);
    std::string key_bytes((std::istreambuf_iterator<char>(key_in)), std::istreambuf_iterator<char>());
    key_in.close();
    ASSERT_EQ(key_bytes.size(), crypto_sign_PUBLICKEYBYTES + crypto_sign_SECRETKEYBYTES);

    PublicKey other = second.public_key();
    std::copy(other.begin(), other.end(), key_bytes.begin());

    fs::permissions(key_path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    std::ofstream key_out(key_path, std::ios::binary | std::ios::trunc);
    key_out.write(key_bytes.data(), static_cast<std::streamsize>(key_bytes.size()));
    key_out.close();

    EXPECT_FALSE(Ed25519Signer::load("solver-host-1", test_dir_).has_value());
}

TEST_F(SignerTest, RemoveDeletesKeyFiles) {
    Ed25519Signer signer("solver-host-1");
    ASSERT_TRUE(signer.save(test_dir_));

    EXPECT_TRUE(Ed25519Signer::remove("solver-host-1", test_dir_));
    EXPECT_FALSE(fs::exists(test_dir_ / "solver-host-1_signing.key"));
    EXPECT_FALSE(fs::exists(test_dir_ / "solver-host-1.pub"));
}

TEST_F(SignerTest, CopiedSignerSignsIdentically) {
    Ed25519Signer original("solver-host-1");
    Ed25519Signer copy(original);

    EXPECT_EQ(copy.signer_id(), original.signer_id());
    EXPECT_EQ(copy.public_key(), original.public_key());

    // Ed25519 is deterministic
    std::vector<uint8_t> message = {7, 7, 7};
    EXPECT_EQ(copy.sign(message), original.sign(message));
}

// ============================================================================
// Key Directory Tests
// ============================================================================

TEST_F(SignerTest, KeyDirectoryVerifiesRegisteredSigner) {
    Ed25519Signer signer("solver-host-1");
    KeyDirectory keys;
    keys.register_key(signer.signer_id(), signer.public_key());

    std::vector<uint8_t> message = {1, 2};
    auto signature = signer.sign(message);

    EXPECT_TRUE(keys.verify("solver-host-1", message, signature));
    EXPECT_FALSE(keys.verify("solver-host-2", message, signature));
}

TEST_F(SignerTest, KeyDirectoryRevoke) {
    Ed25519Signer signer("solver-host-1");
    KeyDirectory keys;
    keys.register_key(signer.signer_id(), signer.public_key());
    EXPECT_EQ(keys.size(), 1u);

    EXPECT_TRUE(keys.revoke("solver-host-1"));
    EXPECT_FALSE(keys.revoke("solver-host-1"));
    EXPECT_FALSE(keys.find("solver-host-1").has_value());

    std::vector<uint8_t> message = {1};
    EXPECT_FALSE(keys.verify("solver-host-1", message, signer.sign(message)));
}

TEST_F(SignerTest, KeyDirectoryLoadsPublicKeyFiles) {
    Ed25519Signer a("solver-host-1");
    Ed25519Signer b("solver-host-2");
    ASSERT_TRUE(a.save(test_dir_));
    ASSERT_TRUE(b.save(test_dir_));

    // Truncated key is skipped
    std::ofstream broken(test_dir_ / "broken.pub");
    broken << "short";
    broken.close();

    KeyDirectory keys;
    EXPECT_EQ(keys.load_directory(test_dir_), 2u);

    auto found = keys.find("solver-host-2");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, b.public_key());
}

TEST_F(SignerTest, KeyDirectoryLoadMissingDirectory) {
    KeyDirectory keys;
    EXPECT_EQ(keys.load_directory(test_dir_ / "does-not-exist"), 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
