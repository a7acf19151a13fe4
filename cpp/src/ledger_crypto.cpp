/**
 * @file ledger_crypto.cpp
 * @brief Implementation of ledger cryptographic primitives
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - SHA-256: record, chain and Merkle hashing
 * - Ed25519: record signatures (128-bit security)
 * - libsodium: Industry-standard implementation
 */

#include "govledger/ledger_crypto.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace govledger {

// ============================================================================
// Initialization
// ============================================================================

bool LedgerCrypto::initialize() {
    // sodium_init() returns 1 when already initialized
    return sodium_init() >= 0;
}

// ============================================================================
// Hashing (SHA-256)
// ============================================================================

Hash256 LedgerCrypto::sha256(const std::vector<uint8_t>& data) {
    Hash256 hash;
    crypto_hash_sha256(hash.data(), data.data(), data.size());
    return hash;
}

Hash256 LedgerCrypto::sha256(const std::string& data) {
    Hash256 hash;
    crypto_hash_sha256(
        hash.data(),
        reinterpret_cast<const uint8_t*>(data.data()),
        data.size()
    );
    return hash;
}

Hash256 LedgerCrypto::zero_hash() {
    Hash256 hash;
    hash.fill(0);
    return hash;
}

// ============================================================================
// Digital Signatures (Ed25519)
// ============================================================================

SigningKeyPair LedgerCrypto::generate_signing_keypair() {
    SigningKeyPair keypair;

    crypto_sign_keypair(
        keypair.public_key.data(),
        keypair.secret_key.data()
    );

    return keypair;
}

std::optional<std::vector<uint8_t>> LedgerCrypto::sign_message(
    const std::vector<uint8_t>& message,
    const SecretKey& secret_key
) {
    std::vector<uint8_t> signature(crypto_sign_BYTES);

    unsigned long long signature_len = 0;
    int result = crypto_sign_detached(
        signature.data(),
        &signature_len,
        message.data(),
        message.size(),
        secret_key.data()
    );

    if (result != 0 || signature_len != crypto_sign_BYTES) {
        return std::nullopt;
    }

    return signature;
}

bool LedgerCrypto::verify_signature(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const PublicKey& public_key
) {
    // Signature must be exactly 64 bytes
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }

    int result = crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    );

    return result == 0;
}

// ============================================================================
// Utility Functions
// ============================================================================

bool LedgerCrypto::constant_time_compare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    if (a.size() != b.size()) {
        return false;
    }

    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool LedgerCrypto::constant_time_compare(const Hash256& a, const Hash256& b) {
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string LedgerCrypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::string LedgerCrypto::hash_to_hex(const Hash256& hash) {
    return bytes_to_hex(std::vector<uint8_t>(hash.begin(), hash.end()));
}

std::optional<std::vector<uint8_t>> LedgerCrypto::hex_to_bytes(const std::string& hex) {
    // Hex string must have even length
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(hex.length() / 2);
    size_t decoded_len = 0;

    int result = sodium_hex2bin(
        bytes.data(),
        bytes.size(),
        hex.c_str(),
        hex.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        nullptr
    );

    if (result != 0 || decoded_len != bytes.size()) {
        return std::nullopt;
    }

    return bytes;
}

std::optional<Hash256> LedgerCrypto::hex_to_hash(const std::string& hex) {
    if (hex.length() != crypto_hash_sha256_BYTES * 2) {
        return std::nullopt;
    }

    auto bytes = hex_to_bytes(hex);
    if (!bytes) {
        return std::nullopt;
    }

    Hash256 hash;
    std::copy(bytes->begin(), bytes->end(), hash.begin());
    return hash;
}

std::string LedgerCrypto::bytes_to_base64(const std::vector<uint8_t>& bytes) {
    size_t base64_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    std::vector<char> base64(base64_len);

    sodium_bin2base64(
        base64.data(),
        base64.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> LedgerCrypto::base64_to_bytes(const std::string& base64) {
    std::vector<uint8_t> bytes(base64.length());

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        base64.c_str(),
        base64.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    if (result != 0) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);

    return bytes;
}

void LedgerCrypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

} // namespace govledger
