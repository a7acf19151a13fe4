/**
 * @file ledger_crypto.hpp
 * @brief Cryptographic primitives used by the ledger
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides SHA-256 hashing and Ed25519 signatures on top of libsodium.
 */

#pragma once

#include <array>
#include <vector>
#include <string>
#include <optional>
#include <cstdint>
#include <sodium.h>

namespace govledger {

/// SHA-256 digest
using Hash256 = std::array<uint8_t, crypto_hash_sha256_BYTES>;

/// Ed25519 public key
using PublicKey = std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>;

/// Ed25519 secret key
using SecretKey = std::array<uint8_t, crypto_sign_SECRETKEYBYTES>;

/**
 * @brief Ed25519 signature key pair
 */
struct SigningKeyPair {
    PublicKey public_key;
    SecretKey secret_key;
};

/**
 * @brief LedgerCrypto - Hashing and signature primitives
 *
 * Thread-safe cryptographic primitives using libsodium.
 * All methods are stateless.
 */
class LedgerCrypto {
public:
    /**
     * @brief Initialize libsodium (safe to call repeatedly)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Hashing (SHA-256)
    // ========================================================================

    static Hash256 sha256(const std::vector<uint8_t>& data);

    static Hash256 sha256(const std::string& data);

    /**
     * @brief All-zero digest (chain_hash[-1])
     */
    static Hash256 zero_hash();

    // ========================================================================
    // Digital Signatures (Ed25519)
    // ========================================================================

    /**
     * @brief Generate Ed25519 signature key pair
     */
    static SigningKeyPair generate_signing_keypair();

    /**
     * @brief Sign a message with Ed25519
     * @param message Message to sign
     * @param secret_key Secret signing key
     * @return Detached signature (64 bytes), or std::nullopt if signing failed
     */
    static std::optional<std::vector<uint8_t>> sign_message(
        const std::vector<uint8_t>& message,
        const SecretKey& secret_key
    );

    /**
     * @brief Verify Ed25519 detached signature
     * @param message Original message
     * @param signature Signature to verify (64 bytes)
     * @param public_key Public key of signer
     * @return true if signature is valid, false otherwise
     */
    static bool verify_signature(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const PublicKey& public_key
    );

    // ========================================================================
    // Utility Functions
    // ========================================================================

    /**
     * @brief Constant-time comparison of byte arrays (prevents timing attacks)
     */
    static bool constant_time_compare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    static bool constant_time_compare(const Hash256& a, const Hash256& b);

    /**
     * @brief Convert bytes to lowercase hexadecimal string
     */
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    static std::string hash_to_hex(const Hash256& hash);

    /**
     * @brief Convert hexadecimal string to bytes
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

    /**
     * @brief Decode a 64-character hex digest
     * @return Digest, or std::nullopt if invalid
     */
    static std::optional<Hash256> hex_to_hash(const std::string& hex);

    /**
     * @brief Convert bytes to base64 string
     */
    static std::string bytes_to_base64(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert base64 string to bytes
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);

    /**
     * @brief Securely zero memory (prevents compiler optimization from removing)
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace govledger
