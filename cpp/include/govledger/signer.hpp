/**
 * @file signer.hpp
 * @brief Signer contract, Ed25519 signer and public key directory
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The ledger only needs sign(bytes) and verify(pubkey, bytes, signature).
 * Key custody (HSMs, rotation) lives behind the Signer interface.
 */

#pragma once

#include "govledger/ledger_crypto.hpp"

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <filesystem>

namespace govledger {

/**
 * @brief Signer contract
 */
class Signer {
public:
    virtual ~Signer() = default;

    /**
     * @brief Identifier under which verifiers find the public key
     */
    virtual std::string signer_id() const = 0;

    /**
     * @brief Public half of the signing key
     */
    virtual PublicKey public_key() const = 0;

    /**
     * @brief Sign a message
     * @param message Bytes to sign
     * @return Detached signature
     * @throws SigningError if the payload is rejected
     */
    virtual std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const = 0;
};

/**
 * @brief Ed25519Signer - libsodium-backed signer with file key storage
 *
 * Key file layout: <signer_id>_signing.key holds public || secret key,
 * <signer_id>.pub holds the public key alone.
 */
class Ed25519Signer : public Signer {
public:
    /**
     * @brief Create signer with a freshly generated key pair
     * @param signer_id Signer identifier
     * @throws InputError if signer_id is not a valid identifier
     */
    explicit Ed25519Signer(const std::string& signer_id);

    ~Ed25519Signer() override;

    Ed25519Signer(const Ed25519Signer& other);
    Ed25519Signer& operator=(const Ed25519Signer& other);

    /**
     * @brief Load signer key pair from storage
     * @return Ed25519Signer if successful, std::nullopt if not found or corrupt
     */
    static std::optional<Ed25519Signer> load(
        const std::string& signer_id,
        const std::filesystem::path& storage_dir
    );

    /**
     * @brief Save key pair and public key to storage (owner-only permissions)
     * @return true if successful, false otherwise
     */
    bool save(const std::filesystem::path& storage_dir) const;

    /**
     * @brief Delete key files from storage
     * @return true if anything was removed
     */
    static bool remove(
        const std::string& signer_id,
        const std::filesystem::path& storage_dir
    );

    std::string signer_id() const override;
    PublicKey public_key() const override;
    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const override;

    /**
     * @brief Verify a signature against a public key
     */
    static bool verify(
        const PublicKey& public_key,
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature
    );

private:
    std::string signer_id_;
    SigningKeyPair keypair_;

    Ed25519Signer(const std::string& signer_id, const SigningKeyPair& keypair);

    static std::filesystem::path get_signing_key_path(
        const std::string& signer_id,
        const std::filesystem::path& storage_dir
    );

    static std::filesystem::path get_public_key_path(
        const std::string& signer_id,
        const std::filesystem::path& storage_dir
    );
};

/**
 * @brief KeyDirectory - Maps signer ids to trusted public keys
 *
 * Thread-safe.
 */
class KeyDirectory {
public:
    KeyDirectory() = default;

    /**
     * @brief Register or replace a signer's public key
     */
    void register_key(const std::string& signer_id, const PublicKey& public_key);

    /**
     * @brief Remove a signer
     * @return true if the signer was known
     */
    bool revoke(const std::string& signer_id);

    /**
     * @brief Look up a signer's public key
     */
    std::optional<PublicKey> find(const std::string& signer_id) const;

    /**
     * @brief Verify a signature made by a registered signer
     * @return false for unknown signers or bad signatures
     */
    bool verify(
        const std::string& signer_id,
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature
    ) const;

    /**
     * @brief Register every <signer_id>.pub file in a directory
     * @return Number of keys loaded
     */
    size_t load_directory(const std::filesystem::path& directory);

    size_t size() const;

private:
    std::map<std::string, PublicKey> keys_;
    mutable std::mutex mutex_;
};

} // namespace govledger
