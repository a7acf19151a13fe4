/**
 * @file signer.cpp
 * @brief Implementation of the Ed25519 signer and key directory
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Signer key management with persistent key storage
 */

#include "govledger/signer.hpp"
#include "govledger/errors.hpp"
#include "govledger/ledger_config.hpp"
#include "govledger/utilities.hpp"

#include <fstream>

namespace govledger {

// ============================================================================
// Ed25519Signer - Constructors
// ============================================================================

Ed25519Signer::Ed25519Signer(const std::string& signer_id)
    : signer_id_(signer_id)
{
    if (!validate_identifier(signer_id_)) {
        throw InputError("Invalid signer id: " + signer_id_);
    }
    if (!LedgerCrypto::initialize()) {
        throw SigningError("Failed to initialize libsodium");
    }
    keypair_ = LedgerCrypto::generate_signing_keypair();
}

Ed25519Signer::Ed25519Signer(const std::string& signer_id, const SigningKeyPair& keypair)
    : signer_id_(signer_id)
    , keypair_(keypair)
{
}

Ed25519Signer::Ed25519Signer(const Ed25519Signer& other)
    : signer_id_(other.signer_id_)
    , keypair_(other.keypair_)
{
}

Ed25519Signer& Ed25519Signer::operator=(const Ed25519Signer& other) {
    if (this != &other) {
        signer_id_ = other.signer_id_;
        keypair_ = other.keypair_;
    }
    return *this;
}

Ed25519Signer::~Ed25519Signer() {
    LedgerCrypto::secure_zero(keypair_.secret_key.data(), keypair_.secret_key.size());
}

// ============================================================================
// Ed25519Signer - Persistent Storage
// ============================================================================

std::optional<Ed25519Signer> Ed25519Signer::load(
    const std::string& signer_id,
    const std::filesystem::path& storage_dir
) {
    try {
        auto key_path = get_signing_key_path(signer_id, storage_dir);

        if (!std::filesystem::exists(key_path)) {
            return std::nullopt;
        }

        std::ifstream key_file(key_path, std::ios::binary);
        if (!key_file) {
            return std::nullopt;
        }

        SigningKeyPair keypair;
        key_file.read(reinterpret_cast<char*>(keypair.public_key.data()),
                      keypair.public_key.size());
        key_file.read(reinterpret_cast<char*>(keypair.secret_key.data()),
                      keypair.secret_key.size());

        if (!key_file) {
            utilities::log_error("Ed25519Signer: Truncated key file " + key_path.string());
            return std::nullopt;
        }

        // The public key is embedded in the last 32 bytes of an Ed25519 secret key
        PublicKey derived;
        crypto_sign_ed25519_sk_to_pk(derived.data(), keypair.secret_key.data());
        if (sodium_memcmp(derived.data(), keypair.public_key.data(), derived.size()) != 0) {
            utilities::log_error("Ed25519Signer: Key pair mismatch in " + key_path.string());
            return std::nullopt;
        }

        return Ed25519Signer(signer_id, keypair);

    } catch (const std::exception& e) {
        utilities::log_error("Ed25519Signer: Failed to load key for " + signer_id + ": " + e.what());
        return std::nullopt;
    }
}

bool Ed25519Signer::save(const std::filesystem::path& storage_dir) const {
    try {
        if (!std::filesystem::exists(storage_dir)) {
            std::filesystem::create_directories(storage_dir);
        }

        auto key_path = get_signing_key_path(signer_id_, storage_dir);
        auto pub_path = get_public_key_path(signer_id_, storage_dir);

        std::ofstream key_file(key_path, std::ios::binary | std::ios::trunc);
        if (!key_file) {
            return false;
        }

        key_file.write(reinterpret_cast<const char*>(keypair_.public_key.data()),
                       keypair_.public_key.size());
        key_file.write(reinterpret_cast<const char*>(keypair_.secret_key.data()),
                       keypair_.secret_key.size());
        key_file.close();

        // Set restrictive permissions (owner read/write only)
#ifndef _WIN32
        std::filesystem::permissions(key_path,
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace);
#endif

        std::ofstream pub_file(pub_path, std::ios::binary | std::ios::trunc);
        if (!pub_file) {
            return false;
        }

        pub_file.write(reinterpret_cast<const char*>(keypair_.public_key.data()),
                       keypair_.public_key.size());
        pub_file.close();

        return pub_file.good() || !pub_file.fail();

    } catch (const std::exception& e) {
        utilities::log_error("Ed25519Signer: Failed to save key for " + signer_id_ + ": " + e.what());
        return false;
    }
}

bool Ed25519Signer::remove(
    const std::string& signer_id,
    const std::filesystem::path& storage_dir
) {
    try {
        bool removed_key = false;
        bool removed_pub = false;

        auto key_path = get_signing_key_path(signer_id, storage_dir);
        auto pub_path = get_public_key_path(signer_id, storage_dir);

        if (std::filesystem::exists(key_path)) {
            removed_key = std::filesystem::remove(key_path);
        }
        if (std::filesystem::exists(pub_path)) {
            removed_pub = std::filesystem::remove(pub_path);
        }

        return removed_key || removed_pub;

    } catch (const std::exception&) {
        return false;
    }
}

// ============================================================================
// Ed25519Signer - Signer contract
// ============================================================================

std::string Ed25519Signer::signer_id() const {
    return signer_id_;
}

PublicKey Ed25519Signer::public_key() const {
    return keypair_.public_key;
}

std::vector<uint8_t> Ed25519Signer::sign(const std::vector<uint8_t>& message) const {
    auto signature = LedgerCrypto::sign_message(message, keypair_.secret_key);
    if (!signature) {
        throw SigningError("Ed25519 signing failed for signer " + signer_id_);
    }
    return *signature;
}

bool Ed25519Signer::verify(
    const PublicKey& public_key,
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature
) {
    return LedgerCrypto::verify_signature(message, signature, public_key);
}

std::filesystem::path Ed25519Signer::get_signing_key_path(
    const std::string& signer_id,
    const std::filesystem::path& storage_dir
) {
    return storage_dir / (signer_id + "_signing.key");
}

std::filesystem::path Ed25519Signer::get_public_key_path(
    const std::string& signer_id,
    const std::filesystem::path& storage_dir
) {
    return storage_dir / (signer_id + ".pub");
}

// ============================================================================
// KeyDirectory
// ============================================================================

void KeyDirectory::register_key(const std::string& signer_id, const PublicKey& public_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_[signer_id] = public_key;
}

bool KeyDirectory::revoke(const std::string& signer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.erase(signer_id) > 0;
}

std::optional<PublicKey> KeyDirectory::find(const std::string& signer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(signer_id);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool KeyDirectory::verify(
    const std::string& signer_id,
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature
) const {
    auto key = find(signer_id);
    if (!key) {
        return false;
    }
    return Ed25519Signer::verify(*key, message, signature);
}

size_t KeyDirectory::load_directory(const std::filesystem::path& directory) {
    size_t loaded = 0;

    try {
        if (!std::filesystem::is_directory(directory)) {
            utilities::log_warn("KeyDirectory: Not a directory: " + directory.string());
            return 0;
        }

        for (const auto& item : std::filesystem::directory_iterator(directory)) {
            if (!item.is_regular_file() || item.path().extension() != ".pub") {
                continue;
            }

            std::string signer_id = item.path().stem().string();
            if (!validate_identifier(signer_id)) {
                utilities::log_warn("KeyDirectory: Skipping key with invalid id: " + signer_id);
                continue;
            }

            std::ifstream pub_file(item.path(), std::ios::binary);
            PublicKey key;
            pub_file.read(reinterpret_cast<char*>(key.data()), key.size());
            if (!pub_file) {
                utilities::log_warn("KeyDirectory: Truncated public key: " + item.path().string());
                continue;
            }

            register_key(signer_id, key);
            loaded++;
        }
    } catch (const std::filesystem::filesystem_error& e) {
        utilities::log_error(std::string("KeyDirectory: Failed to scan directory: ") + e.what());
    }

    utilities::log_info("KeyDirectory: Loaded " + std::to_string(loaded) + " public key(s) from "
                        + directory.string());
    return loaded;
}

size_t KeyDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

} // namespace govledger
