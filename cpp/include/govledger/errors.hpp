/**
 * @file errors.hpp
 * @brief Error taxonomy for the governance evidence ledger
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every failure the ledger core can surface maps to one ErrorCode.
 * Builder failures are thrown to the caller; admission failures become
 * REJECTED results; integrity failures are reported, never corrected.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace govledger {

/**
 * @brief Error categories
 */
enum class ErrorCode {
    INPUT,              ///< Non-canonicalizable or malformed input
    SIGNING,            ///< Signer rejected the payload
    VERIFICATION,       ///< Bad or tampered signature
    LIFECYCLE,          ///< Closed or unknown lifecycle phase
    APPROVAL_TIMEOUT,   ///< Human approval not received in time
    APPROVAL_REJECTED,  ///< Human approval explicitly refused
    PERSISTENCE,        ///< Storage unavailable or atomicity violation
    INTEGRITY           ///< Chain or Merkle mismatch
};

/**
 * @brief Convert error code to its canonical name
 */
std::string error_code_to_string(ErrorCode code);

/**
 * @brief Base class of all ledger exceptions
 */
class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class InputError : public LedgerError {
public:
    explicit InputError(const std::string& message)
        : LedgerError(ErrorCode::INPUT, message) {}
};

class SigningError : public LedgerError {
public:
    explicit SigningError(const std::string& message)
        : LedgerError(ErrorCode::SIGNING, message) {}
};

class VerificationError : public LedgerError {
public:
    explicit VerificationError(const std::string& message)
        : LedgerError(ErrorCode::VERIFICATION, message) {}
};

class LifecycleError : public LedgerError {
public:
    explicit LifecycleError(const std::string& message)
        : LedgerError(ErrorCode::LIFECYCLE, message) {}
};

class ApprovalTimeoutError : public LedgerError {
public:
    explicit ApprovalTimeoutError(const std::string& message)
        : LedgerError(ErrorCode::APPROVAL_TIMEOUT, message) {}
};

class ApprovalRejectedError : public LedgerError {
public:
    explicit ApprovalRejectedError(const std::string& message)
        : LedgerError(ErrorCode::APPROVAL_REJECTED, message) {}
};

class PersistenceError : public LedgerError {
public:
    explicit PersistenceError(const std::string& message)
        : LedgerError(ErrorCode::PERSISTENCE, message) {}
};

/**
 * @brief Chain or Merkle mismatch
 *
 * Carries the first divergent sequence index when one is known.
 */
class IntegrityError : public LedgerError {
public:
    IntegrityError(const std::string& message, uint64_t first_mismatch)
        : LedgerError(ErrorCode::INTEGRITY, message)
        , first_mismatch_(first_mismatch) {}

    uint64_t first_mismatch() const noexcept { return first_mismatch_; }

private:
    uint64_t first_mismatch_;
};

} // namespace govledger
