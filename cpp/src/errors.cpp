/**
 * @file errors.cpp
 * @brief Implementation of the ledger error taxonomy
 *
 * GovLedger - Governance Evidence Ledger
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "govledger/errors.hpp"

namespace govledger {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INPUT: return "InputError";
        case ErrorCode::SIGNING: return "SigningError";
        case ErrorCode::VERIFICATION: return "VerificationError";
        case ErrorCode::LIFECYCLE: return "LifecycleError";
        case ErrorCode::APPROVAL_TIMEOUT: return "ApprovalTimeout";
        case ErrorCode::APPROVAL_REJECTED: return "ApprovalRejected";
        case ErrorCode::PERSISTENCE: return "PersistenceError";
        case ErrorCode::INTEGRITY: return "IntegrityError";
        default: return "UnknownError";
    }
}

LedgerError::LedgerError(ErrorCode code, const std::string& message)
    : std::runtime_error(error_code_to_string(code) + ": " + message)
    , code_(code)
{
}

} // namespace govledger
