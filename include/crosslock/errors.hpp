#pragma once

#include <stdexcept>
#include <string>

namespace crosslock {

/**
 * @brief Rejection reasons for escrow, factory and ledger operations
 *
 * Every rejection is synchronous and leaves balances and lifecycle state
 * untouched, so callers may resubmit once the condition holds.
 */
enum class ErrorCode {
    // Escrow
    InvalidTime,             // Outside the stage window
    InvalidCaller,           // Caller lacks the role or capability
    InvalidSecret,           // hash(secret) != hashlock
    InvalidImmutables,       // Digest differs from the one captured at deployment
    EscrowFinalized,         // Already withdrawn or cancelled

    // Factory
    EscrowAlreadyExists,
    UnknownEscrow,
    Paused,
    NotWhitelisted,
    OnlyOwner,
    OnlyOrderProtocol,
    InvalidCreationTime,
    InvalidTimelocks,
    InvalidExtraData,
    InsufficientEscrowBalance,

    // Value transfer
    InsufficientBalance,
    InsufficientAllowance
};

const char* to_string(ErrorCode code);

class Error : public std::runtime_error {
public:
    explicit Error(ErrorCode code);
    Error(ErrorCode code, const std::string& detail);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace crosslock
