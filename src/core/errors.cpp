#include "crosslock/errors.hpp"

namespace crosslock {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidTime: return "InvalidTime";
        case ErrorCode::InvalidCaller: return "InvalidCaller";
        case ErrorCode::InvalidSecret: return "InvalidSecret";
        case ErrorCode::InvalidImmutables: return "InvalidImmutables";
        case ErrorCode::EscrowFinalized: return "EscrowFinalized";
        case ErrorCode::EscrowAlreadyExists: return "EscrowAlreadyExists";
        case ErrorCode::UnknownEscrow: return "UnknownEscrow";
        case ErrorCode::Paused: return "Paused";
        case ErrorCode::NotWhitelisted: return "NotWhitelisted";
        case ErrorCode::OnlyOwner: return "OnlyOwner";
        case ErrorCode::OnlyOrderProtocol: return "OnlyOrderProtocol";
        case ErrorCode::InvalidCreationTime: return "InvalidCreationTime";
        case ErrorCode::InvalidTimelocks: return "InvalidTimelocks";
        case ErrorCode::InvalidExtraData: return "InvalidExtraData";
        case ErrorCode::InsufficientEscrowBalance: return "InsufficientEscrowBalance";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::InsufficientAllowance: return "InsufficientAllowance";
    }
    return "Unknown";
}

Error::Error(ErrorCode code)
    : std::runtime_error(to_string(code)), code_(code) {}

Error::Error(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

} // namespace crosslock
