// FIXEDRATE - Vault Error Types Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/core/errors.h"

namespace fixedrate {

const char* VaultErrorCodeToString(VaultErrorCode code) {
    switch (code) {
        case VaultErrorCode::NotInitialized:     return "NotInitialized";
        case VaultErrorCode::AlreadyInitialized: return "AlreadyInitialized";
        case VaultErrorCode::ZeroAmount:         return "ZeroAmount";
        case VaultErrorCode::ZeroShares:         return "ZeroShares";
        case VaultErrorCode::InsufficientShares: return "InsufficientShares";
        case VaultErrorCode::WithdrawalTooSoon:  return "WithdrawalTooSoon";
        case VaultErrorCode::HarvestTooSoon:     return "HarvestTooSoon";
        case VaultErrorCode::DelayTooLong:       return "DelayTooLong";
        case VaultErrorCode::ZeroDelay:          return "ZeroDelay";
        case VaultErrorCode::Unauthorized:       return "Unauthorized";
        case VaultErrorCode::Reentrancy:         return "Reentrancy";
        case VaultErrorCode::Arithmetic:         return "Arithmetic";
        case VaultErrorCode::TransferFailed:     return "TransferFailed";
        case VaultErrorCode::InvalidState:       return "InvalidState";
        default:                                 return "Unknown";
    }
}

} // namespace fixedrate
