// FIXEDRATE - Vault Error Types
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Every failure of a vault operation is reported by throwing one of the
// exceptions below. A thrown error means the call had no effect.

#ifndef FIXEDRATE_CORE_ERRORS_H
#define FIXEDRATE_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace fixedrate {

/// Error codes, one per exception type
enum class VaultErrorCode {
    NotInitialized,
    AlreadyInitialized,
    ZeroAmount,
    ZeroShares,
    InsufficientShares,
    WithdrawalTooSoon,
    HarvestTooSoon,
    DelayTooLong,
    ZeroDelay,
    Unauthorized,
    Reentrancy,
    Arithmetic,
    TransferFailed,
    InvalidState,
};

/// Stable name of an error code
const char* VaultErrorCodeToString(VaultErrorCode code);

/// Base class of all vault errors
class VaultError : public std::runtime_error {
public:
    VaultError(VaultErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    VaultErrorCode Code() const { return code_; }

private:
    VaultErrorCode code_;
};

#define FIXEDRATE_DEFINE_ERROR(Name, CodeValue)                         \
    class Name : public VaultError {                                    \
    public:                                                             \
        explicit Name(const std::string& msg)                           \
            : VaultError(VaultErrorCode::CodeValue, msg) {}             \
    }

// Precondition violations
FIXEDRATE_DEFINE_ERROR(NotInitializedError, NotInitialized);
FIXEDRATE_DEFINE_ERROR(AlreadyInitializedError, AlreadyInitialized);
FIXEDRATE_DEFINE_ERROR(ZeroAmountError, ZeroAmount);
FIXEDRATE_DEFINE_ERROR(ZeroSharesError, ZeroShares);
FIXEDRATE_DEFINE_ERROR(InsufficientSharesError, InsufficientShares);
FIXEDRATE_DEFINE_ERROR(WithdrawalTooSoonError, WithdrawalTooSoon);
FIXEDRATE_DEFINE_ERROR(HarvestTooSoonError, HarvestTooSoon);
FIXEDRATE_DEFINE_ERROR(DelayTooLongError, DelayTooLong);
FIXEDRATE_DEFINE_ERROR(ZeroDelayError, ZeroDelay);

// Authorization and call discipline
FIXEDRATE_DEFINE_ERROR(UnauthorizedError, Unauthorized);
FIXEDRATE_DEFINE_ERROR(ReentrancyError, Reentrancy);

// Overflow, underflow and division by zero in the integer helpers
FIXEDRATE_DEFINE_ERROR(ArithmeticError, Arithmetic);

// The asset or the venue reported failure
FIXEDRATE_DEFINE_ERROR(TransferFailedError, TransferFailed);

// A restored snapshot violates an accounting invariant
FIXEDRATE_DEFINE_ERROR(InvalidStateError, InvalidState);

#undef FIXEDRATE_DEFINE_ERROR

} // namespace fixedrate

#endif // FIXEDRATE_CORE_ERRORS_H
