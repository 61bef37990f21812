// FIXEDRATE - Authorization Interface
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#ifndef FIXEDRATE_INTERFACES_AUTHORITY_H
#define FIXEDRATE_INTERFACES_AUTHORITY_H

#include "fixedrate/core/types.h"

#include <optional>
#include <string>

namespace fixedrate {

/// Privileged vault operations
enum class Operation {
    Initialize,
    Harvest,
    ClaimProfit,
    SetWithdrawalDelay,
    SetHarvestDelay,
    SetFixedRate
};

/// Convert operation to string
const char* OperationToString(Operation op);

/// Parse operation from string
std::optional<Operation> ParseOperation(const std::string& str);

/**
 * Policy deciding whether a caller may invoke a privileged operation now.
 */
class IAuthority {
public:
    virtual ~IAuthority() = default;

    virtual bool CanCall(const AccountId& caller, Operation op) const = 0;
};

} // namespace fixedrate

#endif // FIXEDRATE_INTERFACES_AUTHORITY_H
