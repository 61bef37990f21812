// FIXEDRATE - Asset Token Interface
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Capability contract the vault expects from the pooled fungible asset.
// Every mutating call may return false or throw; the vault treats both as a
// hard failure of the whole operation.

#ifndef FIXEDRATE_INTERFACES_ASSET_H
#define FIXEDRATE_INTERFACES_ASSET_H

#include "fixedrate/core/types.h"

namespace fixedrate {

/**
 * A fungible token ledger.
 */
class IAssetToken {
public:
    virtual ~IAssetToken() = default;

    /// Token identity
    virtual AccountId Id() const = 0;

    /// Move amount from `from` to `to` using the allowance `from` granted to `spender`
    virtual bool TransferFrom(const AccountId& spender, const AccountId& from,
                              const AccountId& to, Amount amount) = 0;

    /// Move amount from `from` (the caller) to `to`
    virtual bool Transfer(const AccountId& from, const AccountId& to, Amount amount) = 0;

    /// Let spender move up to amount of owner's balance
    virtual bool Approve(const AccountId& owner, const AccountId& spender, Amount amount) = 0;

    /// Balance of account
    virtual Amount BalanceOf(const AccountId& account) const = 0;
};

} // namespace fixedrate

#endif // FIXEDRATE_INTERFACES_ASSET_H
