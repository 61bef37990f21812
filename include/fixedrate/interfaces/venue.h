// FIXEDRATE - Yield Venue Interface
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Capability contract of the external yield-bearing venue the vault delegates
// capital to. The vault only reads these; it assumes nothing about the
// venue's internals.

#ifndef FIXEDRATE_INTERFACES_VENUE_H
#define FIXEDRATE_INTERFACES_VENUE_H

#include "fixedrate/core/types.h"

namespace fixedrate {

/**
 * A share-based yield venue.
 *
 * Calls are made on behalf of `caller` (the vault). Deposit pulls `amount`
 * of the asset from the caller using a previously granted allowance; Withdraw
 * burns caller's venue shares and sends the redeemed asset back. Failures are
 * reported by returning false or throwing.
 */
class IYieldVenue {
public:
    virtual ~IYieldVenue() = default;

    /// Venue identity
    virtual AccountId Id() const = 0;

    /// Deposit amount of the asset for caller
    virtual bool Deposit(const AccountId& caller, Amount amount) = 0;

    /// Redeem shares of caller
    virtual bool Withdraw(const AccountId& caller, ShareAmount shares) = 0;

    /// Total asset value held by the venue
    virtual Amount Balance() const = 0;

    /// Total venue shares outstanding
    virtual ShareAmount TotalSupply() const = 0;

    /// Asset value of one venue share, WAD-scaled
    virtual uint64_t PricePerShare() const = 0;

    /// Venue shares owned by owner
    virtual ShareAmount ShareBalanceOf(const AccountId& owner) const = 0;
};

} // namespace fixedrate

#endif // FIXEDRATE_INTERFACES_VENUE_H
