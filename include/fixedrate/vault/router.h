// FIXEDRATE - Capital Router
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Tracks how much of the vault's value sits idle (float) and how much has
// been delegated to the yield venue, and moves capital between the two.

#ifndef FIXEDRATE_VAULT_ROUTER_H
#define FIXEDRATE_VAULT_ROUTER_H

#include "fixedrate/core/errors.h"
#include "fixedrate/core/types.h"
#include "fixedrate/interfaces/asset.h"
#include "fixedrate/interfaces/venue.h"

#include <exception>
#include <string>
#include <utility>

namespace fixedrate {
namespace vault {

/**
 * Run a collaborator call that reports success as a bool.
 *
 * A false result, or any exception that is not already a VaultError, is
 * turned into TransferFailedError. VaultErrors (e.g. a ReentrancyError raised
 * by a collaborator calling back into the vault) pass through unchanged.
 */
template<typename Fn>
void RequireSuccess(const std::string& what, Fn&& fn) {
    bool ok = false;
    try {
        ok = std::forward<Fn>(fn)();
    } catch (const VaultError&) {
        throw;
    } catch (const std::exception& e) {
        throw TransferFailedError(what + " failed: " + e.what());
    }
    if (!ok) {
        throw TransferFailedError(what + " returned failure");
    }
}

// ============================================================================
// Capital Router
// ============================================================================

class CapitalRouter {
public:
    /**
     * @param asset The pooled asset
     * @param venue The venue capital is delegated to
     * @param self  Identity the vault holds balances under
     */
    CapitalRouter(IAssetToken& asset, IYieldVenue& venue, const AccountId& self);

    /// Asset value recorded as delegated, as of the last harvest
    Amount Delegated() const { return delegated_; }

    /// Overwrite the delegated holdings (harvest resync, snapshot restore)
    void SetDelegated(Amount amount) { delegated_ = amount; }

    /// Idle asset balance held by the vault
    Amount Float() const;

    /// Float plus delegated holdings
    Amount TotalHoldings() const;

    /// Current value of the vault's venue position, rounded up
    Amount VenueValue() const;

    /**
     * Send amount to the venue: grow the delegated holdings, approve the
     * venue and call its deposit entry point.
     */
    void Delegate(Amount amount);

    /**
     * Make up to amount of idle asset available and return how much is.
     * Pulls the shortfall from the venue when the float is too small.
     * May return less than requested if the venue short-pays; never more.
     */
    Amount Retrieve(Amount amount);

    IAssetToken& Asset() const { return asset_; }
    IYieldVenue& Venue() const { return venue_; }
    const AccountId& Self() const { return self_; }

private:
    IAssetToken& asset_;
    IYieldVenue& venue_;
    AccountId self_;
    Amount delegated_{0};
};

} // namespace vault
} // namespace fixedrate

#endif // FIXEDRATE_VAULT_ROUTER_H
