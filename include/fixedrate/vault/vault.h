// FIXEDRATE - Fixed-Rate Vault
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Share-based yield vault for one asset against one yield venue.
//
// Depositors receive shares for the asset they bring in; the pooled asset is
// delegated to the venue. Periodic harvests compare the venue's real growth
// with the growth promised by a fixed rate and mint the surplus as shares to
// the protocol-fee account (the vault's own identity).
//
// Every state-changing entry point:
// - is non-reentrant (re-entry throws ReentrancyError)
// - either completes or throws, leaving no partial change behind
// - emits its events only after it has committed

#ifndef FIXEDRATE_VAULT_VAULT_H
#define FIXEDRATE_VAULT_VAULT_H

#include "fixedrate/core/types.h"
#include "fixedrate/interfaces/asset.h"
#include "fixedrate/interfaces/authority.h"
#include "fixedrate/interfaces/host.h"
#include "fixedrate/interfaces/venue.h"
#include "fixedrate/vault/events.h"
#include "fixedrate/vault/harvest.h"
#include "fixedrate/vault/ledger.h"
#include "fixedrate/vault/router.h"
#include "fixedrate/vault/snapshot.h"

#include <atomic>
#include <string>

namespace fixedrate {
namespace vault {

class FixedRateVault {
public:
    /**
     * The vault's identity is derived from the asset and venue ids.
     *
     * @param asset     The pooled asset
     * @param venue     Venue the pooled asset is delegated to
     * @param authority Policy for privileged operations
     * @param host      Clock and transaction boundary
     */
    FixedRateVault(IAssetToken& asset, IYieldVenue& venue,
                   const IAuthority& authority, IExecutionHost& host);

    FixedRateVault(const FixedRateVault&) = delete;
    FixedRateVault& operator=(const FixedRateVault&) = delete;

    /// Vault identity, also the protocol-fee account
    const AccountId& Id() const { return id_; }

    // ========================================================================
    // Views
    // ========================================================================

    bool IsInitialized() const { return initialized_; }
    ShareAmount TotalShares() const { return ledger_.TotalShares(); }
    Amount TotalDelegatedHoldings() const { return router_.Delegated(); }
    Seconds WithdrawalDelay() const { return withdrawalDelay_; }
    Seconds HarvestDelay() const { return harvest_.Schedule().harvestDelay; }
    Seconds PendingHarvestDelay() const { return harvest_.Schedule().pendingHarvestDelay; }
    Timestamp LastHarvest() const { return harvest_.Schedule().lastHarvest; }
    uint64_t FixedRatePerSecond() const { return harvest_.Schedule().fixedRatePerSecond; }
    Timestamp NextHarvestTime() const { return harvest_.NextHarvestTime(); }

    /// Float plus delegated holdings
    Amount TotalHoldings() const;

    /// Idle asset held by the vault
    Amount TotalFloat() const;

    /// Shares of account
    ShareAmount BalanceOf(const AccountId& account) const;

    /// Asset value of account's shares (round down)
    Amount BalanceOfUnderlying(const AccountId& account) const;

    /// Shares a deposit of amount would mint now (0 before initialization)
    ShareAmount ConvertToShares(Amount amount) const;

    /// Asset value of shares now (0 before initialization)
    Amount ConvertToUnderlying(ShareAmount shares) const;

    /// Value of the vault's venue position (round up)
    Amount GetVenueBalanceOfUnderlying() const;

    /// Time of account's last deposit (0 if none)
    Timestamp LastDepositOf(const AccountId& account) const;

    /// Earliest time account may withdraw
    Timestamp WithdrawableAt(const AccountId& account) const;

    const ShareLedger& Ledger() const { return ledger_; }

    // ========================================================================
    // Lifecycle and Parameters (privileged)
    // ========================================================================

    /// Open the vault for deposits and start the harvest clock. Once only.
    void Initialize(const AccountId& caller);

    void SetWithdrawalDelay(const AccountId& caller, Seconds delay);

    /// Returns true if the delay took effect immediately, false if staged
    bool SetHarvestDelay(const AccountId& caller, Seconds delay);

    void SetFixedRate(const AccountId& caller, uint64_t ratePerSecond);

    // ========================================================================
    // Flows
    // ========================================================================

    /**
     * Deposit amount of the asset from caller. The caller must have approved
     * the vault for amount. Returns the shares minted.
     */
    ShareAmount Deposit(const AccountId& caller, Amount amount);

    /**
     * Withdraw amount of the asset to caller. Returns the amount paid, which
     * may be less than requested if the venue short-pays.
     */
    Amount Withdraw(const AccountId& caller, Amount amount);

    /// Reconcile the venue position and mint fee shares (privileged)
    HarvestReport Harvest(const AccountId& caller);

    /// Redeem every fee share and pay the proceeds to caller (privileged)
    Amount ClaimProfit(const AccountId& caller);

    // ========================================================================
    // Events and Snapshots
    // ========================================================================

    EventBus& Events() { return events_; }

    VaultSnapshot ExportSnapshot() const;

    /**
     * Replace the vault's state with snapshot. Throws InvalidStateError if the
     * snapshot belongs to another (asset, venue) pair or breaks an accounting
     * invariant; the vault is unchanged in that case.
     */
    void RestoreSnapshot(const VaultSnapshot& snapshot);

private:
    struct Checkpoint {
        bool initialized;
        Seconds withdrawalDelay;
        Amount delegated;
        HarvestSchedule schedule;
        ShareAmount totalShares;
    };

    template<typename Fn>
    auto Execute(const char* operation, Fn&& body) -> decltype(body());

    Checkpoint Save() const;
    void Rollback(const Checkpoint& checkpoint, const char* operation, const char* reason);

    void Authorize(const AccountId& caller, Operation op) const;
    void RequireInitialized(const char* operation) const;
    void Pay(const AccountId& to, Amount amount);
    VaultEvent MakeEvent(EventType type, const AccountId& caller, Timestamp now) const;

    IAssetToken& asset_;
    IYieldVenue& venue_;
    const IAuthority& authority_;
    IExecutionHost& host_;
    AccountId id_;

    ShareLedger ledger_;
    CapitalRouter router_;
    HarvestEngine harvest_;
    EventBus events_;

    bool initialized_{false};
    Seconds withdrawalDelay_{0};

    std::atomic<bool> entered_{false};
};

} // namespace vault
} // namespace fixedrate

#endif // FIXEDRATE_VAULT_VAULT_H
