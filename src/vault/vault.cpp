// FIXEDRATE - Fixed-Rate Vault Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/vault/vault.h"
#include "fixedrate/core/errors.h"
#include "fixedrate/crypto/hash.h"
#include "fixedrate/math/fixedpoint.h"
#include "fixedrate/util/logging.h"
#include "fixedrate/util/time.h"
#include "fixedrate/vault/guard.h"

#include <limits>
#include <optional>
#include <utility>

namespace fixedrate {
namespace vault {

FixedRateVault::FixedRateVault(IAssetToken& asset, IYieldVenue& venue,
                               const IAuthority& authority, IExecutionHost& host)
    : asset_(asset)
    , venue_(venue)
    , authority_(authority)
    , host_(host)
    , id_(DeriveVaultId(asset.Id(), venue.Id()))
    , router_(asset, venue, id_) {
    LOG_DEBUG(util::LogCategory::VAULT) << "vault " << id_.ToHex() << " for asset "
                                        << ShortId(asset.Id()) << " venue "
                                        << ShortId(venue.Id());
}

// ============================================================================
// Call Discipline
// ============================================================================

template<typename Fn>
auto FixedRateVault::Execute(const char* operation, Fn&& body) -> decltype(body()) {
    ReentrancyGuard guard(entered_, operation);

    Checkpoint checkpoint = Save();
    host_.Begin();
    ledger_.BeginJournal();

    std::optional<decltype(body())> result;
    try {
        result.emplace(body());
        host_.Commit();
        ledger_.CommitJournal();
    } catch (const std::exception& e) {
        Rollback(checkpoint, operation, e.what());
        throw;
    } catch (...) {
        Rollback(checkpoint, operation, "unknown exception");
        throw;
    }

    // Observers run after the call has committed and may call back in
    std::vector<VaultEvent> events = events_.TakePending();
    guard.Release();
    events_.Deliver(events);
    return std::move(*result);
}

FixedRateVault::Checkpoint FixedRateVault::Save() const {
    return Checkpoint{initialized_, withdrawalDelay_, router_.Delegated(),
                      harvest_.Schedule(), ledger_.TotalShares()};
}

void FixedRateVault::Rollback(const Checkpoint& checkpoint, const char* operation,
                              const char* reason) {
    bool changed = ledger_.JournalTouched() ||
                   checkpoint.initialized != initialized_ ||
                   checkpoint.withdrawalDelay != withdrawalDelay_ ||
                   checkpoint.delegated != router_.Delegated() ||
                   !(checkpoint.schedule == harvest_.Schedule()) ||
                   checkpoint.totalShares != ledger_.TotalShares();

    ledger_.RollbackJournal();
    initialized_ = checkpoint.initialized;
    withdrawalDelay_ = checkpoint.withdrawalDelay;
    router_.SetDelegated(checkpoint.delegated);
    harvest_.Restore(checkpoint.schedule);
    host_.Rollback();
    events_.Discard();

    if (changed) {
        LOG_WARN(util::LogCategory::VAULT) << operation << " rolled back: " << reason;
    } else {
        LOG_DEBUG(util::LogCategory::VAULT) << operation << " rejected: " << reason;
    }
}

void FixedRateVault::Authorize(const AccountId& caller, Operation op) const {
    if (!authority_.CanCall(caller, op)) {
        LOG_DEBUG(util::LogCategory::ACCESS) << ShortId(caller) << " denied "
                                             << OperationToString(op);
        throw UnauthorizedError(ShortId(caller) + " may not call " + OperationToString(op));
    }
}

void FixedRateVault::RequireInitialized(const char* operation) const {
    if (!initialized_) {
        throw NotInitializedError(std::string(operation) + " before initialization");
    }
}

void FixedRateVault::Pay(const AccountId& to, Amount amount) {
    if (amount == 0) {
        return;
    }
    RequireSuccess("asset transfer", [&] {
        return asset_.Transfer(id_, to, amount);
    });
}

VaultEvent FixedRateVault::MakeEvent(EventType type, const AccountId& caller,
                                     Timestamp now) const {
    VaultEvent event;
    event.type = type;
    event.caller = caller;
    event.timestamp = now;
    return event;
}

// ============================================================================
// Views
// ============================================================================

Amount FixedRateVault::TotalHoldings() const {
    return router_.TotalHoldings();
}

Amount FixedRateVault::TotalFloat() const {
    return router_.Float();
}

ShareAmount FixedRateVault::BalanceOf(const AccountId& account) const {
    return ledger_.BalanceOf(account);
}

Amount FixedRateVault::BalanceOfUnderlying(const AccountId& account) const {
    return ConvertToUnderlying(ledger_.BalanceOf(account));
}

ShareAmount FixedRateVault::ConvertToShares(Amount amount) const {
    if (!initialized_) {
        return 0;
    }
    return ledger_.SharesForAssets(amount, TotalHoldings());
}

Amount FixedRateVault::ConvertToUnderlying(ShareAmount shares) const {
    if (!initialized_) {
        return 0;
    }
    return ledger_.AssetsForShares(shares, TotalHoldings());
}

Amount FixedRateVault::GetVenueBalanceOfUnderlying() const {
    return router_.VenueValue();
}

Timestamp FixedRateVault::LastDepositOf(const AccountId& account) const {
    auto record = ledger_.GetRecord(account);
    return record ? record->lastDeposit : 0;
}

Timestamp FixedRateVault::WithdrawableAt(const AccountId& account) const {
    constexpr Timestamp kMax = std::numeric_limits<Timestamp>::max();
    Timestamp last = LastDepositOf(account);
    if (last >= 0 && withdrawalDelay_ > static_cast<Seconds>(kMax - last)) {
        return kMax;
    }
    return last + static_cast<Timestamp>(withdrawalDelay_);
}

// ============================================================================
// Lifecycle and Parameters
// ============================================================================

void FixedRateVault::Initialize(const AccountId& caller) {
    Execute("Initialize", [&] {
        Authorize(caller, Operation::Initialize);
        if (initialized_) {
            throw AlreadyInitializedError("vault is already initialized");
        }
        if (harvest_.Schedule().harvestDelay == 0) {
            throw ZeroDelayError("set a harvest delay before initializing");
        }

        Timestamp now = host_.Now();
        ledger_.Open();
        harvest_.Start(now);
        initialized_ = true;

        events_.Stage(MakeEvent(EventType::Initialized, caller, now));
        LOG_INFO(util::LogCategory::VAULT) << "initialized by " << ShortId(caller)
                                           << ", harvest clock starts at "
                                           << util::FormatISO8601(now);
        return true;
    });
}

void FixedRateVault::SetWithdrawalDelay(const AccountId& caller, Seconds delay) {
    Execute("SetWithdrawalDelay", [&] {
        Authorize(caller, Operation::SetWithdrawalDelay);
        withdrawalDelay_ = delay;

        VaultEvent event = MakeEvent(EventType::WithdrawalDelayUpdated, caller, host_.Now());
        event.value = delay;
        events_.Stage(event);
        LOG_INFO(util::LogCategory::VAULT) << "withdrawal delay set to "
                                           << util::FormatDuration(static_cast<int64_t>(delay));
        return true;
    });
}

bool FixedRateVault::SetHarvestDelay(const AccountId& caller, Seconds delay) {
    return Execute("SetHarvestDelay", [&] {
        Authorize(caller, Operation::SetHarvestDelay);
        bool immediate = harvest_.SetHarvestDelay(delay);

        VaultEvent event = MakeEvent(EventType::HarvestDelayUpdated, caller, host_.Now());
        event.value = delay;
        event.staged = !immediate;
        events_.Stage(event);
        LOG_INFO(util::LogCategory::HARVEST) << "harvest delay "
                                             << (immediate ? "set to " : "staged as ")
                                             << util::FormatDuration(static_cast<int64_t>(delay));
        return immediate;
    });
}

void FixedRateVault::SetFixedRate(const AccountId& caller, uint64_t ratePerSecond) {
    Execute("SetFixedRate", [&] {
        Authorize(caller, Operation::SetFixedRate);
        harvest_.SetFixedRate(ratePerSecond);

        VaultEvent event = MakeEvent(EventType::FixedRateUpdated, caller, host_.Now());
        event.value = ratePerSecond;
        events_.Stage(event);
        LOG_INFO(util::LogCategory::HARVEST) << "fixed rate set to " << ratePerSecond
                                             << " per second";
        return true;
    });
}

// ============================================================================
// Flows
// ============================================================================

ShareAmount FixedRateVault::Deposit(const AccountId& caller, Amount amount) {
    return Execute("Deposit", [&] {
        RequireInitialized("Deposit");

        ShareAmount shares = ledger_.SharesForAssets(amount, TotalHoldings());
        if (shares == 0) {
            throw ZeroSharesError("deposit of " + std::to_string(amount) +
                                  " would mint zero shares");
        }

        RequireSuccess("asset transferFrom", [&] {
            return asset_.TransferFrom(id_, caller, id_, amount);
        });

        Timestamp now = host_.Now();
        ledger_.Credit(caller, shares);
        ledger_.SetLastDeposit(caller, now);

        router_.Delegate(amount);

        VaultEvent event = MakeEvent(EventType::Deposit, caller, now);
        event.amount = amount;
        event.shares = shares;
        events_.Stage(event);
        LOG_INFO(util::LogCategory::VAULT) << ShortId(caller) << " deposited " << amount
                                           << " for " << shares << " shares";
        return shares;
    });
}

Amount FixedRateVault::Withdraw(const AccountId& caller, Amount amount) {
    return Execute("Withdraw", [&] {
        if (amount == 0) {
            throw ZeroAmountError("withdraw amount is zero");
        }
        RequireInitialized("Withdraw");

        Timestamp now = host_.Now();
        Timestamp unlock = WithdrawableAt(caller);
        if (now < unlock) {
            throw WithdrawalTooSoonError(ShortId(caller) + " may withdraw from " +
                                         util::FormatISO8601(unlock));
        }

        ShareAmount shares = ledger_.SharesToBurn(amount, TotalHoldings());
        ledger_.Debit(caller, shares);

        Amount retrieved = router_.Retrieve(amount);
        Pay(caller, retrieved);

        VaultEvent event = MakeEvent(EventType::Withdrawal, caller, now);
        event.amount = amount;
        event.paid = retrieved;
        event.shares = shares;
        events_.Stage(event);
        LOG_INFO(util::LogCategory::VAULT) << ShortId(caller) << " withdrew " << retrieved
                                           << " of " << amount << " for " << shares
                                           << " shares";
        return retrieved;
    });
}

HarvestReport FixedRateVault::Harvest(const AccountId& caller) {
    return Execute("Harvest", [&] {
        Authorize(caller, Operation::Harvest);
        RequireInitialized("Harvest");

        Timestamp now = host_.Now();
        HarvestReport report = harvest_.Harvest(now, ledger_, router_, id_);

        VaultEvent event = MakeEvent(EventType::Harvest, caller, now);
        event.amount = report.surplus;
        event.shares = report.feeShares;
        event.value = report.observedValue;
        event.loss = report.loss;
        events_.Stage(event);

        if (report.delayApplied) {
            VaultEvent applied = MakeEvent(EventType::HarvestDelayApplied, caller, now);
            applied.value = report.harvestDelay;
            events_.Stage(applied);
        }

        LOG_INFO(util::LogCategory::HARVEST) << "harvest by " << ShortId(caller)
                                             << ": surplus " << report.surplus
                                             << ", fee shares " << report.feeShares
                                             << ", delegated " << report.observedValue;
        return report;
    });
}

Amount FixedRateVault::ClaimProfit(const AccountId& caller) {
    return Execute("ClaimProfit", [&] {
        Authorize(caller, Operation::ClaimProfit);
        RequireInitialized("ClaimProfit");

        ShareAmount feeShares = ledger_.BalanceOf(id_);
        if (feeShares == 0) {
            throw ZeroSharesError("no protocol fee shares to claim");
        }

        Amount assets = ledger_.AssetsForShares(feeShares, TotalHoldings());
        ledger_.Debit(id_, feeShares);

        Amount retrieved = router_.Retrieve(assets);
        Pay(caller, retrieved);

        VaultEvent event = MakeEvent(EventType::ProfitClaimed, caller, host_.Now());
        event.amount = assets;
        event.paid = retrieved;
        event.shares = feeShares;
        events_.Stage(event);
        LOG_INFO(util::LogCategory::VAULT) << ShortId(caller) << " claimed " << retrieved
                                           << " for " << feeShares << " fee shares";
        return retrieved;
    });
}

// ============================================================================
// Snapshots
// ============================================================================

VaultSnapshot FixedRateVault::ExportSnapshot() const {
    VaultSnapshot snapshot;
    snapshot.state.vaultId = id_;
    snapshot.state.asset = asset_.Id();
    snapshot.state.venue = venue_.Id();
    snapshot.state.initialized = initialized_;
    snapshot.state.totalShares = ledger_.TotalShares();
    snapshot.state.totalDelegatedHoldings = router_.Delegated();
    snapshot.state.withdrawalDelay = withdrawalDelay_;
    snapshot.state.schedule = harvest_.Schedule();

    snapshot.accounts.reserve(ledger_.AccountCount());
    for (const auto& [account, record] : ledger_.Accounts()) {
        snapshot.accounts.push_back(AccountEntry{account, record});
    }
    return snapshot;
}

void FixedRateVault::RestoreSnapshot(const VaultSnapshot& snapshot) {
    ReentrancyGuard guard(entered_, "RestoreSnapshot");

    const VaultState& state = snapshot.state;
    if (state.vaultId != id_ || state.asset != asset_.Id() || state.venue != venue_.Id()) {
        throw InvalidStateError("snapshot belongs to vault " + ShortId(state.vaultId));
    }
    if (state.initialized && state.schedule.harvestDelay == 0) {
        throw InvalidStateError("initialized vault with zero harvest delay");
    }
    if (state.schedule.harvestDelay > MAX_HARVEST_DELAY ||
        state.schedule.pendingHarvestDelay > MAX_HARVEST_DELAY) {
        throw InvalidStateError("harvest delay out of range");
    }

    std::vector<std::pair<AccountId, AccountRecord>> records;
    records.reserve(snapshot.accounts.size());
    for (const auto& entry : snapshot.accounts) {
        records.emplace_back(entry.account, entry.record);
    }

    // Validates supply against balances before anything is replaced
    ledger_.Restore(state.initialized, state.totalShares, records);

    initialized_ = state.initialized;
    withdrawalDelay_ = state.withdrawalDelay;
    router_.SetDelegated(state.totalDelegatedHoldings);
    harvest_.Restore(state.schedule);

    LOG_INFO(util::LogCategory::VAULT) << "restored vault " << ShortId(id_) << " with "
                                       << snapshot.accounts.size() << " accounts, "
                                       << state.totalShares << " shares";
}

} // namespace vault
} // namespace fixedrate
