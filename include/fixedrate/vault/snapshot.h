// FIXEDRATE - Vault Snapshot
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Complete, serializable copy of a vault's accounting state.

#ifndef FIXEDRATE_VAULT_SNAPSHOT_H
#define FIXEDRATE_VAULT_SNAPSHOT_H

#include "fixedrate/core/serialize.h"
#include "fixedrate/core/types.h"
#include "fixedrate/vault/harvest.h"
#include "fixedrate/vault/ledger.h"

#include <ios>
#include <vector>

namespace fixedrate {
namespace vault {

/// Snapshot format version
constexpr uint32_t SNAPSHOT_VERSION = 1;

/// One account and its record
struct AccountEntry {
    AccountId account;
    AccountRecord record;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::fixedrate::Serialize(s, account);
        record.Serialize(s);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::fixedrate::Unserialize(s, account);
        record.Unserialize(s);
    }
};

template<typename Stream>
void Serialize(Stream& s, const AccountEntry& entry) {
    entry.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, AccountEntry& entry) {
    entry.Unserialize(s);
}

/**
 * Vault scalars (without the account records).
 */
struct VaultState {
    AccountId vaultId;
    AccountId asset;
    AccountId venue;
    bool initialized{false};
    ShareAmount totalShares{MAX_AMOUNT};
    Amount totalDelegatedHoldings{0};
    Seconds withdrawalDelay{0};
    HarvestSchedule schedule;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::fixedrate::Serialize(s, SNAPSHOT_VERSION);
        ::fixedrate::Serialize(s, vaultId);
        ::fixedrate::Serialize(s, asset);
        ::fixedrate::Serialize(s, venue);
        ::fixedrate::Serialize(s, initialized);
        ::fixedrate::Serialize(s, totalShares);
        ::fixedrate::Serialize(s, totalDelegatedHoldings);
        ::fixedrate::Serialize(s, withdrawalDelay);
        ::fixedrate::Serialize(s, schedule.harvestDelay);
        ::fixedrate::Serialize(s, schedule.pendingHarvestDelay);
        ::fixedrate::Serialize(s, schedule.lastHarvest);
        ::fixedrate::Serialize(s, schedule.fixedRatePerSecond);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint32_t version = 0;
        ::fixedrate::Unserialize(s, version);
        if (version != SNAPSHOT_VERSION) {
            throw std::ios_base::failure("unsupported vault snapshot version " +
                                         std::to_string(version));
        }
        ::fixedrate::Unserialize(s, vaultId);
        ::fixedrate::Unserialize(s, asset);
        ::fixedrate::Unserialize(s, venue);
        ::fixedrate::Unserialize(s, initialized);
        ::fixedrate::Unserialize(s, totalShares);
        ::fixedrate::Unserialize(s, totalDelegatedHoldings);
        ::fixedrate::Unserialize(s, withdrawalDelay);
        ::fixedrate::Unserialize(s, schedule.harvestDelay);
        ::fixedrate::Unserialize(s, schedule.pendingHarvestDelay);
        ::fixedrate::Unserialize(s, schedule.lastHarvest);
        ::fixedrate::Unserialize(s, schedule.fixedRatePerSecond);
    }
};

template<typename Stream>
void Serialize(Stream& s, const VaultState& state) {
    state.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, VaultState& state) {
    state.Unserialize(s);
}

/**
 * Scalars plus every account record.
 */
struct VaultSnapshot {
    VaultState state;
    std::vector<AccountEntry> accounts;

    template<typename Stream>
    void Serialize(Stream& s) const {
        state.Serialize(s);
        ::fixedrate::Serialize(s, accounts);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        state.Unserialize(s);
        ::fixedrate::Unserialize(s, accounts);
    }
};

template<typename Stream>
void Serialize(Stream& s, const VaultSnapshot& snapshot) {
    snapshot.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, VaultSnapshot& snapshot) {
    snapshot.Unserialize(s);
}

} // namespace vault
} // namespace fixedrate

#endif // FIXEDRATE_VAULT_SNAPSHOT_H
