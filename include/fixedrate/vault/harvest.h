// FIXEDRATE - Harvest Engine
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Periodic reconciliation of the venue position against the growth promised
// by the fixed rate. Depositors are guaranteed the fixed rate; any real
// profit above it is minted as shares to the protocol-fee account.

#ifndef FIXEDRATE_VAULT_HARVEST_H
#define FIXEDRATE_VAULT_HARVEST_H

#include "fixedrate/core/types.h"
#include "fixedrate/vault/ledger.h"
#include "fixedrate/vault/router.h"

namespace fixedrate {
namespace vault {

// ============================================================================
// Harvest Schedule
// ============================================================================

/**
 * Harvest timing and rate state.
 */
struct HarvestSchedule {
    /// Minimum seconds between harvests (0 = never set)
    Seconds harvestDelay{0};

    /// Delay to apply at the next harvest (0 = none staged)
    Seconds pendingHarvestDelay{0};

    /// Time of the last harvest, or of initialization
    Timestamp lastHarvest{0};

    /// Target growth per second, WAD-scaled
    uint64_t fixedRatePerSecond{0};

    bool operator==(const HarvestSchedule& other) const {
        return harvestDelay == other.harvestDelay &&
               pendingHarvestDelay == other.pendingHarvestDelay &&
               lastHarvest == other.lastHarvest &&
               fixedRatePerSecond == other.fixedRatePerSecond;
    }
};

// ============================================================================
// Harvest Report
// ============================================================================

/// Everything a harvest measured and changed
struct HarvestReport {
    Timestamp timestamp{0};
    Seconds elapsed{0};
    Amount previousDelegated{0};
    Amount observedValue{0};
    Amount realProfit{0};
    Amount expectedProfit{0};
    Amount surplus{0};
    Amount loss{0};
    ShareAmount feeShares{0};
    bool delayApplied{false};
    Seconds harvestDelay{0};
};

// ============================================================================
// Harvest Engine
// ============================================================================

class HarvestEngine {
public:
    HarvestEngine() = default;

    const HarvestSchedule& Schedule() const { return schedule_; }
    void Restore(const HarvestSchedule& schedule) { schedule_ = schedule; }

    /// Start the harvest clock
    void Start(Timestamp now) { schedule_.lastHarvest = now; }

    /// Earliest time the next harvest may run
    Timestamp NextHarvestTime() const;

    /// True if a harvest may run at now
    bool IsDue(Timestamp now) const;

    /**
     * Set the harvest delay.
     *
     * The first delay ever set takes effect immediately. Later changes are
     * staged and applied when the next harvest completes.
     *
     * @return true if applied immediately, false if staged
     * @throws ZeroDelayError, DelayTooLongError
     */
    bool SetHarvestDelay(Seconds delay);

    void SetFixedRate(uint64_t ratePerSecond) { schedule_.fixedRatePerSecond = ratePerSecond; }

    /**
     * Growth the fixed rate promises on delegated over elapsed seconds,
     * rounded down. Returns MAX_AMOUNT when the promise exceeds 64 bits.
     */
    Amount ExpectedProfit(Amount delegated, Seconds elapsed) const;

    /**
     * Run a harvest at now.
     *
     * Measures the venue position, mints fee shares for the surplus over the
     * expected profit to feeAccount, resyncs the delegated holdings, advances
     * the clock and applies any staged delay.
     *
     * @throws HarvestTooSoonError if now is before NextHarvestTime()
     */
    HarvestReport Harvest(Timestamp now, ShareLedger& ledger, CapitalRouter& router,
                          const AccountId& feeAccount);

private:
    HarvestSchedule schedule_;
};

} // namespace vault
} // namespace fixedrate

#endif // FIXEDRATE_VAULT_HARVEST_H
