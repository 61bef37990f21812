// FIXEDRATE - Harvest Engine Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/vault/harvest.h"
#include "fixedrate/core/errors.h"
#include "fixedrate/math/fixedpoint.h"
#include "fixedrate/util/logging.h"
#include "fixedrate/util/time.h"

#include <limits>

namespace fixedrate {
namespace vault {

Timestamp HarvestEngine::NextHarvestTime() const {
    constexpr Timestamp kMax = std::numeric_limits<Timestamp>::max();
    Seconds delay = schedule_.harvestDelay;
    if (schedule_.lastHarvest > 0 &&
        delay > static_cast<Seconds>(kMax - schedule_.lastHarvest)) {
        return kMax;
    }
    return schedule_.lastHarvest + static_cast<Timestamp>(delay);
}

bool HarvestEngine::IsDue(Timestamp now) const {
    return now >= NextHarvestTime();
}

bool HarvestEngine::SetHarvestDelay(Seconds delay) {
    if (delay == 0) {
        throw ZeroDelayError("harvest delay cannot be zero");
    }
    if (delay > MAX_HARVEST_DELAY) {
        throw DelayTooLongError("harvest delay " + std::to_string(delay) +
                                "s exceeds one year");
    }

    if (schedule_.harvestDelay == 0) {
        schedule_.harvestDelay = delay;
        return true;
    }

    schedule_.pendingHarvestDelay = delay;
    return false;
}

Amount HarvestEngine::ExpectedProfit(Amount delegated, Seconds elapsed) const {
    auto expected = math::TryMulMulDivDown(delegated, schedule_.fixedRatePerSecond,
                                           elapsed, WAD);
    return expected ? *expected : MAX_AMOUNT;
}

HarvestReport HarvestEngine::Harvest(Timestamp now, ShareLedger& ledger, CapitalRouter& router,
                                     const AccountId& feeAccount) {
    if (!IsDue(now)) {
        throw HarvestTooSoonError("next harvest allowed at " +
                                  util::FormatISO8601(NextHarvestTime()) + ", now is " +
                                  util::FormatISO8601(now));
    }

    HarvestReport report;
    report.timestamp = now;
    report.elapsed = static_cast<Seconds>(now - schedule_.lastHarvest);
    report.previousDelegated = router.Delegated();

    // 1. Measure
    report.observedValue = router.VenueValue();
    if (report.observedValue >= report.previousDelegated) {
        report.realProfit = report.observedValue - report.previousDelegated;
    } else {
        report.loss = report.previousDelegated - report.observedValue;
        LOG_WARN(util::LogCategory::HARVEST) << "venue position lost " << report.loss
                                             << " since last harvest (recorded "
                                             << report.previousDelegated << ", observed "
                                             << report.observedValue << ")";
    }

    // 2. Expected profit at the fixed rate
    report.expectedProfit = ExpectedProfit(report.previousDelegated, report.elapsed);

    // 3. Surplus over the fixed rate
    report.surplus = math::SaturatingSub(report.realProfit, report.expectedProfit);

    // 4. Mint fee shares against pre-harvest holdings. Outstanding shares
    // backed by nothing get the whole recovery; there is no price to mint at.
    Amount holdings = router.TotalHoldings();
    if (report.surplus > 0 && holdings == 0 && ledger.TotalShares() > 0) {
        LOG_WARN(util::LogCategory::HARVEST) << "surplus " << report.surplus
                                             << " recovered into a vault with no holdings;"
                                             << " no fee shares minted";
    } else if (report.surplus > 0) {
        report.feeShares = ledger.SharesForAssets(report.surplus, holdings);
        if (report.feeShares > 0) {
            ledger.Credit(feeAccount, report.feeShares);
        }
    }

    // 5. Resync
    router.SetDelegated(report.observedValue);

    // 6. Advance the clock
    schedule_.lastHarvest = now;

    // 7. Staged delay rollover
    if (schedule_.pendingHarvestDelay != 0) {
        schedule_.harvestDelay = schedule_.pendingHarvestDelay;
        schedule_.pendingHarvestDelay = 0;
        report.delayApplied = true;
    }
    report.harvestDelay = schedule_.harvestDelay;

    LOG_DEBUG(util::LogCategory::HARVEST) << "elapsed " << report.elapsed
                                          << "s, real " << report.realProfit
                                          << ", expected " << report.expectedProfit
                                          << ", surplus " << report.surplus
                                          << ", fee shares " << report.feeShares;

    return report;
}

} // namespace vault
} // namespace fixedrate
