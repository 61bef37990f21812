// FIXEDRATE - Capital Router Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/vault/router.h"
#include "fixedrate/math/fixedpoint.h"
#include "fixedrate/util/logging.h"

#include <algorithm>

namespace fixedrate {
namespace vault {

CapitalRouter::CapitalRouter(IAssetToken& asset, IYieldVenue& venue, const AccountId& self)
    : asset_(asset), venue_(venue), self_(self) {}

Amount CapitalRouter::Float() const {
    return asset_.BalanceOf(self_);
}

Amount CapitalRouter::TotalHoldings() const {
    return math::CheckedAdd(Float(), delegated_);
}

Amount CapitalRouter::VenueValue() const {
    return math::MulDivUp(venue_.ShareBalanceOf(self_), venue_.PricePerShare(), WAD);
}

void CapitalRouter::Delegate(Amount amount) {
    if (amount == 0) {
        return;
    }

    delegated_ = math::CheckedAdd(delegated_, amount);

    RequireSuccess("asset approve", [&] {
        return asset_.Approve(self_, venue_.Id(), amount);
    });
    RequireSuccess("venue deposit", [&] {
        return venue_.Deposit(self_, amount);
    });

    LOG_DEBUG(util::LogCategory::ROUTER) << "delegated " << amount
                                         << ", total delegated " << delegated_;
}

Amount CapitalRouter::Retrieve(Amount amount) {
    Amount idle = Float();
    if (idle >= amount) {
        return amount;
    }

    Amount shortfall = amount - idle;

    ShareAmount venueShares = 0;
    Amount venueBalance = venue_.Balance();
    if (venueBalance > 0) {
        venueShares = math::MulDivDown(shortfall, venue_.TotalSupply(), venueBalance);
    }

    ShareAmount owned = venue_.ShareBalanceOf(self_);
    if (venueShares > owned) {
        LOG_WARN(util::LogCategory::ROUTER) << "venue position of " << owned
                                            << " shares cannot cover " << venueShares;
        venueShares = owned;
    }

    if (venueShares > 0) {
        RequireSuccess("venue withdraw", [&] {
            return venue_.Withdraw(self_, venueShares);
        });
    }

    delegated_ = math::CheckedSub(delegated_, shortfall);

    Amount available = Float();
    if (available < amount) {
        LOG_WARN(util::LogCategory::ROUTER) << "short-pay: requested " << amount
                                            << ", available " << available;
    }

    LOG_DEBUG(util::LogCategory::ROUTER) << "retrieved " << venueShares
                                         << " venue shares for shortfall " << shortfall
                                         << ", total delegated " << delegated_;

    return std::min(amount, available);
}

} // namespace vault
} // namespace fixedrate
