// FIXEDRATE - Simulated Yield Venue Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/sim/venue.h"
#include "fixedrate/crypto/hash.h"
#include "fixedrate/math/fixedpoint.h"
#include "fixedrate/util/logging.h"

#include <stdexcept>
#include <string>

namespace fixedrate {
namespace sim {

namespace {
constexpr uint32_t BPS_DENOMINATOR = 10000;
}

SimulatedVenue::SimulatedVenue(InMemoryToken& token, const std::string& name)
    : token_(token), name_(name), id_(DeriveAccountId("venue:" + name)) {}

Amount SimulatedVenue::Balance() const {
    return token_.BalanceOf(id_);
}

uint64_t SimulatedVenue::PricePerShare() const {
    if (state_.totalSupply == 0) {
        return WAD;
    }
    return math::MulDivDown(Balance(), WAD, state_.totalSupply);
}

ShareAmount SimulatedVenue::ShareBalanceOf(const AccountId& owner) const {
    auto it = state_.shares.find(owner);
    return it == state_.shares.end() ? 0 : it->second;
}

void SimulatedVenue::RunHook() {
    if (!hook_) {
        return;
    }
    // Detach while running so a hook that calls back in does not recurse here
    Hook hook = std::move(hook_);
    hook_ = nullptr;
    try {
        hook();
    } catch (...) {
        hook_ = std::move(hook);
        throw;
    }
    hook_ = std::move(hook);
}

bool SimulatedVenue::Deposit(const AccountId& caller, Amount amount) {
    RunHook();

    if (amount == 0) {
        return true;
    }

    Amount balance = Balance();
    ShareAmount minted = (state_.totalSupply == 0 || balance == 0)
        ? amount
        : math::MulDivDown(amount, state_.totalSupply, balance);
    if (minted == 0) {
        LOG_DEBUG(util::LogCategory::SIM) << name_ << ": deposit of " << amount
                                          << " is worth no shares";
        return false;
    }

    if (!token_.TransferFrom(id_, caller, id_, amount)) {
        return false;
    }

    state_.shares[caller] = math::CheckedAdd(ShareBalanceOf(caller), minted);
    state_.totalSupply = math::CheckedAdd(state_.totalSupply, minted);

    LOG_TRACE(util::LogCategory::SIM) << name_ << ": " << ShortId(caller) << " deposited "
                                      << amount << " for " << minted << " shares";
    return true;
}

bool SimulatedVenue::Withdraw(const AccountId& caller, ShareAmount shares) {
    RunHook();

    ShareAmount owned = ShareBalanceOf(caller);
    if (shares > owned) {
        LOG_DEBUG(util::LogCategory::SIM) << name_ << ": redeem of " << shares
                                          << " exceeds position " << owned;
        return false;
    }
    if (shares == 0) {
        return true;
    }

    Amount value = math::MulDivDown(shares, Balance(), state_.totalSupply);
    Amount paid = value - math::MulDivDown(value, shortPayBps_, BPS_DENOMINATOR);

    state_.shares[caller] = owned - shares;
    state_.totalSupply -= shares;

    if (!token_.Transfer(id_, caller, paid)) {
        return false;
    }

    LOG_TRACE(util::LogCategory::SIM) << name_ << ": " << ShortId(caller) << " redeemed "
                                      << shares << " shares for " << paid;
    return true;
}

void SimulatedVenue::Accrue(Amount amount) {
    token_.Mint(id_, amount);
    LOG_DEBUG(util::LogCategory::SIM) << name_ << ": accrued " << amount
                                      << ", balance " << Balance();
}

Amount SimulatedVenue::Loss(Amount amount) {
    Amount lost = token_.Burn(id_, amount);
    LOG_DEBUG(util::LogCategory::SIM) << name_ << ": lost " << lost
                                      << ", balance " << Balance();
    return lost;
}

void SimulatedVenue::SetShortPayBps(uint64_t bps) {
    if (bps > BPS_DENOMINATOR) {
        throw std::invalid_argument(name_ + ": short-pay of " + std::to_string(bps) +
                                    " bps is above 10000");
    }
    shortPayBps_ = static_cast<uint32_t>(bps);
}

} // namespace sim
} // namespace fixedrate
