// FIXEDRATE - Simulated Yield Venue
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#ifndef FIXEDRATE_SIM_VENUE_H
#define FIXEDRATE_SIM_VENUE_H

#include "fixedrate/core/types.h"
#include "fixedrate/interfaces/venue.h"
#include "fixedrate/sim/token.h"

#include <functional>
#include <map>
#include <string>

namespace fixedrate {
namespace sim {

/**
 * Share-based venue over an InMemoryToken.
 *
 * The venue's balance is its token balance, so yield and losses are
 * modelled by minting to or burning from the venue account. The first
 * deposit into an empty venue mints shares 1:1.
 */
class SimulatedVenue : public IYieldVenue {
public:
    struct State {
        std::map<AccountId, ShareAmount> shares;
        ShareAmount totalSupply{0};
    };

    /// Called at the start of every Deposit and Withdraw
    using Hook = std::function<void()>;

    SimulatedVenue(InMemoryToken& token, const std::string& name);

    // IYieldVenue
    AccountId Id() const override { return id_; }
    bool Deposit(const AccountId& caller, Amount amount) override;
    bool Withdraw(const AccountId& caller, ShareAmount shares) override;
    Amount Balance() const override;
    ShareAmount TotalSupply() const override { return state_.totalSupply; }
    uint64_t PricePerShare() const override;
    ShareAmount ShareBalanceOf(const AccountId& owner) const override;

    const std::string& Name() const { return name_; }

    /// Grow the venue's balance by amount of yield
    void Accrue(Amount amount);

    /// Lose up to amount of the venue's balance; returns what was lost
    Amount Loss(Amount amount);

    /// Pay out only (10000 - bps)/10000 of each redemption. 0 disables.
    /// Throws std::invalid_argument above 10000.
    void SetShortPayBps(uint64_t bps);
    uint32_t ShortPayBps() const { return shortPayBps_; }

    void SetHook(Hook hook) { hook_ = std::move(hook); }
    void ClearHook() { hook_ = nullptr; }

    State Snapshot() const { return state_; }
    void Restore(const State& state) { state_ = state; }

private:
    void RunHook();

    InMemoryToken& token_;
    std::string name_;
    AccountId id_;
    State state_;

    uint32_t shortPayBps_{0};
    Hook hook_;
};

} // namespace sim
} // namespace fixedrate

#endif // FIXEDRATE_SIM_VENUE_H
