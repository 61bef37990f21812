// FIXEDRATE - In-Memory Asset Token
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#ifndef FIXEDRATE_SIM_TOKEN_H
#define FIXEDRATE_SIM_TOKEN_H

#include "fixedrate/core/types.h"
#include "fixedrate/interfaces/asset.h"

#include <map>
#include <string>
#include <utility>

namespace fixedrate {
namespace sim {

/// How an injected failure shows itself
enum class FailureMode {
    None,
    ReturnFalse,
    Throw
};

/**
 * Fungible token held entirely in memory.
 *
 * An allowance of MAX_AMOUNT is unlimited and never decremented.
 * Failures can be injected on the Nth upcoming mutating call, and the whole
 * state can be snapshotted and restored.
 */
class InMemoryToken : public IAssetToken {
public:
    struct State {
        std::map<AccountId, Amount> balances;
        std::map<std::pair<AccountId, AccountId>, Amount> allowances;
        Amount totalSupply{0};
    };

    explicit InMemoryToken(const std::string& symbol);

    // IAssetToken
    AccountId Id() const override { return id_; }
    bool TransferFrom(const AccountId& spender, const AccountId& from,
                      const AccountId& to, Amount amount) override;
    bool Transfer(const AccountId& from, const AccountId& to, Amount amount) override;
    bool Approve(const AccountId& owner, const AccountId& spender, Amount amount) override;
    Amount BalanceOf(const AccountId& account) const override;

    const std::string& Symbol() const { return symbol_; }
    Amount TotalSupply() const { return state_.totalSupply; }
    Amount Allowance(const AccountId& owner, const AccountId& spender) const;

    /// Create amount out of thin air for account
    void Mint(const AccountId& to, Amount amount);

    /// Destroy up to amount of account's balance; returns what was destroyed
    Amount Burn(const AccountId& from, Amount amount);

    /**
     * Make the mutating call `skip` calls from now fail with mode.
     * The injection is cleared once it fires.
     */
    void InjectFailure(FailureMode mode, size_t skip = 0);
    void ClearFailure();

    State Snapshot() const { return state_; }
    void Restore(const State& state) { state_ = state; }

private:
    /// True if the current mutating call must fail (throws for FailureMode::Throw)
    bool ShouldFail(const char* call);

    std::string symbol_;
    AccountId id_;
    State state_;

    FailureMode failMode_{FailureMode::None};
    size_t failSkip_{0};
};

} // namespace sim
} // namespace fixedrate

#endif // FIXEDRATE_SIM_TOKEN_H
