// FIXEDRATE - In-Memory Asset Token Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/sim/token.h"
#include "fixedrate/crypto/hash.h"
#include "fixedrate/math/fixedpoint.h"
#include "fixedrate/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace fixedrate {
namespace sim {

InMemoryToken::InMemoryToken(const std::string& symbol)
    : symbol_(symbol), id_(DeriveAccountId("token:" + symbol)) {}

Amount InMemoryToken::BalanceOf(const AccountId& account) const {
    auto it = state_.balances.find(account);
    return it == state_.balances.end() ? 0 : it->second;
}

Amount InMemoryToken::Allowance(const AccountId& owner, const AccountId& spender) const {
    auto it = state_.allowances.find({owner, spender});
    return it == state_.allowances.end() ? 0 : it->second;
}

bool InMemoryToken::ShouldFail(const char* call) {
    if (failMode_ == FailureMode::None) {
        return false;
    }
    if (failSkip_ > 0) {
        --failSkip_;
        return false;
    }

    FailureMode mode = failMode_;
    failMode_ = FailureMode::None;

    LOG_DEBUG(util::LogCategory::SIM) << symbol_ << ": injected failure in " << call;
    if (mode == FailureMode::Throw) {
        throw std::runtime_error(symbol_ + ": injected failure in " + call);
    }
    return true;
}

bool InMemoryToken::Transfer(const AccountId& from, const AccountId& to, Amount amount) {
    if (ShouldFail("transfer")) {
        return false;
    }

    Amount balance = BalanceOf(from);
    if (balance < amount) {
        LOG_DEBUG(util::LogCategory::SIM) << symbol_ << ": transfer of " << amount
                                          << " exceeds balance " << balance
                                          << " of " << ShortId(from);
        return false;
    }
    if (amount == 0 || from == to) {
        return true;
    }

    state_.balances[from] = balance - amount;
    state_.balances[to] = math::CheckedAdd(BalanceOf(to), amount);
    return true;
}

bool InMemoryToken::TransferFrom(const AccountId& spender, const AccountId& from,
                                 const AccountId& to, Amount amount) {
    if (ShouldFail("transferFrom")) {
        return false;
    }

    Amount allowed = Allowance(from, spender);
    if (spender != from && allowed < amount) {
        LOG_DEBUG(util::LogCategory::SIM) << symbol_ << ": allowance " << allowed
                                          << " of " << ShortId(spender)
                                          << " cannot cover " << amount;
        return false;
    }

    Amount balance = BalanceOf(from);
    if (balance < amount) {
        LOG_DEBUG(util::LogCategory::SIM) << symbol_ << ": transferFrom of " << amount
                                          << " exceeds balance " << balance
                                          << " of " << ShortId(from);
        return false;
    }

    if (spender != from && allowed != MAX_AMOUNT) {
        state_.allowances[{from, spender}] = allowed - amount;
    }
    if (amount == 0 || from == to) {
        return true;
    }

    state_.balances[from] = balance - amount;
    state_.balances[to] = math::CheckedAdd(BalanceOf(to), amount);
    return true;
}

bool InMemoryToken::Approve(const AccountId& owner, const AccountId& spender, Amount amount) {
    if (ShouldFail("approve")) {
        return false;
    }
    state_.allowances[{owner, spender}] = amount;
    return true;
}

void InMemoryToken::Mint(const AccountId& to, Amount amount) {
    state_.totalSupply = math::CheckedAdd(state_.totalSupply, amount);
    state_.balances[to] = BalanceOf(to) + amount;
}

Amount InMemoryToken::Burn(const AccountId& from, Amount amount) {
    Amount burned = std::min(amount, BalanceOf(from));
    if (burned == 0) {
        return 0;
    }
    state_.balances[from] -= burned;
    state_.totalSupply -= burned;
    return burned;
}

void InMemoryToken::InjectFailure(FailureMode mode, size_t skip) {
    failMode_ = mode;
    failSkip_ = skip;
}

void InMemoryToken::ClearFailure() {
    failMode_ = FailureMode::None;
    failSkip_ = 0;
}

} // namespace sim
} // namespace fixedrate
