// FIXEDRATE - Share Ledger Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/vault/ledger.h"
#include "fixedrate/core/errors.h"
#include "fixedrate/math/fixedpoint.h"
#include "fixedrate/util/logging.h"

namespace fixedrate {
namespace vault {

// ============================================================================
// Supply and Balances
// ============================================================================

void ShareLedger::Open() {
    if (open_) {
        throw AlreadyInitializedError("share ledger is already open");
    }
    open_ = true;
    totalShares_ = 0;
}

ShareAmount ShareLedger::BalanceOf(const AccountId& account) const {
    auto it = accounts_.find(account);
    return it == accounts_.end() ? 0 : it->second.shares;
}

std::optional<AccountRecord> ShareLedger::GetRecord(const AccountId& account) const {
    auto it = accounts_.find(account);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ShareLedger::Credit(const AccountId& account, ShareAmount shares) {
    if (!open_) {
        throw NotInitializedError("cannot mint shares before initialization");
    }
    ShareAmount newTotal = math::CheckedAdd(totalShares_, shares);

    Touch(account);
    AccountRecord& record = accounts_[account];
    record.shares = math::CheckedAdd(record.shares, shares);
    totalShares_ = newTotal;

    LOG_TRACE(util::LogCategory::LEDGER) << "credit " << ShortId(account)
                                         << " +" << shares << " -> " << record.shares;
}

void ShareLedger::Debit(const AccountId& account, ShareAmount shares) {
    ShareAmount balance = BalanceOf(account);
    if (shares > balance) {
        throw InsufficientSharesError("account " + ShortId(account) + " holds " +
                                      std::to_string(balance) + " shares, needs " +
                                      std::to_string(shares));
    }

    Touch(account);
    AccountRecord& record = accounts_[account];
    record.shares = balance - shares;
    totalShares_ = math::CheckedSub(totalShares_, shares);

    LOG_TRACE(util::LogCategory::LEDGER) << "debit " << ShortId(account)
                                         << " -" << shares << " -> " << record.shares;
}

void ShareLedger::SetLastDeposit(const AccountId& account, Timestamp when) {
    Touch(account);
    accounts_[account].lastDeposit = when;
}

ShareAmount ShareLedger::SumOfBalances() const {
    ShareAmount sum = 0;
    for (const auto& [account, record] : accounts_) {
        sum = math::CheckedAdd(sum, record.shares);
    }
    return sum;
}

// ============================================================================
// Conversions
// ============================================================================

ShareAmount ShareLedger::SharesForAssets(Amount assets, Amount totalHoldings) const {
    if (totalShares_ == 0) {
        return assets;
    }
    return math::MulDivDown(assets, totalShares_, totalHoldings);
}

Amount ShareLedger::AssetsForShares(ShareAmount shares, Amount totalHoldings) const {
    if (totalShares_ == 0) {
        return shares;
    }
    return math::MulDivDown(shares, totalHoldings, totalShares_);
}

ShareAmount ShareLedger::SharesToBurn(Amount assets, Amount totalHoldings) const {
    if (totalShares_ == 0) {
        return assets;
    }
    return math::MulDivUp(assets, totalShares_, totalHoldings);
}

// ============================================================================
// Journal
// ============================================================================

void ShareLedger::BeginJournal() {
    journal_ = Journal{totalShares_, open_, {}};
}

void ShareLedger::CommitJournal() {
    journal_.reset();
}

void ShareLedger::RollbackJournal() {
    if (!journal_) {
        return;
    }
    for (auto& [account, original] : journal_->original) {
        if (original) {
            accounts_[account] = *original;
        } else {
            accounts_.erase(account);
        }
    }
    totalShares_ = journal_->totalShares;
    open_ = journal_->open;
    journal_.reset();
}

void ShareLedger::Touch(const AccountId& account) {
    if (!journal_ || journal_->original.count(account)) {
        return;
    }
    journal_->original.emplace(account, GetRecord(account));
}

// ============================================================================
// Restore
// ============================================================================

void ShareLedger::Restore(bool open, ShareAmount totalShares,
                          const std::vector<std::pair<AccountId, AccountRecord>>& records) {
    std::map<AccountId, AccountRecord> accounts;
    ShareAmount sum = 0;
    for (const auto& [account, record] : records) {
        if (!accounts.emplace(account, record).second) {
            throw InvalidStateError("duplicate account record " + ShortId(account));
        }
        sum = math::CheckedAdd(sum, record.shares);
    }

    if (open && sum != totalShares) {
        throw InvalidStateError("total shares " + std::to_string(totalShares) +
                                " differ from sum of balances " + std::to_string(sum));
    }
    if (!open && (totalShares != MAX_AMOUNT || sum != 0)) {
        throw InvalidStateError("uninitialized ledger must be empty");
    }

    accounts_ = std::move(accounts);
    totalShares_ = totalShares;
    open_ = open;
    journal_.reset();
}

} // namespace vault
} // namespace fixedrate
