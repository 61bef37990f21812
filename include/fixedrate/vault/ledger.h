// FIXEDRATE - Share Ledger
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Total share supply, per-account share balances and the conversions
// between shares and underlying asset amounts.

#ifndef FIXEDRATE_VAULT_LEDGER_H
#define FIXEDRATE_VAULT_LEDGER_H

#include "fixedrate/core/serialize.h"
#include "fixedrate/core/types.h"

#include <map>
#include <optional>
#include <vector>

namespace fixedrate {
namespace vault {

// ============================================================================
// Account Record
// ============================================================================

/**
 * Per-depositor state.
 */
struct AccountRecord {
    /// Vault shares held
    ShareAmount shares{0};

    /// Time of the most recent deposit; gates withdrawals
    Timestamp lastDeposit{0};

    bool operator==(const AccountRecord& other) const {
        return shares == other.shares && lastDeposit == other.lastDeposit;
    }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::fixedrate::Serialize(s, shares);
        ::fixedrate::Serialize(s, lastDeposit);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::fixedrate::Unserialize(s, shares);
        ::fixedrate::Unserialize(s, lastDeposit);
    }
};

template<typename Stream>
void Serialize(Stream& s, const AccountRecord& record) {
    record.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, AccountRecord& record) {
    record.Unserialize(s);
}

// ============================================================================
// Share Ledger
// ============================================================================

/**
 * Share accounting.
 *
 * Before Open() the total supply holds the MAX_AMOUNT sentinel so that the
 * zero-supply (1:1) branch of the conversions can never be taken for a vault
 * that was not initialized.
 *
 * Mutations can be journaled: between BeginJournal() and CommitJournal() the
 * ledger remembers the first-seen value of everything it touches, and
 * RollbackJournal() puts it back.
 */
class ShareLedger {
public:
    ShareLedger() = default;

    // ========================================================================
    // Supply and Balances
    // ========================================================================

    /// Shares outstanding (MAX_AMOUNT until opened)
    ShareAmount TotalShares() const { return totalShares_; }

    /// True once Open() has been called
    bool IsOpen() const { return open_; }

    /// Replace the sentinel supply with zero. Only valid once.
    void Open();

    /// Shares of account (0 if unknown)
    ShareAmount BalanceOf(const AccountId& account) const;

    /// Full record of account, if it ever deposited or received shares
    std::optional<AccountRecord> GetRecord(const AccountId& account) const;

    /// Mint shares to account, growing the supply
    void Credit(const AccountId& account, ShareAmount shares);

    /// Burn shares of account, shrinking the supply.
    /// Throws InsufficientSharesError if the balance is too small.
    void Debit(const AccountId& account, ShareAmount shares);

    /// Record a deposit time for account
    void SetLastDeposit(const AccountId& account, Timestamp when);

    /// Sum of every account balance
    ShareAmount SumOfBalances() const;

    /// All records, ordered by account
    const std::map<AccountId, AccountRecord>& Accounts() const { return accounts_; }

    /// Number of accounts with a record
    size_t AccountCount() const { return accounts_.size(); }

    // ========================================================================
    // Conversions
    // ========================================================================

    /// Shares minted for depositing assets (round down)
    ShareAmount SharesForAssets(Amount assets, Amount totalHoldings) const;

    /// Assets owed for shares (round down)
    Amount AssetsForShares(ShareAmount shares, Amount totalHoldings) const;

    /// Shares burned to withdraw assets (round up)
    ShareAmount SharesToBurn(Amount assets, Amount totalHoldings) const;

    // ========================================================================
    // Journal
    // ========================================================================

    void BeginJournal();
    void CommitJournal();
    void RollbackJournal();
    bool InJournal() const { return journal_.has_value(); }

    /// True if any account was touched since BeginJournal()
    bool JournalTouched() const { return journal_ && !journal_->original.empty(); }

    // ========================================================================
    // Restore
    // ========================================================================

    /// Replace the whole ledger. Throws InvalidStateError if the supply does
    /// not equal the sum of balances.
    void Restore(bool open, ShareAmount totalShares,
                 const std::vector<std::pair<AccountId, AccountRecord>>& records);

private:
    struct Journal {
        ShareAmount totalShares;
        bool open;
        std::map<AccountId, std::optional<AccountRecord>> original;
    };

    void Touch(const AccountId& account);

    ShareAmount totalShares_{MAX_AMOUNT};
    bool open_{false};
    std::map<AccountId, AccountRecord> accounts_;
    std::optional<Journal> journal_;
};

} // namespace vault
} // namespace fixedrate

#endif // FIXEDRATE_VAULT_LEDGER_H
