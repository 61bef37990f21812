// FIXEDRATE - Access Policy
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#ifndef FIXEDRATE_ACCESS_POLICY_H
#define FIXEDRATE_ACCESS_POLICY_H

#include "fixedrate/core/types.h"
#include "fixedrate/interfaces/authority.h"

#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace fixedrate {
namespace access {

/**
 * Owner-plus-grants authorization.
 *
 * The owner may call every privileged operation. Other accounts need an
 * explicit grant per operation. Grants to the owner are ignored; the owner
 * cannot be locked out by a revocation.
 */
class AccessPolicy : public IAuthority {
public:
    explicit AccessPolicy(const AccountId& owner);

    // IAuthority
    bool CanCall(const AccountId& caller, Operation op) const override;

    const AccountId& Owner() const { return owner_; }

    /// Hand ownership to newOwner. Existing grants are kept.
    void TransferOwnership(const AccountId& newOwner);

    /// Allow account to call op. Returns false if it already could.
    bool Grant(const AccountId& account, Operation op);

    /// Withdraw a grant. Returns false if there was none.
    bool Revoke(const AccountId& account, Operation op);

    /// Withdraw every grant of account
    void RevokeAll(const AccountId& account);

    /// Operations account was granted (the owner's implicit rights excluded)
    std::vector<Operation> GrantsOf(const AccountId& account) const;

    size_t GrantCount() const;

private:
    mutable std::mutex mutex_;
    AccountId owner_;
    std::map<AccountId, std::set<Operation>> grants_;
};

} // namespace access
} // namespace fixedrate

#endif // FIXEDRATE_ACCESS_POLICY_H
