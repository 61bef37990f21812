// FIXEDRATE - Access Policy Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/access/policy.h"
#include "fixedrate/util/logging.h"

namespace fixedrate {
namespace access {

AccessPolicy::AccessPolicy(const AccountId& owner) : owner_(owner) {}

bool AccessPolicy::CanCall(const AccountId& caller, Operation op) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller == owner_) {
        return true;
    }
    auto it = grants_.find(caller);
    return it != grants_.end() && it->second.count(op) > 0;
}

void AccessPolicy::TransferOwnership(const AccountId& newOwner) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_INFO(util::LogCategory::ACCESS) << "Ownership transferred from "
                                        << ShortId(owner_) << " to "
                                        << ShortId(newOwner);
    owner_ = newOwner;
}

bool AccessPolicy::Grant(const AccountId& account, Operation op) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (account == owner_) {
        return false;
    }
    bool inserted = grants_[account].insert(op).second;
    if (inserted) {
        LOG_INFO(util::LogCategory::ACCESS) << "Granted " << OperationToString(op)
                                            << " to " << ShortId(account);
    }
    return inserted;
}

bool AccessPolicy::Revoke(const AccountId& account, Operation op) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(account);
    if (it == grants_.end() || it->second.erase(op) == 0) {
        return false;
    }
    if (it->second.empty()) {
        grants_.erase(it);
    }
    LOG_INFO(util::LogCategory::ACCESS) << "Revoked " << OperationToString(op)
                                        << " from " << ShortId(account);
    return true;
}

void AccessPolicy::RevokeAll(const AccountId& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    grants_.erase(account);
}

std::vector<Operation> AccessPolicy::GrantsOf(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(account);
    if (it == grants_.end()) {
        return {};
    }
    return std::vector<Operation>(it->second.begin(), it->second.end());
}

size_t AccessPolicy::GrantCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [account, ops] : grants_) {
        count += ops.size();
    }
    return count;
}

} // namespace access
} // namespace fixedrate
