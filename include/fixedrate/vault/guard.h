// FIXEDRATE - Reentrancy Guard
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#ifndef FIXEDRATE_VAULT_GUARD_H
#define FIXEDRATE_VAULT_GUARD_H

#include "fixedrate/core/errors.h"

#include <atomic>
#include <string>

namespace fixedrate {
namespace vault {

/**
 * Scoped non-reentrant lock over a flag.
 *
 * Acquiring a flag that is already held throws ReentrancyError at once; it
 * never waits. The flag is released on destruction or by Release().
 */
class ReentrancyGuard {
public:
    ReentrancyGuard(std::atomic<bool>& flag, const char* operation)
        : flag_(flag) {
        if (flag_.exchange(true)) {
            throw ReentrancyError(std::string("re-entered vault during ") + operation);
        }
        held_ = true;
    }

    ~ReentrancyGuard() {
        Release();
    }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    void Release() {
        if (held_) {
            held_ = false;
            flag_.store(false);
        }
    }

private:
    std::atomic<bool>& flag_;
    bool held_{false};
};

} // namespace vault
} // namespace fixedrate

#endif // FIXEDRATE_VAULT_GUARD_H
