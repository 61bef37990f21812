// FIXEDRATE - Execution Host Interface
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// The environment a vault runs in. It supplies the current time and the
// transaction boundary around each state-changing call, so that effects on
// collaborators (token balances, venue positions) are undone together with
// the vault's own state when a call fails.

#ifndef FIXEDRATE_INTERFACES_HOST_H
#define FIXEDRATE_INTERFACES_HOST_H

#include "fixedrate/core/types.h"

namespace fixedrate {

class IExecutionHost {
public:
    virtual ~IExecutionHost() = default;

    /// Current Unix time in seconds
    virtual Timestamp Now() const = 0;

    /// Start a transaction covering collaborator state
    virtual void Begin() = 0;

    /// Keep all collaborator changes since Begin()
    virtual void Commit() = 0;

    /// Undo all collaborator changes since Begin()
    virtual void Rollback() = 0;
};

/**
 * Host backed by the process clock (util::GetTime, mock-time aware).
 * Collaborators are external, so Begin/Commit/Rollback are no-ops.
 */
class SystemHost : public IExecutionHost {
public:
    Timestamp Now() const override;
    void Begin() override {}
    void Commit() override {}
    void Rollback() override {}
};

} // namespace fixedrate

#endif // FIXEDRATE_INTERFACES_HOST_H
