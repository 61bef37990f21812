// FIXEDRATE - Vault Events
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Change notifications for off-vault observers (indexers, dashboards,
// the simulator report). Events are buffered while a call runs and only
// delivered once it has committed.

#ifndef FIXEDRATE_VAULT_EVENTS_H
#define FIXEDRATE_VAULT_EVENTS_H

#include "fixedrate/core/types.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace fixedrate {
namespace vault {

enum class EventType {
    Initialized,
    Deposit,
    Withdrawal,
    Harvest,
    ProfitClaimed,
    WithdrawalDelayUpdated,
    HarvestDelayUpdated,
    HarvestDelayApplied,
    FixedRateUpdated
};

const char* EventTypeToString(EventType type);

/**
 * A single notification. Fields not relevant to the event type are zero.
 */
struct VaultEvent {
    EventType type{EventType::Initialized};
    AccountId caller;
    Timestamp timestamp{0};

    /// Asset amount requested or moved (deposit, withdrawal, claim, surplus)
    Amount amount{0};

    /// Asset amount actually paid out (withdrawal, claim)
    Amount paid{0};

    /// Shares minted or burned
    ShareAmount shares{0};

    /// New value of an updated parameter (delay seconds, rate)
    uint64_t value{0};

    /// Harvest only: value lost by the venue since the previous harvest
    Amount loss{0};

    /// HarvestDelayUpdated only: true when the change waits for the next harvest
    bool staged{false};

    std::string ToString() const;
};

/**
 * Subscriber registry with a per-call buffer.
 */
class EventBus {
public:
    using Callback = std::function<void(const VaultEvent&)>;

    /// Register a callback, returns its id
    uint64_t Subscribe(Callback callback);

    /// Remove a callback; false if the id is unknown
    bool Unsubscribe(uint64_t id);

    size_t SubscriberCount() const;

    /// Queue an event for the call in progress
    void Stage(VaultEvent event);

    /// Deliver and clear the queue
    void Flush();

    /// Remove and return the queued events without delivering them
    std::vector<VaultEvent> TakePending();

    /**
     * Hand events to every subscriber. Observer exceptions are logged and
     * never reach the caller.
     */
    void Deliver(const std::vector<VaultEvent>& events);

    /// Drop the queue without delivering
    void Discard();

    size_t PendingCount() const;

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, Callback> subscribers_;
    uint64_t nextId_{1};
    std::vector<VaultEvent> pending_;
};

} // namespace vault
} // namespace fixedrate

#endif // FIXEDRATE_VAULT_EVENTS_H
