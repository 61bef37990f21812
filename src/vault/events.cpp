// FIXEDRATE - Vault Events Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/vault/events.h"
#include "fixedrate/util/logging.h"

#include <sstream>

namespace fixedrate {
namespace vault {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::Initialized:            return "Initialized";
        case EventType::Deposit:                return "Deposit";
        case EventType::Withdrawal:             return "Withdrawal";
        case EventType::Harvest:                return "Harvest";
        case EventType::ProfitClaimed:          return "ProfitClaimed";
        case EventType::WithdrawalDelayUpdated: return "WithdrawalDelayUpdated";
        case EventType::HarvestDelayUpdated:    return "HarvestDelayUpdated";
        case EventType::HarvestDelayApplied:    return "HarvestDelayApplied";
        case EventType::FixedRateUpdated:       return "FixedRateUpdated";
        default:                                return "Unknown";
    }
}

std::string VaultEvent::ToString() const {
    std::ostringstream oss;
    oss << EventTypeToString(type) << " caller=" << ShortId(caller) << " t=" << timestamp;
    switch (type) {
        case EventType::Deposit:
            oss << " amount=" << amount << " shares=" << shares;
            break;
        case EventType::Withdrawal:
        case EventType::ProfitClaimed:
            oss << " amount=" << amount << " paid=" << paid << " shares=" << shares;
            break;
        case EventType::Harvest:
            oss << " surplus=" << amount << " feeShares=" << shares
                << " delegated=" << value;
            if (loss > 0) {
                oss << " loss=" << loss;
            }
            break;
        case EventType::HarvestDelayUpdated:
            oss << " value=" << value << (staged ? " (staged)" : "");
            break;
        case EventType::WithdrawalDelayUpdated:
        case EventType::HarvestDelayApplied:
        case EventType::FixedRateUpdated:
            oss << " value=" << value;
            break;
        default:
            break;
    }
    return oss.str();
}

uint64_t EventBus::Subscribe(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = nextId_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

bool EventBus::Unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.erase(id) > 0;
}

size_t EventBus::SubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

void EventBus::Stage(VaultEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(event));
}

std::vector<VaultEvent> EventBus::TakePending() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<VaultEvent> events;
    events.swap(pending_);
    return events;
}

void EventBus::Flush() {
    Deliver(TakePending());
}

void EventBus::Deliver(const std::vector<VaultEvent>& events) {
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, callback] : subscribers_) {
            callbacks.push_back(callback);
        }
    }

    for (const auto& event : events) {
        LOG_DEBUG(util::LogCategory::VAULT) << "event " << event.ToString();
        for (const auto& callback : callbacks) {
            // Observers cannot fail a committed call
            try {
                callback(event);
            } catch (const std::exception& e) {
                LOG_ERROR(util::LogCategory::VAULT) << "event observer threw on "
                                                    << EventTypeToString(event.type)
                                                    << ": " << e.what();
            } catch (...) {
                LOG_ERROR(util::LogCategory::VAULT) << "event observer threw a non-standard"
                                                    << " exception on "
                                                    << EventTypeToString(event.type);
            }
        }
    }
}

void EventBus::Discard() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
}

size_t EventBus::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace vault
} // namespace fixedrate
