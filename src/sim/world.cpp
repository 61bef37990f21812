// FIXEDRATE - Simulation World Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/sim/world.h"
#include "fixedrate/core/errors.h"
#include "fixedrate/util/logging.h"
#include "fixedrate/util/time.h"

#include <limits>
#include <stdexcept>
#include <string>

namespace fixedrate {
namespace sim {

SimulationWorld::SimulationWorld(const std::string& assetSymbol, const std::string& venueName,
                                 Timestamp startTime)
    : token_(assetSymbol), venue_(token_, venueName), now_(startTime) {}

void SimulationWorld::SetTime(Timestamp t) {
    if (t < now_) {
        throw std::invalid_argument("cannot move clock back from " + util::FormatISO8601(now_) +
                                    " to " + util::FormatISO8601(t));
    }
    now_ = t;
}

void SimulationWorld::Advance(Seconds seconds) {
    constexpr Timestamp kMax = std::numeric_limits<Timestamp>::max();
    if (seconds > static_cast<Seconds>(kMax - now_)) {
        throw std::invalid_argument("cannot advance clock by " + std::to_string(seconds) +
                                    "s from " + util::FormatISO8601(now_));
    }
    now_ += static_cast<Timestamp>(seconds);
}

void SimulationWorld::Begin() {
    if (saved_) {
        throw InvalidStateError("simulation transaction already open");
    }
    saved_ = Saved{token_.Snapshot(), venue_.Snapshot()};
    ++begins_;
}

void SimulationWorld::Commit() {
    if (!saved_) {
        throw InvalidStateError("no simulation transaction to commit");
    }
    saved_.reset();
    ++commits_;
}

void SimulationWorld::Rollback() {
    if (!saved_) {
        throw InvalidStateError("no simulation transaction to roll back");
    }
    token_.Restore(saved_->token);
    venue_.Restore(saved_->venue);
    saved_.reset();
    ++rollbacks_;

    LOG_DEBUG(util::LogCategory::SIM) << "rolled back token and venue state";
}

} // namespace sim
} // namespace fixedrate
