// FIXEDRATE - Simulation World
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// A self-contained environment for running a vault: one token, one venue
// and a settable clock. The world is also the vault's execution host, so a
// failed vault call rolls back token balances and venue positions too.

#ifndef FIXEDRATE_SIM_WORLD_H
#define FIXEDRATE_SIM_WORLD_H

#include "fixedrate/core/types.h"
#include "fixedrate/interfaces/host.h"
#include "fixedrate/sim/token.h"
#include "fixedrate/sim/venue.h"

#include <optional>
#include <string>

namespace fixedrate {
namespace sim {

class SimulationWorld : public IExecutionHost {
public:
    /// Default clock start (2024-01-01T00:00:00Z)
    static constexpr Timestamp DEFAULT_START_TIME = 1704067200;

    SimulationWorld(const std::string& assetSymbol, const std::string& venueName,
                    Timestamp startTime = DEFAULT_START_TIME);

    SimulationWorld(const SimulationWorld&) = delete;
    SimulationWorld& operator=(const SimulationWorld&) = delete;

    InMemoryToken& Token() { return token_; }
    const InMemoryToken& Token() const { return token_; }
    SimulatedVenue& Venue() { return venue_; }
    const SimulatedVenue& Venue() const { return venue_; }

    // ========================================================================
    // Clock
    // ========================================================================

    Timestamp Now() const override { return now_; }

    /// Move the clock to t. Time never runs backwards.
    void SetTime(Timestamp t);

    /// Move the clock forward by seconds. Throws std::invalid_argument if
    /// the clock would pass the largest timestamp.
    void Advance(Seconds seconds);

    // ========================================================================
    // Transactions
    // ========================================================================

    void Begin() override;
    void Commit() override;
    void Rollback() override;

    bool InTransaction() const { return saved_.has_value(); }

    /// Transactions started, committed and rolled back so far
    size_t BeginCount() const { return begins_; }
    size_t CommitCount() const { return commits_; }
    size_t RollbackCount() const { return rollbacks_; }

private:
    struct Saved {
        InMemoryToken::State token;
        SimulatedVenue::State venue;
    };

    InMemoryToken token_;
    SimulatedVenue venue_;
    Timestamp now_;

    std::optional<Saved> saved_;
    size_t begins_{0};
    size_t commits_{0};
    size_t rollbacks_{0};
};

} // namespace sim
} // namespace fixedrate

#endif // FIXEDRATE_SIM_WORLD_H
