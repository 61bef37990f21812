// FIXEDRATE - Harvest Engine Tests
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include <gtest/gtest.h>

#include "fixedrate/core/errors.h"
#include "fixedrate/crypto/hash.h"
#include "fixedrate/sim/world.h"
#include "fixedrate/vault/harvest.h"

#include <limits>

namespace fixedrate {
namespace vault {
namespace test {

constexpr Timestamp T0 = 1704067200;

class HarvestTest : public ::testing::Test {
protected:
    HarvestTest()
        : world_("USDC", "venue"),
          vaultId_(DeriveAccountId("vault")),
          depositor_(DeriveAccountId("alice")),
          router_(world_.Token(), world_.Venue(), vaultId_) {}

    void SetUp() override {
        engine_.SetHarvestDelay(100);
        engine_.Start(T0);
        ledger_.Open();
    }

    /// Mint shares 1:1 for amount and delegate it
    void Deposit(Amount amount) {
        ledger_.Credit(depositor_, ledger_.SharesForAssets(amount, router_.TotalHoldings()));
        world_.Token().Mint(vaultId_, amount);
        router_.Delegate(amount);
    }

    sim::SimulationWorld world_;
    AccountId vaultId_;
    AccountId depositor_;
    ShareLedger ledger_;
    CapitalRouter router_;
    HarvestEngine engine_;
};

TEST_F(HarvestTest, FirstDelayAppliesImmediately) {
    HarvestEngine fresh;
    EXPECT_TRUE(fresh.SetHarvestDelay(50));
    EXPECT_EQ(fresh.Schedule().harvestDelay, 50u);
    EXPECT_FALSE(fresh.SetHarvestDelay(70));
    EXPECT_EQ(fresh.Schedule().harvestDelay, 50u);
    EXPECT_EQ(fresh.Schedule().pendingHarvestDelay, 70u);
}

TEST_F(HarvestTest, DelayBounds) {
    HarvestEngine fresh;
    EXPECT_THROW(fresh.SetHarvestDelay(0), ZeroDelayError);
    EXPECT_THROW(fresh.SetHarvestDelay(MAX_HARVEST_DELAY + 1), DelayTooLongError);
    EXPECT_TRUE(fresh.SetHarvestDelay(MAX_HARVEST_DELAY));
}

TEST_F(HarvestTest, NextHarvestTime) {
    EXPECT_EQ(engine_.NextHarvestTime(), T0 + 100);
    EXPECT_FALSE(engine_.IsDue(T0 + 99));
    EXPECT_TRUE(engine_.IsDue(T0 + 100));
}

TEST_F(HarvestTest, NextHarvestTimeSaturates) {
    HarvestSchedule schedule;
    schedule.harvestDelay = MAX_HARVEST_DELAY;
    schedule.lastHarvest = std::numeric_limits<Timestamp>::max() - 10;
    engine_.Restore(schedule);
    EXPECT_EQ(engine_.NextHarvestTime(), std::numeric_limits<Timestamp>::max());
}

TEST_F(HarvestTest, ExpectedProfitAtFixedRate) {
    engine_.SetFixedRate(400000000000000ULL);
    EXPECT_EQ(engine_.ExpectedProfit(100, 100), 4u);
    EXPECT_EQ(engine_.ExpectedProfit(100, 0), 0u);
    EXPECT_EQ(engine_.ExpectedProfit(0, 100), 0u);

    // Rounds down: 99 * 4e14 * 100 / 1e18 = 3.96
    EXPECT_EQ(engine_.ExpectedProfit(99, 100), 3u);
}

TEST_F(HarvestTest, ExpectedProfitSaturatesOnOverflow) {
    engine_.SetFixedRate(WAD);
    EXPECT_EQ(engine_.ExpectedProfit(MAX_AMOUNT, MAX_HARVEST_DELAY), MAX_AMOUNT);
}

TEST_F(HarvestTest, TooSoon) {
    EXPECT_THROW(engine_.Harvest(T0 + 99, ledger_, router_, vaultId_), HarvestTooSoonError);
    EXPECT_EQ(engine_.Schedule().lastHarvest, T0);
}

TEST_F(HarvestTest, SurplusMintsFeeShares) {
    engine_.SetFixedRate(400000000000000ULL);
    Deposit(100);
    world_.Venue().Accrue(10);

    HarvestReport report = engine_.Harvest(T0 + 100, ledger_, router_, vaultId_);
    EXPECT_EQ(report.timestamp, T0 + 100);
    EXPECT_EQ(report.previousDelegated, 100u);
    EXPECT_EQ(report.observedValue, 110u);
    EXPECT_EQ(report.realProfit, 10u);
    EXPECT_EQ(report.expectedProfit, 4u);
    EXPECT_EQ(report.surplus, 6u);
    EXPECT_EQ(report.feeShares, 6u);
    EXPECT_EQ(report.loss, 0u);

    EXPECT_EQ(ledger_.BalanceOf(vaultId_), 6u);
    EXPECT_EQ(router_.Delegated(), 110u);
    EXPECT_EQ(engine_.Schedule().lastHarvest, T0 + 100);
}

TEST_F(HarvestTest, ProfitBelowRateMintsNothing) {
    engine_.SetFixedRate(400000000000000ULL);
    Deposit(100);
    world_.Venue().Accrue(4);

    HarvestReport report = engine_.Harvest(T0 + 100, ledger_, router_, vaultId_);
    EXPECT_EQ(report.surplus, 0u);
    EXPECT_EQ(report.feeShares, 0u);
    EXPECT_EQ(ledger_.TotalShares(), 100u);
    EXPECT_EQ(router_.Delegated(), 104u);
}

TEST_F(HarvestTest, LossIsReportedAndResynced) {
    Deposit(1000);
    world_.Venue().Loss(250);

    HarvestReport report = engine_.Harvest(T0 + 100, ledger_, router_, vaultId_);
    EXPECT_EQ(report.realProfit, 0u);
    EXPECT_EQ(report.loss, 250u);
    EXPECT_EQ(report.feeShares, 0u);
    EXPECT_EQ(router_.Delegated(), 750u);
}

TEST_F(HarvestTest, RecoveryIntoEmptyVaultMintsNothing) {
    Deposit(1000);
    world_.Venue().Loss(1000);
    engine_.Harvest(T0 + 100, ledger_, router_, vaultId_);
    EXPECT_EQ(router_.TotalHoldings(), 0u);

    world_.Venue().Accrue(500);
    HarvestReport report = engine_.Harvest(T0 + 200, ledger_, router_, vaultId_);
    EXPECT_EQ(report.surplus, 500u);
    EXPECT_EQ(report.feeShares, 0u);
    EXPECT_EQ(ledger_.BalanceOf(vaultId_), 0u);
    EXPECT_EQ(ledger_.TotalShares(), 1000u);
    EXPECT_EQ(router_.Delegated(), 500u);
    EXPECT_EQ(engine_.Schedule().lastHarvest, T0 + 200);
}

TEST_F(HarvestTest, StagedDelayRollsOver) {
    EXPECT_FALSE(engine_.SetHarvestDelay(300));

    HarvestReport report = engine_.Harvest(T0 + 100, ledger_, router_, vaultId_);
    EXPECT_TRUE(report.delayApplied);
    EXPECT_EQ(report.harvestDelay, 300u);
    EXPECT_EQ(engine_.Schedule().pendingHarvestDelay, 0u);
    EXPECT_EQ(engine_.NextHarvestTime(), T0 + 400);
}

} // namespace test
} // namespace vault
} // namespace fixedrate
