// FIXEDRATE - Simulation Tests
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include <gtest/gtest.h>

#include "fixedrate/core/errors.h"
#include "fixedrate/crypto/hash.h"
#include "fixedrate/sim/world.h"

#include <stdexcept>

namespace fixedrate {
namespace sim {
namespace test {

class SimTest : public ::testing::Test {
protected:
    SimTest()
        : world_("USDC", "venue"),
          alice_(DeriveAccountId("alice")),
          bob_(DeriveAccountId("bob")) {}

    InMemoryToken& Token() { return world_.Token(); }
    SimulatedVenue& Venue() { return world_.Venue(); }

    /// Approve the venue and deposit amount for account
    bool VenueDeposit(const AccountId& account, Amount amount) {
        Token().Approve(account, Venue().Id(), amount);
        return Venue().Deposit(account, amount);
    }

    SimulationWorld world_;
    AccountId alice_;
    AccountId bob_;
};

// ============================================================================
// Token
// ============================================================================

TEST_F(SimTest, MintAndTransfer) {
    Token().Mint(alice_, 100);
    EXPECT_EQ(Token().TotalSupply(), 100u);

    EXPECT_TRUE(Token().Transfer(alice_, bob_, 40));
    EXPECT_EQ(Token().BalanceOf(alice_), 60u);
    EXPECT_EQ(Token().BalanceOf(bob_), 40u);

    EXPECT_FALSE(Token().Transfer(alice_, bob_, 61));
    EXPECT_EQ(Token().BalanceOf(alice_), 60u);
    EXPECT_EQ(Token().Symbol(), "USDC");
}

TEST_F(SimTest, TransferFromSpendsAllowance) {
    Token().Mint(alice_, 100);
    Token().Approve(alice_, bob_, 30);

    EXPECT_FALSE(Token().TransferFrom(bob_, alice_, bob_, 31));
    EXPECT_TRUE(Token().TransferFrom(bob_, alice_, bob_, 20));
    EXPECT_EQ(Token().Allowance(alice_, bob_), 10u);
    EXPECT_EQ(Token().BalanceOf(bob_), 20u);

    // Moving one's own funds needs no allowance
    EXPECT_TRUE(Token().TransferFrom(alice_, alice_, bob_, 5));
}

TEST_F(SimTest, UnlimitedAllowanceIsNotSpent) {
    Token().Mint(alice_, 100);
    Token().Approve(alice_, bob_, MAX_AMOUNT);

    EXPECT_TRUE(Token().TransferFrom(bob_, alice_, bob_, 60));
    EXPECT_EQ(Token().Allowance(alice_, bob_), MAX_AMOUNT);
}

TEST_F(SimTest, BurnIsCappedAtBalance) {
    Token().Mint(alice_, 10);
    EXPECT_EQ(Token().Burn(alice_, 25), 10u);
    EXPECT_EQ(Token().TotalSupply(), 0u);
    EXPECT_EQ(Token().Burn(alice_, 1), 0u);
}

TEST_F(SimTest, InjectedFailureSkipsCalls) {
    Token().Mint(alice_, 100);
    Token().InjectFailure(FailureMode::ReturnFalse, 1);

    EXPECT_TRUE(Token().Transfer(alice_, bob_, 1));
    EXPECT_FALSE(Token().Transfer(alice_, bob_, 1));
    EXPECT_TRUE(Token().Transfer(alice_, bob_, 1));
    EXPECT_EQ(Token().BalanceOf(bob_), 2u);
}

TEST_F(SimTest, InjectedFailureThrows) {
    Token().Mint(alice_, 100);
    Token().InjectFailure(FailureMode::Throw);

    // Mint is not a counted call
    Token().Mint(alice_, 1);
    EXPECT_THROW(Token().Approve(alice_, bob_, 1), std::runtime_error);
    EXPECT_TRUE(Token().Approve(alice_, bob_, 1));

    Token().InjectFailure(FailureMode::ReturnFalse);
    Token().ClearFailure();
    EXPECT_TRUE(Token().Transfer(alice_, bob_, 1));
}

// ============================================================================
// Venue
// ============================================================================

TEST_F(SimTest, FirstDepositMintsOneToOne) {
    Token().Mint(alice_, 100);
    EXPECT_EQ(Venue().PricePerShare(), WAD);

    ASSERT_TRUE(VenueDeposit(alice_, 100));
    EXPECT_EQ(Venue().ShareBalanceOf(alice_), 100u);
    EXPECT_EQ(Venue().TotalSupply(), 100u);
    EXPECT_EQ(Venue().Balance(), 100u);
    EXPECT_EQ(Token().BalanceOf(alice_), 0u);
}

TEST_F(SimTest, AccrualRaisesPrice) {
    Token().Mint(alice_, 100);
    Token().Mint(bob_, 150);
    ASSERT_TRUE(VenueDeposit(alice_, 100));

    Venue().Accrue(50);
    EXPECT_EQ(Venue().PricePerShare(), 3 * WAD / 2);

    ASSERT_TRUE(VenueDeposit(bob_, 150));
    EXPECT_EQ(Venue().ShareBalanceOf(bob_), 100u);

    ASSERT_TRUE(Venue().Withdraw(alice_, 100));
    EXPECT_EQ(Token().BalanceOf(alice_), 150u);
    EXPECT_EQ(Venue().ShareBalanceOf(alice_), 0u);
}

TEST_F(SimTest, DepositWithoutApprovalFails) {
    Token().Mint(alice_, 100);
    EXPECT_FALSE(Venue().Deposit(alice_, 100));
    EXPECT_EQ(Venue().TotalSupply(), 0u);
}

TEST_F(SimTest, WithdrawBeyondPositionFails) {
    Token().Mint(alice_, 100);
    ASSERT_TRUE(VenueDeposit(alice_, 100));
    EXPECT_FALSE(Venue().Withdraw(alice_, 101));
    EXPECT_TRUE(Venue().Withdraw(alice_, 0));
}

TEST_F(SimTest, LossLowersPrice) {
    Token().Mint(alice_, 100);
    ASSERT_TRUE(VenueDeposit(alice_, 100));

    EXPECT_EQ(Venue().Loss(40), 40u);
    EXPECT_EQ(Venue().PricePerShare(), 6 * WAD / 10);
    EXPECT_EQ(Venue().Loss(500), 60u);
}

TEST_F(SimTest, ShortPay) {
    Token().Mint(alice_, 100);
    ASSERT_TRUE(VenueDeposit(alice_, 100));

    Venue().SetShortPayBps(1000);
    ASSERT_TRUE(Venue().Withdraw(alice_, 100));
    EXPECT_EQ(Token().BalanceOf(alice_), 90u);

    EXPECT_THROW(Venue().SetShortPayBps(10001), std::invalid_argument);
}

TEST_F(SimTest, ShortPayRangeIsCheckedOnFullValue) {
    // Would read as 100 bps if narrowed to 32 bits first
    EXPECT_THROW(Venue().SetShortPayBps(4294967396ULL), std::invalid_argument);
    EXPECT_EQ(Venue().ShortPayBps(), 0u);

    Venue().SetShortPayBps(10000);
    EXPECT_EQ(Venue().ShortPayBps(), 10000u);
}

TEST_F(SimTest, HookRunsBeforeVenueCalls) {
    Token().Mint(alice_, 100);
    int calls = 0;
    Venue().SetHook([&]() { ++calls; });

    ASSERT_TRUE(VenueDeposit(alice_, 100));
    ASSERT_TRUE(Venue().Withdraw(alice_, 10));
    EXPECT_EQ(calls, 2);

    Venue().SetHook([]() { throw std::runtime_error("venue paused"); });
    EXPECT_THROW(Venue().Withdraw(alice_, 10), std::runtime_error);

    Venue().ClearHook();
    EXPECT_TRUE(Venue().Withdraw(alice_, 10));
}

// ============================================================================
// World
// ============================================================================

TEST_F(SimTest, Clock) {
    EXPECT_EQ(world_.Now(), SimulationWorld::DEFAULT_START_TIME);

    world_.Advance(60);
    EXPECT_EQ(world_.Now(), SimulationWorld::DEFAULT_START_TIME + 60);

    world_.SetTime(SimulationWorld::DEFAULT_START_TIME + 100);
    EXPECT_THROW(world_.SetTime(SimulationWorld::DEFAULT_START_TIME), std::invalid_argument);
}

TEST_F(SimTest, AdvancePastEndOfTimeIsRejected) {
    EXPECT_THROW(world_.Advance(MAX_AMOUNT), std::invalid_argument);
    EXPECT_EQ(world_.Now(), SimulationWorld::DEFAULT_START_TIME);
}

TEST_F(SimTest, RollbackRestoresTokenAndVenue) {
    Token().Mint(alice_, 100);

    world_.Begin();
    EXPECT_TRUE(world_.InTransaction());
    ASSERT_TRUE(VenueDeposit(alice_, 100));
    world_.Rollback();

    EXPECT_FALSE(world_.InTransaction());
    EXPECT_EQ(Token().BalanceOf(alice_), 100u);
    EXPECT_EQ(Venue().TotalSupply(), 0u);
    EXPECT_EQ(world_.RollbackCount(), 1u);
}

TEST_F(SimTest, CommitKeepsChanges) {
    Token().Mint(alice_, 100);

    world_.Begin();
    ASSERT_TRUE(Token().Transfer(alice_, bob_, 30));
    world_.Commit();

    EXPECT_EQ(Token().BalanceOf(bob_), 30u);
    EXPECT_EQ(world_.BeginCount(), 1u);
    EXPECT_EQ(world_.CommitCount(), 1u);
}

TEST_F(SimTest, TransactionMisuse) {
    EXPECT_THROW(world_.Commit(), InvalidStateError);
    EXPECT_THROW(world_.Rollback(), InvalidStateError);

    world_.Begin();
    EXPECT_THROW(world_.Begin(), InvalidStateError);
    world_.Commit();
}

} // namespace test
} // namespace sim
} // namespace fixedrate
