// FIXEDRATE - Fixed-Point Arithmetic Tests
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include <gtest/gtest.h>

#include "fixedrate/core/errors.h"
#include "fixedrate/math/fixedpoint.h"

namespace fixedrate {
namespace math {
namespace test {

// ============================================================================
// Multiply-Divide
// ============================================================================

TEST(FixedPointTest, MulDivRounding) {
    EXPECT_EQ(MulDivDown(10, 1, 3), 3u);
    EXPECT_EQ(MulDivUp(10, 1, 3), 4u);
    EXPECT_EQ(MulDivDown(9, 1, 3), 3u);
    EXPECT_EQ(MulDivUp(9, 1, 3), 3u);
    EXPECT_EQ(MulDivUp(0, 5, 3), 0u);

    EXPECT_EQ(MulDiv(10, 1, 3, Rounding::Down), 3u);
    EXPECT_EQ(MulDiv(10, 1, 3, Rounding::Up), 4u);
}

TEST(FixedPointTest, WideIntermediateProduct) {
    // MAX * MAX would overflow 64 bits before the division
    EXPECT_EQ(MulDivDown(MAX_AMOUNT, MAX_AMOUNT, MAX_AMOUNT), MAX_AMOUNT);
    EXPECT_EQ(MulDivDown(MAX_AMOUNT, WAD, WAD), MAX_AMOUNT);
    EXPECT_EQ(MulDivUp(MAX_AMOUNT - 1, MAX_AMOUNT, MAX_AMOUNT), MAX_AMOUNT - 1);
}

TEST(FixedPointTest, MulDivOverflowThrows) {
    EXPECT_THROW(MulDivDown(MAX_AMOUNT, 2, 1), ArithmeticError);
    EXPECT_THROW(MulDivUp(MAX_AMOUNT, MAX_AMOUNT, MAX_AMOUNT - 1), ArithmeticError);
}

TEST(FixedPointTest, DivisionByZeroThrows) {
    EXPECT_THROW(MulDivDown(1, 1, 0), ArithmeticError);
    EXPECT_THROW(MulDivUp(1, 1, 0), ArithmeticError);
    EXPECT_THROW(TryMulMulDivDown(1, 1, 1, 0), ArithmeticError);
}

TEST(FixedPointTest, WadHelpers) {
    EXPECT_EQ(FMulDown(3 * WAD / 2, 10), 15u);
    EXPECT_EQ(FMulDown(WAD / 3, 10), 3u);
    EXPECT_EQ(FMulUp(WAD / 3, 10), 4u);
}

// ============================================================================
// Triple Product
// ============================================================================

TEST(FixedPointTest, TryMulMulDivDown) {
    // 100 at 4e14 per second for 100 seconds
    EXPECT_EQ(TryMulMulDivDown(100, 400000000000000ULL, 100, WAD).value_or(0), 4u);
    EXPECT_EQ(TryMulMulDivDown(0, MAX_AMOUNT, MAX_AMOUNT, 1).value_or(1), 0u);
    EXPECT_EQ(TryMulMulDivDown(MAX_AMOUNT, MAX_AMOUNT, 0, 1).value_or(1), 0u);

    // Product spills past 128 bits
    EXPECT_FALSE(TryMulMulDivDown(MAX_AMOUNT, MAX_AMOUNT, 2, 1).has_value());

    // Fits 128 bits but the quotient does not fit 64
    EXPECT_FALSE(TryMulMulDivDown(MAX_AMOUNT, 2, 1, 1).has_value());

    // Large intermediate, small result
    EXPECT_EQ(TryMulMulDivDown(MAX_AMOUNT, WAD, 1, WAD).value_or(0), MAX_AMOUNT);
}

// ============================================================================
// Checked Operations
// ============================================================================

TEST(FixedPointTest, CheckedAdd) {
    EXPECT_EQ(CheckedAdd(1, 2), 3u);
    EXPECT_EQ(CheckedAdd(MAX_AMOUNT, 0), MAX_AMOUNT);
    EXPECT_THROW(CheckedAdd(MAX_AMOUNT, 1), ArithmeticError);
}

TEST(FixedPointTest, CheckedSub) {
    EXPECT_EQ(CheckedSub(5, 5), 0u);
    EXPECT_THROW(CheckedSub(4, 5), ArithmeticError);
}

TEST(FixedPointTest, CheckedMul) {
    EXPECT_EQ(CheckedMul(1ULL << 32, (1ULL << 32) - 1), (1ULL << 32) * ((1ULL << 32) - 1));
    EXPECT_THROW(CheckedMul(1ULL << 32, 1ULL << 32), ArithmeticError);
}

TEST(FixedPointTest, SaturatingSub) {
    EXPECT_EQ(SaturatingSub(10, 4), 6u);
    EXPECT_EQ(SaturatingSub(4, 10), 0u);
}

} // namespace test
} // namespace math
} // namespace fixedrate
