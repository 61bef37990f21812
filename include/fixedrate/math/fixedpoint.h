// FIXEDRATE - Fixed-Point Arithmetic
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Integer-only arithmetic used by the vault accounting:
// - Multiply-then-divide with an explicit rounding direction
// - Checked add/sub/mul that throw instead of wrapping
// - WAD (1e18) scaled helpers for rates and prices
//
// Intermediate products are computed in 128 bits so that x * y never
// overflows before the division. A result that does not fit 64 bits throws
// ArithmeticError.

#ifndef FIXEDRATE_MATH_FIXEDPOINT_H
#define FIXEDRATE_MATH_FIXEDPOINT_H

#include "fixedrate/core/types.h"

#include <cstdint>
#include <optional>

namespace fixedrate {
namespace math {

/// Rounding direction of a division
enum class Rounding {
    Down,
    Up
};

/// x * y / d rounded down
uint64_t MulDivDown(uint64_t x, uint64_t y, uint64_t d);

/// x * y / d rounded up
uint64_t MulDivUp(uint64_t x, uint64_t y, uint64_t d);

/// x * y / d with the given rounding
uint64_t MulDiv(uint64_t x, uint64_t y, uint64_t d, Rounding rounding);

/// x * y * z / d rounded down, or nullopt when the result exceeds 64 bits.
/// Division by zero still throws.
std::optional<uint64_t> TryMulMulDivDown(uint64_t x, uint64_t y, uint64_t z, uint64_t d);

/// x * y / WAD rounded down
inline uint64_t FMulDown(uint64_t x, uint64_t y) { return MulDivDown(x, y, WAD); }

/// x * y / WAD rounded up
inline uint64_t FMulUp(uint64_t x, uint64_t y) { return MulDivUp(x, y, WAD); }

/// a + b, throws ArithmeticError on overflow
uint64_t CheckedAdd(uint64_t a, uint64_t b);

/// a - b, throws ArithmeticError on underflow
uint64_t CheckedSub(uint64_t a, uint64_t b);

/// a * b, throws ArithmeticError on overflow
uint64_t CheckedMul(uint64_t a, uint64_t b);

/// a - b, or zero when b > a
inline uint64_t SaturatingSub(uint64_t a, uint64_t b) { return a > b ? a - b : 0; }

} // namespace math
} // namespace fixedrate

#endif // FIXEDRATE_MATH_FIXEDPOINT_H
