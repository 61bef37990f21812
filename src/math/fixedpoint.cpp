// FIXEDRATE - Fixed-Point Arithmetic Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/math/fixedpoint.h"
#include "fixedrate/core/errors.h"

#include <limits>
#include <string>

namespace fixedrate {
namespace math {

namespace {

__extension__ typedef unsigned __int128 uint128_t;

constexpr uint128_t MAX_U64 = std::numeric_limits<uint64_t>::max();

uint64_t Narrow(uint128_t value, const char* op) {
    if (value > MAX_U64) {
        throw ArithmeticError(std::string(op) + ": result overflows 64 bits");
    }
    return static_cast<uint64_t>(value);
}

} // namespace

uint64_t MulDivDown(uint64_t x, uint64_t y, uint64_t d) {
    if (d == 0) {
        throw ArithmeticError("MulDivDown: division by zero");
    }
    uint128_t product = static_cast<uint128_t>(x) * y;
    return Narrow(product / d, "MulDivDown");
}

uint64_t MulDivUp(uint64_t x, uint64_t y, uint64_t d) {
    if (d == 0) {
        throw ArithmeticError("MulDivUp: division by zero");
    }
    uint128_t product = static_cast<uint128_t>(x) * y;
    uint128_t quotient = product / d;
    if (product % d != 0) {
        ++quotient;
    }
    return Narrow(quotient, "MulDivUp");
}

std::optional<uint64_t> TryMulMulDivDown(uint64_t x, uint64_t y, uint64_t z, uint64_t d) {
    if (d == 0) {
        throw ArithmeticError("TryMulMulDivDown: division by zero");
    }
    uint128_t xy = static_cast<uint128_t>(x) * y;
    if (xy == 0 || z == 0) {
        return 0;
    }
    // xy * z >= 2^128 implies a quotient of at least 2^64 for any 64-bit d
    if (xy > (~static_cast<uint128_t>(0)) / z) {
        return std::nullopt;
    }
    uint128_t quotient = xy * z / d;
    if (quotient > MAX_U64) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(quotient);
}

uint64_t MulDiv(uint64_t x, uint64_t y, uint64_t d, Rounding rounding) {
    return rounding == Rounding::Up ? MulDivUp(x, y, d) : MulDivDown(x, y, d);
}

uint64_t CheckedAdd(uint64_t a, uint64_t b) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        throw ArithmeticError("CheckedAdd: overflow (" + std::to_string(a) +
                              " + " + std::to_string(b) + ")");
    }
    return a + b;
}

uint64_t CheckedSub(uint64_t a, uint64_t b) {
    if (b > a) {
        throw ArithmeticError("CheckedSub: underflow (" + std::to_string(a) +
                              " - " + std::to_string(b) + ")");
    }
    return a - b;
}

uint64_t CheckedMul(uint64_t a, uint64_t b) {
    return Narrow(static_cast<uint128_t>(a) * b, "CheckedMul");
}

} // namespace math
} // namespace fixedrate
