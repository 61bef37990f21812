// FIXEDRATE - Core Types Header
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// This file defines fundamental types used throughout FIXEDRATE.

#ifndef FIXEDRATE_CORE_TYPES_H
#define FIXEDRATE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <limits>
#include <stdexcept>
#include <cstring>
#include <vector>

namespace fixedrate {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount of the underlying asset in its smallest units
using Amount = uint64_t;

/// Amount of vault shares
using ShareAmount = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Duration in whole seconds (delays)
using Seconds = uint64_t;

/// Largest representable amount. Also used as the "not initialized"
/// total share supply sentinel.
constexpr uint64_t MAX_AMOUNT = std::numeric_limits<uint64_t>::max();

/// Fixed-point scale for rates and prices (1.0 == WAD)
constexpr uint64_t WAD = 1000000000000000000ULL;

/// Longest harvest delay that may be configured (365 days)
constexpr Seconds MAX_HARVEST_DELAY = 365ULL * 24 * 60 * 60;

// ============================================================================
// Hex Helpers
// ============================================================================

/// Convert bytes to lowercase hex
std::string BytesToHex(const Byte* data, size_t len);

/// Convert hex to bytes (throws std::invalid_argument on bad input)
std::vector<Byte> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        if (len >= SIZE) {
            std::memcpy(data_.data(), data, SIZE);
        } else {
            data_.fill(0);
            if (data && len > 0) {
                std::memcpy(data_.data(), data, len);
            }
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to hex string (storage byte order)
    std::string ToHex() const;

    /// Create from hex string
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    explicit Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}
};

/// 160-bit identifier (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    explicit Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

// ============================================================================
// Identities
// ============================================================================

/// Identity of a depositor, caller or the vault itself
using AccountId = Hash160;

/// Short printable form of an account (first 8 hex chars)
std::string ShortId(const AccountId& id);

} // namespace fixedrate

#endif // FIXEDRATE_CORE_TYPES_H
