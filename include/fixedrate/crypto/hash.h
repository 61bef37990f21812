// FIXEDRATE - Hashing and Identity Derivation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// SHA-256 backed by OpenSSL EVP, and the helpers that turn labels and
// (asset, venue) pairs into 160-bit account identities.

#ifndef FIXEDRATE_CRYPTO_HASH_H
#define FIXEDRATE_CRYPTO_HASH_H

#include "fixedrate/core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace fixedrate {

/// Incremental SHA-256 hasher
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Write a string to the hasher
    SHA256& Write(const std::string& str);

    /// Finalize the hash and write OUTPUT_SIZE bytes to hash
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// One-shot SHA-256
Hash256 SHA256Hash(const Byte* data, size_t len);

/// One-shot SHA-256 of a string
Hash256 SHA256Hash(const std::string& str);

/// Account identity for a human-readable label (first 20 bytes of
/// SHA-256("account:" || label))
AccountId DeriveAccountId(const std::string& label);

/// Identity of the vault managing asset against venue. Doubles as the
/// protocol-fee account and as the deduplication key of the pair.
AccountId DeriveVaultId(const AccountId& asset, const AccountId& venue);

} // namespace fixedrate

#endif // FIXEDRATE_CRYPTO_HASH_H
