// FIXEDRATE - Hashing Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/crypto/hash.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace fixedrate {

// ============================================================================
// SHA256
// ============================================================================

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() {
        ctx = EVP_MD_CTX_new();
        if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            if (ctx) {
                EVP_MD_CTX_free(ctx);
            }
            throw std::runtime_error("SHA256: failed to initialize digest context");
        }
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("SHA256: digest update failed");
    }
    return *this;
}

SHA256& SHA256::Write(const std::string& str) {
    return Write(reinterpret_cast<const Byte*>(str.data()), str.size());
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: digest finalization failed");
    }
    Reset();
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: digest reset failed");
    }
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Byte out[SHA256::OUTPUT_SIZE];
    SHA256().Write(data, len).Finalize(out);
    return Hash256(out, SHA256::OUTPUT_SIZE);
}

Hash256 SHA256Hash(const std::string& str) {
    return SHA256Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

AccountId DeriveAccountId(const std::string& label) {
    Hash256 digest = SHA256Hash("account:" + label);
    return AccountId(digest.data(), AccountId::SIZE);
}

AccountId DeriveVaultId(const AccountId& asset, const AccountId& venue) {
    Byte out[SHA256::OUTPUT_SIZE];
    SHA256 hasher;
    hasher.Write("vault:");
    hasher.Write(asset.data(), asset.size());
    hasher.Write(venue.data(), venue.size());
    hasher.Finalize(out);
    return AccountId(out, AccountId::SIZE);
}

} // namespace fixedrate
