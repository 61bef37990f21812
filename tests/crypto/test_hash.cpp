// FIXEDRATE - Hashing Tests
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include <gtest/gtest.h>
#include "fixedrate/crypto/hash.h"

#include <string>

namespace fixedrate {
namespace test {

// ============================================================================
// SHA256
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, KnownVectors) {
    EXPECT_EQ(SHA256Hash("").ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(SHA256Hash("abc").ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(SHA256Hash("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq").ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, MillionAs) {
    std::string input(1000000, 'a');
    EXPECT_EQ(SHA256Hash(input).ToHex(),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    Byte out[SHA256::OUTPUT_SIZE];
    SHA256 hasher;
    hasher.Write("a").Write("b").Write("c").Finalize(out);
    EXPECT_EQ(Hash256(out, sizeof(out)), SHA256Hash("abc"));
}

TEST(SHA256Test, FinalizeResets) {
    Byte first[SHA256::OUTPUT_SIZE];
    Byte second[SHA256::OUTPUT_SIZE];
    SHA256 hasher;
    hasher.Write("abc").Finalize(first);
    hasher.Write("abc").Finalize(second);
    EXPECT_EQ(Hash256(first, sizeof(first)), Hash256(second, sizeof(second)));

    hasher.Write("discarded").Reset().Write("abc").Finalize(second);
    EXPECT_EQ(Hash256(second, sizeof(second)), SHA256Hash("abc"));
}

// ============================================================================
// Identity Derivation
// ============================================================================

TEST(DeriveTest, AccountIdIsTruncatedDigest) {
    AccountId alice = DeriveAccountId("alice");
    Hash256 digest = SHA256Hash("account:alice");
    EXPECT_EQ(alice, AccountId(digest.data(), AccountId::SIZE));
    EXPECT_EQ(alice, DeriveAccountId("alice"));
    EXPECT_NE(alice, DeriveAccountId("bob"));
    EXPECT_FALSE(alice.IsNull());
}

TEST(DeriveTest, VaultIdDependsOnPairOrder) {
    AccountId asset = DeriveAccountId("token:USDC");
    AccountId venue = DeriveAccountId("venue:aave");

    EXPECT_EQ(DeriveVaultId(asset, venue), DeriveVaultId(asset, venue));
    EXPECT_NE(DeriveVaultId(asset, venue), DeriveVaultId(venue, asset));
    EXPECT_NE(DeriveVaultId(asset, venue), DeriveVaultId(asset, DeriveAccountId("venue:other")));
}

} // namespace test
} // namespace fixedrate
