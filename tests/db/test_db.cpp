// FIXEDRATE - Database Tests
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include <gtest/gtest.h>
#include "fixedrate/crypto/hash.h"
#include "fixedrate/db/database.h"
#include "fixedrate/db/leveldb.h"
#include "fixedrate/db/vaultdb.h"

#include <algorithm>
#include <filesystem>
#include <random>

using namespace fixedrate;
using namespace fixedrate::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("fixedrate_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    vault::VaultSnapshot CreateTestSnapshot() {
        vault::VaultSnapshot snapshot;
        snapshot.state.asset = DeriveAccountId("token:USDC");
        snapshot.state.venue = DeriveAccountId("venue:aave");
        snapshot.state.vaultId = DeriveVaultId(snapshot.state.asset, snapshot.state.venue);
        snapshot.state.initialized = true;
        snapshot.state.totalShares = 1500;
        snapshot.state.totalDelegatedHoldings = 1200;
        snapshot.state.withdrawalDelay = 1800;
        snapshot.state.schedule.harvestDelay = 3600;
        snapshot.state.schedule.pendingHarvestDelay = 7200;
        snapshot.state.schedule.lastHarvest = 1704067200;
        snapshot.state.schedule.fixedRatePerSecond = 1585489599;

        vault::AccountEntry alice;
        alice.account = DeriveAccountId("alice");
        alice.record.shares = 1000;
        alice.record.lastDeposit = 1704067300;

        vault::AccountEntry bob;
        bob.account = DeriveAccountId("bob");
        bob.record.shares = 500;
        bob.record.lastDeposit = 1704067400;

        snapshot.accounts = {alice, bob};
        std::sort(snapshot.accounts.begin(), snapshot.accounts.end(),
                  [](const vault::AccountEntry& a, const vault::AccountEntry& b) {
                      return a.account < b.account;
                  });
        return snapshot;
    }
};

// ============================================================================
// Basic Database Tests
// ============================================================================

TEST_F(DatabaseTest, OpenAndClose) {
    Options opts;
    opts.create_if_missing = true;

    auto [status, db] = OpenDatabase(testDir_ / "test_db", opts);
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(db, nullptr);
}

TEST_F(DatabaseTest, PutAndGet) {
    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok());

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());

    std::string value;
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(db->Exists(Slice("key1")));
}

TEST_F(DatabaseTest, GetMissingIsNotFound) {
    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok());

    std::string value;
    Status s = db->Get(Slice("missing"), &value);
    EXPECT_TRUE(s.IsNotFound());
    EXPECT_FALSE(db->Exists(Slice("missing")));
}

TEST_F(DatabaseTest, Delete) {
    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok());

    db->Put(Slice("key"), Slice("value"));
    ASSERT_TRUE(db->Delete(Slice("key")).ok());
    EXPECT_FALSE(db->Exists(Slice("key")));
}

TEST_F(DatabaseTest, DestroyRemovesDirectory) {
    std::filesystem::path path = testDir_ / "to_destroy";
    {
        auto [status, db] = OpenDatabase(path);
        ASSERT_TRUE(status.ok());
    }
    EXPECT_TRUE(DestroyDatabase(path).ok());
    EXPECT_FALSE(std::filesystem::exists(path));
}

// ============================================================================
// Memory Backend Tests
// ============================================================================

TEST(MemoryDatabaseTest, WriteBatchIsApplied) {
    MemoryDatabase db;
    db.Put(Slice("gone"), Slice("x"));

    WriteBatch batch;
    batch.Put(Slice("a"), Slice("1"));
    batch.Put(Slice("b"), Slice("2"));
    batch.Delete(Slice("gone"));
    EXPECT_EQ(batch.Count(), 3u);

    ASSERT_TRUE(db.Write(&batch).ok());
    EXPECT_EQ(db.Size(), 2u);
    EXPECT_FALSE(db.Exists(Slice("gone")));
    EXPECT_STREQ(db.Backend(), "memory");

    batch.Clear();
    EXPECT_TRUE(batch.Empty());
}

TEST(MemoryDatabaseTest, IteratorIsOrdered) {
    MemoryDatabase db;
    db.Put(Slice("b2"), Slice("x"));
    db.Put(Slice("a1"), Slice("x"));
    db.Put(Slice("b1"), Slice("x"));

    std::vector<std::string> keys;
    auto it = db.NewIterator();
    for (it->Seek(Slice("b")); it->Valid() && it->key().starts_with(Slice("b")); it->Next()) {
        keys.push_back(it->key().ToString());
    }

    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "b1");
    EXPECT_EQ(keys[1], "b2");
}

TEST(StatusTest, ToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_EQ(Status::NotFound("x").ToString(), "NotFound: x");
    EXPECT_EQ(Status::Corruption("bad").ToString(), "Corruption: bad");
    EXPECT_TRUE(Status::IOError().IsIOError());
}

TEST(KeyTest, MakeKeyPrefixesId) {
    AccountId id = DeriveAccountId("vault");
    std::string key = MakeKey(prefix::VAULT_STATE, id);
    ASSERT_EQ(key.size(), 1u + AccountId::SIZE);
    EXPECT_EQ(key[0], 'v');
    EXPECT_EQ(MakeKey(prefix::ACCOUNT), "a");
}

// ============================================================================
// Vault Store Tests
// ============================================================================

class VaultStoreTest : public DatabaseTest {
protected:
    VaultStoreTest() : store_(std::make_unique<MemoryDatabase>()) {}

    VaultStore store_;
};

TEST_F(VaultStoreTest, SaveAndLoad) {
    vault::VaultSnapshot snapshot = CreateTestSnapshot();
    ASSERT_TRUE(store_.Save(snapshot, false).ok());
    EXPECT_TRUE(store_.Has(snapshot.state.vaultId));

    vault::VaultSnapshot loaded;
    Status s = store_.Load(snapshot.state.vaultId, &loaded);
    ASSERT_TRUE(s.ok()) << s.ToString();

    EXPECT_EQ(loaded.state.vaultId, snapshot.state.vaultId);
    EXPECT_EQ(loaded.state.asset, snapshot.state.asset);
    EXPECT_TRUE(loaded.state.initialized);
    EXPECT_EQ(loaded.state.totalShares, 1500u);
    EXPECT_EQ(loaded.state.totalDelegatedHoldings, 1200u);
    EXPECT_EQ(loaded.state.withdrawalDelay, 1800u);
    EXPECT_EQ(loaded.state.schedule.pendingHarvestDelay, 7200u);
    EXPECT_EQ(loaded.state.schedule.fixedRatePerSecond, 1585489599u);

    ASSERT_EQ(loaded.accounts.size(), 2u);
    for (size_t i = 0; i < 2; ++i) {
        EXPECT_EQ(loaded.accounts[i].account, snapshot.accounts[i].account);
        EXPECT_EQ(loaded.accounts[i].record, snapshot.accounts[i].record);
    }
}

TEST_F(VaultStoreTest, SaveReplacesAccounts) {
    vault::VaultSnapshot snapshot = CreateTestSnapshot();
    ASSERT_TRUE(store_.Save(snapshot, false).ok());

    snapshot.accounts.pop_back();
    ASSERT_TRUE(store_.Save(snapshot, false).ok());

    vault::VaultSnapshot loaded;
    ASSERT_TRUE(store_.Load(snapshot.state.vaultId, &loaded).ok());
    EXPECT_EQ(loaded.accounts.size(), 1u);
}

TEST_F(VaultStoreTest, LoadMissingIsNotFound) {
    vault::VaultSnapshot loaded;
    EXPECT_TRUE(store_.Load(DeriveAccountId("nobody"), &loaded).IsNotFound());
    EXPECT_FALSE(store_.Has(DeriveAccountId("nobody")));
}

TEST_F(VaultStoreTest, UnreadableStateIsCorruption) {
    AccountId vaultId = DeriveAccountId("vault");
    store_.GetDatabase().Put(Slice(MakeKey(prefix::VAULT_STATE, vaultId)), Slice("garbage"));

    vault::VaultSnapshot loaded;
    EXPECT_TRUE(store_.Load(vaultId, &loaded).IsCorruption());
}

TEST_F(VaultStoreTest, MisplacedStateIsCorruption) {
    vault::VaultSnapshot snapshot = CreateTestSnapshot();
    AccountId other = DeriveAccountId("other");
    store_.GetDatabase().Put(Slice(MakeKey(prefix::VAULT_STATE, other)),
                             Slice(SerializeToString(snapshot.state)));

    vault::VaultSnapshot loaded;
    EXPECT_TRUE(store_.Load(other, &loaded).IsCorruption());
}

TEST_F(VaultStoreTest, EraseAndList) {
    vault::VaultSnapshot first = CreateTestSnapshot();
    vault::VaultSnapshot second = CreateTestSnapshot();
    second.state.vaultId = DeriveVaultId(second.state.asset, DeriveAccountId("venue:other"));

    ASSERT_TRUE(store_.Save(first, false).ok());
    ASSERT_TRUE(store_.Save(second, false).ok());
    EXPECT_EQ(store_.ListVaults().size(), 2u);

    ASSERT_TRUE(store_.Erase(first.state.vaultId).ok());
    EXPECT_FALSE(store_.Has(first.state.vaultId));

    std::vector<AccountId> ids = store_.ListVaults();
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], second.state.vaultId);

    vault::VaultSnapshot loaded;
    ASSERT_TRUE(store_.Load(second.state.vaultId, &loaded).ok());
    EXPECT_EQ(loaded.accounts.size(), 2u);
}

TEST_F(VaultStoreTest, NullDatabaseRejected) {
    std::unique_ptr<Database> none;
    EXPECT_THROW({ VaultStore store(std::move(none)); }, std::invalid_argument);
}

TEST_F(VaultStoreTest, OpenAtPath) {
    VaultStore store(testDir_ / "vaults");
    vault::VaultSnapshot snapshot = CreateTestSnapshot();
    ASSERT_TRUE(store.Save(snapshot).ok());
    EXPECT_TRUE(store.Has(snapshot.state.vaultId));
}
