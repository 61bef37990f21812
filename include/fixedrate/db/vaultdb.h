// FIXEDRATE - Vault Snapshot Store
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Persists vault snapshots in a key-value database:
//   'v' + vault id            -> VaultState
//   'a' + vault id + account  -> AccountRecord

#ifndef FIXEDRATE_DB_VAULTDB_H
#define FIXEDRATE_DB_VAULTDB_H

#include "fixedrate/db/database.h"
#include "fixedrate/vault/snapshot.h"

#include <filesystem>
#include <memory>
#include <vector>

namespace fixedrate {
namespace db {

class VaultStore {
public:
    /**
     * Open (creating if needed) the store under dbPath.
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit VaultStore(const std::filesystem::path& dbPath,
                        const Options& options = Options());

    /// Use an already open database
    explicit VaultStore(std::unique_ptr<Database> database);

    /**
     * Write snapshot, replacing whatever was stored for its vault, in one
     * atomic batch.
     */
    Status Save(const vault::VaultSnapshot& snapshot, bool sync = true);

    /**
     * Read the snapshot of vaultId.
     * @return NotFound if nothing is stored, Corruption if a record is unreadable
     */
    Status Load(const AccountId& vaultId, vault::VaultSnapshot* snapshot) const;

    /// Delete every record of vaultId
    Status Erase(const AccountId& vaultId);

    bool Has(const AccountId& vaultId) const;

    /// Ids of every stored vault
    std::vector<AccountId> ListVaults() const;

    Database& GetDatabase() { return *db_; }

private:
    /// Keys of every stored account record of vaultId
    std::vector<std::string> AccountKeys(const AccountId& vaultId) const;

    std::unique_ptr<Database> db_;
};

} // namespace db
} // namespace fixedrate

#endif // FIXEDRATE_DB_VAULTDB_H
