// FIXEDRATE - Vault Snapshot Store Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/db/vaultdb.h"
#include "fixedrate/util/logging.h"

#include <stdexcept>

namespace fixedrate {
namespace db {

namespace {

std::string AccountPrefix(const AccountId& vaultId) {
    return MakeKey(prefix::ACCOUNT, vaultId);
}

std::string AccountKey(const AccountId& vaultId, const AccountId& account) {
    std::string key = AccountPrefix(vaultId);
    key.append(reinterpret_cast<const char*>(account.data()), account.size());
    return key;
}

} // namespace

VaultStore::VaultStore(const std::filesystem::path& dbPath, const Options& options) {
    auto [status, database] = OpenDatabase(dbPath, options);
    if (!status.ok()) {
        throw std::runtime_error("Failed to open vault database: " + status.ToString());
    }
    db_ = std::move(database);
}

VaultStore::VaultStore(std::unique_ptr<Database> database) : db_(std::move(database)) {
    if (!db_) {
        throw std::invalid_argument("VaultStore needs a database");
    }
}

std::vector<std::string> VaultStore::AccountKeys(const AccountId& vaultId) const {
    std::vector<std::string> keys;
    std::string start = AccountPrefix(vaultId);

    auto it = db_->NewIterator();
    for (it->Seek(Slice(start)); it->Valid() && it->key().starts_with(Slice(start)); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    return keys;
}

Status VaultStore::Save(const vault::VaultSnapshot& snapshot, bool sync) {
    const AccountId& vaultId = snapshot.state.vaultId;

    WriteBatch batch;
    for (const auto& key : AccountKeys(vaultId)) {
        batch.Delete(Slice(key));
    }
    batch.Put(Slice(MakeKey(prefix::VAULT_STATE, vaultId)),
              Slice(SerializeToString(snapshot.state)));
    for (const auto& entry : snapshot.accounts) {
        batch.Put(Slice(AccountKey(vaultId, entry.account)),
                  Slice(SerializeToString(entry.record)));
    }

    WriteOptions options;
    options.sync = sync;
    Status s = db_->Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "saving vault " << ShortId(vaultId)
                                         << " failed: " << s.ToString();
        return s;
    }

    LOG_INFO(util::LogCategory::DB) << "saved vault " << ShortId(vaultId) << " ("
                                    << snapshot.accounts.size() << " accounts, "
                                    << batch.Count() << " writes, " << db_->Backend() << ")";
    return s;
}

Status VaultStore::Load(const AccountId& vaultId, vault::VaultSnapshot* snapshot) const {
    std::string value;
    Status s = db_->Get(Slice(MakeKey(prefix::VAULT_STATE, vaultId)), &value);
    if (!s.ok()) {
        return s;
    }

    vault::VaultSnapshot result;
    if (!DeserializeFromString(value, result.state)) {
        return Status::Corruption("unreadable state of vault " + ShortId(vaultId));
    }
    if (result.state.vaultId != vaultId) {
        return Status::Corruption("state stored under " + ShortId(vaultId) +
                                  " names vault " + ShortId(result.state.vaultId));
    }

    std::string start = AccountPrefix(vaultId);
    auto it = db_->NewIterator();
    for (it->Seek(Slice(start)); it->Valid() && it->key().starts_with(Slice(start)); it->Next()) {
        Slice key = it->key();
        if (key.size() != start.size() + AccountId::SIZE) {
            return Status::Corruption("malformed account key of vault " + ShortId(vaultId));
        }

        vault::AccountEntry entry;
        entry.account = AccountId(reinterpret_cast<const Byte*>(key.data() + start.size()),
                                  AccountId::SIZE);
        if (!DeserializeFromString(it->value().ToString(), entry.record)) {
            return Status::Corruption("unreadable record of account " + ShortId(entry.account));
        }
        result.accounts.push_back(entry);
    }
    if (!it->status().ok()) {
        return it->status();
    }

    *snapshot = std::move(result);
    LOG_DEBUG(util::LogCategory::DB) << "loaded vault " << ShortId(vaultId) << " ("
                                     << snapshot->accounts.size() << " accounts)";
    return Status::Ok();
}

Status VaultStore::Erase(const AccountId& vaultId) {
    WriteBatch batch;
    for (const auto& key : AccountKeys(vaultId)) {
        batch.Delete(Slice(key));
    }
    batch.Delete(Slice(MakeKey(prefix::VAULT_STATE, vaultId)));
    return db_->Write(&batch);
}

bool VaultStore::Has(const AccountId& vaultId) const {
    return db_->Exists(Slice(MakeKey(prefix::VAULT_STATE, vaultId)));
}

std::vector<AccountId> VaultStore::ListVaults() const {
    std::vector<AccountId> ids;
    std::string start = MakeKey(prefix::VAULT_STATE);

    auto it = db_->NewIterator();
    for (it->Seek(Slice(start)); it->Valid() && it->key().starts_with(Slice(start)); it->Next()) {
        Slice key = it->key();
        if (key.size() == 1 + AccountId::SIZE) {
            ids.emplace_back(reinterpret_cast<const Byte*>(key.data() + 1), AccountId::SIZE);
        }
    }
    return ids;
}

} // namespace db
} // namespace fixedrate
