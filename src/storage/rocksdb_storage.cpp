#include "storage/rocksdb_storage.hpp"
#include "storage/record_codec.hpp"
#include "storage/storage_error.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace tsync {

namespace {

// ── Keys ──────────────────────────────────────────────────────────────────────

[[nodiscard]] std::string client_key(const ClientId& client_id) {
    return "c:" + to_bytes(client_id);
}

[[nodiscard]] std::string version_prefix(const ClientId& client_id) {
    return "v:" + to_bytes(client_id);
}

[[nodiscard]] std::string version_key(const ClientId& client_id, const VersionId& version_id) {
    return version_prefix(client_id) + to_bytes(version_id);
}

[[nodiscard]] std::string parent_prefix(const ClientId& client_id) {
    return "p:" + to_bytes(client_id);
}

[[nodiscard]] std::string parent_key(const ClientId& client_id, const VersionId& parent_id) {
    return parent_prefix(client_id) + to_bytes(parent_id);
}

[[nodiscard]] std::string snapshot_key(const ClientId& client_id) {
    return "s:" + to_bytes(client_id);
}

// ── Status helpers ────────────────────────────────────────────────────────────

void check(const rocksdb::Status& status, const char* what) {
    if (!status.ok()) {
        spdlog::error("RocksDB {} failed: {}", what, status.ToString());
        throw StorageError(std::string("RocksDB ") + what + " failed: " + status.ToString());
    }
}

// Returns false on NotFound, throws on any other failure.
[[nodiscard]] bool found(const rocksdb::Status& status, const char* what) {
    if (status.IsNotFound()) {
        return false;
    }
    check(status, what);
    return true;
}

using TxnPtr = std::unique_ptr<rocksdb::Transaction>;

// Begins a pessimistic transaction.  Dropping the pointer without Commit()
// discards every write made through it.
[[nodiscard]] TxnPtr begin(rocksdb::TransactionDB& db) {
    TxnPtr txn{db.BeginTransaction(rocksdb::WriteOptions{})};
    if (!txn) {
        throw StorageError("RocksDB BeginTransaction failed");
    }
    return txn;
}

// Reads and locks the client record; std::nullopt if it does not exist (the
// key is locked either way, so a concurrent create is serialized too).
[[nodiscard]] std::optional<Client> lock_client(rocksdb::Transaction& txn,
                                                const ClientId& client_id) {
    std::string value;
    auto status = txn.GetForUpdate(rocksdb::ReadOptions{}, client_key(client_id), &value);
    if (!found(status, "GetForUpdate(client)")) {
        return std::nullopt;
    }
    return codec::decode_client(client_id, value);
}

[[nodiscard]] Client lock_existing_client(rocksdb::Transaction& txn,
                                          const ClientId& client_id) {
    auto client = lock_client(txn, client_id);
    if (!client) {
        throw StorageError("no such client " + to_string(client_id));
    }
    return std::move(*client);
}

} // anonymous namespace

RocksDBStorage::RocksDBStorage(const std::filesystem::path& db_path, const Clock& clock)
    : clock_(clock) {
    rocksdb::Options options;
    options.create_if_missing = true;

    // Optimise for small-to-medium working sets typical of a sync server.
    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();

    rocksdb::TransactionDBOptions txn_db_options;
    // Lock waits only queue behind other requests for the same client.
    txn_db_options.transaction_lock_timeout = 10'000; // ms

    rocksdb::TransactionDB* raw_db = nullptr;
    auto status = rocksdb::TransactionDB::Open(
        options, txn_db_options, db_path.string(), &raw_db);
    if (!status.ok()) {
        throw StorageError(
            "Failed to open RocksDB at " + db_path.string() + ": " +
            status.ToString());
    }
    db_.reset(raw_db);
    spdlog::info("RocksDB opened at {}", db_path.string());
}

RocksDBStorage::~RocksDBStorage() {
    if (db_) {
        spdlog::info("Closing RocksDB");
    }
    // unique_ptr<rocksdb::TransactionDB> destructor calls delete, which closes the DB.
}

std::optional<Client> RocksDBStorage::get_client(const ClientId& client_id) {
    std::string value;
    auto status = db_->Get(rocksdb::ReadOptions{}, client_key(client_id), &value);
    if (!found(status, "Get(client)")) {
        return std::nullopt;
    }
    return codec::decode_client(client_id, value);
}

CreateClientResult RocksDBStorage::create_client(const ClientId& client_id) {
    auto txn = begin(*db_);
    if (lock_client(*txn, client_id)) {
        return AlreadyExists{};
    }

    Client client;
    client.client_id = client_id;
    check(txn->Put(client_key(client_id), codec::encode_client(client)), "Put(client)");
    check(txn->Commit(), "Commit(create_client)");
    return client;
}

std::optional<Version> RocksDBStorage::get_version_by_parent(
    const ClientId& client_id, const VersionId& parent_version_id) {
    // Index and version must be read from the same point in time.
    rocksdb::ManagedSnapshot snapshot{db_.get()};
    rocksdb::ReadOptions read_options;
    read_options.snapshot = snapshot.snapshot();

    std::string child;
    auto status = db_->Get(read_options, parent_key(client_id, parent_version_id), &child);
    if (!found(status, "Get(parent index)")) {
        return std::nullopt;
    }
    auto child_id = from_bytes(child);
    if (!child_id) {
        throw StorageError("corrupt parent index for client " + to_string(client_id));
    }

    std::string value;
    status = db_->Get(read_options, version_key(client_id, *child_id), &value);
    if (!found(status, "Get(version)")) {
        return std::nullopt;
    }
    return codec::decode_version(*child_id, value);
}

std::optional<Version> RocksDBStorage::get_version(
    const ClientId& client_id, const VersionId& version_id) {
    std::string value;
    auto status = db_->Get(rocksdb::ReadOptions{}, version_key(client_id, version_id), &value);
    if (!found(status, "Get(version)")) {
        return std::nullopt;
    }
    return codec::decode_version(version_id, value);
}

AddVersionResult RocksDBStorage::add_version(
    const ClientId& client_id, const VersionId& parent_version_id,
    const VersionId& new_version_id, const std::string& history_segment) {
    auto txn = begin(*db_);
    Client client = lock_existing_client(*txn, client_id);

    if (client.latest_version_id != parent_version_id) {
        return Conflict{client.latest_version_id};
    }

    client.latest_version_id = new_version_id;
    ++client.versions_since_snapshot;

    check(txn->Put(version_key(client_id, new_version_id),
                   codec::encode_version(
                       Version{new_version_id, parent_version_id, history_segment})),
          "Put(version)");
    check(txn->Put(parent_key(client_id, parent_version_id), to_bytes(new_version_id)),
          "Put(parent index)");
    check(txn->Put(client_key(client_id), codec::encode_client(client)), "Put(client)");
    check(txn->Commit(), "Commit(add_version)");

    return Committed{client.versions_since_snapshot, client.snapshot};
}

AddSnapshotResult RocksDBStorage::add_snapshot(
    const ClientId& client_id, const VersionId& version_id, const std::string& snapshot) {
    auto txn = begin(*db_);
    Client client = lock_existing_client(*txn, client_id);

    const auto head = client.latest_version_id;
    if (head == kNilVersionId || head != version_id) {
        return VersionMismatch{head};
    }

    client.snapshot = SnapshotInfo{version_id, from_unix_seconds(to_unix_seconds(clock_.now()))};
    client.versions_since_snapshot = 0;

    check(txn->Put(snapshot_key(client_id), snapshot), "Put(snapshot)");
    check(txn->Put(client_key(client_id), codec::encode_client(client)), "Put(client)");
    check(txn->Commit(), "Commit(add_snapshot)");
    return SnapshotStored{};
}

std::optional<StoredSnapshot> RocksDBStorage::get_snapshot(const ClientId& client_id) {
    rocksdb::ManagedSnapshot snapshot{db_.get()};
    rocksdb::ReadOptions read_options;
    read_options.snapshot = snapshot.snapshot();

    std::string value;
    auto status = db_->Get(read_options, client_key(client_id), &value);
    if (!found(status, "Get(client)")) {
        return std::nullopt;
    }
    const Client client = codec::decode_client(client_id, value);
    if (!client.snapshot) {
        return std::nullopt;
    }

    std::string data;
    status = db_->Get(read_options, snapshot_key(client_id), &data);
    if (!found(status, "Get(snapshot)")) {
        throw StorageError("snapshot data missing for client " + to_string(client_id));
    }
    return StoredSnapshot{client.snapshot->version_id, std::move(data)};
}

std::size_t RocksDBStorage::prune_versions(
    const ClientId& client_id, const VersionId& up_to_version_id) {
    auto txn = begin(*db_);
    if (!lock_client(*txn, client_id)) {
        return 0;
    }

    std::size_t removed = 0;
    VersionId vid = up_to_version_id;
    while (vid != kNilVersionId) {
        std::string value;
        auto status = txn->Get(rocksdb::ReadOptions{}, version_key(client_id, vid), &value);
        if (!found(status, "Get(version)")) {
            break; // older history already pruned
        }
        const Version version = codec::decode_version(vid, value);
        check(txn->Delete(version_key(client_id, vid)), "Delete(version)");
        check(txn->Delete(parent_key(client_id, version.parent_version_id)),
              "Delete(parent index)");
        ++removed;
        vid = version.parent_version_id;
    }

    check(txn->Commit(), "Commit(prune_versions)");
    return removed;
}

bool RocksDBStorage::delete_client(const ClientId& client_id) {
    auto txn = begin(*db_);
    if (!lock_client(*txn, client_id)) {
        return false;
    }

    // Collect first, then delete, so the iterator never sees its own writes.
    std::vector<std::string> doomed;
    for (const auto& prefix : {version_prefix(client_id), parent_prefix(client_id)}) {
        std::unique_ptr<rocksdb::Iterator> it(txn->GetIterator(rocksdb::ReadOptions{}));
        for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
            doomed.emplace_back(it->key().ToString());
        }
        check(it->status(), "Iterator");
    }

    for (const auto& key : doomed) {
        check(txn->Delete(key), "Delete(version)");
    }
    check(txn->Delete(snapshot_key(client_id)), "Delete(snapshot)");
    check(txn->Delete(client_key(client_id)), "Delete(client)");
    check(txn->Commit(), "Commit(delete_client)");
    return true;
}

} // namespace tsync
