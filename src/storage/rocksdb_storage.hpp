#pragma once

#include "common/clock.hpp"
#include "storage/sync_storage.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace rocksdb {
class TransactionDB;
} // namespace rocksdb

namespace tsync {

// ── RocksDBStorage ──────────────────────────────────────────────────────────
//
// Persistent SyncStorage backed by an embedded RocksDB TransactionDB.
//
// Every mutating call runs in a pessimistic rocksdb::Transaction that first
// locks the client's record with GetForUpdate(), so concurrent check-then-
// write calls for the same client are serialized by RocksDB's row locks
// while different clients proceed in parallel.  Reads use a consistent
// RocksDB snapshot.  A RocksDB directory can only be opened by one process.
//
// Key layout (ids are 16 raw bytes):
//   c:<client>            ClientRecord
//   v:<client><version>   VersionRecord
//   p:<client><parent>    child version id (the get_version_by_parent index)
//   s:<client>            snapshot bytes

class RocksDBStorage final : public SyncStorage {
public:
    // Opens (or creates) a RocksDB database at `db_path`.
    // Throws StorageError if the database cannot be opened.
    explicit RocksDBStorage(const std::filesystem::path& db_path,
                            const Clock& clock = SystemClock::instance());

    ~RocksDBStorage() override;

    // Not copyable or movable – RocksDB owns internal state.
    RocksDBStorage(const RocksDBStorage&)            = delete;
    RocksDBStorage& operator=(const RocksDBStorage&) = delete;
    RocksDBStorage(RocksDBStorage&&)                 = delete;
    RocksDBStorage& operator=(RocksDBStorage&&)      = delete;

    [[nodiscard]] std::optional<Client> get_client(const ClientId& client_id) override;
    [[nodiscard]] CreateClientResult create_client(const ClientId& client_id) override;
    [[nodiscard]] std::optional<Version>
    get_version_by_parent(const ClientId& client_id, const VersionId& parent_version_id) override;
    [[nodiscard]] std::optional<Version>
    get_version(const ClientId& client_id, const VersionId& version_id) override;
    [[nodiscard]] AddVersionResult
    add_version(const ClientId& client_id, const VersionId& parent_version_id,
                const VersionId& new_version_id, const std::string& history_segment) override;
    [[nodiscard]] AddSnapshotResult
    add_snapshot(const ClientId& client_id, const VersionId& version_id,
                 const std::string& snapshot) override;
    [[nodiscard]] std::optional<StoredSnapshot> get_snapshot(const ClientId& client_id) override;
    std::size_t prune_versions(const ClientId& client_id,
                               const VersionId& up_to_version_id) override;
    bool delete_client(const ClientId& client_id) override;

private:
    const Clock& clock_;
    std::unique_ptr<rocksdb::TransactionDB> db_;
};

} // namespace tsync
