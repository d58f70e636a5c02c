#pragma once

#include "common/clock.hpp"
#include "storage/sync_storage.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace tsync {

// ── SqliteStorage ─────────────────────────────────────────────────────────────
//
// Persistent SyncStorage in a single SQLite database file
// (<directory>/tasksync.sqlite3, WAL journal mode).
//
// Each call checks a connection out of a small pool, runs one transaction on
// it and returns it.  Mutating calls use BEGIN IMMEDIATE, which takes SQLite's
// database-wide write lock up front: check-then-write calls are serialized
// across threads *and* across processes sharing the file.  Lock waits are
// bounded by `busy_timeout`; exceeding it is a StorageError.
//
// Schema:
//   clients(client_id PK, latest_version_id, snapshot_version_id,
//           versions_since_snapshot, snapshot_timestamp, snapshot)
//   versions(client_id FK ON DELETE CASCADE, version_id, parent_version_id,
//            history_segment, PK(client_id, version_id))
//   UNIQUE INDEX versions_by_parent(client_id, parent_version_id)

class SqliteStorage final : public SyncStorage {
public:
    static constexpr const char* kFilename = "tasksync.sqlite3";

    // Opens (or creates) the database in `directory`, creating the directory
    // and the schema as needed.  Throws StorageError on failure.
    explicit SqliteStorage(const std::filesystem::path& directory,
                           const Clock& clock = SystemClock::instance(),
                           std::chrono::milliseconds busy_timeout = std::chrono::seconds{5});

    ~SqliteStorage() override;

    SqliteStorage(const SqliteStorage&)            = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;
    SqliteStorage(SqliteStorage&&)                 = delete;
    SqliteStorage& operator=(SqliteStorage&&)      = delete;

    [[nodiscard]] const std::filesystem::path& db_file() const noexcept { return db_file_; }

    // Connections currently parked in the pool.
    [[nodiscard]] std::size_t idle_connections();

    // A connection may only be pooled again when no transaction is open on it,
    // e.g. after a failed ROLLBACK it is closed instead.
    [[nodiscard]] static bool reusable(sqlite3* db) noexcept;

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
    // Owns one sqlite3 handle.
    class Connection {
    public:
        explicit Connection(sqlite3* db) noexcept : db_(db) {}
        ~Connection();
        Connection(const Connection&)            = delete;
        Connection& operator=(const Connection&) = delete;

        [[nodiscard]] sqlite3* get() const noexcept { return db_; }

    private:
        sqlite3* db_;
    };

    // Checked-out connection; returns itself to the pool on destruction.
    class Lease {
    public:
        Lease(SqliteStorage& owner, std::unique_ptr<Connection> conn) noexcept
            : owner_(owner), conn_(std::move(conn)) {}
        ~Lease();
        Lease(const Lease&)            = delete;
        Lease& operator=(const Lease&) = delete;

        [[nodiscard]] sqlite3* get() const noexcept { return conn_->get(); }

    private:
        SqliteStorage& owner_;
        std::unique_ptr<Connection> conn_;
    };

    [[nodiscard]] std::unique_ptr<Connection> open_connection() const;
    [[nodiscard]] Lease checkout();

    std::filesystem::path db_file_;
    const Clock& clock_;
    std::chrono::milliseconds busy_timeout_;

    std::mutex pool_mutex_;
    std::vector<std::unique_ptr<Connection>> idle_;
};

} // namespace tsync
