#include "storage/sqlite_storage.hpp"
#include "storage/storage_error.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <system_error>

namespace tsync {

namespace {

// Pool size cap; connections beyond it are closed on check-in.
constexpr std::size_t kMaxIdleConnections = 16;

constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS clients ("
    "  client_id TEXT PRIMARY KEY,"
    "  latest_version_id TEXT NOT NULL,"
    "  snapshot_version_id TEXT,"
    "  versions_since_snapshot INTEGER NOT NULL DEFAULT 0,"
    "  snapshot_timestamp INTEGER,"
    "  snapshot BLOB)",
    "CREATE TABLE IF NOT EXISTS versions ("
    "  client_id TEXT NOT NULL REFERENCES clients (client_id) ON DELETE CASCADE,"
    "  version_id TEXT NOT NULL,"
    "  parent_version_id TEXT NOT NULL,"
    "  history_segment BLOB NOT NULL,"
    "  PRIMARY KEY (client_id, version_id))",
    "CREATE UNIQUE INDEX IF NOT EXISTS versions_by_parent"
    "  ON versions (client_id, parent_version_id)",
};

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    const std::string msg = what + ": " + sqlite3_errmsg(db);
    spdlog::error("SQLite {}", msg);
    throw StorageError("SQLite " + msg);
}

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        const std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        spdlog::error("SQLite exec '{}' failed: {}", sql, msg);
        throw StorageError("SQLite exec failed: " + msg);
    }
}

// ── Statement ─────────────────────────────────────────────────────────────────
// RAII wrapper for one prepared statement.  Parameters are 1-based, columns
// 0-based, as in the C API.

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            fail(db, std::string("prepare '") + sql + "'");
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& text) {
        check(sqlite3_bind_text(stmt_, idx, text.data(), static_cast<int>(text.size()),
                                SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int idx, const boost::uuids::uuid& id) {
        return bind(idx, to_string(id));
    }

    Statement& bind(int idx, int64_t value) {
        check(sqlite3_bind_int64(stmt_, idx, value));
        return *this;
    }

    Statement& bind_blob(int idx, const std::string& bytes) {
        check(sqlite3_bind_blob64(stmt_, idx, bytes.data(), bytes.size(), SQLITE_TRANSIENT));
        return *this;
    }

    // Returns true while a row is available, false when done.
    [[nodiscard]] bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail(db_, std::string("step '") + sqlite3_sql(stmt_) + "'");
    }

    // For statements that return no rows.
    void run() {
        if (step()) {
            fail(db_, std::string("unexpected row from '") + sqlite3_sql(stmt_) + "'");
        }
    }

    [[nodiscard]] bool is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    [[nodiscard]] int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

    [[nodiscard]] std::string text(int col) const {
        const auto* p = sqlite3_column_text(stmt_, col);
        const int n   = sqlite3_column_bytes(stmt_, col);
        return p ? std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(n))
                 : std::string{};
    }

    [[nodiscard]] std::string blob(int col) const {
        const void* p = sqlite3_column_blob(stmt_, col);
        const int n   = sqlite3_column_bytes(stmt_, col);
        return p ? std::string(static_cast<const char*>(p), static_cast<std::size_t>(n))
                 : std::string{};
    }

    [[nodiscard]] boost::uuids::uuid uuid(int col) const {
        auto id = parse_uuid(text(col));
        if (!id) {
            throw StorageError(std::string("corrupt uuid in column ") +
                               sqlite3_column_name(stmt_, col));
        }
        return *id;
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            fail(db_, "bind");
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// ── Transaction ───────────────────────────────────────────────────────────────
// Rolls back on destruction unless commit() succeeded.

class Transaction {
public:
    enum class Mode { read, write };

    Transaction(sqlite3* db, Mode mode) : db_(db) {
        exec(db_, mode == Mode::write ? "BEGIN IMMEDIATE" : "BEGIN");
    }

    ~Transaction() {
        if (!done_ && sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            spdlog::error("SQLite ROLLBACK failed: {}", sqlite3_errmsg(db_));
        }
    }

    Transaction(const Transaction&)            = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec(db_, "COMMIT");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

constexpr const char* kSelectClient =
    "SELECT latest_version_id, versions_since_snapshot, snapshot_version_id,"
    "       snapshot_timestamp"
    "  FROM clients WHERE client_id = ?";

// Reads one client inside the caller's transaction.
[[nodiscard]] std::optional<Client> read_client(sqlite3* db, const ClientId& client_id) {
    Statement stmt{db, kSelectClient};
    stmt.bind(1, client_id);
    if (!stmt.step()) {
        return std::nullopt;
    }

    Client client;
    client.client_id               = client_id;
    client.latest_version_id       = stmt.uuid(0);
    client.versions_since_snapshot = static_cast<std::uint32_t>(stmt.int64(1));
    if (!stmt.is_null(2) && !stmt.is_null(3)) {
        client.snapshot = SnapshotInfo{stmt.uuid(2), from_unix_seconds(stmt.int64(3))};
    }
    return client;
}

[[nodiscard]] Client read_existing_client(sqlite3* db, const ClientId& client_id) {
    auto client = read_client(db, client_id);
    if (!client) {
        throw StorageError("no such client " + to_string(client_id));
    }
    return std::move(*client);
}

[[nodiscard]] std::optional<Version> read_version(sqlite3* db, const char* sql,
                                                  const ClientId& client_id,
                                                  const VersionId& key) {
    Statement stmt{db, sql};
    stmt.bind(1, client_id).bind(2, key);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return Version{stmt.uuid(0), stmt.uuid(1), stmt.blob(2)};
}

} // anonymous namespace

// ── Connection pool ───────────────────────────────────────────────────────────

SqliteStorage::Connection::~Connection() {
    if (db_ && sqlite3_close(db_) != SQLITE_OK) {
        spdlog::warn("SQLite close failed: {}", sqlite3_errmsg(db_));
    }
}

SqliteStorage::Lease::~Lease() {
    if (!reusable(conn_->get())) {
        // Closing the handle rolls back whatever is still open on it.
        spdlog::error("SQLite connection left inside a transaction, closing it");
        return;
    }
    std::lock_guard lock(owner_.pool_mutex_);
    if (owner_.idle_.size() < kMaxIdleConnections) {
        owner_.idle_.push_back(std::move(conn_));
    }
}

bool SqliteStorage::reusable(sqlite3* db) noexcept {
    return db != nullptr && sqlite3_get_autocommit(db) != 0;
}

std::size_t SqliteStorage::idle_connections() {
    std::lock_guard lock(pool_mutex_);
    return idle_.size();
}

std::unique_ptr<SqliteStorage::Connection> SqliteStorage::open_connection() const {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(db_file_.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                       SQLITE_OPEN_NOMUTEX,
                                   nullptr);
    auto conn = std::make_unique<Connection>(raw);
    if (rc != SQLITE_OK) {
        const std::string msg = raw ? sqlite3_errmsg(raw) : "out of memory";
        throw StorageError("Failed to open SQLite database " + db_file_.string() + ": " + msg);
    }

    sqlite3_busy_timeout(raw, static_cast<int>(busy_timeout_.count()));
    exec(raw, "PRAGMA foreign_keys = ON");
    return conn;
}

SqliteStorage::Lease SqliteStorage::checkout() {
    std::unique_ptr<Connection> conn;
    {
        std::lock_guard lock(pool_mutex_);
        if (!idle_.empty()) {
            conn = std::move(idle_.back());
            idle_.pop_back();
        }
    }
    if (!conn) {
        conn = open_connection();
    }
    return Lease{*this, std::move(conn)};
}

// ── Construction ──────────────────────────────────────────────────────────────

SqliteStorage::SqliteStorage(const std::filesystem::path& directory, const Clock& clock,
                             std::chrono::milliseconds busy_timeout)
    : db_file_(directory / kFilename), clock_(clock), busy_timeout_(busy_timeout) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw StorageError("Failed to create " + directory.string() + ": " + ec.message());
    }

    auto lease = checkout();
    {
        Statement wal{lease.get(), "PRAGMA journal_mode = WAL"};
        if (!wal.step() || wal.text(0) != "wal") {
            spdlog::warn("SQLite could not enable WAL journal mode for {}", db_file_.string());
        }
    }
    Transaction txn{lease.get(), Transaction::Mode::write};
    for (const char* sql : kSchema) {
        exec(lease.get(), sql);
    }
    txn.commit();

    spdlog::info("SQLite database opened at {}", db_file_.string());
}

SqliteStorage::~SqliteStorage() = default;

// ── SyncStorage ───────────────────────────────────────────────────────────────

std::optional<Client> SqliteStorage::get_client(const ClientId& client_id) {
    auto lease = checkout();
    Transaction txn{lease.get(), Transaction::Mode::read};
    auto client = read_client(lease.get(), client_id);
    txn.commit();
    return client;
}

CreateClientResult SqliteStorage::create_client(const ClientId& client_id) {
    auto lease = checkout();
    Transaction txn{lease.get(), Transaction::Mode::write};
    if (read_client(lease.get(), client_id)) {
        return AlreadyExists{};
    }

    Statement insert{lease.get(),
                     "INSERT INTO clients (client_id, latest_version_id) VALUES (?, ?)"};
    insert.bind(1, client_id).bind(2, kNilVersionId).run();
    txn.commit();

    Client client;
    client.client_id = client_id;
    return client;
}

std::optional<Version> SqliteStorage::get_version_by_parent(
    const ClientId& client_id, const VersionId& parent_version_id) {
    auto lease = checkout();
    Transaction txn{lease.get(), Transaction::Mode::read};
    auto version = read_version(
        lease.get(),
        "SELECT version_id, parent_version_id, history_segment FROM versions"
        " WHERE client_id = ? AND parent_version_id = ?",
        client_id, parent_version_id);
    txn.commit();
    return version;
}

std::optional<Version> SqliteStorage::get_version(
    const ClientId& client_id, const VersionId& version_id) {
    auto lease = checkout();
    Transaction txn{lease.get(), Transaction::Mode::read};
    auto version = read_version(
        lease.get(),
        "SELECT version_id, parent_version_id, history_segment FROM versions"
        " WHERE client_id = ? AND version_id = ?",
        client_id, version_id);
    txn.commit();
    return version;
}

AddVersionResult SqliteStorage::add_version(
    const ClientId& client_id, const VersionId& parent_version_id,
    const VersionId& new_version_id, const std::string& history_segment) {
    auto lease = checkout();
    Transaction txn{lease.get(), Transaction::Mode::write};
    const Client client = read_existing_client(lease.get(), client_id);

    if (client.latest_version_id != parent_version_id) {
        return Conflict{client.latest_version_id};
    }

    Statement insert{lease.get(),
                     "INSERT INTO versions"
                     " (client_id, version_id, parent_version_id, history_segment)"
                     " VALUES (?, ?, ?, ?)"};
    insert.bind(1, client_id).bind(2, new_version_id).bind(3, parent_version_id)
          .bind_blob(4, history_segment).run();

    Statement update{lease.get(),
                     "UPDATE clients SET latest_version_id = ?,"
                     " versions_since_snapshot = versions_since_snapshot + 1"
                     " WHERE client_id = ?"};
    update.bind(1, new_version_id).bind(2, client_id).run();

    txn.commit();
    return Committed{client.versions_since_snapshot + 1, client.snapshot};
}

AddSnapshotResult SqliteStorage::add_snapshot(
    const ClientId& client_id, const VersionId& version_id, const std::string& snapshot) {
    auto lease = checkout();
    Transaction txn{lease.get(), Transaction::Mode::write};
    const Client client = read_existing_client(lease.get(), client_id);

    const auto head = client.latest_version_id;
    if (head == kNilVersionId || head != version_id) {
        return VersionMismatch{head};
    }

    Statement update{lease.get(),
                     "UPDATE clients SET snapshot_version_id = ?, snapshot_timestamp = ?,"
                     " versions_since_snapshot = 0, snapshot = ?"
                     " WHERE client_id = ?"};
    update.bind(1, version_id)
          .bind(2, to_unix_seconds(clock_.now()))
          .bind_blob(3, snapshot)
          .bind(4, client_id)
          .run();

    txn.commit();
    return SnapshotStored{};
}

std::optional<StoredSnapshot> SqliteStorage::get_snapshot(const ClientId& client_id) {
    auto lease = checkout();
    Transaction txn{lease.get(), Transaction::Mode::read};
    Statement select{lease.get(),
                     "SELECT snapshot_version_id, snapshot FROM clients"
                     " WHERE client_id = ? AND snapshot_version_id IS NOT NULL"};
    select.bind(1, client_id);

    std::optional<StoredSnapshot> result;
    if (select.step()) {
        result = StoredSnapshot{select.uuid(0), select.blob(1)};
    }
    txn.commit();
    return result;
}

std::size_t SqliteStorage::prune_versions(
    const ClientId& client_id, const VersionId& up_to_version_id) {
    auto lease = checkout();
    Transaction txn{lease.get(), Transaction::Mode::write};

    std::size_t removed = 0;
    VersionId vid = up_to_version_id;
    while (vid != kNilVersionId) {
        VersionId parent;
        {
            Statement select{lease.get(),
                             "SELECT parent_version_id FROM versions"
                             " WHERE client_id = ? AND version_id = ?"};
            select.bind(1, client_id).bind(2, vid);
            if (!select.step()) {
                break; // older history already pruned
            }
            parent = select.uuid(0);
        }

        Statement del{lease.get(),
                      "DELETE FROM versions WHERE client_id = ? AND version_id = ?"};
        del.bind(1, client_id).bind(2, vid).run();
        ++removed;
        vid = parent;
    }

    txn.commit();
    return removed;
}

bool SqliteStorage::delete_client(const ClientId& client_id) {
    auto lease = checkout();
    Transaction txn{lease.get(), Transaction::Mode::write};
    Statement del{lease.get(), "DELETE FROM clients WHERE client_id = ?"};
    del.bind(1, client_id).run();
    const bool existed = sqlite3_changes(lease.get()) > 0;
    txn.commit();
    return existed;
}

} // namespace tsync
