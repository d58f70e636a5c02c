#pragma once

#include "storage/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace tsync {

// ── SyncStorage ───────────────────────────────────────────────────────────────
//
// Abstract transactional storage for clients and their version chains.
//
// Every method is one atomic transaction.  Implementations must make each
// check-then-write (add_version, add_snapshot) serializable with respect to
// every other call for the same client_id, across threads and, where the
// backend can be shared, across processes.  Calls for different clients need
// not be isolated from one another.
//
// Backend failures throw StorageError after rolling back; nothing a failed
// call did is ever visible.  All other outcomes are return values.
//
// The concrete backend (in-memory, SQLite, RocksDB) is selected at startup.

class SyncStorage {
public:
    virtual ~SyncStorage() = default;

    // Returns the client, or std::nullopt if it does not exist.
    [[nodiscard]] virtual std::optional<Client> get_client(const ClientId& client_id) = 0;

    // Inserts a client with a nil head and no snapshot.
    // Returns AlreadyExists (without modifying anything) if it exists.
    [[nodiscard]] virtual CreateClientResult create_client(const ClientId& client_id) = 0;

    // Returns the version whose parent is `parent_version_id`, if any.
    [[nodiscard]] virtual std::optional<Version>
    get_version_by_parent(const ClientId& client_id, const VersionId& parent_version_id) = 0;

    // Returns the version with id `version_id`, if any.
    [[nodiscard]] virtual std::optional<Version>
    get_version(const ClientId& client_id, const VersionId& version_id) = 0;

    // Appends a version if, and only if, `parent_version_id` is the client's
    // current head: stores the version, moves the head to `new_version_id` and
    // increments versions_since_snapshot.  Otherwise writes nothing and
    // returns Conflict with the actual head.
    // Throws StorageError if the client does not exist.
    [[nodiscard]] virtual AddVersionResult
    add_version(const ClientId& client_id, const VersionId& parent_version_id,
                const VersionId& new_version_id, const std::string& history_segment) = 0;

    // Stores a snapshot if, and only if, `version_id` is the client's current
    // (non-nil) head: records version, timestamp and data, and resets
    // versions_since_snapshot to 0.  Otherwise writes nothing and returns
    // VersionMismatch.
    // Throws StorageError if the client does not exist.
    [[nodiscard]] virtual AddSnapshotResult
    add_snapshot(const ClientId& client_id, const VersionId& version_id,
                 const std::string& snapshot) = 0;

    // Returns the latest snapshot's version id and bytes, if any.
    [[nodiscard]] virtual std::optional<StoredSnapshot>
    get_snapshot(const ClientId& client_id) = 0;

    // Deletes `up_to_version_id` and all of its ancestors.  Returns the number
    // of versions deleted.  The head is not changed.
    virtual std::size_t
    prune_versions(const ClientId& client_id, const VersionId& up_to_version_id) = 0;

    // Deletes the client with its versions and snapshot.
    // Returns true if the client existed.
    virtual bool delete_client(const ClientId& client_id) = 0;
};

} // namespace tsync
