#pragma once

#include "common/clock.hpp"
#include "common/ids.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace tsync {

// ── Records ───────────────────────────────────────────────────────────────────
//
// History segments and snapshots are opaque encrypted bytes; they are carried
// in std::string and never inspected.

// Metadata about the most recent snapshot of a client.  The snapshot bytes
// themselves are fetched separately (SyncStorage::get_snapshot).
struct SnapshotInfo {
    VersionId         version_id;
    Clock::time_point timestamp;

    bool operator==(const SnapshotInfo&) const = default;
};

struct Client {
    ClientId                    client_id;
    VersionId                   latest_version_id = kNilVersionId;
    std::uint32_t               versions_since_snapshot = 0;
    std::optional<SnapshotInfo> snapshot;

    bool operator==(const Client&) const = default;
};

struct Version {
    VersionId   version_id;
    VersionId   parent_version_id;
    std::string history_segment;

    bool operator==(const Version&) const = default;
};

struct StoredSnapshot {
    VersionId   version_id;
    std::string data;
};

// ── Outcomes ──────────────────────────────────────────────────────────────────
//
// Expected, recoverable results are alternatives of a std::variant so callers
// std::visit over them; only backend failures are thrown (StorageError).

// create_client: the client already existed; re-read it with get_client().
struct AlreadyExists {};

using CreateClientResult = std::variant<Client, AlreadyExists>;

// add_version committed.  Carries the client state *after* the commit, so the
// caller can decide on snapshot urgency without a second read.
struct Committed {
    std::uint32_t               versions_since_snapshot;
    std::optional<SnapshotInfo> snapshot;
};

// add_version rejected: `latest_version_id` is the actual head.
struct Conflict {
    VersionId latest_version_id;
};

using AddVersionResult = std::variant<Committed, Conflict>;

struct SnapshotStored {};

// add_snapshot rejected: `latest_version_id` is the actual head.
struct VersionMismatch {
    VersionId latest_version_id;
};

using AddSnapshotResult = std::variant<SnapshotStored, VersionMismatch>;

} // namespace tsync
