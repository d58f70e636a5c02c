#pragma once

#include "common/clock.hpp"
#include "common/ids.hpp"
#include "storage/sync_storage.hpp"
#include "sync/snapshot_policy.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include <spdlog/spdlog.h>

namespace tsync {

// What happens to versions once a snapshot covers them.
enum class RetentionPolicy {
    keep_all, // never delete versions
    prune,    // after an accepted snapshot, delete it and all its ancestors
};

struct SyncConfig {
    std::uint32_t   snapshot_versions = 100;
    std::int64_t    snapshot_days     = 14;
    bool            create_clients    = true;
    RetentionPolicy retention         = RetentionPolicy::keep_all;
};

// Thrown when a request names an unknown client and create_clients is off.
class ClientNotFound : public std::runtime_error {
public:
    explicit ClientNotFound(const ClientId& client_id)
        : std::runtime_error("unknown client " + to_string(client_id)) {}
};

// ── Results ───────────────────────────────────────────────────────────────────

struct ChildVersion {
    VersionId   version_id;
    VersionId   parent_version_id;
    std::string history_segment;
};

// The parent is the head (or the chain is empty): nothing newer yet.
struct NoSuchChild {};

// The parent is not the head and has no stored child.
struct VersionGone {};

using GetChildVersionResult = std::variant<ChildVersion, NoSuchChild, VersionGone>;

struct VersionAdded {
    VersionId       version_id;
    SnapshotUrgency snapshot_urgency = SnapshotUrgency::none;
};

struct VersionConflict {
    VersionId latest_version_id;
};

using AddVersionOutcome = std::variant<VersionAdded, VersionConflict>;

// ── SyncServer ────────────────────────────────────────────────────────────────
//
// The version-chain protocol engine.  Holds no mutable state of its own:
// every operation is one storage transaction (plus, for a previously unseen
// client, one create_client transaction), so a single instance is shared by
// every connection on every thread.
//
// StorageError and ClientNotFound propagate to the caller.

class SyncServer {
public:
    SyncServer(SyncStorage& storage, SyncConfig config,
               const Clock& clock = SystemClock::instance(),
               std::shared_ptr<spdlog::logger> logger = {});

    [[nodiscard]] GetChildVersionResult
    get_child_version(const ClientId& client_id, const VersionId& parent_version_id);

    // Appends `history_segment` after `parent_version_id` under a freshly
    // generated version id.  Never retries on conflict.
    [[nodiscard]] AddVersionOutcome
    add_version(const ClientId& client_id, const VersionId& parent_version_id,
                const std::string& history_segment);

    // Returns false when the snapshot was stale (version is not the head).
    [[nodiscard]] bool add_snapshot(const ClientId& client_id, const VersionId& version_id,
                                    const std::string& snapshot);

    [[nodiscard]] std::optional<StoredSnapshot> get_snapshot(const ClientId& client_id);

    [[nodiscard]] const SyncConfig& config() const noexcept { return config_; }

private:
    // Returns the client, creating it when allowed.  Throws ClientNotFound.
    Client ensure_client(const ClientId& client_id);

    SyncStorage& storage_;
    SyncConfig config_;
    const Clock& clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tsync
