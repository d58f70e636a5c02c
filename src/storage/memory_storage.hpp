#pragma once

#include "common/clock.hpp"
#include "common/ids.hpp"
#include "storage/sync_storage.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tsync {

// ── MemoryStorage ─────────────────────────────────────────────────────────────
//
// Process-local SyncStorage backed by std::unordered_map, for tests and
// throwaway deployments.  Nothing survives a restart.
//
// Concurrency model:
//   - get_*() acquire a shared (read) lock.
//   - every mutating call acquires an exclusive (write) lock for its whole
//     check-then-write, which makes it trivially serializable.
class MemoryStorage final : public SyncStorage {
public:
    explicit MemoryStorage(const Clock& clock = SystemClock::instance());

    // Not copyable or movable – copies of a live store would silently race.
    MemoryStorage(const MemoryStorage&)            = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;
    MemoryStorage(MemoryStorage&&)                 = delete;
    MemoryStorage& operator=(MemoryStorage&&)      = delete;

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
    // Everything owned by one client; erasing it cascades.
    struct ClientState {
        Client client;
        std::optional<std::string> snapshot_data;
        std::unordered_map<VersionId, Version, IdHash> versions;   // by version_id
        std::unordered_map<VersionId, VersionId, IdHash> children; // parent -> child
    };

    // Requires the caller to hold mutex_ exclusively.
    [[nodiscard]] ClientState& existing_client(const ClientId& client_id);

    const Clock& clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<ClientId, ClientState, IdHash> clients_;
};

} // namespace tsync
