#include "storage/memory_storage.hpp"
#include "storage/storage_error.hpp"

#include <mutex>
#include <shared_mutex>

namespace tsync {

MemoryStorage::MemoryStorage(const Clock& clock) : clock_(clock) {}

MemoryStorage::ClientState& MemoryStorage::existing_client(const ClientId& client_id) {
    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        throw StorageError("no such client " + to_string(client_id));
    }
    return it->second;
}

std::optional<Client> MemoryStorage::get_client(const ClientId& client_id) {
    std::shared_lock lock(mutex_);
    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return std::nullopt;
    }
    return it->second.client;
}

CreateClientResult MemoryStorage::create_client(const ClientId& client_id) {
    std::unique_lock lock(mutex_);
    ClientState state;
    state.client.client_id = client_id;
    auto [it, inserted] = clients_.try_emplace(client_id, std::move(state));
    if (!inserted) {
        return AlreadyExists{};
    }
    return it->second.client;
}

std::optional<Version> MemoryStorage::get_version_by_parent(
    const ClientId& client_id, const VersionId& parent_version_id) {
    std::shared_lock lock(mutex_);
    auto cit = clients_.find(client_id);
    if (cit == clients_.end()) {
        return std::nullopt;
    }
    const auto& state = cit->second;
    auto child = state.children.find(parent_version_id);
    if (child == state.children.end()) {
        return std::nullopt;
    }
    auto vit = state.versions.find(child->second);
    if (vit == state.versions.end()) {
        return std::nullopt;
    }
    return vit->second;
}

std::optional<Version> MemoryStorage::get_version(
    const ClientId& client_id, const VersionId& version_id) {
    std::shared_lock lock(mutex_);
    auto cit = clients_.find(client_id);
    if (cit == clients_.end()) {
        return std::nullopt;
    }
    auto vit = cit->second.versions.find(version_id);
    if (vit == cit->second.versions.end()) {
        return std::nullopt;
    }
    return vit->second;
}

AddVersionResult MemoryStorage::add_version(
    const ClientId& client_id, const VersionId& parent_version_id,
    const VersionId& new_version_id, const std::string& history_segment) {
    std::unique_lock lock(mutex_);
    auto& state = existing_client(client_id);

    if (state.client.latest_version_id != parent_version_id) {
        return Conflict{state.client.latest_version_id};
    }
    if (state.versions.contains(new_version_id) ||
        state.children.contains(parent_version_id)) {
        throw StorageError("version chain of client " + to_string(client_id) +
                           " is inconsistent");
    }

    state.versions.emplace(new_version_id,
                           Version{new_version_id, parent_version_id, history_segment});
    try {
        state.children.emplace(parent_version_id, new_version_id);
    } catch (...) {
        state.versions.erase(new_version_id);
        throw;
    }

    state.client.latest_version_id = new_version_id;
    ++state.client.versions_since_snapshot;
    return Committed{state.client.versions_since_snapshot, state.client.snapshot};
}

AddSnapshotResult MemoryStorage::add_snapshot(
    const ClientId& client_id, const VersionId& version_id, const std::string& snapshot) {
    std::unique_lock lock(mutex_);
    auto& state = existing_client(client_id);

    const auto head = state.client.latest_version_id;
    if (head == kNilVersionId || head != version_id) {
        return VersionMismatch{head};
    }

    state.snapshot_data = snapshot;
    state.client.snapshot = SnapshotInfo{
        version_id, from_unix_seconds(to_unix_seconds(clock_.now()))};
    state.client.versions_since_snapshot = 0;
    return SnapshotStored{};
}

std::optional<StoredSnapshot> MemoryStorage::get_snapshot(const ClientId& client_id) {
    std::shared_lock lock(mutex_);
    auto cit = clients_.find(client_id);
    if (cit == clients_.end()) {
        return std::nullopt;
    }
    const auto& state = cit->second;
    if (!state.client.snapshot || !state.snapshot_data) {
        return std::nullopt;
    }
    return StoredSnapshot{state.client.snapshot->version_id, *state.snapshot_data};
}

std::size_t MemoryStorage::prune_versions(
    const ClientId& client_id, const VersionId& up_to_version_id) {
    std::unique_lock lock(mutex_);
    auto cit = clients_.find(client_id);
    if (cit == clients_.end()) {
        return 0;
    }
    auto& state = cit->second;

    std::size_t removed = 0;
    VersionId vid = up_to_version_id;
    while (vid != kNilVersionId) {
        auto vit = state.versions.find(vid);
        if (vit == state.versions.end()) {
            break; // older history already pruned
        }
        const VersionId parent = vit->second.parent_version_id;
        state.children.erase(parent);
        state.versions.erase(vit);
        ++removed;
        vid = parent;
    }
    return removed;
}

bool MemoryStorage::delete_client(const ClientId& client_id) {
    std::unique_lock lock(mutex_);
    return clients_.erase(client_id) > 0;
}

} // namespace tsync
