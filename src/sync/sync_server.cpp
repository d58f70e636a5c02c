#include "sync/sync_server.hpp"
#include "storage/storage_error.hpp"

#include <type_traits>

namespace tsync {

SyncServer::SyncServer(SyncStorage& storage, SyncConfig config, const Clock& clock,
                       std::shared_ptr<spdlog::logger> logger)
    : storage_(storage)
    , config_(config)
    , clock_(clock)
    , logger_(logger ? std::move(logger) : spdlog::default_logger())
{
}

Client SyncServer::ensure_client(const ClientId& client_id) {
    if (auto client = storage_.get_client(client_id)) {
        return std::move(*client);
    }
    if (!config_.create_clients) {
        throw ClientNotFound(client_id);
    }

    auto created = storage_.create_client(client_id);
    if (auto* client = std::get_if<Client>(&created)) {
        logger_->info("Created client {}", to_string(client_id));
        return std::move(*client);
    }

    // Lost a creation race; the other request's client is just as good.
    auto client = storage_.get_client(client_id);
    if (!client) {
        throw StorageError("client " + to_string(client_id) +
                           " reported as existing but cannot be read");
    }
    return std::move(*client);
}

// ── get_child_version ─────────────────────────────────────────────────────────

GetChildVersionResult SyncServer::get_child_version(const ClientId& client_id,
                                                    const VersionId& parent_version_id) {
    const Client client = ensure_client(client_id);

    if (auto version = storage_.get_version_by_parent(client_id, parent_version_id)) {
        return ChildVersion{version->version_id, version->parent_version_id,
                            std::move(version->history_segment)};
    }

    if (client.latest_version_id == kNilVersionId ||
        parent_version_id == client.latest_version_id) {
        return NoSuchChild{};
    }

    logger_->debug("Client {}: parent {} is gone (head {})", to_string(client_id),
                   to_string(parent_version_id), to_string(client.latest_version_id));
    return VersionGone{};
}

// ── add_version ───────────────────────────────────────────────────────────────

AddVersionOutcome SyncServer::add_version(const ClientId& client_id,
                                          const VersionId& parent_version_id,
                                          const std::string& history_segment) {
    ensure_client(client_id);

    const VersionId version_id = new_version_id();
    auto result = storage_.add_version(client_id, parent_version_id, version_id,
                                       history_segment);

    return std::visit(
        [&](const auto& r) -> AddVersionOutcome {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, Committed>) {
                const auto urgency =
                    snapshot_urgency(r.versions_since_snapshot, r.snapshot, clock_.now(),
                                     config_.snapshot_versions, config_.snapshot_days);
                logger_->debug("Client {}: added version {} after {} ({} since snapshot)",
                               to_string(client_id), to_string(version_id),
                               to_string(parent_version_id), r.versions_since_snapshot);
                return VersionAdded{version_id, urgency};
            } else if constexpr (std::is_same_v<T, Conflict>) {
                logger_->debug("Client {}: version conflict, parent {} but head {}",
                               to_string(client_id), to_string(parent_version_id),
                               to_string(r.latest_version_id));
                return VersionConflict{r.latest_version_id};
            }
        },
        result);
}

// ── add_snapshot ──────────────────────────────────────────────────────────────

bool SyncServer::add_snapshot(const ClientId& client_id, const VersionId& version_id,
                              const std::string& snapshot) {
    ensure_client(client_id);

    const auto result = storage_.add_snapshot(client_id, version_id, snapshot);
    if (const auto* mismatch = std::get_if<VersionMismatch>(&result)) {
        logger_->debug("Client {}: discarding snapshot at {} (head {})", to_string(client_id),
                       to_string(version_id), to_string(mismatch->latest_version_id));
        return false;
    }

    logger_->debug("Client {}: stored snapshot at {} ({} bytes)", to_string(client_id),
                   to_string(version_id), snapshot.size());

    if (config_.retention == RetentionPolicy::prune) {
        try {
            const auto removed = storage_.prune_versions(client_id, version_id);
            logger_->debug("Client {}: pruned {} versions up to {}", to_string(client_id),
                           removed, to_string(version_id));
        } catch (const StorageError& e) {
            // The snapshot is committed; pruning is retried after the next one.
            logger_->error("Client {}: pruning after snapshot {} failed: {}",
                           to_string(client_id), to_string(version_id), e.what());
        }
    }
    return true;
}

// ── get_snapshot ──────────────────────────────────────────────────────────────

std::optional<StoredSnapshot> SyncServer::get_snapshot(const ClientId& client_id) {
    ensure_client(client_id);
    return storage_.get_snapshot(client_id);
}

} // namespace tsync
