#include "storage/record_codec.hpp"
#include "storage/storage_error.hpp"

#include "storage_records.pb.h"

namespace tsync::codec {

namespace {

[[nodiscard]] VersionId decode_id(const std::string& bytes, const char* field) {
    auto id = from_bytes(bytes);
    if (!id) {
        throw StorageError(std::string("corrupt record: bad ") + field);
    }
    return *id;
}

} // namespace

std::string encode_client(const Client& client) {
    storage::ClientRecord rec;
    rec.set_latest_version_id(to_bytes(client.latest_version_id));
    rec.set_versions_since_snapshot(client.versions_since_snapshot);
    if (client.snapshot) {
        auto* snap = rec.mutable_snapshot();
        snap->set_version_id(to_bytes(client.snapshot->version_id));
        snap->set_timestamp(to_unix_seconds(client.snapshot->timestamp));
    }
    return rec.SerializeAsString();
}

Client decode_client(const ClientId& client_id, std::string_view bytes) {
    storage::ClientRecord rec;
    if (!rec.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        throw StorageError("corrupt client record for " + to_string(client_id));
    }

    Client client;
    client.client_id               = client_id;
    client.latest_version_id       = decode_id(rec.latest_version_id(), "latest_version_id");
    client.versions_since_snapshot = rec.versions_since_snapshot();
    if (rec.has_snapshot()) {
        client.snapshot = SnapshotInfo{
            decode_id(rec.snapshot().version_id(), "snapshot version_id"),
            from_unix_seconds(rec.snapshot().timestamp())};
    }
    return client;
}

std::string encode_version(const Version& version) {
    storage::VersionRecord rec;
    rec.set_parent_version_id(to_bytes(version.parent_version_id));
    rec.set_history_segment(version.history_segment);
    return rec.SerializeAsString();
}

Version decode_version(const VersionId& version_id, std::string_view bytes) {
    storage::VersionRecord rec;
    if (!rec.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        throw StorageError("corrupt version record for " + to_string(version_id));
    }

    Version version;
    version.version_id        = version_id;
    version.parent_version_id = decode_id(rec.parent_version_id(), "parent_version_id");
    version.history_segment   = std::move(*rec.mutable_history_segment());
    return version;
}

} // namespace tsync::codec
