#pragma once

#include "storage/types.hpp"

#include <string>
#include <string_view>

namespace tsync::codec {

// ── Record codec ──────────────────────────────────────────────────────────────
//
// Protobuf encoding of Client and Version values for key-value backends
// (see proto/storage_records.proto).  Decoders throw StorageError on
// malformed input, which indicates on-disk corruption.

[[nodiscard]] std::string encode_client(const Client& client);
[[nodiscard]] Client decode_client(const ClientId& client_id, std::string_view bytes);

[[nodiscard]] std::string encode_version(const Version& version);
[[nodiscard]] Version decode_version(const VersionId& version_id, std::string_view bytes);

} // namespace tsync::codec
