#pragma once

#include <boost/functional/hash.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace tsync {

// ── Identifiers ───────────────────────────────────────────────────────────────
//
// Clients and versions are both identified by 128-bit UUIDs.  The nil UUID is
// the distinguished "no version" value: the parent of the first version in a
// chain, and the head of a client that has no versions yet.

using ClientId  = boost::uuids::uuid;
using VersionId = boost::uuids::uuid;

inline constexpr VersionId kNilVersionId{};

// Hasher for unordered containers keyed by id.
using IdHash = boost::hash<boost::uuids::uuid>;

// Parse a UUID in hyphenated, simple (32 hex digits), braced or "urn:uuid:"
// form, case-insensitive.  Returns std::nullopt on anything else.
[[nodiscard]] std::optional<boost::uuids::uuid> parse_uuid(std::string_view text);

// Lower-case hyphenated form.
using boost::uuids::to_string;

// Fresh random (version 4) UUID from the operating system's CSPRNG.
// Thread-safe.
[[nodiscard]] VersionId new_version_id();

// Raw 16-byte big-endian form, used for storage keys.
[[nodiscard]] std::string to_bytes(const boost::uuids::uuid& id);

// Inverse of to_bytes().  Returns std::nullopt unless `bytes` has length 16.
[[nodiscard]] std::optional<boost::uuids::uuid> from_bytes(std::string_view bytes);

} // namespace tsync
