#pragma once

#include "common/ids.hpp"
#include "sync/snapshot_policy.hpp"

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace tsync {

inline constexpr std::string_view kServerVersion = "0.1.0";

inline constexpr std::string_view kHistorySegmentContentType =
    "application/vnd.taskchampion.history-segment";
inline constexpr std::string_view kSnapshotContentType =
    "application/vnd.taskchampion.snapshot";

// Larger request bodies are rejected with 400 before they reach the engine.
inline constexpr std::size_t kMaxBodySize = 100 * 1024 * 1024;

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of a single HTTP request.  Each command type is a
// plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

// GET /
struct IndexCmd {};

// GET /v1/client/get-child-version/{parent}
struct GetChildVersionCmd {
    ClientId  client_id;
    VersionId parent_version_id;
};

// POST /v1/client/add-version/{parent}
struct AddVersionCmd {
    ClientId    client_id;
    VersionId   parent_version_id;
    std::string history_segment;
};

// POST /v1/client/add-snapshot/{version}
struct AddSnapshotCmd {
    ClientId    client_id;
    VersionId   version_id;
    std::string snapshot;
};

// GET /v1/client/snapshot
struct GetSnapshotCmd {
    ClientId client_id;
};

using Command =
    std::variant<IndexCmd, GetChildVersionCmd, AddVersionCmd, AddSnapshotCmd, GetSnapshotCmd>;

// ── Responses ─────────────────────────────────────────────────────────────────

struct BannerResp {};

struct ChildVersionResp {
    VersionId   version_id;
    VersionId   parent_version_id;
    std::string history_segment;
};

struct NoChildResp {};
struct GoneResp {};

struct VersionAddedResp {
    VersionId       version_id;
    SnapshotUrgency snapshot_urgency = SnapshotUrgency::none;
};

struct ConflictResp {
    VersionId latest_version_id;
};

// add-snapshot answers 200 whether the snapshot was kept or discarded.
struct SnapshotAcceptedResp {};

struct SnapshotResp {
    VersionId   version_id;
    std::string snapshot;
};

struct NoSnapshotResp {};

struct ErrorResp {
    boost::beast::http::status status = boost::beast::http::status::bad_request;
    std::string message;
};

using Response =
    std::variant<BannerResp, ChildVersionResp, NoChildResp, GoneResp, VersionAddedResp,
                 ConflictResp, SnapshotAcceptedResp, SnapshotResp, NoSnapshotResp, ErrorResp>;

// ── Protocol ──────────────────────────────────────────────────────────────────

namespace network {

using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Stateless helper: map one HTTP request onto a Command.
// Returns an ErrorResp (400, 404 or 405) on malformed input, so callers can
// directly serialize the error back to the client.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, ErrorResp> parse_request(const HttpRequest& request);

// The client a command acts for; nullptr for IndexCmd.
[[nodiscard]] const ClientId* command_client_id(const Command& command) noexcept;

// Build the HTTP response for `response`.  `version` and `keep_alive` are
// copied from the request being answered.
// Thread-safe: pure function, no shared state.
[[nodiscard]] HttpResponse serialize_response(const Response& response, unsigned version,
                                              bool keep_alive);

} // namespace network
} // namespace tsync
