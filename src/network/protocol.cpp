#include "network/protocol.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <type_traits>

namespace tsync::network {

namespace http = boost::beast::http;

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

constexpr const char* kClientIdHeader        = "X-Client-Id";
constexpr const char* kVersionIdHeader       = "X-Version-Id";
constexpr const char* kParentVersionHeader   = "X-Parent-Version-Id";
constexpr const char* kSnapshotRequestHeader = "X-Snapshot-Request";

constexpr std::string_view kGetChildVersionPrefix = "/v1/client/get-child-version/";
constexpr std::string_view kAddVersionPrefix      = "/v1/client/add-version/";
constexpr std::string_view kAddSnapshotPrefix     = "/v1/client/add-snapshot/";
constexpr std::string_view kSnapshotPath          = "/v1/client/snapshot";

std::string_view to_std(boost::beast::string_view sv) {
    return {sv.data(), sv.size()};
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// Media type without parameters ("type/subtype; charset=..." -> "type/subtype").
bool has_content_type(const HttpRequest& request, std::string_view expected) {
    auto value = to_std(request[http::field::content_type]);
    const auto semi = value.find(';');
    if (semi != std::string_view::npos) {
        value = value.substr(0, semi);
    }
    return iequals(trim(value), expected);
}

ErrorResp bad_request(std::string message) {
    return ErrorResp{http::status::bad_request, std::move(message)};
}

ErrorResp method_not_allowed(http::verb allowed) {
    return ErrorResp{http::status::method_not_allowed,
                     "method not allowed, use " + std::string(to_std(http::to_string(allowed)))};
}

// Parses the X-Client-Id header.
std::variant<ClientId, ErrorResp> client_id_of(const HttpRequest& request) {
    const auto value = request.find(kClientIdHeader);
    if (value == request.end()) {
        return bad_request("missing X-Client-Id header");
    }
    auto id = parse_uuid(trim(to_std(value->value())));
    if (!id) {
        return bad_request("invalid X-Client-Id header");
    }
    return *id;
}

std::variant<VersionId, ErrorResp> path_version_id(std::string_view segment) {
    auto id = parse_uuid(segment);
    if (!id) {
        return bad_request("invalid version id in path: " + std::string(segment));
    }
    return *id;
}

} // namespace

// ── parse_request ─────────────────────────────────────────────────────────────

std::variant<Command, ErrorResp> parse_request(const HttpRequest& request) {
    auto path = to_std(request.target());
    if (const auto query = path.find('?'); query != std::string_view::npos) {
        path = path.substr(0, query);
    }
    const auto method = request.method();

    // ── GET / ─────────────────────────────────────────────────────────────────
    if (path == "/") {
        if (method != http::verb::get) {
            return method_not_allowed(http::verb::get);
        }
        return IndexCmd{};
    }

    enum class Route { get_child_version, add_version, add_snapshot, get_snapshot };
    Route route{};
    std::string_view id_segment;
    http::verb expected = http::verb::get;

    if (starts_with(path, kGetChildVersionPrefix)) {
        route      = Route::get_child_version;
        id_segment = path.substr(kGetChildVersionPrefix.size());
    } else if (starts_with(path, kAddVersionPrefix)) {
        route      = Route::add_version;
        id_segment = path.substr(kAddVersionPrefix.size());
        expected   = http::verb::post;
    } else if (starts_with(path, kAddSnapshotPrefix)) {
        route      = Route::add_snapshot;
        id_segment = path.substr(kAddSnapshotPrefix.size());
        expected   = http::verb::post;
    } else if (path == kSnapshotPath) {
        route = Route::get_snapshot;
    } else {
        return ErrorResp{http::status::not_found, "no such route: " + std::string(path)};
    }

    if (method != expected) {
        return method_not_allowed(expected);
    }

    auto client = client_id_of(request);
    if (auto* err = std::get_if<ErrorResp>(&client)) {
        return std::move(*err);
    }
    const ClientId client_id = std::get<ClientId>(client);

    if (route == Route::get_snapshot) {
        return GetSnapshotCmd{client_id};
    }

    auto version = path_version_id(id_segment);
    if (auto* err = std::get_if<ErrorResp>(&version)) {
        return std::move(*err);
    }
    const VersionId version_id = std::get<VersionId>(version);

    switch (route) {
    case Route::get_child_version:
        return GetChildVersionCmd{client_id, version_id};

    case Route::add_version:
        if (!has_content_type(request, kHistorySegmentContentType)) {
            return bad_request("expected Content-Type " +
                               std::string(kHistorySegmentContentType));
        }
        if (request.body().empty()) {
            return bad_request("empty history segment");
        }
        return AddVersionCmd{client_id, version_id, request.body()};

    case Route::add_snapshot:
        if (!has_content_type(request, kSnapshotContentType)) {
            return bad_request("expected Content-Type " + std::string(kSnapshotContentType));
        }
        if (request.body().empty()) {
            return bad_request("empty snapshot");
        }
        return AddSnapshotCmd{client_id, version_id, request.body()};

    case Route::get_snapshot:
        break;
    }
    return GetSnapshotCmd{client_id};
}

const ClientId* command_client_id(const Command& command) noexcept {
    return std::visit(
        [](const auto& c) -> const ClientId* {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, IndexCmd>) {
                return nullptr;
            } else {
                return &c.client_id;
            }
        },
        command);
}

// ── serialize_response ────────────────────────────────────────────────────────

HttpResponse serialize_response(const Response& response, unsigned version, bool keep_alive) {
    HttpResponse res{http::status::ok, version};
    res.set(http::field::server, "tasksync/" + std::string(kServerVersion));
    res.set(http::field::cache_control, "no-store, max-age=0");
    res.keep_alive(keep_alive);

    std::visit(
        [&res](const auto& r) {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, BannerResp>) {
                res.set(http::field::content_type, "text/plain");
                res.body() = "tasksync server v" + std::string(kServerVersion);
            } else if constexpr (std::is_same_v<T, ChildVersionResp>) {
                res.set(http::field::content_type, std::string(kHistorySegmentContentType));
                res.set(kVersionIdHeader, to_string(r.version_id));
                res.set(kParentVersionHeader, to_string(r.parent_version_id));
                res.body() = r.history_segment;
            } else if constexpr (std::is_same_v<T, NoChildResp>) {
                res.result(http::status::not_found);
            } else if constexpr (std::is_same_v<T, GoneResp>) {
                res.result(http::status::gone);
            } else if constexpr (std::is_same_v<T, VersionAddedResp>) {
                res.set(kVersionIdHeader, to_string(r.version_id));
                if (r.snapshot_urgency != SnapshotUrgency::none) {
                    res.set(kSnapshotRequestHeader,
                            "urgency=" + std::string(to_string(r.snapshot_urgency)));
                }
            } else if constexpr (std::is_same_v<T, ConflictResp>) {
                res.result(http::status::conflict);
                res.set(kParentVersionHeader, to_string(r.latest_version_id));
            } else if constexpr (std::is_same_v<T, SnapshotAcceptedResp>) {
                // 200, empty body
            } else if constexpr (std::is_same_v<T, SnapshotResp>) {
                res.set(http::field::content_type, std::string(kSnapshotContentType));
                res.set(kVersionIdHeader, to_string(r.version_id));
                res.body() = r.snapshot;
            } else if constexpr (std::is_same_v<T, NoSnapshotResp>) {
                res.result(http::status::not_found);
            } else if constexpr (std::is_same_v<T, ErrorResp>) {
                res.result(r.status);
                res.set(http::field::content_type, "text/plain");
                res.body() = r.message;
            }
        },
        response);

    res.prepare_payload();
    return res;
}

} // namespace tsync::network
