#include "network/session.hpp"
#include "storage/storage_error.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

namespace tsync::network {

namespace http = boost::beast::http;

namespace {

// Idle connections are closed after this long without a complete request.
constexpr auto kReadTimeout = std::chrono::seconds(60);

} // namespace

// ── dispatch ──────────────────────────────────────────────────────────────────

Response dispatch(SyncServer& sync, const ClientAllowList& allow, const Command& cmd,
                  spdlog::logger& log) {
    if (const ClientId* client_id = command_client_id(cmd);
        client_id && allow && allow->count(*client_id) == 0) {
        log.debug("Rejecting client {}: not in allow list", to_string(*client_id));
        return ErrorResp{http::status::forbidden, "client not allowed"};
    }

    try {
        return std::visit(
            [&](const auto& c) -> Response {
                using T = std::decay_t<decltype(c)>;

                if constexpr (std::is_same_v<T, IndexCmd>) {
                    return BannerResp{};

                } else if constexpr (std::is_same_v<T, GetChildVersionCmd>) {
                    auto result = sync.get_child_version(c.client_id, c.parent_version_id);
                    if (auto* child = std::get_if<ChildVersion>(&result)) {
                        return ChildVersionResp{child->version_id, child->parent_version_id,
                                                std::move(child->history_segment)};
                    }
                    if (std::holds_alternative<VersionGone>(result)) {
                        return GoneResp{};
                    }
                    return NoChildResp{};

                } else if constexpr (std::is_same_v<T, AddVersionCmd>) {
                    auto result =
                        sync.add_version(c.client_id, c.parent_version_id, c.history_segment);
                    if (auto* added = std::get_if<VersionAdded>(&result)) {
                        return VersionAddedResp{added->version_id, added->snapshot_urgency};
                    }
                    return ConflictResp{std::get<VersionConflict>(result).latest_version_id};

                } else if constexpr (std::is_same_v<T, AddSnapshotCmd>) {
                    // A stale snapshot is discarded without telling the client.
                    (void)sync.add_snapshot(c.client_id, c.version_id, c.snapshot);
                    return SnapshotAcceptedResp{};

                } else if constexpr (std::is_same_v<T, GetSnapshotCmd>) {
                    auto snapshot = sync.get_snapshot(c.client_id);
                    if (!snapshot) {
                        return NoSnapshotResp{};
                    }
                    return SnapshotResp{snapshot->version_id, std::move(snapshot->data)};
                }
            },
            cmd);
    } catch (const ClientNotFound& e) {
        log.debug("Rejecting request: {}", e.what());
        return ErrorResp{http::status::forbidden, "unknown client"};
    } catch (const StorageError& e) {
        log.error("Storage failure: {}", e.what());
        return ErrorResp{http::status::internal_server_error, "storage error"};
    }
}

// ── Session ───────────────────────────────────────────────────────────────────

Session::Session(boost::asio::ip::tcp::socket socket, SyncServer& sync,
                 const ClientAllowList& allow, std::shared_ptr<spdlog::logger> logger)
    : stream_(std::move(socket)), sync_(sync), allow_(allow), logger_(std::move(logger)) {}

boost::asio::awaitable<void> Session::run() {
    const auto remote = [&]() -> std::string {
        boost::system::error_code ec;
        const auto ep = stream_.socket().remote_endpoint(ec);
        return ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    }();

    logger_->debug("Session {}: connected", remote);

    boost::beast::flat_buffer buffer;
    boost::system::error_code ec;

    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(kMaxBodySize);

        stream_.expires_after(kReadTimeout);
        co_await http::async_read(stream_, buffer, parser,
                                  boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec == http::error::body_limit) {
            logger_->warn("Session {}: request body over {} bytes", remote, kMaxBodySize);
            auto res = serialize_response(
                ErrorResp{http::status::bad_request, "request body too large"}, 11, false);
            co_await http::async_write(stream_, res,
                                       boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            break;
        }
        if (ec) {
            if (ec != boost::beast::error::timeout &&
                ec != boost::asio::error::connection_reset &&
                ec != boost::asio::error::operation_aborted) {
                logger_->warn("Session {}: read error: {}", remote, ec.message());
            }
            break;
        }

        const HttpRequest& request = parser.get();
        const auto method = http::to_string(request.method());
        const auto target = request.target();
        logger_->debug("Session {}: {} {}", remote,
                       std::string_view(method.data(), method.size()),
                       std::string_view(target.data(), target.size()));

        auto res = handle(request);
        logger_->debug("Session {}: -> {}", remote, res.result_int());

        stream_.expires_never();
        co_await http::async_write(stream_, res,
                                   boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            logger_->warn("Session {}: write error: {}", remote, ec.message());
            break;
        }
        if (!res.keep_alive()) {
            break;
        }
    }

    boost::system::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    logger_->debug("Session {}: disconnected", remote);
}

HttpResponse Session::handle(const HttpRequest& request) {
    auto parsed = parse_request(request);
    Response response = std::holds_alternative<ErrorResp>(parsed)
                            ? Response{std::get<ErrorResp>(std::move(parsed))}
                            : dispatch(sync_, allow_, std::get<Command>(parsed), *logger_);
    return serialize_response(response, request.version(), request.keep_alive());
}

} // namespace tsync::network
