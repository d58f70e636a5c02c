#pragma once

#include "common/ids.hpp"
#include "network/protocol.hpp"
#include "sync/sync_server.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>

#include <spdlog/spdlog.h>

namespace tsync::network {

// When set, only the listed clients are served.
using ClientAllowList = std::optional<std::set<ClientId>>;

// Execute a parsed Command against the engine and return the Response.
// Maps ClientNotFound and allow-list violations to 403 and StorageError to
// 500; never throws for either.
[[nodiscard]] Response dispatch(SyncServer& sync, const ClientAllowList& allow,
                                const Command& cmd, spdlog::logger& log);

// Handles one TCP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() and runs until the
// client disconnects, asks to close the connection, or an error occurs.
// Requests on one connection are answered strictly in order (HTTP/1.1
// keep-alive, no pipelining of engine calls).
class Session {
public:
    Session(boost::asio::ip::tcp::socket socket, SyncServer& sync,
            const ClientAllowList& allow, std::shared_ptr<spdlog::logger> logger);

    // Main coroutine.  Loops reading requests, dispatching them to the engine
    // and writing responses.  Returns when the connection closes.
    boost::asio::awaitable<void> run();

private:
    [[nodiscard]] HttpResponse handle(const HttpRequest& request);

    boost::beast::tcp_stream stream_;
    SyncServer& sync_;
    const ClientAllowList& allow_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tsync::network
