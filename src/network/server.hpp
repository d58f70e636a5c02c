#pragma once

#include "common/server_config.hpp"
#include "network/session.hpp"
#include "sync/sync_server.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

namespace tsync::network {

// Owns the io_context and one TCP acceptor per listen address.
//
// Usage:
//   Server srv{cfg.listen, sync, cfg.allow_client_ids, cfg.threads};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
class Server {
public:
    // Resolves and binds every address (port 0 picks a free port).
    // Throws boost::system::system_error if any of them cannot be bound.
    // `threads` == 0 uses std::thread::hardware_concurrency().
    Server(const std::vector<ListenAddress>& listen, SyncServer& sync,
           ClientAllowList allow, unsigned threads = 0,
           std::shared_ptr<spdlog::logger> logger = {});

    // Starts the thread pool, begins accepting connections, and installs signal
    // handlers for graceful shutdown (SIGINT / SIGTERM).
    // Blocks until the server stops.
    void run();

    // Stops accepting and stops the io_context, causing run() to return.
    // Safe to call from any thread.
    void stop();

    // The bound endpoints, in listen-address order.
    [[nodiscard]] std::vector<boost::asio::ip::tcp::endpoint> local_endpoints() const;

private:
    // Accept loop coroutine – one per acceptor, runs until it is closed.
    boost::asio::awaitable<void> accept_loop(boost::asio::ip::tcp::acceptor& acceptor);

    SyncServer& sync_;
    ClientAllowList allow_;
    unsigned threads_;
    std::shared_ptr<spdlog::logger> logger_;

    boost::asio::io_context ioc_;
    std::vector<std::unique_ptr<boost::asio::ip::tcp::acceptor>> acceptors_;
};

} // namespace tsync::network
