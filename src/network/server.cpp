#include "network/server.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/v6_only.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <csignal>
#include <string>
#include <thread>

namespace tsync::network {

namespace {

unsigned effective_threads(unsigned requested) {
    return requested != 0 ? requested : std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

Server::Server(const std::vector<ListenAddress>& listen, SyncServer& sync,
               ClientAllowList allow, unsigned threads,
               std::shared_ptr<spdlog::logger> logger)
    : sync_(sync),
      allow_(std::move(allow)),
      threads_(effective_threads(threads)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      ioc_(static_cast<int>(threads_)) {
    using boost::asio::ip::tcp;

    tcp::resolver resolver{ioc_};
    for (const auto& addr : listen) {
        const auto results = resolver.resolve(addr.host, std::to_string(addr.port),
                                              tcp::resolver::passive);
        for (const auto& entry : results) {
            const tcp::endpoint endpoint = entry.endpoint();

            auto acceptor = std::make_unique<tcp::acceptor>(ioc_);
            acceptor->open(endpoint.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            if (endpoint.protocol() == tcp::v6()) {
                // "[::]:port" and "0.0.0.0:port" may both be listed.
                acceptor->set_option(boost::asio::ip::v6_only(true));
            }
            acceptor->bind(endpoint);
            acceptor->listen();

            logger_->info("Server listening on {}:{}", acceptor->local_endpoint().address().to_string(),
                          acceptor->local_endpoint().port());
            acceptors_.push_back(std::move(acceptor));
        }
    }
}

void Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            logger_->info("Server: received signal {}, shutting down", signo);
            stop();
        }
    });

    for (auto& acceptor : acceptors_) {
        boost::asio::co_spawn(ioc_, accept_loop(*acceptor), boost::asio::detached);
    }

    // Run the io_context across a thread pool.
    std::vector<std::thread> pool;
    pool.reserve(threads_ - 1);
    for (unsigned int i = 1; i < threads_; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    logger_->info("Server: io_context stopped, all threads joined");
}

void Server::stop() {
    boost::asio::post(ioc_, [this] {
        for (auto& acceptor : acceptors_) {
            boost::system::error_code ignored;
            acceptor->close(ignored);
        }
        ioc_.stop();
    });
}

std::vector<boost::asio::ip::tcp::endpoint> Server::local_endpoints() const {
    std::vector<boost::asio::ip::tcp::endpoint> endpoints;
    endpoints.reserve(acceptors_.size());
    for (const auto& acceptor : acceptors_) {
        endpoints.push_back(acceptor->local_endpoint());
    }
    return endpoints;
}

boost::asio::awaitable<void> Server::accept_loop(boost::asio::ip::tcp::acceptor& acceptor) {
    boost::system::error_code ec;

    for (;;) {
        auto socket = co_await acceptor.async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                logger_->warn("Server: accept error: {}", ec.message());
            }
            break; // Acceptor was closed – time to stop.
        }

        // Disable Nagle – send responses immediately.
        socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);

        auto session_ptr = std::make_shared<Session>(std::move(socket), sync_, allow_, logger_);
        boost::asio::co_spawn(
            ioc_,
            [sp = std::move(session_ptr)]() -> boost::asio::awaitable<void> {
                co_await sp->run();
            },
            boost::asio::detached);
    }
}

} // namespace tsync::network
