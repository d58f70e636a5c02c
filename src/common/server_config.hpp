#pragma once

#include "common/ids.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace tsync {

// ── ListenAddress ─────────────────────────────────────────────────────────────
// One "host:port" the HTTP server binds to.  `host` may be an IPv4/IPv6
// literal or a DNS name; IPv6 literals are written in brackets on the command
// line ("[::1]:8080") and stored without them.

struct ListenAddress {
    std::string   host;
    std::uint16_t port;
};

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one tasksync-server process.
// Populated by parse_config() from CLI arguments and environment variables.

struct ServerConfig {
    std::vector<ListenAddress> listen;       // At least one
    std::string   data_dir;                  // Directory for the storage backend
    std::string   engine;                    // "memory", "sqlite" (default) or "rocksdb"

    // When set, only these client ids are served; everyone else gets 403.
    std::optional<std::set<ClientId>> allow_client_ids;

    bool          create_clients;            // Auto-create unknown clients
    std::uint32_t snapshot_versions;         // Versions between snapshots (> 0)
    std::int64_t  snapshot_days;             // Days between snapshots (>= 0)
    std::string   retention;                 // "keep-all" (default) or "prune"
    std::uint32_t threads;                   // io_context worker threads, 0 = auto
    std::string   log_level;                 // spdlog level string
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments (and, for options absent from the command line, the
// environment variables listed in add_options()) into a ServerConfig.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the usage text.
//
// Validates:
//   - at least one --listen address, each host:port with port in [1, 65535]
//   - --engine and --retention are known values
//   - --data-dir non-empty, --snapshot-versions > 0, --snapshot-days >= 0
//   - every --allow-client-id is a UUID
//
// Repeatable options (--listen, --allow-client-id) also accept
// comma-separated lists, which is how they are given through the environment.

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// Same, with an explicit environment lookup instead of ::getenv (for tests).
// `getenv` returns nullptr for unset variables.
[[nodiscard]] ServerConfig parse_config(int argc, char* argv[],
                                        const char* (*getenv)(const char*));

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with server options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// Parse one "host:port" / "[v6]:port" entry.  Throws std::runtime_error.
[[nodiscard]] ListenAddress parse_listen_address(const std::string& text);

} // namespace tsync
