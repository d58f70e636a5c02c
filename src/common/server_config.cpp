#include "common/server_config.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace tsync {

namespace {

// ── Environment mapping ───────────────────────────────────────────────────────

struct EnvOption {
    const char* env;
    const char* option;
};

constexpr EnvOption kEnvOptions[] = {
    {"LISTEN",            "listen"},
    {"DATA_DIR",          "data-dir"},
    {"ENGINE",            "engine"},
    {"CLIENT_ID",         "allow-client-id"},
    {"SNAPSHOT_VERSIONS", "snapshot-versions"},
    {"SNAPSHOT_DAYS",     "snapshot-days"},
    {"RETENTION",         "retention"},
    {"THREADS",           "threads"},
    {"LOG_LEVEL",         "log-level"},
};

// ── Helpers ───────────────────────────────────────────────────────────────────

// Parse an unsigned integer from string_view.
// Returns the value or throws std::runtime_error on failure.
template <typename T>
[[nodiscard]] T parse_uint(std::string_view sv, std::string_view field_name) {
    T value{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::runtime_error(
            fmt::format("Invalid integer for {}: '{}'", field_name, sv));
    }
    return value;
}

// Split every element of `values` on ',' and drop empty pieces.
[[nodiscard]] std::vector<std::string> split_lists(const std::vector<std::string>& values) {
    std::vector<std::string> result;
    for (const auto& value : values) {
        std::string_view remaining{value};
        while (!remaining.empty()) {
            auto comma_pos = remaining.find(',');
            std::string_view entry = (comma_pos == std::string_view::npos)
                ? remaining
                : remaining.substr(0, comma_pos);
            remaining = (comma_pos == std::string_view::npos)
                ? std::string_view{}
                : remaining.substr(comma_pos + 1);
            if (!entry.empty()) {
                result.emplace_back(entry);
            }
        }
    }
    return result;
}

[[nodiscard]] bool env_flag_is_false(std::string_view v) {
    return v == "false" || v == "0" || v == "no" || v == "off";
}

// Translate set environment variables into "--option=value" tokens so they go
// through the same program_options machinery as the command line.  Options
// given explicitly on the command line are skipped; otherwise composing
// options would merge both sources.
[[nodiscard]] std::vector<std::string> environment_args(
    const char* (*getenv)(const char*), const po::variables_map& cli)
{
    std::vector<std::string> args;
    for (const auto& [env, option] : kEnvOptions) {
        if (cli.count(option) && !cli[option].defaulted()) {
            continue;
        }
        const char* value = getenv(env);
        if (value != nullptr && *value != '\0') {
            args.push_back(fmt::format("--{}={}", option, value));
        }
    }
    if (const char* create = getenv("CREATE_CLIENTS");
        create != nullptr && env_flag_is_false(create)) {
        args.emplace_back("--no-create-clients");
    }
    return args;
}

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    if (cfg.listen.empty()) {
        throw std::runtime_error("At least one --listen address is required");
    }
    if (cfg.data_dir.empty()) {
        throw std::runtime_error("--data-dir must not be empty");
    }
    if (cfg.engine != "memory" && cfg.engine != "sqlite" && cfg.engine != "rocksdb") {
        throw std::runtime_error(
            fmt::format("--engine must be 'memory', 'sqlite' or 'rocksdb', got '{}'",
                        cfg.engine));
    }
    if (cfg.retention != "keep-all" && cfg.retention != "prune") {
        throw std::runtime_error(
            fmt::format("--retention must be 'keep-all' or 'prune', got '{}'",
                        cfg.retention));
    }
    if (cfg.snapshot_versions == 0) {
        throw std::runtime_error("--snapshot-versions must be > 0");
    }
    if (cfg.snapshot_days < 0) {
        throw std::runtime_error("--snapshot-days must be >= 0");
    }
}

} // anonymous namespace

// ── parse_listen_address ──────────────────────────────────────────────────────

ListenAddress parse_listen_address(const std::string& text) {
    std::string_view sv{text};
    std::string_view host;
    std::string_view port_sv;

    if (!sv.empty() && sv.front() == '[') {
        // [v6-literal]:port
        const auto close = sv.find(']');
        if (close == std::string_view::npos || close + 1 >= sv.size() ||
            sv[close + 1] != ':') {
            throw std::runtime_error(
                fmt::format("Malformed listen address (expected [host]:port): '{}'", text));
        }
        host    = sv.substr(1, close - 1);
        port_sv = sv.substr(close + 2);
    } else {
        const auto colon = sv.rfind(':');
        if (colon == std::string_view::npos) {
            throw std::runtime_error(
                fmt::format("Malformed listen address (expected host:port): '{}'", text));
        }
        host    = sv.substr(0, colon);
        port_sv = sv.substr(colon + 1);
        if (host.find(':') != std::string_view::npos) {
            throw std::runtime_error(
                fmt::format("IPv6 listen addresses must be bracketed: '{}'", text));
        }
    }

    if (host.empty()) {
        throw std::runtime_error(
            fmt::format("Listen address host must not be empty: '{}'", text));
    }

    ListenAddress addr;
    addr.host = std::string(host);
    addr.port = parse_uint<std::uint16_t>(port_sv, "listen port");
    if (addr.port == 0) {
        throw std::runtime_error(
            fmt::format("Listen port must be in [1, 65535], got 0 in '{}'", text));
    }
    return addr;
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("listen,l",
            po::value<std::vector<std::string>>()->composing(),
            "Address and port to listen on, host:port (repeatable) [env LISTEN]")
        ("data-dir,d",
            po::value<std::string>()->default_value("/var/lib/tasksync"),
            "Directory in which to store data [env DATA_DIR]")
        ("engine",
            po::value<std::string>()->default_value("sqlite"),
            "Storage engine: sqlite (default), rocksdb or memory [env ENGINE]")
        ("allow-client-id,C",
            po::value<std::vector<std::string>>()->composing(),
            "Client ID to allow (repeatable; all clients allowed if absent) [env CLIENT_ID]")
        ("no-create-clients",
            "Do not create clients that are not already in the database "
            "[env CREATE_CLIENTS=false]")
        ("snapshot-versions",
            po::value<std::uint32_t>()->default_value(100),
            "Target number of versions between snapshots [env SNAPSHOT_VERSIONS]")
        ("snapshot-days",
            po::value<std::int64_t>()->default_value(14),
            "Target number of days between snapshots [env SNAPSHOT_DAYS]")
        ("retention",
            po::value<std::string>()->default_value("keep-all"),
            "Version retention: keep-all (default) or prune (drop history covered "
            "by a snapshot) [env RETENTION]")
        ("threads",
            po::value<std::uint32_t>()->default_value(0),
            "Worker threads, 0 = one per hardware thread [env THREADS]")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical [env LOG_LEVEL]");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    return parse_config(argc, argv, [](const char* name) -> const char* {
        return std::getenv(name);
    });
}

ServerConfig parse_config(int argc, char* argv[],
                          const char* (*getenv)(const char*)) {
    po::options_description desc("tasksync-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        // Command line first; the environment only fills in what it left out.
        po::store(po::parse_command_line(argc, argv, desc), vm);

        // Handle --help before notify() so missing options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::store(po::command_line_parser(environment_args(getenv, vm))
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    if (vm.count("listen")) {
        for (const auto& entry : split_lists(vm["listen"].as<std::vector<std::string>>())) {
            cfg.listen.push_back(parse_listen_address(entry));
        }
    }
    if (vm.count("allow-client-id")) {
        std::set<ClientId> allowed;
        for (const auto& entry :
             split_lists(vm["allow-client-id"].as<std::vector<std::string>>())) {
            auto id = parse_uuid(entry);
            if (!id) {
                throw std::runtime_error(
                    fmt::format("Invalid client id for --allow-client-id: '{}'", entry));
            }
            allowed.insert(*id);
        }
        cfg.allow_client_ids = std::move(allowed);
    }
    cfg.data_dir          = vm["data-dir"].as<std::string>();
    cfg.engine            = vm["engine"].as<std::string>();
    cfg.create_clients    = vm.count("no-create-clients") == 0;
    cfg.snapshot_versions = vm["snapshot-versions"].as<std::uint32_t>();
    cfg.snapshot_days     = vm["snapshot-days"].as<std::int64_t>();
    cfg.retention         = vm["retention"].as<std::string>();
    cfg.threads           = vm["threads"].as<std::uint32_t>();
    cfg.log_level         = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace tsync
