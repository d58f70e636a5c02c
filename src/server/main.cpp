#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "storage/memory_storage.hpp"
#ifdef TASKSYNC_WITH_ROCKSDB
#include "storage/rocksdb_storage.hpp"
#endif
#include "storage/sqlite_storage.hpp"
#include "storage/storage_error.hpp"
#include "sync/sync_server.hpp"

#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    tsync::ServerConfig cfg;
    try {
        cfg = tsync::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = tsync::parse_log_level(cfg.log_level);
    tsync::init_default_logger(level);
    auto logger = spdlog::default_logger();

    logger->info("tasksync-server v{} starting – engine={} data-dir={} listen={}",
                 tsync::kServerVersion, cfg.engine, cfg.data_dir, cfg.listen.size());
    if (cfg.allow_client_ids) {
        logger->info("Serving {} allowed client id(s) only", cfg.allow_client_ids->size());
    }

    // ── Storage ──────────────────────────────────────────────────────────────
    namespace fs = std::filesystem;
    const fs::path data_dir{cfg.data_dir};

    std::unique_ptr<tsync::SyncStorage> storage;
    try {
        if (cfg.engine == "rocksdb") {
#ifdef TASKSYNC_WITH_ROCKSDB
            const auto db_path = data_dir / "rocksdb";
            storage = std::make_unique<tsync::RocksDBStorage>(db_path);
            logger->info("Using RocksDB storage engine at {}", db_path.string());
#else
            logger->error("This build has no RocksDB storage engine");
            return 1;
#endif
        } else if (cfg.engine == "sqlite") {
            storage = std::make_unique<tsync::SqliteStorage>(data_dir);
            logger->info("Using SQLite storage engine in {}", data_dir.string());
        } else {
            storage = std::make_unique<tsync::MemoryStorage>();
            logger->warn("Using in-memory storage engine; nothing survives a restart");
        }
    } catch (const tsync::StorageError& e) {
        logger->error("Failed to open {} storage engine: {}", cfg.engine, e.what());
        return 1;
    }

    // ── Engine ───────────────────────────────────────────────────────────────
    tsync::SyncConfig sync_cfg;
    sync_cfg.snapshot_versions = cfg.snapshot_versions;
    sync_cfg.snapshot_days     = cfg.snapshot_days;
    sync_cfg.create_clients    = cfg.create_clients;
    sync_cfg.retention         = cfg.retention == "prune" ? tsync::RetentionPolicy::prune
                                                          : tsync::RetentionPolicy::keep_all;

    tsync::SyncServer sync{*storage, sync_cfg, tsync::SystemClock::instance(),
                           tsync::make_logger("sync", level)};

    logger->info("Snapshots requested every {} versions / {} days, retention={}, "
                 "create-clients={}",
                 sync_cfg.snapshot_versions, sync_cfg.snapshot_days, cfg.retention,
                 cfg.create_clients);

    // ── HTTP server ──────────────────────────────────────────────────────────
    try {
        tsync::network::Server server{cfg.listen, sync, cfg.allow_client_ids, cfg.threads,
                                      tsync::make_logger("http", level)};
        server.run();
    } catch (const boost::system::system_error& e) {
        logger->error("Failed to start HTTP server: {}", e.what());
        return 1;
    }

    logger->info("tasksync-server stopped");
    return 0;
}
