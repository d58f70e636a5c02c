#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace tsync {

namespace {
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";

// Serializes get-or-create; spdlog throws if a name is registered twice.
std::mutex registry_mutex;
} // namespace

void init_default_logger(spdlog::level::level_enum level) {
    std::lock_guard lock(registry_mutex);
    auto logger = spdlog::get("tasksync");
    if (!logger) {
        logger = spdlog::stdout_color_mt("tasksync");
    }
    logger->set_pattern(kPattern);
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level)
{
    std::lock_guard lock(registry_mutex);

    // Return existing logger if already created (idempotent).
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto logger = spdlog::stdout_color_mt(name);
    logger->set_pattern(kPattern);
    logger->set_level(level);
    return logger;
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

} // namespace tsync
