#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tsync {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (startup messages, tests, and any code
// that does not hold a component logger).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named component logger, e.g.
// "http", "storage", "sync".  The name is embedded in every line as [<name>].
std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace tsync
