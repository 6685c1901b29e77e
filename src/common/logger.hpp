#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cfgstore {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (CLI, benchmark, tests).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named component logger, e.g. the
// one a Tracer writes to.  Every line carries [<name>].
std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Returns `logger` when set, spdlog's default logger otherwise.
std::shared_ptr<spdlog::logger> logger_or_default(
    std::shared_ptr<spdlog::logger> logger);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace cfgstore
