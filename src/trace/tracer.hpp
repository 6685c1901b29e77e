#pragma once

#include "config/store.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace cfgstore::trace {

// ── TraceOptions ─────────────────────────────────────────────────────────────

struct TraceOptions {
    bool enabled       = false;    // Log every operation
    bool log_responses = false;    // Also log values read/written (implies enabled)
    std::vector<std::string> include;  // Store-name prefixes to trace; empty = all
    std::vector<std::string> exclude;  // Store-name prefixes never traced; wins over include
};

// ── Tracer ───────────────────────────────────────────────────────────────────
//
// Wraps stores (or the stores an Opener produces) in a decorator that logs
// each call through `logger`:
//
//   config store myapp/ui: Unmarshal(theme)
//   config store myapp/ui: Unmarshal(theme) error: 'theme.toml' does not exist
//
// The decorator is transparent: results are passed through and exceptions
// are rethrown unchanged.  Stores whose name is not selected are returned
// as they are, without a wrapper.

class Tracer {
public:
    explicit Tracer(TraceOptions options = {},
                    std::shared_ptr<spdlog::logger> logger = nullptr);

    // True when tracing applies to the store called `name` ("app/ns...").
    [[nodiscard]] bool enabled_for(const std::string& name) const;

    [[nodiscard]] std::unique_ptr<Store> wrap_store(const std::string& name,
                                                    std::unique_ptr<Store> store) const;

    // Opener whose stores are wrapped under the name store_scope(app, ns).
    // An empty opener stays empty.
    [[nodiscard]] Opener wrap_opener(Opener opener) const;

    [[nodiscard]] const TraceOptions& options() const noexcept { return options_; }

private:
    TraceOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cfgstore::trace
