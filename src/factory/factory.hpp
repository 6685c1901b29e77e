#pragma once

#include "config/store.hpp"
#include "factory/store_flags.hpp"

#include <memory>

#include <spdlog/spdlog.h>

namespace cfgstore {

// ── make_opener ──────────────────────────────────────────────────────────────
//
// Builds an Opener for the backend selected in `flags`:
//
//   directory      SimpleStore (directory_format, default toml) or
//                  MultiFormat (directory_mode = multi) over
//                  <directory_path or config dir>/<app>/<ns...>
//   sqlite         JSON-only store, rows keyed by the raw key
//   sqlite-multi   MultiFormat over SQLite
//   rocksdb        JSON SimpleStore over a RocksDB column family
//   rocksdb-multi  MultiFormat over RocksDB
//
// Validation happens here, before any store is opened: an unknown selector,
// mode or format throws UsageError.  Backends are opened lazily by the
// Opener; every store opened on the same database path shares one handle,
// released when its last store goes away.
//
// When flags.trace selects tracing the returned Opener is wrapped by a
// trace::Tracer logging to `logger` (default logger when null).
//
// Example:
//
//   auto open = make_opener(flags);
//   auto store = open("myapp", {"ui"});
//   nlohmann::json theme;
//   store->unmarshal(key("theme"), theme);

[[nodiscard]] Opener make_opener(const StoreFlags& flags,
                                 std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace cfgstore
