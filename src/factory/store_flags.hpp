#pragma once

#include "storage/sqlite_loader.hpp"
#include "trace/tracer.hpp"

#include <string>

#include <boost/program_options.hpp>

namespace cfgstore {

// ── StoreFlags ────────────────────────────────────────────────────────────────
// Everything needed to build an Opener.  Populated from the command line by
// flags_from_variables(); the defaults select a TOML directory store under
// the user's config directory.

struct StoreFlags {
    std::string store = "directory";   // directory|sqlite|sqlite-multi|rocksdb|rocksdb-multi

    std::string directory_path;        // Root for directory stores; empty = user config dir
    std::string directory_mode = "simple";  // simple|multi
    std::string directory_format;      // simple mode only; empty = toml

    storage::SqliteOptions sqlite;     // sqlite.path empty = <config dir>/<app>/<ns>/config.db
    std::string rocksdb_path;          // empty = <config dir>/<app>/<ns>/config.rocksdb

    trace::TraceOptions trace;
};

// ── add_options ───────────────────────────────────────────────────────────────
// Registers --<prefix>config-store* options.  Defaults mirror StoreFlags{}.
//
// Example: prefix "server-" yields --server-config-store,
// --server-config-store-sqlite-path, ...

void add_options(boost::program_options::options_description& desc,
                 const std::string& prefix = "");

// ── flags_from_variables ──────────────────────────────────────────────────────
// Reads the options registered by add_options() back out of `vm` and
// validates them.  Throws UsageError.

[[nodiscard]] StoreFlags flags_from_variables(
    const boost::program_options::variables_map& vm,
    const std::string& prefix = "");

// ── validate ──────────────────────────────────────────────────────────────────
// Throws UsageError when:
//   - the store selector, directory mode or directory format is unknown
//   - a directory format is given in multi mode
//   - the store is "datastore" (not available in this build)
//   - a SQLite pragma is outside its keyword set or a size is negative

void validate(const StoreFlags& flags);

} // namespace cfgstore
