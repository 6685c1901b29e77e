#include "factory/store_flags.hpp"

#include "common/errors.hpp"
#include "marshal/marshaller.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <string_view>
#include <vector>

namespace po = boost::program_options;

namespace cfgstore {

namespace {

constexpr std::array<std::string_view, 5> kStores = {
    "directory", "sqlite", "sqlite-multi", "rocksdb", "rocksdb-multi"};

// Fetch `prefix + name` from vm, falling back to `fallback` when absent
// (e.g. the caller registered only a subset of the options).
template <typename T>
T get_or(const po::variables_map& vm, const std::string& prefix,
         std::string_view name, T fallback) {
    const auto key = prefix + std::string(name);
    if (vm.count(key)) {
        return vm[key].as<T>();
    }
    return fallback;
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc, const std::string& prefix) {
    const StoreFlags defaults;
    const auto opt = [&prefix](std::string_view name) {
        return prefix + std::string(name);
    };

    desc.add_options()
        (opt("config-store").c_str(),
            po::value<std::string>()->default_value(defaults.store),
            "Type of config store to use (directory, sqlite, sqlite-multi, rocksdb, rocksdb-multi)")
        (opt("config-store-directory-path").c_str(),
            po::value<std::string>()->default_value(defaults.directory_path),
            "Custom path for the directory backend (defaults to the user config dir)")
        (opt("config-store-directory-mode").c_str(),
            po::value<std::string>()->default_value(defaults.directory_mode),
            "Directory store mode: simple or multi")
        (opt("config-store-directory-format").c_str(),
            po::value<std::string>()->default_value(defaults.directory_format),
            "Directory store format for simple mode (toml, json, yaml, msgpack; default toml)")
        (opt("config-store-sqlite-path").c_str(),
            po::value<std::string>()->default_value(defaults.sqlite.path),
            "Custom path for the SQLite backend (defaults to the user config dir)")
        (opt("config-store-sqlite-journal-mode").c_str(),
            po::value<std::string>()->default_value(defaults.sqlite.journal_mode),
            "SQLite journal mode (for example, WAL)")
        (opt("config-store-sqlite-synchronous").c_str(),
            po::value<std::string>()->default_value(defaults.sqlite.synchronous),
            "SQLite synchronous mode (for example, NORMAL)")
        (opt("config-store-sqlite-busy-timeout-ms").c_str(),
            po::value<int>()->default_value(defaults.sqlite.busy_timeout_ms),
            "SQLite busy timeout in milliseconds")
        (opt("config-store-sqlite-max-open-conns").c_str(),
            po::value<int>()->default_value(defaults.sqlite.max_open_conns),
            "SQLite max open connections")
        (opt("config-store-sqlite-max-idle-conns").c_str(),
            po::value<int>()->default_value(defaults.sqlite.max_idle_conns),
            "SQLite max idle connections")
        (opt("config-store-sqlite-cache-size").c_str(),
            po::value<int>()->default_value(defaults.sqlite.cache_size),
            "SQLite cache_size pragma (pages; negative means KiB)")
        (opt("config-store-sqlite-mmap-size").c_str(),
            po::value<int64_t>()->default_value(defaults.sqlite.mmap_size),
            "SQLite mmap_size pragma in bytes")
        (opt("config-store-sqlite-temp-store").c_str(),
            po::value<std::string>()->default_value(defaults.sqlite.temp_store),
            "SQLite temp_store pragma (DEFAULT, FILE, MEMORY)")
        (opt("config-store-rocksdb-path").c_str(),
            po::value<std::string>()->default_value(defaults.rocksdb_path),
            "Custom path for the RocksDB backend (defaults to the user config dir)")
        (opt("config-store-trace").c_str(),
            po::bool_switch()->default_value(defaults.trace.enabled),
            "Enable config store tracing")
        (opt("config-store-trace-responses").c_str(),
            po::bool_switch()->default_value(defaults.trace.log_responses),
            "Log config store responses as well as lookups")
        (opt("config-store-trace-include").c_str(),
            po::value<std::vector<std::string>>()->composing(),
            "Trace only stores with this prefix (repeatable)")
        (opt("config-store-trace-exclude").c_str(),
            po::value<std::vector<std::string>>()->composing(),
            "Do not trace stores with this prefix (repeatable)");
}

// ── flags_from_variables ──────────────────────────────────────────────────────

StoreFlags flags_from_variables(const po::variables_map& vm, const std::string& prefix) {
    StoreFlags flags;
    flags.store            = get_or(vm, prefix, "config-store", flags.store);
    flags.directory_path   = get_or(vm, prefix, "config-store-directory-path", flags.directory_path);
    flags.directory_mode   = get_or(vm, prefix, "config-store-directory-mode", flags.directory_mode);
    flags.directory_format = get_or(vm, prefix, "config-store-directory-format", flags.directory_format);

    auto& sq = flags.sqlite;
    sq.path            = get_or(vm, prefix, "config-store-sqlite-path", sq.path);
    sq.journal_mode    = get_or(vm, prefix, "config-store-sqlite-journal-mode", sq.journal_mode);
    sq.synchronous     = get_or(vm, prefix, "config-store-sqlite-synchronous", sq.synchronous);
    sq.busy_timeout_ms = get_or(vm, prefix, "config-store-sqlite-busy-timeout-ms", sq.busy_timeout_ms);
    sq.max_open_conns  = get_or(vm, prefix, "config-store-sqlite-max-open-conns", sq.max_open_conns);
    sq.max_idle_conns  = get_or(vm, prefix, "config-store-sqlite-max-idle-conns", sq.max_idle_conns);
    sq.cache_size      = get_or(vm, prefix, "config-store-sqlite-cache-size", sq.cache_size);
    sq.mmap_size       = get_or(vm, prefix, "config-store-sqlite-mmap-size", sq.mmap_size);
    sq.temp_store      = get_or(vm, prefix, "config-store-sqlite-temp-store", sq.temp_store);

    flags.rocksdb_path = get_or(vm, prefix, "config-store-rocksdb-path", flags.rocksdb_path);

    auto& tr = flags.trace;
    tr.enabled       = get_or(vm, prefix, "config-store-trace", tr.enabled);
    tr.log_responses = get_or(vm, prefix, "config-store-trace-responses", tr.log_responses);
    tr.include       = get_or(vm, prefix, "config-store-trace-include", tr.include);
    tr.exclude       = get_or(vm, prefix, "config-store-trace-exclude", tr.exclude);

    validate(flags);
    return flags;
}

// ── validate ──────────────────────────────────────────────────────────────────

void validate(const StoreFlags& flags) {
    if (flags.store == "datastore") {
        throw UsageError("--config-store datastore is not available in this build");
    }

    bool known_store = false;
    for (auto s : kStores) {
        known_store = known_store || flags.store == s;
    }
    if (!known_store) {
        throw UsageError(std::format("unknown config store type: '{}'", flags.store));
    }

    if (flags.directory_mode == "simple" || flags.directory_mode.empty()) {
        if (!flags.directory_format.empty() && !marshal::by_name(flags.directory_format)) {
            throw UsageError(std::format("unknown directory format: '{}' (known: {})",
                                         flags.directory_format, marshal::known_names()));
        }
    } else if (flags.directory_mode == "multi") {
        if (!flags.directory_format.empty()) {
            throw UsageError("directory format is only valid for simple mode");
        }
    } else {
        throw UsageError(std::format("unknown directory mode: '{}'", flags.directory_mode));
    }

    storage::validate_pragmas(flags.sqlite);
}

} // namespace cfgstore
