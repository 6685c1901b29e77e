#pragma once

#include "config/loader.hpp"
#include "config/store.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rocksdb {
class DB;
class ColumnFamilyHandle;
} // namespace rocksdb

namespace cfgstore::storage {

// <user config dir>/<app>/<ns...>/config.rocksdb
[[nodiscard]] std::filesystem::path default_rocksdb_path(
    const std::string& app, const std::vector<std::string>& namespaces);

class RocksLoader;

// ── RocksDatabase ────────────────────────────────────────────────────────────
//
// Embedded key-value database shared by many scopes.  Each scope is a column
// family named by the scope string, created the first time a store for it is
// opened.  Keys are storage names, values the raw payload bytes.
//
// Thread safety is delegated to RocksDB for reads and writes; the handle map
// is guarded by a mutex.  The database directory is created on open and the
// destructor closes the database cleanly.

class RocksDatabase : public std::enable_shared_from_this<RocksDatabase> {
public:
    // Opens (or creates) the database at `path` with every existing column
    // family.  Throws BackendError if the database cannot be opened.
    [[nodiscard]] static std::shared_ptr<RocksDatabase> open(const std::filesystem::path& path);

    ~RocksDatabase();

    RocksDatabase(const RocksDatabase&)            = delete;
    RocksDatabase& operator=(const RocksDatabase&) = delete;

    // JSON SimpleStore (encoded key + ".json").
    [[nodiscard]] std::unique_ptr<Store> open_store(
        const std::string& app, const std::vector<std::string>& namespaces = {});

    // Multi-format store.
    [[nodiscard]] std::unique_ptr<Store> open_multi_store(
        const std::string& app, const std::vector<std::string>& namespaces = {});

    // Raw loader for `scope`; creates the column family when missing.
    [[nodiscard]] std::unique_ptr<RocksLoader> open_loader(const std::string& scope);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Column families currently open, including "default".
    [[nodiscard]] std::vector<std::string> column_families() const;

private:
    friend class RocksLoader;

    RocksDatabase() = default;

    rocksdb::ColumnFamilyHandle* family(const std::string& scope);

    std::filesystem::path path_;
    std::unique_ptr<rocksdb::DB> db_;

    mutable std::mutex mutex_;
    std::map<std::string, rocksdb::ColumnFamilyHandle*> families_;
};

// ── RocksLoader ──────────────────────────────────────────────────────────────
//
// Entries of one column family.  list() is in key order.

class RocksLoader final : public Loader {
public:
    RocksLoader(std::shared_ptr<RocksDatabase> db, std::string scope,
                rocksdb::ColumnFamilyHandle* family);

    [[nodiscard]] std::vector<std::string> list() const override;
    [[nodiscard]] std::string read(const std::string& name) const override;
    void write(const std::string& name, std::string_view data) override;
    void del(const std::string& name) override;
    [[nodiscard]] std::string location() const override;

    [[nodiscard]] const std::string& scope() const noexcept { return scope_; }

private:
    std::shared_ptr<RocksDatabase> db_;
    const std::string scope_;
    rocksdb::ColumnFamilyHandle* family_;
};

} // namespace cfgstore::storage
