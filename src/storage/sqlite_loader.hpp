#pragma once

#include "config/loader.hpp"
#include "config/store.hpp"

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace cfgstore::storage {

// ── SqliteOptions ────────────────────────────────────────────────────────────
//
// Connection and pragma settings.  Defaults favour durability under
// concurrent access: WAL journal, NORMAL sync, 5 s busy wait.
// Empty strings / zero values leave SQLite's own default in place.

struct SqliteOptions {
    std::string path;                        // Database file (or "file:" URI); required
    std::string journal_mode = "WAL";        // PRAGMA journal_mode
    std::string synchronous  = "NORMAL";     // PRAGMA synchronous
    int         busy_timeout_ms = 5000;      // PRAGMA busy_timeout
    int         max_open_conns  = 8;         // Pool limit (0 = unbounded)
    int         max_idle_conns  = 8;         // Connections kept open when idle
    int         cache_size      = -2000;     // PRAGMA cache_size (pages; negative = KiB)
    int64_t     mmap_size       = 64 * 1024 * 1024; // PRAGMA mmap_size in bytes
    std::string temp_store   = "MEMORY";     // PRAGMA temp_store
};

// Throws UsageError on an unknown pragma keyword or a negative size.
void validate_pragmas(const SqliteOptions& options);

// validate_pragmas() plus a non-empty path.
void validate(const SqliteOptions& options);

// <user config dir>/<app>/<ns...>/config.db
[[nodiscard]] std::filesystem::path default_sqlite_path(
    const std::string& app, const std::vector<std::string>& namespaces);

class SqliteLoader;

// ── SqliteDatabase ───────────────────────────────────────────────────────────
//
// One database file shared by any number of scoped stores.  All entries live
// in a single table:
//
//   configs(scope TEXT, name TEXT, data BLOB, PRIMARY KEY(scope, name))
//
// Connections come from a small pool bounded by max_open_conns; each one
// carries its own prepared statements.  Writers are serialized by SQLite
// itself; a writer that cannot get the lock within busy_timeout_ms fails
// with BackendError::busy() set.  Nothing is retried here.

class SqliteDatabase : public std::enable_shared_from_this<SqliteDatabase> {
public:
    // Validates `options`, opens the first connection and creates the schema.
    // Throws UsageError / BackendError.
    [[nodiscard]] static std::shared_ptr<SqliteDatabase> open(SqliteOptions options);

    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&)            = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    // JSON-only store keyed by the raw logical key.
    [[nodiscard]] std::unique_ptr<Store> open_store(
        const std::string& app, const std::vector<std::string>& namespaces = {});

    // Multi-format store (encoded key + extension).
    [[nodiscard]] std::unique_ptr<Store> open_multi_store(
        const std::string& app, const std::vector<std::string>& namespaces = {});

    // Raw loader for `scope`.
    [[nodiscard]] std::unique_ptr<SqliteLoader> open_loader(std::string scope);

    [[nodiscard]] const SqliteOptions& options() const noexcept { return options_; }

private:
    friend class SqliteLoader;

    enum Stmt { kList = 0, kRead, kWrite, kDelete, kStmtCount };

    struct Connection {
        sqlite3* db = nullptr;
        sqlite3_stmt* stmts[kStmtCount] = {};
    };

    // Returns a connection to the pool on destruction.
    class Lease {
    public:
        Lease(SqliteDatabase& owner, Connection* conn) : owner_(owner), conn_(conn) {}
        ~Lease() { owner_.release(conn_); }

        Lease(const Lease&)            = delete;
        Lease& operator=(const Lease&) = delete;

        Connection* operator->() const { return conn_; }

    private:
        SqliteDatabase& owner_;
        Connection* conn_;
    };

    explicit SqliteDatabase(SqliteOptions options);

    Lease acquire();
    void release(Connection* conn);

    // Opens a connection and applies the pragmas.
    std::unique_ptr<Connection> connect();
    // Prepares the cached statements; closes `conn` and throws on failure.
    void prepare(Connection& conn);
    static void disconnect(Connection* conn);

    SqliteOptions options_;

    std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<Connection>> idle_;
    std::vector<std::unique_ptr<Connection>> busy_;
    int open_count_ = 0;
};

// ── SqliteLoader ─────────────────────────────────────────────────────────────
//
// Rows of one scope.  list() is sorted by name.

class SqliteLoader final : public Loader {
public:
    SqliteLoader(std::shared_ptr<SqliteDatabase> db, std::string scope);

    [[nodiscard]] std::vector<std::string> list() const override;
    [[nodiscard]] std::string read(const std::string& name) const override;
    void write(const std::string& name, std::string_view data) override;
    void del(const std::string& name) override;
    [[nodiscard]] std::string location() const override;

    [[nodiscard]] const std::string& scope() const noexcept { return scope_; }

private:
    std::shared_ptr<SqliteDatabase> db_;
    const std::string scope_;
};

} // namespace cfgstore::storage
