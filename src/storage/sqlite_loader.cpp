#include "storage/sqlite_loader.hpp"

#include "common/errors.hpp"
#include "config/multi_format.hpp"
#include "config/scope.hpp"
#include "config/simple_store.hpp"
#include "marshal/marshaller.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <string_view>

#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace cfgstore::storage {

namespace fs = std::filesystem;

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS configs ("
    " scope TEXT NOT NULL,"
    " name TEXT NOT NULL,"
    " data BLOB NOT NULL,"
    " PRIMARY KEY (scope, name))";

constexpr const char* kStatements[] = {
    "SELECT name FROM configs WHERE scope = ?1 ORDER BY name",
    "SELECT data FROM configs WHERE scope = ?1 AND name = ?2",
    "INSERT INTO configs (scope, name, data) VALUES (?1, ?2, ?3)"
    " ON CONFLICT (scope, name) DO UPDATE SET data = excluded.data",
    "DELETE FROM configs WHERE scope = ?1 AND name = ?2",
};

constexpr std::array<std::string_view, 6> kJournalModes = {
    "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};
constexpr std::array<std::string_view, 8> kSynchronousModes = {
    "OFF", "NORMAL", "FULL", "EXTRA", "0", "1", "2", "3"};
constexpr std::array<std::string_view, 6> kTempStores = {
    "DEFAULT", "FILE", "MEMORY", "0", "1", "2"};

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

template <std::size_t N>
void check_keyword(const char* pragma, const std::string& value,
                   const std::array<std::string_view, N>& allowed) {
    if (value.empty()) {
        return;
    }
    const auto v = upper(value);
    if (std::find(allowed.begin(), allowed.end(), v) == allowed.end()) {
        throw UsageError(std::format("sqlite: invalid {} '{}'", pragma, value));
    }
}

bool is_busy(int rc) {
    const int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

[[noreturn]] void throw_sqlite(sqlite3* db, int rc, const std::string& context) {
    const char* msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    throw BackendError(std::format("{}: {}", context, msg), {}, is_busy(rc));
}

// Clears bindings and resets a cached statement when the operation ends.
class StatementScope {
public:
    explicit StatementScope(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementScope() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    StatementScope(const StatementScope&)            = delete;
    StatementScope& operator=(const StatementScope&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_;
};

void bind_text(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value,
               const std::string& context) {
    int rc = sqlite3_bind_text(stmt, index, value.data(),
                               static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        throw_sqlite(db, rc, context);
    }
}

bool is_memory_or_uri(const std::string& path) {
    return path == ":memory:" || path.starts_with("file:");
}

// Every connection to one of these opens its own private database.
bool is_in_memory(const std::string& path) {
    if (path == ":memory:") {
        return true;
    }
    return path.starts_with("file:") &&
           (path.starts_with("file::memory:") || path.find("mode=memory") != std::string::npos);
}

} // anonymous namespace

// ── Options ──────────────────────────────────────────────────────────────────

void validate_pragmas(const SqliteOptions& options) {
    check_keyword("journal_mode", options.journal_mode, kJournalModes);
    check_keyword("synchronous", options.synchronous, kSynchronousModes);
    check_keyword("temp_store", options.temp_store, kTempStores);
    if (options.busy_timeout_ms < 0) {
        throw UsageError("sqlite: busy_timeout_ms must not be negative");
    }
    if (options.max_open_conns < 0 || options.max_idle_conns < 0) {
        throw UsageError("sqlite: connection limits must not be negative");
    }
    if (options.mmap_size < 0) {
        throw UsageError("sqlite: mmap_size must not be negative");
    }
}

void validate(const SqliteOptions& options) {
    if (options.path.empty()) {
        throw UsageError("sqlite: database path is required");
    }
    validate_pragmas(options);
}

fs::path default_sqlite_path(const std::string& app,
                             const std::vector<std::string>& namespaces) {
    return default_config_dir(app, namespaces) / "config.db";
}

// ── SqliteDatabase ───────────────────────────────────────────────────────────

SqliteDatabase::SqliteDatabase(SqliteOptions options) : options_(std::move(options)) {}

std::shared_ptr<SqliteDatabase> SqliteDatabase::open(SqliteOptions options) {
    validate(options);

    if (!is_memory_or_uri(options.path)) {
        const auto parent = fs::path(options.path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                throw BackendError(
                    std::format("sqlite: cannot create {}", parent.string()), ec);
            }
        }
    }

    // An in-memory database lives only as long as its single connection, so
    // the pool holds exactly one and never closes it.
    if (is_in_memory(options.path)) {
        if (options.max_open_conns != 1 || options.max_idle_conns < 1) {
            spdlog::debug("sqlite: {} is in memory, using a single connection", options.path);
        }
        options.max_open_conns = 1;
        options.max_idle_conns = 1;
    }

    std::shared_ptr<SqliteDatabase> db(new SqliteDatabase(std::move(options)));

    // The first connection creates the schema and is kept idle for reuse.
    auto conn = db->connect();
    char* err = nullptr;
    int rc = sqlite3_exec(conn->db, kSchema, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        disconnect(conn.get());
        throw BackendError(std::format("sqlite: cannot create schema in {}: {}",
                                       db->options_.path, msg),
                           {}, is_busy(rc));
    }
    db->prepare(*conn);
    db->open_count_ = 1;
    db->idle_.push_back(std::move(conn));

    spdlog::info("sqlite: opened {} (journal_mode={}, synchronous={})",
                 db->options_.path, db->options_.journal_mode, db->options_.synchronous);
    return db;
}

SqliteDatabase::~SqliteDatabase() {
    for (auto& conn : idle_) {
        disconnect(conn.get());
    }
    spdlog::info("sqlite: closed {}", options_.path);
}

std::unique_ptr<SqliteDatabase::Connection> SqliteDatabase::connect() {
    auto conn = std::make_unique<Connection>();

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (options_.path.starts_with("file:")) {
        flags |= SQLITE_OPEN_URI;
    }
    int rc = sqlite3_open_v2(options_.path.c_str(), &conn->db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = conn->db ? sqlite3_errmsg(conn->db) : sqlite3_errstr(rc);
        sqlite3_close(conn->db);
        throw BackendError(std::format("sqlite: cannot open {}: {}", options_.path, msg),
                           {}, is_busy(rc));
    }

    if (options_.busy_timeout_ms > 0) {
        sqlite3_busy_timeout(conn->db, options_.busy_timeout_ms);
    }

    std::string pragmas;
    if (!options_.journal_mode.empty()) {
        pragmas += std::format("PRAGMA journal_mode = {};", options_.journal_mode);
    }
    if (!options_.synchronous.empty()) {
        pragmas += std::format("PRAGMA synchronous = {};", options_.synchronous);
    }
    if (options_.cache_size != 0) {
        pragmas += std::format("PRAGMA cache_size = {};", options_.cache_size);
    }
    if (options_.mmap_size > 0) {
        pragmas += std::format("PRAGMA mmap_size = {};", options_.mmap_size);
    }
    if (!options_.temp_store.empty()) {
        pragmas += std::format("PRAGMA temp_store = {};", options_.temp_store);
    }
    if (!pragmas.empty()) {
        char* err = nullptr;
        rc = sqlite3_exec(conn->db, pragmas.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errstr(rc);
            sqlite3_free(err);
            sqlite3_close(conn->db);
            throw BackendError(
                std::format("sqlite: cannot configure {}: {}", options_.path, msg),
                {}, is_busy(rc));
        }
    }
    return conn;
}

void SqliteDatabase::prepare(Connection& conn) {
    for (int i = 0; i < kStmtCount; ++i) {
        if (conn.stmts[i]) {
            continue;
        }
        int rc = sqlite3_prepare_v3(conn.db, kStatements[i], -1, SQLITE_PREPARE_PERSISTENT,
                                    &conn.stmts[i], nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(conn.db);
            disconnect(&conn);
            throw BackendError(
                std::format("sqlite: cannot prepare statement on {}: {}", options_.path, msg),
                {}, is_busy(rc));
        }
    }
}

void SqliteDatabase::disconnect(Connection* conn) {
    for (auto*& stmt : conn->stmts) {
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }
    sqlite3_close(conn->db);
    conn->db = nullptr;
}

SqliteDatabase::Lease SqliteDatabase::acquire() {
    std::unique_lock lock(mutex_);
    available_.wait(lock, [this] {
        return !idle_.empty() || options_.max_open_conns == 0 ||
               open_count_ < options_.max_open_conns;
    });

    if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        auto* raw = conn.get();
        busy_.push_back(std::move(conn));
        return Lease(*this, raw);
    }

    ++open_count_;
    lock.unlock();

    std::unique_ptr<Connection> conn;
    try {
        conn = connect();
        prepare(*conn);
    } catch (...) {
        lock.lock();
        --open_count_;
        lock.unlock();
        available_.notify_one();
        throw;
    }

    lock.lock();
    auto* raw = conn.get();
    busy_.push_back(std::move(conn));
    return Lease(*this, raw);
}

void SqliteDatabase::release(Connection* conn) {
    std::unique_ptr<Connection> closing;
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(busy_.begin(), busy_.end(),
                               [conn](const auto& p) { return p.get() == conn; });
        if (it == busy_.end()) {
            return;
        }
        auto owned = std::move(*it);
        busy_.erase(it);
        if (static_cast<int>(idle_.size()) < options_.max_idle_conns) {
            idle_.push_back(std::move(owned));
        } else {
            --open_count_;
            closing = std::move(owned);
        }
    }
    available_.notify_one();
    if (closing) {
        disconnect(closing.get());
    }
}

std::unique_ptr<SqliteLoader> SqliteDatabase::open_loader(std::string scope) {
    return std::make_unique<SqliteLoader>(shared_from_this(), std::move(scope));
}

std::unique_ptr<Store> SqliteDatabase::open_store(const std::string& app,
                                                  const std::vector<std::string>& namespaces) {
    StoreOptions opts;
    opts.key_codec = identity_key_codec();
    opts.append_extension = false;
    return std::make_unique<SimpleStore>(open_loader(store_scope(app, namespaces)),
                                         marshal::json(), std::move(opts));
}

std::unique_ptr<Store> SqliteDatabase::open_multi_store(
    const std::string& app, const std::vector<std::string>& namespaces) {
    return std::make_unique<MultiFormat>(open_loader(store_scope(app, namespaces)));
}

// ── SqliteLoader ─────────────────────────────────────────────────────────────

SqliteLoader::SqliteLoader(std::shared_ptr<SqliteDatabase> db, std::string scope)
    : db_(std::move(db)), scope_(std::move(scope)) {
    if (!db_) {
        throw UsageError("sqlite: loader requires a database");
    }
}

std::string SqliteLoader::location() const {
    return std::format("sqlite {} [{}]", db_->options().path, scope_);
}

std::vector<std::string> SqliteLoader::list() const {
    const auto context = std::format("sqlite: list {}", scope_);
    auto conn = db_->acquire();
    StatementScope stmt(conn->stmts[SqliteDatabase::kList]);
    bind_text(conn->db, stmt.get(), 1, scope_, context);

    std::vector<std::string> names;
    for (;;) {
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            throw_sqlite(conn->db, rc, context);
        }
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
        const int len = sqlite3_column_bytes(stmt.get(), 0);
        names.emplace_back(text ? text : "", static_cast<std::size_t>(len));
    }
    return names;
}

std::string SqliteLoader::read(const std::string& name) const {
    const auto context = std::format("sqlite: read {}/{}", scope_, name);
    auto conn = db_->acquire();
    StatementScope stmt(conn->stmts[SqliteDatabase::kRead]);
    bind_text(conn->db, stmt.get(), 1, scope_, context);
    bind_text(conn->db, stmt.get(), 2, name, context);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        throw NotFoundError(name);
    }
    if (rc != SQLITE_ROW) {
        throw_sqlite(conn->db, rc, context);
    }
    const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt.get(), 0));
    const int len = sqlite3_column_bytes(stmt.get(), 0);
    return blob ? std::string(blob, static_cast<std::size_t>(len)) : std::string();
}

void SqliteLoader::write(const std::string& name, std::string_view data) {
    const auto context = std::format("sqlite: write {}/{}", scope_, name);
    auto conn = db_->acquire();
    StatementScope stmt(conn->stmts[SqliteDatabase::kWrite]);
    bind_text(conn->db, stmt.get(), 1, scope_, context);
    bind_text(conn->db, stmt.get(), 2, name, context);

    // A null pointer would bind SQL NULL; empty payloads are zero-length blobs.
    int rc = data.empty()
        ? sqlite3_bind_zeroblob(stmt.get(), 3, 0)
        : sqlite3_bind_blob(stmt.get(), 3, data.data(), static_cast<int>(data.size()),
                            SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        throw_sqlite(conn->db, rc, context);
    }

    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        throw_sqlite(conn->db, rc, context);
    }
}

void SqliteLoader::del(const std::string& name) {
    const auto context = std::format("sqlite: delete {}/{}", scope_, name);
    auto conn = db_->acquire();
    StatementScope stmt(conn->stmts[SqliteDatabase::kDelete]);
    bind_text(conn->db, stmt.get(), 1, scope_, context);
    bind_text(conn->db, stmt.get(), 2, name, context);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        throw_sqlite(conn->db, rc, context);
    }
    if (sqlite3_changes(conn->db) == 0) {
        throw NotFoundError(name);
    }
}

} // namespace cfgstore::storage
