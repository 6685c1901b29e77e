#include "storage/rocksdb_loader.hpp"

#include "common/errors.hpp"
#include "config/multi_format.hpp"
#include "config/scope.hpp"
#include "config/simple_store.hpp"
#include "marshal/marshaller.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <spdlog/spdlog.h>

#include <format>

namespace cfgstore::storage {

namespace fs = std::filesystem;

namespace {

BackendError status_error(const std::string& context, const rocksdb::Status& status) {
    const bool busy = status.IsBusy() || status.IsTimedOut() || status.IsTryAgain();
    return BackendError(std::format("{}: {}", context, status.ToString()), {}, busy);
}

} // anonymous namespace

fs::path default_rocksdb_path(const std::string& app,
                              const std::vector<std::string>& namespaces) {
    return default_config_dir(app, namespaces) / "config.rocksdb";
}

// ── RocksDatabase ────────────────────────────────────────────────────────────

std::shared_ptr<RocksDatabase> RocksDatabase::open(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw BackendError(std::format("rocksdb: cannot create {}", path.string()), ec);
    }

    rocksdb::Options options;
    options.create_if_missing = true;
    options.create_missing_column_families = true;

    // Configuration data is small; keep the defaults light.
    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();

    std::vector<std::string> names;
    auto status = rocksdb::DB::ListColumnFamilies(options, path.string(), &names);
    if (!status.ok() || names.empty()) {
        // Fresh database.
        names = {rocksdb::kDefaultColumnFamilyName};
    }

    std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
    descriptors.reserve(names.size());
    for (const auto& name : names) {
        descriptors.emplace_back(name, rocksdb::ColumnFamilyOptions(options));
    }

    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    rocksdb::DB* raw_db = nullptr;
    status = rocksdb::DB::Open(rocksdb::DBOptions(options), path.string(), descriptors,
                               &handles, &raw_db);
    if (!status.ok()) {
        throw status_error(std::format("rocksdb: cannot open {}", path.string()), status);
    }

    std::shared_ptr<RocksDatabase> db(new RocksDatabase());
    db->path_ = path;
    db->db_.reset(raw_db);
    for (auto* handle : handles) {
        db->families_.emplace(handle->GetName(), handle);
    }
    spdlog::info("rocksdb: opened {} ({} column families)", path.string(), handles.size());
    return db;
}

RocksDatabase::~RocksDatabase() {
    if (!db_) {
        return;
    }
    for (auto& [name, handle] : families_) {
        auto status = db_->DestroyColumnFamilyHandle(handle);
        if (!status.ok()) {
            spdlog::error("rocksdb: cannot release column family {}: {}", name,
                          status.ToString());
        }
    }
    families_.clear();
    spdlog::info("rocksdb: closing {}", path_.string());
    // unique_ptr<rocksdb::DB> destructor calls delete, which closes the DB.
}

std::vector<std::string> RocksDatabase::column_families() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    names.reserve(families_.size());
    for (const auto& [name, handle] : families_) {
        names.push_back(name);
    }
    return names;
}

rocksdb::ColumnFamilyHandle* RocksDatabase::family(const std::string& scope) {
    if (scope.empty()) {
        throw UsageError("rocksdb: empty scope");
    }
    std::lock_guard lock(mutex_);
    if (auto it = families_.find(scope); it != families_.end()) {
        return it->second;
    }
    rocksdb::ColumnFamilyHandle* handle = nullptr;
    auto status = db_->CreateColumnFamily(rocksdb::ColumnFamilyOptions(), scope, &handle);
    if (!status.ok()) {
        throw status_error(std::format("rocksdb: cannot create column family {}", scope),
                           status);
    }
    spdlog::debug("rocksdb: created column family {}", scope);
    families_.emplace(scope, handle);
    return handle;
}

std::unique_ptr<RocksLoader> RocksDatabase::open_loader(const std::string& scope) {
    auto* handle = family(scope);
    return std::make_unique<RocksLoader>(shared_from_this(), scope, handle);
}

std::unique_ptr<Store> RocksDatabase::open_store(const std::string& app,
                                                 const std::vector<std::string>& namespaces) {
    return std::make_unique<SimpleStore>(open_loader(store_scope(app, namespaces)),
                                         marshal::json());
}

std::unique_ptr<Store> RocksDatabase::open_multi_store(
    const std::string& app, const std::vector<std::string>& namespaces) {
    return std::make_unique<MultiFormat>(open_loader(store_scope(app, namespaces)));
}

// ── RocksLoader ──────────────────────────────────────────────────────────────

RocksLoader::RocksLoader(std::shared_ptr<RocksDatabase> db, std::string scope,
                         rocksdb::ColumnFamilyHandle* family)
    : db_(std::move(db)), scope_(std::move(scope)), family_(family) {
    if (!db_ || !family_) {
        throw UsageError("rocksdb: loader requires a database and column family");
    }
}

std::string RocksLoader::location() const {
    return std::format("rocksdb {} [{}]", db_->path().string(), scope_);
}

std::vector<std::string> RocksLoader::list() const {
    std::vector<std::string> result;
    std::unique_ptr<rocksdb::Iterator> it(
        db_->db_->NewIterator(rocksdb::ReadOptions{}, family_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        result.emplace_back(it->key().ToString());
    }
    if (!it->status().ok()) {
        throw status_error(std::format("rocksdb: list {}", scope_), it->status());
    }
    return result;
}

std::string RocksLoader::read(const std::string& name) const {
    std::string value;
    auto status = db_->db_->Get(rocksdb::ReadOptions{}, family_, name, &value);
    if (status.IsNotFound()) {
        throw NotFoundError(name);
    }
    if (!status.ok()) {
        throw status_error(std::format("rocksdb: read {}/{}", scope_, name), status);
    }
    return value;
}

void RocksLoader::write(const std::string& name, std::string_view data) {
    auto status = db_->db_->Put(rocksdb::WriteOptions{}, family_, name,
                                rocksdb::Slice{data.data(), data.size()});
    if (!status.ok()) {
        throw status_error(std::format("rocksdb: write {}/{}", scope_, name), status);
    }
}

void RocksLoader::del(const std::string& name) {
    // Check existence first: RocksDB Delete succeeds even if the key is missing.
    std::string existing;
    auto status = db_->db_->Get(rocksdb::ReadOptions{}, family_, name, &existing);
    if (status.IsNotFound()) {
        throw NotFoundError(name);
    }
    if (!status.ok()) {
        throw status_error(std::format("rocksdb: delete {}/{}", scope_, name), status);
    }

    status = db_->db_->Delete(rocksdb::WriteOptions{}, family_, name);
    if (!status.ok()) {
        throw status_error(std::format("rocksdb: delete {}/{}", scope_, name), status);
    }
}

} // namespace cfgstore::storage
