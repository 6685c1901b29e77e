#include "factory/factory.hpp"

#include "common/errors.hpp"
#include "config/multi_format.hpp"
#include "config/simple_store.hpp"
#include "storage/directory_loader.hpp"
#include "storage/rocksdb_loader.hpp"
#include "storage/sqlite_loader.hpp"
#include "trace/tracer.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace cfgstore {

namespace fs = std::filesystem;

namespace {

// ── HandleCache ──────────────────────────────────────────────────────────────
// One open database per path for as long as some store still uses it.

template <typename Database>
class HandleCache {
public:
    template <typename OpenFn>
    std::shared_ptr<Database> get(const std::string& path, OpenFn open) {
        std::lock_guard lock(mutex_);
        if (auto it = handles_.find(path); it != handles_.end()) {
            if (auto db = it->second.lock()) {
                return db;
            }
        }
        auto db = open();
        handles_[path] = db;
        return db;
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::weak_ptr<Database>> handles_;
};

Opener directory_opener(const StoreFlags& flags) {
    const bool multi = flags.directory_mode == "multi";
    const auto marshaller = marshal::by_name(
        flags.directory_format.empty() ? "toml" : flags.directory_format);
    const fs::path root = flags.directory_path;

    return [multi, marshaller, root](const std::string& app,
                                     const std::vector<std::string>& namespaces)
               -> std::unique_ptr<Store> {
        std::unique_ptr<Loader> loader;
        if (root.empty()) {
            loader = storage::open_home_dir(app, namespaces);
        } else {
            loader = storage::open_dir(root / app, namespaces);
        }
        if (multi) {
            return std::make_unique<MultiFormat>(std::move(loader));
        }
        return std::make_unique<SimpleStore>(std::move(loader), marshaller);
    };
}

Opener sqlite_opener(const StoreFlags& flags, bool multi) {
    auto cache = std::make_shared<HandleCache<storage::SqliteDatabase>>();
    const auto options = flags.sqlite;

    return [cache, options, multi](const std::string& app,
                                   const std::vector<std::string>& namespaces)
               -> std::unique_ptr<Store> {
        auto opts = options;
        if (opts.path.empty()) {
            opts.path = storage::default_sqlite_path(app, namespaces).string();
        }
        auto db = cache->get(opts.path, [&opts] {
            return storage::SqliteDatabase::open(opts);
        });
        return multi ? db->open_multi_store(app, namespaces)
                     : db->open_store(app, namespaces);
    };
}

Opener rocksdb_opener(const StoreFlags& flags, bool multi) {
    auto cache = std::make_shared<HandleCache<storage::RocksDatabase>>();
    const auto configured = flags.rocksdb_path;

    return [cache, configured, multi](const std::string& app,
                                      const std::vector<std::string>& namespaces)
               -> std::unique_ptr<Store> {
        const fs::path path = configured.empty()
            ? storage::default_rocksdb_path(app, namespaces)
            : fs::path(configured);
        auto db = cache->get(path.string(), [&path] {
            return storage::RocksDatabase::open(path);
        });
        return multi ? db->open_multi_store(app, namespaces)
                     : db->open_store(app, namespaces);
    };
}

} // anonymous namespace

Opener make_opener(const StoreFlags& flags, std::shared_ptr<spdlog::logger> logger) {
    validate(flags);

    Opener opener;
    if (flags.store == "directory") {
        opener = directory_opener(flags);
    } else if (flags.store == "sqlite") {
        opener = sqlite_opener(flags, false);
    } else if (flags.store == "sqlite-multi") {
        opener = sqlite_opener(flags, true);
    } else if (flags.store == "rocksdb") {
        opener = rocksdb_opener(flags, false);
    } else if (flags.store == "rocksdb-multi") {
        opener = rocksdb_opener(flags, true);
    } else {
        // validate() already rejects anything else.
        throw UsageError("unknown config store type: '" + flags.store + "'");
    }

    trace::Tracer tracer(flags.trace, std::move(logger));
    return tracer.wrap_opener(std::move(opener));
}

} // namespace cfgstore
