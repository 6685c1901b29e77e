// Config store benchmark: List / Get / Store / LookupMissing across the
// directory, sqlite, sqlite-multi and rocksdb backends.
//
// For every backend, operation, record count and parallelism a fresh store
// is created in a temporary directory, populated with `count` records, and
// hit with N operations spread over `parallelism` threads.  SQLite Store
// runs single-threaded: concurrent writers only measure lock waits.
//
// Record counts and parallelism default to {1, 100, 1000} and {1, 4}; they
// can be overridden with comma-separated lists in CFGSTORE_BENCH_COUNTS and
// CFGSTORE_BENCH_PARALLELISM.  argv[1] sets N (default 2000).
//
// Prints: ops, elapsed time, ops/sec, and latency percentiles.

#include "common/errors.hpp"
#include "config/simple_store.hpp"
#include "config/store.hpp"
#include "marshal/marshaller.hpp"
#include "storage/directory_loader.hpp"
#include "storage/rocksdb_loader.hpp"
#include "storage/sqlite_loader.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <numeric>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

namespace fs = std::filesystem;

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

// ── Backends ─────────────────────────────────────────────────────────────────

// Keeps whatever owns the store's database alive next to it.
struct OpenStore {
    std::shared_ptr<void> database;
    std::unique_ptr<cfgstore::Store> store;
};

struct Backend {
    std::string name;
    bool serial_writes = false;
    std::function<OpenStore(const fs::path& dir)> open;
};

std::vector<Backend> backends() {
    return {
        {"directory", false, [](const fs::path& dir) {
             OpenStore s;
             s.store = std::make_unique<cfgstore::SimpleStore>(
                 cfgstore::storage::open_dir(dir, {"app", "ns"}), cfgstore::marshal::json());
             return s;
         }},
        {"sqlite", true, [](const fs::path& dir) {
             cfgstore::storage::SqliteOptions options;
             options.path = (dir / "config.db").string();
             auto db = cfgstore::storage::SqliteDatabase::open(options);
             OpenStore s;
             s.store = db->open_store("app", {"ns"});
             s.database = db;
             return s;
         }},
        {"sqlite-multi", true, [](const fs::path& dir) {
             cfgstore::storage::SqliteOptions options;
             options.path = (dir / "config.db").string();
             auto db = cfgstore::storage::SqliteDatabase::open(options);
             OpenStore s;
             s.store = db->open_multi_store("app", {"ns"});
             s.database = db;
             return s;
         }},
        {"rocksdb", false, [](const fs::path& dir) {
             auto db = cfgstore::storage::RocksDatabase::open(dir / "config.rocksdb");
             OpenStore s;
             s.store = db->open_store("app", {"ns"});
             s.database = db;
             return s;
         }},
    };
}

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p99_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns, double wall_sec) {
    BenchResult r;
    r.total_ops = latencies_ns.size();
    r.elapsed_sec = wall_sec;

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.ops_per_sec = wall_sec > 0 ? static_cast<double>(r.total_ops) / wall_sec : 0.0;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us = percentile(0.50);
    r.p99_us = percentile(0.99);
    return r;
}

void print_result(const std::string& label, const BenchResult& r) {
    fprintf(stdout, "%-44s %8zu ops %9.3f s %10.0f ops/sec  avg %8.1f µs  p50 %8.1f µs  p99 %8.1f µs\n",
            label.c_str(), r.total_ops, r.elapsed_sec, r.ops_per_sec,
            r.avg_us, r.p50_us, r.p99_us);
}

// ── Environment ──────────────────────────────────────────────────────────────

std::vector<int> ints_from_env(const char* name, std::vector<int> fallback) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) {
        return fallback;
    }
    std::vector<int> values;
    std::string_view rest{raw};
    while (!rest.empty()) {
        auto comma = rest.find(',');
        auto item = rest.substr(0, comma);
        rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);

        int value = 0;
        auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), value);
        if (ec != std::errc{} || ptr != item.data() + item.size() || value <= 0) {
            throw cfgstore::UsageError(std::format("{}: invalid value '{}'", name, item));
        }
        values.push_back(value);
    }
    return values;
}

// ── Operations ───────────────────────────────────────────────────────────────

using OpFn = std::function<void(cfgstore::Store&, const std::vector<std::string>&, std::size_t)>;

struct Op {
    std::string name;
    bool writes = false;
    OpFn run;
};

std::vector<Op> operations() {
    return {
        {"List", false, [](cfgstore::Store& store, const std::vector<std::string>&, std::size_t) {
             (void)store.list();
         }},
        {"Get", false, [](cfgstore::Store& store, const std::vector<std::string>& keys, std::size_t i) {
             nlohmann::json value;
             store.unmarshal(cfgstore::key(keys[i % keys.size()]), value);
         }},
        {"Store", true, [](cfgstore::Store& store, const std::vector<std::string>& keys, std::size_t i) {
             store.marshal(cfgstore::key(keys[i % keys.size()]), nlohmann::json{{"value", "value"}});
         }},
        {"LookupMissing", false, [](cfgstore::Store& store, const std::vector<std::string>&, std::size_t i) {
             nlohmann::json value;
             try {
                 store.unmarshal(cfgstore::key(std::format("missing-{}", i)), value);
             } catch (const cfgstore::NotFoundError&) {
                 return;
             }
             throw cfgstore::StoreError("expected a not-found error");
         }},
    };
}

BenchResult run_one(cfgstore::Store& store, const Op& op, const std::vector<std::string>& keys,
                    std::size_t num_ops, int parallelism) {
    std::atomic<std::size_t> next{0};
    std::mutex merge_mutex;
    std::vector<int64_t> latencies;
    latencies.reserve(num_ops);

    // First failure wins; the benchmark is aborted by rethrowing it.
    std::exception_ptr failure;

    auto worker = [&] {
        std::vector<int64_t> local;
        try {
            for (auto i = next.fetch_add(1); i < num_ops; i = next.fetch_add(1)) {
                auto t0 = clock::now();
                op.run(store, keys, i);
                auto t1 = clock::now();
                local.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
            }
        } catch (...) {
            std::lock_guard lock(merge_mutex);
            if (!failure) failure = std::current_exception();
        }
        std::lock_guard lock(merge_mutex);
        latencies.insert(latencies.end(), local.begin(), local.end());
    };

    auto start = clock::now();
    std::vector<std::thread> threads;
    for (int t = 1; t < parallelism; ++t) {
        threads.emplace_back(worker);
    }
    worker();
    for (auto& t : threads) {
        t.join();
    }
    auto wall = std::chrono::duration<double>(clock::now() - start).count();

    if (failure) {
        std::rethrow_exception(failure);
    }
    return compute_stats(latencies, wall);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_ops = 2'000;
    if (argc > 1) {
        num_ops = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_ops == 0) num_ops = 2'000;
    }

    try {
        const auto counts      = ints_from_env("CFGSTORE_BENCH_COUNTS", {1, 100, 1000});
        const auto parallelism = ints_from_env("CFGSTORE_BENCH_PARALLELISM", {1, 4});

        fprintf(stdout,
            "Config Store Benchmark\n"
            "======================\n"
            "Ops per run: %zu\n\n",
            num_ops);

        const auto root = fs::temp_directory_path() /
                          std::format("cfgstore-bench-{}", std::chrono::steady_clock::now()
                                                               .time_since_epoch().count());

        for (const auto& backend : backends()) {
            for (const auto& op : operations()) {
                for (int count : counts) {
                    std::vector<std::string> keys;
                    keys.reserve(static_cast<std::size_t>(count));
                    for (int i = 0; i < count; ++i) {
                        keys.push_back(std::format("key-{}", i));
                    }

                    for (int p : parallelism) {
                        const auto dir = root / std::format("{}-{}-{}-{}", backend.name, op.name, count, p);
                        std::error_code ec;
                        fs::create_directories(dir, ec);
                        if (ec) {
                            throw cfgstore::BackendError(
                                std::format("cannot create {}", dir.string()), ec);
                        }

                        BenchResult result;
                        {
                            auto s = backend.open(dir);
                            for (const auto& k : keys) {
                                s.store->marshal(cfgstore::key(k), nlohmann::json{{"value", "value"}});
                            }
                            const int threads = op.writes && backend.serial_writes ? 1 : p;
                            result = run_one(*s.store, op, keys, num_ops, threads);
                        }
                        fs::remove_all(dir, ec);

                        print_result(std::format("{}/{}/n={}/p={}", backend.name, op.name, count, p),
                                     result);
                    }
                }
            }
        }

        std::error_code ec;
        fs::remove_all(root, ec);
    } catch (const std::exception& e) {
        spdlog::error("benchmark: {}", e.what());
        return 1;
    }

    fprintf(stdout, "\n");
    return 0;
}
