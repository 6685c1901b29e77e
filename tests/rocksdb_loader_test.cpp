#include "config/multi_format.hpp"
#include "marshal/marshaller.hpp"
#include "storage/rocksdb_loader.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace cfgstore::storage {

namespace fs = std::filesystem;

// ── Fixture ─────────────────────────────────────────────────────────────────
// Opens a RocksDatabase in a temporary directory for each test.

class RocksLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = tmp_.path() / "config.rocksdb";
        db_ = RocksDatabase::open(path_);
    }

    void TearDown() override {
        db_.reset(); // close DB before removing files
    }

    // Re-open the DB at the same path (for persistence tests).
    void reopen() {
        db_.reset();
        db_ = RocksDatabase::open(path_);
    }

    bool has_family(const std::string& name) const {
        auto families = db_->column_families();
        return std::find(families.begin(), families.end(), name) != families.end();
    }

    testing::TempDir tmp_{"rocksdb"};
    fs::path path_;
    std::shared_ptr<RocksDatabase> db_;
};

// ── Column families ───────────────────────────────────────────────────────────

TEST_F(RocksLoaderTest, FreshDatabaseHasOnlyDefaultFamily) {
    EXPECT_EQ(db_->column_families(), std::vector<std::string>{"default"});
    EXPECT_TRUE(fs::is_directory(path_));
}

TEST_F(RocksLoaderTest, FamilyIsCreatedOnFirstOpen) {
    EXPECT_FALSE(has_family("myapp/ui"));
    auto loader = db_->open_loader("myapp/ui");
    EXPECT_TRUE(has_family("myapp/ui"));

    auto again = db_->open_loader("myapp/ui");
    auto families = db_->column_families();
    EXPECT_EQ(std::count(families.begin(), families.end(), "myapp/ui"), 1);
}

TEST_F(RocksLoaderTest, FamiliesSurviveReopen) {
    db_->open_loader("a")->write("k", "v");
    (void)db_->open_loader("b");
    reopen();
    EXPECT_TRUE(has_family("a"));
    EXPECT_TRUE(has_family("b"));
    EXPECT_EQ(db_->open_loader("a")->read("k"), "v");
}

TEST_F(RocksLoaderTest, EmptyScopeIsRejected) {
    EXPECT_THROW((void)db_->open_loader(""), UsageError);
}

// ── Loader operations ─────────────────────────────────────────────────────────

TEST_F(RocksLoaderTest, WriteThenReadReturnsBytes) {
    auto loader = db_->open_loader("scope");
    loader->write("k", "value");
    EXPECT_EQ(loader->read("k"), "value");
}

TEST_F(RocksLoaderTest, WriteOverwrites) {
    auto loader = db_->open_loader("scope");
    loader->write("k", "first");
    loader->write("k", "second");
    EXPECT_EQ(loader->read("k"), "second");
}

TEST_F(RocksLoaderTest, EmptyAndBinaryPayloadsArePreserved) {
    auto loader = db_->open_loader("scope");
    const std::string bin("\x00\x01\xfe", 3);
    loader->write("empty", "");
    loader->write("bin", bin);
    EXPECT_EQ(loader->read("empty"), "");
    EXPECT_EQ(loader->read("bin"), bin);
}

TEST_F(RocksLoaderTest, ListIsInKeyOrder) {
    auto loader = db_->open_loader("scope");
    loader->write("c", "3");
    loader->write("a", "1");
    loader->write("b", "2");
    EXPECT_EQ(loader->list(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(RocksLoaderTest, MissingKeysAreNotFound) {
    auto loader = db_->open_loader("scope");
    try {
        (void)loader->read("absent");
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.name(), "absent");
    }
    EXPECT_THROW(loader->del("absent"), NotFoundError);
}

TEST_F(RocksLoaderTest, DeleteRemovesKey) {
    auto loader = db_->open_loader("scope");
    loader->write("k", "v");
    loader->del("k");
    EXPECT_THROW((void)loader->read("k"), NotFoundError);
    EXPECT_TRUE(loader->list().empty());
}

TEST_F(RocksLoaderTest, ScopesAreIsolated) {
    auto a = db_->open_loader("app/a");
    auto b = db_->open_loader("app/b");
    a->write("shared", "from a");
    b->write("shared", "from b");
    EXPECT_EQ(a->read("shared"), "from a");
    EXPECT_EQ(b->read("shared"), "from b");
    a->del("shared");
    EXPECT_EQ(b->read("shared"), "from b");
}

TEST_F(RocksLoaderTest, LoaderKeepsDatabaseAlive) {
    auto loader = db_->open_loader("scope");
    db_.reset();
    loader->write("k", "still open");
    EXPECT_EQ(loader->read("k"), "still open");
}

TEST_F(RocksLoaderTest, LocationNamesPathAndScope) {
    EXPECT_EQ(db_->open_loader("x/y")->location(), "rocksdb " + path_.string() + " [x/y]");
}

// ── Stores ────────────────────────────────────────────────────────────────────

TEST_F(RocksLoaderTest, JsonStoreUsesEncodedKeyWithExtension) {
    auto store = db_->open_store("myapp", {"testns"});
    store->marshal(key("a/b"), nlohmann::json{{"x", 1}});

    EXPECT_EQ(db_->open_loader("myapp/testns")->list(),
              std::vector<std::string>{"a%2Fb.json"});

    nlohmann::json out;
    auto found = store->unmarshal(key("a/b"), out);
    EXPECT_EQ(found, key("a/b"));
    EXPECT_EQ(out["x"], 1);
}

TEST_F(RocksLoaderTest, MultiStoreFindsAnyFormat) {
    auto loader = db_->open_loader("myapp");
    loader->write("theme.yaml", "color: blue\n");

    auto store = db_->open_multi_store("myapp");
    nlohmann::json out;
    auto found = store->unmarshal(key("theme"), out);
    EXPECT_EQ(found, format_key("theme", marshal::yaml()));
    EXPECT_EQ(out["color"], "blue");
}

TEST_F(RocksLoaderTest, DataSurvivesReopen) {
    db_->open_store("myapp")->marshal(key("k"), nlohmann::json(42));
    reopen();
    nlohmann::json out;
    db_->open_store("myapp")->unmarshal(key("k"), out);
    EXPECT_EQ(out, 42);
}

// ── Concurrency ───────────────────────────────────────────────────────────────

TEST_F(RocksLoaderTest, ConcurrentScopesOpenAndWrite) {
    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            auto loader = db_->open_loader("scope/" + std::to_string(t % 3));
            for (int i = 0; i < 50; ++i) {
                loader->write("t" + std::to_string(t) + "-" + std::to_string(i), "v");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::size_t total = 0;
    for (int s = 0; s < 3; ++s) {
        total += db_->open_loader("scope/" + std::to_string(s))->list().size();
    }
    EXPECT_EQ(total, static_cast<std::size_t>(kThreads * 50));
}

} // namespace cfgstore::storage
