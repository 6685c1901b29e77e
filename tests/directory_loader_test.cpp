#include "config/multi_format.hpp"
#include "config/scope.hpp"
#include "config/simple_store.hpp"
#include "marshal/marshaller.hpp"
#include "storage/directory_loader.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace cfgstore::storage {

namespace fs = std::filesystem;

// ── Fixture ─────────────────────────────────────────────────────────────────
// Fresh temporary root per test; loader_ points at <root>/app/ns.

class DirectoryLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        loader_ = open_dir(tmp_.path(), {"app", "ns"});
    }

    std::vector<std::string> sorted_list() const {
        auto names = loader_->list();
        std::sort(names.begin(), names.end());
        return names;
    }

    testing::TempDir tmp_{"dir"};
    std::unique_ptr<DirectoryLoader> loader_;
};

// ── Construction ──────────────────────────────────────────────────────────────

TEST_F(DirectoryLoaderTest, OpenDirCreatesNestedDirectories) {
    EXPECT_TRUE(fs::is_directory(tmp_.path() / "app" / "ns"));
    EXPECT_EQ(loader_->dir(), tmp_.path() / "app" / "ns");
    EXPECT_EQ(loader_->location(), "directory " + (tmp_.path() / "app" / "ns").string());
}

TEST_F(DirectoryLoaderTest, OpenFailsWhenPathIsAFile) {
    std::ofstream(tmp_.path() / "file") << "x";
    EXPECT_THROW(open_dir(tmp_.path() / "file", {"sub"}), BackendError);
}

TEST_F(DirectoryLoaderTest, OpenHomeDirUsesXdgConfigHome) {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = old ? old : "";
    ::setenv("XDG_CONFIG_HOME", tmp_.path().c_str(), 1);

    auto loader = open_home_dir("myapp", {"a", "b"});
    EXPECT_EQ(loader->dir(), tmp_.path() / "myapp" / "a" / "b");
    EXPECT_TRUE(fs::is_directory(loader->dir()));

    if (old) {
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }
}

TEST_F(DirectoryLoaderTest, ScopeHelpersJoinAppAndNamespaces) {
    EXPECT_EQ(store_scope("myapp", {}), "myapp");
    EXPECT_EQ(store_scope("myapp", {"ui", "colors"}), "myapp/ui/colors");

    const char* old_xdg = std::getenv("XDG_CONFIG_HOME");
    const std::string saved_xdg = old_xdg ? old_xdg : "";
    const char* old_home = std::getenv("HOME");
    const std::string saved_home = old_home ? old_home : "";

    ::setenv("XDG_CONFIG_HOME", tmp_.path().c_str(), 1);
    EXPECT_EQ(user_config_root(), tmp_.path());
    EXPECT_EQ(default_config_dir("myapp", {"ns"}), tmp_.path() / "myapp" / "ns");

    ::unsetenv("XDG_CONFIG_HOME");
    ::setenv("HOME", tmp_.path().c_str(), 1);
    EXPECT_EQ(user_config_root(), tmp_.path() / ".config");

    ::unsetenv("HOME");
    EXPECT_THROW((void)user_config_root(), UsageError);

    if (old_home) {
        ::setenv("HOME", saved_home.c_str(), 1);
    }
    if (old_xdg) {
        ::setenv("XDG_CONFIG_HOME", saved_xdg.c_str(), 1);
    }
}

// ── write / read ──────────────────────────────────────────────────────────────

TEST_F(DirectoryLoaderTest, WriteThenReadReturnsBytes) {
    loader_->write("config.toml", "a = 1\n");
    EXPECT_EQ(loader_->read("config.toml"), "a = 1\n");
    EXPECT_TRUE(fs::is_regular_file(loader_->dir() / "config.toml"));
}

TEST_F(DirectoryLoaderTest, WriteOverwrites) {
    loader_->write("k", "first");
    loader_->write("k", "second");
    EXPECT_EQ(loader_->read("k"), "second");
}

TEST_F(DirectoryLoaderTest, EmptyPayloadIsStored) {
    loader_->write("empty", "");
    EXPECT_EQ(loader_->read("empty"), "");
}

TEST_F(DirectoryLoaderTest, BinaryPayloadIsPreserved) {
    const std::string data("\x00\x01\xff\n\r", 5);
    loader_->write("bin", data);
    EXPECT_EQ(loader_->read("bin"), data);
}

TEST_F(DirectoryLoaderTest, ReadMissingIsNotFound) {
    try {
        (void)loader_->read("absent");
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.name(), "absent");
    }
}

TEST_F(DirectoryLoaderTest, WriteLeavesNoTemporaryFiles) {
    for (int i = 0; i < 10; ++i) {
        loader_->write("k", std::to_string(i));
    }
    std::size_t files = 0;
    for (const auto& entry : fs::directory_iterator(loader_->dir())) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(DirectoryLoaderTest, InvalidNamesAreUsageErrors) {
    EXPECT_THROW(loader_->write("", "x"), UsageError);
    EXPECT_THROW(loader_->write(".", "x"), UsageError);
    EXPECT_THROW(loader_->write("..", "x"), UsageError);
    EXPECT_THROW(loader_->write("a/b", "x"), UsageError);
    EXPECT_THROW((void)loader_->read(std::string("a\0b", 3)), UsageError);
}

// ── list ──────────────────────────────────────────────────────────────────────

TEST_F(DirectoryLoaderTest, ListReturnsRegularFilesOnly) {
    loader_->write("b.json", "{}");
    loader_->write("a.toml", "");
    fs::create_directory(loader_->dir() / "subdir");
    std::ofstream(loader_->dir() / ".cfgstore-tmp-1-1") << "partial";

    EXPECT_EQ(sorted_list(), (std::vector<std::string>{"a.toml", "b.json"}));
}

TEST_F(DirectoryLoaderTest, ListOfEmptyDirectoryIsEmpty) {
    EXPECT_TRUE(loader_->list().empty());
}

// ── del ───────────────────────────────────────────────────────────────────────

TEST_F(DirectoryLoaderTest, DeleteRemovesFile) {
    loader_->write("k", "v");
    loader_->del("k");
    EXPECT_FALSE(fs::exists(loader_->dir() / "k"));
    EXPECT_THROW((void)loader_->read("k"), NotFoundError);
}

TEST_F(DirectoryLoaderTest, DeleteMissingIsNotFound) {
    EXPECT_THROW(loader_->del("absent"), NotFoundError);
}

// ── Scopes ────────────────────────────────────────────────────────────────────

TEST_F(DirectoryLoaderTest, ScopesAreIsolated) {
    auto other = open_dir(tmp_.path(), {"app", "other"});
    loader_->write("shared", "mine");
    other->write("shared", "theirs");

    EXPECT_EQ(loader_->read("shared"), "mine");
    EXPECT_EQ(other->read("shared"), "theirs");
    other->del("shared");
    EXPECT_EQ(loader_->read("shared"), "mine");
}

// ── Concurrency ───────────────────────────────────────────────────────────────

TEST_F(DirectoryLoaderTest, ConcurrentWritersLeaveOneCompleteValue) {
    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 20; ++i) {
                loader_->write("race", std::string(1000, static_cast<char>('a' + t)));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    auto value = loader_->read("race");
    ASSERT_EQ(value.size(), 1000u);
    EXPECT_EQ(std::count(value.begin(), value.end(), value[0]), 1000);
    EXPECT_EQ(loader_->list(), std::vector<std::string>{"race"});
}

// ── Stores over directories ───────────────────────────────────────────────────

TEST_F(DirectoryLoaderTest, SimpleStoreWritesTomlFiles) {
    SimpleStore store(open_dir(tmp_.path(), {"app", "ns"}), marshal::toml());
    store.marshal(key("server/main"), nlohmann::json{{"port", 80}});

    EXPECT_TRUE(fs::exists(loader_->dir() / "server%2Fmain.toml"));
    nlohmann::json out;
    store.unmarshal(key("server/main"), out);
    EXPECT_EQ(out["port"], 80);
}

TEST_F(DirectoryLoaderTest, SimpleStoreEncodesSlashAndPercentOnDisk) {
    SimpleStore store(open_dir(tmp_.path(), {"app", "ns"}), marshal::toml());
    const nlohmann::json doc{{"v", "x"}};
    store.marshal(key("a/b%"), doc);

    EXPECT_TRUE(fs::is_regular_file(loader_->dir() / "a%2Fb%25.toml"));
    nlohmann::json out;
    store.unmarshal(key("a/b%"), out);
    EXPECT_EQ(out, doc);
    EXPECT_EQ(store.list(), std::vector<Descriptor>{key("a/b%")});
}

TEST_F(DirectoryLoaderTest, MultiFormatReadsFileWrittenByHand) {
    std::ofstream(loader_->dir() / "handmade.yaml") << "name: hand\n";
    MultiFormat store(open_dir(tmp_.path(), {"app", "ns"}));

    nlohmann::json out;
    auto found = store.unmarshal(key("handmade"), out);
    EXPECT_EQ(found, format_key("handmade", marshal::yaml()));
    EXPECT_EQ(out["name"], "hand");
}

} // namespace cfgstore::storage
