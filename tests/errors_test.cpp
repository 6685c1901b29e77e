#include "common/errors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <system_error>
#include <vector>

namespace cfgstore {

// ── NotFoundError ─────────────────────────────────────────────────────────────

TEST(ErrorsTest, NotFoundCarriesName) {
    NotFoundError e("config.toml");
    EXPECT_EQ(e.name(), "config.toml");
    EXPECT_STREQ(e.what(), "'config.toml' does not exist");
}

TEST(ErrorsTest, AllErrorsDeriveFromStoreError) {
    EXPECT_THROW(throw NotFoundError("x"), StoreError);
    EXPECT_THROW(throw UsageError("x"), StoreError);
    EXPECT_THROW(throw SerializationError("x"), StoreError);
    EXPECT_THROW(throw BackendError("x"), StoreError);
    EXPECT_THROW(throw MultiError({BackendError("x")}), StoreError);
}

// ── BackendError ──────────────────────────────────────────────────────────────

TEST(ErrorsTest, BackendErrorAppendsErrorCodeMessage) {
    auto ec = std::make_error_code(std::errc::permission_denied);
    BackendError e("cannot open file", ec);
    EXPECT_EQ(e.code(), ec);
    EXPECT_FALSE(e.busy());
    EXPECT_EQ(std::string(e.what()), "cannot open file: " + ec.message());
}

TEST(ErrorsTest, BackendErrorWithoutCodeKeepsMessage) {
    BackendError e("database is locked", {}, true);
    EXPECT_FALSE(e.code());
    EXPECT_TRUE(e.busy());
    EXPECT_STREQ(e.what(), "database is locked");
}

TEST(ErrorsTest, WrapPrefixesContextAndKeepsCodeAndBusy) {
    auto ec = std::make_error_code(std::errc::io_error);
    BackendError inner("read failed", ec, true);
    auto outer = inner.wrap("could not delete a.json");
    EXPECT_EQ(outer.code(), ec);
    EXPECT_TRUE(outer.busy());
    EXPECT_EQ(std::string(outer.what()),
              "could not delete a.json: " + std::string(inner.what()));
}

// ── MultiError ────────────────────────────────────────────────────────────────

TEST(ErrorsTest, MultiErrorWithOneErrorUsesItsMessage) {
    MultiError e({BackendError("only one")});
    ASSERT_EQ(e.errors().size(), 1u);
    EXPECT_STREQ(e.what(), "only one");
}

TEST(ErrorsTest, MultiErrorListsEveryMessage) {
    MultiError e({BackendError("first"), BackendError("second")});
    ASSERT_EQ(e.errors().size(), 2u);
    EXPECT_STREQ(e.what(), "2 errors:\n  - first\n  - second");
    EXPECT_STREQ(e.errors()[1].what(), "second");
}

} // namespace cfgstore
