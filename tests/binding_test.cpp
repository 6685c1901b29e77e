#include "config/binding.hpp"
#include "config/multi_format.hpp"
#include "config/simple_store.hpp"
#include "marshal/marshaller.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>

namespace cfgstore {

using testing::MemoryData;
using testing::MemoryLoader;

TEST(StoreBindingTest, MarshalsAndUnmarshalsOneKey) {
    auto data = std::make_shared<MemoryData>();
    SimpleStore store(std::make_unique<MemoryLoader>(data), marshal::json());
    StoreBinding binding(store, "limits");
    EXPECT_EQ(binding.key(), "limits");

    std::map<std::string, int> limits{{"cpu", 4}, {"mem", 512}};
    binding.marshal(limits);
    EXPECT_EQ(data->entries.count("limits.json"), 1u);

    std::map<std::string, int> out;
    binding.unmarshal(out);
    EXPECT_EQ(out, limits);
}

TEST(StoreBindingTest, MissingKeyIsNotFound) {
    MultiFormat store(std::make_unique<MemoryLoader>());
    StoreBinding binding(store, "absent");
    int out = 0;
    EXPECT_THROW(binding.unmarshal(out), NotFoundError);
}

TEST(StoreBindingTest, UsesPreferredFormatOfMultiStore) {
    auto data = std::make_shared<MemoryData>();
    MultiFormat store(std::make_unique<MemoryLoader>(data));
    StoreBinding binding(store, "settings");

    binding.marshal(nlohmann::json{{"theme", "dark"}});
    EXPECT_EQ(data->entries.count("settings.toml"), 1u);

    nlohmann::json out;
    binding.unmarshal(out);
    EXPECT_EQ(out["theme"], "dark");
}

} // namespace cfgstore
