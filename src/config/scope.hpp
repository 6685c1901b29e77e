#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace cfgstore {

// "app/ns1/ns2": the scope string used as SQLite column value, RocksDB
// column family name and tracer store name.
[[nodiscard]] std::string store_scope(const std::string& app,
                                      const std::vector<std::string>& namespaces);

// Per-user configuration root: $XDG_CONFIG_HOME, else $HOME/.config.
// Throws UsageError when neither variable is set.
[[nodiscard]] std::filesystem::path user_config_root();

// <user_config_root>/<app>/<ns...>
[[nodiscard]] std::filesystem::path default_config_dir(
    const std::string& app, const std::vector<std::string>& namespaces);

} // namespace cfgstore
