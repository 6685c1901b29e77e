#pragma once

#include "config/loader.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cfgstore::storage {

// ── DirectoryLoader ──────────────────────────────────────────────────────────
//
// One file per entry, directly under a scope directory:
//
//   <root>/<app>/<ns...>/<name>
//
// write() goes through a temporary file in the same directory followed by
// rename(), so readers observe either the old or the new content.  There is
// no locking: concurrent writers of one name race and the last rename wins.

class DirectoryLoader final : public Loader {
public:
    // Uses `dir` as the scope directory, creating it if needed.
    // Throws BackendError if the directory cannot be created.
    explicit DirectoryLoader(std::filesystem::path dir);

    [[nodiscard]] std::vector<std::string> list() const override;
    [[nodiscard]] std::string read(const std::string& name) const override;
    void write(const std::string& name, std::string_view data) override;
    void del(const std::string& name) override;
    [[nodiscard]] std::string location() const override;

    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

private:
    std::filesystem::path path_for(const std::string& name) const;

    std::filesystem::path dir_;
};

// <base>/<sub...>
[[nodiscard]] std::unique_ptr<DirectoryLoader> open_dir(
    const std::filesystem::path& base, const std::vector<std::string>& sub = {});

// <user config dir>/<app>/<namespaces...>
[[nodiscard]] std::unique_ptr<DirectoryLoader> open_home_dir(
    const std::string& app, const std::vector<std::string>& namespaces = {});

} // namespace cfgstore::storage
