#include "config/scope.hpp"

#include "common/errors.hpp"

#include <cstdlib>

namespace cfgstore {

std::string store_scope(const std::string& app,
                        const std::vector<std::string>& namespaces) {
    std::string scope = app;
    for (const auto& ns : namespaces) {
        scope += '/';
        scope += ns;
    }
    return scope;
}

std::filesystem::path user_config_root() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return xdg;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config";
    }
    throw UsageError("cannot determine the user config directory: neither "
                     "XDG_CONFIG_HOME nor HOME is set");
}

std::filesystem::path default_config_dir(const std::string& app,
                                         const std::vector<std::string>& namespaces) {
    auto dir = user_config_root() / app;
    for (const auto& ns : namespaces) {
        dir /= ns;
    }
    return dir;
}

} // namespace cfgstore
