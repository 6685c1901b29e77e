#include "storage/directory_loader.hpp"

#include "common/errors.hpp"
#include "config/scope.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <format>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace cfgstore::storage {

namespace fs = std::filesystem;

namespace {

// In-flight writes; never reported by list().
constexpr std::string_view kTempPrefix = ".cfgstore-tmp-";

std::error_code last_error() {
    return {errno, std::system_category()};
}

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const char* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Read the whole file behind fd.
[[nodiscard]] std::error_code read_all(int fd, std::string& out) {
    char buf[8192];
    for (;;) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        if (n == 0) {
            return {};
        }
        out.append(buf, static_cast<std::size_t>(n));
    }
}

std::string temp_name() {
    static std::atomic<uint64_t> counter{0};
    return std::format("{}{}-{}", kTempPrefix, ::getpid(), counter.fetch_add(1));
}

} // anonymous namespace

DirectoryLoader::DirectoryLoader(fs::path dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw BackendError(std::format("directory: cannot create {}", dir_.string()), ec);
    }
    spdlog::debug("directory: opened {}", dir_.string());
}

fs::path DirectoryLoader::path_for(const std::string& name) const {
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos || name.find('\0') != std::string::npos) {
        throw UsageError(std::format("directory: invalid entry name '{}'", name));
    }
    return dir_ / name;
}

std::string DirectoryLoader::location() const {
    return std::format("directory {}", dir_.string());
}

std::vector<std::string> DirectoryLoader::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        throw BackendError(std::format("directory: cannot list {}", dir_.string()), ec);
    }
    const auto end = fs::end(it);
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        auto name = it->path().filename().string();
        if (name.starts_with(kTempPrefix)) {
            continue;
        }
        names.push_back(std::move(name));
    }
    if (ec) {
        throw BackendError(std::format("directory: cannot list {}", dir_.string()), ec);
    }
    return names;
}

std::string DirectoryLoader::read(const std::string& name) const {
    const auto path = path_for(name);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const auto err = last_error();
        if (err.value() == ENOENT) {
            throw NotFoundError(name);
        }
        throw BackendError(std::format("directory: cannot open {}", path.string()), err);
    }

    std::string data;
    auto ec = read_all(fd, data);
    ::close(fd);
    if (ec) {
        throw BackendError(std::format("directory: cannot read {}", path.string()), ec);
    }
    return data;
}

void DirectoryLoader::write(const std::string& name, std::string_view data) {
    const auto path = path_for(name);
    const auto tmp_path = dir_ / temp_name();

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        const auto err = last_error();
        throw BackendError(std::format("directory: cannot create {}", tmp_path.string()), err);
    }

    auto ec = write_all(fd, data.data(), data.size());
    if (!ec && ::fsync(fd) < 0) {
        ec = last_error();
    }
    ::close(fd);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw BackendError(std::format("directory: cannot write {}", path.string()), ec);
    }

    // Rename .tmp → final path.
    std::error_code rename_ec;
    fs::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw BackendError(std::format("directory: cannot replace {}", path.string()),
                           rename_ec);
    }
}

void DirectoryLoader::del(const std::string& name) {
    const auto path = path_for(name);
    if (::unlink(path.c_str()) < 0) {
        const auto err = last_error();
        if (err.value() == ENOENT) {
            throw NotFoundError(name);
        }
        throw BackendError(std::format("directory: cannot remove {}", path.string()), err);
    }
}

std::unique_ptr<DirectoryLoader> open_dir(const fs::path& base,
                                          const std::vector<std::string>& sub) {
    auto dir = base;
    for (const auto& s : sub) {
        dir /= s;
    }
    return std::make_unique<DirectoryLoader>(std::move(dir));
}

std::unique_ptr<DirectoryLoader> open_home_dir(const std::string& app,
                                               const std::vector<std::string>& namespaces) {
    return std::make_unique<DirectoryLoader>(default_config_dir(app, namespaces));
}

} // namespace cfgstore::storage
