#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cfgstore {

// ── Loader ───────────────────────────────────────────────────────────────────
//
// Raw byte storage for one scope of one backend (a directory, a SQLite
// scope, a RocksDB column family).  Names are opaque: encoding and format
// extensions are the Store's business.
//
// Error contract, identical for every backend:
//   - read() / del() of an absent name throw NotFoundError.
//   - every other failure throws BackendError carrying the backend context.
//
// Loaders do not lock anything themselves; concurrency guarantees are those
// of the underlying medium.

class Loader {
public:
    virtual ~Loader() = default;

    // Returns all stored names (order is backend-specific).
    [[nodiscard]] virtual std::vector<std::string> list() const = 0;

    // Returns the full payload stored under `name`.
    [[nodiscard]] virtual std::string read(const std::string& name) const = 0;

    // Creates or fully replaces `name`.
    virtual void write(const std::string& name, std::string_view data) = 0;

    // Removes `name`.
    virtual void del(const std::string& name) = 0;

    // Human-readable backend + scope, used to enrich error messages.
    [[nodiscard]] virtual std::string location() const = 0;
};

} // namespace cfgstore
