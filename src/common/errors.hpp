#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace cfgstore {

// ── Error taxonomy ────────────────────────────────────────────────────────────
//
// Every failure surfaced by a Store, Loader, Factory or Tracer derives from
// StoreError.  Callers that only care about "missing vs. real failure" catch
// NotFoundError first; the concrete backend is never visible in the type.

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The entry is absent.  Raised identically by every backend.
class NotFoundError : public StoreError {
public:
    explicit NotFoundError(std::string name);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

// Programmer error: null descriptor, unknown backend/mode/format, ...
class UsageError : public StoreError {
public:
    using StoreError::StoreError;
};

// Payload could not be encoded or decoded in the selected format.
class SerializationError : public StoreError {
public:
    using StoreError::StoreError;
};

// Filesystem, SQLite or RocksDB failure.
class BackendError : public StoreError {
public:
    explicit BackendError(const std::string& what,
                          std::error_code ec = {},
                          bool busy = false);

    [[nodiscard]] std::error_code code() const noexcept { return code_; }

    // True when the backend reported lock contention (e.g. SQLITE_BUSY after
    // busy_timeout expired).  The library never retries on its own.
    [[nodiscard]] bool busy() const noexcept { return busy_; }

    // Same error (code and busy flag kept), message prefixed with `context`.
    [[nodiscard]] BackendError wrap(const std::string& context) const;

private:
    struct Raw {};
    BackendError(Raw, const std::string& message, std::error_code ec, bool busy);

    std::error_code code_;
    bool busy_;
};

// Several independent failures folded into one (MultiFormat::del).
class MultiError : public StoreError {
public:
    explicit MultiError(std::vector<BackendError> errors);

    [[nodiscard]] const std::vector<BackendError>& errors() const noexcept {
        return errors_;
    }

private:
    std::vector<BackendError> errors_;
};

} // namespace cfgstore
