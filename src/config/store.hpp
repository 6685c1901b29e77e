#pragma once

#include "common/errors.hpp"
#include "config/descriptor.hpp"
#include "config/key_codec.hpp"

#include <format>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cfgstore {

// ── Store ────────────────────────────────────────────────────────────────────
//
// Serialization-aware view of one scope.  Documents travel as
// nlohmann::json; the typed helpers below convert user types through
// nlohmann's to_json / from_json customization points.
//
// Errors (see common/errors.hpp):
//   NotFoundError       entry absent
//   UsageError          empty or malformed descriptor
//   SerializationError  payload cannot be encoded / decoded
//   BackendError        I/O or database failure

class Store {
public:
    virtual ~Store() = default;

    // One descriptor per stored entry.
    [[nodiscard]] virtual std::vector<Descriptor> list() const = 0;

    // Creates or overwrites the entry named by `desc`.
    virtual void marshal(const Descriptor& desc, const nlohmann::json& value) = 0;

    // Loads the entry named by `desc` into `value` and returns the descriptor
    // that was actually read.  A zero-length payload leaves `value` untouched.
    virtual Descriptor unmarshal(const Descriptor& desc, nlohmann::json& value) const = 0;

    // Removes the entry named by `desc`.
    virtual void del(const Descriptor& desc) = 0;
};

// Opens the store for `app` / `namespaces...`.
using Opener = std::function<std::unique_ptr<Store>(
    const std::string& app, const std::vector<std::string>& namespaces)>;

// Construction-time knobs shared by SimpleStore and MultiFormat.
struct StoreOptions {
    // Key <-> storage-name mapping.
    std::shared_ptr<const KeyCodec> key_codec = default_key_codec();

    // SimpleStore only: append ".<ext>" to stored names.
    bool append_extension = true;
};

// ── Typed helpers ────────────────────────────────────────────────────────────

template <typename T>
void marshal_value(Store& store, const Descriptor& desc, const T& value) {
    nlohmann::json doc;
    try {
        doc = value;
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::format("{}: {}", desc.to_string(), e.what()));
    }
    store.marshal(desc, doc);
}

// Leaves `value` unchanged when the stored payload is empty.
template <typename T>
Descriptor unmarshal_value(const Store& store, const Descriptor& desc, T& value) {
    nlohmann::json doc(nlohmann::json::value_t::discarded);
    auto found = store.unmarshal(desc, doc);
    if (doc.is_discarded()) {
        return found;
    }
    try {
        doc.get_to(value);
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::format("{}: {}", found.to_string(), e.what()));
    }
    return found;
}

} // namespace cfgstore
