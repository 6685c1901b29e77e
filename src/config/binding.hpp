#pragma once

#include "config/store.hpp"

#include <string>
#include <utility>

namespace cfgstore {

// ── StoreBinding ─────────────────────────────────────────────────────────────
//
// Ties one key of a store to a typed value, for code that keeps a single
// document (e.g. "settings") and never needs to list.

class StoreBinding {
public:
    StoreBinding(Store& store, std::string key)
        : store_(store), key_(std::move(key)) {}

    template <typename T>
    void marshal(const T& value) {
        marshal_value(store_, cfgstore::key(key_), value);
    }

    template <typename T>
    void unmarshal(T& value) const {
        unmarshal_value(store_, cfgstore::key(key_), value);
    }

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    Store& store_;
    std::string key_;
};

} // namespace cfgstore
