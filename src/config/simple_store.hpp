#pragma once

#include "config/loader.hpp"
#include "config/store.hpp"

#include <memory>
#include <string>

namespace cfgstore {

// ── SimpleStore ──────────────────────────────────────────────────────────────
//
// Single-format store: every entry is written and read with one marshaller.
// Stored name = codec.encode(key) + "." + extension (the suffix can be turned
// off through StoreOptions::append_extension).

class SimpleStore final : public Store {
public:
    // Throws UsageError when `loader` or `marshaller` is null.
    SimpleStore(std::unique_ptr<Loader> loader,
                marshal::MarshallerPtr marshaller,
                StoreOptions options = {});

    [[nodiscard]] std::vector<Descriptor> list() const override;
    void marshal(const Descriptor& desc, const nlohmann::json& value) override;
    Descriptor unmarshal(const Descriptor& desc, nlohmann::json& value) const override;
    void del(const Descriptor& desc) override;

    [[nodiscard]] const marshal::MarshallerPtr& marshaller() const noexcept { return marshaller_; }
    [[nodiscard]] Loader& loader() noexcept { return *loader_; }

    // Storage name for `key`.
    [[nodiscard]] std::string path_for_key(const std::string& key) const;

private:
    // Validates `desc` for operation `op`; returns the logical key.
    const std::string& check(const Descriptor& desc, const char* op) const;

    std::unique_ptr<Loader> loader_;
    marshal::MarshallerPtr marshaller_;
    StoreOptions options_;
};

} // namespace cfgstore
