#pragma once

#include "config/loader.hpp"
#include "config/store.hpp"

#include <memory>
#include <string>

namespace cfgstore {

// ── MultiFormat ──────────────────────────────────────────────────────────────
//
// Store that understands several formats at once.  The marshaller list is
// ordered: the first entry is the preferred format.
//
//   marshal(key(k))          writes the preferred format only; copies of k
//                            in other formats are left as they are.
//   marshal(format_key(k,m)) writes exactly format m.
//   unmarshal(key(k))        returns the first format, in list order, for
//                            which an entry exists.  An entry that exists but
//                            fails to read or decode is reported, not skipped.
//   list()                   one FormatKey per stored name; a key stored in
//                            three formats is listed three times.
//   del(format_key(k,m))     removes that entry only.
//   del(key(k))              removes k in every format.  NotFoundError only
//                            when no format existed; other failures are
//                            collected (MultiError when more than one).
//
// Example:
//
//   MultiFormat m(std::move(loader));
//   m.marshal(key("config"), doc);                      // config.toml
//   m.marshal(format_key("config", marshal::json()), doc); // config.json
//   m.unmarshal(key("config"), out);                    // reads config.toml

class MultiFormat final : public Store {
public:
    // An empty `marshallers` list selects marshal::known().
    // Throws UsageError when `loader` or any marshaller is null.
    explicit MultiFormat(std::unique_ptr<Loader> loader,
                         marshal::MarshallerList marshallers = {},
                         StoreOptions options = {});

    [[nodiscard]] std::vector<Descriptor> list() const override;
    void marshal(const Descriptor& desc, const nlohmann::json& value) override;
    Descriptor unmarshal(const Descriptor& desc, nlohmann::json& value) const override;
    void del(const Descriptor& desc) override;

    [[nodiscard]] const marshal::MarshallerList& marshallers() const noexcept { return marshallers_; }
    [[nodiscard]] Loader& loader() noexcept { return *loader_; }

    // encode(key) + "." + m->extension()
    [[nodiscard]] std::string path_for_key(const std::string& key,
                                           const marshal::MarshallerPtr& m) const;

private:
    void check(const Descriptor& desc, const char* op) const;

    Descriptor load(const std::string& key, const marshal::MarshallerPtr& m,
                    nlohmann::json& value) const;

    std::unique_ptr<Loader> loader_;
    marshal::MarshallerList marshallers_;
    StoreOptions options_;
};

} // namespace cfgstore
