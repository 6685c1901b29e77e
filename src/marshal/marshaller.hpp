#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace cfgstore::marshal {

// ── Marshaller ───────────────────────────────────────────────────────────────
//
// A serialization format: a stateless encode/decode pair over the in-memory
// document model (nlohmann::json) plus the canonical file extension used to
// name entries and to recognise existing ones.
//
// Both directions throw cfgstore::SerializationError on failure.

class Marshaller {
public:
    virtual ~Marshaller() = default;

    // Format name as accepted on the command line ("toml", "json", ...).
    [[nodiscard]] virtual std::string_view name() const = 0;

    // File extension, without the leading dot.
    [[nodiscard]] virtual std::string_view extension() const = 0;

    [[nodiscard]] virtual std::string marshal(const nlohmann::json& value) const = 0;
    [[nodiscard]] virtual nlohmann::json unmarshal(std::string_view data) const = 0;
};

using MarshallerPtr = std::shared_ptr<const Marshaller>;
using MarshallerList = std::vector<MarshallerPtr>;

// Process-wide immutable instances.  Identity comparison is meaningful:
// toml() == toml() always holds.
[[nodiscard]] MarshallerPtr toml();
[[nodiscard]] MarshallerPtr json();
[[nodiscard]] MarshallerPtr yaml();
[[nodiscard]] MarshallerPtr msgpack();

// All known formats in preference order: toml, json, yaml, msgpack.
// Returned by value; callers may reorder or trim their copy freely.
[[nodiscard]] MarshallerList known();

// Returns the marshaller in `list` whose extension terminates `path`
// (as ".<ext>"), or nullptr when no extension matches.
[[nodiscard]] MarshallerPtr by_file_extension(const MarshallerList& list,
                                              std::string_view path);

// Returns the known marshaller called `name`, or nullptr.
[[nodiscard]] MarshallerPtr by_name(std::string_view name);

// Comma-separated names of the known formats, for help and error text.
[[nodiscard]] std::string known_names();

} // namespace cfgstore::marshal
