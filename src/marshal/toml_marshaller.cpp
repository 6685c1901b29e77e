#include "marshal/marshaller.hpp"

#include "common/errors.hpp"

#include <toml++/toml.h>

#include <cstdint>
#include <format>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace cfgstore::marshal {

namespace {

// ── TOML -> JSON ─────────────────────────────────────────────────────────────
//
// Tables map to objects and arrays to arrays.  Date and time literals have no
// JSON counterpart and are read as their TOML spelling.

template <typename T>
std::string spelled(const T& value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

nlohmann::json to_json(const ::toml::node& node) {
    switch (node.type()) {
    case ::toml::node_type::table: {
        auto out = nlohmann::json::object();
        for (auto&& [k, v] : *node.as_table()) {
            out[std::string(k.str())] = to_json(v);
        }
        return out;
    }
    case ::toml::node_type::array: {
        auto out = nlohmann::json::array();
        for (auto&& item : *node.as_array()) {
            out.push_back(to_json(item));
        }
        return out;
    }
    case ::toml::node_type::string:
        return node.as_string()->get();
    case ::toml::node_type::integer:
        return node.as_integer()->get();
    case ::toml::node_type::floating_point:
        return node.as_floating_point()->get();
    case ::toml::node_type::boolean:
        return node.as_boolean()->get();
    case ::toml::node_type::date:
        return spelled(node.as_date()->get());
    case ::toml::node_type::time:
        return spelled(node.as_time()->get());
    case ::toml::node_type::date_time:
        return spelled(node.as_date_time()->get());
    case ::toml::node_type::none:
        break;
    }
    return nullptr;
}

// ── JSON -> TOML ─────────────────────────────────────────────────────────────
//
// TOML has no null: null members of a table are dropped, null array elements
// are an error.  Integers must fit in a signed 64-bit value.

::toml::table to_table(const nlohmann::json& object);
::toml::array to_array(const nlohmann::json& array);

// Converts one non-null value and hands it to `add`.
template <typename Add>
void put(const nlohmann::json& value, Add&& add) {
    switch (value.type()) {
    case nlohmann::json::value_t::object:
        add(to_table(value));
        break;
    case nlohmann::json::value_t::array:
        add(to_array(value));
        break;
    case nlohmann::json::value_t::string:
        add(value.get<std::string>());
        break;
    case nlohmann::json::value_t::boolean:
        add(value.get<bool>());
        break;
    case nlohmann::json::value_t::number_integer:
        add(value.get<std::int64_t>());
        break;
    case nlohmann::json::value_t::number_unsigned: {
        const auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw SerializationError(std::format("toml: integer {} does not fit in 64 bits", u));
        }
        add(static_cast<std::int64_t>(u));
        break;
    }
    case nlohmann::json::value_t::number_float:
        add(value.get<double>());
        break;
    case nlohmann::json::value_t::binary:
        throw SerializationError("toml: binary values are not supported");
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
        break;
    }
}

::toml::table to_table(const nlohmann::json& object) {
    ::toml::table out;
    for (const auto& [k, v] : object.items()) {
        if (v.is_null()) {
            continue;
        }
        put(v, [&](auto&& x) { out.insert_or_assign(k, std::forward<decltype(x)>(x)); });
    }
    return out;
}

::toml::array to_array(const nlohmann::json& array) {
    ::toml::array out;
    for (const auto& item : array) {
        if (item.is_null()) {
            throw SerializationError("toml: arrays cannot hold null");
        }
        put(item, [&](auto&& x) { out.push_back(std::forward<decltype(x)>(x)); });
    }
    return out;
}

class TomlMarshaller final : public Marshaller {
public:
    std::string_view name() const override { return "toml"; }
    std::string_view extension() const override { return "toml"; }

    std::string marshal(const nlohmann::json& value) const override {
        if (!value.is_object()) {
            throw SerializationError(
                std::format("toml: document root must be a table, not {}", value.type_name()));
        }
        std::ostringstream os;
        os << to_table(value);
        std::string text = os.str();
        if (!text.empty() && text.back() != '\n') {
            text += '\n';
        }
        return text;
    }

    nlohmann::json unmarshal(std::string_view data) const override {
        try {
            const ::toml::table doc = ::toml::parse(data);
            return to_json(doc);
        } catch (const ::toml::parse_error& e) {
            throw SerializationError(std::format("toml: {} (line {})",
                                                 e.description(), e.source().begin.line));
        }
    }
};

} // anonymous namespace

MarshallerPtr toml() {
    static const auto instance = std::make_shared<const TomlMarshaller>();
    return instance;
}

} // namespace cfgstore::marshal
