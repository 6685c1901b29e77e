#include "marshal/marshaller.hpp"

#include "common/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <memory>
#include <string>

namespace cfgstore::marshal {

namespace {

// ── Scalar typing ────────────────────────────────────────────────────────────
//
// yaml-cpp hands back every scalar as text.  Plain (unquoted) scalars are
// typed following the YAML 1.2 core schema; quoted scalars are always strings.

bool is_null_scalar(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

bool parse_bool_scalar(const std::string& s, bool& out) {
    if (s == "true" || s == "True" || s == "TRUE") {
        out = true;
        return true;
    }
    if (s == "false" || s == "False" || s == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

nlohmann::json plain_scalar(const std::string& s) {
    if (is_null_scalar(s)) {
        return nullptr;
    }
    bool b = false;
    if (parse_bool_scalar(s, b)) {
        return b;
    }

    const bool numeric_start = (s[0] >= '0' && s[0] <= '9') ||
        ((s[0] == '-' || s[0] == '+' || s[0] == '.') && s.size() > 1);
    if (numeric_start) {
        const bool has_float_marker = s.find_first_of(".eE") != std::string::npos;
        if (!has_float_marker) {
            try {
                std::size_t pos = 0;
                if (s[0] == '-') {
                    const long long v = std::stoll(s, &pos, 10);
                    if (pos == s.size()) return static_cast<std::int64_t>(v);
                } else {
                    const unsigned long long v = std::stoull(s, &pos, 10);
                    if (pos == s.size()) return static_cast<std::uint64_t>(v);
                }
            } catch (const std::exception&) {
                // Out of range or not a number: fall through.
            }
        } else {
            try {
                std::size_t pos = 0;
                const double v = std::stod(s, &pos);
                if (pos == s.size()) return v;
            } catch (const std::exception&) {
            }
        }
    }

    if (s == ".inf" || s == ".Inf" || s == ".INF" || s == "+.inf") {
        return std::numeric_limits<double>::infinity();
    }
    if (s == "-.inf" || s == "-.Inf" || s == "-.INF") {
        return -std::numeric_limits<double>::infinity();
    }
    if (s == ".nan" || s == ".NaN" || s == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return s;
}

nlohmann::json to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return nullptr;
    case YAML::NodeType::Scalar:
        // Quoted scalars carry the non-specific "!" tag.
        if (node.Tag() == "!") {
            return node.Scalar();
        }
        return plain_scalar(node.Scalar());
    case YAML::NodeType::Sequence: {
        auto out = nlohmann::json::array();
        for (const auto& item : node) {
            out.push_back(to_json(item));
        }
        return out;
    }
    case YAML::NodeType::Map: {
        auto out = nlohmann::json::object();
        for (const auto& kv : node) {
            out[kv.first.as<std::string>()] = to_json(kv.second);
        }
        return out;
    }
    }
    return nullptr;
}

// ── Emission ─────────────────────────────────────────────────────────────────

void emit_string(YAML::Emitter& out, const std::string& s) {
    // Strings that would read back as another type must be quoted.
    if (!plain_scalar(s).is_string()) {
        out << YAML::DoubleQuoted << s;
    } else {
        out << s;
    }
}

void emit(YAML::Emitter& out, const nlohmann::json& value) {
    switch (value.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
        out << YAML::Null;
        break;
    case nlohmann::json::value_t::boolean:
        out << value.get<bool>();
        break;
    case nlohmann::json::value_t::number_integer:
        out << value.get<std::int64_t>();
        break;
    case nlohmann::json::value_t::number_unsigned:
        out << value.get<std::uint64_t>();
        break;
    case nlohmann::json::value_t::number_float: {
        const double d = value.get<double>();
        if (std::isnan(d)) {
            out << ".nan";
        } else if (std::isinf(d)) {
            out << (d > 0 ? ".inf" : "-.inf");
        } else {
            // Shortest round-trip spelling; whole numbers keep a ".0" so they
            // read back as floats.
            auto text = std::format("{}", d);
            if (text.find_first_of(".e") == std::string::npos) {
                text += ".0";
            }
            out << text;
        }
        break;
    }
    case nlohmann::json::value_t::string:
        emit_string(out, value.get_ref<const std::string&>());
        break;
    case nlohmann::json::value_t::array:
        out << YAML::BeginSeq;
        for (const auto& item : value) {
            emit(out, item);
        }
        out << YAML::EndSeq;
        break;
    case nlohmann::json::value_t::object:
        out << YAML::BeginMap;
        for (const auto& [k, v] : value.items()) {
            out << YAML::Key;
            emit_string(out, k);
            out << YAML::Value;
            emit(out, v);
        }
        out << YAML::EndMap;
        break;
    case nlohmann::json::value_t::binary:
        throw SerializationError("yaml: binary values are not supported");
    }
}

class YamlMarshaller final : public Marshaller {
public:
    std::string_view name() const override { return "yaml"; }
    std::string_view extension() const override { return "yaml"; }

    std::string marshal(const nlohmann::json& value) const override {
        YAML::Emitter out;
        emit(out, value);
        if (!out.good()) {
            throw SerializationError(std::format("yaml: {}", out.GetLastError()));
        }
        return std::string(out.c_str()) + '\n';
    }

    nlohmann::json unmarshal(std::string_view data) const override {
        try {
            return to_json(YAML::Load(std::string(data)));
        } catch (const YAML::Exception& e) {
            throw SerializationError(std::format("yaml: {}", e.what()));
        }
    }
};

} // anonymous namespace

MarshallerPtr yaml() {
    static const auto instance = std::make_shared<const YamlMarshaller>();
    return instance;
}

} // namespace cfgstore::marshal
