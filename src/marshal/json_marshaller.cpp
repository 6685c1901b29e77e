#include "marshal/marshaller.hpp"

#include "common/errors.hpp"

#include <format>
#include <memory>

namespace cfgstore::marshal {

namespace {

// Pretty-printed JSON, one trailing newline, so that files stay diffable.
class JsonMarshaller final : public Marshaller {
public:
    std::string_view name() const override { return "json"; }
    std::string_view extension() const override { return "json"; }

    std::string marshal(const nlohmann::json& value) const override {
        try {
            return value.dump(2) + '\n';
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError(std::format("json: {}", e.what()));
        }
    }

    nlohmann::json unmarshal(std::string_view data) const override {
        try {
            return nlohmann::json::parse(data.begin(), data.end());
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError(std::format("json: {}", e.what()));
        }
    }
};

// MessagePack: the compact binary format.
class MsgpackMarshaller final : public Marshaller {
public:
    std::string_view name() const override { return "msgpack"; }
    std::string_view extension() const override { return "msgpack"; }

    std::string marshal(const nlohmann::json& value) const override {
        try {
            const auto bytes = nlohmann::json::to_msgpack(value);
            return std::string(bytes.begin(), bytes.end());
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError(std::format("msgpack: {}", e.what()));
        }
    }

    nlohmann::json unmarshal(std::string_view data) const override {
        try {
            return nlohmann::json::from_msgpack(data.begin(), data.end());
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError(std::format("msgpack: {}", e.what()));
        }
    }
};

} // anonymous namespace

MarshallerPtr json() {
    static const auto instance = std::make_shared<const JsonMarshaller>();
    return instance;
}

MarshallerPtr msgpack() {
    static const auto instance = std::make_shared<const MsgpackMarshaller>();
    return instance;
}

} // namespace cfgstore::marshal
