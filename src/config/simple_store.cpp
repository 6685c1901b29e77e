#include "config/simple_store.hpp"

#include "common/errors.hpp"

#include <format>
#include <utility>

namespace cfgstore {

SimpleStore::SimpleStore(std::unique_ptr<Loader> loader,
                         marshal::MarshallerPtr marshaller,
                         StoreOptions options)
    : loader_(std::move(loader)),
      marshaller_(std::move(marshaller)),
      options_(std::move(options)) {
    if (!loader_ || !marshaller_) {
        throw UsageError("SimpleStore requires a loader and a marshaller");
    }
    if (!options_.key_codec) {
        options_.key_codec = default_key_codec();
    }
}

std::string SimpleStore::path_for_key(const std::string& key) const {
    auto name = options_.key_codec->encode(key);
    if (options_.append_extension) {
        name += '.';
        name += marshaller_->extension();
    }
    return name;
}

const std::string& SimpleStore::check(const Descriptor& desc, const char* op) const {
    if (!desc) {
        throw UsageError(std::format(
            "API usage error - SimpleStore::{} must be passed a non-empty descriptor", op));
    }
    if (desc.kind() == Descriptor::Kind::FormatKey &&
        (!desc.format() || desc.format()->name() != marshaller_->name())) {
        throw UsageError(std::format(
            "API usage error - SimpleStore::{} on a {} store got descriptor {}",
            op, marshaller_->name(), desc.to_string()));
    }
    return desc.key();
}

std::vector<Descriptor> SimpleStore::list() const {
    const auto names = loader_->list();
    const std::string suffix = std::string(".") + std::string(marshaller_->extension());

    std::vector<Descriptor> descs;
    descs.reserve(names.size());
    for (const auto& name : names) {
        std::string_view stem{name};
        // Names written by other tools may lack the suffix; keep them whole.
        if (options_.append_extension && stem.size() >= suffix.size() &&
            stem.substr(stem.size() - suffix.size()) == suffix) {
            stem.remove_suffix(suffix.size());
        }
        descs.push_back(key(options_.key_codec->decode(stem)));
    }
    return descs;
}

void SimpleStore::marshal(const Descriptor& desc, const nlohmann::json& value) {
    const auto& k = check(desc, "marshal");
    const auto name = path_for_key(k);

    std::string data;
    try {
        data = marshaller_->marshal(value);
    } catch (const SerializationError& e) {
        throw SerializationError(std::format("{}: {}: {}", loader_->location(), name, e.what()));
    }
    loader_->write(name, data);
}

Descriptor SimpleStore::unmarshal(const Descriptor& desc, nlohmann::json& value) const {
    const auto& k = check(desc, "unmarshal");
    const auto name = path_for_key(k);

    const auto data = loader_->read(name);
    if (data.empty()) {
        return key(k);
    }
    try {
        value = marshaller_->unmarshal(data);
    } catch (const SerializationError& e) {
        throw SerializationError(std::format("{}: {}: {}", loader_->location(), name, e.what()));
    }
    return key(k);
}

void SimpleStore::del(const Descriptor& desc) {
    const auto& k = check(desc, "del");
    loader_->del(path_for_key(k));
}

} // namespace cfgstore
