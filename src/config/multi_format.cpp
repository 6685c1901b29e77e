#include "config/multi_format.hpp"

#include "common/errors.hpp"

#include <exception>
#include <format>
#include <utility>

namespace cfgstore {

MultiFormat::MultiFormat(std::unique_ptr<Loader> loader,
                         marshal::MarshallerList marshallers,
                         StoreOptions options)
    : loader_(std::move(loader)),
      marshallers_(std::move(marshallers)),
      options_(std::move(options)) {
    if (!loader_) {
        throw UsageError("MultiFormat requires a loader");
    }
    if (marshallers_.empty()) {
        marshallers_ = marshal::known();
    }
    for (const auto& m : marshallers_) {
        if (!m) {
            throw UsageError("MultiFormat marshaller list contains a null entry");
        }
    }
    if (!options_.key_codec) {
        options_.key_codec = default_key_codec();
    }
}

std::string MultiFormat::path_for_key(const std::string& key,
                                      const marshal::MarshallerPtr& m) const {
    auto name = options_.key_codec->encode(key);
    name += '.';
    name += m->extension();
    return name;
}

void MultiFormat::check(const Descriptor& desc, const char* op) const {
    switch (desc.kind()) {
    case Descriptor::Kind::Key:
        return;
    case Descriptor::Kind::FormatKey:
        if (desc.format()) {
            return;
        }
        throw UsageError(std::format(
            "API usage error - MultiFormat::{} passed a format key without a format: {}",
            op, desc.key()));
    case Descriptor::Kind::None:
        break;
    }
    throw UsageError(std::format(
        "API usage error - MultiFormat::{} must be passed a non-empty descriptor", op));
}

std::vector<Descriptor> MultiFormat::list() const {
    const auto names = loader_->list();

    std::vector<Descriptor> descs;
    descs.reserve(names.size());
    for (const auto& name : names) {
        auto m = marshal::by_file_extension(marshallers_, name);
        if (!m) {
            // Not one of ours: expose the decoded full name as a bare key.
            descs.push_back(key(options_.key_codec->decode(name)));
            continue;
        }
        std::string_view stem{name};
        stem.remove_suffix(m->extension().size() + 1);
        descs.push_back(format_key(options_.key_codec->decode(stem), std::move(m)));
    }
    return descs;
}

void MultiFormat::marshal(const Descriptor& desc, const nlohmann::json& value) {
    check(desc, "marshal");
    const auto& m = desc.kind() == Descriptor::Kind::FormatKey ? desc.format()
                                                                : marshallers_.front();
    const auto name = path_for_key(desc.key(), m);

    std::string data;
    try {
        data = m->marshal(value);
    } catch (const SerializationError& e) {
        throw SerializationError(std::format("{}: {}: {}", loader_->location(), name, e.what()));
    }
    loader_->write(name, data);
}

Descriptor MultiFormat::load(const std::string& k, const marshal::MarshallerPtr& m,
                             nlohmann::json& value) const {
    const auto name = path_for_key(k, m);
    const auto data = loader_->read(name);
    if (!data.empty()) {
        try {
            value = m->unmarshal(data);
        } catch (const SerializationError& e) {
            throw SerializationError(std::format("{}: {}: {}", loader_->location(), name, e.what()));
        }
    }
    return format_key(k, m);
}

Descriptor MultiFormat::unmarshal(const Descriptor& desc, nlohmann::json& value) const {
    check(desc, "unmarshal");
    if (desc.kind() == Descriptor::Kind::FormatKey) {
        return load(desc.key(), desc.format(), value);
    }

    // Later formats are tried after any failure. When nothing loads, the last
    // failure other than a missing entry is reported.
    std::exception_ptr failure;
    for (const auto& m : marshallers_) {
        try {
            return load(desc.key(), m, value);
        } catch (const NotFoundError&) {
            continue;
        } catch (const StoreError&) {
            failure = std::current_exception();
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    throw NotFoundError(desc.key());
}

void MultiFormat::del(const Descriptor& desc) {
    check(desc, "del");
    if (desc.kind() == Descriptor::Kind::FormatKey) {
        loader_->del(path_for_key(desc.key(), desc.format()));
        return;
    }

    std::size_t nonexisting = 0;
    std::vector<BackendError> errors;
    for (const auto& m : marshallers_) {
        const auto name = path_for_key(desc.key(), m);
        try {
            loader_->del(name);
        } catch (const NotFoundError&) {
            ++nonexisting;
        } catch (const BackendError& e) {
            errors.push_back(e.wrap(std::format("could not delete {}", name)));
        }
    }

    if (errors.size() == 1) {
        throw errors.front();
    }
    if (!errors.empty()) {
        throw MultiError(std::move(errors));
    }
    if (nonexisting == marshallers_.size()) {
        throw NotFoundError(desc.key());
    }
}

} // namespace cfgstore
