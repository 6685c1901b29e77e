#include "config/descriptor.hpp"

#include <format>
#include <utility>

namespace cfgstore {

std::string Descriptor::to_string() const {
    switch (kind_) {
    case Kind::None:
        return "<none>";
    case Kind::Key:
        return key_;
    case Kind::FormatKey:
        return std::format("{} [{}]", key_, format_ ? format_->name() : std::string_view("?"));
    }
    return key_;
}

Descriptor key(std::string name) {
    return Descriptor(Descriptor::Kind::Key, std::move(name), nullptr);
}

Descriptor format_key(std::string name, marshal::MarshallerPtr format) {
    return Descriptor(Descriptor::Kind::FormatKey, std::move(name), std::move(format));
}

} // namespace cfgstore
