#pragma once

#include "marshal/marshaller.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace cfgstore {

// ── Descriptor ───────────────────────────────────────────────────────────────
//
// Names a document inside a Store.  Two variants:
//   Key        – bare logical name, the store picks the format.
//   FormatKey  – logical name plus an explicit marshaller.
//
// A default-constructed Descriptor is empty (the "no descriptor" value);
// every Store operation rejects it with UsageError.
//
// key() is always the logical name, never suffixed with an extension.

class Descriptor {
public:
    enum class Kind : uint8_t {
        None      = 0,
        Key       = 1,
        FormatKey = 2,
    };

    Descriptor() = default;

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    // Marshaller of a FormatKey; nullptr for Key and empty descriptors.
    [[nodiscard]] const marshal::MarshallerPtr& format() const noexcept { return format_; }

    explicit operator bool() const noexcept { return kind_ != Kind::None; }

    // "name" for a Key, "name [json]" for a FormatKey, "<none>" when empty.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Descriptor& a, const Descriptor& b) {
        return a.kind_ == b.kind_ && a.key_ == b.key_ && a.format_ == b.format_;
    }

    friend Descriptor key(std::string name);
    friend Descriptor format_key(std::string name, marshal::MarshallerPtr format);

private:
    Descriptor(Kind kind, std::string name, marshal::MarshallerPtr format)
        : kind_(kind), key_(std::move(name)), format_(std::move(format)) {}

    Kind kind_ = Kind::None;
    std::string key_;
    marshal::MarshallerPtr format_;
};

// Bare key; the store resolves the format.
Descriptor key(std::string name);

// Key pinned to one format.
Descriptor format_key(std::string name, marshal::MarshallerPtr format);

} // namespace cfgstore
