#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace cfgstore {

// ── KeyCodec ─────────────────────────────────────────────────────────────────
//
// Maps logical keys to names that are safe to use as file names or database
// identifiers, and back.  Implementations must be stateless and satisfy
// decode(encode(k)) == k for every k.

class KeyCodec {
public:
    virtual ~KeyCodec() = default;

    [[nodiscard]] virtual std::string encode(std::string_view key) const = 0;
    [[nodiscard]] virtual std::string decode(std::string_view name) const = 0;
};

// Escapes '/', '%' and NUL as %XX.  Everything else passes through.
class DefaultKeyCodec final : public KeyCodec {
public:
    [[nodiscard]] std::string encode(std::string_view key) const override;
    [[nodiscard]] std::string decode(std::string_view name) const override;
};

// Leaves names untouched.
class IdentityKeyCodec final : public KeyCodec {
public:
    [[nodiscard]] std::string encode(std::string_view key) const override {
        return std::string(key);
    }
    [[nodiscard]] std::string decode(std::string_view name) const override {
        return std::string(name);
    }
};

// Shared immutable instances.
[[nodiscard]] std::shared_ptr<const KeyCodec> default_key_codec();
[[nodiscard]] std::shared_ptr<const KeyCodec> identity_key_codec();

// Encodes only '/', '%', and NUL bytes using uppercase %XX escapes.
[[nodiscard]] std::string encode_key(std::string_view key);

// Decodes any %XX sequence (hex digits of either case).  Invalid or truncated
// escapes are copied through unchanged; never fails.
[[nodiscard]] std::string decode_key(std::string_view encoded);

} // namespace cfgstore
