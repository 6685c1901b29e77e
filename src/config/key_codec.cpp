#include "config/key_codec.hpp"

namespace cfgstore {

namespace {

constexpr char to_hex(unsigned char v) {
    return static_cast<char>(v < 10 ? '0' + v : 'A' + (v - 10));
}

// Returns -1 for a non-hex character.
constexpr int from_hex(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string encode_key(std::string_view key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        switch (c) {
        case '/':
        case '%':
        case '\0': {
            const auto byte = static_cast<unsigned char>(c);
            out += '%';
            out += to_hex(byte >> 4);
            out += to_hex(byte & 0x0f);
            break;
        }
        default:
            out += c;
        }
    }
    return out;
}

std::string decode_key(std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%' || i + 2 >= encoded.size()) {
            out += encoded[i];
            continue;
        }
        const int hi = from_hex(encoded[i + 1]);
        const int lo = from_hex(encoded[i + 2]);
        if (hi < 0 || lo < 0) {
            out += encoded[i];
            continue;
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

std::string DefaultKeyCodec::encode(std::string_view key) const {
    return encode_key(key);
}

std::string DefaultKeyCodec::decode(std::string_view name) const {
    return decode_key(name);
}

std::shared_ptr<const KeyCodec> default_key_codec() {
    static const auto codec = std::make_shared<const DefaultKeyCodec>();
    return codec;
}

std::shared_ptr<const KeyCodec> identity_key_codec() {
    static const auto codec = std::make_shared<const IdentityKeyCodec>();
    return codec;
}

} // namespace cfgstore
