#include "config/key_codec.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace cfgstore {

using namespace std::string_literals;

// ── encode_key ────────────────────────────────────────────────────────────────

TEST(KeyCodecTest, EncodeLeavesOrdinaryKeysAlone) {
    EXPECT_EQ(encode_key("config"), "config");
    EXPECT_EQ(encode_key("with space.and-dots_"), "with space.and-dots_");
    EXPECT_EQ(encode_key(""), "");
}

TEST(KeyCodecTest, EncodeEscapesSlashPercentAndNul) {
    EXPECT_EQ(encode_key("a/b"), "a%2Fb");
    EXPECT_EQ(encode_key("100%"), "100%25");
    EXPECT_EQ(encode_key("nul\0byte"s), "nul%00byte");
    EXPECT_EQ(encode_key("/%/"), "%2F%25%2F");
}

TEST(KeyCodecTest, EncodePassesNonAsciiThrough) {
    EXPECT_EQ(encode_key("caf\xc3\xa9"), "caf\xc3\xa9");
}

// ── decode_key ────────────────────────────────────────────────────────────────

TEST(KeyCodecTest, DecodeAcceptsEitherCase) {
    EXPECT_EQ(decode_key("a%2Fb"), "a/b");
    EXPECT_EQ(decode_key("a%2fb"), "a/b");
    EXPECT_EQ(decode_key("%41%42"), "AB");
}

TEST(KeyCodecTest, DecodeCopiesInvalidEscapesThrough) {
    EXPECT_EQ(decode_key("%zz"), "%zz");
    EXPECT_EQ(decode_key("50%"), "50%");
    EXPECT_EQ(decode_key("%4"), "%4");
    EXPECT_EQ(decode_key("%%41"), "%A");
}

TEST(KeyCodecTest, DecodeInvertsEncode) {
    const std::vector<std::string> keys = {
        "plain", "a/b/c", "%41", "trailing%", "nul\0mid"s, "", "//", "x%2Fy",
    };
    for (const auto& k : keys) {
        EXPECT_EQ(decode_key(encode_key(k)), k) << "key: " << k;
    }
}

TEST(KeyCodecTest, DecodeInvertsEncodeForEveryByte) {
    for (int b = 0; b <= 0xff; ++b) {
        const std::string byte(1, static_cast<char>(b));
        const std::vector<std::string> keys = {
            byte,
            "a" + byte + "b",
            byte + byte + "%",
            "%" + byte + "/" + byte,
            "%4" + byte,
            byte + "%2F" + byte,
        };
        for (const auto& k : keys) {
            EXPECT_EQ(decode_key(encode_key(k)), k) << "byte: " << b;
        }
    }
    const std::string mixed = "\xff%\x00/"s + "\x80\xc3\xa9%25";
    EXPECT_EQ(decode_key(encode_key(mixed)), mixed);
}

TEST(KeyCodecTest, EncodedNamesHoldNoSlashOrNul) {
    std::string all;
    for (int b = 0; b <= 0xff; ++b) {
        all += static_cast<char>(b);
    }
    const auto name = encode_key(all);
    EXPECT_EQ(name.find('/'), std::string::npos);
    EXPECT_EQ(name.find('\0'), std::string::npos);
    EXPECT_EQ(decode_key(name), all);
}

// ── KeyCodec implementations ──────────────────────────────────────────────────

TEST(KeyCodecTest, DefaultCodecUsesEscaping) {
    auto codec = default_key_codec();
    EXPECT_EQ(codec->encode("a/b"), "a%2Fb");
    EXPECT_EQ(codec->decode("a%2Fb"), "a/b");
}

TEST(KeyCodecTest, IdentityCodecLeavesNamesUntouched) {
    auto codec = identity_key_codec();
    EXPECT_EQ(codec->encode("a/b%"), "a/b%");
    EXPECT_EQ(codec->decode("a%2Fb"), "a%2Fb");
}

TEST(KeyCodecTest, SharedInstancesAreStable) {
    EXPECT_EQ(default_key_codec(), default_key_codec());
    EXPECT_EQ(identity_key_codec(), identity_key_codec());
}

} // namespace cfgstore
