/// @file test_utf8.cpp
/// @brief Unit tests for the UTF-8 helpers behind \uXXXX escapes.

#include <treedit/treedit.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace treedit;
namespace utf8 = treedit::detail::utf8;

// ═══════════════════════════════════════════════════════════════════════════════
// Encoding
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Utf8, EncodeLengths) {
    char buf[4];
    EXPECT_EQ(utf8::encode(0x41, buf), 1u);
    EXPECT_EQ(utf8::encode(0xE9, buf), 2u);
    EXPECT_EQ(utf8::encode(0x20AC, buf), 3u);
    EXPECT_EQ(utf8::encode(0x1F600, buf), 4u);
    EXPECT_EQ(utf8::encode(0x110000, buf), 0u);
}

TEST(Utf8, EncodeBytes) {
    char buf[4];
    const unsigned n = utf8::encode(0x20AC, buf);
    EXPECT_EQ(std::string(buf, n), "\xE2\x82\xAC");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Decoding
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Utf8, DecodeAdvancesPastSequence) {
    const std::string s = "\xF0\x9F\x98\x80" "a";
    const char* p = s.data();
    EXPECT_EQ(utf8::decode(p, s.data() + s.size()), 0x1F600u);
    EXPECT_EQ(p, s.data() + 4);
    EXPECT_EQ(utf8::decode(p, s.data() + s.size()), static_cast<uint32_t>('a'));
}

TEST(Utf8, MalformedYieldsReplacementAndProgresses) {
    const std::string s = "\xC3" "A";
    const char* p = s.data();
    EXPECT_EQ(utf8::decode(p, s.data() + s.size()), 0xFFFDu);
    EXPECT_EQ(p, s.data() + 1);
}

TEST(Utf8, TruncatedSequence) {
    const std::string s = "\xE2\x82";
    const char* p = s.data();
    EXPECT_EQ(utf8::decode(p, s.data() + s.size()), 0xFFFDu);
    EXPECT_EQ(p, s.data() + 1);
}

TEST(Utf8, ParserAndPrinterAgree) {
    SerializeOptions ascii = SerializeOptions::compact();
    ascii.ensure_ascii = true;
    const Node original("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
    const std::string text = print(original, ascii);
    EXPECT_EQ(text, "\"caf\\u00e9 \\u20ac \\ud83d\\ude00\"");
    EXPECT_EQ(parse(text), original);
}
