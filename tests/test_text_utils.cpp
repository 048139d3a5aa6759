#include <gtest/gtest.h>
#include "utils/text_utils.h"
#include "utils/crypto_utils.h"

using namespace shroud::utils;

TEST(TextUtilsTest, AsciiLowerKeepsByteLength) {
    const std::string s = "HeLLo \xC3\x89T\xC3\x89";  // "HeLLo ÉTÉ"
    std::string lowered = asciiLower(s);
    EXPECT_EQ(lowered.size(), s.size());
    EXPECT_EQ(lowered, "hello \xC3\x89t\xC3\x89");
}

TEST(TextUtilsTest, TrimAndBlank) {
    EXPECT_EQ(trim("  padded\t\n"), "padded");
    EXPECT_EQ(trim(""), "");
    EXPECT_TRUE(isBlank(""));
    EXPECT_TRUE(isBlank(" \t\r\n"));
    EXPECT_FALSE(isBlank(" x "));
}

TEST(TextUtilsTest, StartsWith) {
    EXPECT_TRUE(startsWith("B-EMAIL", "B-"));
    EXPECT_FALSE(startsWith("B", "B-"));
    EXPECT_TRUE(startsWith("anything", ""));
}

TEST(TextUtilsTest, Utf8Offsets) {
    const std::string s = "h\xC3\xA9llo";  // "héllo"
    EXPECT_EQ(utf8Length(s), 5u);
    EXPECT_EQ(utf8ByteOffset(s, 0), 0u);
    EXPECT_EQ(utf8ByteOffset(s, 2), 3u);
    EXPECT_EQ(utf8ByteOffset(s, 5), s.size());
    EXPECT_EQ(utf8ByteOffset(s, 50), s.size());
}

TEST(CryptoUtilsTest, HmacSha256KnownVector) {
    EXPECT_EQ(hmacSha256Hex("Jefe", "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(CryptoUtilsTest, Base64) {
    EXPECT_EQ(toBase64("hello"), "aGVsbG8=");
    EXPECT_EQ(toBase64(""), "");
}
