#include <gtest/gtest.h>
#include "common/charset.hpp"

using namespace neolan;

TEST(CharsetTest, AsciiPassesThroughBothCharsets) {
    EXPECT_TRUE(charset::is_ascii("hello, world"));
    EXPECT_FALSE(charset::is_ascii("h\xC3\xA9llo"));

    EXPECT_EQ(*charset::decode("plain", Charset::Legacy), "plain");
    EXPECT_EQ(*charset::encode("plain", Charset::Legacy), "plain");
    EXPECT_EQ(*charset::decode("plain", Charset::Utf8), "plain");
}

TEST(CharsetTest, Utf8Validation) {
    EXPECT_TRUE(charset::is_valid_utf8("中文"));
    EXPECT_FALSE(charset::is_valid_utf8("\xC4\xE3\xBA"));
    EXPECT_EQ(charset::decode("\xC4\xE3\xBA", Charset::Utf8).error(), ErrorCode::CHARSET_ERROR);
}

TEST(CharsetTest, LegacyDecodeGbk) {
    auto text = charset::decode("\xD6\xD0\xCE\xC4", Charset::Legacy);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "中文");
}

TEST(CharsetTest, LegacyEncodeGbk) {
    auto bytes = charset::encode("中文", Charset::Legacy);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, "\xD6\xD0\xCE\xC4");
}

TEST(CharsetTest, LegacyEncodeRejectsUnrepresentable) {
    // GBK 没有 emoji
    EXPECT_EQ(charset::encode("\xF0\x9F\x98\x80", Charset::Legacy).error(), ErrorCode::CHARSET_ERROR);
}

TEST(CharsetTest, EncodeRejectsInvalidUtf8Input) {
    EXPECT_EQ(charset::encode("\xFF", Charset::Utf8).error(), ErrorCode::CHARSET_ERROR);
}

TEST(CharsetTest, Names) {
    EXPECT_STREQ(charset_name(Charset::Utf8), "UTF-8");
    EXPECT_STREQ(charset_name(Charset::Legacy), "GBK");
}
