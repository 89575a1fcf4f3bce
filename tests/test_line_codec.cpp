#include <gtest/gtest.h>

#include "codec/line_codec.h"

TEST(LineCodec, EncodeAppendsDelimiter) {
    EXPECT_EQ(LineCodec::encode("hello"), "hello\n");
    EXPECT_EQ(LineCodec::encode(""), "\n");
}

TEST(LineCodec, EncodeEscapesControlCharacters) {
    EXPECT_EQ(LineCodec::encode("a\nb"), "a\\nb\n");
    EXPECT_EQ(LineCodec::encode("a\rb"), "a\\rb\n");
    EXPECT_EQ(LineCodec::encode("C:\\tmp"), "C:\\\\tmp\n");
}

TEST(LineCodec, DecodePlainLine) {
    auto msg = LineCodec::decode("hello world");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, "hello world");
}

TEST(LineCodec, DecodeDropsTrailingCarriageReturn) {
    auto msg = LineCodec::decode("ping\r");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, "ping");
}

TEST(LineCodec, PayloadsWithSpecialCharactersSurvive) {
    for (std::string payload : {"multi\nline\ntext", "trailing cr\r", "back\\slash\\",
                                "\\n is not a newline", "", "unicode: h\xc3\xa9llo"}) {
        std::string frame = LineCodec::encode(payload);
        ASSERT_EQ(frame.back(), '\n');
        EXPECT_EQ(frame.find('\n'), frame.size() - 1) << payload;

        auto decoded = LineCodec::decode(std::string_view(frame).substr(0, frame.size() - 1));
        ASSERT_TRUE(decoded.has_value()) << payload;
        EXPECT_EQ(*decoded, payload);
    }
}

TEST(LineCodec, RejectsUnknownEscape) {
    EXPECT_FALSE(LineCodec::decode("tab\\there").has_value());
}

TEST(LineCodec, RejectsDanglingBackslash) {
    EXPECT_FALSE(LineCodec::decode("oops\\").has_value());
    EXPECT_FALSE(LineCodec::decode("oops\\\r").has_value());
}
