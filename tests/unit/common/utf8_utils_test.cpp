#include <gtest/gtest.h>

#include <exflow/common/utf8_utils.h>

using namespace exflow::common;

TEST(Utf8UtilsTest, AsciiAndMultiByteTextIsValid) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("def handler():\n    pass\n"));
    EXPECT_TRUE(isValidUtf8("caf\xC3\xA9"));          // é
    EXPECT_TRUE(isValidUtf8("\xE2\x9C\x93 ok"));      // ✓
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x98\x80 end")); // U+1F600
}

TEST(Utf8UtilsTest, ReportsOffsetOfFirstInvalidByte) {
    EXPECT_EQ(findInvalidUtf8("abc\xFF"), std::optional<size_t>(3));
    EXPECT_EQ(findInvalidUtf8("\x80"), std::optional<size_t>(0));
    // Truncated 2-byte sequence at the end.
    EXPECT_EQ(findInvalidUtf8("ok\xC3"), std::optional<size_t>(2));
    // Latin-1 e-acute followed by ASCII.
    EXPECT_EQ(findInvalidUtf8("caf\xE9!"), std::optional<size_t>(3));
}

TEST(Utf8UtilsTest, RejectsOverlongSurrogateAndOutOfRangeForms) {
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));         // overlong '/'
    EXPECT_FALSE(isValidUtf8("\xE0\x80\xAF"));     // overlong 3-byte
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));     // U+D800
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80")); // above U+10FFFF
    EXPECT_FALSE(isValidUtf8("\xF5\x80\x80\x80"));
}

TEST(Utf8UtilsTest, SanitizeReplacesInvalidBytes) {
    EXPECT_EQ(sanitizeUtf8("plain"), "plain");
    EXPECT_EQ(sanitizeUtf8("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(sanitizeUtf8("a\xFF" "b"), "a?b");
    EXPECT_EQ(sanitizeUtf8("x\xC3"), "x?");
}
