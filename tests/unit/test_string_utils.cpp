#include <gtest/gtest.h>
#include <formulary/util/StringUtils.hpp>

using namespace Formulary;

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  소시호 \t\r\n"), "소시호");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST(StringUtilsTest, TrimUnicodeSpaces) {
    EXPECT_EQ(StringUtils::trim("\u3000소시호\u00A0"), "소시호");
    EXPECT_EQ(StringUtils::trim("\u2003 \uFEFF"), "");
    EXPECT_EQ(StringUtils::trim("소\u3000시호"), "소\u3000시호");

    EXPECT_TRUE(StringUtils::isWhitespace(0x3000));
    EXPECT_TRUE(StringUtils::isWhitespace(0x00A0));
    EXPECT_TRUE(StringUtils::isWhitespace(0x200A));
    EXPECT_FALSE(StringUtils::isWhitespace(0x200B));
    EXPECT_FALSE(StringUtils::isWhitespace(0xAC00));
}

TEST(StringUtilsTest, SplitTrimmedDropsEmpty) {
    auto parts = StringUtils::splitTrimmed(" a + b ++ c +", '+');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "c");

    EXPECT_TRUE(StringUtils::splitTrimmed("", '+').empty());
}

TEST(StringUtilsTest, ParseLeadingNumber) {
    EXPECT_DOUBLE_EQ(StringUtils::parseLeadingNumber("12"), 12.0);
    EXPECT_DOUBLE_EQ(StringUtils::parseLeadingNumber(" 3.5g"), 3.5);
    EXPECT_DOUBLE_EQ(StringUtils::parseLeadingNumber(".5"), 0.5);
    EXPECT_DOUBLE_EQ(StringUtils::parseLeadingNumber("abc"), 0.0);
    EXPECT_DOUBLE_EQ(StringUtils::parseLeadingNumber(""), 0.0);
    EXPECT_DOUBLE_EQ(StringUtils::parseLeadingNumber("-"), 0.0);
}

TEST(StringUtilsTest, SplitMultiplier) {
    auto [name, multiplier] = StringUtils::splitMultiplier("소시호*0.5");
    EXPECT_EQ(name, "소시호");
    EXPECT_DOUBLE_EQ(multiplier, 0.5);

    auto trailingSpace = StringUtils::splitMultiplier("소시호 *2");
    EXPECT_EQ(trailingSpace.first, "소시호");
    EXPECT_DOUBLE_EQ(trailingSpace.second, 2.0);

    auto lastStar = StringUtils::splitMultiplier("a*2*3");
    EXPECT_EQ(lastStar.first, "a*2");
    EXPECT_DOUBLE_EQ(lastStar.second, 3.0);
}

TEST(StringUtilsTest, SplitMultiplierRejectsMalformedSuffix) {
    EXPECT_EQ(StringUtils::splitMultiplier("소시호*").first, "소시호*");
    EXPECT_EQ(StringUtils::splitMultiplier("*2").first, "*2");
    EXPECT_EQ(StringUtils::splitMultiplier("a*1.2.3").first, "a*1.2.3");
    EXPECT_EQ(StringUtils::splitMultiplier("a*2.").first, "a*2.");
    EXPECT_DOUBLE_EQ(StringUtils::splitMultiplier("a*x").second, 1.0);
}

TEST(StringUtilsTest, ZeroMultiplierFallsBackToOne) {
    auto result = StringUtils::splitMultiplier("소시호*0");
    EXPECT_EQ(result.first, "소시호");
    EXPECT_DOUBLE_EQ(result.second, 1.0);
}

TEST(StringUtilsTest, CodePoints) {
    EXPECT_EQ(StringUtils::codePointLength("소시호"), 3u);
    EXPECT_EQ(StringUtils::codePointLength("ab소"), 3u);
    EXPECT_EQ(StringUtils::codePointLength(""), 0u);

    std::size_t length = 0;
    unsigned int cp = StringUtils::decodeCodePoint("가", 0, length);
    EXPECT_EQ(cp, 0xAC00u);
    EXPECT_EQ(length, 3u);
    EXPECT_TRUE(StringUtils::isHangulSyllable(cp));
    EXPECT_FALSE(StringUtils::isHangulSyllable('a'));
}

TEST(StringUtilsTest, CaseHelpers) {
    EXPECT_EQ(StringUtils::toLower("ABC소시호"), "abc소시호");
    EXPECT_TRUE(StringUtils::startsWith("소시호탕", "소시호"));
    EXPECT_FALSE(StringUtils::startsWith("소시", "소시호"));
    EXPECT_TRUE(StringUtils::contains("반하사심탕", "사심"));
}
