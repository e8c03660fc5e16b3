/// @file test_merger.cpp
/// @brief Tests for max-wins herb merging

#include <gtest/gtest.h>
#include <formulary/merger/HerbMerger.hpp>

using namespace Formulary;

namespace {

ResolvedTemplate makeTemplate(const std::string& name,
                              const std::vector<std::pair<std::string, double>>& herbs) {
    ResolvedTemplate tmpl;
    tmpl.name = name;
    for (const auto& herb : herbs) {
        tmpl.herbs.push_back({herb.first, herb.second, "g"});
    }
    return tmpl;
}

} // namespace

TEST(HerbMergerTest, EmptyInput) {
    EXPECT_TRUE(HerbMerger::merge({}).empty());
}

TEST(HerbMergerTest, SingleTemplateSortedByDosage) {
    auto tmpl = makeTemplate("소시호탕", {{"시호", 12.0}, {"황금", 6.0}, {"반하", 8.0}});
    auto merged = HerbMerger::merge({{&tmpl, 1.0}});

    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].herbName, "시호");
    EXPECT_EQ(merged[1].herbName, "반하");
    EXPECT_EQ(merged[2].herbName, "황금");
}

TEST(HerbMergerTest, SharedHerbKeepsLargestScaledDosage) {
    auto a = makeTemplate("갑", {{"감초", 4.0}, {"생강", 6.0}});
    auto b = makeTemplate("을", {{"감초", 3.0}});

    // 4 * 0.5 = 2 loses against 3 * 2 = 6; never summed
    auto merged = HerbMerger::merge({{&a, 0.5}, {&b, 2.0}});

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].herbName, "감초");
    EXPECT_DOUBLE_EQ(merged[0].dosage, 6.0);
    EXPECT_EQ(merged[1].herbName, "생강");
    EXPECT_DOUBLE_EQ(merged[1].dosage, 3.0);
}

TEST(HerbMergerTest, EqualDosagesKeepFirstOccurrenceOrder) {
    auto a = makeTemplate("갑", {{"대추", 4.0}, {"생강", 4.0}});
    auto b = makeTemplate("을", {{"감초", 4.0}, {"대추", 4.0}});

    auto merged = HerbMerger::merge({{&a, 1.0}, {&b, 1.0}});

    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].herbName, "대추");
    EXPECT_EQ(merged[1].herbName, "생강");
    EXPECT_EQ(merged[2].herbName, "감초");
}

TEST(HerbMergerTest, NullTemplateIsSkipped) {
    auto a = makeTemplate("갑", {{"감초", 2.0}});
    auto merged = HerbMerger::merge({{nullptr, 1.0}, {&a, 1.0}});

    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].herbName, "감초");
}
