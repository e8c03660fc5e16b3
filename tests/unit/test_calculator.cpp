/// @file test_calculator.cpp
/// @brief Tests for batch amounts, adjustments and water volume

#include <gtest/gtest.h>
#include <formulary/calculator/DosageCalculator.hpp>
#include <formulary/util/Constants.hpp>
#include <map>

using namespace Formulary;

// ============================================================================
// Recommendation and water
// ============================================================================

TEST(DosageCalculatorTest, RecommendDosesAboveTarget) {
    auto rec = DosageCalculator::recommendDoses(120.0, 15);
    EXPECT_TRUE(rec.second);
    EXPECT_DOUBLE_EQ(rec.first, 12.5);
}

TEST(DosageCalculatorTest, RecommendDosesRoundsToOneDecimal) {
    // 10 * 100 / 130 = 7.6923...
    auto rec = DosageCalculator::recommendDoses(130.0, 10);
    EXPECT_TRUE(rec.second);
    EXPECT_DOUBLE_EQ(rec.first, 7.7);
}

TEST(DosageCalculatorTest, NoRecommendationAtOrBelowTarget) {
    EXPECT_FALSE(DosageCalculator::recommendDoses(100.0, 15).second);
    EXPECT_FALSE(DosageCalculator::recommendDoses(42.0, 15).second);
    EXPECT_FALSE(DosageCalculator::recommendDoses(0.0, 15).second);
}

TEST(DosageCalculatorTest, WaterVolume) {
    EXPECT_EQ(DosageCalculator::waterVolumeMl(1500.0, 100, 30), 5200);
    EXPECT_EQ(DosageCalculator::waterVolumeMl(0.0, 100, 0), 400);
    // 255 * 1.2 + 120 * 31 + 300 = 4326
    EXPECT_EQ(DosageCalculator::waterVolumeMl(255.0, 120, 30), 4326);
}

// ============================================================================
// Adjustment parsing
// ============================================================================

TEST(DosageCalculatorTest, ParseAdjustmentsSignsAndFractions) {
    auto adj = DosageCalculator::parseAdjustments("+감초3 -대추2.5 생강4");

    ASSERT_EQ(adj.size(), 3u);
    EXPECT_EQ(adj[0].herbName, "감초");
    EXPECT_DOUBLE_EQ(adj[0].amount, 3.0);
    EXPECT_TRUE(adj[0].isAdd);
    EXPECT_EQ(adj[1].herbName, "대추");
    EXPECT_DOUBLE_EQ(adj[1].amount, 2.5);
    EXPECT_FALSE(adj[1].isAdd);
    EXPECT_EQ(adj[2].herbName, "생강");
    EXPECT_DOUBLE_EQ(adj[2].amount, 4.0);
    EXPECT_TRUE(adj[2].isAdd);
}

TEST(DosageCalculatorTest, ParseAdjustmentsWithoutSeparators) {
    auto adj = DosageCalculator::parseAdjustments("감초3-대추2");

    ASSERT_EQ(adj.size(), 2u);
    EXPECT_EQ(adj[0].herbName, "감초");
    EXPECT_TRUE(adj[0].isAdd);
    EXPECT_EQ(adj[1].herbName, "대추");
    EXPECT_FALSE(adj[1].isAdd);
}

TEST(DosageCalculatorTest, ParseAdjustmentsIgnoresMalformedText) {
    EXPECT_TRUE(DosageCalculator::parseAdjustments("").empty());
    EXPECT_TRUE(DosageCalculator::parseAdjustments("   ").empty());
    EXPECT_TRUE(DosageCalculator::parseAdjustments("감초 +3 abc12").empty());

    auto adj = DosageCalculator::parseAdjustments("note: 감초 x, 대추5g");
    ASSERT_EQ(adj.size(), 1u);
    EXPECT_EQ(adj[0].herbName, "대추");
    EXPECT_DOUBLE_EQ(adj[0].amount, 5.0);
}

// ============================================================================
// Batch amounts and adjustments
// ============================================================================

TEST(DosageCalculatorTest, BatchAmountsRoundHalfAway) {
    auto amounts = DosageCalculator::batchAmounts({{"시호", 6.5}, {"황련", 0.1}}, 15.0);

    ASSERT_EQ(amounts.size(), 2u);
    EXPECT_DOUBLE_EQ(amounts[0].second, 98.0);   // 97.5
    EXPECT_DOUBLE_EQ(amounts[1].second, 2.0);    // 1.5
}

TEST(DosageCalculatorTest, ApplyAdjustmentsInOrder) {
    std::vector<std::pair<std::string, double>> amounts = {{"감초", 30.0}, {"반하", 150.0}};

    DosageCalculator::applyAdjustments(amounts, {
        {"감초", 30.0, false},    // removed at zero
        {"감초", 5.0, true},      // re-introduced
        {"반하", 200.0, false},   // removed below zero
        {"대추", 3.0, false},     // unknown herb, ignored
    });

    ASSERT_EQ(amounts.size(), 1u);
    EXPECT_EQ(amounts[0].first, "감초");
    EXPECT_DOUBLE_EQ(amounts[0].second, 5.0);
}

TEST(DosageCalculatorTest, ComputeFinalFullPipeline) {
    std::vector<MergedHerb> merged = {{"반하", 10.0}, {"시호", 6.5}, {"감초", 2.0}};
    std::map<std::string, int> ids = {{"반하", 3}, {"시호", 1}, {"감초", 7}};

    DosingParameters dosing;
    dosing.totalDoses = 15.0;
    dosing.days = 15;
    dosing.dosesPerDay = 2;
    dosing.packVolumeMl = 100;

    auto result = DosageCalculator::computeFinal(
        merged, dosing, "-감초30 +대추5 +반하2",
        [&ids](const std::string& name) {
            auto it = ids.find(name);
            return it == ids.end() ? -1 : it->second;
        });

    ASSERT_EQ(result.finalHerbs.size(), 3u);
    EXPECT_EQ(result.finalHerbs[0].herbName, "시호");
    EXPECT_EQ(result.finalHerbs[0].herbId, 1);
    EXPECT_DOUBLE_EQ(result.finalHerbs[0].amount, 98.0);
    EXPECT_EQ(result.finalHerbs[1].herbName, "반하");
    EXPECT_EQ(result.finalHerbs[1].herbId, 3);
    EXPECT_DOUBLE_EQ(result.finalHerbs[1].amount, 152.0);
    EXPECT_EQ(result.finalHerbs[2].herbName, "대추");
    EXPECT_EQ(result.finalHerbs[2].herbId, Constants::kUnknownHerbId);
    EXPECT_DOUBLE_EQ(result.finalHerbs[2].amount, 5.0);

    const auto& q = result.quantities;
    EXPECT_DOUBLE_EQ(q.totalPerDoseWeight, 18.5);
    EXPECT_DOUBLE_EQ(q.totalBatchWeight, 255.0);
    EXPECT_EQ(q.totalPacks, 30);
    EXPECT_EQ(q.waterVolumeMl, 3706);
    EXPECT_FALSE(q.hasRecommendedDoses);
}

TEST(DosageCalculatorTest, ComputeFinalWithoutMergedHerbs) {
    DosingParameters dosing;
    auto result = DosageCalculator::computeFinal({}, dosing, "+감초3", nullptr);

    ASSERT_EQ(result.finalHerbs.size(), 1u);
    EXPECT_EQ(result.finalHerbs[0].herbId, Constants::kUnknownHerbId);
    EXPECT_DOUBLE_EQ(result.quantities.totalPerDoseWeight, 0.0);
    EXPECT_DOUBLE_EQ(result.quantities.totalBatchWeight, 3.0);
    EXPECT_EQ(result.quantities.totalPacks, 30);
}

TEST(DosageCalculatorTest, ComputeFinalRecommendsForHeavyFormula) {
    DosingParameters dosing;
    dosing.days = 15;
    auto result = DosageCalculator::computeFinal({{"석고", 80.0}, {"지모", 40.0}},
                                                 dosing, "", nullptr);

    EXPECT_TRUE(result.quantities.hasRecommendedDoses);
    EXPECT_DOUBLE_EQ(result.quantities.recommendedDoses, 12.5);
}
