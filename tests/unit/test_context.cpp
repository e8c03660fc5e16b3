#include <gtest/gtest.h>
#include <formulary/FormularyContext.hpp>
#include <formulary/Formulary.hpp>
#include <formulary/PrescriptionSession.hpp>
#include <formulary/util/ErrorCodes.hpp>

using namespace Formulary;

TEST(ContextTest, Creation) {
    FormularyContext ctx;

    EXPECT_NE(ctx.catalog, nullptr);
    EXPECT_NE(ctx.io, nullptr);
}

TEST(ContextTest, InitialState) {
    FormularyContext ctx;

    EXPECT_EQ(ctx.info(), 0);
    EXPECT_TRUE(ctx.isSuccess());
    EXPECT_FALSE(ctx.isCatalogLoaded());
}

TEST(ContextTest, DefaultDosing) {
    FormularyContext ctx;

    EXPECT_DOUBLE_EQ(ctx.io->dosing.totalDoses, 15.0);
    EXPECT_EQ(ctx.io->dosing.days, 15);
    EXPECT_EQ(ctx.io->dosing.dosesPerDay, 2);
    EXPECT_EQ(ctx.io->dosing.packVolumeMl, 100);
}

TEST(ContextTest, SetDosing) {
    PrescriptionSession session;
    session.setTotalDoses(12.5);
    session.setSchedule(10, 3);
    session.setPackVolume(120);

    auto& ctx = session.getContext();
    EXPECT_DOUBLE_EQ(ctx.io->dosing.totalDoses, 12.5);
    EXPECT_EQ(ctx.io->dosing.days, 10);
    EXPECT_EQ(ctx.io->dosing.dosesPerDay, 3);
    EXPECT_EQ(ctx.io->dosing.packVolumeMl, 120);
}

TEST(ContextTest, SetInfoFillsGenericMessage) {
    FormularyContext ctx;
    ctx.setInfo(ErrorCode::kCatalogNotLoaded, "");

    EXPECT_FALSE(ctx.isSuccess());
    EXPECT_EQ(ctx.io->errorMessage, "Formula catalog not loaded");
}

TEST(ContextTest, ResetPrescriptionKeepsInputs) {
    FormularyContext ctx;
    setFormula(ctx, "소시호");
    ctx.io->mergedHerbs.push_back({"시호", 12.0});
    ctx.setInfo(ErrorCode::kFormulaNotFound, "Formula not found: 소시호");

    ctx.resetPrescription();

    EXPECT_EQ(ctx.info(), 0);
    EXPECT_TRUE(ctx.io->errorMessage.empty());
    EXPECT_TRUE(ctx.io->mergedHerbs.empty());
    EXPECT_EQ(ctx.io->formulaText, "소시호");
}

TEST(ContextTest, ResetAll) {
    FormularyContext ctx;
    FormulaDefinition def;
    def.name = "소시호탕";
    def.composition = "시호:12";
    loadCatalog(ctx, {{1, "시호", "g"}}, {def});
    setFormula(ctx, "소시호");
    ASSERT_TRUE(ctx.isCatalogLoaded());

    ctx.resetAll();

    EXPECT_FALSE(ctx.isCatalogLoaded());
    EXPECT_TRUE(ctx.catalog->definitions.empty());
    EXPECT_EQ(ctx.catalog->getHerbId("시호"), -1);
    EXPECT_TRUE(ctx.io->formulaText.empty());
}

TEST(ContextTest, MoveKeepsState) {
    FormularyContext ctx;
    setFormula(ctx, "반하사심");

    FormularyContext moved(std::move(ctx));
    EXPECT_EQ(moved.io->formulaText, "반하사심");
}

TEST(ErrorCodeTest, Messages) {
    EXPECT_STREQ(ErrorCode::getMessage(0), "Success");
    EXPECT_STREQ(ErrorCode::getMessage(ErrorCode::kAmbiguousFormula),
                 "Multiple formulas matched");
    EXPECT_STREQ(ErrorCode::getMessage(ErrorCode::kFormulaNotFound),
                 "Formula not found");
    EXPECT_STREQ(ErrorCode::getMessage(-5), "Unknown error");
}

TEST(CatalogTest, DefinitionLookupPrefersName) {
    Catalog catalog;
    std::vector<FormulaDefinition> defs(2);
    defs[0].name = "갑";
    defs[0].alias = "을";
    defs[0].composition = "시호:1";
    defs[1].name = "을";
    defs[1].composition = "황금:1";
    catalog.setDefinitions(defs);

    ASSERT_NE(catalog.findDefinition("을"), nullptr);
    EXPECT_EQ(catalog.findDefinition("을")->name, "을");
    EXPECT_EQ(catalog.findDefinition("갑")->name, "갑");
    EXPECT_EQ(catalog.findDefinition("병"), nullptr);
}

TEST(CatalogTest, HerbIdLookup) {
    Catalog catalog;
    catalog.setHerbs({{3, "반하", "g"}, {7, "감초", "g"}});

    EXPECT_EQ(catalog.getHerbId("반하"), 3);
    EXPECT_EQ(catalog.getHerbId("감초"), 7);
    EXPECT_EQ(catalog.getHerbId("대추"), -1);
}
