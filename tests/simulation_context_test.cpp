#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

#include "simulation_context.h"

namespace {

std::string writeTempConfig(const std::string& name, const std::string& body) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << body;
    return path.string();
}

} // namespace

TEST(SimulationConfig, DefaultsAreDocumentedValues) {
    const SimulationConfig config;
    EXPECT_EQ(config.season.seasonWeeks, 52);
    EXPECT_EQ(config.resolvedWeeksPerHalf(), 26);
    EXPECT_EQ(config.stage(ContestStage::Stage1).problemCount, 1);
    EXPECT_DOUBLE_EQ(config.stage(ContestStage::Stage5).difficulty, 300.0);
    EXPECT_EQ(config.stage(ContestStage::Stage4).rewardMax, 0);
    EXPECT_DOUBLE_EQ(config.stage(ContestStage::Stage4).passRateBonus, 0.2);
    EXPECT_GT(config.scoring.abilityWeight, config.scoring.knowledgeWeight);
    EXPECT_EQ(config.province.strongBudget, 200000);
}

TEST(SimulationContext, RandomHelpersRespectBounds) {
    SimulationContext ctx(42, "");
    for (int i = 0; i < 200; ++i) {
        const int v = ctx.randInt(5, 1);
        EXPECT_GE(v, 1);
        EXPECT_LE(v, 5);
        const double u = ctx.randUniform(3.0, 2.0);
        EXPECT_GE(u, 2.0);
        EXPECT_LE(u, 3.0);
        const double r = ctx.rand01();
        EXPECT_GE(r, 0.0);
        EXPECT_LT(r, 1.0);
    }
    EXPECT_DOUBLE_EQ(ctx.randNormal(7.5, 0.0), 7.5);
    EXPECT_DOUBLE_EQ(ctx.randUniform(4.0, 4.0), 4.0);
}

TEST(SimulationContext, SubStreamsAreDeterministic) {
    const SimulationContext a(1234, "");
    const SimulationContext b(1234, "");
    std::mt19937_64 ra = a.makeRng(0x55);
    std::mt19937_64 rb = b.makeRng(0x55);
    std::mt19937_64 rc = a.makeRng(0x56);
    const auto va = ra();
    EXPECT_EQ(va, rb());
    EXPECT_NE(va, rc());
}

TEST(SimulationContext, ShippedConfigMatchesDefaults) {
    SimulationContext ctx(1, "");
    std::string err;
    ASSERT_TRUE(ctx.loadConfig(std::string(OICOACH_TEST_DATA_DIR) + "/sim_config.toml", &err)) << err;
    const SimulationConfig defaults;
    EXPECT_NE(ctx.configHash, "defaults");
    EXPECT_EQ(ctx.config.season.stageWeeks, defaults.season.stageWeeks);
    EXPECT_DOUBLE_EQ(ctx.config.scoring.mentalPressureAlpha, defaults.scoring.mentalPressureAlpha);
    EXPECT_EQ(ctx.config.stage(ContestStage::Stage3).rewardMax, defaults.stage(ContestStage::Stage3).rewardMax);
    EXPECT_DOUBLE_EQ(ctx.config.gains.purchasedMultiplier, defaults.gains.purchasedMultiplier);
}

TEST(SimulationContext, PartialConfigKeepsDefaultsAndIsSanitized) {
    const std::string path = writeTempConfig("oicoach_partial.toml",
        "[season]\n"
        "seasonWeeks = 40\n"
        "[stages.stage2]\n"
        "rewardMin = 100\n"
        "rewardMax = 50\n");
    SimulationContext ctx(1, "");
    std::string err;
    ASSERT_TRUE(ctx.loadConfig(path, &err)) << err;
    EXPECT_EQ(ctx.config.season.seasonWeeks, 40);
    EXPECT_EQ(ctx.config.resolvedWeeksPerHalf(), 20);
    // Default stage weeks overflow a 20-week half and are spread evenly.
    const std::vector<int> expected = {4, 8, 12, 16, 20};
    EXPECT_EQ(ctx.config.season.stageWeeks, expected);
    EXPECT_EQ(ctx.config.stage(ContestStage::Stage2).rewardMin, 50);
    EXPECT_EQ(ctx.config.stage(ContestStage::Stage2).rewardMax, 100);
    EXPECT_DOUBLE_EQ(ctx.config.province.normalBasePassRate, 0.5);
    std::filesystem::remove(path);
}

TEST(SimulationContext, MalformedConfigFallsBackToDefaults) {
    const std::string path = writeTempConfig("oicoach_broken.toml", "[season\nseasonWeeks = \n");
    SimulationContext ctx(1, "");
    std::string err;
    EXPECT_FALSE(ctx.loadConfig(path, &err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(ctx.config.season.seasonWeeks, 52);
    std::filesystem::remove(path);
}

TEST(SimulationContext, OutOfRangeWeightsFeedbackAndBonusAreReset) {
    const std::string path = writeTempConfig("oicoach_out_of_range.toml",
        "[scoring]\n"
        "abilityWeight = 0.3\n"
        "knowledgeWeight = 0.7\n"
        "[feedback]\n"
        "passPressureRelief = -5.0\n"
        "failMentalLoss = inf\n"
        "[stages.stage4]\n"
        "passRateBonus = nan\n");
    SimulationContext ctx(1, "");
    std::string err;
    ASSERT_TRUE(ctx.loadConfig(path, &err)) << err;
    EXPECT_DOUBLE_EQ(ctx.config.scoring.abilityWeight, 0.6);
    EXPECT_DOUBLE_EQ(ctx.config.scoring.knowledgeWeight, 0.4);
    EXPECT_DOUBLE_EQ(ctx.config.feedback.passPressureRelief, 10.0);
    EXPECT_DOUBLE_EQ(ctx.config.feedback.failMentalLoss, 5.0);
    EXPECT_TRUE(std::isfinite(ctx.config.stage(ContestStage::Stage4).passRateBonus));
    EXPECT_DOUBLE_EQ(ctx.config.stage(ContestStage::Stage4).passRateBonus, 0.0);
    std::filesystem::remove(path);
}
