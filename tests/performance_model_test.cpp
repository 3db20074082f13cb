#include <gtest/gtest.h>

#include "competitor.h"
#include "contest_definition.h"
#include "performance_model.h"
#include "simulation_context.h"

TEST(PerformanceModel, ScoresAreBoundedAndGranular) {
    SimulationContext ctx(5, "");
    PerformanceModel model(ctx);
    Competitor c("Guo Xin", 60.0, 55.0, 70.0);
    for (int i = 0; i < 500; ++i) {
        const int score = model.scoreProblem(c, 50.0 + (i % 5) * 40.0, 100, i % 6, ContestKind::Formal);
        EXPECT_GE(score, 0);
        EXPECT_LE(score, 100);
        EXPECT_EQ(score % 10, 0);
    }
}

TEST(PerformanceModel, ZeroMaxScoreYieldsZero) {
    SimulationContext ctx(5, "");
    PerformanceModel model(ctx);
    const Competitor c("Guo Xin", 60.0, 55.0, 70.0);
    EXPECT_EQ(model.scoreProblem(c, 10.0, 0, 0, ContestKind::Practice), 0);
}

TEST(PerformanceModel, StrongCompetitorOutscoresWeakOnAverage) {
    SimulationContext ctx(17, "");
    PerformanceModel model(ctx);
    Competitor strong("Gao Rui", 90.0, 90.0, 90.0);
    Competitor weak("Tang Bo", 10.0, 10.0, 10.0);
    long long strongTotal = 0;
    long long weakTotal = 0;
    for (int i = 0; i < 300; ++i) {
        strongTotal += model.scoreProblem(strong, 40.0, 100, 0, ContestKind::Formal);
        weakTotal += model.scoreProblem(weak, 40.0, 100, 0, ContestKind::Formal);
    }
    EXPECT_GT(strongTotal, weakTotal);
}

TEST(PerformanceModel, ProblemSetEscalatesDifficulty) {
    SimulationContext ctx(8, "");
    PerformanceModel model(ctx);
    const ContestDefinition def = makeStageContest(ctx.config, ContestStage::Stage3, 13);
    const std::vector<Problem> problems = model.buildProblemSet(def);
    ASSERT_EQ(problems.size(), 4u);
    for (size_t i = 0; i < problems.size(); ++i) {
        const double lo = def.difficulty * (0.6 + 0.2 * static_cast<double>(i));
        const double hi = def.difficulty * (0.8 + 0.2 * static_cast<double>(i));
        EXPECT_GE(problems[i].difficulty, lo);
        EXPECT_LE(problems[i].difficulty, hi);
        EXPECT_GE(problems[i].tags.size(), 1u);
        EXPECT_LE(problems[i].tags.size(), 3u);
        EXPECT_EQ(problems[i].maxScore, 100);
    }
}

TEST(PerformanceModel, CallerTagsAreKept) {
    SimulationContext ctx(8, "");
    PerformanceModel model(ctx);
    const ContestDefinition def = makePracticeContest(ctx.config, PracticeTier::Easy, 30.0, 0, false,
                                                      {{KnowledgeTag::String}, {KnowledgeTag::Graph, KnowledgeTag::Math}});
    EXPECT_EQ(def.problemCount, 2);
    const std::vector<Problem> problems = model.buildProblemSet(def);
    ASSERT_EQ(problems.size(), 2u);
    ASSERT_EQ(problems[1].tags.size(), 2u);
    EXPECT_EQ(problems[1].tags[0], KnowledgeTag::Graph);

    Competitor c("Guo Xin", 50.0, 50.0, 50.0);
    c.setKnowledge(KnowledgeTag::Graph, 5);
    c.setKnowledge(KnowledgeTag::Math, 2);
    EXPECT_EQ(model.knowledgeValueFor(c, problems[1]), 3);
}

TEST(ContestDefinition, ValidationReportsProblems) {
    const SimulationConfig config;
    ContestDefinition def = makeStageContest(config, ContestStage::Stage2, 9);
    EXPECT_TRUE(validateContestDefinition(def).empty());
    def.problemCount = 0;
    EXPECT_FALSE(validateContestDefinition(def).empty());
    def = makeStageContest(config, ContestStage::Stage2, 9);
    def.maxScorePerProblem = 0;
    EXPECT_FALSE(validateContestDefinition(def).empty());
    def = makeStageContest(config, ContestStage::Stage2, 9);
    def.problemTags = {{}, {KnowledgeTag::Math}, {KnowledgeTag::Math}, {KnowledgeTag::Math}};
    EXPECT_FALSE(validateContestDefinition(def).empty());
}
