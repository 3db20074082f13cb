#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "contest_definition.h"
#include "season_session.h"
#include "simulation_context.h"

namespace {

Competitor prodigy(const std::string& name) {
    Competitor c(name, 100.0, 100.0, 100.0);
    for (KnowledgeTag tag : allKnowledgeTags()) {
        c.setKnowledge(tag, 50);
    }
    return c;
}

Competitor novice(const std::string& name) {
    return Competitor(name, 0.0, 0.0, 0.0);
}

std::vector<Competitor> prodigyRoster() {
    return {prodigy("Zhang Ming"), prodigy("Li Hua"), prodigy("Wang Qiang")};
}

std::vector<Competitor> noviceRoster() {
    return {novice("Chen Na"), novice("Yang Min"), novice("Huang Jing")};
}

} // namespace

TEST(SeasonSession, RejectsInvalidInput) {
    SimulationContext ctx(1, "");
    ContestResolution out;
    std::string err;

    SeasonSession empty(ctx, {}, ProvinceTier::Normal);
    EXPECT_FALSE(empty.resolveContest(makeStageContest(ctx.config, ContestStage::Stage1, 5), out, &err));
    EXPECT_FALSE(err.empty());

    SeasonSession session(ctx, prodigyRoster(), ProvinceTier::Normal);
    err.clear();
    const ContestDefinition practice = makePracticeContest(ctx.config, PracticeTier::Easy, 25.0, 2, false);
    EXPECT_FALSE(session.resolveContest(practice, out, &err));
    EXPECT_FALSE(err.empty());

    ContestDefinition broken = makeStageContest(ctx.config, ContestStage::Stage1, 5);
    broken.problemCount = 0;
    err.clear();
    EXPECT_FALSE(session.resolveContest(broken, out, &err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(session.getCareerLedger().size(), 0u);
}

TEST(SeasonSession, ResolvesStageAndQualifiesPassers) {
    SimulationContext ctx(21, "");
    SeasonSession session(ctx, prodigyRoster(), ProvinceTier::Normal);
    const long long startBudget = session.getBudget();
    EXPECT_EQ(startBudget, 100000);

    ContestResolution out;
    std::string err;
    ASSERT_TRUE(session.resolveContest(makeStageContest(ctx.config, ContestStage::Stage1, 5), out, &err)) << err;
    EXPECT_EQ(out.status, ResolutionStatus::Resolved);
    EXPECT_EQ(out.halfSeason, 0);
    EXPECT_FALSE(out.endingTriggered);
    ASSERT_TRUE(out.hasCareerEntry);
    EXPECT_EQ(out.careerEntry.participantCount, 3);
    ASSERT_EQ(out.results.size(), 3u);
    for (size_t i = 1; i < out.results.size(); ++i) {
        EXPECT_GE(out.results[i - 1].totalScore, out.results[i].totalScore);
    }

    int passed = 0;
    for (const ContestResult& r : out.results) {
        EXPECT_TRUE(r.participated);
        EXPECT_EQ(r.medal, MedalTier::None);
        if (r.passed) {
            ++passed;
            EXPECT_TRUE(session.getQualification().hasQualified(0, ContestStage::Stage1, r.name));
        }
    }
    EXPECT_GE(passed, 1);
    EXPECT_EQ(out.careerEntry.passedCount, passed);
    EXPECT_GE(out.fundingIssued, 2000LL * passed);
    EXPECT_LE(out.fundingIssued, 5000LL * passed);
    EXPECT_EQ(session.getBudget(), startBudget + out.fundingIssued);
    EXPECT_TRUE(session.isContestCompleted(0, "CSP-S1", 5));
}

TEST(SeasonSession, RepeatedResolutionIsANoOp) {
    SimulationContext ctx(21, "");
    SeasonSession session(ctx, prodigyRoster(), ProvinceTier::Strong);
    const ContestDefinition def = makeStageContest(ctx.config, ContestStage::Stage1, 5);

    ContestResolution first;
    ASSERT_TRUE(session.resolveContest(def, first));
    const long long budget = session.getBudget();
    const double pressure = session.getRoster()[0].getPressure();

    ContestResolution second;
    ASSERT_TRUE(session.resolveContest(def, second));
    EXPECT_EQ(second.status, ResolutionStatus::Duplicate);
    EXPECT_EQ(second.fundingIssued, 0);
    EXPECT_FALSE(second.hasCareerEntry);
    EXPECT_EQ(session.getBudget(), budget);
    EXPECT_EQ(session.getCareerLedger().size(), 1u);
    EXPECT_DOUBLE_EQ(session.getRoster()[0].getPressure(), pressure);
}

TEST(SeasonSession, SessionWeekIsUsedWhenDefinitionHasNone) {
    SimulationContext ctx(4, "");
    SeasonSession session(ctx, prodigyRoster(), ProvinceTier::Normal);
    session.setWeek(31);
    EXPECT_EQ(session.getHalfSeasonIndex(), 1);

    ContestResolution out;
    ASSERT_TRUE(session.resolveContest(makeStageContest(ctx.config, ContestStage::Stage1, 0), out));
    EXPECT_EQ(out.week, 31);
    EXPECT_EQ(out.halfSeason, 1);
    EXPECT_TRUE(session.isContestCompleted(1, "CSP-S1", 31));
}

TEST(SeasonSession, FirstHalfWithoutEligibleCompetitorsIsSkipped) {
    SimulationContext ctx(2, "");
    SeasonSession session(ctx, prodigyRoster(), ProvinceTier::Normal);

    ContestResolution out;
    ASSERT_TRUE(session.resolveContest(makeStageContest(ctx.config, ContestStage::Stage2, 9), out));
    EXPECT_EQ(out.status, ResolutionStatus::Skipped);
    EXPECT_FALSE(out.endingTriggered);
    EXPECT_EQ(out.fundingIssued, 0);
    ASSERT_TRUE(out.hasCareerEntry);
    EXPECT_EQ(out.careerEntry.participantCount, 0);
    ASSERT_EQ(out.careerEntry.outcomes.size(), 3u);
    EXPECT_FALSE(out.careerEntry.outcomes[0].participated);
    EXPECT_FALSE(session.isEndingTriggered());
    EXPECT_FALSE(session.getNews().getEvents().empty());
}

TEST(SeasonSession, SecondHalfWithoutEligibleCompetitorsEndsSeason) {
    SimulationContext ctx(2, "");
    SeasonSession session(ctx, prodigyRoster(), ProvinceTier::Normal);
    const long long budget = session.getBudget();

    ContestResolution out;
    ASSERT_TRUE(session.resolveContest(makeStageContest(ctx.config, ContestStage::Stage2, 35), out));
    EXPECT_EQ(out.status, ResolutionStatus::ChainFailure);
    EXPECT_TRUE(out.endingTriggered);
    EXPECT_EQ(out.endingReason, "chain-failure");
    EXPECT_DOUBLE_EQ(out.passLine, 0.0);
    EXPECT_TRUE(out.results.empty());
    EXPECT_EQ(out.fundingIssued, 0);
    EXPECT_FALSE(out.hasCareerEntry);
    EXPECT_EQ(session.getCareerLedger().size(), 0u);
    EXPECT_EQ(session.getBudget(), budget);
    EXPECT_TRUE(session.isEndingTriggered());

    ContestResolution later;
    ASSERT_TRUE(session.resolveContest(makeStageContest(ctx.config, ContestStage::Stage3, 39), later));
    EXPECT_EQ(later.status, ResolutionStatus::SeasonOver);
    EXPECT_TRUE(later.endingTriggered);
    EXPECT_EQ(later.endingReason, "chain-failure");
}

TEST(SeasonSession, SecondHalfWithoutPassersEndsSeasonBeforeFeedback) {
    SimulationContext ctx(6, "");
    SeasonSession session(ctx, noviceRoster(), ProvinceTier::Normal);
    const double pressureBefore = session.getRoster()[0].getPressure();

    ContestResolution out;
    ASSERT_TRUE(session.resolveContest(makeStageContest(ctx.config, ContestStage::Stage1, 31), out));
    EXPECT_EQ(out.status, ResolutionStatus::ChainFailure);
    EXPECT_EQ(out.endingReason, "chain-failure");
    EXPECT_DOUBLE_EQ(out.passLine, 30.0);
    EXPECT_EQ(out.fundingIssued, 0);
    EXPECT_FALSE(out.hasCareerEntry);
    EXPECT_DOUBLE_EQ(session.getRoster()[0].getPressure(), pressureBefore);
    EXPECT_EQ(session.getQualification().qualifiedCount(1, ContestStage::Stage1), 0u);
}

TEST(SeasonSession, FirstHalfWithoutPassersContinues) {
    SimulationContext ctx(6, "");
    SeasonSession session(ctx, noviceRoster(), ProvinceTier::Normal);

    ContestResolution out;
    ASSERT_TRUE(session.resolveContest(makeStageContest(ctx.config, ContestStage::Stage1, 5), out));
    EXPECT_EQ(out.status, ResolutionStatus::Resolved);
    EXPECT_EQ(out.careerEntry.passedCount, 0);
    EXPECT_FALSE(session.isEndingTriggered());
    // Fail, and the last-place penalty: 20 + 15 + 10 * 2.
    EXPECT_DOUBLE_EQ(session.getRoster()[0].getPressure(), 55.0);

    ContestResolution next;
    ASSERT_TRUE(session.resolveContest(makeStageContest(ctx.config, ContestStage::Stage2, 9), next));
    EXPECT_EQ(next.status, ResolutionStatus::Skipped);
}

TEST(SeasonSession, TerminalStageAwardsMedals) {
    SimulationContext ctx(13, "");
    // Saturated logistic with no noise: each problem scores floor(mental / 10) * 10.
    for (SimulationConfig::StageTuning& st : ctx.config.stages) {
        st.difficulty = 0.0;
    }
    ctx.config.scoring.logisticScale = 1e-3;
    ctx.config.scoring.mentalPressureAlpha = 0.0;
    ctx.config.scoring.mentalNoiseStddev = 0.0;
    ctx.config.scoring.perfNoiseBase = 0.0;
    ctx.config.scoring.perfNoiseMentalDivisor = 1e300;
    ctx.config.tuning.passLineMultiplier = 0.0;

    // Four passes at +3 mental each lift these to 85, 65, 45 and 25 before the final.
    std::vector<Competitor> roster = {prodigy("Zhang Ming"), prodigy("Li Hua"), prodigy("Wang Qiang"), prodigy("Zhao Lei")};
    const double startMental[] = {73.0, 53.0, 33.0, 13.0};
    for (size_t i = 0; i < roster.size(); ++i) {
        roster[i].setMental(startMental[i]);
    }
    SeasonSession session(ctx, roster, ProvinceTier::Strong);

    ContestResolution out;
    for (int i = 0; i + 1 < kStageCount; ++i) {
        const ContestStage stage = stageFromIndex(i);
        ASSERT_TRUE(session.resolveContest(makeStageContest(ctx.config, stage, ctx.config.season.stageWeeks[static_cast<size_t>(i)]), out));
        ASSERT_EQ(out.status, ResolutionStatus::Resolved) << resolutionStatusName(out.status);
        ASSERT_EQ(out.careerEntry.passedCount, 4);
    }
    EXPECT_DOUBLE_EQ(session.getRoster()[0].getMental(), 85.0);
    EXPECT_DOUBLE_EQ(session.getRoster()[3].getMental(), 25.0);

    ctx.config.tuning.passLineMultiplier = 1.0;
    ASSERT_TRUE(session.resolveContest(makeStageContest(ctx.config, ContestStage::Stage5, ctx.config.season.stageWeeks.back()), out));
    ASSERT_EQ(out.status, ResolutionStatus::Resolved);
    ASSERT_TRUE(out.hasCareerEntry);
    EXPECT_EQ(out.careerEntry.stage, ContestStage::Stage5);

    // Scores 320/240/160/80 out of 400. The terminal floor lifts the line to 320.
    EXPECT_DOUBLE_EQ(out.passLine, 320.0);
    ASSERT_EQ(out.results.size(), 4u);
    EXPECT_EQ(out.results[0].totalScore, 320);
    EXPECT_EQ(out.results[1].totalScore, 240);
    EXPECT_EQ(out.results[2].totalScore, 160);
    EXPECT_EQ(out.results[3].totalScore, 80);

    EXPECT_TRUE(out.results[0].passed);
    EXPECT_EQ(out.results[0].medal, MedalTier::Gold);
    EXPECT_FALSE(out.results[1].passed);
    EXPECT_EQ(out.results[1].medal, MedalTier::Silver);
    EXPECT_FALSE(out.results[2].passed);
    EXPECT_EQ(out.results[2].medal, MedalTier::Bronze);
    EXPECT_FALSE(out.results[3].passed);
    EXPECT_EQ(out.results[3].medal, MedalTier::None);
    EXPECT_EQ(out.careerEntry.outcomes[1].medal, MedalTier::Silver);
    EXPECT_FALSE(session.isEndingTriggered());
}

TEST(SeasonSession, StatusNamesAreDistinct) {
    EXPECT_STREQ(resolutionStatusName(ResolutionStatus::Resolved), "resolved");
    EXPECT_STREQ(resolutionStatusName(ResolutionStatus::ChainFailure), "chain-failure");
    EXPECT_STRNE(resolutionStatusName(ResolutionStatus::Skipped), resolutionStatusName(ResolutionStatus::Duplicate));
    EXPECT_STRNE(resolutionStatusName(ResolutionStatus::SeasonOver), resolutionStatusName(ResolutionStatus::Resolved));
}

TEST(SeasonSession, PracticeAppliesGainsWithoutQualification) {
    SimulationContext ctx(8, "");
    SeasonSession session(ctx, prodigyRoster(), ProvinceTier::Normal);

    PracticeResolution out;
    std::string err;
    EXPECT_FALSE(session.runPracticeContest(makeStageContest(ctx.config, ContestStage::Stage1, 5), out, &err));
    EXPECT_FALSE(err.empty());

    const ContestDefinition def = makePracticeContest(ctx.config, PracticeTier::Medium, 75.0, 4, false);
    ASSERT_TRUE(session.runPracticeContest(def, out, &err)) << err;
    EXPECT_EQ(out.sheets.size(), 3u);
    EXPECT_EQ(out.deltas.size(), 3u);
    EXPECT_EQ(out.totalMax, 400);
    EXPECT_EQ(session.getQualification().getQualified(0, ContestStage::Stage1), nullptr);
    EXPECT_EQ(session.getCareerLedger().size(), 0u);
}

TEST(SeasonSession, PracticeNewsListsEveryCompetitorChange) {
    SimulationContext ctx(8, "");
    SeasonSession session(ctx, prodigyRoster(), ProvinceTier::Normal);

    PracticeResolution out;
    std::string err;
    const ContestDefinition def = makePracticeContest(ctx.config, PracticeTier::Easy, 25.0, 3, false);
    ASSERT_TRUE(session.runPracticeContest(def, out, &err)) << err;
    ASSERT_EQ(out.deltas.size(), 3u);

    const std::vector<NewsEvent>& events = session.getNews().getEvents();
    ASSERT_FALSE(events.empty());
    const NewsEvent& last = events.back();
    EXPECT_NE(last.title.find(def.name), std::string::npos);

    std::string expected;
    for (size_t i = 0; i < out.deltas.size(); ++i) {
        if (i > 0) expected += "\n";
        expected += out.deltas[i].describe();
    }
    EXPECT_EQ(last.description, expected);
    for (const char* name : {"Zhang Ming", "Li Hua", "Wang Qiang"}) {
        EXPECT_NE(last.description.find(name), std::string::npos) << name;
    }
}

TEST(SeasonSession, WeekCounterStaysInsideSeason) {
    SimulationContext ctx(1, "");
    SeasonSession session(ctx, prodigyRoster(), ProvinceTier::Weak);
    EXPECT_EQ(session.getWeek(), 1);
    EXPECT_EQ(session.advanceWeeks(25), 26);
    EXPECT_EQ(session.getHalfSeasonIndex(), 0);
    EXPECT_EQ(session.advanceWeeks(1), 27);
    EXPECT_EQ(session.getHalfSeasonIndex(), 1);
    EXPECT_EQ(session.advanceWeeks(100), 52);
    EXPECT_EQ(session.getBudget(), 40000);
}
