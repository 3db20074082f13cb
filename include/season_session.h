#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "career_ledger.h"
#include "competitor.h"
#include "contest_definition.h"
#include "contest_feedback.h"
#include "gain_distribution.h"
#include "news.h"
#include "performance_model.h"
#include "qualification.h"
#include "simulation_context.h"

enum class ResolutionStatus : std::uint8_t {
    Resolved,     // scored, feedback applied, ledger appended
    Skipped,      // first half-season, nobody eligible
    Duplicate,    // occurrence already completed, nothing changed
    ChainFailure, // second half-season broke the chain, the season ends
    SeasonOver    // an ending was already triggered
};

const char* resolutionStatusName(ResolutionStatus status);

struct ContestResult {
    std::string name;
    int rosterIndex = -1;
    bool participated = false;
    int totalScore = 0;
    std::vector<int> problemScores;
    bool passed = false;
    MedalTier medal = MedalTier::None;
    double pressureDelta = 0.0;
    double mentalDelta = 0.0;
    int extraPressure = 0;
    std::string remark;
};

struct ContestResolution {
    ResolutionStatus status = ResolutionStatus::Resolved;
    int week = 0;
    int halfSeason = 0;
    double passLine = 0.0;
    std::vector<Problem> problems;
    std::vector<ContestResult> results; // participants by score, then non-participants
    bool hasCareerEntry = false;
    CareerEntry careerEntry;
    long long fundingIssued = 0;
    bool endingTriggered = false;
    std::string endingReason;
};

struct PracticeResolution {
    std::vector<Problem> problems;
    std::vector<ScoreSheet> sheets;
    std::vector<CompetitorDeltas> deltas; // parallel to sheets
    int totalMax = 0;
    int sessionMinScore = 0;
};

// Owns the roster and every piece of season state; contest resolution is serialized through it.
class SeasonSession {
public:
    SeasonSession(SimulationContext& ctx, std::vector<Competitor> roster, ProvinceTier province);

    // Returns false (and fills errorMessage) for an empty roster, a practice definition or an
    // invalid definition. Everything else, including duplicates and endings, is a status.
    bool resolveContest(const ContestDefinition& def, ContestResolution& out, std::string* errorMessage = nullptr);

    // Scores every active competitor and applies practice gains. Qualification is untouched.
    bool runPracticeContest(const ContestDefinition& def, PracticeResolution& out, std::string* errorMessage = nullptr);

    CompetitorDeltas applyGains(Competitor& competitor, const PracticeOutcome& outcome);

    int getWeek() const { return m_week; }
    void setWeek(int week);
    int advanceWeeks(int weeks);
    int getWeeksPerHalf() const { return m_weeksPerHalf; }
    int getHalfSeasonIndex() const { return QualificationLedger::halfSeasonForWeek(m_week, m_weeksPerHalf); }

    std::vector<Competitor>& getRoster() { return m_roster; }
    const std::vector<Competitor>& getRoster() const { return m_roster; }
    const QualificationLedger& getQualification() const { return m_qualification; }
    const CareerLedger& getCareerLedger() const { return m_career; }
    const News& getNews() const { return m_news; }
    ProvinceTier getProvince() const { return m_province; }
    long long getBudget() const { return m_budget; }

    bool isEndingTriggered() const { return m_endingTriggered; }
    const std::string& getEndingReason() const { return m_endingReason; }

    bool isContestCompleted(int halfSeason, const std::string& contestName, int week) const;
    static std::string contestKey(int halfSeason, const std::string& contestName, int week);

private:
    void triggerChainFailure(const ContestDefinition& def, int week, const std::string& why, ContestResolution& out);
    CareerOutcome absentOutcome(const Competitor& competitor, const std::string& remark) const;

    SimulationContext& m_ctx;
    PerformanceModel m_model;
    std::vector<Competitor> m_roster;
    ProvinceTier m_province;
    int m_week = 1;
    int m_weeksPerHalf;
    long long m_budget;

    QualificationLedger m_qualification;
    CareerLedger m_career;
    News m_news;
    FundingLedger m_funding;
    std::unordered_set<std::string> m_completedContests;

    bool m_endingTriggered = false;
    std::string m_endingReason;
};

long long provinceBudget(const SimulationConfig& config, ProvinceTier province);
