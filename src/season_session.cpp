#include "season_session.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

#include "pass_line.h"

const char* resolutionStatusName(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::Resolved: return "resolved";
        case ResolutionStatus::Skipped: return "skipped";
        case ResolutionStatus::Duplicate: return "duplicate";
        case ResolutionStatus::ChainFailure: return "chain-failure";
        case ResolutionStatus::SeasonOver: return "season-over";
    }
    return "unknown";
}

long long provinceBudget(const SimulationConfig& config, ProvinceTier province) {
    switch (province) {
        case ProvinceTier::Strong: return config.province.strongBudget;
        case ProvinceTier::Weak: return config.province.weakBudget;
        case ProvinceTier::Normal: return config.province.normalBudget;
    }
    return config.province.normalBudget;
}

SeasonSession::SeasonSession(SimulationContext& ctx, std::vector<Competitor> roster, ProvinceTier province)
    : m_ctx(ctx),
      m_model(ctx),
      m_roster(std::move(roster)),
      m_province(province),
      m_weeksPerHalf(ctx.config.resolvedWeeksPerHalf()),
      m_budget(provinceBudget(ctx.config, province)) {}

void SeasonSession::setWeek(int week) {
    m_week = std::clamp(week, 1, std::max(1, m_ctx.config.season.seasonWeeks));
}

int SeasonSession::advanceWeeks(int weeks) {
    setWeek(m_week + std::max(0, weeks));
    return m_week;
}

std::string SeasonSession::contestKey(int halfSeason, const std::string& contestName, int week) {
    std::ostringstream key;
    key << halfSeason << "_" << contestName << "_" << week;
    return key.str();
}

bool SeasonSession::isContestCompleted(int halfSeason, const std::string& contestName, int week) const {
    return m_completedContests.count(contestKey(halfSeason, contestName, week)) > 0;
}

CareerOutcome SeasonSession::absentOutcome(const Competitor& competitor, const std::string& remark) const {
    CareerOutcome o;
    o.name = competitor.getName();
    o.participated = false;
    o.remark = remark;
    return o;
}

void SeasonSession::triggerChainFailure(const ContestDefinition& def,
                                        int week,
                                        const std::string& why,
                                        ContestResolution& out) {
    m_endingTriggered = true;
    m_endingReason = "chain-failure";
    out.status = ResolutionStatus::ChainFailure;
    out.endingTriggered = true;
    out.endingReason = m_endingReason;
    m_news.addEvent(week, def.name + " ends the season", why);
    std::cout << "[Contest] " << def.name << " (week " << week << "): " << why << ", season over\n";
}

bool SeasonSession::resolveContest(const ContestDefinition& def, ContestResolution& out, std::string* errorMessage) {
    out = ContestResolution{};
    if (m_roster.empty()) {
        if (errorMessage) *errorMessage = "roster is empty";
        std::cerr << "[Contest] Cannot resolve " << def.name << ": roster is empty\n";
        return false;
    }
    if (def.kind != ContestKind::Formal) {
        if (errorMessage) *errorMessage = "practice contests go through runPracticeContest";
        std::cerr << "[Contest] " << def.name << " is not a formal contest\n";
        return false;
    }
    const std::string invalid = validateContestDefinition(def);
    if (!invalid.empty()) {
        if (errorMessage) *errorMessage = invalid;
        std::cerr << "[Contest] Invalid contest definition: " << invalid << "\n";
        return false;
    }

    const int week = (def.week > 0) ? def.week : m_week;
    const int half = QualificationLedger::halfSeasonForWeek(week, m_weeksPerHalf);
    out.week = week;
    out.halfSeason = half;

    if (m_endingTriggered) {
        out.status = ResolutionStatus::SeasonOver;
        out.endingTriggered = true;
        out.endingReason = m_endingReason;
        return true;
    }

    const std::string key = contestKey(half, def.name, week);
    if (m_completedContests.count(key) > 0) {
        out.status = ResolutionStatus::Duplicate;
        std::cout << "[Contest] " << key << " already resolved, ignoring\n";
        return true;
    }

    m_qualification.touchStage(half, def.stage);
    const std::vector<int> eligible = m_qualification.eligibleIndices(half, def.stage, m_roster);

    if (eligible.empty()) {
        m_completedContests.insert(key);
        if (half == 1) {
            triggerChainFailure(def, week, "no competitor is eligible", out);
            return true;
        }
        out.status = ResolutionStatus::Skipped;
        CareerEntry entry;
        entry.week = week;
        entry.contestName = def.name;
        entry.stage = def.stage;
        entry.halfSeason = half;
        for (const Competitor& c : m_roster) {
            if (!c.isActive()) continue;
            entry.outcomes.push_back(absentOutcome(c, "not qualified"));
        }
        m_career.append(entry);
        out.hasCareerEntry = true;
        out.careerEntry = entry;
        m_news.addEvent(week, def.name + " skipped", "no competitor is eligible");
        std::cout << "[Contest] " << def.name << " (week " << week << ") skipped: nobody eligible\n";
        return true;
    }

    out.problems = m_model.buildProblemSet(def);
    std::vector<ScoreSheet> sheets;
    sheets.reserve(eligible.size());
    for (int idx : eligible) {
        sheets.push_back(m_model.scoreCompetitor(m_roster[static_cast<size_t>(idx)], idx, out.problems, ContestKind::Formal));
    }
    std::stable_sort(sheets.begin(), sheets.end(), [](const ScoreSheet& a, const ScoreSheet& b) {
        return a.totalScore > b.totalScore;
    });

    std::vector<int> sortedScores;
    sortedScores.reserve(sheets.size());
    for (const ScoreSheet& s : sheets) {
        sortedScores.push_back(s.totalScore);
    }
    const int totalMax = def.totalMaxScore();
    out.passLine = calculatePassLine(sortedScores,
                                     passRateFor(m_ctx.config, m_province, def.stage),
                                     totalMax,
                                     def.stage,
                                     m_ctx.config.tuning.passLineMultiplier);

    int passedCount = 0;
    for (const ScoreSheet& s : sheets) {
        if (static_cast<double>(s.totalScore) >= out.passLine) ++passedCount;
    }

    const bool terminal = isTerminalStage(def.stage);
    for (const ScoreSheet& s : sheets) {
        ContestResult r;
        r.name = s.name;
        r.rosterIndex = s.rosterIndex;
        r.participated = true;
        r.totalScore = s.totalScore;
        r.problemScores = s.problemScores;
        r.passed = static_cast<double>(s.totalScore) >= out.passLine;
        if (terminal) {
            r.medal = medalFor(static_cast<double>(s.totalScore), out.passLine);
        }
        out.results.push_back(r);
    }

    if (passedCount == 0 && half == 1) {
        m_completedContests.insert(key);
        triggerChainFailure(def, week, "no competitor passed", out);
        return true;
    }

    const std::vector<CompetitorFeedback> feedback = computeContestFeedback(m_ctx.config, sheets, out.passLine, totalMax);
    applyContestFeedback(m_ctx.config, m_roster, feedback);
    for (size_t i = 0; i < feedback.size() && i < out.results.size(); ++i) {
        ContestResult& r = out.results[i];
        r.pressureDelta = feedback[i].pressureDelta;
        r.mentalDelta = feedback[i].mentalDelta;
        r.extraPressure = feedback[i].extraPressure;
        r.remark = feedback[i].remark;
        if (r.passed) {
            m_qualification.recordPassed(half, def.stage, r.name);
        }
    }

    const std::string fundingKey = FundingLedger::fundingKey(half, def.name, week);
    out.fundingIssued = m_funding.issue(m_ctx, fundingKey, def.stage, passedCount);
    if (out.fundingIssued > 0) {
        m_budget += out.fundingIssued;
        std::ostringstream desc;
        desc << "+" << out.fundingIssued << " for " << passedCount << " qualifier(s)";
        m_news.addEvent(week, def.name + " funding", desc.str());
    }

    CareerEntry entry;
    entry.week = week;
    entry.contestName = def.name;
    entry.stage = def.stage;
    entry.halfSeason = half;
    entry.passedCount = passedCount;
    entry.participantCount = static_cast<int>(sheets.size());
    for (size_t i = 0; i < out.results.size(); ++i) {
        const ContestResult& r = out.results[i];
        CareerOutcome o;
        o.name = r.name;
        o.participated = true;
        o.rank = static_cast<int>(i) + 1;
        o.score = r.totalScore;
        o.passed = r.passed;
        o.medal = r.medal;
        o.remark = r.remark;
        entry.outcomes.push_back(o);
    }

    std::vector<bool> participated(m_roster.size(), false);
    for (int idx : eligible) {
        participated[static_cast<size_t>(idx)] = true;
    }
    for (size_t i = 0; i < m_roster.size(); ++i) {
        const Competitor& c = m_roster[i];
        if (participated[i] || !c.isActive()) continue;
        ContestResult r;
        r.name = c.getName();
        r.rosterIndex = static_cast<int>(i);
        r.remark = "not qualified";
        out.results.push_back(r);
        entry.outcomes.push_back(absentOutcome(c, r.remark));
    }

    m_career.append(entry);
    out.hasCareerEntry = true;
    out.careerEntry = entry;
    m_completedContests.insert(key);

    std::ostringstream summary;
    summary << passedCount << " of " << sheets.size() << " passed (line " << static_cast<int>(out.passLine) << ")";
    m_news.addEvent(week, def.name, summary.str());
    std::cout << "[Contest] " << def.name << " week " << week << " half " << half << ": " << summary.str() << "\n";

    out.status = ResolutionStatus::Resolved;
    return true;
}

CompetitorDeltas SeasonSession::applyGains(Competitor& competitor, const PracticeOutcome& outcome) {
    return ::applyGains(m_ctx.config, competitor, outcome);
}

bool SeasonSession::runPracticeContest(const ContestDefinition& def, PracticeResolution& out, std::string* errorMessage) {
    out = PracticeResolution{};
    if (m_roster.empty()) {
        if (errorMessage) *errorMessage = "roster is empty";
        std::cerr << "[Contest] Cannot run practice " << def.name << ": roster is empty\n";
        return false;
    }
    if (def.kind != ContestKind::Practice) {
        if (errorMessage) *errorMessage = "formal contests go through resolveContest";
        std::cerr << "[Contest] " << def.name << " is not a practice contest\n";
        return false;
    }
    const std::string invalid = validateContestDefinition(def);
    if (!invalid.empty()) {
        if (errorMessage) *errorMessage = invalid;
        std::cerr << "[Contest] Invalid practice definition: " << invalid << "\n";
        return false;
    }

    out.problems = m_model.buildProblemSet(def);
    out.totalMax = def.totalMaxScore();
    for (size_t i = 0; i < m_roster.size(); ++i) {
        if (!m_roster[i].isActive()) continue;
        out.sheets.push_back(m_model.scoreCompetitor(m_roster[i], static_cast<int>(i), out.problems, ContestKind::Practice));
    }
    if (out.sheets.empty()) {
        return true;
    }

    out.sessionMinScore = out.sheets.front().totalScore;
    for (const ScoreSheet& s : out.sheets) {
        out.sessionMinScore = std::min(out.sessionMinScore, s.totalScore);
    }

    for (const ScoreSheet& s : out.sheets) {
        PracticeOutcome outcome;
        outcome.problems = out.problems;
        outcome.problemScores = s.problemScores;
        outcome.totalScore = s.totalScore;
        outcome.totalMax = out.totalMax;
        outcome.sessionMinScore = out.sessionMinScore;
        outcome.tier = def.practiceTier;
        outcome.difficulty = def.difficulty;
        outcome.purchased = def.purchased;
        out.deltas.push_back(applyGains(m_roster[static_cast<size_t>(s.rosterIndex)], outcome));
    }

    // One line per competitor: "Li Ming: Thinking +1.2, Math +2" or "no significant change".
    std::ostringstream summary;
    for (size_t i = 0; i < out.deltas.size(); ++i) {
        if (i > 0) summary << "\n";
        summary << out.deltas[i].describe();
    }
    m_news.addEvent(m_week, def.name + " results", summary.str());
    std::cout << "[Contest] " << def.name << " week " << m_week << ": " << out.sheets.size()
              << " competitor(s), lowest " << out.sessionMinScore << "/" << out.totalMax << "\n";
    return true;
}
