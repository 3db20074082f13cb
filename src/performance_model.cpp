#include "performance_model.h"

#include <algorithm>
#include <cmath>

PerformanceModel::PerformanceModel(SimulationContext& ctx)
    : m_ctx(ctx) {}

double PerformanceModel::logistic(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

std::vector<KnowledgeTag> PerformanceModel::drawTags() {
    const int numTags = m_ctx.randInt(1, 3);
    std::vector<KnowledgeTag> tags;
    tags.reserve(static_cast<size_t>(numTags));
    while (static_cast<int>(tags.size()) < numTags) {
        const KnowledgeTag tag = allKnowledgeTags()[static_cast<size_t>(m_ctx.randInt(0, kKnowledgeTagCount - 1))];
        if (std::find(tags.begin(), tags.end(), tag) == tags.end()) {
            tags.push_back(tag);
        }
    }
    return tags;
}

std::vector<Problem> PerformanceModel::buildProblemSet(const ContestDefinition& def) {
    std::vector<Problem> problems;
    problems.reserve(static_cast<size_t>(std::max(0, def.problemCount)));
    for (int i = 0; i < def.problemCount; ++i) {
        Problem p;
        if (static_cast<size_t>(i) < def.problemTags.size() && !def.problemTags[static_cast<size_t>(i)].empty()) {
            p.tags = def.problemTags[static_cast<size_t>(i)];
        } else {
            p.tags = drawTags();
        }
        const double minDiff = def.difficulty * (0.6 + 0.2 * i);
        const double maxDiff = def.difficulty * (0.8 + 0.2 * i);
        p.difficulty = m_ctx.randUniform(minDiff, maxDiff);
        p.maxScore = def.maxScorePerProblem;
        problems.push_back(std::move(p));
    }
    return problems;
}

int PerformanceModel::knowledgeValueFor(const Competitor& competitor, const Problem& problem) const {
    if (problem.tags.empty()) {
        return 0;
    }
    int total = 0;
    for (KnowledgeTag tag : problem.tags) {
        total += competitor.getKnowledge(tag);
    }
    return total / static_cast<int>(problem.tags.size());
}

int PerformanceModel::scoreProblem(const Competitor& competitor,
                                   double problemDifficulty,
                                   int maxScore,
                                   int knowledgeValue,
                                   ContestKind kind) {
    if (maxScore <= 0) {
        return 0;
    }
    const SimulationConfig::Scoring& scoring = m_ctx.config.scoring;

    const double comprehensive = competitor.getComprehensiveAbility(scoring);
    const double mentalIdx = competitor.getMentalIndex(m_ctx);
    const double multiplier = (kind == ContestKind::Practice)
        ? scoring.practiceKnowledgeMultiplier
        : scoring.formalKnowledgeMultiplier;
    const double effectiveAbility = comprehensive + static_cast<double>(knowledgeValue) * multiplier;

    const double performanceRatio = logistic((effectiveAbility - problemDifficulty) / scoring.logisticScale);
    const double stabilityFactor = mentalIdx / 100.0;

    // Less stable competitors have a wider spread.
    const double sigmaPerformance = (100.0 - mentalIdx) / scoring.perfNoiseMentalDivisor + scoring.perfNoiseBase;
    const double randomFactor = m_ctx.randNormal(0.0, sigmaPerformance);

    const double finalRatio = std::clamp(performanceRatio * stabilityFactor * (1.0 + randomFactor), 0.0, 1.0);

    const int granularity = scoring.scoreGranularity;
    int score = static_cast<int>(std::floor(finalRatio * static_cast<double>(maxScore)));
    score = (score / granularity) * granularity;
    return std::clamp(score, 0, maxScore);
}

ScoreSheet PerformanceModel::scoreCompetitor(const Competitor& competitor,
                                             int rosterIndex,
                                             const std::vector<Problem>& problems,
                                             ContestKind kind) {
    ScoreSheet sheet;
    sheet.rosterIndex = rosterIndex;
    sheet.name = competitor.getName();
    sheet.problemScores.reserve(problems.size());
    for (const Problem& p : problems) {
        const int score = scoreProblem(competitor, p.difficulty, p.maxScore, knowledgeValueFor(competitor, p), kind);
        sheet.problemScores.push_back(score);
        sheet.totalScore += score;
    }
    return sheet;
}
