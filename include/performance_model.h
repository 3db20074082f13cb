#pragma once

#include <string>
#include <vector>

#include "competitor.h"
#include "contest_definition.h"
#include "simulation_context.h"

// Per-competitor scores for one contest.
struct ScoreSheet {
    int rosterIndex = -1;
    std::string name;
    std::vector<int> problemScores;
    int totalScore = 0;
};

class PerformanceModel {
public:
    explicit PerformanceModel(SimulationContext& ctx);

    // Problem i draws its difficulty from [d*(0.6+0.2i), d*(0.8+0.2i)], so earlier problems are easier.
    std::vector<Problem> buildProblemSet(const ContestDefinition& def);

    // Floor of the competitor's mean knowledge over the problem's tags.
    int knowledgeValueFor(const Competitor& competitor, const Problem& problem) const;

    // Stochastic score in [0, maxScore], a multiple of the configured granularity.
    int scoreProblem(const Competitor& competitor,
                     double problemDifficulty,
                     int maxScore,
                     int knowledgeValue,
                     ContestKind kind);

    ScoreSheet scoreCompetitor(const Competitor& competitor,
                               int rosterIndex,
                               const std::vector<Problem>& problems,
                               ContestKind kind);

    static double logistic(double x);

private:
    std::vector<KnowledgeTag> drawTags();

    SimulationContext& m_ctx;
};
