#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "competitor.h"
#include "contest_definition.h"
#include "simulation_context.h"

enum class GainKind : std::uint8_t {
    Discrete,   // knowledge points: floored, deficit goes to the best-scored problem
    Continuous  // ability points: rounded to one decimal, drift accepted
};

struct ProblemPerformance {
    int actualScore = 0;
    int maxScore = 100;
    double difficulty = 0.0; // difficulty proxy, weights harder solves more
};

// Splits totalGainCap across problems proportional to (actual/max) * max(1, difficulty).
// Discrete gains sum to floor(totalGainCap) whenever any problem scored.
std::vector<double> distributeContestGains(double totalGainCap,
                                           const std::vector<ProblemPerformance>& problems,
                                           GainKind kind);

// Everything one competitor needs to turn a practice contest into gains.
struct PracticeOutcome {
    std::vector<Problem> problems;
    std::vector<int> problemScores;
    int totalScore = 0;
    int totalMax = 0;
    int sessionMinScore = 0;
    PracticeTier tier = PracticeTier::Medium;
    double difficulty = 0.0;
    bool purchased = false;
};

struct CompetitorDeltas {
    std::string name;
    double thinking = 0.0;
    double coding = 0.0;
    double mental = 0.0;
    double pressure = 0.0;
    std::array<int, kKnowledgeTagCount> knowledge{};

    bool empty() const;
    std::string describe() const;
};

double practiceGainRatio(const SimulationConfig& config, PracticeTier tier, double difficulty);

// Applies knowledge/thinking/coding gains and the practice psychological feedback.
CompetitorDeltas applyGains(const SimulationConfig& config, Competitor& competitor, const PracticeOutcome& outcome);
