#pragma once

#include <vector>

#include "contest_stage.h"
#include "simulation_context.h"

double basePassRate(const SimulationConfig& config, ProvinceTier province);
// Province base rate plus the stage's bonus (Stage4 by default).
double passRateFor(const SimulationConfig& config, ProvinceTier province, ContestStage stage);

// sortedScoresDesc must be in descending order. An empty list yields 0.
// Bounds relative to totalMax: terminal stage >= 80%, other stages within [30%, 90%].
// passLineMultiplier is applied after the bounds.
double calculatePassLine(const std::vector<int>& sortedScoresDesc,
                         double passRate,
                         int totalMax,
                         ContestStage stage,
                         double passLineMultiplier = 1.0);

// Thresholds are fractions of the pass line, not of the maximum score.
MedalTier medalFor(double score, double passLine);
