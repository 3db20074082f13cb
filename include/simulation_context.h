#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "contest_stage.h"

struct SimulationConfig {
    struct StageTuning {
        double difficulty = 0.0;
        int problemCount = 4;
        int rewardMin = 0;
        int rewardMax = 0;
        double passRateBonus = 0.0;
        double gainRatio = 0.6; // practice gain ratio for the matching PracticeTier
    };

    struct Season {
        int seasonWeeks = 52;
        int weeksPerHalf = 0; // 0 derives seasonWeeks / 2
        // Week offsets of Stage1..Stage5 inside each half-season.
        std::vector<int> stageWeeks = {5, 9, 13, 19, 24};
        int defaultRosterSize = 6;
    } season{};

    struct Province {
        double weakBasePassRate = 0.40;
        double normalBasePassRate = 0.50;
        double strongBasePassRate = 0.65;
        long long weakBudget = 40000;
        long long normalBudget = 100000;
        long long strongBudget = 200000;
        double weakMinAbility = 20.0;
        double weakMaxAbility = 45.0;
        double normalMinAbility = 30.0;
        double normalMaxAbility = 55.0;
        double strongMinAbility = 50.0;
        double strongMaxAbility = 70.0;
    } province{};

    struct Scoring {
        double abilityWeight = 0.6;
        double knowledgeWeight = 0.4;
        double mentalPressureAlpha = 28.0;
        double mentalNoiseStddev = 3.0;
        double formalKnowledgeMultiplier = 2.0;
        double practiceKnowledgeMultiplier = 3.5;
        double logisticScale = 10.0;
        double perfNoiseBase = 0.05;
        double perfNoiseMentalDivisor = 200.0;
        int problemMaxScore = 100;
        int scoreGranularity = 10;
    } scoring{};

    struct Feedback {
        double passPressureRelief = 10.0;
        double passMentalGain = 3.0;
        double failPressureGain = 15.0;
        double failMentalLoss = 5.0;
        int extraPressureCap = 15;
        double extraPressureUnitDivisor = 20.0;
        double extraPressureApplyFactor = 2.0;
    } feedback{};

    struct Gains {
        double maxKnowledge = 12.0;
        double maxThinking = 10.0;
        double maxCoding = 10.0;
        double purchasedMultiplier = 1.8;
        double onlineLowRatio = 0.4;
        double onlineMediumRatio = 0.6;
        double onlineHighRatio = 0.8;
        double onlineLowMaxDifficulty = 150.0;
        double onlineMediumMaxDifficulty = 300.0;
        double goodPerformanceRatio = 0.7;
        double poorPerformanceRatio = 0.5;
        double goodMentalGain = 2.0;
        double goodPressureRelief = 3.0;
        double poorPressureGain = 20.0;
    } gains{};

    // Global balance knobs (difficulty mode).
    struct Tuning {
        double pressureIncreaseMultiplier = 1.0;
        double passLineMultiplier = 1.0;
    } tuning{};

    std::array<StageTuning, kStageCount> stages = defaultStageTuning();

    static std::array<StageTuning, kStageCount> defaultStageTuning();

    const StageTuning& stage(ContestStage s) const { return stages[static_cast<size_t>(stageIndex(s))]; }
    int resolvedWeeksPerHalf() const;
};

struct SimulationContext {
    std::uint64_t worldSeed = 0;
    std::mt19937_64 worldRng;
    SimulationConfig config;
    std::string configPath;
    std::string configHash;

    explicit SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath = "data/sim_config.toml");

    double rand01();
    double randUniform(double a, double b);
    int randInt(int a, int b); // inclusive
    double randNormal(double mean = 0.0, double stddev = 1.0);

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);

    std::mt19937_64 makeRng(std::uint64_t salt) const;

    static std::uint64_t mix64(std::uint64_t x);
};
