#include "simulation_context.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void readTomlValue(const toml::node_view<const toml::node>& section,
                   std::string_view key,
                   T& target) {
    const toml::node_view<const toml::node> view = section[key];
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, long long>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<long long>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    }
}

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    readTomlValue(root[section], key, target);
}

void readTomlIntArray(const toml::table& root,
                      std::string_view section,
                      std::string_view key,
                      std::vector<int>& target) {
    const toml::array* arr = root[section][key].as_array();
    if (!arr) {
        return;
    }
    std::vector<int> values;
    values.reserve(arr->size());
    for (const toml::node& n : *arr) {
        if (const auto v = n.value<std::int64_t>()) {
            values.push_back(static_cast<int>(*v));
        }
    }
    target = std::move(values);
}

double sanitizeRate(double v, double fallback) {
    if (!std::isfinite(v)) return fallback;
    return std::clamp(v, 0.0, 1.0);
}

double sanitizeNonNegative(double v, double fallback) {
    if (!std::isfinite(v) || v < 0.0) return fallback;
    return v;
}

void sanitizeConfig(SimulationConfig& config) {
    const SimulationConfig defaults{};

    config.season.seasonWeeks = std::max(2, config.season.seasonWeeks);
    if (config.season.weeksPerHalf < 0 || config.season.weeksPerHalf >= config.season.seasonWeeks) {
        config.season.weeksPerHalf = 0;
    }
    const int half = config.resolvedWeeksPerHalf();
    bool weeksValid = static_cast<int>(config.season.stageWeeks.size()) == kStageCount;
    for (size_t i = 0; weeksValid && i < config.season.stageWeeks.size(); ++i) {
        const int w = config.season.stageWeeks[i];
        if (w < 1 || w > half) weeksValid = false;
        if (i > 0 && w <= config.season.stageWeeks[i - 1]) weeksValid = false;
    }
    if (!weeksValid) {
        std::cerr << "[Config] season.stageWeeks must hold " << kStageCount
                  << " ascending weeks within a half-season; using defaults.\n";
        config.season.stageWeeks = defaults.season.stageWeeks;
        if (config.season.stageWeeks.back() > half) {
            // Defaults do not fit a very short season: spread stages evenly instead.
            for (int i = 0; i < kStageCount; ++i) {
                config.season.stageWeeks[static_cast<size_t>(i)] = std::max(1, (i + 1) * half / kStageCount);
            }
        }
    }
    config.season.defaultRosterSize = std::clamp(config.season.defaultRosterSize, 1, 64);

    auto& p = config.province;
    p.weakBasePassRate = sanitizeRate(p.weakBasePassRate, defaults.province.weakBasePassRate);
    p.normalBasePassRate = sanitizeRate(p.normalBasePassRate, defaults.province.normalBasePassRate);
    p.strongBasePassRate = sanitizeRate(p.strongBasePassRate, defaults.province.strongBasePassRate);
    if (p.weakMaxAbility < p.weakMinAbility) std::swap(p.weakMaxAbility, p.weakMinAbility);
    if (p.normalMaxAbility < p.normalMinAbility) std::swap(p.normalMaxAbility, p.normalMinAbility);
    if (p.strongMaxAbility < p.strongMinAbility) std::swap(p.strongMaxAbility, p.strongMinAbility);

    auto& s = config.scoring;
    if (s.logisticScale <= 0.0 || !std::isfinite(s.logisticScale)) s.logisticScale = defaults.scoring.logisticScale;
    if (s.perfNoiseMentalDivisor <= 0.0 || !std::isfinite(s.perfNoiseMentalDivisor)) {
        s.perfNoiseMentalDivisor = defaults.scoring.perfNoiseMentalDivisor;
    }
    s.mentalNoiseStddev = sanitizeNonNegative(s.mentalNoiseStddev, defaults.scoring.mentalNoiseStddev);
    s.perfNoiseBase = sanitizeNonNegative(s.perfNoiseBase, defaults.scoring.perfNoiseBase);
    // Ability has to outweigh knowledge in the comprehensive score.
    if (!std::isfinite(s.abilityWeight) || !std::isfinite(s.knowledgeWeight) ||
        s.abilityWeight < 0.0 || s.knowledgeWeight < 0.0 || s.abilityWeight <= s.knowledgeWeight) {
        std::cerr << "[Config] scoring.abilityWeight must exceed scoring.knowledgeWeight; using defaults.\n";
        s.abilityWeight = defaults.scoring.abilityWeight;
        s.knowledgeWeight = defaults.scoring.knowledgeWeight;
    }
    s.mentalPressureAlpha = sanitizeNonNegative(s.mentalPressureAlpha, defaults.scoring.mentalPressureAlpha);
    s.formalKnowledgeMultiplier = sanitizeNonNegative(s.formalKnowledgeMultiplier, defaults.scoring.formalKnowledgeMultiplier);
    s.practiceKnowledgeMultiplier =
        sanitizeNonNegative(s.practiceKnowledgeMultiplier, defaults.scoring.practiceKnowledgeMultiplier);
    s.problemMaxScore = std::max(1, s.problemMaxScore);
    s.scoreGranularity = std::max(1, s.scoreGranularity);

    auto& f = config.feedback;
    f.passPressureRelief = sanitizeNonNegative(f.passPressureRelief, defaults.feedback.passPressureRelief);
    f.passMentalGain = sanitizeNonNegative(f.passMentalGain, defaults.feedback.passMentalGain);
    f.failPressureGain = sanitizeNonNegative(f.failPressureGain, defaults.feedback.failPressureGain);
    f.failMentalLoss = sanitizeNonNegative(f.failMentalLoss, defaults.feedback.failMentalLoss);
    f.extraPressureCap = std::max(0, f.extraPressureCap);
    if (f.extraPressureUnitDivisor <= 0.0 || !std::isfinite(f.extraPressureUnitDivisor)) {
        f.extraPressureUnitDivisor = defaults.feedback.extraPressureUnitDivisor;
    }
    f.extraPressureApplyFactor =
        sanitizeNonNegative(f.extraPressureApplyFactor, defaults.feedback.extraPressureApplyFactor);

    config.gains.maxKnowledge = sanitizeNonNegative(config.gains.maxKnowledge, defaults.gains.maxKnowledge);
    config.gains.maxThinking = sanitizeNonNegative(config.gains.maxThinking, defaults.gains.maxThinking);
    config.gains.maxCoding = sanitizeNonNegative(config.gains.maxCoding, defaults.gains.maxCoding);
    config.gains.purchasedMultiplier = sanitizeNonNegative(config.gains.purchasedMultiplier, defaults.gains.purchasedMultiplier);

    config.tuning.pressureIncreaseMultiplier =
        sanitizeNonNegative(config.tuning.pressureIncreaseMultiplier, defaults.tuning.pressureIncreaseMultiplier);
    config.tuning.passLineMultiplier =
        sanitizeNonNegative(config.tuning.passLineMultiplier, defaults.tuning.passLineMultiplier);

    for (SimulationConfig::StageTuning& st : config.stages) {
        st.problemCount = std::max(1, st.problemCount);
        st.rewardMin = std::max(0, st.rewardMin);
        st.rewardMax = std::max(0, st.rewardMax);
        if (st.rewardMax < st.rewardMin) std::swap(st.rewardMax, st.rewardMin);
        st.difficulty = sanitizeNonNegative(st.difficulty, 0.0);
        st.gainRatio = sanitizeNonNegative(st.gainRatio, 0.6);
        if (!std::isfinite(st.passRateBonus)) st.passRateBonus = 0.0;
    }
}

} // namespace

std::array<SimulationConfig::StageTuning, kStageCount> SimulationConfig::defaultStageTuning() {
    //        difficulty, problems, rewardMin, rewardMax, passRateBonus, gainRatio
    return {{
        {25.0, 1, 2000, 5000, 0.0, 0.30},
        {75.0, 4, 4000, 8000, 0.0, 0.45},
        {125.0, 4, 10000, 20000, 0.0, 0.60},
        {200.0, 4, 0, 0, 0.2, 0.80},
        {300.0, 4, 30000, 50000, 0.0, 1.00},
    }};
}

int SimulationConfig::resolvedWeeksPerHalf() const {
    if (season.weeksPerHalf > 0) {
        return season.weeksPerHalf;
    }
    return std::max(1, season.seasonWeeks / 2);
}

SimulationContext::SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath)
    : worldSeed(seed), worldRng(seed), config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            std::cerr << "[Config] " << err << " Using built-in defaults.\n";
        }
    }
}

double SimulationContext::rand01() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(worldRng);
}

double SimulationContext::randUniform(double a, double b) {
    if (a > b) {
        std::swap(a, b);
    }
    if (a == b) {
        return a;
    }
    std::uniform_real_distribution<double> dist(a, b);
    return dist(worldRng);
}

int SimulationContext::randInt(int a, int b) {
    if (a > b) {
        std::swap(a, b);
    }
    std::uniform_int_distribution<int> dist(a, b);
    return dist(worldRng);
}

double SimulationContext::randNormal(double mean, double stddev) {
    if (stddev <= 0.0) {
        return mean;
    }
    std::normal_distribution<double> dist(mean, stddev);
    return dist(worldRng);
}

bool SimulationContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = SimulationConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "season", "seasonWeeks", config.season.seasonWeeks);
        readTomlValue(root, "season", "weeksPerHalf", config.season.weeksPerHalf);
        readTomlIntArray(root, "season", "stageWeeks", config.season.stageWeeks);
        readTomlValue(root, "season", "defaultRosterSize", config.season.defaultRosterSize);

        readTomlValue(root, "province", "weakBasePassRate", config.province.weakBasePassRate);
        readTomlValue(root, "province", "normalBasePassRate", config.province.normalBasePassRate);
        readTomlValue(root, "province", "strongBasePassRate", config.province.strongBasePassRate);
        readTomlValue(root, "province", "weakBudget", config.province.weakBudget);
        readTomlValue(root, "province", "normalBudget", config.province.normalBudget);
        readTomlValue(root, "province", "strongBudget", config.province.strongBudget);
        readTomlValue(root, "province", "weakMinAbility", config.province.weakMinAbility);
        readTomlValue(root, "province", "weakMaxAbility", config.province.weakMaxAbility);
        readTomlValue(root, "province", "normalMinAbility", config.province.normalMinAbility);
        readTomlValue(root, "province", "normalMaxAbility", config.province.normalMaxAbility);
        readTomlValue(root, "province", "strongMinAbility", config.province.strongMinAbility);
        readTomlValue(root, "province", "strongMaxAbility", config.province.strongMaxAbility);

        readTomlValue(root, "scoring", "abilityWeight", config.scoring.abilityWeight);
        readTomlValue(root, "scoring", "knowledgeWeight", config.scoring.knowledgeWeight);
        readTomlValue(root, "scoring", "mentalPressureAlpha", config.scoring.mentalPressureAlpha);
        readTomlValue(root, "scoring", "mentalNoiseStddev", config.scoring.mentalNoiseStddev);
        readTomlValue(root, "scoring", "formalKnowledgeMultiplier", config.scoring.formalKnowledgeMultiplier);
        readTomlValue(root, "scoring", "practiceKnowledgeMultiplier", config.scoring.practiceKnowledgeMultiplier);
        readTomlValue(root, "scoring", "logisticScale", config.scoring.logisticScale);
        readTomlValue(root, "scoring", "perfNoiseBase", config.scoring.perfNoiseBase);
        readTomlValue(root, "scoring", "perfNoiseMentalDivisor", config.scoring.perfNoiseMentalDivisor);
        readTomlValue(root, "scoring", "problemMaxScore", config.scoring.problemMaxScore);
        readTomlValue(root, "scoring", "scoreGranularity", config.scoring.scoreGranularity);

        readTomlValue(root, "feedback", "passPressureRelief", config.feedback.passPressureRelief);
        readTomlValue(root, "feedback", "passMentalGain", config.feedback.passMentalGain);
        readTomlValue(root, "feedback", "failPressureGain", config.feedback.failPressureGain);
        readTomlValue(root, "feedback", "failMentalLoss", config.feedback.failMentalLoss);
        readTomlValue(root, "feedback", "extraPressureCap", config.feedback.extraPressureCap);
        readTomlValue(root, "feedback", "extraPressureUnitDivisor", config.feedback.extraPressureUnitDivisor);
        readTomlValue(root, "feedback", "extraPressureApplyFactor", config.feedback.extraPressureApplyFactor);

        readTomlValue(root, "gains", "maxKnowledge", config.gains.maxKnowledge);
        readTomlValue(root, "gains", "maxThinking", config.gains.maxThinking);
        readTomlValue(root, "gains", "maxCoding", config.gains.maxCoding);
        readTomlValue(root, "gains", "purchasedMultiplier", config.gains.purchasedMultiplier);
        readTomlValue(root, "gains", "onlineLowRatio", config.gains.onlineLowRatio);
        readTomlValue(root, "gains", "onlineMediumRatio", config.gains.onlineMediumRatio);
        readTomlValue(root, "gains", "onlineHighRatio", config.gains.onlineHighRatio);
        readTomlValue(root, "gains", "onlineLowMaxDifficulty", config.gains.onlineLowMaxDifficulty);
        readTomlValue(root, "gains", "onlineMediumMaxDifficulty", config.gains.onlineMediumMaxDifficulty);
        readTomlValue(root, "gains", "goodPerformanceRatio", config.gains.goodPerformanceRatio);
        readTomlValue(root, "gains", "poorPerformanceRatio", config.gains.poorPerformanceRatio);
        readTomlValue(root, "gains", "goodMentalGain", config.gains.goodMentalGain);
        readTomlValue(root, "gains", "goodPressureRelief", config.gains.goodPressureRelief);
        readTomlValue(root, "gains", "poorPressureGain", config.gains.poorPressureGain);

        readTomlValue(root, "tuning", "pressureIncreaseMultiplier", config.tuning.pressureIncreaseMultiplier);
        readTomlValue(root, "tuning", "passLineMultiplier", config.tuning.passLineMultiplier);

        const toml::table& constRoot = root;
        for (const StageDefinition& def : getStageDefinitions()) {
            const toml::node_view<const toml::node> section = constRoot["stages"][def.key];
            SimulationConfig::StageTuning& st = config.stages[static_cast<size_t>(stageIndex(def.stage))];
            readTomlValue(section, "difficulty", st.difficulty);
            readTomlValue(section, "problemCount", st.problemCount);
            readTomlValue(section, "rewardMin", st.rewardMin);
            readTomlValue(section, "rewardMax", st.rewardMax);
            readTomlValue(section, "passRateBonus", st.passRateBonus);
            readTomlValue(section, "gainRatio", st.gainRatio);
        }

        sanitizeConfig(config);

        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    config = SimulationConfig{};
    return false;
}

std::string SimulationContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

std::mt19937_64 SimulationContext::makeRng(std::uint64_t salt) const {
    return std::mt19937_64(mix64(worldSeed ^ salt));
}

std::uint64_t SimulationContext::mix64(std::uint64_t x) {
    // SplitMix64 finalizer.
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}
