#include "pass_line.h"

#include <algorithm>
#include <cmath>

namespace {

constexpr double kTerminalMinShare = 0.8;
constexpr double kStageMinShare = 0.3;
constexpr double kStageMaxShare = 0.9;

constexpr double kGoldShare = 1.0;
constexpr double kSilverShare = 0.7;
constexpr double kBronzeShare = 0.5;

} // namespace

double basePassRate(const SimulationConfig& config, ProvinceTier province) {
    switch (province) {
        case ProvinceTier::Strong: return config.province.strongBasePassRate;
        case ProvinceTier::Weak: return config.province.weakBasePassRate;
        case ProvinceTier::Normal: return config.province.normalBasePassRate;
    }
    return config.province.normalBasePassRate;
}

double passRateFor(const SimulationConfig& config, ProvinceTier province, ContestStage stage) {
    return basePassRate(config, province) + config.stage(stage).passRateBonus;
}

double calculatePassLine(const std::vector<int>& sortedScoresDesc,
                         double passRate,
                         int totalMax,
                         ContestStage stage,
                         double passLineMultiplier) {
    if (sortedScoresDesc.empty()) {
        return 0.0;
    }
    const int n = static_cast<int>(sortedScoresDesc.size());
    int passCount = std::max(1, static_cast<int>(std::floor(static_cast<double>(n) * passRate)));
    passCount = std::min(passCount, n);
    double baseLine = static_cast<double>(sortedScoresDesc[static_cast<size_t>(passCount - 1)]);

    if (totalMax > 0) {
        const double total = static_cast<double>(totalMax);
        if (isTerminalStage(stage)) {
            baseLine = std::max(baseLine, total * kTerminalMinShare);
        } else {
            baseLine = std::max(baseLine, total * kStageMinShare);
            baseLine = std::min(baseLine, total * kStageMaxShare);
        }
    }

    return baseLine * passLineMultiplier;
}

MedalTier medalFor(double score, double passLine) {
    if (score >= passLine * kGoldShare) return MedalTier::Gold;
    if (score >= passLine * kSilverShare) return MedalTier::Silver;
    if (score >= passLine * kBronzeShare) return MedalTier::Bronze;
    return MedalTier::None;
}
