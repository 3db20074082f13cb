#include "gain_distribution.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

std::vector<double> distributeContestGains(double totalGainCap,
                                           const std::vector<ProblemPerformance>& problems,
                                           GainKind kind) {
    if (problems.empty()) {
        return {};
    }

    std::vector<double> weights;
    weights.reserve(problems.size());
    for (const ProblemPerformance& p : problems) {
        const double scoreRatio = (p.actualScore > 0)
            ? static_cast<double>(p.actualScore) / static_cast<double>(std::max(1, p.maxScore))
            : 0.0;
        const double difficultyFactor = std::max(1.0, p.difficulty);
        weights.push_back(scoreRatio * difficultyFactor);
    }

    const double totalWeight = std::accumulate(weights.begin(), weights.end(), 0.0);
    std::vector<double> gains(problems.size(), 0.0);
    if (totalWeight <= 0.0 || !std::isfinite(totalGainCap) || totalGainCap <= 0.0) {
        return gains;
    }

    for (size_t i = 0; i < weights.size(); ++i) {
        const double rawGain = (weights[i] / totalWeight) * totalGainCap;
        gains[i] = (kind == GainKind::Discrete)
            ? std::floor(rawGain)
            : std::round(rawGain * 10.0) / 10.0;
    }

    if (kind == GainKind::Discrete) {
        const double actualTotal = std::accumulate(gains.begin(), gains.end(), 0.0);
        const double deficit = std::floor(totalGainCap) - actualTotal;
        if (deficit > 0.0) {
            // First occurrence wins ties.
            size_t best = 0;
            for (size_t i = 1; i < problems.size(); ++i) {
                if (problems[i].actualScore > problems[best].actualScore) {
                    best = i;
                }
            }
            gains[best] += deficit;
        }
    }

    return gains;
}

double practiceGainRatio(const SimulationConfig& config, PracticeTier tier, double difficulty) {
    switch (tier) {
        case PracticeTier::Easy: return config.stage(ContestStage::Stage1).gainRatio;
        case PracticeTier::Medium: return config.stage(ContestStage::Stage2).gainRatio;
        case PracticeTier::Hard: return config.stage(ContestStage::Stage3).gainRatio;
        case PracticeTier::Hell: return config.stage(ContestStage::Stage4).gainRatio;
        case PracticeTier::Online:
            if (difficulty < config.gains.onlineLowMaxDifficulty) return config.gains.onlineLowRatio;
            if (difficulty <= config.gains.onlineMediumMaxDifficulty) return config.gains.onlineMediumRatio;
            return config.gains.onlineHighRatio;
    }
    return config.gains.onlineMediumRatio;
}

CompetitorDeltas applyGains(const SimulationConfig& config, Competitor& competitor, const PracticeOutcome& outcome) {
    CompetitorDeltas deltas;
    deltas.name = competitor.getName();

    const double beforeThinking = competitor.getThinking();
    const double beforeCoding = competitor.getCoding();
    const double beforeMental = competitor.getMental();
    const double beforePressure = competitor.getPressure();
    const std::array<int, kKnowledgeTagCount> beforeKnowledge = competitor.getKnowledgeAll();

    const double ratio = practiceGainRatio(config, outcome.tier, outcome.difficulty);
    const double mult = outcome.purchased ? config.gains.purchasedMultiplier : 1.0;
    const double knowledgeCap = config.gains.maxKnowledge * ratio * mult;
    const double thinkingCap = config.gains.maxThinking * ratio * mult;
    const double codingCap = config.gains.maxCoding * ratio * mult;

    std::vector<ProblemPerformance> perf;
    perf.reserve(outcome.problems.size());
    for (size_t i = 0; i < outcome.problems.size(); ++i) {
        ProblemPerformance pp;
        pp.actualScore = (i < outcome.problemScores.size()) ? outcome.problemScores[i] : 0;
        pp.maxScore = outcome.problems[i].maxScore;
        pp.difficulty = outcome.problems[i].difficulty;
        perf.push_back(pp);
    }

    const std::vector<double> knowledgeGains = distributeContestGains(knowledgeCap, perf, GainKind::Discrete);
    const std::vector<double> thinkingGains = distributeContestGains(thinkingCap, perf, GainKind::Continuous);
    const std::vector<double> codingGains = distributeContestGains(codingCap, perf, GainKind::Continuous);

    // A problem's knowledge gain is shared evenly by its tags.
    for (size_t i = 0; i < outcome.problems.size() && i < knowledgeGains.size(); ++i) {
        const int gain = static_cast<int>(knowledgeGains[i]);
        if (gain <= 0) continue;
        const std::vector<KnowledgeTag>& tags = outcome.problems[i].tags;
        const int perTag = gain / std::max<int>(1, static_cast<int>(tags.size()));
        if (perTag <= 0) continue;
        for (KnowledgeTag tag : tags) {
            competitor.addKnowledge(tag, perTag);
        }
    }

    const double totalThinking = std::accumulate(thinkingGains.begin(), thinkingGains.end(), 0.0);
    const double totalCoding = std::accumulate(codingGains.begin(), codingGains.end(), 0.0);
    if (totalThinking > 0.0) {
        competitor.setThinking(competitor.getThinking() + totalThinking);
    }
    if (totalCoding > 0.0) {
        competitor.setCoding(competitor.getCoding() + totalCoding);
    }

    const double performanceRatio = static_cast<double>(outcome.totalScore) / static_cast<double>(std::max(1, outcome.totalMax));
    if (performanceRatio >= config.gains.goodPerformanceRatio) {
        competitor.setMental(competitor.getMental() + config.gains.goodMentalGain);
        competitor.setPressure(competitor.getPressure() - config.gains.goodPressureRelief);
    } else if (performanceRatio < config.gains.poorPerformanceRatio || outcome.totalScore == outcome.sessionMinScore) {
        competitor.setPressure(competitor.getPressure() + config.gains.poorPressureGain);
    }

    deltas.thinking = competitor.getThinking() - beforeThinking;
    deltas.coding = competitor.getCoding() - beforeCoding;
    deltas.mental = competitor.getMental() - beforeMental;
    deltas.pressure = competitor.getPressure() - beforePressure;
    for (int t = 0; t < kKnowledgeTagCount; ++t) {
        deltas.knowledge[static_cast<size_t>(t)] =
            competitor.getKnowledgeAll()[static_cast<size_t>(t)] - beforeKnowledge[static_cast<size_t>(t)];
    }
    return deltas;
}

bool CompetitorDeltas::empty() const {
    if (thinking != 0.0 || coding != 0.0 || mental != 0.0 || pressure != 0.0) {
        return false;
    }
    return std::all_of(knowledge.begin(), knowledge.end(), [](int k) { return k == 0; });
}

std::string CompetitorDeltas::describe() const {
    if (empty()) {
        return name + ": no significant change";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << name << ":";
    bool first = true;
    auto emit = [&](const char* label, double v) {
        if (v == 0.0) return;
        oss << (first ? " " : ", ") << label << " " << (v > 0.0 ? "+" : "") << v;
        first = false;
    };
    emit("Thinking", thinking);
    emit("Coding", coding);
    emit("Mental", mental);
    emit("Pressure", pressure);
    for (KnowledgeTag tag : allKnowledgeTags()) {
        const int k = knowledge[static_cast<size_t>(tag)];
        if (k == 0) continue;
        oss << (first ? " " : ", ") << knowledgeTagName(tag) << " " << (k > 0 ? "+" : "") << k;
        first = false;
    }
    return oss.str();
}
