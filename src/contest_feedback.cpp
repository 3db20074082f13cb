#include "contest_feedback.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

int computeExtraPressure(const SimulationConfig::Feedback& feedback, int score, int totalMax) {
    if (totalMax <= 0) {
        return 0;
    }
    const double midpoint = static_cast<double>(totalMax) / 2.0;
    const double deficit = std::max(0.0, midpoint - static_cast<double>(score));
    const double unit = std::max(1.0, static_cast<double>(totalMax) / feedback.extraPressureUnitDivisor);
    const int extra = static_cast<int>(std::ceil(deficit / unit));
    return std::min(feedback.extraPressureCap, extra);
}

std::vector<CompetitorFeedback> computeContestFeedback(const SimulationConfig& config,
                                                       const std::vector<ScoreSheet>& sheets,
                                                       double passLine,
                                                       int totalMax) {
    std::vector<CompetitorFeedback> out;
    if (sheets.empty()) {
        return out;
    }
    out.reserve(sheets.size());

    int sessionMin = sheets.front().totalScore;
    for (const ScoreSheet& s : sheets) {
        sessionMin = std::min(sessionMin, s.totalScore);
    }
    const double midpoint = static_cast<double>(totalMax) / 2.0;
    const SimulationConfig::Feedback& fb = config.feedback;
    const double mult = config.tuning.pressureIncreaseMultiplier;

    for (const ScoreSheet& s : sheets) {
        CompetitorFeedback f;
        f.rosterIndex = s.rosterIndex;
        f.passed = static_cast<double>(s.totalScore) >= passLine;
        if (f.passed) {
            f.pressureDelta = -fb.passPressureRelief;
            f.mentalDelta = fb.passMentalGain;
        } else {
            f.pressureDelta = fb.failPressureGain * mult;
            f.mentalDelta = -fb.failMentalLoss;
        }

        const bool belowMid = static_cast<double>(s.totalScore) < midpoint;
        const bool lastPlace = s.totalScore == sessionMin;
        if (!f.passed || belowMid || lastPlace) {
            const int extra = computeExtraPressure(fb, s.totalScore, totalMax);
            if (extra > 0) {
                f.extraPressure = extra;
                std::ostringstream remark;
                remark << (lastPlace ? "last place" : "below midpoint") << ", extra pressure +"
                       << static_cast<int>(std::lround(extra * fb.extraPressureApplyFactor * mult));
                f.remark = remark.str();
            }
        }
        if (f.remark.empty()) {
            f.remark = f.passed ? "passed" : "did not pass";
        }
        out.push_back(f);
    }
    return out;
}

void applyContestFeedback(const SimulationConfig& config,
                          std::vector<Competitor>& roster,
                          const std::vector<CompetitorFeedback>& feedback) {
    const double factor = config.feedback.extraPressureApplyFactor * config.tuning.pressureIncreaseMultiplier;
    for (const CompetitorFeedback& f : feedback) {
        if (f.rosterIndex < 0 || f.rosterIndex >= static_cast<int>(roster.size())) {
            std::cerr << "[Contest] Feedback for unknown roster index " << f.rosterIndex << " ignored\n";
            continue;
        }
        Competitor& c = roster[static_cast<size_t>(f.rosterIndex)];
        c.setPressure(c.getPressure() + f.pressureDelta);
        c.setMental(c.getMental() + f.mentalDelta);
        if (f.extraPressure > 0) {
            c.setPressure(c.getPressure() + static_cast<double>(f.extraPressure) * factor);
        }
    }
}

std::string FundingLedger::fundingKey(int halfSeason, const std::string& contestName, int week) {
    std::ostringstream key;
    key << halfSeason << "_" << contestName << "_" << week;
    return key.str();
}

long long FundingLedger::issue(SimulationContext& ctx, const std::string& key, ContestStage stage, int passedParticipants) {
    if (!m_issued.insert(key).second) {
        std::cout << "[Funding] " << key << " already issued, skipping\n";
        return 0;
    }
    const SimulationConfig::StageTuning& tuning = ctx.config.stage(stage);
    long long total = 0;
    if (tuning.rewardMax > 0) {
        for (int i = 0; i < passedParticipants; ++i) {
            total += ctx.randInt(tuning.rewardMin, tuning.rewardMax);
        }
    }
    if (total > 0) {
        std::cout << "[Funding] " << key << ": " << passedParticipants << " passed, +" << total << "\n";
    }
    return total;
}
