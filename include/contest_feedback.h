#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "competitor.h"
#include "contest_stage.h"
#include "performance_model.h"
#include "simulation_context.h"

// Result of the pure "compute deltas" pass for one participant.
struct CompetitorFeedback {
    int rosterIndex = -1;
    bool passed = false;
    double pressureDelta = 0.0; // base pass/fail delta
    double mentalDelta = 0.0;
    int extraPressure = 0;      // recorded, applied once as extra * factor * multiplier
    std::string remark;
};

// min(cap, ceil(max(0, midpoint - score) / max(1, totalMax / divisor))), 0 when totalMax <= 0.
int computeExtraPressure(const SimulationConfig::Feedback& feedback, int score, int totalMax);

std::vector<CompetitorFeedback> computeContestFeedback(const SimulationConfig& config,
                                                       const std::vector<ScoreSheet>& sheets,
                                                       double passLine,
                                                       int totalMax);

// Single apply pass; each competitor's recorded extra pressure is applied exactly once.
void applyContestFeedback(const SimulationConfig& config,
                          std::vector<Competitor>& roster,
                          const std::vector<CompetitorFeedback>& feedback);

// Issues stage rewards at most once per (half-season, contest, week) key.
class FundingLedger {
public:
    static std::string fundingKey(int halfSeason, const std::string& contestName, int week);

    bool isIssued(const std::string& key) const { return m_issued.count(key) > 0; }

    // One draw from the stage reward range per passed participant. Returns 0 for a repeated key.
    long long issue(SimulationContext& ctx, const std::string& key, ContestStage stage, int passedParticipants);

    size_t size() const { return m_issued.size(); }

private:
    std::unordered_set<std::string> m_issued;
};
