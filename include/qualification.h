#pragma once

#include <array>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "competitor.h"
#include "contest_stage.h"

// Who passed which stage, per half-season. Keyed by competitor name.
class QualificationLedger {
public:
    static constexpr int kHalfSeasons = 2;

    static int halfSeasonForWeek(int week, int weeksPerHalf);

    bool hasQualified(int halfSeason, ContestStage stage, const std::string& name) const;
    // Active, and (for stages after the first) passed the previous stage in the same half-season.
    bool isEligible(int halfSeason, ContestStage stage, const Competitor& competitor) const;
    std::vector<int> eligibleIndices(int halfSeason, ContestStage stage, const std::vector<Competitor>& roster) const;

    // Creates the stage set on first write. Returns false for an out-of-range half-season.
    bool recordPassed(int halfSeason, ContestStage stage, const std::string& name);
    bool touchStage(int halfSeason, ContestStage stage);

    // nullptr when nothing was ever recorded for the stage.
    const std::unordered_set<std::string>* getQualified(int halfSeason, ContestStage stage) const;
    std::vector<std::string> getQualifiedSorted(int halfSeason, ContestStage stage) const;
    size_t qualifiedCount(int halfSeason, ContestStage stage) const;

    static void setDebugMode(bool enabled) { s_debugMode = enabled; }

private:
    static bool validHalf(int halfSeason) { return halfSeason >= 0 && halfSeason < kHalfSeasons; }

    std::array<std::unordered_map<int, std::unordered_set<std::string>>, kHalfSeasons> m_halves;
    static bool s_debugMode;
};
