#include "qualification.h"

#include <algorithm>
#include <iostream>

bool QualificationLedger::s_debugMode = false;

int QualificationLedger::halfSeasonForWeek(int week, int weeksPerHalf) {
    return (week > weeksPerHalf) ? 1 : 0;
}

bool QualificationLedger::hasQualified(int halfSeason, ContestStage stage, const std::string& name) const {
    const std::unordered_set<std::string>* passed = getQualified(halfSeason, stage);
    return passed && passed->count(name) > 0;
}

bool QualificationLedger::isEligible(int halfSeason, ContestStage stage, const Competitor& competitor) const {
    if (!competitor.isActive()) {
        return false;
    }
    if (!hasPreviousStage(stage)) {
        if (s_debugMode) {
            std::cout << "[Qualification] " << competitor.getName() << " may enter "
                      << stageDefinition(stage).name << " (first stage)\n";
        }
        return true;
    }
    const ContestStage prev = previousStage(stage);
    const bool ok = hasQualified(halfSeason, prev, competitor.getName());
    if (s_debugMode) {
        std::cout << "[Qualification] " << competitor.getName()
                  << (ok ? " passed " : " did not pass ") << stageDefinition(prev).name
                  << (ok ? ", may enter " : ", cannot enter ") << stageDefinition(stage).name
                  << " (half " << halfSeason << ")\n";
    }
    return ok;
}

std::vector<int> QualificationLedger::eligibleIndices(int halfSeason,
                                                      ContestStage stage,
                                                      const std::vector<Competitor>& roster) const {
    std::vector<int> out;
    for (size_t i = 0; i < roster.size(); ++i) {
        if (isEligible(halfSeason, stage, roster[i])) {
            out.push_back(static_cast<int>(i));
        }
    }
    return out;
}

bool QualificationLedger::touchStage(int halfSeason, ContestStage stage) {
    if (!validHalf(halfSeason)) {
        return false;
    }
    m_halves[static_cast<size_t>(halfSeason)][stageIndex(stage)];
    return true;
}

bool QualificationLedger::recordPassed(int halfSeason, ContestStage stage, const std::string& name) {
    if (!validHalf(halfSeason)) {
        std::cerr << "[Qualification] Ignoring record for invalid half-season " << halfSeason << "\n";
        return false;
    }
    m_halves[static_cast<size_t>(halfSeason)][stageIndex(stage)].insert(name);
    if (s_debugMode) {
        std::cout << "[Qualification] half " << halfSeason << " " << stageDefinition(stage).name
                  << ": " << name << " advances\n";
    }
    return true;
}

const std::unordered_set<std::string>* QualificationLedger::getQualified(int halfSeason, ContestStage stage) const {
    if (!validHalf(halfSeason)) {
        return nullptr;
    }
    const auto& half = m_halves[static_cast<size_t>(halfSeason)];
    const auto it = half.find(stageIndex(stage));
    if (it == half.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> QualificationLedger::getQualifiedSorted(int halfSeason, ContestStage stage) const {
    std::vector<std::string> names;
    if (const std::unordered_set<std::string>* passed = getQualified(halfSeason, stage)) {
        names.assign(passed->begin(), passed->end());
        std::sort(names.begin(), names.end());
    }
    return names;
}

size_t QualificationLedger::qualifiedCount(int halfSeason, ContestStage stage) const {
    const std::unordered_set<std::string>* passed = getQualified(halfSeason, stage);
    return passed ? passed->size() : 0;
}
