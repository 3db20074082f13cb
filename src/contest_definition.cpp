#include "contest_definition.h"

#include "simulation_context.h"

#include <cmath>
#include <sstream>

ContestDefinition makeStageContest(const SimulationConfig& config, ContestStage stage, int week) {
    const SimulationConfig::StageTuning& tuning = config.stage(stage);
    ContestDefinition def;
    def.name = stageDefinition(stage).name;
    def.kind = ContestKind::Formal;
    def.stage = stage;
    def.week = week;
    def.problemCount = tuning.problemCount;
    def.difficulty = tuning.difficulty;
    def.maxScorePerProblem = config.scoring.problemMaxScore;
    return def;
}

ContestDefinition makePracticeContest(const SimulationConfig& config,
                                      PracticeTier tier,
                                      double difficulty,
                                      int problemCount,
                                      bool purchased,
                                      const std::vector<std::vector<KnowledgeTag>>& problemTags) {
    ContestDefinition def;
    def.name = (tier == PracticeTier::Online) ? "Online Contest" : "Mock Contest";
    def.kind = ContestKind::Practice;
    def.difficulty = difficulty;
    def.problemCount = problemTags.empty() ? problemCount : static_cast<int>(problemTags.size());
    def.maxScorePerProblem = config.scoring.problemMaxScore;
    def.problemTags = problemTags;
    def.practiceTier = tier;
    def.purchased = purchased;
    return def;
}

std::string validateContestDefinition(const ContestDefinition& def) {
    std::ostringstream oss;
    if (def.name.empty()) {
        oss << "contest definition has no name";
    } else if (def.problemCount <= 0) {
        oss << "contest '" << def.name << "' has problemCount=" << def.problemCount;
    } else if (def.maxScorePerProblem <= 0) {
        oss << "contest '" << def.name << "' has maxScorePerProblem=" << def.maxScorePerProblem;
    } else if (!std::isfinite(def.difficulty) || def.difficulty < 0.0) {
        oss << "contest '" << def.name << "' has invalid difficulty";
    } else if (!def.problemTags.empty() && static_cast<int>(def.problemTags.size()) != def.problemCount) {
        oss << "contest '" << def.name << "' lists tags for " << def.problemTags.size()
            << " problems but declares " << def.problemCount;
    } else if (def.week < 0) {
        oss << "contest '" << def.name << "' has negative week";
    } else {
        for (size_t i = 0; i < def.problemTags.size(); ++i) {
            const size_t n = def.problemTags[i].size();
            if (n < 1 || n > 3) {
                oss << "contest '" << def.name << "' problem " << (i + 1) << " has " << n << " tags (expected 1..3)";
                break;
            }
        }
    }
    return oss.str();
}
