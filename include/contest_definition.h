#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "contest_stage.h"

struct SimulationConfig;

enum class ContestKind : std::uint8_t {
    Formal,   // tournament stage, part of the qualification chain
    Practice  // mock/online contest, never touches qualification
};

struct Problem {
    std::vector<KnowledgeTag> tags; // 1..3 distinct tags
    double difficulty = 0.0;
    int maxScore = 100;
};

struct ContestDefinition {
    std::string name;
    ContestKind kind = ContestKind::Formal;
    ContestStage stage = ContestStage::Stage1;
    int week = 0; // 0 means "the session's current week"
    int problemCount = 4;
    double difficulty = 0.0;
    int maxScorePerProblem = 100;

    // Optional caller-chosen tags per problem; drawn at random when empty.
    std::vector<std::vector<KnowledgeTag>> problemTags;

    // Practice only.
    PracticeTier practiceTier = PracticeTier::Medium;
    bool purchased = false;

    int totalMaxScore() const { return problemCount * maxScorePerProblem; }
};

// Tournament stage contest using the configured stage difficulty and problem count.
ContestDefinition makeStageContest(const SimulationConfig& config, ContestStage stage, int week);

// Practice contest; an empty tag list draws random tags for `problemCount` problems.
ContestDefinition makePracticeContest(const SimulationConfig& config,
                                      PracticeTier tier,
                                      double difficulty,
                                      int problemCount,
                                      bool purchased,
                                      const std::vector<std::vector<KnowledgeTag>>& problemTags = {});

// Empty string when the definition is usable, otherwise the reason it is not.
std::string validateContestDefinition(const ContestDefinition& def);
