#pragma once

#include <array>
#include <cstdint>
#include <string>

// Ordered tournament chain. Stage5 is the terminal stage (medals).
enum class ContestStage : std::uint8_t {
    Stage1 = 0,
    Stage2 = 1,
    Stage3 = 2,
    Stage4 = 3,
    Stage5 = 4
};

constexpr int kStageCount = 5;

enum class KnowledgeTag : std::uint8_t {
    DataStructures = 0,
    Graph = 1,
    String = 2,
    Math = 3,
    DynamicProgramming = 4
};

constexpr int kKnowledgeTagCount = 5;

// Province archetype; selects the base pass rate, budget and starting ability range.
enum class ProvinceTier : std::uint8_t {
    Weak,
    Normal,
    Strong
};

// Practice contest grade. Easy..Hell borrow the gain ratio of Stage1..Stage4,
// Online picks a ratio from the contest difficulty.
enum class PracticeTier : std::uint8_t {
    Easy,
    Medium,
    Hard,
    Hell,
    Online
};

enum class MedalTier : std::uint8_t {
    None,
    Bronze,
    Silver,
    Gold
};

struct StageDefinition {
    ContestStage stage;
    std::string key;  // config section and idempotency key component
    std::string name; // display name
    bool terminal;
};

const std::array<StageDefinition, kStageCount>& getStageDefinitions();
const StageDefinition& stageDefinition(ContestStage stage);

int stageIndex(ContestStage stage);
ContestStage stageFromIndex(int index); // clamps into the chain
bool hasPreviousStage(ContestStage stage);
ContestStage previousStage(ContestStage stage); // Stage1 maps to itself
bool isTerminalStage(ContestStage stage);

const std::array<KnowledgeTag, kKnowledgeTagCount>& allKnowledgeTags();
const char* knowledgeTagName(KnowledgeTag tag);

const char* provinceTierName(ProvinceTier tier);
bool parseProvinceTier(const std::string& value, ProvinceTier& out);

const char* medalTierName(MedalTier medal);
