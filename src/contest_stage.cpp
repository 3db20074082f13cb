#include "contest_stage.h"

#include <algorithm>
#include <cctype>

namespace {

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

} // namespace

const std::array<StageDefinition, kStageCount>& getStageDefinitions() {
    static const std::array<StageDefinition, kStageCount> kStages = {{
        {ContestStage::Stage1, "stage1", "CSP-S1", false},
        {ContestStage::Stage2, "stage2", "CSP-S2", false},
        {ContestStage::Stage3, "stage3", "NOIP", false},
        {ContestStage::Stage4, "stage4", "Provincial Selection", false},
        {ContestStage::Stage5, "stage5", "NOI", true},
    }};
    return kStages;
}

const StageDefinition& stageDefinition(ContestStage stage) {
    return getStageDefinitions()[static_cast<size_t>(stageIndex(stage))];
}

int stageIndex(ContestStage stage) {
    return static_cast<int>(stage);
}

ContestStage stageFromIndex(int index) {
    return static_cast<ContestStage>(std::clamp(index, 0, kStageCount - 1));
}

bool hasPreviousStage(ContestStage stage) {
    return stageIndex(stage) > 0;
}

ContestStage previousStage(ContestStage stage) {
    return stageFromIndex(stageIndex(stage) - 1);
}

bool isTerminalStage(ContestStage stage) {
    return stageDefinition(stage).terminal;
}

const std::array<KnowledgeTag, kKnowledgeTagCount>& allKnowledgeTags() {
    static const std::array<KnowledgeTag, kKnowledgeTagCount> kTags = {
        KnowledgeTag::DataStructures,
        KnowledgeTag::Graph,
        KnowledgeTag::String,
        KnowledgeTag::Math,
        KnowledgeTag::DynamicProgramming
    };
    return kTags;
}

const char* knowledgeTagName(KnowledgeTag tag) {
    switch (tag) {
        case KnowledgeTag::DataStructures: return "Data Structures";
        case KnowledgeTag::Graph: return "Graph";
        case KnowledgeTag::String: return "String";
        case KnowledgeTag::Math: return "Math";
        case KnowledgeTag::DynamicProgramming: return "Dynamic Programming";
    }
    return "Unknown";
}

const char* provinceTierName(ProvinceTier tier) {
    switch (tier) {
        case ProvinceTier::Weak: return "weak";
        case ProvinceTier::Normal: return "normal";
        case ProvinceTier::Strong: return "strong";
    }
    return "normal";
}

bool parseProvinceTier(const std::string& value, ProvinceTier& out) {
    const std::string lowered = toLowerAscii(value);
    if (lowered == "weak") {
        out = ProvinceTier::Weak;
        return true;
    }
    if (lowered == "normal") {
        out = ProvinceTier::Normal;
        return true;
    }
    if (lowered == "strong") {
        out = ProvinceTier::Strong;
        return true;
    }
    return false;
}

const char* medalTierName(MedalTier medal) {
    switch (medal) {
        case MedalTier::Gold: return "gold";
        case MedalTier::Silver: return "silver";
        case MedalTier::Bronze: return "bronze";
        case MedalTier::None: return "";
    }
    return "";
}
