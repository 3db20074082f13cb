#include "roster_generator.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace {

const std::vector<std::string>& surnames() {
    static const std::vector<std::string> kSurnames = {
        "Zhang", "Li", "Wang", "Liu", "Chen", "Yang", "Huang", "Zhao", "Zhou", "Wu",
        "Xu", "Sun", "Ma", "Zhu", "Hu", "Guo", "He", "Lin", "Luo", "Gao",
        "Liang", "Song", "Zheng", "Xie", "Han", "Tang", "Feng", "Yu", "Dong", "Xiao"
    };
    return kSurnames;
}

const std::vector<std::string>& givenSyllables() {
    static const std::vector<std::string> kGiven = {
        "ming", "hua", "qiang", "jun", "wei", "lei", "jie", "tao", "chao", "peng",
        "na", "min", "jing", "li", "fang", "yun", "ting", "xue", "ling", "chen",
        "yu", "hao", "rui", "xuan", "bo", "zhen", "ze", "xiang", "kai", "wen",
        "wu", "yong", "zhi", "hui", "hong", "qi", "yue", "xin", "han", "yi"
    };
    return kGiven;
}

void abilityRange(const SimulationConfig& config, ProvinceTier province, double& minV, double& maxV) {
    switch (province) {
        case ProvinceTier::Strong:
            minV = config.province.strongMinAbility;
            maxV = config.province.strongMaxAbility;
            return;
        case ProvinceTier::Weak:
            minV = config.province.weakMinAbility;
            maxV = config.province.weakMaxAbility;
            return;
        case ProvinceTier::Normal:
            break;
    }
    minV = config.province.normalMinAbility;
    maxV = config.province.normalMaxAbility;
}

} // namespace

RosterGenerator::RosterGenerator(SimulationContext& ctx)
    : m_config(ctx.config),
      m_rng(ctx.makeRng(0x524F53544552ull)) {} // "ROSTER"

std::string RosterGenerator::generateName() {
    const std::vector<std::string>& family = surnames();
    const std::vector<std::string>& given = givenSyllables();
    std::uniform_int_distribution<int> familyDist(0, static_cast<int>(family.size()) - 1);
    std::uniform_int_distribution<int> givenDist(0, static_cast<int>(given.size()) - 1);
    std::uniform_real_distribution<double> u01(0.0, 1.0);

    std::string name;
    for (int attempt = 0; attempt < 64; ++attempt) {
        std::string first = given[static_cast<size_t>(givenDist(m_rng))];
        // Most given names have two syllables.
        if (u01(m_rng) > 0.4) {
            first += given[static_cast<size_t>(givenDist(m_rng))];
        }
        first[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(first[0])));
        name = family[static_cast<size_t>(familyDist(m_rng))] + " " + first;
        if (m_usedNames.count(name) == 0) {
            m_usedNames.insert(name);
            return name;
        }
    }

    // Pool exhausted for this seed; disambiguate with a counter.
    const std::string base = name;
    for (int n = 2;; ++n) {
        name = base + " " + std::to_string(n);
        if (m_usedNames.insert(name).second) {
            return name;
        }
    }
}

std::vector<Competitor> RosterGenerator::generate(ProvinceTier province, int count) {
    double minV = 0.0;
    double maxV = 0.0;
    abilityRange(m_config, province, minV, maxV);
    // Wide spread around the tier midpoint.
    const double mean = (minV + maxV) / 2.0;
    const double stddev = std::max(0.0, maxV - minV);
    std::normal_distribution<double> abilityDist(mean, stddev > 0.0 ? stddev : 1e-9);
    std::uniform_int_distribution<int> knowledgeDist(0, 3);

    std::vector<Competitor> roster;
    roster.reserve(static_cast<size_t>(std::max(0, count)));
    for (int i = 0; i < count; ++i) {
        const std::string name = generateName();
        const double thinking = std::clamp(abilityDist(m_rng), 0.0, 100.0);
        const double coding = std::clamp(abilityDist(m_rng), 0.0, 100.0);
        const double mental = std::clamp(abilityDist(m_rng), 0.0, 100.0);
        Competitor c(name, thinking, coding, mental);
        for (KnowledgeTag tag : allKnowledgeTags()) {
            c.setKnowledge(tag, knowledgeDist(m_rng));
        }
        roster.push_back(std::move(c));
    }
    return roster;
}
