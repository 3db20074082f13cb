#include "competitor.h"

#include <numeric>

Competitor::Competitor(const std::string& name, double thinking, double coding, double mental)
    : m_name(name),
      m_thinking(clampAxis(thinking)),
      m_coding(clampAxis(coding)),
      m_mental(clampAxis(mental)) {}

int Competitor::getKnowledge(KnowledgeTag tag) const {
    return m_knowledge[static_cast<size_t>(tag)];
}

void Competitor::setKnowledge(KnowledgeTag tag, int value) {
    m_knowledge[static_cast<size_t>(tag)] = std::max(0, value);
}

void Competitor::addKnowledge(KnowledgeTag tag, int amount) {
    int& slot = m_knowledge[static_cast<size_t>(tag)];
    slot = std::max(0, slot + amount);
}

double Competitor::getAbilityAvg() const {
    return (m_thinking + m_coding + m_mental) / 3.0;
}

double Competitor::getKnowledgeAvg() const {
    const int total = std::accumulate(m_knowledge.begin(), m_knowledge.end(), 0);
    return static_cast<double>(total) / static_cast<double>(kKnowledgeTagCount);
}

double Competitor::getComprehensiveAbility(const SimulationConfig::Scoring& scoring) const {
    return scoring.abilityWeight * getAbilityAvg() + scoring.knowledgeWeight * getKnowledgeAvg();
}

double Competitor::getMentalIndex(SimulationContext& ctx) const {
    const SimulationConfig::Scoring& scoring = ctx.config.scoring;
    const double noise = ctx.randNormal(0.0, scoring.mentalNoiseStddev);
    const double result = m_mental
        - scoring.mentalPressureAlpha * (m_pressure / 100.0) * (1.0 - m_comfort / 100.0)
        + noise;
    return std::clamp(result, 0.0, 100.0);
}
