#pragma once

#include <algorithm>
#include <array>
#include <string>

#include "contest_stage.h"
#include "simulation_context.h"

class Competitor {
public:
    Competitor(const std::string& name, double thinking, double coding, double mental);

    const std::string& getName() const { return m_name; }

    // Bounded axes are clamped to [0,100] on every write.
    double getThinking() const { return m_thinking; }
    void setThinking(double v) { m_thinking = clampAxis(v); }
    double getCoding() const { return m_coding; }
    void setCoding(double v) { m_coding = clampAxis(v); }
    double getMental() const { return m_mental; }
    void setMental(double v) { m_mental = clampAxis(v); }
    double getPressure() const { return m_pressure; }
    void setPressure(double v) { m_pressure = clampAxis(v); }
    double getComfort() const { return m_comfort; }
    void setComfort(double v) { m_comfort = clampAxis(v); }

    // Knowledge counters have no upper bound.
    int getKnowledge(KnowledgeTag tag) const;
    void setKnowledge(KnowledgeTag tag, int value);
    void addKnowledge(KnowledgeTag tag, int amount);
    const std::array<int, kKnowledgeTagCount>& getKnowledgeAll() const { return m_knowledge; }

    bool isActive() const { return m_active; }
    void setActive(bool active) { m_active = active; }

    double getAbilityAvg() const;
    double getKnowledgeAvg() const;
    double getComprehensiveAbility(const SimulationConfig::Scoring& scoring) const;
    // Stochastic: pressure erodes consistency, comfort moderates it.
    double getMentalIndex(SimulationContext& ctx) const;

private:
    static double clampAxis(double v) { return std::clamp(v, 0.0, 100.0); }

    std::string m_name;
    double m_thinking = 0.0;
    double m_coding = 0.0;
    double m_mental = 0.0;
    double m_pressure = 20.0;
    double m_comfort = 50.0;
    std::array<int, kKnowledgeTagCount> m_knowledge{};
    bool m_active = true;
};
