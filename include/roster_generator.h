#pragma once

#include <random>
#include <string>
#include <unordered_set>
#include <vector>

#include "competitor.h"
#include "contest_stage.h"
#include "simulation_context.h"

// Draws an initial roster on its own RNG stream so contest draws stay reproducible.
class RosterGenerator {
public:
    explicit RosterGenerator(SimulationContext& ctx);

    // Names are unique within the generator's lifetime.
    std::vector<Competitor> generate(ProvinceTier province, int count);

    std::string generateName();

private:
    const SimulationConfig& m_config;
    std::mt19937_64 m_rng;
    std::unordered_set<std::string> m_usedNames;
};
