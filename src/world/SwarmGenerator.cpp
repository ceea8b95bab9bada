/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/SwarmGenerator.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <string>

namespace ShoalEngine {

uint32_t SwarmGenerator::resolveSeed(uint32_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device device;
    uint32_t drawn = device();
    return drawn != 0 ? drawn : 1u;
}

std::vector<Agent> SwarmGenerator::generate(const SwarmGenerationConfig& config) {
    std::mt19937 rng(resolveSeed(config.seed));
    std::uniform_real_distribution<float> coordinate(-config.halfExtent, config.halfExtent);

    std::vector<Agent> agents;
    agents.reserve(config.agentCount);

    for (uint32_t i = 0; i < config.agentCount; ++i) {
        // Draw order fixed so a seed always yields the same layout
        const float x = coordinate(rng);
        const float y = coordinate(rng);
        agents.emplace_back(i, Vector3D(x, y, 0.0f), randomHeading(rng));
    }

    SIMULATION_DEBUG("Generated swarm of " + std::to_string(agents.size()) + " agents");
    return agents;
}

Vector3D SwarmGenerator::randomHeading(std::mt19937& rng) {
    std::normal_distribution<float> noise(0.0f, 1.0f);
    constexpr float base = 0.1f;

    const float n1 = noise(rng);
    const float n2 = noise(rng);
    Vector3D heading(base, std::sin(base) + 0.1f * n1, std::cos(base) + 0.1f * n2);
    heading.normalize();

    // The y/z noise cannot cancel x = 0.1, so heading is never degenerate
    return heading;
}

} // namespace ShoalEngine
