/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SWARM_GENERATOR_HPP
#define SWARM_GENERATOR_HPP

#include "entities/Agent.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace ShoalEngine {

struct SwarmGenerationConfig {
    uint32_t agentCount{20};
    uint32_t seed{0};           // 0 draws a seed from std::random_device
    float halfExtent{15.0f};    // x and y are uniform in [-halfExtent, halfExtent]
};

/**
 * Places a fresh swarm on the z = 0 plane.
 *
 * Agents get ids 0..N-1, default speed and perception, and a heading near
 * (0.1, sin 0.1, cos 0.1) perturbed by gaussian noise on y and z.
 */
class SwarmGenerator {
public:
    static std::vector<Agent> generate(const SwarmGenerationConfig& config);

    // Resolves a configured seed of 0 into a concrete one
    static uint32_t resolveSeed(uint32_t seed);

private:
    static Vector3D randomHeading(std::mt19937& rng);
};

} // namespace ShoalEngine

#endif // SWARM_GENERATOR_HPP
