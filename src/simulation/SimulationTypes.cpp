/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/SimulationTypes.hpp"
#include "core/SimulationErrors.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ShoalEngine {

void SimulationSettings::validate() const {
    if (numAgents < MIN_AGENTS || numAgents > MAX_AGENTS) {
        throw InvalidConfigurationError(
            "num_agents must be in [" + std::to_string(MIN_AGENTS) + ", " +
            std::to_string(MAX_AGENTS) + "], got " + std::to_string(numAgents));
    }
    if (!std::isfinite(timestep) || timestep <= 0.0f || timestep > MAX_TIMESTEP) {
        throw InvalidConfigurationError("timestep must be in (0, " +
                                        std::to_string(MAX_TIMESTEP) + "], got " +
                                        std::to_string(timestep));
    }
    if (!std::isfinite(updateInterval) || updateInterval <= 0.0f ||
        updateInterval > MAX_UPDATE_INTERVAL) {
        throw InvalidConfigurationError("update_interval must be in (0, " +
                                        std::to_string(MAX_UPDATE_INTERVAL) + "], got " +
                                        std::to_string(updateInterval));
    }
    if (channelCapacity == 0) {
        throw InvalidConfigurationError("channel_capacity must be at least 1");
    }
    if (static_cast<size_t>(mode) > static_cast<size_t>(SimulationMode::DPP)) {
        throw InvalidConfigurationError("unsupported simulation mode");
    }
}

SimulationSettings SimulationSettings::fromSettings(const SettingsManager& settings) {
    SimulationSettings result;

    const std::string modeName =
        settings.get<std::string>("simulation", "mode",
                                  std::string(simulationModeName(result.mode)));
    auto mode = parseSimulationMode(modeName);
    if (!mode) {
        throw InvalidConfigurationError("unsupported mode '" + modeName +
                                        "', expected swarm, torus, hpp or dpp");
    }
    result.mode = *mode;

    result.numAgents = settings.get<int>("simulation", "num_agents", result.numAgents);
    result.timestep = settings.get<float>("simulation", "timestep", result.timestep);
    result.updateInterval =
        settings.get<float>("simulation", "update_interval", result.updateInterval);
    result.strictTurnRate =
        settings.get<bool>("simulation", "strict_turn_rate", result.strictTurnRate);

    const int capacity = settings.get<int>("simulation", "channel_capacity",
                                           static_cast<int>(result.channelCapacity));
    if (capacity < 1) {
        throw InvalidConfigurationError("channel_capacity must be at least 1, got " +
                                        std::to_string(capacity));
    }
    result.channelCapacity = static_cast<size_t>(capacity);

    const int seed = settings.get<int>("simulation", "seed", 0);
    result.seed = static_cast<uint32_t>(seed);

    const int threshold = settings.get<int>("threading", "parallel_agent_threshold",
                                            static_cast<int>(result.parallelAgentThreshold));
    result.parallelAgentThreshold = static_cast<size_t>(std::max(threshold, 1));

    result.validate();
    return result;
}

const char* simulationStateName(SimulationState state) {
    switch (state) {
    case SimulationState::Idle:
        return "idle";
    case SimulationState::Running:
        return "running";
    case SimulationState::Stopping:
        return "stopping";
    case SimulationState::Closed:
        return "closed";
    case SimulationState::Faulted:
        return "faulted";
    }
    return "unknown";
}

} // namespace ShoalEngine
