/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_TYPES_HPP
#define SIMULATION_TYPES_HPP

#include "ai/FlockEngine.hpp"
#include "ai/SwarmModes.hpp"
#include "entities/Agent.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ShoalEngine {

class SettingsManager;

using SimulationID = uint64_t;
constexpr SimulationID INVALID_SIMULATION_ID = 0;

/**
 * @brief Creation parameters of one simulation
 *
 * Fixed for the lifetime of the simulation. validate() is the single place
 * that enforces the bounds; SimulationInstance and SimulationManager call it
 * before constructing anything.
 */
struct SimulationSettings {
    static constexpr int MIN_AGENTS = 1;
    static constexpr int MAX_AGENTS = 500;
    static constexpr size_t DEFAULT_CHANNEL_CAPACITY = 256;
    // Upper bounds keep the interval representable as a steady_clock duration
    static constexpr float MAX_TIMESTEP = 3600.0f;
    static constexpr float MAX_UPDATE_INTERVAL = 3600.0f;

    int numAgents{20};
    SimulationMode mode{SimulationMode::Swarm};
    float timestep{0.1f};       // simulated seconds per tick
    float updateInterval{0.1f}; // wall-clock seconds between ticks
    size_t channelCapacity{DEFAULT_CHANNEL_CAPACITY};
    bool strictTurnRate{false};
    uint32_t seed{0};           // 0 = random placement
    size_t parallelAgentThreshold{FlockEngine::DEFAULT_PARALLEL_THRESHOLD};

    /**
     * @throws InvalidConfigurationError naming the first offending field
     */
    void validate() const;

    /**
     * @brief Build settings from the "simulation" and "threading" categories
     *
     * Missing keys fall back to the defaults above. The result is validated.
     * @throws InvalidConfigurationError on an unknown mode or out-of-range value
     */
    static SimulationSettings fromSettings(const SettingsManager& settings);
};

// Stable part of a simulation's lifecycle, see SimulationInstance
enum class SimulationState : uint8_t { Idle, Running, Stopping, Closed, Faulted };

const char* simulationStateName(SimulationState state);

inline std::ostream& operator<<(std::ostream& os, SimulationState state) {
    return os << simulationStateName(state);
}

struct AgentState {
    AgentID id{0};
    Vector3D position;
    Vector3D heading;
};

// Delta broadcast after every completed tick
struct TickPayload {
    SimulationID simulationId{INVALID_SIMULATION_ID};
    uint64_t tick{0};
    std::vector<AgentState> agents;
};

// Point-in-time view of one simulation
struct SimulationSnapshot {
    SimulationID simulationId{INVALID_SIMULATION_ID};
    uint64_t tick{0};
    SimulationState state{SimulationState::Idle};
    SimulationSettings params;
    std::vector<AgentState> agents;
};

struct SimulationSummary {
    SimulationID simulationId{INVALID_SIMULATION_ID};
    int numAgents{0};
    SimulationMode mode{SimulationMode::Swarm};
    uint64_t tick{0};
    SimulationState state{SimulationState::Idle};
};

enum class MessageType : uint8_t {
    Tick,     // payload holds the new tick
    Shutdown, // simulation was deleted; terminal
    Fault     // tick loop failed; terminal, reason is set
};

struct SimulationMessage {
    MessageType type{MessageType::Tick};
    std::shared_ptr<const TickPayload> payload; // shared by every subscriber
    std::string reason;

    [[nodiscard]] bool isTerminal() const { return type != MessageType::Tick; }

    static SimulationMessage tick(std::shared_ptr<const TickPayload> payload) {
        return SimulationMessage{MessageType::Tick, std::move(payload), {}};
    }
    static SimulationMessage shutdown() {
        return SimulationMessage{MessageType::Shutdown, nullptr, {}};
    }
    static SimulationMessage fault(std::string reason) {
        return SimulationMessage{MessageType::Fault, nullptr, std::move(reason)};
    }
};

} // namespace ShoalEngine

#endif // SIMULATION_TYPES_HPP
