/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PAYLOAD_SERIALIZER_HPP
#define PAYLOAD_SERIALIZER_HPP

#include "simulation/SimulationTypes.hpp"
#include "utils/JsonReader.hpp"
#include "utils/Vector3D.hpp"
#include <vector>

namespace ShoalEngine {

/**
 * @brief JSON rendering of the data a transport relays to observers
 *
 * Every top-level message carries a "type" member: "snapshot", "tick",
 * "shutdown" or "fault". Vectors are written as [x, y, z] arrays.
 */
class PayloadSerializer {
public:
    static JsonValue vectorToJson(const Vector3D& vector);
    static JsonValue agentToJson(const AgentState& agent);

    // {type, simulation_id, tick, state, params:{...}, agents:[...]}
    static JsonValue snapshotToJson(const SimulationSnapshot& snapshot);

    // {type, simulation_id, tick, agents:[...]}
    static JsonValue tickToJson(const TickPayload& payload);

    // Tick, shutdown or fault marker depending on the message type
    static JsonValue messageToJson(const SimulationMessage& message);

    static JsonValue summaryToJson(const SimulationSummary& summary);
    static JsonValue summariesToJson(const std::vector<SimulationSummary>& summaries);

private:
    static JsonValue agentsToJson(const std::vector<AgentState>& agents);
};

} // namespace ShoalEngine

#endif // PAYLOAD_SERIALIZER_HPP
