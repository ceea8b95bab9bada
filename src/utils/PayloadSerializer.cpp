/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/PayloadSerializer.hpp"
#include "ai/SwarmModes.hpp"
#include <string>

namespace ShoalEngine {

JsonValue PayloadSerializer::vectorToJson(const Vector3D& vector) {
    return JsonValue(JsonArray{JsonValue(vector.getX()), JsonValue(vector.getY()),
                               JsonValue(vector.getZ())});
}

JsonValue PayloadSerializer::agentToJson(const AgentState& agent) {
    JsonValue json;
    json["id"] = JsonValue(agent.id);
    json["position"] = vectorToJson(agent.position);
    json["heading"] = vectorToJson(agent.heading);
    return json;
}

JsonValue PayloadSerializer::agentsToJson(const std::vector<AgentState>& agents) {
    JsonArray array;
    array.reserve(agents.size());
    for (const auto& agent : agents) {
        array.push_back(agentToJson(agent));
    }
    return JsonValue(std::move(array));
}

JsonValue PayloadSerializer::snapshotToJson(const SimulationSnapshot& snapshot) {
    JsonValue params;
    params["num_agents"] = JsonValue(snapshot.params.numAgents);
    params["mode"] = JsonValue(std::string(simulationModeName(snapshot.params.mode)));
    params["timestep"] = JsonValue(snapshot.params.timestep);
    params["update_interval"] = JsonValue(snapshot.params.updateInterval);

    JsonValue json;
    json["type"] = JsonValue("snapshot");
    json["simulation_id"] = JsonValue(snapshot.simulationId);
    json["tick"] = JsonValue(snapshot.tick);
    json["state"] = JsonValue(simulationStateName(snapshot.state));
    json["params"] = std::move(params);
    json["agents"] = agentsToJson(snapshot.agents);
    return json;
}

JsonValue PayloadSerializer::tickToJson(const TickPayload& payload) {
    JsonValue json;
    json["type"] = JsonValue("tick");
    json["simulation_id"] = JsonValue(payload.simulationId);
    json["tick"] = JsonValue(payload.tick);
    json["agents"] = agentsToJson(payload.agents);
    return json;
}

JsonValue PayloadSerializer::messageToJson(const SimulationMessage& message) {
    JsonValue json;
    switch (message.type) {
    case MessageType::Tick:
        if (message.payload) {
            return tickToJson(*message.payload);
        }
        json["type"] = JsonValue("tick");
        break;
    case MessageType::Shutdown:
        json["type"] = JsonValue("shutdown");
        break;
    case MessageType::Fault:
        json["type"] = JsonValue("fault");
        json["message"] = JsonValue(message.reason);
        break;
    }
    return json;
}

JsonValue PayloadSerializer::summaryToJson(const SimulationSummary& summary) {
    JsonValue json;
    json["simulation_id"] = JsonValue(summary.simulationId);
    json["num_agents"] = JsonValue(summary.numAgents);
    json["mode"] = JsonValue(std::string(simulationModeName(summary.mode)));
    json["tick"] = JsonValue(summary.tick);
    json["state"] = JsonValue(simulationStateName(summary.state));
    return json;
}

JsonValue PayloadSerializer::summariesToJson(const std::vector<SimulationSummary>& summaries) {
    JsonArray array;
    array.reserve(summaries.size());
    for (const auto& summary : summaries) {
        array.push_back(summaryToJson(summary));
    }
    return JsonValue(std::move(array));
}

} // namespace ShoalEngine
