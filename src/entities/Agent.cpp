/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Agent.hpp"
#include "core/SimulationErrors.hpp"
#include <cmath>
#include <string>

namespace ShoalEngine {

Agent::Agent(AgentID id, const Vector3D& position, const Vector3D& heading,
             float speed, float vision, float turningAngle)
    : m_id(id), m_position(position), m_heading(heading), m_speed(speed),
      m_vision(vision), m_turningAngle(turningAngle) {
    if (!position.isFinite()) {
        throw InvalidConfigurationError("agent " + std::to_string(id) +
                                        " has a non-finite position");
    }
    if (!heading.isFinite() ||
        std::abs(heading.length() - 1.0f) > UNIT_TOLERANCE) {
        throw InvalidConfigurationError("agent " + std::to_string(id) +
                                        " heading must be a unit vector");
    }
    if (!std::isfinite(speed) || speed <= 0.0f) {
        throw InvalidConfigurationError("agent " + std::to_string(id) +
                                        " speed must be positive, got " +
                                        std::to_string(speed));
    }
    if (!std::isfinite(vision) || !std::isfinite(turningAngle) ||
        turningAngle < 0.0f) {
        throw InvalidConfigurationError("agent " + std::to_string(id) +
                                        " has invalid perception parameters");
    }
}

} // namespace ShoalEngine
