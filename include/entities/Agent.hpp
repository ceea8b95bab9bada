/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_HPP
#define AGENT_HPP

#include "utils/Vector3D.hpp"
#include <cstdint>

namespace ShoalEngine {

using AgentID = uint32_t;

/**
 * @brief Kinematic state of one swarm member.
 *
 * The id is fixed at construction. Position and heading only change
 * together, through setMotion(), which the owning simulation calls once per
 * tick. Vision and turning angle are perception parameters in degrees;
 * the zone rules ignore vision, and turning angle only matters when a
 * simulation enables strict turn-rate limiting.
 */
class Agent {
public:
    // Allowed deviation of |heading| from 1 at construction
    static constexpr float UNIT_TOLERANCE = 1e-3f;

    static constexpr float DEFAULT_SPEED = 1.0f;
    static constexpr float DEFAULT_VISION_DEG = 360.0f;
    static constexpr float DEFAULT_TURNING_ANGLE_DEG = 40.0f;

    /**
     * @throws InvalidConfigurationError if heading is not unit length,
     * speed is not positive, or any value is non-finite
     */
    Agent(AgentID id, const Vector3D& position, const Vector3D& heading,
          float speed = DEFAULT_SPEED,
          float vision = DEFAULT_VISION_DEG,
          float turningAngle = DEFAULT_TURNING_ANGLE_DEG);

    [[nodiscard]] AgentID getID() const { return m_id; }
    [[nodiscard]] const Vector3D& getPosition() const { return m_position; }
    [[nodiscard]] const Vector3D& getHeading() const { return m_heading; }
    [[nodiscard]] float getSpeed() const { return m_speed; }
    [[nodiscard]] float getVision() const { return m_vision; }
    [[nodiscard]] float getTurningAngle() const { return m_turningAngle; }

    void setMotion(const Vector3D& position, const Vector3D& heading) {
        m_position = position;
        m_heading = heading;
    }

private:
    AgentID m_id;
    Vector3D m_position;
    Vector3D m_heading;
    float m_speed;
    float m_vision;
    float m_turningAngle;
};

} // namespace ShoalEngine

#endif // AGENT_HPP
