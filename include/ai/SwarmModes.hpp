/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SWARM_MODES_HPP
#define SWARM_MODES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace ShoalEngine {

enum class SimulationMode : uint8_t { Swarm = 0, Torus = 1, HPP = 2, DPP = 3 };

/**
 * @brief Zone radii partitioning the distance axis around an agent.
 *
 * Repulsion (0, zor], orientation (zor, zoo], attraction (zoo, zoa],
 * nothing beyond zoa. Valid radii satisfy 0 < zor < zoo < zoa.
 */
struct ZoneRadii {
    float zor{0.0f};
    float zoo{0.0f};
    float zoa{0.0f};

    [[nodiscard]] constexpr bool isValid() const {
        return zor > 0.0f && zor < zoo && zoo < zoa;
    }
};

namespace detail {
// Indexed by SimulationMode
inline constexpr std::array<ZoneRadii, 4> MODE_RADII{{
    {2.0f, 3.0f, 7.0f},   // Swarm
    {0.3f, 0.8f, 15.0f},  // Torus
    {0.5f, 10.0f, 20.0f}, // HPP
    {0.2f, 4.0f, 10.0f},  // DPP
}};

inline constexpr std::array<std::string_view, 4> MODE_NAMES{
    "swarm", "torus", "hpp", "dpp"};
} // namespace detail

[[nodiscard]] constexpr ZoneRadii getZoneRadii(SimulationMode mode) {
    return detail::MODE_RADII[static_cast<size_t>(mode)];
}

[[nodiscard]] constexpr std::string_view simulationModeName(SimulationMode mode) {
    return detail::MODE_NAMES[static_cast<size_t>(mode)];
}

// Accepts the lowercase mode names only
[[nodiscard]] inline std::optional<SimulationMode> parseSimulationMode(std::string_view name) {
    for (size_t i = 0; i < detail::MODE_NAMES.size(); ++i) {
        if (detail::MODE_NAMES[i] == name) {
            return static_cast<SimulationMode>(i);
        }
    }
    return std::nullopt;
}

// Stream operator for SimulationMode (for Boost.Test)
inline std::ostream& operator<<(std::ostream& os, SimulationMode mode) {
    return os << simulationModeName(mode);
}

} // namespace ShoalEngine

#endif // SWARM_MODES_HPP
