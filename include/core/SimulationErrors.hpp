/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_ERRORS_HPP
#define SIMULATION_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ShoalEngine {

/**
 * @brief Thrown when simulation settings or agent parameters are rejected.
 *
 * Raised synchronously at construction time; no simulation or agent is
 * created when it is thrown.
 */
class InvalidConfigurationError : public std::invalid_argument {
public:
    explicit InvalidConfigurationError(const std::string& what)
        : std::invalid_argument("Shoal Engine - Invalid configuration: " + what) {}
};

} // namespace ShoalEngine

#endif // SIMULATION_ERRORS_HPP
