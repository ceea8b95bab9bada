/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_MANAGER_HPP
#define SIMULATION_MANAGER_HPP

/**
 * @file SimulationManager.hpp
 * @brief Registry of live simulations keyed by SimulationID
 *
 * The registry lock only guards the id -> instance map. Instances tick on
 * their own threads and are closed outside the registry lock, so creating
 * or removing one simulation never waits on another's tick.
 *
 * Callers receive shared ownership from get(); an instance removed while a
 * caller still holds it stays alive (and Closed) until released.
 */

#include "simulation/SimulationInstance.hpp"
#include "simulation/SimulationTypes.hpp"
#include <atomic>
#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace ShoalEngine {

class SimulationManager {
public:
    static SimulationManager& Instance() {
        static SimulationManager instance;
        return instance;
    }

    bool init();

    // Closes every registered simulation and empties the registry
    void clean();

    [[nodiscard]] bool isInitialized() const noexcept {
        return m_initialized.load(std::memory_order_acquire);
    }

    /**
     * @brief Validate settings, build a simulation and register it Idle
     * @return The new id, or INVALID_SIMULATION_ID if the manager is not initialized
     * @throws InvalidConfigurationError before anything is constructed
     */
    SimulationID create(const SimulationSettings& settings);

    // nullptr if the id is unknown
    [[nodiscard]] std::shared_ptr<SimulationInstance> get(SimulationID id) const;

    // Ordered by id
    [[nodiscard]] std::vector<SimulationSummary> list() const;

    /**
     * @brief Unregister and close a simulation
     *
     * Subscribers receive Shutdown.
     * @return false if the id is unknown
     */
    bool remove(SimulationID id);

    [[nodiscard]] size_t size() const;

    ~SimulationManager();

private:
    SimulationManager() = default;

    SimulationManager(const SimulationManager&) = delete;
    SimulationManager& operator=(const SimulationManager&) = delete;

    using SimulationMap = boost::container::flat_map<SimulationID, std::shared_ptr<SimulationInstance>>;

    SimulationMap m_simulations;
    mutable std::shared_mutex m_registryMutex;

    std::atomic<SimulationID> m_nextId{1};
    std::atomic<bool> m_initialized{false};
};

} // namespace ShoalEngine

#endif // SIMULATION_MANAGER_HPP
