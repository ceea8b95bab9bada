/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SimulationManager.hpp"
#include "core/Logger.hpp"
#include <mutex>
#include <string>

namespace ShoalEngine {

SimulationManager::~SimulationManager() {
    if (m_initialized.load(std::memory_order_acquire)) {
        clean();
    }
}

bool SimulationManager::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        return true;
    }
    m_initialized.store(true, std::memory_order_release);
    REGISTRY_INFO("SimulationManager initialized");
    return true;
}

void SimulationManager::clean() {
    SimulationMap closing;
    {
        std::unique_lock<std::shared_mutex> lock(m_registryMutex);
        closing.swap(m_simulations);
    }
    m_initialized.store(false, std::memory_order_release);

    for (auto& [id, simulation] : closing) {
        simulation->close();
    }
    REGISTRY_INFO("SimulationManager cleaned up (" + std::to_string(closing.size()) +
                  " simulation(s) closed)");
}

SimulationID SimulationManager::create(const SimulationSettings& settings) {
    if (!m_initialized.load(std::memory_order_acquire)) {
        REGISTRY_ERROR("Cannot create simulation - SimulationManager not initialized");
        return INVALID_SIMULATION_ID;
    }

    settings.validate();

    const SimulationID id = m_nextId.fetch_add(1, std::memory_order_relaxed);
    auto simulation = std::make_shared<SimulationInstance>(id, settings);

    {
        std::unique_lock<std::shared_mutex> lock(m_registryMutex);
        m_simulations.emplace(id, std::move(simulation));
    }

    REGISTRY_INFO("Registered simulation " + std::to_string(id));
    return id;
}

std::shared_ptr<SimulationInstance> SimulationManager::get(SimulationID id) const {
    std::shared_lock<std::shared_mutex> lock(m_registryMutex);
    auto it = m_simulations.find(id);
    return (it != m_simulations.end()) ? it->second : nullptr;
}

std::vector<SimulationSummary> SimulationManager::list() const {
    std::vector<std::shared_ptr<SimulationInstance>> simulations;
    {
        std::shared_lock<std::shared_mutex> lock(m_registryMutex);
        simulations.reserve(m_simulations.size());
        for (const auto& [id, simulation] : m_simulations) {
            simulations.push_back(simulation);
        }
    }

    // Per-instance state is read without holding the registry lock
    std::vector<SimulationSummary> summaries;
    summaries.reserve(simulations.size());
    for (const auto& simulation : simulations) {
        const auto& settings = simulation->getSettings();
        summaries.push_back(SimulationSummary{simulation->getID(), settings.numAgents, settings.mode,
                                              simulation->getTick(), simulation->getState()});
    }
    return summaries;
}

bool SimulationManager::remove(SimulationID id) {
    std::shared_ptr<SimulationInstance> simulation;
    {
        std::unique_lock<std::shared_mutex> lock(m_registryMutex);
        auto it = m_simulations.find(id);
        if (it == m_simulations.end()) {
            REGISTRY_DEBUG("Remove requested for unknown simulation " + std::to_string(id));
            return false;
        }
        simulation = std::move(it->second);
        m_simulations.erase(it);
    }

    simulation->close();
    REGISTRY_INFO("Removed simulation " + std::to_string(id));
    return true;
}

size_t SimulationManager::size() const {
    std::shared_lock<std::shared_mutex> lock(m_registryMutex);
    return m_simulations.size();
}

} // namespace ShoalEngine
