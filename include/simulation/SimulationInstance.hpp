/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_INSTANCE_HPP
#define SIMULATION_INSTANCE_HPP

/**
 * @file SimulationInstance.hpp
 * @brief One running swarm plus the subscribers watching it
 *
 * Lifecycle:
 *
 *   Idle --register--> Running --last unregister--> Stopping --loop exit--> Idle
 *   Idle|Running|Stopping --close--> Closed
 *   Running --tick failure--> Faulted --close--> Closed
 *
 * While Running, a dedicated loop thread advances the swarm once per
 * update interval and pushes the new state to every subscriber. The tick
 * loop runs only while at least one subscriber is registered.
 *
 * Locking: m_mutex covers agents, tick, state and the subscriber list. The
 * loop holds it only while computing and applying a tick; broadcasting and
 * sleeping happen outside it, so snapshot() and subscriber changes never
 * wait for more than one tick computation.
 *
 * Ownership: when the instance is owned by a std::shared_ptr, its loop
 * thread holds a reference until the loop exits. The tick observer may
 * therefore close the instance or drop the last outside reference (for
 * example through SimulationManager::remove()) without the loop running on
 * freed memory. A shared-owned instance that is still Running is kept alive
 * by its loop; close() it (or remove it from the registry) to release it.
 */

#include "ai/FlockEngine.hpp"
#include "entities/Agent.hpp"
#include "simulation/SimulationTypes.hpp"
#include "simulation/SubscriberChannel.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ShoalEngine {

class SimulationInstance : public std::enable_shared_from_this<SimulationInstance> {
public:
    // Invoked on the ticking thread after each tick, before subscribers are
    // notified. An exception thrown from it faults the simulation.
    using TickObserver = std::function<void(const TickPayload&)>;

    /**
     * @brief Create a simulation with a freshly generated swarm
     * @throws InvalidConfigurationError if settings are out of range
     */
    SimulationInstance(SimulationID id, const SimulationSettings& settings);

    /**
     * @brief Create a simulation around a prepared set of agents
     *
     * settings.numAgents is overwritten with agents.size().
     * @throws InvalidConfigurationError if settings or the agent count are invalid
     */
    SimulationInstance(SimulationID id, SimulationSettings settings, std::vector<Agent> agents);

    // Closes the simulation and waits until its loop thread has exited
    ~SimulationInstance();

    SimulationInstance(const SimulationInstance&) = delete;
    SimulationInstance& operator=(const SimulationInstance&) = delete;

    // Consistent copy of the current tick; never observes a half-applied tick
    [[nodiscard]] SimulationSnapshot snapshot() const;

    /**
     * @brief Attach a subscriber, starting the tick loop if it was idle
     *
     * If a previous loop is still winding down, waits for it to finish
     * first so at most one loop ever runs.
     *
     * @return The subscriber's channel, or nullptr once Closed or Faulted
     */
    std::shared_ptr<SubscriberChannel> registerSubscriber();

    /**
     * @brief Detach a subscriber; unknown channels are ignored
     *
     * Removing the last subscriber asks the loop to stop. The loop exits at
     * its next suspension point, without completing another tick.
     */
    void unregisterSubscriber(const std::shared_ptr<SubscriberChannel>& channel);

    /**
     * @brief Stop any loop, then send Shutdown to every subscriber
     *
     * Idempotent. After close() nothing can be registered. Safe to call from
     * the tick observer; the loop then finishes on its own instead of being
     * joined.
     */
    void close();

    /**
     * @brief Advance exactly one tick on the calling thread
     * @return false if a loop is active, the simulation is closed or faulted,
     *         or the tick failed (the simulation is then Faulted)
     */
    bool stepOnce();

    // Waits until no loop is active (state is not Running or Stopping)
    bool waitUntilIdle(std::chrono::milliseconds timeout) const;

    void setTickObserver(TickObserver observer);

    [[nodiscard]] SimulationID getID() const { return m_id; }
    [[nodiscard]] const SimulationSettings& getSettings() const { return m_settings; }
    [[nodiscard]] SimulationState getState() const;
    [[nodiscard]] uint64_t getTick() const;
    [[nodiscard]] size_t getSubscriberCount() const;
    [[nodiscard]] std::string getFaultReason() const;

private:
    // keepAlive is null for instances not owned by a shared_ptr
    void runLoop(std::shared_ptr<SimulationInstance> keepAlive);

    // Requires m_mutex. Computes and applies one tick, returning its payload.
    // Agents are left untouched if computation throws.
    std::shared_ptr<const TickPayload> advanceTickLocked();

    std::vector<AgentState> captureAgentsLocked() const;

    static void broadcast(const std::vector<std::shared_ptr<SubscriberChannel>>& channels,
                          const SimulationMessage& message);

    // Moves to Faulted (unless already Closed) and notifies subscribers
    void fault(const std::string& reason);

    const SimulationID m_id;
    const SimulationSettings m_settings;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_stateCondition;

    std::vector<Agent> m_agents;
    FlockEngine m_engine;
    uint64_t m_tick{0};
    SimulationState m_state{SimulationState::Idle};
    bool m_stopRequested{false};
    std::string m_faultReason;

    std::vector<std::shared_ptr<SubscriberChannel>> m_subscribers;
    TickObserver m_tickObserver;

    std::thread m_loopThread;
    std::thread::id m_loopThreadId;
    bool m_loopActive{false}; // cleared by the loop as its last member access
};

} // namespace ShoalEngine

#endif // SIMULATION_INSTANCE_HPP
