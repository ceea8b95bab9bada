/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/SimulationInstance.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"
#include "world/SwarmGenerator.hpp"
#include <algorithm>
#include <exception>
#include <string>
#include <unordered_set>

#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace ShoalEngine {

namespace {

SimulationSettings validated(SimulationSettings settings) {
    settings.validate();
    return settings;
}

SimulationSettings withAgentCount(SimulationSettings settings, const std::vector<Agent>& agents) {
    if (agents.size() > static_cast<size_t>(SimulationSettings::MAX_AGENTS)) {
        throw InvalidConfigurationError("too many agents: " + std::to_string(agents.size()));
    }
    settings.numAgents = static_cast<int>(agents.size());
    settings.validate();

    std::unordered_set<AgentID> ids;
    for (const auto& agent : agents) {
        if (!ids.insert(agent.getID()).second) {
            throw InvalidConfigurationError("duplicate agent id " +
                                            std::to_string(agent.getID()));
        }
    }
    return settings;
}

void nameCurrentThread(SimulationID id) {
    // Linux limits thread names to 15 characters
    std::string threadName = "Sim-" + std::to_string(id);
    if (threadName.size() > 15) {
        threadName.resize(15);
    }
#if defined(__linux__) || defined(_GNU_SOURCE)
    pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
    pthread_setname_np(threadName.c_str());
#endif
}

} // anonymous namespace

SimulationInstance::SimulationInstance(SimulationID id, const SimulationSettings& settings)
    : m_id(id),
      m_settings(validated(settings)),
      m_agents(SwarmGenerator::generate(
          SwarmGenerationConfig{static_cast<uint32_t>(m_settings.numAgents), m_settings.seed})),
      m_engine(getZoneRadii(m_settings.mode), m_settings.strictTurnRate,
               m_settings.parallelAgentThreshold) {
    SIMULATION_INFO("Created simulation " + std::to_string(m_id) + " (" +
                    std::to_string(m_settings.numAgents) + " agents, mode " +
                    std::string(simulationModeName(m_settings.mode)) + ")");
}

SimulationInstance::SimulationInstance(SimulationID id, SimulationSettings settings,
                                       std::vector<Agent> agents)
    : m_id(id),
      m_settings(withAgentCount(std::move(settings), agents)),
      m_agents(std::move(agents)),
      m_engine(getZoneRadii(m_settings.mode), m_settings.strictTurnRate,
               m_settings.parallelAgentThreshold) {
    SIMULATION_INFO("Created simulation " + std::to_string(m_id) + " from " +
                    std::to_string(m_agents.size()) + " prepared agents");
}

SimulationInstance::~SimulationInstance() {
    close();

    // A loop detached by close() from its own observer may still be
    // unwinding; the members it touches must outlive it
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_loopActive && m_loopThreadId != std::this_thread::get_id()) {
        m_stateCondition.wait(lock, [this] { return !m_loopActive; });
    }
}

SimulationSnapshot SimulationInstance::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    SimulationSnapshot result;
    result.simulationId = m_id;
    result.tick = m_tick;
    result.state = m_state;
    result.params = m_settings;
    result.agents = captureAgentsLocked();
    return result;
}

std::shared_ptr<SubscriberChannel> SimulationInstance::registerSubscriber() {
    std::unique_lock<std::mutex> lock(m_mutex);

    // A loop that is winding down must finish before another may start
    m_stateCondition.wait(lock, [this] { return m_state != SimulationState::Stopping; });

    if (m_state == SimulationState::Closed || m_state == SimulationState::Faulted) {
        SIMULATION_WARN("Rejected subscriber for simulation " + std::to_string(m_id) +
                        " in state " + simulationStateName(m_state));
        return nullptr;
    }

    auto channel = std::make_shared<SubscriberChannel>(m_settings.channelCapacity);
    m_subscribers.push_back(channel);

    if (m_state == SimulationState::Idle) {
        // The previous loop already published Idle and takes no further locks
        if (m_loopThread.joinable()) {
            m_loopThread.join();
        }
        m_stopRequested = false;
        m_state = SimulationState::Running;
        m_loopActive = true;
        m_loopThread = std::thread(&SimulationInstance::runLoop, this, weak_from_this().lock());
        m_loopThreadId = m_loopThread.get_id();
        SIMULATION_INFO("Simulation " + std::to_string(m_id) + " started ticking");
    }

    SIMULATION_DEBUG("Simulation " + std::to_string(m_id) + " now has " +
                     std::to_string(m_subscribers.size()) + " subscriber(s)");
    return channel;
}

void SimulationInstance::unregisterSubscriber(const std::shared_ptr<SubscriberChannel>& channel) {
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find(m_subscribers.begin(), m_subscribers.end(), channel);
        if (it == m_subscribers.end()) {
            return;
        }
        m_subscribers.erase(it);

        if (m_subscribers.empty() && m_state == SimulationState::Running) {
            m_state = SimulationState::Stopping;
            m_stopRequested = true;
            stopping = true;
        }
    }

    if (stopping) {
        SIMULATION_INFO("Last subscriber left simulation " + std::to_string(m_id) +
                        ", stopping tick loop");
        m_stateCondition.notify_all();
    }
}

void SimulationInstance::close() {
    std::thread loop;
    std::vector<std::shared_ptr<SubscriberChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == SimulationState::Closed) {
            return;
        }
        m_state = SimulationState::Closed;
        m_stopRequested = true;
        loop = std::move(m_loopThread);
        channels.swap(m_subscribers);
    }
    m_stateCondition.notify_all();

    if (loop.joinable()) {
        if (loop.get_id() == std::this_thread::get_id()) {
            // Called on the loop thread (tick observer, or the last owner
            // released there); the loop exits on its own
            loop.detach();
        } else {
            loop.join();
        }
    }

    broadcast(channels, SimulationMessage::shutdown());
    SIMULATION_INFO("Closed simulation " + std::to_string(m_id) + " (" +
                    std::to_string(channels.size()) + " subscriber(s) notified)");
}

bool SimulationInstance::stepOnce() {
    try {
        std::shared_ptr<const TickPayload> payload;
        std::vector<std::shared_ptr<SubscriberChannel>> channels;
        TickObserver observer;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state != SimulationState::Idle) {
                return false;
            }
            payload = advanceTickLocked();
            channels = m_subscribers;
            observer = m_tickObserver;
        }

        if (observer) {
            observer(*payload);
        }
        broadcast(channels, SimulationMessage::tick(std::move(payload)));
        return true;
    } catch (const std::exception& e) {
        fault(e.what());
        return false;
    } catch (...) {
        fault("unknown exception");
        return false;
    }
}

bool SimulationInstance::waitUntilIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_stateCondition.wait_for(lock, timeout, [this] {
        return m_state != SimulationState::Running && m_state != SimulationState::Stopping;
    });
}

void SimulationInstance::setTickObserver(TickObserver observer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tickObserver = std::move(observer);
}

SimulationState SimulationInstance::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

uint64_t SimulationInstance::getTick() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tick;
}

size_t SimulationInstance::getSubscriberCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscribers.size();
}

std::string SimulationInstance::getFaultReason() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_faultReason;
}

void SimulationInstance::runLoop(std::shared_ptr<SimulationInstance> keepAlive) {
    // Held until this function returns, after the last member access, so an
    // observer that drops the final outside reference cannot free us mid-tick
    (void)keepAlive;

    const SimulationID id = m_id;
    nameCurrentThread(id);

    // validate() bounds the interval, so the conversion cannot overflow
    const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(m_settings.updateInterval));

    try {
        while (true) {
            std::shared_ptr<const TickPayload> payload;
            std::vector<std::shared_ptr<SubscriberChannel>> channels;
            TickObserver observer;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_stopRequested) {
                    break;
                }
                payload = advanceTickLocked();
                channels = m_subscribers;
                observer = m_tickObserver;
            }

            if (observer) {
                observer(*payload);
            }
            broadcast(channels, SimulationMessage::tick(std::move(payload)));

            // Interruptible sleep; a stop request ends it early
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_stateCondition.wait_for(lock, interval, [this] { return m_stopRequested; })) {
                break;
            }
        }
    } catch (const std::exception& e) {
        fault(e.what());
    } catch (...) {
        fault("unknown exception");
    }

    SIMULATION_INFO("Simulation " + std::to_string(id) + " tick loop exited");

    // Last access to members. Notifying under the lock lets a destructor
    // waiting on m_loopActive free the instance as soon as it wakes.
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == SimulationState::Stopping) {
        m_state = SimulationState::Idle;
    }
    m_loopActive = false;
    m_stateCondition.notify_all();
}

std::shared_ptr<const TickPayload> SimulationInstance::advanceTickLocked() {
    auto headings = m_engine.computeNextHeadings(m_agents);
    FlockEngine::applyHeadings(m_agents, headings, m_settings.timestep);
    ++m_tick;

    auto payload = std::make_shared<TickPayload>();
    payload->simulationId = m_id;
    payload->tick = m_tick;
    payload->agents = captureAgentsLocked();
    return payload;
}

std::vector<AgentState> SimulationInstance::captureAgentsLocked() const {
    std::vector<AgentState> states;
    states.reserve(m_agents.size());
    for (const auto& agent : m_agents) {
        states.push_back(AgentState{agent.getID(), agent.getPosition(), agent.getHeading()});
    }
    return states;
}

void SimulationInstance::broadcast(const std::vector<std::shared_ptr<SubscriberChannel>>& channels,
                                   const SimulationMessage& message) {
    for (const auto& channel : channels) {
        channel->push(message);
    }
}

void SimulationInstance::fault(const std::string& reason) {
    std::vector<std::shared_ptr<SubscriberChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
        if (m_state == SimulationState::Closed) {
            return;
        }
        m_state = SimulationState::Faulted;
        m_faultReason = reason;
        channels.swap(m_subscribers);
    }
    m_stateCondition.notify_all();

    SIMULATION_ERROR("Simulation " + std::to_string(m_id) + " faulted at tick " +
                     std::to_string(getTick()) + ": " + reason);
    broadcast(channels, SimulationMessage::fault(reason));
}

} // namespace ShoalEngine
