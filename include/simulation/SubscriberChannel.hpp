/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SUBSCRIBER_CHANNEL_HPP
#define SUBSCRIBER_CHANNEL_HPP

#include "simulation/SimulationTypes.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace ShoalEngine {

/**
 * @brief Bounded per-subscriber message queue
 *
 * The producer (a simulation's tick loop) never blocks on a slow consumer:
 * when the queue is full the oldest tick is discarded to make room and the
 * drop is counted. Terminal messages (Shutdown, Fault) are always accepted
 * and close the channel; anything pushed afterwards is ignored. Messages
 * queued before the terminal one remain readable.
 */
class SubscriberChannel {
public:
    explicit SubscriberChannel(size_t capacity = SimulationSettings::DEFAULT_CHANNEL_CAPACITY);

    SubscriberChannel(const SubscriberChannel&) = delete;
    SubscriberChannel& operator=(const SubscriberChannel&) = delete;

    /**
     * @brief Enqueue a message without blocking
     * @return false if the channel was already closed
     */
    bool push(SimulationMessage message);

    // Waits up to timeout for the next message
    std::optional<SimulationMessage> pop(std::chrono::milliseconds timeout);

    std::optional<SimulationMessage> tryPop();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return m_capacity; }
    [[nodiscard]] uint64_t droppedCount() const;
    [[nodiscard]] bool isClosed() const;

private:
    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<SimulationMessage> m_queue;
    uint64_t m_dropped{0};
    bool m_closed{false};
    bool m_overflowReported{false};
};

} // namespace ShoalEngine

#endif // SUBSCRIBER_CHANNEL_HPP
