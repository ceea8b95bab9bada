/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/SubscriberChannel.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <string>

namespace ShoalEngine {

SubscriberChannel::SubscriberChannel(size_t capacity)
    : m_capacity(std::max<size_t>(capacity, 1)) {}

bool SubscriberChannel::push(SimulationMessage message) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return false;
        }

        if (message.isTerminal()) {
            m_closed = true;
        } else if (m_queue.size() >= m_capacity) {
            m_queue.pop_front();
            ++m_dropped;
            // One warning per overflow episode, not per dropped tick
            if (!m_overflowReported) {
                m_overflowReported = true;
                CHANNEL_WARN("Subscriber is falling behind, dropping oldest ticks (capacity " +
                             std::to_string(m_capacity) + ")");
            }
        } else {
            m_overflowReported = false;
        }

        m_queue.push_back(std::move(message));
    }
    m_condition.notify_one();
    return true;
}

std::optional<SimulationMessage> SubscriberChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_condition.wait_for(lock, timeout, [this] { return !m_queue.empty(); })) {
        return std::nullopt;
    }
    SimulationMessage message = std::move(m_queue.front());
    m_queue.pop_front();
    return message;
}

std::optional<SimulationMessage> SubscriberChannel::tryPop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.empty()) {
        return std::nullopt;
    }
    SimulationMessage message = std::move(m_queue.front());
    m_queue.pop_front();
    return message;
}

size_t SubscriberChannel::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

uint64_t SubscriberChannel::droppedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

bool SubscriberChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

} // namespace ShoalEngine
