/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/FlockEngine.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"
#include "core/ThreadSystem.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <numbers>
#include <string>

namespace ShoalEngine {

FlockEngine::FlockEngine(const ZoneRadii& radii, bool strictTurnRate,
                         size_t parallelThreshold)
    : m_radii(radii), m_strictTurnRate(strictTurnRate),
      m_parallelThreshold(std::max<size_t>(parallelThreshold, 1)) {
    if (!m_radii.isValid()) {
        throw InvalidConfigurationError(
            "zone radii must satisfy 0 < zor < zoo < zoa (got " +
            std::to_string(radii.zor) + ", " + std::to_string(radii.zoo) + ", " +
            std::to_string(radii.zoa) + ")");
    }
}

FlockEngine::HeadingMap FlockEngine::computeNextHeadings(const std::vector<Agent>& agents) {
    const size_t count = agents.size();
    m_headingBuffer.resize(count);

    try {
        m_table.build(agents);

        bool const useThreads = count >= m_parallelThreshold &&
                                ThreadSystem::Instance().isInitialized();
        if (useThreads) {
            computeParallel(agents, m_headingBuffer);
        } else {
            computeRange(agents, m_headingBuffer, 0, count);
        }
    } catch (...) {
        m_table.reset();
        throw;
    }
    m_table.reset();

    HeadingMap headings;
    headings.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        headings.emplace_hint(headings.end(), agents[i].getID(), m_headingBuffer[i]);
    }
    return headings;
}

void FlockEngine::applyHeadings(std::vector<Agent>& agents, const HeadingMap& headings,
                                float timestep) {
    for (auto& agent : agents) {
        auto it = headings.find(agent.getID());
        const Vector3D heading = (it != headings.end()) ? it->second : agent.getHeading();
        const Vector3D position =
            agent.getPosition() + heading * (agent.getSpeed() * timestep);
        agent.setMotion(position, heading);
    }
}

void FlockEngine::advance(std::vector<Agent>& agents, float timestep) {
    applyHeadings(agents, computeNextHeadings(agents), timestep);
}

Vector3D FlockEngine::computeHeading(const std::vector<Agent>& agents, size_t index) const {
    const size_t count = agents.size();
    const Agent& self = agents[index];

    bool repulsionMode = false;
    for (size_t j = 0; j < count; ++j) {
        if (j != index && m_table.distance(index, j) <= m_radii.zor) {
            repulsionMode = true;
            break;
        }
    }

    Vector3D direction;
    bool sawOrientation = false;
    bool sawAttraction = false;

    for (size_t j = 0; j < count; ++j) {
        if (j == index) {
            continue;
        }
        const float dist = m_table.distance(index, j);

        if (repulsionMode) {
            if (dist <= m_radii.zor) {
                direction -= m_table.direction(index, j);
            }
        } else if (dist > m_radii.zor && dist <= m_radii.zoo) {
            direction += agents[j].getHeading() * 0.5f;
            sawOrientation = true;
        } else if (dist > m_radii.zoo && dist <= m_radii.zoa) {
            direction += m_table.direction(index, j) * 0.5f;
            sawAttraction = true;
        }
    }

    // A lone influence is amplified so it turns as hard as a combined one
    if (!repulsionMode && !(sawOrientation && sawAttraction)) {
        direction *= 2.0f;
    }

    if (direction.isZero()) {
        return self.getHeading();
    }

    Vector3D heading = direction.normalized();

    if (m_strictTurnRate) {
        const float maxTurn = self.getTurningAngle() * std::numbers::pi_v<float> / 180.0f;
        heading = Vector3D::rotateTowards(self.getHeading(), heading, maxTurn);
    }
    return heading;
}

void FlockEngine::computeRange(const std::vector<Agent>& agents, std::vector<Vector3D>& out,
                               size_t begin, size_t end) const {
    for (size_t i = begin; i < end; ++i) {
        out[i] = computeHeading(agents, i);
    }
}

void FlockEngine::computeParallel(const std::vector<Agent>& agents,
                                  std::vector<Vector3D>& out) {
    auto& threadSystem = ThreadSystem::Instance();
    const size_t count = agents.size();

    const size_t workers = std::max<size_t>(threadSystem.getThreadCount(), 1);
    const size_t batchSize = std::max(MIN_BATCH_SIZE, (count + workers - 1) / workers);

    std::vector<std::future<void>> batchFutures;
    batchFutures.reserve((count + batchSize - 1) / batchSize);

    size_t submittedEnd = 0;
    try {
        for (size_t start = 0; start < count; start += batchSize) {
            const size_t end = std::min(start + batchSize, count);
            batchFutures.push_back(threadSystem.enqueueTaskWithResult(
                [this, &agents, &out, start, end]() { computeRange(agents, out, start, end); },
                TaskPriority::High, "Flock_Heading_Batch"));
            submittedEnd = end;
        }
    } catch (const std::runtime_error& e) {
        // Pool went away between the check and the submit
        FLOCK_WARN("Falling back to single-threaded heading pass: " + std::string(e.what()));
    }

    // Batches that never made it into the pool run here
    computeRange(agents, out, submittedEnd, count);

    // get() rethrows the first failing batch; every future is still waited on
    // so no batch outlives the table it reads
    std::exception_ptr firstFailure;
    for (auto& future : batchFutures) {
        try {
            future.get();
        } catch (...) {
            if (!firstFailure) {
                firstFailure = std::current_exception();
            }
        }
    }
    if (firstFailure) {
        std::rethrow_exception(firstFailure);
    }
}

} // namespace ShoalEngine
