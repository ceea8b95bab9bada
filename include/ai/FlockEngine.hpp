/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOCK_ENGINE_HPP
#define FLOCK_ENGINE_HPP

/**
 * @file FlockEngine.hpp
 * @brief Zone-based heading update for a set of agents
 *
 * Every mode runs the same rule; modes only differ in their ZoneRadii.
 *
 * Per agent i, each tick:
 * - Repulsion: if any neighbor lies within zor, every neighbor within zor
 *   pushes i away (minus the unit direction toward it) and nothing farther
 *   away contributes.
 * - Otherwise neighbors in (zor, zoo] add half their heading (orientation)
 *   and neighbors in (zoo, zoa] add half the unit direction toward them
 *   (attraction). Unless both kinds fired, the sum is doubled.
 * - A zero sum keeps the current heading; anything else is normalized.
 *
 * Threading Model:
 * - Small swarms are processed on the calling thread
 * - At or above the parallel threshold, the per-agent pass is split into
 *   batches submitted to ThreadSystem and awaited before returning
 * - One engine belongs to one simulation; computeNextHeadings() must not be
 *   called concurrently on the same engine
 */

#include "ai/PairwiseTable.hpp"
#include "ai/SwarmModes.hpp"
#include "entities/Agent.hpp"
#include "utils/Vector3D.hpp"
#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <vector>

namespace ShoalEngine {

class FlockEngine {
public:
    using HeadingMap = boost::container::flat_map<AgentID, Vector3D>;

    static constexpr size_t DEFAULT_PARALLEL_THRESHOLD = 256;

    /**
     * @param radii Zone radii; must satisfy 0 < zor < zoo < zoa
     * @param strictTurnRate Clamp each turn to the agent's turning angle
     * @param parallelThreshold Agent count at which ThreadSystem batches are used
     * @throws InvalidConfigurationError if radii are invalid
     */
    explicit FlockEngine(const ZoneRadii& radii, bool strictTurnRate = false,
                         size_t parallelThreshold = DEFAULT_PARALLEL_THRESHOLD);

    /**
     * @brief Compute the next unit heading of every agent
     *
     * Agents are not modified. The pairwise table is built for this call
     * and reset before returning, including when an exception propagates.
     *
     * @return AgentID -> new heading, one entry per agent
     */
    HeadingMap computeNextHeadings(const std::vector<Agent>& agents);

    /**
     * @brief Move every agent along its new heading
     *
     * position += heading * speed * timestep. Agents absent from headings
     * keep their current heading.
     */
    static void applyHeadings(std::vector<Agent>& agents, const HeadingMap& headings,
                              float timestep);

    // computeNextHeadings() followed by applyHeadings()
    void advance(std::vector<Agent>& agents, float timestep);

    [[nodiscard]] const ZoneRadii& getZoneRadii() const { return m_radii; }
    [[nodiscard]] bool isStrictTurnRate() const { return m_strictTurnRate; }
    [[nodiscard]] size_t getParallelThreshold() const { return m_parallelThreshold; }

    // Scratch table; outside computeNextHeadings() it is always reset
    [[nodiscard]] const PairwiseTable& getPairwiseTable() const { return m_table; }

private:
    Vector3D computeHeading(const std::vector<Agent>& agents, size_t index) const;

    void computeRange(const std::vector<Agent>& agents, std::vector<Vector3D>& out,
                      size_t begin, size_t end) const;

    void computeParallel(const std::vector<Agent>& agents, std::vector<Vector3D>& out);

    ZoneRadii m_radii;
    bool m_strictTurnRate;
    size_t m_parallelThreshold;
    PairwiseTable m_table;

    // Reusable output buffer (avoid per-tick allocation)
    std::vector<Vector3D> m_headingBuffer;

    static constexpr size_t MIN_BATCH_SIZE = 32;
};

} // namespace ShoalEngine

#endif // FLOCK_ENGINE_HPP
