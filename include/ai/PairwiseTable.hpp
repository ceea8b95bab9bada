/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PAIRWISE_TABLE_HPP
#define PAIRWISE_TABLE_HPP

#include "entities/Agent.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <limits>
#include <vector>

namespace ShoalEngine {

/**
 * @brief Per-tick scratch table of pairwise distances and unit directions.
 *
 * Indexed by position in the agent vector, not by AgentID. build() computes
 * each unordered pair once and mirrors it: distance(i, j) == distance(j, i)
 * and direction(i, j) == -direction(j, i). Diagonal entries are never
 * written and read as UNKNOWN_DISTANCE.
 *
 * The table is rebuilt at the start of a tick and reset() to the sentinel at
 * the end, so nothing computed in one tick is visible in the next. Storage
 * capacity is kept between ticks.
 *
 * Not thread-safe for writes; concurrent reads after build() are fine.
 */
class PairwiseTable {
public:
    static constexpr float UNKNOWN_DISTANCE = std::numeric_limits<float>::infinity();

    void build(const std::vector<Agent>& agents);

    // Fills every entry with the sentinel; size is preserved
    void reset();

    [[nodiscard]] bool isReset() const;

    [[nodiscard]] size_t size() const { return m_count; }

    [[nodiscard]] float distance(size_t i, size_t j) const {
        return m_distances[i * m_count + j];
    }

    // Unit vector pointing from agent i toward agent j
    [[nodiscard]] const Vector3D& direction(size_t i, size_t j) const {
        return m_directions[i * m_count + j];
    }

private:
    static Vector3D unknownDirection() {
        return Vector3D(UNKNOWN_DISTANCE, UNKNOWN_DISTANCE, UNKNOWN_DISTANCE);
    }

    size_t m_count{0};
    std::vector<float> m_distances;
    std::vector<Vector3D> m_directions;
};

} // namespace ShoalEngine

#endif // PAIRWISE_TABLE_HPP
