/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/PairwiseTable.hpp"
#include <algorithm>

namespace ShoalEngine {

void PairwiseTable::build(const std::vector<Agent>& agents) {
    m_count = agents.size();
    const size_t cells = m_count * m_count;

    // Reuses capacity from previous ticks
    m_distances.assign(cells, UNKNOWN_DISTANCE);
    m_directions.assign(cells, unknownDirection());

    for (size_t i = 0; i < m_count; ++i) {
        const Vector3D& pi = agents[i].getPosition();
        for (size_t j = i + 1; j < m_count; ++j) {
            const Vector3D offset = agents[j].getPosition() - pi;
            const float dist = offset.length();
            const Vector3D dir = offset.normalized();

            m_distances[i * m_count + j] = dist;
            m_distances[j * m_count + i] = dist;
            m_directions[i * m_count + j] = dir;
            m_directions[j * m_count + i] = -dir;
        }
    }
}

void PairwiseTable::reset() {
    std::fill(m_distances.begin(), m_distances.end(), UNKNOWN_DISTANCE);
    std::fill(m_directions.begin(), m_directions.end(), unknownDirection());
}

bool PairwiseTable::isReset() const {
    const bool distancesClear =
        std::all_of(m_distances.begin(), m_distances.end(),
                    [](float d) { return d == UNKNOWN_DISTANCE; });
    if (!distancesClear) {
        return false;
    }
    const Vector3D unknown = unknownDirection();
    return std::all_of(m_directions.begin(), m_directions.end(),
                       [&unknown](const Vector3D& v) { return v == unknown; });
}

} // namespace ShoalEngine
