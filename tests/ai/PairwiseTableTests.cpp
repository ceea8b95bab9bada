/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PairwiseTableTests
#include <boost/test/unit_test.hpp>

#include "ai/PairwiseTable.hpp"
#include "world/SwarmGenerator.hpp"
#include <cmath>

using namespace ShoalEngine;

namespace {

Agent makeAgent(AgentID id, float x, float y, float z) {
    return Agent(id, Vector3D(x, y, z), Vector3D(1.0f, 0.0f, 0.0f));
}

} // namespace

BOOST_AUTO_TEST_SUITE(PairwiseTableTests)

BOOST_AUTO_TEST_CASE(TestFreshTableIsEmptyAndReset) {
    PairwiseTable table;
    BOOST_CHECK_EQUAL(table.size(), 0u);
    BOOST_CHECK(table.isReset());
}

BOOST_AUTO_TEST_CASE(TestDistancesAndDirections) {
    std::vector<Agent> agents{makeAgent(0, 0.0f, 0.0f, 0.0f), makeAgent(1, 3.0f, 4.0f, 0.0f),
                              makeAgent(2, 0.0f, 0.0f, -2.0f)};
    PairwiseTable table;
    table.build(agents);

    BOOST_CHECK_EQUAL(table.size(), 3u);
    BOOST_CHECK_CLOSE(table.distance(0, 1), 5.0f, 0.001f);
    BOOST_CHECK_CLOSE(table.distance(0, 2), 2.0f, 0.001f);

    const Vector3D& toSecond = table.direction(0, 1);
    BOOST_CHECK_CLOSE(toSecond.getX(), 0.6f, 0.001f);
    BOOST_CHECK_CLOSE(toSecond.getY(), 0.8f, 0.001f);
    BOOST_CHECK_EQUAL(table.direction(0, 2), Vector3D(0.0f, 0.0f, -1.0f));

    // Diagonal is never written
    BOOST_CHECK_EQUAL(table.distance(1, 1), PairwiseTable::UNKNOWN_DISTANCE);
    BOOST_CHECK(!table.isReset());
}

BOOST_AUTO_TEST_CASE(TestSymmetryIsExact) {
    auto agents = SwarmGenerator::generate(SwarmGenerationConfig{40, 1234u, 15.0f});
    PairwiseTable table;
    table.build(agents);

    for (size_t i = 0; i < agents.size(); ++i) {
        for (size_t j = 0; j < agents.size(); ++j) {
            if (i == j) {
                continue;
            }
            BOOST_REQUIRE_EQUAL(table.distance(i, j), table.distance(j, i));
            BOOST_REQUIRE_EQUAL(table.direction(i, j), -table.direction(j, i));
            BOOST_REQUIRE_CLOSE(table.direction(i, j).length(), 1.0f, 0.01f);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestCoincidentAgentsHaveZeroDirection) {
    std::vector<Agent> agents{makeAgent(0, 1.0f, 1.0f, 1.0f), makeAgent(1, 1.0f, 1.0f, 1.0f)};
    PairwiseTable table;
    table.build(agents);

    BOOST_CHECK_EQUAL(table.distance(0, 1), 0.0f);
    BOOST_CHECK(table.direction(0, 1).isZero());
    BOOST_CHECK(table.direction(0, 1).isFinite());
}

BOOST_AUTO_TEST_CASE(TestResetRestoresSentinel) {
    std::vector<Agent> agents{makeAgent(0, 0.0f, 0.0f, 0.0f), makeAgent(1, 1.0f, 0.0f, 0.0f)};
    PairwiseTable table;
    table.build(agents);
    table.reset();

    BOOST_CHECK(table.isReset());
    BOOST_CHECK_EQUAL(table.size(), 2u);
    BOOST_CHECK_EQUAL(table.distance(0, 1), PairwiseTable::UNKNOWN_DISTANCE);
    BOOST_CHECK(std::isinf(table.direction(1, 0).getX()));
}

BOOST_AUTO_TEST_CASE(TestRebuildWithFewerAgents) {
    PairwiseTable table;
    table.build(SwarmGenerator::generate(SwarmGenerationConfig{10, 5u, 15.0f}));
    table.reset();

    std::vector<Agent> agents{makeAgent(0, 0.0f, 0.0f, 0.0f), makeAgent(1, 0.0f, 2.0f, 0.0f)};
    table.build(agents);

    BOOST_CHECK_EQUAL(table.size(), 2u);
    BOOST_CHECK_CLOSE(table.distance(1, 0), 2.0f, 0.001f);
    BOOST_CHECK_EQUAL(table.direction(1, 0), Vector3D(0.0f, -1.0f, 0.0f));
}

BOOST_AUTO_TEST_SUITE_END()
