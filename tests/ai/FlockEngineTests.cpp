/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE FlockEngineTests
#include <boost/test/unit_test.hpp>

#include "ai/FlockEngine.hpp"
#include "ai/SwarmModes.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"
#include "core/ThreadSystem.hpp"
#include "world/SwarmGenerator.hpp"
#include <cmath>
#include <numbers>

using namespace ShoalEngine;

namespace {

constexpr float UNIT_EPSILON = 1e-4f;

// zor = 0.5, zoo = 10, zoa = 20
const ZoneRadii HPP_RADII = getZoneRadii(SimulationMode::HPP);

Agent makeAgent(AgentID id, const Vector3D& position, const Vector3D& heading) {
    return Agent(id, position, heading.normalized());
}

bool approxEqual(const Vector3D& a, const Vector3D& b, float epsilon = UNIT_EPSILON) {
    return std::abs(a.getX() - b.getX()) < epsilon &&
           std::abs(a.getY() - b.getY()) < epsilon &&
           std::abs(a.getZ() - b.getZ()) < epsilon;
}

} // namespace

// Thread pool for the parallel heading pass; shut down once at exit
struct ThreadSystemFixture {
    ThreadSystemFixture() {
        SHOAL_ENABLE_BENCHMARK_MODE();
        ThreadSystem::Instance().init(4);
    }
    ~ThreadSystemFixture() {
        ThreadSystem::Instance().clean();
        SHOAL_DISABLE_BENCHMARK_MODE();
    }
};

BOOST_GLOBAL_FIXTURE(ThreadSystemFixture);

BOOST_AUTO_TEST_SUITE(SwarmModeTests)

BOOST_AUTO_TEST_CASE(TestModeRadiiTable) {
    BOOST_CHECK_EQUAL(getZoneRadii(SimulationMode::Swarm).zor, 2.0f);
    BOOST_CHECK_EQUAL(getZoneRadii(SimulationMode::Swarm).zoo, 3.0f);
    BOOST_CHECK_EQUAL(getZoneRadii(SimulationMode::Swarm).zoa, 7.0f);
    BOOST_CHECK_EQUAL(getZoneRadii(SimulationMode::Torus).zor, 0.3f);
    BOOST_CHECK_EQUAL(getZoneRadii(SimulationMode::Torus).zoa, 15.0f);
    BOOST_CHECK_EQUAL(getZoneRadii(SimulationMode::HPP).zoo, 10.0f);
    BOOST_CHECK_EQUAL(getZoneRadii(SimulationMode::DPP).zor, 0.2f);
    BOOST_CHECK_EQUAL(getZoneRadii(SimulationMode::DPP).zoo, 4.0f);

    for (auto mode : {SimulationMode::Swarm, SimulationMode::Torus, SimulationMode::HPP,
                      SimulationMode::DPP}) {
        BOOST_CHECK(getZoneRadii(mode).isValid());
        BOOST_CHECK_EQUAL(parseSimulationMode(simulationModeName(mode)).value(), mode);
    }
}

BOOST_AUTO_TEST_CASE(TestParseRejectsUnknownModes) {
    BOOST_CHECK(!parseSimulationMode("SWARM").has_value());
    BOOST_CHECK(!parseSimulationMode("vortex").has_value());
    BOOST_CHECK(!parseSimulationMode("").has_value());
}

BOOST_AUTO_TEST_CASE(TestInvalidRadiiRejected) {
    BOOST_CHECK_THROW(FlockEngine(ZoneRadii{0.0f, 1.0f, 2.0f}), InvalidConfigurationError);
    BOOST_CHECK_THROW(FlockEngine(ZoneRadii{1.0f, 1.0f, 2.0f}), InvalidConfigurationError);
    BOOST_CHECK_THROW(FlockEngine(ZoneRadii{1.0f, 3.0f, 2.0f}), InvalidConfigurationError);
    BOOST_CHECK_NO_THROW(FlockEngine(ZoneRadii{1.0f, 2.0f, 3.0f}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(AgentValidationTests)

BOOST_AUTO_TEST_CASE(TestDefaults) {
    Agent agent(3, Vector3D(1.0f, 2.0f, 0.0f), Vector3D(0.0f, 0.0f, 1.0f));
    BOOST_CHECK_EQUAL(agent.getID(), 3u);
    BOOST_CHECK_EQUAL(agent.getSpeed(), 1.0f);
    BOOST_CHECK_EQUAL(agent.getVision(), 360.0f);
    BOOST_CHECK_EQUAL(agent.getTurningAngle(), 40.0f);
}

BOOST_AUTO_TEST_CASE(TestRejectsInvalidState) {
    const Vector3D origin;
    const Vector3D unitX(1.0f, 0.0f, 0.0f);

    BOOST_CHECK_THROW(Agent(0, origin, Vector3D(2.0f, 0.0f, 0.0f)), InvalidConfigurationError);
    BOOST_CHECK_THROW(Agent(0, origin, Vector3D()), InvalidConfigurationError);
    BOOST_CHECK_THROW(Agent(0, origin, unitX, 0.0f), InvalidConfigurationError);
    BOOST_CHECK_THROW(Agent(0, origin, unitX, -1.0f), InvalidConfigurationError);
    BOOST_CHECK_THROW(Agent(0, Vector3D(NAN, 0.0f, 0.0f), unitX), InvalidConfigurationError);
    BOOST_CHECK_THROW(Agent(0, origin, unitX, 1.0f, 360.0f, -5.0f), InvalidConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(FlockEngineRuleTests)

BOOST_AUTO_TEST_CASE(TestHeadingsAreUnitOrUnchanged) {
    for (auto mode : {SimulationMode::Swarm, SimulationMode::Torus, SimulationMode::HPP,
                      SimulationMode::DPP}) {
        BOOST_TEST_CONTEXT("mode " << mode) {
            auto agents = SwarmGenerator::generate(SwarmGenerationConfig{60, 42u, 15.0f});
            FlockEngine engine(getZoneRadii(mode));

            for (int tick = 0; tick < 5; ++tick) {
                auto headings = engine.computeNextHeadings(agents);
                BOOST_REQUIRE_EQUAL(headings.size(), agents.size());
                for (const auto& agent : agents) {
                    const Vector3D& next = headings.at(agent.getID());
                    const bool unchanged = next == agent.getHeading();
                    BOOST_CHECK(unchanged || std::abs(next.length() - 1.0f) < UNIT_EPSILON);
                }
                FlockEngine::applyHeadings(agents, headings, 0.1f);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(TestTwoAgentsTooCloseSteerApart) {
    // 0.1 apart with zor = 0.5, facing each other
    std::vector<Agent> agents{
        makeAgent(0, Vector3D(0.0f, 0.0f, 0.0f), Vector3D(1.0f, 0.0f, 0.0f)),
        makeAgent(1, Vector3D(0.1f, 0.0f, 0.0f), Vector3D(-1.0f, 0.0f, 0.0f)),
    };
    FlockEngine engine(HPP_RADII);
    auto headings = engine.computeNextHeadings(agents);

    const Vector3D towardSecond(1.0f, 0.0f, 0.0f);
    BOOST_CHECK_LT(headings.at(0).dot(towardSecond), 0.0f);
    BOOST_CHECK_LT(headings.at(1).dot(-towardSecond), 0.0f);
    BOOST_CHECK(approxEqual(headings.at(0), Vector3D(-1.0f, 0.0f, 0.0f)));
    BOOST_CHECK(approxEqual(headings.at(1), Vector3D(1.0f, 0.0f, 0.0f)));
}

BOOST_AUTO_TEST_CASE(TestRepulsionDominatesFartherNeighbors) {
    const Vector3D heading(0.0f, 0.0f, 1.0f);
    std::vector<Agent> close{
        makeAgent(0, Vector3D(0.0f, 0.0f, 0.0f), heading),
        makeAgent(1, Vector3D(0.0f, 0.3f, 0.0f), heading),
    };

    // Same pair plus neighbors in agent 0's orientation and attraction zones
    std::vector<Agent> crowded = close;
    crowded.push_back(makeAgent(2, Vector3D(5.0f, 0.0f, 0.0f), Vector3D(1.0f, 0.0f, 0.0f)));
    crowded.push_back(makeAgent(3, Vector3D(0.0f, 0.0f, -15.0f), Vector3D(0.0f, 1.0f, 0.0f)));

    FlockEngine engine(HPP_RADII);
    const Vector3D alone = engine.computeNextHeadings(close).at(0);
    const Vector3D withOthers = engine.computeNextHeadings(crowded).at(0);

    BOOST_CHECK_EQUAL(alone, withOthers);
    BOOST_CHECK(approxEqual(alone, Vector3D(0.0f, -1.0f, 0.0f)));
}

BOOST_AUTO_TEST_CASE(TestLoneOrientationNeighborIsMatched) {
    const Vector3D neighborHeading = Vector3D(0.0f, 1.0f, 1.0f).normalized();
    const Vector3D isolatedHeading(1.0f, 0.0f, 0.0f);
    std::vector<Agent> agents{
        makeAgent(0, Vector3D(0.0f, 0.0f, 0.0f), Vector3D(1.0f, 0.0f, 0.0f)),
        makeAgent(1, Vector3D(5.0f, 0.0f, 0.0f), neighborHeading),
        makeAgent(2, Vector3D(100.0f, 0.0f, 0.0f), isolatedHeading),
    };

    FlockEngine engine(HPP_RADII);
    auto headings = engine.computeNextHeadings(agents);

    BOOST_CHECK(approxEqual(headings.at(0), neighborHeading));
    BOOST_CHECK(approxEqual(headings.at(1), Vector3D(1.0f, 0.0f, 0.0f)));
    // No neighbor in any zone: heading is carried over exactly
    BOOST_CHECK_EQUAL(headings.at(2), agents[2].getHeading());
}

BOOST_AUTO_TEST_CASE(TestLoneAttractionNeighborPulls) {
    std::vector<Agent> agents{
        makeAgent(0, Vector3D(0.0f, 0.0f, 0.0f), Vector3D(0.0f, 0.0f, 1.0f)),
        makeAgent(1, Vector3D(15.0f, 0.0f, 0.0f), Vector3D(0.0f, 0.0f, 1.0f)),
    };
    FlockEngine engine(HPP_RADII);
    auto headings = engine.computeNextHeadings(agents);

    BOOST_CHECK(approxEqual(headings.at(0), Vector3D(1.0f, 0.0f, 0.0f)));
    BOOST_CHECK(approxEqual(headings.at(1), Vector3D(-1.0f, 0.0f, 0.0f)));
}

BOOST_AUTO_TEST_CASE(TestOrientationAndAttractionCombine) {
    std::vector<Agent> agents{
        makeAgent(0, Vector3D(0.0f, 0.0f, 0.0f), Vector3D(1.0f, 0.0f, 0.0f)),
        makeAgent(1, Vector3D(5.0f, 0.0f, 0.0f), Vector3D(0.0f, 1.0f, 0.0f)),
        makeAgent(2, Vector3D(0.0f, 0.0f, 15.0f), Vector3D(1.0f, 0.0f, 0.0f)),
    };
    FlockEngine engine(HPP_RADII);
    auto headings = engine.computeNextHeadings(agents);

    // 0.5 * neighbor heading (0,1,0) + 0.5 * direction to agent 2 (0,0,1)
    BOOST_CHECK(approxEqual(headings.at(0), Vector3D(0.0f, 1.0f, 1.0f).normalized()));
}

BOOST_AUTO_TEST_CASE(TestCancellingInfluencesKeepHeading) {
    // Opposite orientation neighbors sum to exactly zero for agent 0
    const Vector3D ownHeading = Vector3D(0.3f, 0.0f, 1.0f).normalized();
    std::vector<Agent> agents{
        makeAgent(0, Vector3D(0.0f, 0.0f, 0.0f), ownHeading),
        makeAgent(1, Vector3D(5.0f, 0.0f, 0.0f), Vector3D(0.0f, 1.0f, 0.0f)),
        makeAgent(2, Vector3D(-5.0f, 0.0f, 0.0f), Vector3D(0.0f, -1.0f, 0.0f)),
    };
    FlockEngine engine(HPP_RADII);
    auto headings = engine.computeNextHeadings(agents);

    BOOST_CHECK_EQUAL(headings.at(0), agents[0].getHeading());
}

BOOST_AUTO_TEST_CASE(TestInputAgentsNotModified) {
    auto agents = SwarmGenerator::generate(SwarmGenerationConfig{30, 9u, 5.0f});
    const auto before = agents;

    FlockEngine engine(getZoneRadii(SimulationMode::Swarm));
    (void)engine.computeNextHeadings(agents);

    for (size_t i = 0; i < agents.size(); ++i) {
        BOOST_CHECK_EQUAL(agents[i].getPosition(), before[i].getPosition());
        BOOST_CHECK_EQUAL(agents[i].getHeading(), before[i].getHeading());
    }
}

BOOST_AUTO_TEST_CASE(TestScratchTableResetAndRepeatable) {
    auto agents = SwarmGenerator::generate(SwarmGenerationConfig{80, 77u, 15.0f});
    FlockEngine engine(getZoneRadii(SimulationMode::Torus));

    auto first = engine.computeNextHeadings(agents);
    BOOST_CHECK(engine.getPairwiseTable().isReset());

    auto second = engine.computeNextHeadings(agents);
    BOOST_CHECK(engine.getPairwiseTable().isReset());

    BOOST_REQUIRE_EQUAL(first.size(), second.size());
    for (const auto& [id, heading] : first) {
        BOOST_CHECK_EQUAL(heading, second.at(id));
    }

    // A fresh engine on the same input agrees too
    FlockEngine other(getZoneRadii(SimulationMode::Torus));
    auto third = other.computeNextHeadings(agents);
    for (const auto& [id, heading] : first) {
        BOOST_CHECK_EQUAL(heading, third.at(id));
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(FlockEngineMotionTests)

BOOST_AUTO_TEST_CASE(TestApplyHeadingsIntegratesPosition) {
    std::vector<Agent> agents{
        Agent(0, Vector3D(1.0f, 1.0f, 1.0f), Vector3D(1.0f, 0.0f, 0.0f), 2.0f),
        Agent(1, Vector3D(0.0f, 0.0f, 0.0f), Vector3D(0.0f, 0.0f, 1.0f)),
    };

    FlockEngine::HeadingMap headings;
    headings[0] = Vector3D(0.0f, 1.0f, 0.0f);

    FlockEngine::applyHeadings(agents, headings, 0.5f);

    BOOST_CHECK_EQUAL(agents[0].getHeading(), Vector3D(0.0f, 1.0f, 0.0f));
    BOOST_CHECK(approxEqual(agents[0].getPosition(), Vector3D(1.0f, 2.0f, 1.0f)));

    // Missing from the map: keeps heading, still moves
    BOOST_CHECK_EQUAL(agents[1].getHeading(), Vector3D(0.0f, 0.0f, 1.0f));
    BOOST_CHECK(approxEqual(agents[1].getPosition(), Vector3D(0.0f, 0.0f, 0.5f)));
}

BOOST_AUTO_TEST_CASE(TestAdvanceMovesEveryAgent) {
    auto agents = SwarmGenerator::generate(SwarmGenerationConfig{25, 3u, 15.0f});
    const auto before = agents;

    FlockEngine engine(getZoneRadii(SimulationMode::DPP));
    engine.advance(agents, 0.1f);

    for (size_t i = 0; i < agents.size(); ++i) {
        const float moved = Vector3D::distance(before[i].getPosition(), agents[i].getPosition());
        BOOST_CHECK_CLOSE(moved, 0.1f, 0.1f);
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(FlockEngineTurnRateTests)

BOOST_AUTO_TEST_CASE(TestStrictTurnRateClampsTurn) {
    std::vector<Agent> agents{
        makeAgent(0, Vector3D(0.0f, 0.0f, 0.0f), Vector3D(1.0f, 0.0f, 0.0f)),
        makeAgent(1, Vector3D(0.0f, 15.0f, 0.0f), Vector3D(1.0f, 0.0f, 0.0f)),
    };

    FlockEngine relaxed(HPP_RADII, false);
    BOOST_CHECK(approxEqual(relaxed.computeNextHeadings(agents).at(0), Vector3D(0.0f, 1.0f, 0.0f)));

    FlockEngine strict(HPP_RADII, true);
    const Vector3D clamped = strict.computeNextHeadings(agents).at(0);
    const float maxTurn = 40.0f * std::numbers::pi_v<float> / 180.0f;

    BOOST_CHECK_CLOSE(clamped.length(), 1.0f, 0.01f);
    BOOST_CHECK_CLOSE(Vector3D::angleBetween(agents[0].getHeading(), clamped), maxTurn, 0.1f);
    BOOST_CHECK_GT(clamped.getY(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestStrictTurnRateLeavesSmallTurns) {
    std::vector<Agent> agents{
        makeAgent(0, Vector3D(0.0f, 0.0f, 0.0f), Vector3D(1.0f, 0.0f, 0.0f)),
        makeAgent(1, Vector3D(5.0f, 0.0f, 0.0f), Vector3D(1.0f, 0.2f, 0.0f)),
    };

    FlockEngine relaxed(HPP_RADII, false);
    FlockEngine strict(HPP_RADII, true);
    BOOST_CHECK_EQUAL(relaxed.computeNextHeadings(agents).at(0),
                      strict.computeNextHeadings(agents).at(0));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(FlockEngineParallelTests)

BOOST_AUTO_TEST_CASE(TestParallelMatchesSequential) {
    BOOST_REQUIRE(ThreadSystem::Instance().isInitialized());

    auto agents = SwarmGenerator::generate(SwarmGenerationConfig{300, 2024u, 15.0f});

    FlockEngine sequential(getZoneRadii(SimulationMode::Swarm), false, 100000);
    FlockEngine parallel(getZoneRadii(SimulationMode::Swarm), false, 64);

    const size_t enqueuedBefore = ThreadSystem::Instance().getTotalTasksEnqueued();
    auto expected = sequential.computeNextHeadings(agents);
    auto actual = parallel.computeNextHeadings(agents);
    BOOST_CHECK_GT(ThreadSystem::Instance().getTotalTasksEnqueued(), enqueuedBefore);

    BOOST_REQUIRE_EQUAL(expected.size(), actual.size());
    for (const auto& [id, heading] : expected) {
        BOOST_CHECK_EQUAL(heading, actual.at(id));
    }
    BOOST_CHECK(parallel.getPairwiseTable().isReset());
}

BOOST_AUTO_TEST_SUITE_END()
