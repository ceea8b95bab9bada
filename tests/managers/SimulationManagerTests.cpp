/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SimulationManagerTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/SimulationManager.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <set>
#include <thread>
#include <vector>

using namespace ShoalEngine;
using namespace std::chrono_literals;

namespace {

SimulationSettings quickSettings(int agents = 10, SimulationMode mode = SimulationMode::Swarm) {
    SimulationSettings settings;
    settings.numAgents = agents;
    settings.mode = mode;
    settings.updateInterval = 0.01f;
    settings.seed = 99;
    return settings;
}

} // namespace

struct GlobalTestFixture {
    GlobalTestFixture() {
        SHOAL_ENABLE_BENCHMARK_MODE();
        ThreadSystem::Instance().init(2);
    }
    ~GlobalTestFixture() {
        ThreadSystem::Instance().clean();
        SHOAL_DISABLE_BENCHMARK_MODE();
    }
};

BOOST_GLOBAL_FIXTURE(GlobalTestFixture);

struct SimulationManagerFixture {
    SimulationManagerFixture() : manager(SimulationManager::Instance()) {
        manager.init();
    }
    ~SimulationManagerFixture() {
        manager.clean();
    }

    SimulationManager& manager;
};

BOOST_AUTO_TEST_SUITE(SimulationManagerLifecycleTests)

BOOST_AUTO_TEST_CASE(TestCreateBeforeInit) {
    auto& manager = SimulationManager::Instance();
    manager.clean();
    BOOST_CHECK(!manager.isInitialized());
    BOOST_CHECK_EQUAL(manager.create(quickSettings()), INVALID_SIMULATION_ID);
    BOOST_CHECK_EQUAL(manager.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestInitIsIdempotent) {
    auto& manager = SimulationManager::Instance();
    BOOST_CHECK(manager.init());
    BOOST_CHECK(manager.init());
    BOOST_CHECK(manager.isInitialized());
    manager.clean();
    BOOST_CHECK(!manager.isInitialized());
}

BOOST_AUTO_TEST_CASE(TestCleanClosesEverySimulation) {
    auto& manager = SimulationManager::Instance();
    manager.init();
    auto first = manager.get(manager.create(quickSettings()));
    auto second = manager.get(manager.create(quickSettings()));
    BOOST_REQUIRE(first && second);
    auto channel = first->registerSubscriber();
    BOOST_REQUIRE(channel);

    manager.clean();

    BOOST_CHECK_EQUAL(manager.size(), 0u);
    BOOST_CHECK(first->getState() == SimulationState::Closed);
    BOOST_CHECK(second->getState() == SimulationState::Closed);
    BOOST_CHECK(channel->isClosed());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SimulationManagerRegistryTests, SimulationManagerFixture)

BOOST_AUTO_TEST_CASE(TestCreateAndGet) {
    const SimulationID id = manager.create(quickSettings(25, SimulationMode::HPP));
    BOOST_REQUIRE_NE(id, INVALID_SIMULATION_ID);
    BOOST_CHECK_EQUAL(manager.size(), 1u);

    auto simulation = manager.get(id);
    BOOST_REQUIRE(simulation);
    BOOST_CHECK_EQUAL(simulation->getID(), id);
    BOOST_CHECK(simulation->getState() == SimulationState::Idle);

    auto snap = simulation->snapshot();
    BOOST_CHECK_EQUAL(snap.agents.size(), 25u);
    BOOST_CHECK(snap.params.mode == SimulationMode::HPP);
    BOOST_CHECK_EQUAL(snap.tick, 0u);
}

BOOST_AUTO_TEST_CASE(TestIdsAreUnique) {
    std::set<SimulationID> ids;
    for (int i = 0; i < 5; ++i) {
        ids.insert(manager.create(quickSettings(3)));
    }
    BOOST_CHECK_EQUAL(ids.size(), 5u);
    BOOST_CHECK(ids.count(INVALID_SIMULATION_ID) == 0);
    BOOST_CHECK_EQUAL(manager.size(), 5u);
}

BOOST_AUTO_TEST_CASE(TestUnknownIds) {
    BOOST_CHECK(!manager.get(123456));
    BOOST_CHECK(!manager.get(INVALID_SIMULATION_ID));
    BOOST_CHECK(!manager.remove(123456));
}

BOOST_AUTO_TEST_CASE(TestInvalidSettingsRejected) {
    manager.create(quickSettings());

    auto settings = quickSettings();
    settings.numAgents = 0;
    BOOST_CHECK_THROW(manager.create(settings), InvalidConfigurationError);

    settings = quickSettings();
    settings.timestep = -1.0f;
    BOOST_CHECK_THROW(manager.create(settings), InvalidConfigurationError);

    settings = quickSettings();
    settings.updateInterval = 0.0f;
    BOOST_CHECK_THROW(manager.create(settings), InvalidConfigurationError);

    BOOST_CHECK_EQUAL(manager.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestListOrderedById) {
    const SimulationID first = manager.create(quickSettings(4, SimulationMode::Torus));
    const SimulationID second = manager.create(quickSettings(6, SimulationMode::DPP));

    auto summaries = manager.list();
    BOOST_REQUIRE_EQUAL(summaries.size(), 2u);
    BOOST_CHECK_EQUAL(summaries[0].simulationId, first);
    BOOST_CHECK_EQUAL(summaries[0].numAgents, 4);
    BOOST_CHECK(summaries[0].mode == SimulationMode::Torus);
    BOOST_CHECK_EQUAL(summaries[1].simulationId, second);
    BOOST_CHECK_EQUAL(summaries[1].numAgents, 6);
    BOOST_CHECK(summaries[1].mode == SimulationMode::DPP);
    BOOST_CHECK(summaries[1].state == SimulationState::Idle);
}

BOOST_AUTO_TEST_CASE(TestListEmpty) {
    BOOST_CHECK(manager.list().empty());
}

BOOST_AUTO_TEST_CASE(TestRemoveNotifiesSubscribers) {
    const SimulationID id = manager.create(quickSettings());
    auto simulation = manager.get(id);
    auto channel = simulation->registerSubscriber();
    BOOST_REQUIRE(channel);
    BOOST_REQUIRE(channel->pop(2000ms).has_value());

    BOOST_CHECK(manager.remove(id));
    BOOST_CHECK(!manager.get(id));
    BOOST_CHECK_EQUAL(manager.size(), 0u);
    BOOST_CHECK(!manager.remove(id));

    std::optional<SimulationMessage> message;
    do {
        message = channel->tryPop();
        BOOST_REQUIRE(message.has_value());
    } while (message->type == MessageType::Tick);
    BOOST_CHECK(message->type == MessageType::Shutdown);

    // A caller still holding the instance sees it Closed
    BOOST_CHECK(simulation->getState() == SimulationState::Closed);
    BOOST_CHECK(!simulation->registerSubscriber());
}

BOOST_AUTO_TEST_CASE(TestRemovingOneLeavesOthersRunning) {
    const SimulationID keep = manager.create(quickSettings());
    const SimulationID drop = manager.create(quickSettings());
    auto kept = manager.get(keep);
    auto channel = kept->registerSubscriber();
    BOOST_REQUIRE(channel);

    BOOST_CHECK(manager.remove(drop));

    for (int i = 0; i < 3; ++i) {
        auto message = channel->pop(2000ms);
        BOOST_REQUIRE(message.has_value());
        BOOST_CHECK(message->type == MessageType::Tick);
    }
    BOOST_CHECK(kept->getState() == SimulationState::Running);

    kept->unregisterSubscriber(channel);
    BOOST_CHECK(kept->waitUntilIdle(2000ms));
}

BOOST_AUTO_TEST_CASE(TestConcurrentCreateAndRemove) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 5;
    std::atomic<int> created{0};
    std::atomic<int> removed{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < PER_THREAD; ++i) {
                const SimulationID id = manager.create(quickSettings(3));
                if (id == INVALID_SIMULATION_ID) {
                    ++failures;
                    continue;
                }
                ++created;
                if (i % 2 == 0) {
                    if (manager.remove(id)) {
                        ++removed;
                    } else {
                        ++failures;
                    }
                }
                (void)manager.list();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(failures.load(), 0);
    BOOST_CHECK_EQUAL(created.load(), THREADS * PER_THREAD);
    BOOST_CHECK_EQUAL(manager.size(), static_cast<size_t>(created.load() - removed.load()));
}

BOOST_AUTO_TEST_SUITE_END()
