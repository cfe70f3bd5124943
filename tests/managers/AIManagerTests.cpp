/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file AIManagerTests.cpp
 * @brief Tick-level tests for AIManager against an in-memory world
 *
 * Covers:
 * - Lifecycle events (init, periodic pathfinding stats)
 * - State changes driven through full ticks
 * - Agent and pathfinding budgets with round-robin fairness
 * - Agent bookkeeping when entities vanish or die
 * - Obstacle and algorithm changes invalidating caches
 * - Dead agents holding still, threat memory and profile behavior trees
 */

#define BOOST_TEST_MODULE AIManagerTests
#include <boost/test/unit_test.hpp>

#include "ai/BehaviorTree.hpp"
#include "core/Logger.hpp"
#include "managers/AIManager.hpp"
#include "../mocks/MockWorld.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

using namespace HordeMind;

namespace {

AIConfig testConfig() {
    AIConfig config;
    config.worldMin = Vector2D(-1000.0f, -1000.0f);
    config.worldMax = Vector2D(1000.0f, 1000.0f);
    return config;
}

} // namespace

struct ManagerFixture {
    explicit ManagerFixture(const AIConfig& config = testConfig()) : manager(world, config) {}

    void tick(double nowMs) {
        TickContext ctx;
        ctx.deltaTime = static_cast<float>((nowMs - lastTime) / 1000.0);
        ctx.totalTimeMs = nowMs;
        ctx.frameCount = ++frames;
        lastTime = nowMs;
        manager.update(ctx, world.agentRefs());
    }

    MockWorld world;
    AIManager manager;
    double lastTime{0.0};
    uint64_t frames{0};
};

BOOST_FIXTURE_TEST_SUITE(LifecycleTests, ManagerFixture)

BOOST_AUTO_TEST_CASE(InitEmitsOnce)
{
    BOOST_CHECK(!manager.isInitialized());
    BOOST_CHECK(manager.init());
    BOOST_CHECK(manager.init());
    BOOST_CHECK(manager.isInitialized());
    BOOST_CHECK_EQUAL(world.countEvents(EventTypeId::AISystemInitialized), 1u);

    const auto& payload = world.events().front().payload;
    const auto* init = std::get_if<AISystemInitializedEvent>(&payload);
    BOOST_REQUIRE(init != nullptr);
    BOOST_CHECK_EQUAL(init->algorithm, PathfindingAlgorithm::FlowField);
    BOOST_CHECK_EQUAL(init->maxAgentUpdatesPerTick, 50u);
    BOOST_CHECK_EQUAL(init->maxPathfindsPerTick, 10u);
}

BOOST_AUTO_TEST_CASE(UpdateBeforeInitDoesNothing)
{
    world.addAgent(1, Vector2D(0.0f, 0.0f));
    tick(0.0);
    BOOST_CHECK_EQUAL(manager.getAgentCount(), 0u);
    BOOST_CHECK(world.events().empty());
}

BOOST_AUTO_TEST_CASE(StatsEventFollowsMaintenanceInterval)
{
    manager.init();
    world.addAgent(1, Vector2D(0.0f, 0.0f));

    tick(0.0);
    tick(4000.0);
    BOOST_CHECK_EQUAL(world.countEvents(EventTypeId::PathfindingStats), 0u);
    tick(5000.0);
    BOOST_CHECK_EQUAL(world.countEvents(EventTypeId::PathfindingStats), 1u);
    tick(6000.0);
    BOOST_CHECK_EQUAL(world.countEvents(EventTypeId::PathfindingStats), 1u);
    tick(10000.0);
    BOOST_CHECK_EQUAL(world.countEvents(EventTypeId::PathfindingStats), 2u);
}

BOOST_AUTO_TEST_CASE(CleanForgetsEverything)
{
    manager.init();
    world.addAgent(1, Vector2D(0.0f, 0.0f));
    world.addCombatant(100, Vector2D(100.0f, 0.0f));
    tick(0.0);
    BOOST_CHECK_EQUAL(manager.getAgentCount(), 1u);

    manager.clean();
    BOOST_CHECK(!manager.isInitialized());
    BOOST_CHECK_EQUAL(manager.getAgentCount(), 0u);
    BOOST_CHECK_EQUAL(manager.spatialIndex().size(), 0u);
}

BOOST_AUTO_TEST_CASE(CleanResetsCacheHitRate)
{
    manager.init();
    world.addCombatant(100, Vector2D(0.0f, 150.0f));
    world.addAgent(1, Vector2D(5.0f, 5.0f));
    world.addAgent(2, Vector2D(10.0f, 5.0f));
    tick(0.0);
    tick(1.0);

    // Both agents share a cache key; the second request is a hit
    BOOST_CHECK_EQUAL(manager.getStats().requestsServedThisTick, 2u);
    BOOST_CHECK_GT(manager.getStats().pathCacheHitRate, 0.0f);

    manager.clean();
    BOOST_CHECK_EQUAL(manager.getStats().pathCacheHitRate, 0.0f);
    BOOST_CHECK_EQUAL(manager.getStats().pathCacheSize, 0u);
}

BOOST_AUTO_TEST_CASE(RejectsBadConfig)
{
    AIConfig bad = testConfig();
    bad.spatialCellSize = 0.0f;
    BOOST_CHECK_THROW(AIManager(world, bad), std::invalid_argument);

    bad = testConfig();
    bad.maxAgentUpdatesPerTick = -5;
    BOOST_CHECK_THROW(AIManager(world, bad), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DecisionTests, ManagerFixture)

BOOST_AUTO_TEST_CASE(IdleAgentStartsChasingApproachingTarget)
{
    manager.init();
    world.addAgent(1, Vector2D(0.0f, 0.0f));
    world.addCombatant(100, Vector2D(500.0f, 0.0f));

    tick(0.0);
    BOOST_REQUIRE(manager.getAgent(1) != nullptr);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->state, AIState::IDLE);
    BOOST_CHECK_EQUAL(manager.getPrimaryTarget(), 100u);

    world.setPosition(100, Vector2D(150.0f, 0.0f));
    tick(100.0);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->state, AIState::CHASE);

    const auto changes = world.stateChangesFor(1);
    BOOST_REQUIRE_EQUAL(changes.size(), 1u);
    BOOST_CHECK_EQUAL(changes[0].previousState, AIState::IDLE);
    BOOST_CHECK_EQUAL(changes[0].newState, AIState::CHASE);
    BOOST_CHECK_EQUAL(changes[0].timestamp, 100.0);
    BOOST_CHECK_EQUAL(manager.getStats().pendingRequests, 1u);

    // Next tick serves the queued request and the agent starts moving
    tick(200.0);
    BOOST_CHECK_EQUAL(manager.getStats().requestsServedThisTick, 1u);
    BOOST_CHECK(manager.getAgent(1)->hasPath());
    BOOST_CHECK_GT(world.find(1)->movement->velocity.getX(), 0.0f);
}

BOOST_AUTO_TEST_CASE(CloseTargetIsAttacked)
{
    manager.init();
    world.addAgent(1, Vector2D(0.0f, 0.0f));
    world.addCombatant(100, Vector2D(30.0f, 0.0f));

    tick(0.0);
    const AgentRecord* agent = manager.getAgent(1);
    BOOST_REQUIRE(agent != nullptr);
    BOOST_CHECK_EQUAL(agent->state, AIState::ATTACK);
    BOOST_CHECK_EQUAL(agent->attacksPerformed, 1u);
    BOOST_CHECK(world.find(1)->movement->velocity.isZero());
}

BOOST_AUTO_TEST_CASE(AgentsRespectUpdateInterval)
{
    manager.init();
    world.addAgent(1, Vector2D(0.0f, 0.0f));
    world.addCombatant(100, Vector2D(500.0f, 0.0f));

    tick(0.0);
    world.setPosition(100, Vector2D(150.0f, 0.0f));
    tick(50.0);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->state, AIState::IDLE);
    BOOST_CHECK_EQUAL(manager.getStats().agentUpdatesThisTick, 0u);
    tick(100.0);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->state, AIState::CHASE);
}

BOOST_AUTO_TEST_CASE(DeathIsPermanent)
{
    manager.init();
    world.addAgent(1, Vector2D(0.0f, 0.0f));
    tick(0.0);

    world.setHealth(1, 0.0f, 50.0);
    tick(100.0);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->state, AIState::DEAD);

    world.setHealth(1, 100.0f);
    world.addCombatant(100, Vector2D(100.0f, 0.0f));
    tick(200.0);
    tick(300.0);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->state, AIState::DEAD);
    BOOST_CHECK_EQUAL(world.stateChangesFor(1).size(), 1u);
}

BOOST_AUTO_TEST_CASE(DeadSwarmAgentStaysStillAndIsNotAnAlly)
{
    AIProfile swarm;
    swarm.personality = PersonalityType::SWARM;
    manager.init();
    world.addAgent(1, Vector2D(0.0f, 0.0f), swarm);
    world.addAgent(2, Vector2D(60.0f, 0.0f), swarm);
    tick(0.0);

    world.setHealth(1, 0.0f, 50.0);
    tick(100.0);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->state, AIState::DEAD);
    BOOST_CHECK(world.find(1)->movement->velocity.isZero());

    tick(200.0);
    BOOST_CHECK(world.find(1)->movement->velocity.isZero());
    BOOST_CHECK(world.find(2)->movement->velocity.isZero());
    // The corpse is skipped without using an update slot
    BOOST_CHECK_EQUAL(manager.getStats().agentUpdatesThisTick, 1u);
}

BOOST_AUTO_TEST_CASE(DamageSourceTakesOverTarget)
{
    manager.init();
    world.addCombatant(100, Vector2D(100.0f, 0.0f));
    world.addCombatant(101, Vector2D(0.0f, 120.0f));
    world.addAgent(1, Vector2D(0.0f, 0.0f));

    tick(0.0);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->targetId, 100u);

    BOOST_CHECK(manager.recordDamage(1, 101, 60.0f));
    BOOST_CHECK(!manager.recordDamage(1, 1, 60.0f));
    BOOST_CHECK(!manager.recordDamage(7, 101, 60.0f));
    tick(100.0);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->targetId, 101u);
    BOOST_CHECK_CLOSE(manager.getAgent(1)->threatLevel(101), 0.6f, 0.001f);
}

BOOST_AUTO_TEST_CASE(ProfileBehaviorTreeRunsEachEvaluation)
{
    auto calls = std::make_shared<int>(0);
    auto tree = std::make_shared<ActionNode>([calls](AgentRecord& agent, const AIContext&) {
        ++*calls;
        agent.targetPosition = Vector2D(0.0f, 300.0f);
        return true;
    });

    AIProfile profile;
    profile.behaviorTree = tree;
    manager.init();
    world.addAgent(1, Vector2D(0.0f, 0.0f), profile);

    // The tree overrides IDLE's stop and sends the agent somewhere
    tick(0.0);
    BOOST_CHECK_EQUAL(*calls, 1);
    BOOST_CHECK_EQUAL(manager.getStats().pendingRequests, 1u);

    tick(50.0);
    BOOST_CHECK_EQUAL(*calls, 1);
    tick(100.0);
    BOOST_CHECK_EQUAL(*calls, 2);

    world.setHealth(1, 0.0f, 150.0);
    tick(200.0);
    tick(300.0);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->state, AIState::DEAD);
    BOOST_CHECK_EQUAL(*calls, 2);
}

BOOST_AUTO_TEST_CASE(ThrowingBehaviorTreeDoesNotStopTheTick)
{
    AIProfile profile;
    profile.behaviorTree = std::make_shared<ActionNode>([](AgentRecord&, const AIContext&) -> bool {
        throw std::runtime_error("broken action");
    });
    manager.init();
    world.addAgent(1, Vector2D(0.0f, 0.0f), profile);
    world.addAgent(2, Vector2D(100.0f, 0.0f));

    BOOST_CHECK_NO_THROW(tick(0.0));
    BOOST_CHECK_EQUAL(manager.getStats().agentUpdatesThisTick, 2u);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->nextUpdateTime, 100.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(BudgetTests)

BOOST_AUTO_TEST_CASE(AgentBudgetRotatesFairly)
{
    AIConfig config = testConfig();
    config.maxAgentUpdatesPerTick = 3;
    ManagerFixture f(config);
    f.manager.init();
    for (EntityID id = 1; id <= 7; ++id) {
        f.world.addAgent(id, Vector2D(static_cast<float>(id) * 40.0f, 0.0f));
    }

    f.tick(0.0);
    BOOST_CHECK_EQUAL(f.manager.getStats().agentUpdatesThisTick, 3u);
    f.tick(1.0);
    BOOST_CHECK_EQUAL(f.manager.getStats().agentUpdatesThisTick, 3u);
    f.tick(2.0);
    BOOST_CHECK_EQUAL(f.manager.getStats().agentUpdatesThisTick, 1u);

    // Every agent was evaluated exactly once across the three ticks
    for (EntityID id = 1; id <= 7; ++id) {
        const AgentRecord* agent = f.manager.getAgent(id);
        BOOST_REQUIRE(agent != nullptr);
        BOOST_CHECK_GE(agent->nextUpdateTime, 100.0);
        BOOST_CHECK_LE(agent->nextUpdateTime, 102.0);
    }
}

BOOST_AUTO_TEST_CASE(PathfindBudgetDrainsBacklogOverTicks)
{
    ManagerFixture f;
    f.manager.init();
    f.world.addCombatant(100, Vector2D(0.0f, 150.0f));
    EntityID id = 1;
    for (int x = -70; x <= 70; x += 10) {
        f.world.addAgent(id++, Vector2D(static_cast<float>(x), 0.0f));
    }
    BOOST_REQUIRE_EQUAL(id - 1, 15u);

    f.tick(0.0);
    BOOST_CHECK_EQUAL(f.manager.getStats().pendingRequests, 15u);

    f.tick(1.0);
    BOOST_CHECK_EQUAL(f.manager.getStats().requestsServedThisTick, 10u);
    BOOST_CHECK_EQUAL(f.manager.getStats().pendingRequests, 5u);

    f.tick(2.0);
    BOOST_CHECK_EQUAL(f.manager.getStats().requestsServedThisTick, 5u);
    BOOST_CHECK_EQUAL(f.manager.getStats().pendingRequests, 0u);
}

BOOST_AUTO_TEST_CASE(LargeHordeStaysWithinBudgets)
{
    HORDE_ENABLE_BENCHMARK_MODE();
    {
        ManagerFixture f;
        f.manager.init();
        f.world.addCombatant(100000, Vector2D(0.0f, 0.0f));
        EntityID id = 1;
        for (int y = 0; y < 20; ++y) {
            for (int x = 0; x < 25; ++x) {
                f.world.addAgent(id++, Vector2D(-600.0f + static_cast<float>(x) * 48.0f,
                                                -600.0f + static_cast<float>(y) * 48.0f));
            }
        }

        size_t evaluated = 0;
        for (int frame = 0; frame < 40; ++frame) {
            f.tick(static_cast<double>(frame) * 16.0);
            const AIManagerStats stats = f.manager.getStats();
            BOOST_REQUIRE_LE(stats.agentUpdatesThisTick, 50u);
            BOOST_REQUIRE_LE(stats.requestsServedThisTick, 10u);
            evaluated += stats.agentUpdatesThisTick;
        }
        BOOST_CHECK_EQUAL(f.manager.getAgentCount(), 500u);
        BOOST_CHECK_GE(evaluated, 500u);
    }
    HORDE_DISABLE_BENCHMARK_MODE();
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(BookkeepingTests, ManagerFixture)

BOOST_AUTO_TEST_CASE(VanishedAgentsAreDropped)
{
    manager.init();
    world.addAgent(1, Vector2D(0.0f, 0.0f));
    world.addAgent(2, Vector2D(50.0f, 0.0f));
    tick(0.0);
    BOOST_CHECK_EQUAL(manager.getAgentCount(), 2u);

    world.removeEntity(2);
    tick(100.0);
    BOOST_CHECK_EQUAL(manager.getAgentCount(), 1u);
    BOOST_CHECK(manager.getAgent(2) == nullptr);
    BOOST_CHECK(!manager.spatialIndex().contains(2));
}

BOOST_AUTO_TEST_CASE(NonAgentsInListAreIgnored)
{
    manager.init();
    world.addCombatant(100, Vector2D(0.0f, 0.0f));

    TickContext ctx;
    manager.update(ctx, world.getEntitiesWithComponents(toMask(ComponentType::Transform)));
    BOOST_CHECK_EQUAL(manager.getAgentCount(), 0u);
    BOOST_CHECK(manager.spatialIndex().contains(100));
}

BOOST_AUTO_TEST_CASE(DyingAgentLosesQueuedRequest)
{
    AIConfig config = testConfig();
    config.maxPathfindsPerTick = 1;
    ManagerFixture f(config);
    f.manager.init();
    f.world.addCombatant(100, Vector2D(0.0f, 150.0f));
    f.world.addAgent(1, Vector2D(-20.0f, 0.0f));
    f.world.addAgent(2, Vector2D(20.0f, 0.0f));

    f.tick(0.0);
    BOOST_CHECK_EQUAL(f.manager.getStats().pendingRequests, 2u);

    // Agent 1's request is served first; agent 2 dies before its turn
    f.world.setHealth(2, 0.0f, 50.0);
    f.tick(100.0);
    BOOST_CHECK_EQUAL(f.manager.getAgent(2)->state, AIState::DEAD);
    BOOST_CHECK(!f.manager.getAgent(2)->hasPath());
    BOOST_CHECK_EQUAL(f.manager.getStats().pendingRequests, 0u);
}

BOOST_AUTO_TEST_CASE(RemoveAgentCancelsRequest)
{
    manager.init();
    world.addCombatant(100, Vector2D(0.0f, 150.0f));
    world.addAgent(1, Vector2D(0.0f, 0.0f));
    tick(0.0);
    BOOST_CHECK_EQUAL(manager.getStats().pendingRequests, 1u);

    manager.removeAgent(1);
    BOOST_CHECK(manager.getAgent(1) == nullptr);
    BOOST_CHECK_EQUAL(manager.getStats().pendingRequests, 0u);
    BOOST_CHECK(!manager.spatialIndex().contains(1));
}

BOOST_AUTO_TEST_CASE(PrimaryTargetFieldIsPrebuilt)
{
    manager.init();
    world.addCombatant(100, Vector2D(300.0f, 300.0f));
    tick(0.0);
    BOOST_CHECK_EQUAL(manager.getStats().flowFieldCount, 1u);

    tick(10.0);
    BOOST_CHECK_EQUAL(manager.getStats().flowFieldCount, 1u);
}

BOOST_AUTO_TEST_CASE(ObstacleChangeClearsCaches)
{
    manager.init();
    world.addCombatant(100, Vector2D(0.0f, 150.0f));
    world.addAgent(1, Vector2D(0.0f, 0.0f));
    tick(0.0);
    tick(1.0);
    BOOST_CHECK_EQUAL(manager.getStats().pathCacheSize, 1u);

    BOOST_CHECK_GT(manager.setObstacle(Vector2D(-100.0f, 60.0f), Vector2D(100.0f, 80.0f)), 0u);
    BOOST_CHECK_EQUAL(manager.getStats().pathCacheSize, 0u);
    BOOST_CHECK_EQUAL(manager.getStats().flowFieldCount, 0u);

    // Same rectangle again changes nothing
    BOOST_CHECK_EQUAL(manager.setObstacle(Vector2D(-100.0f, 60.0f), Vector2D(100.0f, 80.0f)), 0u);
}

BOOST_AUTO_TEST_CASE(SwitchingAlgorithmDropsCachedPaths)
{
    manager.init();
    world.addCombatant(100, Vector2D(0.0f, 150.0f));
    world.addAgent(1, Vector2D(0.0f, 0.0f));
    tick(0.0);
    tick(1.0);
    BOOST_CHECK_EQUAL(manager.getStats().pathCacheSize, 1u);

    manager.setAlgorithm(PathfindingAlgorithm::AStar);
    BOOST_CHECK_EQUAL(manager.getAlgorithm(), PathfindingAlgorithm::AStar);
    BOOST_CHECK_EQUAL(manager.getStats().algorithm, PathfindingAlgorithm::AStar);
    BOOST_CHECK_EQUAL(manager.getStats().pathCacheSize, 0u);
}

BOOST_AUTO_TEST_CASE(NavMeshAlgorithmRoutesThroughLoadedMesh)
{
    std::vector<NavPolygon> mesh(3);
    for (int i = 0; i < 3; ++i) {
        const float x0 = 100.0f * static_cast<float>(i);
        mesh[i].vertices = {Vector2D(x0, 0.0f), Vector2D(x0 + 100.0f, 0.0f), Vector2D(x0 + 100.0f, 100.0f),
                            Vector2D(x0, 100.0f)};
    }
    mesh[0].neighbors = {1};
    mesh[1].neighbors = {0, 2};
    mesh[2].neighbors = {1};

    manager.loadNavMesh(std::move(mesh));
    manager.setAlgorithm(PathfindingAlgorithm::NavMesh);
    manager.init();
    world.addCombatant(100, Vector2D(240.0f, 50.0f));
    world.addAgent(1, Vector2D(60.0f, 50.0f));

    tick(0.0);
    BOOST_CHECK_EQUAL(manager.getAgent(1)->state, AIState::CHASE);
    tick(1.0);

    const AgentRecord* agent = manager.getAgent(1);
    BOOST_REQUIRE_EQUAL(agent->path.size(), 3u);
    BOOST_CHECK_CLOSE(agent->path[1].getX(), 150.0f, 0.001f);
    BOOST_CHECK_CLOSE(agent->path[1].getY(), 50.0f, 0.001f);
    BOOST_CHECK_EQUAL(agent->path[2], Vector2D(240.0f, 50.0f));
}

BOOST_AUTO_TEST_SUITE_END()
