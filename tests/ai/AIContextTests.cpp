/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AIContextTests
#include <boost/test/unit_test.hpp>

#include "ai/AIConfig.hpp"
#include "ai/AIContext.hpp"
#include "ai/AIPersonality.hpp"
#include "ai/AIProfile.hpp"
#include "ai/AgentRecord.hpp"
#include "collisions/SpatialGrid.hpp"
#include "../mocks/MockWorld.hpp"
#include <limits>
#include <set>
#include <stdexcept>

using namespace HordeMind;

struct ContextFixture {
    ContextFixture()
        : builder(grid, world, [this](EntityID id) { return classify(id); }) {}

    NeighborKind classify(EntityID id) const {
        if (deadIds.count(id) != 0) {
            return NeighborKind::DeadAgent;
        }
        return agentIds.count(id) != 0 ? NeighborKind::Agent : NeighborKind::Other;
    }

    AgentRecord addAgent(EntityID id, const Vector2D& position, float health = 100.0f) {
        world.addAgent(id, position, AIProfile{}, health);
        grid.insert(id, position);
        agentIds.insert(id);
        AgentRecord record;
        record.id = id;
        return record;
    }

    void addCombatant(EntityID id, const Vector2D& position) {
        world.addCombatant(id, position);
        grid.insert(id, position);
    }

    AIContext build(AgentRecord& agent, EntityID primary = INVALID_ENTITY_ID, double now = 0.0) {
        return builder.build(agent, *world.getEntity(agent.id), primary, now);
    }

    SpatialGrid grid;
    MockWorld world;
    std::set<EntityID> agentIds;
    std::set<EntityID> deadIds;
    AIContextBuilder builder;
};

BOOST_FIXTURE_TEST_SUITE(AIContextBuilderTests, ContextFixture)

BOOST_AUTO_TEST_CASE(SplitsNeighboursIntoAlliesAndEnemies)
{
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    addAgent(2, Vector2D(50.0f, 0.0f));
    addCombatant(10, Vector2D(100.0f, 0.0f));
    addCombatant(11, Vector2D(350.0f, 0.0f));

    const AIContext ctx = build(agent);
    BOOST_REQUIRE_EQUAL(ctx.nearbyAllies.size(), 1u);
    BOOST_CHECK_EQUAL(ctx.nearbyAllies[0], 2u);
    BOOST_REQUIRE_EQUAL(ctx.nearbyEnemies.size(), 1u);
    BOOST_CHECK_EQUAL(ctx.nearbyEnemies[0], 10u);
}

BOOST_AUTO_TEST_CASE(DeadAgentsAreNeitherAlliesNorEnemies)
{
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    addAgent(2, Vector2D(40.0f, 0.0f), 10.0f);
    addAgent(3, Vector2D(0.0f, 40.0f));
    deadIds.insert(2);

    const AIContext ctx = build(agent);
    BOOST_REQUIRE_EQUAL(ctx.nearbyAllies.size(), 1u);
    BOOST_CHECK_EQUAL(ctx.nearbyAllies[0], 3u);
    BOOST_CHECK(ctx.nearbyEnemies.empty());
    BOOST_CHECK(!ctx.woundedAllyInSight);
    BOOST_CHECK_EQUAL(agent.targetId, INVALID_ENTITY_ID);
}

BOOST_AUTO_TEST_CASE(PrefersPrimaryTargetThenNearest)
{
    addCombatant(10, Vector2D(150.0f, 0.0f));
    addCombatant(11, Vector2D(60.0f, 0.0f));

    AgentRecord hunter = addAgent(1, Vector2D(0.0f, 0.0f));
    build(hunter, 10);
    BOOST_CHECK_EQUAL(hunter.targetId, 10u);

    AgentRecord other = addAgent(2, Vector2D(0.0f, 0.0f));
    const AIContext ctx = build(other);
    BOOST_CHECK_EQUAL(other.targetId, 11u);
    BOOST_CHECK(ctx.targetVisible);
    BOOST_CHECK_CLOSE(ctx.distanceToTarget, 60.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(KeepsCurrentTargetWhileIndexed)
{
    addCombatant(10, Vector2D(150.0f, 0.0f));
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    build(agent);
    BOOST_CHECK_EQUAL(agent.targetId, 10u);

    addCombatant(11, Vector2D(20.0f, 0.0f));
    build(agent);
    BOOST_CHECK_EQUAL(agent.targetId, 10u);
}

BOOST_AUTO_TEST_CASE(ForgetsVanishedTarget)
{
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    agent.targetId = 99;
    agent.rememberTarget(99, Vector2D(10.0f, 10.0f));
    addCombatant(10, Vector2D(100.0f, 0.0f));

    build(agent);
    BOOST_CHECK_EQUAL(agent.targetId, 10u);
    BOOST_CHECK(!agent.lastSeen(99).has_value());
}

BOOST_AUTO_TEST_CASE(StrongThreatOverridesCurrentTarget)
{
    addCombatant(10, Vector2D(60.0f, 0.0f));
    addCombatant(11, Vector2D(0.0f, 150.0f));
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    build(agent);
    BOOST_CHECK_EQUAL(agent.targetId, 10u);

    // Below the switch level the current target is kept
    agent.recordDamage(11, 30.0f);
    build(agent);
    BOOST_CHECK_EQUAL(agent.targetId, 10u);

    agent.recordDamage(11, 30.0f);
    const AIContext ctx = build(agent);
    BOOST_CHECK_EQUAL(agent.targetId, 11u);
    BOOST_CHECK_EQUAL(ctx.targetId, 11u);
    BOOST_CHECK_CLOSE(ctx.distanceToTarget, 150.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(ThreatOutOfRangeIsIgnored)
{
    addCombatant(10, Vector2D(60.0f, 0.0f));
    addCombatant(11, Vector2D(0.0f, 900.0f));
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    agent.recordDamage(11, 90.0f);

    build(agent);
    BOOST_CHECK_EQUAL(agent.targetId, 10u);
}

BOOST_AUTO_TEST_CASE(VanishedThreatIsForgotten)
{
    addCombatant(11, Vector2D(0.0f, 100.0f));
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    agent.recordDamage(11, 80.0f);
    build(agent);
    BOOST_REQUIRE_EQUAL(agent.targetId, 11u);

    grid.remove(11);
    world.removeEntity(11);
    build(agent);
    BOOST_CHECK_EQUAL(agent.targetId, INVALID_ENTITY_ID);
    BOOST_CHECK_EQUAL(agent.threatLevel(11), 0.0f);
    BOOST_CHECK_EQUAL(agent.highestThreat(), INVALID_ENTITY_ID);
}

BOOST_AUTO_TEST_CASE(OnlyVisibleTargetsAreRemembered)
{
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    addCombatant(10, Vector2D(250.0f, 0.0f));

    AIContext ctx = build(agent);
    BOOST_CHECK_EQUAL(ctx.targetId, 10u);
    BOOST_CHECK(!ctx.targetVisible);
    BOOST_CHECK(!agent.lastSeen(10).has_value());

    world.setPosition(10, Vector2D(150.0f, 0.0f));
    grid.update(10, Vector2D(150.0f, 0.0f));
    ctx = build(agent);
    BOOST_CHECK(ctx.targetVisible);
    BOOST_REQUIRE(agent.lastSeen(10).has_value());
    BOOST_CHECK_EQUAL(*agent.lastSeen(10), Vector2D(150.0f, 0.0f));
}

BOOST_AUTO_TEST_CASE(StuckAfterManyStationarySamples)
{
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    AIContext ctx;
    for (int i = 0; i < 11; ++i) {
        ctx = build(agent);
    }
    BOOST_CHECK_EQUAL(agent.stuckCounter, 10);
    BOOST_CHECK(!ctx.isStuck);

    ctx = build(agent);
    BOOST_CHECK(ctx.isStuck);

    world.setPosition(1, Vector2D(5.0f, 0.0f));
    ctx = build(agent);
    BOOST_CHECK_EQUAL(agent.stuckCounter, 0);
    BOOST_CHECK(!ctx.isStuck);
}

BOOST_AUTO_TEST_CASE(RecentDamageMeansUnderAttack)
{
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    world.setHealth(1, 60.0f, 1000.0);

    AIContext ctx = build(agent, INVALID_ENTITY_ID, 2500.0);
    BOOST_CHECK(ctx.underAttack);
    BOOST_CHECK_CLOSE(ctx.healthFraction(), 0.6f, 0.001f);

    ctx = build(agent, INVALID_ENTITY_ID, 3500.0);
    BOOST_CHECK(!ctx.underAttack);
}

BOOST_AUTO_TEST_CASE(FindsMostWoundedAllyInSight)
{
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    addAgent(2, Vector2D(50.0f, 0.0f), 30.0f);
    addAgent(3, Vector2D(80.0f, 0.0f), 10.0f);
    addAgent(4, Vector2D(60.0f, 0.0f), 0.0f);
    addAgent(5, Vector2D(250.0f, 0.0f), 5.0f);

    const AIContext ctx = build(agent);
    BOOST_CHECK(ctx.woundedAllyInSight);
    BOOST_CHECK_EQUAL(ctx.mostWoundedAlly, 3u);
    BOOST_REQUIRE(ctx.mostWoundedAllyPosition.has_value());
    BOOST_CHECK_EQUAL(*ctx.mostWoundedAllyPosition, Vector2D(80.0f, 0.0f));
}

BOOST_AUTO_TEST_CASE(HealthyAlliesAreNotWounded)
{
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    addAgent(2, Vector2D(50.0f, 0.0f), 50.0f);
    BOOST_CHECK(!build(agent).woundedAllyInSight);
}

BOOST_AUTO_TEST_CASE(MeasuresDistanceToGuardPost)
{
    AgentRecord agent = addAgent(1, Vector2D(0.0f, 0.0f));
    agent.guardPost = Vector2D(30.0f, 40.0f);
    BOOST_CHECK_CLOSE(build(agent).distanceFromGuardPost, 50.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(RequiresNeighbourClassifier)
{
    BOOST_CHECK_THROW(AIContextBuilder(grid, world, nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(AgentRecordTests)

BOOST_AUTO_TEST_CASE(NoTargetNoPathRequest)
{
    AgentRecord agent;
    BOOST_CHECK(!agent.needsPath(10000.0));
    agent.targetPosition = Vector2D(100.0f, 0.0f);
    BOOST_CHECK(agent.needsPath(10000.0));
}

BOOST_AUTO_TEST_CASE(CooldownBlocksRequests)
{
    AgentRecord agent;
    agent.targetPosition = Vector2D(100.0f, 0.0f);
    agent.lastPathfindTime = 1000.0;
    BOOST_CHECK(!agent.needsPath(1200.0));
    BOOST_CHECK(agent.needsPath(1500.0));
}

BOOST_AUTO_TEST_CASE(StalePathIsReplaced)
{
    AgentRecord agent;
    agent.setPath({Vector2D(0.0f, 0.0f), Vector2D(100.0f, 0.0f)});
    agent.targetPosition = Vector2D(130.0f, 0.0f);
    BOOST_CHECK(!agent.needsPath(0.0));

    agent.targetPosition = Vector2D(200.0f, 0.0f);
    BOOST_CHECK(agent.needsPath(0.0));

    agent.targetPosition = Vector2D(100.0f, 0.0f);
    agent.stuckCounter = AgentRecord::STUCK_REPATH_CHECKS + 1;
    BOOST_CHECK(agent.needsPath(0.0));
}

BOOST_AUTO_TEST_CASE(PriorityShortensInterval)
{
    AgentRecord agent;
    agent.updateIntervalMs = 100.0f;
    agent.updatePriority = 2.0f;
    BOOST_CHECK_CLOSE(agent.effectiveUpdateInterval(), 50.0, 0.001);
    agent.updatePriority = 0.0f;
    BOOST_CHECK_CLOSE(agent.effectiveUpdateInterval(), 100.0, 0.001);
}

BOOST_AUTO_TEST_CASE(DamageBuildsClampedThreat)
{
    AgentRecord agent;
    agent.recordDamage(5, 40.0f);
    agent.recordDamage(5, 30.0f);
    agent.recordDamage(6, 50.0f);
    BOOST_CHECK_CLOSE(agent.threatLevel(5), 0.7f, 0.001f);
    BOOST_CHECK_CLOSE(agent.totalDamageReceived, 120.0f, 0.001f);
    BOOST_CHECK_EQUAL(agent.highestThreat(), 5u);

    agent.recordDamage(6, 500.0f);
    BOOST_CHECK_EQUAL(agent.threatLevel(6), 1.0f);
    BOOST_CHECK_EQUAL(agent.highestThreat(), 6u);

    agent.updateThreatLevel(6, -5.0f);
    BOOST_CHECK_EQUAL(agent.threatLevel(6), 0.0f);
    BOOST_CHECK_EQUAL(agent.highestThreat(), 5u);
}

BOOST_AUTO_TEST_CASE(BadDamageIsIgnored)
{
    AgentRecord agent;
    agent.recordDamage(5, 0.0f);
    agent.recordDamage(5, -10.0f);
    agent.recordDamage(5, std::numeric_limits<float>::quiet_NaN());
    agent.recordDamage(5, std::numeric_limits<float>::infinity());
    BOOST_CHECK_EQUAL(agent.totalDamageReceived, 0.0f);
    BOOST_CHECK_EQUAL(agent.highestThreat(), INVALID_ENTITY_ID);
}

BOOST_AUTO_TEST_CASE(ThreatTiesGoToLowestId)
{
    AgentRecord agent;
    agent.recordDamage(9, 20.0f);
    agent.recordDamage(4, 20.0f);
    BOOST_CHECK_EQUAL(agent.highestThreat(), 4u);

    agent.forget(4);
    BOOST_CHECK_EQUAL(agent.highestThreat(), 9u);
    BOOST_CHECK_EQUAL(agent.damageBySource.count(4), 0u);
}

BOOST_AUTO_TEST_CASE(StateCooldownExpires)
{
    AgentRecord agent;
    BOOST_CHECK(!agent.isStateOnCooldown(AIState::RETREAT, 0.0));
    agent.stateCooldowns[AIState::RETREAT] = 3000.0;
    BOOST_CHECK(agent.isStateOnCooldown(AIState::RETREAT, 2999.0));
    BOOST_CHECK(!agent.isStateOnCooldown(AIState::RETREAT, 3000.0));
    BOOST_CHECK(!agent.isStateOnCooldown(AIState::FLEE, 0.0));
}

BOOST_AUTO_TEST_CASE(ProfileFillsRecord)
{
    AIConfig config;
    config.avoidanceRadius = 45.0f;
    config.pathfindCooldownMs = 250.0f;

    AIProfile profile;
    profile.personality = PersonalityType::GUARDIAN;
    profile.guardPost = Vector2D(10.0f, 20.0f);
    profile.bodyRadius = -3.0f;

    AgentRecord record = AgentRecord::fromProfile(7, profile, config);
    BOOST_CHECK_EQUAL(record.id, 7u);
    BOOST_CHECK_EQUAL(record.personality.type, PersonalityType::GUARDIAN);
    BOOST_CHECK_EQUAL(record.avoidanceRadius, 45.0f);
    BOOST_CHECK_EQUAL(record.pathfindCooldownMs, 250.0f);
    BOOST_CHECK_EQUAL(record.bodyRadius, 0.0f);
    BOOST_CHECK(record.guardPost.has_value());

    profile.avoidanceRadius = 12.0f;
    BOOST_CHECK_EQUAL(AgentRecord::fromProfile(7, profile, config).avoidanceRadius, 12.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PersonalityAndConfigTests)

BOOST_AUTO_TEST_CASE(PresetsCarryRoles)
{
    BOOST_CHECK_EQUAL(Personality::fromType(PersonalityType::BERSERKER).fleeHealthThreshold, 0.0f);
    BOOST_CHECK(Personality::fromType(PersonalityType::SWARM).swarm);
    BOOST_CHECK(Personality::fromType(PersonalityType::SUPPORT).role == PersonalityRole::SUPPORT);
    BOOST_CHECK(Personality::fromType(PersonalityType::GUARDIAN).role == PersonalityRole::GUARDIAN);
    BOOST_CHECK(Personality::fromType(PersonalityType::AGGRESSIVE).role == PersonalityRole::NONE);
    BOOST_CHECK_GT(Personality::fromType(PersonalityType::COWARD).fear, 0.5f);
}

BOOST_AUTO_TEST_CASE(ValidateRejectsBadCellSizes)
{
    AIConfig config;
    BOOST_CHECK_NO_THROW(config.validate());

    config.spatialCellSize = 0.0f;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config = AIConfig{};
    config.maxPathfindsPerTick = 0;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(SanitizedRepairsLimits)
{
    AIConfig config;
    config.pathCacheCapacity = 0;
    config.cacheMaintenanceIntervalMs = -1.0f;
    config.worldMin = Vector2D(100.0f, 100.0f);
    config.worldMax = Vector2D(0.0f, 0.0f);

    const AIConfig fixed = config.sanitized();
    BOOST_CHECK_EQUAL(fixed.pathCacheCapacity, AIConfig{}.pathCacheCapacity);
    BOOST_CHECK_EQUAL(fixed.cacheMaintenanceIntervalMs, AIConfig{}.cacheMaintenanceIntervalMs);
    BOOST_CHECK_EQUAL(fixed.worldMax, AIConfig{}.worldMax);
}

BOOST_AUTO_TEST_SUITE_END()
