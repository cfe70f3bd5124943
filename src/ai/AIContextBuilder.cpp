/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/AIContext.hpp"
#include "ai/AgentRecord.hpp"
#include "collisions/SpatialGrid.hpp"
#include "core/Logger.hpp"
#include "world/WorldAccess.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace HordeMind {

AIContextBuilder::AIContextBuilder(const SpatialGrid& grid, IWorldAccess& world, NeighborClassifier classify)
    : m_grid(grid), m_world(world), m_classify(std::move(classify)) {
    if (!m_classify) {
        throw std::invalid_argument("AIContextBuilder requires a neighbour classifier");
    }
}

AIContext AIContextBuilder::build(AgentRecord& agent, const EntityRef& entity, EntityID primaryTarget,
                                  double nowMs) const {
    AIContext ctx;
    ctx.now = nowMs;
    if (const auto* transform = entity.get<TransformData>()) {
        ctx.position = transform->position;
    }

    if (const auto* health = entity.get<HealthData>()) {
        ctx.health = health->current;
        ctx.maxHealth = health->max;
        ctx.timeSinceLastDamage = nowMs - health->lastDamageTime;
        ctx.underAttack = ctx.timeSinceLastDamage < UNDER_ATTACK_WINDOW_MS;
    }

    const float perception = std::max(agent.sightRange, agent.hearingRange);
    for (EntityID other : m_grid.query(ctx.position, perception)) {
        if (other == agent.id) {
            continue;
        }
        switch (m_classify(other)) {
            case NeighborKind::Agent:
                ctx.nearbyAllies.push_back(other);
                break;
            case NeighborKind::Other:
                ctx.nearbyEnemies.push_back(other);
                break;
            case NeighborKind::DeadAgent:
                break;
        }
    }

    acquireTarget(agent, ctx, primaryTarget);
    if (agent.targetId != INVALID_ENTITY_ID) {
        ctx.targetId = agent.targetId;
        ctx.targetPosition = m_grid.getPosition(agent.targetId);
        if (ctx.targetPosition) {
            ctx.distanceToTarget = Vector2D::distance(ctx.position, *ctx.targetPosition);
            ctx.targetVisible = ctx.distanceToTarget <= agent.sightRange;
            if (ctx.targetVisible) {
                agent.rememberTarget(agent.targetId, *ctx.targetPosition);
            }
        }
    }

    ctx.timeInState = nowMs - agent.stateStartTime;
    ctx.hasPath = agent.hasPath();

    if (agent.lastSampledPosition &&
        Vector2D::distance(ctx.position, *agent.lastSampledPosition) < STUCK_DISTANCE) {
        ++agent.stuckCounter;
    } else {
        agent.stuckCounter = 0;
    }
    agent.lastSampledPosition = ctx.position;
    ctx.isStuck = agent.stuckCounter > STUCK_CHECKS;

    if (agent.guardPost) {
        ctx.distanceFromGuardPost = Vector2D::distance(ctx.position, *agent.guardPost);
    }

    findWoundedAllies(agent, ctx);
    return ctx;
}

void AIContextBuilder::acquireTarget(AgentRecord& agent, const AIContext& ctx, EntityID primaryTarget) const {
    if (agent.targetId != INVALID_ENTITY_ID && !m_grid.contains(agent.targetId)) {
        // Target vanished; forget it
        agent.forget(agent.targetId);
        agent.targetId = INVALID_ENTITY_ID;
    }

    auto isNearbyEnemy = [&ctx](EntityID id) {
        return std::find(ctx.nearbyEnemies.begin(), ctx.nearbyEnemies.end(), id) != ctx.nearbyEnemies.end();
    };

    // Whoever hurt the agent enough takes over, current target or not
    const EntityID threat = agent.highestThreat();
    if (threat != INVALID_ENTITY_ID && threat != agent.targetId &&
        agent.threatLevel(threat) >= THREAT_SWITCH_LEVEL && isNearbyEnemy(threat)) {
        AI_DEBUG("Entity " + std::to_string(agent.id) + " turns on threat " + std::to_string(threat));
        agent.targetId = threat;
        return;
    }

    if (agent.targetId != INVALID_ENTITY_ID || ctx.nearbyEnemies.empty()) {
        return;
    }

    if (primaryTarget != INVALID_ENTITY_ID && isNearbyEnemy(primaryTarget)) {
        agent.targetId = primaryTarget;
        return;
    }

    float bestDistSq = std::numeric_limits<float>::infinity();
    for (EntityID enemy : ctx.nearbyEnemies) {
        const auto pos = m_grid.getPosition(enemy);
        if (!pos) {
            continue;
        }
        const float distSq = Vector2D::distanceSquared(ctx.position, *pos);
        if (distSq < bestDistSq || (distSq == bestDistSq && enemy < agent.targetId)) {
            bestDistSq = distSq;
            agent.targetId = enemy;
        }
    }
}

void AIContextBuilder::findWoundedAllies(const AgentRecord& agent, AIContext& ctx) const {
    float lowestFraction = WOUNDED_FRACTION;
    for (EntityID ally : ctx.nearbyAllies) {
        const auto pos = m_grid.getPosition(ally);
        if (!pos || Vector2D::distance(ctx.position, *pos) > agent.sightRange) {
            continue;
        }
        const auto ref = m_world.getEntity(ally);
        const auto* health = ref ? ref->get<HealthData>() : nullptr;
        if (!health || !(health->max > 0.0f) || health->current <= 0.0f) {
            continue;
        }
        const float fraction = health->current / health->max;
        if (fraction < lowestFraction) {
            lowestFraction = fraction;
            ctx.woundedAllyInSight = true;
            ctx.mostWoundedAlly = ally;
            ctx.mostWoundedAllyPosition = *pos;
        }
    }
}

} // namespace HordeMind
