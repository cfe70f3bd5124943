/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/BehaviorStateMachine.hpp"
#include "ai/AgentRecord.hpp"
#include "core/Logger.hpp"
#include <string>

namespace HordeMind {

namespace {

using Condition = bool (*)(const AIContext&, const AgentRecord&);

struct TransitionRule {
    AIState from;
    AIState to;
    int priority;
    Condition condition;
    float cooldownMs{0.0f};   // Blocks re-entering `to` for this long once taken
};

bool isSupport(const AgentRecord& a) { return a.personality.role == PersonalityRole::SUPPORT; }
bool isGuardian(const AgentRecord& a) {
    return a.personality.role == PersonalityRole::GUARDIAN && a.guardPost.has_value();
}
bool lowHealth(const AIContext& c, const AgentRecord& a) {
    return c.healthFraction() < a.personality.fleeHealthThreshold;
}

// Table order breaks priority ties
constexpr TransitionRule TRANSITIONS[] = {
    {AIState::IDLE, AIState::PATROL, 1,
     [](const AIContext& c, const AgentRecord& a) { return !a.patrolRoute.empty() && c.nearbyEnemies.empty(); }},
    {AIState::IDLE, AIState::INVESTIGATE, 2,
     [](const AIContext& c, const AgentRecord& a) {
         return a.personality.curiosity > 0.5f && !c.nearbyEnemies.empty() && !c.targetVisible;
     }},
    {AIState::IDLE, AIState::CHASE, 3,
     [](const AIContext& c, const AgentRecord& a) { return c.targetVisible && c.distanceToTarget > a.attackRange; }},
    {AIState::IDLE, AIState::ATTACK, 3,
     [](const AIContext& c, const AgentRecord& a) { return c.targetVisible && c.distanceToTarget <= a.attackRange; }},
    {AIState::IDLE, AIState::SUPPORT, 2,
     [](const AIContext& c, const AgentRecord& a) { return isSupport(a) && c.woundedAllyInSight; }},
    {AIState::IDLE, AIState::GUARD, 2,
     [](const AIContext& c, const AgentRecord& a) { return isGuardian(a) && !c.targetVisible; }},

    {AIState::PATROL, AIState::CHASE, 3,
     [](const AIContext& c, const AgentRecord& a) { return c.targetVisible && a.personality.aggression > 0.3f; }},
    {AIState::PATROL, AIState::INVESTIGATE, 2,
     [](const AIContext& c, const AgentRecord&) { return !c.nearbyEnemies.empty() && !c.targetVisible; }},

    {AIState::CHASE, AIState::ATTACK, 4,
     [](const AIContext& c, const AgentRecord& a) { return c.distanceToTarget <= a.attackRange; }},
    {AIState::CHASE, AIState::FLEE, 5,
     [](const AIContext& c, const AgentRecord& a) { return lowHealth(c, a) && a.personality.fear > 0.5f; }},
    {AIState::CHASE, AIState::INVESTIGATE, 2,
     [](const AIContext& c, const AgentRecord& a) {
         return !c.targetVisible && a.lastSeen(a.targetId).has_value() && c.timeInState > 3000.0;
     },
     2000.0f},
    {AIState::CHASE, AIState::GUARD, 4,
     [](const AIContext& c, const AgentRecord& a) {
         return isGuardian(a) && c.distanceFromGuardPost > a.sightRange;
     }},

    {AIState::ATTACK, AIState::CHASE, 3,
     [](const AIContext& c, const AgentRecord& a) { return c.distanceToTarget > a.attackRange; }},
    {AIState::ATTACK, AIState::FLEE, 5,
     [](const AIContext& c, const AgentRecord& a) { return c.healthFraction() < 0.2f && a.personality.fear > 0.3f; }},
    {AIState::ATTACK, AIState::RETREAT, 4,
     [](const AIContext& c, const AgentRecord& a) {
         return c.nearbyEnemies.size() > 3 && a.personality.type == PersonalityType::TACTICAL;
     },
     3000.0f},

    {AIState::FLEE, AIState::IDLE, 2,
     [](const AIContext& c, const AgentRecord& a) { return c.distanceToTarget > a.fleeDistance; }},
    {AIState::FLEE, AIState::SUPPORT, 3,
     [](const AIContext& c, const AgentRecord& a) { return isSupport(a) && c.nearbyAllies.size() > 2; }},

    {AIState::INVESTIGATE, AIState::CHASE, 3,
     [](const AIContext& c, const AgentRecord&) { return c.targetVisible; }},
    {AIState::INVESTIGATE, AIState::IDLE, 1,
     [](const AIContext& c, const AgentRecord&) { return c.timeInState > 5000.0; }},

    {AIState::RETREAT, AIState::CHASE, 2,
     [](const AIContext& c, const AgentRecord&) { return c.nearbyEnemies.size() <= 1 && c.targetVisible; }},
    {AIState::RETREAT, AIState::IDLE, 1,
     [](const AIContext& c, const AgentRecord&) { return c.nearbyEnemies.empty(); }},

    {AIState::SUPPORT, AIState::FLEE, 5,
     [](const AIContext& c, const AgentRecord& a) { return lowHealth(c, a); }},
    {AIState::SUPPORT, AIState::IDLE, 1,
     [](const AIContext& c, const AgentRecord&) { return !c.woundedAllyInSight && c.timeInState > 2000.0; }},

    {AIState::GUARD, AIState::CHASE, 3,
     [](const AIContext& c, const AgentRecord&) { return c.targetVisible; }},
};

// Unit vector from the threat toward the agent; +X when they coincide
Vector2D awayFrom(const Vector2D& position, const Vector2D& threat) {
    Vector2D away = (position - threat).normalized();
    return away.isZero() ? Vector2D(1.0f, 0.0f) : away;
}

std::optional<Vector2D> threatPosition(const AgentRecord& agent, const AIContext& ctx) {
    if (ctx.targetPosition) {
        return ctx.targetPosition;
    }
    return agent.lastSeen(agent.targetId);
}

void stop(AgentRecord& agent) {
    agent.clearPath();
    agent.targetPosition.reset();
}

} // namespace

AIState BehaviorStateMachine::evaluate(const AIContext& ctx, const AgentRecord& agent) const {
    if (agent.state == AIState::DEAD || ctx.health <= 0.0f) {
        return AIState::DEAD;
    }

    AIState best = agent.state;
    int bestPriority = 0;
    for (const TransitionRule& rule : TRANSITIONS) {
        if (rule.from != agent.state || rule.priority <= bestPriority ||
            agent.isStateOnCooldown(rule.to, ctx.now)) {
            continue;
        }
        if (rule.condition(ctx, agent)) {
            best = rule.to;
            bestPriority = rule.priority;
        }
    }
    return best;
}

bool BehaviorStateMachine::transition(AgentRecord& agent, AIState newState, double nowMs) const {
    if (newState == agent.state) {
        return false;
    }
    if (newState != AIState::DEAD && agent.isStateOnCooldown(newState, nowMs)) {
        AI_DEBUG("Entity " + std::to_string(agent.id) + " " + aiStateToString(newState) + " still on cooldown");
        return false;
    }
    for (const TransitionRule& rule : TRANSITIONS) {
        if (rule.from == agent.state && rule.to == newState && rule.cooldownMs > 0.0f) {
            agent.stateCooldowns[newState] = nowMs + rule.cooldownMs;
            break;
        }
    }
    AI_DEBUG("Entity " + std::to_string(agent.id) + " " + aiStateToString(agent.state) + " -> " +
             aiStateToString(newState));
    agent.previousState = agent.state;
    agent.state = newState;
    agent.stateStartTime = nowMs;
    if (newState == AIState::DEAD) {
        stop(agent);
    }
    return true;
}

void BehaviorStateMachine::applyStateAction(AgentRecord& agent, const AIContext& ctx) const {
    switch (agent.state) {
        case AIState::IDLE:
            // Target adoption happens while the context is built
            stop(agent);
            break;

        case AIState::PATROL: {
            if (agent.patrolRoute.empty()) {
                stop(agent);
                break;
            }
            agent.patrolIndex %= agent.patrolRoute.size();
            if (Vector2D::distance(ctx.position, agent.patrolRoute[agent.patrolIndex]) < PATROL_ARRIVAL_RADIUS) {
                agent.patrolIndex = (agent.patrolIndex + 1) % agent.patrolRoute.size();
            }
            agent.targetPosition = agent.patrolRoute[agent.patrolIndex];
            break;
        }

        case AIState::CHASE:
            if (ctx.targetVisible && ctx.targetPosition) {
                agent.targetPosition = ctx.targetPosition;
            } else if (auto seen = agent.lastSeen(agent.targetId)) {
                agent.targetPosition = seen;
            } else {
                agent.targetPosition = ctx.targetPosition;
            }
            break;

        case AIState::ATTACK:
            stop(agent);
            if (ctx.now - agent.lastAttackTime >= agent.attackCooldownMs) {
                agent.lastAttackTime = ctx.now;
                ++agent.attacksPerformed;
            }
            break;

        case AIState::FLEE:
            if (auto threat = threatPosition(agent, ctx)) {
                agent.targetPosition = ctx.position + awayFrom(ctx.position, *threat) * agent.fleeDistance;
            } else {
                stop(agent);
            }
            break;

        case AIState::INVESTIGATE:
            agent.targetPosition = agent.lastSeen(agent.targetId);
            if (!agent.targetPosition) {
                agent.clearPath();
            }
            break;

        case AIState::RETREAT:
            if (auto threat = threatPosition(agent, ctx)) {
                agent.targetPosition = ctx.position + awayFrom(ctx.position, *threat) * agent.preferredDistance;
            } else {
                stop(agent);
            }
            break;

        case AIState::SUPPORT:
            if (ctx.mostWoundedAllyPosition) {
                agent.targetPosition = ctx.mostWoundedAllyPosition;
            } else {
                stop(agent);
            }
            break;

        case AIState::GUARD:
            if (agent.guardPost && ctx.distanceFromGuardPost > agent.sightRange * 0.5f) {
                agent.targetPosition = agent.guardPost;
            } else {
                stop(agent);
            }
            break;

        case AIState::DEAD:
        case AIState::COUNT:
            stop(agent);
            break;
    }
}

} // namespace HordeMind
