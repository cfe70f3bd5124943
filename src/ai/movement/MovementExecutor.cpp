/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/movement/MovementExecutor.hpp"
#include "ai/AgentRecord.hpp"
#include "ai/internal/Crowd.hpp"
#include "collisions/SpatialGrid.hpp"
#include "core/Logger.hpp"
#include "world/WorldAccess.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace HordeMind {

MovementExecutor::MovementExecutor(const SpatialGrid& grid, IWorldAccess& world, NeighborClassifier classify,
                                   const MovementSettings& settings)
    : m_grid(grid), m_world(world), m_classify(std::move(classify)), m_settings(settings) {
    if (!m_classify) {
        throw std::invalid_argument("MovementExecutor requires a neighbour classifier");
    }
    if (!(m_settings.arrivalRadius > 0.0f)) {
        m_settings.arrivalRadius = MovementSettings{}.arrivalRadius;
    }
}

Vector2D MovementExecutor::execute(AgentRecord& agent, const EntityRef& entity) const {
    auto* transform = entity.get<TransformData>();
    auto* movement = entity.get<MovementData>();
    if (!transform || !movement) {
        return Vector2D();
    }
    if (agent.state == AIState::DEAD) {
        movement->velocity = Vector2D();
        return Vector2D();
    }

    const Vector2D position = transform->position;
    const float maxSpeed = movement->maxSpeed * agent.personality.speedMultiplier * agent.moveSpeed;

    Vector2D velocity = desiredVelocity(agent, position, maxSpeed);
    if (!velocity.isZero()) {
        velocity = AIInternal::BlendAvoidance(velocity, avoidance(agent, position));
    }

    if (m_settings.groupBehaviorEnabled && agent.personality.swarm) {
        velocity = AIInternal::ApplyFlocking(velocity, flocking(agent, position), maxSpeed);
    }

    movement->velocity = velocity;
    return velocity;
}

Vector2D MovementExecutor::desiredVelocity(AgentRecord& agent, const Vector2D& position, float speed) const {
    while (const Vector2D* waypoint = agent.currentWaypoint()) {
        if (Vector2D::distance(position, *waypoint) >= m_settings.arrivalRadius) {
            return (*waypoint - position).normalized() * speed;
        }
        agent.advanceWaypoint();
    }
    if (!agent.path.empty()) {
        NAVIGATION_DEBUG("Entity " + std::to_string(agent.id) + " reached end of path");
        agent.clearPath();
    }
    return Vector2D();
}

Vector2D MovementExecutor::avoidance(const AgentRecord& agent, const Vector2D& position) const {
    std::vector<Vector2D> neighbors;
    for (EntityID other : m_grid.query(position, agent.avoidanceRadius)) {
        if (other == agent.id || m_classify(other) != NeighborKind::Agent) {
            continue;
        }
        if (auto pos = m_grid.getPosition(other)) {
            neighbors.push_back(*pos);
        }
    }
    return AIInternal::ComputeAvoidance(position, neighbors, agent.avoidanceRadius);
}

Vector2D MovementExecutor::flocking(const AgentRecord& agent, const Vector2D& position) const {
    std::vector<AIInternal::CrowdNeighbor> allies;
    for (EntityID other : m_grid.query(position, AIInternal::CrowdParams::FLOCK_RADIUS)) {
        if (other == agent.id || m_classify(other) != NeighborKind::Agent) {
            continue;
        }
        auto ref = m_world.getEntity(other);
        const auto* transform = ref ? ref->get<TransformData>() : nullptr;
        if (!transform) {
            continue;
        }
        AIInternal::CrowdNeighbor neighbor;
        neighbor.position = transform->position;
        if (const auto* movement = ref->get<MovementData>()) {
            neighbor.velocity = movement->velocity;
        }
        allies.push_back(neighbor);
    }
    return AIInternal::ComputeFlockingForce(position, allies);
}

} // namespace HordeMind
