/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOVEMENT_EXECUTOR_HPP
#define MOVEMENT_EXECUTOR_HPP

#include "ai/AIContext.hpp"
#include "entities/EntityID.hpp"
#include "utils/Vector2D.hpp"

namespace HordeMind {

class IWorldAccess;
class SpatialGrid;
struct AgentRecord;
struct EntityRef;

struct MovementSettings {
    float arrivalRadius = 10.0f;        // Waypoint counts as reached inside this distance
    bool groupBehaviorEnabled = true;   // Flocking for swarm personalities
};

/**
 * @brief Turns an agent's path into a velocity on its movement component.
 *
 * Path following, local avoidance against other live agents and optional
 * swarm flocking. Positions are never written; the world integrates velocity.
 * Dead agents neither move nor count as neighbours.
 */
class MovementExecutor {
public:
    MovementExecutor(const SpatialGrid& grid, IWorldAccess& world, NeighborClassifier classify,
                     const MovementSettings& settings = MovementSettings{});

    /**
     * @brief Advances the path and writes the new velocity.
     *
     * Entities without transform or movement are left untouched. A DEAD
     * agent gets zero velocity.
     * @return The velocity written, zero when skipped
     */
    Vector2D execute(AgentRecord& agent, const EntityRef& entity) const;

    void setGroupBehaviorEnabled(bool enabled) { m_settings.groupBehaviorEnabled = enabled; }
    const MovementSettings& getSettings() const { return m_settings; }

private:
    const SpatialGrid& m_grid;
    IWorldAccess& m_world;
    NeighborClassifier m_classify;
    MovementSettings m_settings;

    Vector2D desiredVelocity(AgentRecord& agent, const Vector2D& position, float speed) const;
    Vector2D avoidance(const AgentRecord& agent, const Vector2D& position) const;
    Vector2D flocking(const AgentRecord& agent, const Vector2D& position) const;
};

} // namespace HordeMind

#endif // MOVEMENT_EXECUTOR_HPP
