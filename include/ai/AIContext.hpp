/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_CONTEXT_HPP
#define AI_CONTEXT_HPP

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <vector>
#include "entities/EntityID.hpp"
#include "utils/Vector2D.hpp"

namespace HordeMind {

class IWorldAccess;
class SpatialGrid;
struct AgentRecord;
struct EntityRef;

// How a neighbour found in the spatial index relates to the agent population
enum class NeighborKind : uint8_t {
    Agent,      // Live tracked agent: ally, avoided and flocked with
    DeadAgent,  // Tracked agent in DEAD: ignored entirely
    Other       // Anything else in the index: potential enemy
};

using NeighborClassifier = std::function<NeighborKind(EntityID)>;

/**
 * @brief Per-evaluation snapshot of what one agent perceives.
 */
struct AIContext {
    double now{0.0};
    Vector2D position;

    float health{100.0f};
    float maxHealth{100.0f};

    std::vector<EntityID> nearbyAllies;     // Other live agents within max(sight, hearing)
    std::vector<EntityID> nearbyEnemies;    // Non-agent combatants within max(sight, hearing)

    EntityID targetId{INVALID_ENTITY_ID};
    std::optional<Vector2D> targetPosition;
    float distanceToTarget{std::numeric_limits<float>::infinity()};
    bool targetVisible{false};

    double timeSinceLastDamage{std::numeric_limits<double>::infinity()};
    bool underAttack{false};
    double timeInState{0.0};
    bool hasPath{false};
    bool isStuck{false};

    float distanceFromGuardPost{std::numeric_limits<float>::infinity()};
    bool woundedAllyInSight{false};
    EntityID mostWoundedAlly{INVALID_ENTITY_ID};
    std::optional<Vector2D> mostWoundedAllyPosition;

    [[nodiscard]] float healthFraction() const {
        return maxHealth > 0.0f ? health / maxHealth : 0.0f;
    }
};

/**
 * @brief Builds AIContext snapshots from the spatial index and the world.
 *
 * Building also updates the agent's perception bookkeeping: target
 * acquisition, last-seen memory and the stuck counter.
 */
class AIContextBuilder {
public:
    static constexpr double UNDER_ATTACK_WINDOW_MS = 2000.0;
    static constexpr int STUCK_CHECKS = 10;             // Stuck once the counter exceeds this
    static constexpr float STUCK_DISTANCE = 1.0f;
    static constexpr float WOUNDED_FRACTION = 0.5f;

    static constexpr float THREAT_SWITCH_LEVEL = 0.5f;  // Threat that pulls an agent off its current target

    /**
     * @param classify Tells allies (live agents) apart from enemies
     * @throws std::invalid_argument if classify is empty
     */
    AIContextBuilder(const SpatialGrid& grid, IWorldAccess& world, NeighborClassifier classify);

    AIContext build(AgentRecord& agent, const EntityRef& entity, EntityID primaryTarget, double nowMs) const;

private:
    const SpatialGrid& m_grid;
    IWorldAccess& m_world;
    NeighborClassifier m_classify;

    void acquireTarget(AgentRecord& agent, const AIContext& ctx, EntityID primaryTarget) const;
    void findWoundedAllies(const AgentRecord& agent, AIContext& ctx) const;
};

} // namespace HordeMind

#endif // AI_CONTEXT_HPP
