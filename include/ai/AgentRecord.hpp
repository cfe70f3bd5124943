/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_RECORD_HPP
#define AGENT_RECORD_HPP

#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <vector>
#include "ai/AIPersonality.hpp"
#include "ai/AIState.hpp"
#include "entities/EntityID.hpp"
#include "utils/Vector2D.hpp"

namespace HordeMind {

struct AIConfig;
struct AIProfile;
class BehaviorNode;

/**
 * @brief Per-agent decision and navigation state owned by the AIManager.
 *
 * Created from the entity's AIProfile the first time the entity shows up in
 * the agent list and destroyed when it disappears.
 */
struct AgentRecord {
    static constexpr int STUCK_REPATH_CHECKS = 5;        // Repath once the stuck counter exceeds this
    static constexpr float PATH_END_TOLERANCE = 50.0f;   // Repath when the path ends farther than this from the goal

    EntityID id{INVALID_ENTITY_ID};

    // State machine
    AIState state{AIState::IDLE};
    AIState previousState{AIState::IDLE};
    double stateStartTime{0.0};
    boost::container::flat_map<AIState, double> stateCooldowns;   // Earliest time each state may be re-entered

    // Target and memory
    EntityID targetId{INVALID_ENTITY_ID};
    std::optional<Vector2D> targetPosition;   // Where the agent is currently heading
    boost::container::flat_map<EntityID, Vector2D> lastSeenPositions;

    // Threat memory, keyed by damage source
    boost::container::flat_map<EntityID, float> damageBySource;
    boost::container::flat_map<EntityID, float> threatLevels;     // Clamped to [0, 1]
    float totalDamageReceived{0.0f};

    // Path
    std::vector<Vector2D> path;
    size_t pathIndex{0};
    double lastPathfindTime{-std::numeric_limits<double>::infinity()};
    float pathfindCooldownMs{500.0f};

    // Stuck detection
    int stuckCounter{0};
    std::optional<Vector2D> lastSampledPosition;

    // Personality and ranges
    Personality personality;
    float sightRange{200.0f};
    float hearingRange{300.0f};
    float attackRange{50.0f};
    float avoidanceRadius{30.0f};
    float fleeDistance{400.0f};
    float preferredDistance{100.0f};
    float moveSpeed{1.0f};
    float bodyRadius{0.0f};

    // Combat bookkeeping
    float attackCooldownMs{1000.0f};
    double lastAttackTime{-std::numeric_limits<double>::infinity()};
    uint32_t attacksPerformed{0};

    // Routes
    std::vector<Vector2D> patrolRoute;
    size_t patrolIndex{0};
    std::optional<Vector2D> guardPost;

    // Scheduling
    float updateIntervalMs{100.0f};
    float updatePriority{1.0f};
    double nextUpdateTime{0.0};

    // Optional tree ticked after the state action; shared, never modified
    std::shared_ptr<const BehaviorNode> behaviorTree;

    /**
     * @brief Replaces the active path and restarts it from the first waypoint.
     */
    void setPath(std::vector<Vector2D> newPath);
    void clearPath();

    [[nodiscard]] bool hasPath() const { return pathIndex < path.size(); }
    const Vector2D* currentWaypoint() const;
    void advanceWaypoint() { ++pathIndex; }

    /**
     * @brief Whether a new path request should be queued now.
     *
     * Never inside the pathfinding cooldown or without a target position;
     * otherwise when stuck, without a path, or when the path no longer ends
     * near the target position.
     */
    bool needsPath(double nowMs) const;

    // Interval between evaluations after priority scaling
    double effectiveUpdateInterval() const;

    void rememberTarget(EntityID target, const Vector2D& position) { lastSeenPositions[target] = position; }
    std::optional<Vector2D> lastSeen(EntityID target) const;

    [[nodiscard]] bool isStateOnCooldown(AIState target, double nowMs) const;

    /**
     * @brief Adds damage from a source and raises its threat by damage / 100.
     *
     * Non-positive or non-finite damage is ignored.
     */
    void recordDamage(EntityID source, float damage);

    // Adds delta to the source's threat, clamped to [0, 1]
    void updateThreatLevel(EntityID source, float delta);
    float threatLevel(EntityID source) const;

    /**
     * @return Source with the highest positive threat (lowest id on ties), or
     *         INVALID_ENTITY_ID when nothing has threatened the agent
     */
    EntityID highestThreat() const;

    // Drops every memory entry about an entity
    void forget(EntityID entity);

    static AgentRecord fromProfile(EntityID id, const AIProfile& profile, const AIConfig& config);
};

} // namespace HordeMind

#endif // AGENT_RECORD_HPP
