/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_PROFILE_HPP
#define AI_PROFILE_HPP

#include <memory>
#include <optional>
#include <vector>
#include "ai/AIPersonality.hpp"
#include "utils/Vector2D.hpp"

namespace HordeMind {

class BehaviorNode;

/**
 * @brief AI capability data the world attaches to an entity.
 *
 * The orchestrator copies it into its own agent record the first time the
 * entity shows up in the agent list; later edits to the profile are not
 * picked up until the agent is removed and re-registered.
 */
struct AIProfile {
    PersonalityType personality = PersonalityType::AGGRESSIVE;

    // Detection
    float sightRange = 200.0f;              // Target counts as visible within this distance
    float hearingRange = 300.0f;            // Neighbours are counted within max(sight, hearing)
    float attackRange = 50.0f;
    float fleeDistance = 400.0f;            // How far a fleeing agent runs, and when it calms down
    float preferredDistance = 100.0f;       // Retreat step length

    // Movement
    float moveSpeed = 1.0f;                 // Multiplier on top of the personality speed multiplier
    std::optional<float> avoidanceRadius;   // Falls back to AIConfig::avoidanceRadius
    float bodyRadius = 0.0f;                // Radius stored in the spatial index

    // Combat
    float attackCooldownMs = 1000.0f;

    // Scheduling
    float updateIntervalMs = 100.0f;        // Base time between state machine evaluations
    float updatePriority = 1.0f;            // Higher priority shortens the interval

    // Routes
    std::vector<Vector2D> patrolRoute;
    std::optional<Vector2D> guardPost;

    // Optional behavior tree ticked every evaluation after the state action
    std::shared_ptr<const BehaviorNode> behaviorTree;
};

} // namespace HordeMind

#endif // AI_PROFILE_HPP
