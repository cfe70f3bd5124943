/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/AgentRecord.hpp"
#include "ai/AIConfig.hpp"
#include "ai/AIProfile.hpp"
#include <algorithm>
#include <cmath>

namespace HordeMind {

void AgentRecord::setPath(std::vector<Vector2D> newPath) {
    path = std::move(newPath);
    pathIndex = 0;
}

void AgentRecord::clearPath() {
    path.clear();
    pathIndex = 0;
}

const Vector2D* AgentRecord::currentWaypoint() const {
    return hasPath() ? &path[pathIndex] : nullptr;
}

bool AgentRecord::needsPath(double nowMs) const {
    if (!targetPosition || nowMs - lastPathfindTime < pathfindCooldownMs) {
        return false;
    }
    if (stuckCounter > STUCK_REPATH_CHECKS || !hasPath()) {
        return true;
    }
    return Vector2D::distance(path.back(), *targetPosition) > PATH_END_TOLERANCE;
}

double AgentRecord::effectiveUpdateInterval() const {
    const float priority = (std::isfinite(updatePriority) && updatePriority > 0.0f) ? updatePriority : 1.0f;
    return static_cast<double>(std::max(0.0f, updateIntervalMs)) / static_cast<double>(priority);
}

std::optional<Vector2D> AgentRecord::lastSeen(EntityID target) const {
    auto it = lastSeenPositions.find(target);
    if (it == lastSeenPositions.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool AgentRecord::isStateOnCooldown(AIState target, double nowMs) const {
    auto it = stateCooldowns.find(target);
    return it != stateCooldowns.end() && nowMs < it->second;
}

void AgentRecord::recordDamage(EntityID source, float damage) {
    if (!(damage > 0.0f) || !std::isfinite(damage)) {
        return;
    }
    damageBySource[source] += damage;
    totalDamageReceived += damage;
    updateThreatLevel(source, damage / 100.0f);
}

void AgentRecord::updateThreatLevel(EntityID source, float delta) {
    if (!std::isfinite(delta)) {
        return;
    }
    float& level = threatLevels[source];
    level = std::clamp(level + delta, 0.0f, 1.0f);
}

float AgentRecord::threatLevel(EntityID source) const {
    auto it = threatLevels.find(source);
    return it != threatLevels.end() ? it->second : 0.0f;
}

EntityID AgentRecord::highestThreat() const {
    EntityID best = INVALID_ENTITY_ID;
    float bestLevel = 0.0f;
    for (const auto& [source, level] : threatLevels) {
        if (level > bestLevel) {
            bestLevel = level;
            best = source;
        }
    }
    return best;
}

void AgentRecord::forget(EntityID entity) {
    lastSeenPositions.erase(entity);
    damageBySource.erase(entity);
    threatLevels.erase(entity);
}

AgentRecord AgentRecord::fromProfile(EntityID id, const AIProfile& profile, const AIConfig& config) {
    AgentRecord record;
    record.id = id;
    record.personality = Personality::fromType(profile.personality);
    record.sightRange = profile.sightRange;
    record.hearingRange = profile.hearingRange;
    record.attackRange = profile.attackRange;
    record.avoidanceRadius = profile.avoidanceRadius.value_or(config.avoidanceRadius);
    record.fleeDistance = profile.fleeDistance;
    record.preferredDistance = profile.preferredDistance;
    record.moveSpeed = profile.moveSpeed;
    record.bodyRadius = std::max(0.0f, profile.bodyRadius);
    record.attackCooldownMs = profile.attackCooldownMs;
    record.patrolRoute = profile.patrolRoute;
    record.guardPost = profile.guardPost;
    record.updateIntervalMs = profile.updateIntervalMs;
    record.updatePriority = profile.updatePriority;
    record.pathfindCooldownMs = config.pathfindCooldownMs;
    record.behaviorTree = profile.behaviorTree;
    return record;
}

} // namespace HordeMind
