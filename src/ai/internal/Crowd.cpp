/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/internal/Crowd.hpp"

namespace AIInternal {

Vector2D ComputeAvoidance(const Vector2D &position,
                          const std::vector<Vector2D> &neighborPositions,
                          float radius) {
  if (!(radius > 0.0f)) {
    return Vector2D();
  }

  Vector2D push;
  for (const auto &other : neighborPositions) {
    const Vector2D offset = position - other;
    const float dist = offset.length();
    if (dist <= 0.0f || dist >= radius) {
      continue;
    }
    push += (offset / dist) * (1.0f - dist / radius);
  }
  return push.normalized();
}

Vector2D BlendAvoidance(const Vector2D &desired, const Vector2D &avoidance) {
  const float speed = desired.length();
  if (speed <= 0.0f || avoidance.isZero()) {
    return desired;
  }
  const Vector2D blended =
      (desired / speed) * CrowdParams::DESIRED_WEIGHT +
      avoidance * CrowdParams::AVOIDANCE_WEIGHT;
  return blended.normalized() * speed;
}

Vector2D ComputeFlockingForce(const Vector2D &position,
                              const std::vector<CrowdNeighbor> &allies) {
  Vector2D separation;
  Vector2D velocitySum;
  Vector2D positionSum;
  int count = 0;

  for (const auto &ally : allies) {
    const Vector2D offset = position - ally.position;
    const float dist = offset.length();
    if (dist > CrowdParams::FLOCK_RADIUS) {
      continue;
    }
    ++count;
    velocitySum += ally.velocity;
    positionSum += ally.position;
    if (dist > 0.0f && dist < CrowdParams::SEPARATION_RADIUS) {
      separation += (offset / dist) / dist;
    }
  }

  if (count == 0) {
    return Vector2D();
  }

  const float n = static_cast<float>(count);
  const Vector2D alignment = (velocitySum / n).normalized();
  const Vector2D cohesion = (positionSum / n - position).normalized();

  return separation.normalized() * CrowdParams::SEPARATION_WEIGHT +
         alignment * CrowdParams::ALIGNMENT_WEIGHT +
         cohesion * CrowdParams::COHESION_WEIGHT;
}

Vector2D ApplyFlocking(const Vector2D &velocity, const Vector2D &force,
                       float maxSpeed) {
  if (force.isZero()) {
    return velocity;
  }
  return velocity * (1.0f - CrowdParams::FLOCK_BLEND) +
         force * (CrowdParams::FLOCK_BLEND * maxSpeed);
}

} // namespace AIInternal
