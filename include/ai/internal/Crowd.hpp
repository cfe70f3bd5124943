/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

// Internal crowd utilities: local avoidance and swarm flocking.
#ifndef AI_INTERNAL_CROWD_HPP
#define AI_INTERNAL_CROWD_HPP

#include "utils/Vector2D.hpp"
#include <vector>

namespace AIInternal {

namespace CrowdParams {
constexpr float DESIRED_WEIGHT = 0.7f;
constexpr float AVOIDANCE_WEIGHT = 0.3f;

constexpr float FLOCK_RADIUS = 100.0f;
constexpr float SEPARATION_RADIUS = 30.0f;
constexpr float SEPARATION_WEIGHT = 0.5f;
constexpr float ALIGNMENT_WEIGHT = 0.3f;
constexpr float COHESION_WEIGHT = 0.2f;
constexpr float FLOCK_BLEND = 0.2f;     // Share of the flocking force in the new velocity
} // namespace CrowdParams

struct CrowdNeighbor {
    Vector2D position;
    Vector2D velocity;
};

// Normalized push away from neighbours closer than radius
// - each neighbour at distance d contributes (1 - d/radius) along the away vector
// - coincident neighbours are ignored
// Returns: zero when nothing is in range
Vector2D ComputeAvoidance(const Vector2D &position,
                          const std::vector<Vector2D> &neighborPositions,
                          float radius);

// Mixes the desired velocity with an avoidance direction
// - desired: velocity toward the waypoint (zero means standing still, returned as is)
// - avoidance: output of ComputeAvoidance
// Returns: renormalized 0.7/0.3 blend scaled back to the desired speed
Vector2D BlendAvoidance(const Vector2D &desired, const Vector2D &avoidance);

// Separation, alignment and cohesion over allies within FLOCK_RADIUS
// Returns: 0.5/0.3/0.2 weighted sum, zero when no ally is in range
Vector2D ComputeFlockingForce(const Vector2D &position,
                              const std::vector<CrowdNeighbor> &allies);

// v = 0.8 v + 0.2 * force * maxSpeed; a zero force leaves v unchanged
Vector2D ApplyFlocking(const Vector2D &velocity, const Vector2D &force,
                       float maxSpeed);

} // namespace AIInternal

#endif // AI_INTERNAL_CROWD_HPP
