/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_ALGORITHM_HPP
#define PATHFINDING_ALGORITHM_HPP

#include <cstdint>
#include <ostream>
#include <string_view>

namespace HordeMind {

enum class PathfindingAlgorithm : uint8_t {
    Direct = 0,
    AStar,
    FlowField,
    Dijkstra,
    NavMesh
};

const char* algorithmToString(PathfindingAlgorithm algorithm) noexcept;

/**
 * @brief Parses "direct", "astar", "flowfield", "dijkstra" or "navmesh"
 *        (case insensitive, '_' and '-' ignored). Unknown names map to Direct.
 */
PathfindingAlgorithm algorithmFromString(std::string_view name);

inline std::ostream& operator<<(std::ostream& os, PathfindingAlgorithm algorithm) {
    return os << algorithmToString(algorithm);
}

} // namespace HordeMind

#endif // PATHFINDING_ALGORITHM_HPP
