/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/PathfindingAlgorithm.hpp"
#include <cctype>
#include <string>

namespace HordeMind {

const char* algorithmToString(PathfindingAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case PathfindingAlgorithm::Direct:    return "direct";
        case PathfindingAlgorithm::AStar:     return "astar";
        case PathfindingAlgorithm::FlowField: return "flowfield";
        case PathfindingAlgorithm::Dijkstra:  return "dijkstra";
        case PathfindingAlgorithm::NavMesh:   return "navmesh";
    }
    return "unknown";
}

PathfindingAlgorithm algorithmFromString(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == '-' || c == ' ') {
            continue;
        }
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (key == "astar" || key == "a*") return PathfindingAlgorithm::AStar;
    if (key == "flowfield") return PathfindingAlgorithm::FlowField;
    if (key == "dijkstra") return PathfindingAlgorithm::Dijkstra;
    if (key == "navmesh") return PathfindingAlgorithm::NavMesh;
    return PathfindingAlgorithm::Direct;
}

} // namespace HordeMind
