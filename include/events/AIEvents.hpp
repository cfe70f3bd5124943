/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_EVENTS_HPP
#define AI_EVENTS_HPP

/**
 * @file AIEvents.hpp
 * @brief Payloads emitted through IWorldAccess::emit().
 *
 * Delivery is fire and forget; the core never reads anything back.
 */

#include <cstddef>
#include <cstdint>
#include <variant>
#include "ai/AIState.hpp"
#include "ai/pathfinding/PathfindingAlgorithm.hpp"
#include "entities/EntityID.hpp"
#include "events/EventTypeId.hpp"

namespace HordeMind {

struct AISystemInitializedEvent {
    PathfindingAlgorithm algorithm{PathfindingAlgorithm::Direct};
    uint32_t maxAgentUpdatesPerTick{0};
    uint32_t maxPathfindsPerTick{0};
    bool groupBehaviorEnabled{false};
};

struct AIStateChangedEvent {
    EntityID entityId{INVALID_ENTITY_ID};
    AIState previousState{AIState::IDLE};
    AIState newState{AIState::IDLE};
    double timestamp{0.0};  // Cumulative tick time in ms
};

struct PathfindingStatsEvent {
    PathfindingAlgorithm algorithm{PathfindingAlgorithm::Direct};
    size_t pathCacheSize{0};
    size_t flowFieldCount{0};
    size_t pendingRequests{0};
    uint64_t cacheHits{0};
    uint64_t cacheMisses{0};
    uint64_t pathsComputed{0};
    double timestamp{0.0};
};

using AIEventData = std::variant<AISystemInitializedEvent, AIStateChangedEvent, PathfindingStatsEvent>;

} // namespace HordeMind

#endif // AI_EVENTS_HPP
