/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_TYPE_ID_HPP
#define EVENT_TYPE_ID_HPP

#include <cstdint>
#include <ostream>

namespace HordeMind {

// Notifications the navigation core sends to the world collaborator
enum class EventTypeId : uint8_t {
  AISystemInitialized = 0,
  AIStateChanged = 1,
  PathfindingStats = 2,
  COUNT = 3
};

inline std::ostream &operator<<(std::ostream &os, EventTypeId type) {
  switch (type) {
  case EventTypeId::AISystemInitialized:
    return os << "AI_SYSTEM_INITIALIZED";
  case EventTypeId::AIStateChanged:
    return os << "AI_STATE_CHANGED";
  case EventTypeId::PathfindingStats:
    return os << "PATHFINDING_STATS";
  default:
    return os << "UNKNOWN";
  }
}

} // namespace HordeMind

#endif // EVENT_TYPE_ID_HPP
