/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_STATE_HPP
#define AI_STATE_HPP

#include <cstdint>
#include <ostream>

namespace HordeMind {

enum class AIState : uint8_t {
    IDLE = 0,
    PATROL,
    CHASE,
    ATTACK,
    FLEE,
    INVESTIGATE,
    RETREAT,
    SUPPORT,
    GUARD,
    DEAD,
    COUNT
};

constexpr const char* aiStateToString(AIState state) noexcept {
    switch (state) {
        case AIState::IDLE:        return "IDLE";
        case AIState::PATROL:      return "PATROL";
        case AIState::CHASE:       return "CHASE";
        case AIState::ATTACK:      return "ATTACK";
        case AIState::FLEE:        return "FLEE";
        case AIState::INVESTIGATE: return "INVESTIGATE";
        case AIState::RETREAT:     return "RETREAT";
        case AIState::SUPPORT:     return "SUPPORT";
        case AIState::GUARD:       return "GUARD";
        case AIState::DEAD:        return "DEAD";
        default:                   return "UNKNOWN";
    }
}

// Stream operator for Boost.Test output
inline std::ostream& operator<<(std::ostream& os, AIState state) {
    return os << aiStateToString(state);
}

} // namespace HordeMind

#endif // AI_STATE_HPP
