/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_PERSONALITY_HPP
#define AI_PERSONALITY_HPP

#include <cstdint>
#include <ostream>

namespace HordeMind {

enum class PersonalityType : uint8_t {
    AGGRESSIVE = 0,  // High aggression, low fear
    DEFENSIVE,       // Balanced, values survival
    COWARD,          // Low aggression, high fear
    BERSERKER,       // Never flees
    TACTICAL,        // Retreats when outnumbered
    SUPPORT,         // Tends to wounded allies
    GUARDIAN,        // Holds a guard post
    HUNTER,          // Curious, investigates noises
    SWARM            // Flocks with nearby allies
};

// Roles gate the SUPPORT and GUARD transitions
enum class PersonalityRole : uint8_t {
    NONE = 0,
    SUPPORT,
    GUARDIAN
};

/**
 * @brief Parameter bundle shaping one agent's transitions and movement.
 */
struct Personality {
    PersonalityType type = PersonalityType::AGGRESSIVE;
    PersonalityRole role = PersonalityRole::NONE;

    float aggression = 0.5f;            // 0..1, gates PATROL->CHASE
    float fear = 0.5f;                  // 0..1, gates the FLEE transitions
    float curiosity = 0.5f;             // 0..1, gates IDLE->INVESTIGATE
    float loyalty = 0.5f;               // 0..1, informational for callers
    float speedMultiplier = 1.0f;       // Scales the entity's max speed
    float fleeHealthThreshold = 0.3f;   // Health fraction below which CHASE may turn to FLEE
    bool swarm = false;                 // Enables separation/alignment/cohesion blending

    /**
     * @brief Preset values for a personality type.
     */
    static Personality fromType(PersonalityType type);
};

const char* personalityTypeToString(PersonalityType type) noexcept;

inline std::ostream& operator<<(std::ostream& os, PersonalityType type) {
    return os << personalityTypeToString(type);
}

} // namespace HordeMind

#endif // AI_PERSONALITY_HPP
