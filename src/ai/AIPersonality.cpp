/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/AIPersonality.hpp"

namespace HordeMind {

namespace {

Personality makePreset(PersonalityType type, float aggression, float fear,
                       float curiosity, float loyalty, float fleeThreshold) {
    Personality p;
    p.type = type;
    p.aggression = aggression;
    p.fear = fear;
    p.curiosity = curiosity;
    p.loyalty = loyalty;
    p.fleeHealthThreshold = fleeThreshold;
    return p;
}

} // namespace

Personality Personality::fromType(PersonalityType type) {
    switch (type) {
        case PersonalityType::AGGRESSIVE:
            return makePreset(type, 0.8f, 0.2f, 0.6f, 0.4f, 0.2f);
        case PersonalityType::DEFENSIVE:
            return makePreset(type, 0.5f, 0.5f, 0.4f, 0.6f, 0.3f);
        case PersonalityType::COWARD:
            return makePreset(type, 0.2f, 0.8f, 0.3f, 0.2f, 0.5f);
        case PersonalityType::BERSERKER:
            // Threshold 0: health fraction is never below it while alive
            return makePreset(type, 1.0f, 0.0f, 0.7f, 0.3f, 0.0f);
        case PersonalityType::TACTICAL:
            return makePreset(type, 0.6f, 0.4f, 0.7f, 0.5f, 0.3f);
        case PersonalityType::SUPPORT: {
            Personality p = makePreset(type, 0.3f, 0.6f, 0.5f, 0.8f, 0.4f);
            p.role = PersonalityRole::SUPPORT;
            return p;
        }
        case PersonalityType::GUARDIAN: {
            Personality p = makePreset(type, 0.7f, 0.1f, 0.2f, 0.9f, 0.15f);
            p.role = PersonalityRole::GUARDIAN;
            return p;
        }
        case PersonalityType::HUNTER:
            return makePreset(type, 0.7f, 0.3f, 0.8f, 0.4f, 0.25f);
        case PersonalityType::SWARM: {
            Personality p = makePreset(type, 0.6f, 0.4f, 0.5f, 0.7f, 0.3f);
            p.swarm = true;
            return p;
        }
    }
    return makePreset(PersonalityType::AGGRESSIVE, 0.8f, 0.2f, 0.6f, 0.4f, 0.2f);
}

const char* personalityTypeToString(PersonalityType type) noexcept {
    switch (type) {
        case PersonalityType::AGGRESSIVE: return "AGGRESSIVE";
        case PersonalityType::DEFENSIVE:  return "DEFENSIVE";
        case PersonalityType::COWARD:     return "COWARD";
        case PersonalityType::BERSERKER:  return "BERSERKER";
        case PersonalityType::TACTICAL:   return "TACTICAL";
        case PersonalityType::SUPPORT:    return "SUPPORT";
        case PersonalityType::GUARDIAN:   return "GUARDIAN";
        case PersonalityType::HUNTER:     return "HUNTER";
        case PersonalityType::SWARM:      return "SWARM";
    }
    return "UNKNOWN";
}

} // namespace HordeMind
