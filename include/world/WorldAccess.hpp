/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_ACCESS_HPP
#define WORLD_ACCESS_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>
#include <vector>
#include "ai/AIProfile.hpp"
#include "entities/EntityID.hpp"
#include "events/AIEvents.hpp"
#include "events/EventTypeId.hpp"
#include "utils/Vector2D.hpp"

namespace HordeMind {

enum class ComponentType : uint8_t {
    Transform = 1u << 0,
    Movement = 1u << 1,
    Health = 1u << 2,
    AI = 1u << 3
};

using ComponentMask = uint8_t;

constexpr ComponentMask toMask(ComponentType type) noexcept {
    return static_cast<ComponentMask>(type);
}

constexpr ComponentMask operator|(ComponentType a, ComponentType b) noexcept {
    return static_cast<ComponentMask>(toMask(a) | toMask(b));
}

constexpr ComponentMask operator|(ComponentMask a, ComponentType b) noexcept {
    return static_cast<ComponentMask>(a | toMask(b));
}

struct TransformData {
    Vector2D position;
};

struct MovementData {
    Vector2D velocity;          // Written by the movement executor, integrated by the world
    float maxSpeed = 100.0f;    // World units per second
};

struct HealthData {
    float current = 100.0f;
    float max = 100.0f;
    double lastDamageTime = -std::numeric_limits<double>::infinity();  // ms, same clock as TickContext
};

/**
 * @brief Non-owning view of one entity's components.
 *
 * Pointers are null when the entity lacks that component. A ref is only valid
 * for the duration of the call that produced it.
 */
struct EntityRef {
    EntityID id{INVALID_ENTITY_ID};
    TransformData* transform{nullptr};
    MovementData* movement{nullptr};
    HealthData* health{nullptr};
    const AIProfile* ai{nullptr};

    template <typename T>
    T* get() const {
        if constexpr (std::is_same_v<T, TransformData>) {
            return transform;
        } else if constexpr (std::is_same_v<T, MovementData>) {
            return movement;
        } else if constexpr (std::is_same_v<T, HealthData>) {
            return health;
        } else {
            static_assert(std::is_same_v<T, const AIProfile>, "unsupported component type");
            return ai;
        }
    }

    [[nodiscard]] ComponentMask components() const noexcept {
        ComponentMask mask = 0;
        if (transform) mask = mask | ComponentType::Transform;
        if (movement) mask = mask | ComponentType::Movement;
        if (health) mask = mask | ComponentType::Health;
        if (ai) mask = mask | ComponentType::AI;
        return mask;
    }

    [[nodiscard]] bool hasComponents(ComponentMask required) const noexcept {
        return (components() & required) == required;
    }
};

/**
 * @brief Narrow interface the core uses to reach entity storage and events.
 */
class IWorldAccess {
public:
    virtual ~IWorldAccess() = default;

    virtual std::optional<EntityRef> getEntity(EntityID id) = 0;

    virtual std::vector<EntityRef> getEntitiesWithComponents(ComponentMask required) = 0;

    // Fire and forget
    virtual void emit(EventTypeId type, const AIEventData& payload) = 0;
};

} // namespace HordeMind

#endif // WORLD_ACCESS_HPP
