/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_REQUEST_QUEUE_HPP
#define PATH_REQUEST_QUEUE_HPP

/**
 * @file PathRequestQueue.hpp
 * @brief Bounded FIFO of pending pathfinding requests, one per agent
 *
 * Game logic never computes paths inline. Agents enqueue here and the
 * orchestrator drains a fixed budget per tick:
 * - Strict FIFO across agents
 * - Re-enqueueing an agent updates its goal in place, keeping its position
 * - Unserved requests persist to the next drain
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <ostream>
#include <unordered_map>

#include "entities/EntityID.hpp"
#include "utils/Vector2D.hpp"

namespace AIInternal {

struct PathRequest {
    HordeMind::EntityID agentId{HordeMind::INVALID_ENTITY_ID};
    Vector2D goal{0.0f, 0.0f};
    double enqueueTime{0.0};   // ms
};

enum class EnqueueResult : uint8_t {
    Queued,     // New entry at the back
    Updated,    // Pending entry for this agent had its goal replaced
    Rejected    // Queue full
};

inline std::ostream& operator<<(std::ostream& os, EnqueueResult result) {
    switch (result) {
        case EnqueueResult::Queued: return os << "Queued";
        case EnqueueResult::Updated: return os << "Updated";
        case EnqueueResult::Rejected: return os << "Rejected";
    }
    return os << "Unknown";
}

class PathRequestQueue {
public:
    // Returns true when the request was served, false when it was skipped
    using Handler = std::function<bool(const PathRequest&)>;

    explicit PathRequestQueue(size_t capacity = DEFAULT_CAPACITY);

    EnqueueResult enqueue(HordeMind::EntityID agentId, const Vector2D& goal, double nowMs);

    /**
     * @brief Removes the agent's pending request, if any.
     * @return true if a request was pending
     */
    bool cancel(HordeMind::EntityID agentId);

    /**
     * @brief Pops requests in FIFO order until budget requests were served.
     *
     * Skipped requests (handler returned false) are discarded without
     * consuming budget.
     * @return Number of requests served
     */
    size_t drain(size_t budget, const Handler& handler);

    [[nodiscard]] bool contains(HordeMind::EntityID agentId) const { return m_pending.count(agentId) != 0; }
    [[nodiscard]] size_t size() const { return m_pending.size(); }
    [[nodiscard]] bool empty() const { return m_pending.empty(); }
    [[nodiscard]] size_t capacity() const { return m_capacity; }
    uint64_t getRejectedCount() const { return m_rejected; }

    void clear();

    static constexpr size_t DEFAULT_CAPACITY = 1024;

private:
    struct Slot {
        HordeMind::EntityID agentId;
        uint64_t sequence;
    };
    struct Pending {
        PathRequest request;
        uint64_t sequence;
    };

    // Order of arrival; entries whose sequence no longer matches m_pending are stale
    std::deque<Slot> m_order;
    std::unordered_map<HordeMind::EntityID, Pending> m_pending;
    size_t m_capacity;
    uint64_t m_nextSequence{0};
    uint64_t m_rejected{0};

    // Drops stale slots left behind by cancel()
    void compact();
};

} // namespace AIInternal

#endif // PATH_REQUEST_QUEUE_HPP
