/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BEHAVIOR_STATE_MACHINE_HPP
#define BEHAVIOR_STATE_MACHINE_HPP

#include "ai/AIContext.hpp"
#include "ai/AIState.hpp"

namespace HordeMind {

struct AgentRecord;

/**
 * @brief Priority-ordered transition table plus per-state actions.
 *
 * evaluate() only reads; transition() and applyStateAction() write to the
 * agent record. DEAD is absorbing.
 */
class BehaviorStateMachine {
public:
    static constexpr float PATROL_ARRIVAL_RADIUS = 20.0f;

    /**
     * @brief Highest priority state whose condition holds, or the current
     *        state when none does. Ties go to the rule listed first; rules
     *        into a state still on cooldown are skipped.
     */
    AIState evaluate(const AIContext& ctx, const AgentRecord& agent) const;

    /**
     * @brief Switches state and restarts the state timer.
     *
     * Taking a rule with a cooldown blocks its target state until
     * nowMs + cooldown. DEAD ignores cooldowns.
     * @return false when newState equals the current state or is on cooldown
     */
    bool transition(AgentRecord& agent, AIState newState, double nowMs) const;

    /**
     * @brief Runs the current state's action: picks where the agent should
     *        head (or stops it) and does combat bookkeeping.
     */
    void applyStateAction(AgentRecord& agent, const AIContext& ctx) const;
};

} // namespace HordeMind

#endif // BEHAVIOR_STATE_MACHINE_HPP
