/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/BehaviorTree.hpp"
#include "ai/AIContext.hpp"
#include "ai/AgentRecord.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>

namespace HordeMind {

CompositeNode& CompositeNode::add(BehaviorNodePtr child) {
  if (child) {
    m_children.push_back(std::move(child));
  }
  return *this;
}

bool SequenceNode::tick(AgentRecord& agent, const AIContext& ctx) const {
  for (const auto& child : m_children) {
    if (!child->tick(agent, ctx)) {
      return false;
    }
  }
  return true;
}

bool SelectorNode::tick(AgentRecord& agent, const AIContext& ctx) const {
  for (const auto& child : m_children) {
    if (child->tick(agent, ctx)) {
      return true;
    }
  }
  return false;
}

bool ParallelNode::tick(AgentRecord& agent, const AIContext& ctx) const {
  if (m_children.empty()) {
    return true;
  }
  size_t succeeded = 0;
  for (const auto& child : m_children) {
    if (child->tick(agent, ctx)) {
      ++succeeded;
    }
  }
  return succeeded * 2 > m_children.size();
}

DecoratorNode::DecoratorNode(DecoratorType type, BehaviorNodePtr child, int times)
    : m_type(type), m_child(std::move(child)), m_times(std::max(times, 1)) {
  if (!m_child) {
    throw std::invalid_argument("DecoratorNode requires a child");
  }
}

bool DecoratorNode::tick(AgentRecord& agent, const AIContext& ctx) const {
  switch (m_type) {
  case DecoratorType::Invert:
    return !m_child->tick(agent, ctx);
  case DecoratorType::Succeed:
    m_child->tick(agent, ctx);
    return true;
  case DecoratorType::Fail:
    m_child->tick(agent, ctx);
    return false;
  case DecoratorType::Repeat:
    for (int i = 0; i < m_times; ++i) {
      m_child->tick(agent, ctx);
    }
    return true;
  case DecoratorType::Retry:
    for (int i = 0; i < m_times; ++i) {
      if (m_child->tick(agent, ctx)) {
        return true;
      }
    }
    return false;
  case DecoratorType::Passthrough:
    break;
  }
  return m_child->tick(agent, ctx);
}

std::string DecoratorNode::getName() const {
  switch (m_type) {
  case DecoratorType::Invert:
    return "Invert";
  case DecoratorType::Succeed:
    return "Succeed";
  case DecoratorType::Fail:
    return "Fail";
  case DecoratorType::Repeat:
    return "Repeat";
  case DecoratorType::Retry:
    return "Retry";
  case DecoratorType::Passthrough:
    break;
  }
  return "Passthrough";
}

bool ConditionNode::tick(AgentRecord&, const AIContext& ctx) const {
  return m_predicate ? m_predicate(ctx) : false;
}

bool ActionNode::tick(AgentRecord& agent, const AIContext& ctx) const {
  return m_action ? m_action(agent, ctx) : false;
}

bool runBehaviorTree(const BehaviorNode* root, AgentRecord& agent, const AIContext& ctx) {
  if (!root) {
    return false;
  }
  try {
    return root->tick(agent, ctx);
  } catch (const std::exception& e) {
    AI_WARN("Behavior tree " + root->getName() + " failed for entity " +
            std::to_string(agent.id) + ": " + e.what());
    return false;
  }
}

} // namespace HordeMind
