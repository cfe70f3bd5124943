/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BEHAVIOR_TREE_HPP
#define BEHAVIOR_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace HordeMind {

struct AIContext;
struct AgentRecord;

/**
 * @brief One node of an optional per-agent behavior tree.
 *
 * Trees are built once, shared between agents through AIProfile and never
 * modified while ticking. Every node reports plain success or failure.
 */
class BehaviorNode {
public:
  virtual ~BehaviorNode() = default;

  virtual bool tick(AgentRecord& agent, const AIContext& ctx) const = 0;
  virtual std::string getName() const = 0;
};

using BehaviorNodePtr = std::unique_ptr<BehaviorNode>;

class CompositeNode : public BehaviorNode {
public:
  // Appends a child; null children are ignored. Returns *this for chaining.
  CompositeNode& add(BehaviorNodePtr child);
  size_t childCount() const { return m_children.size(); }

protected:
  std::vector<BehaviorNodePtr> m_children;
};

// Succeeds when every child succeeds, stopping at the first failure
class SequenceNode : public CompositeNode {
public:
  bool tick(AgentRecord& agent, const AIContext& ctx) const override;
  std::string getName() const override { return "Sequence"; }
};

// Succeeds on the first child that succeeds
class SelectorNode : public CompositeNode {
public:
  bool tick(AgentRecord& agent, const AIContext& ctx) const override;
  std::string getName() const override { return "Selector"; }
};

// Ticks every child; succeeds when more than half of them did
class ParallelNode : public CompositeNode {
public:
  bool tick(AgentRecord& agent, const AIContext& ctx) const override;
  std::string getName() const override { return "Parallel"; }
};

enum class DecoratorType : uint8_t {
  Passthrough,
  Invert,
  Succeed,   // Runs the child, always succeeds
  Fail,      // Runs the child, always fails
  Repeat,    // Runs the child `times` times, always succeeds
  Retry      // Runs the child up to `times` times until it succeeds
};

class DecoratorNode : public BehaviorNode {
public:
  /**
   * @param times Repeat/Retry count, raised to 1 when smaller
   * @throws std::invalid_argument if child is null
   */
  DecoratorNode(DecoratorType type, BehaviorNodePtr child, int times = 1);

  bool tick(AgentRecord& agent, const AIContext& ctx) const override;
  std::string getName() const override;

private:
  DecoratorType m_type;
  BehaviorNodePtr m_child;
  int m_times;
};

class ConditionNode : public BehaviorNode {
public:
  using Predicate = std::function<bool(const AIContext&)>;

  explicit ConditionNode(Predicate predicate) : m_predicate(std::move(predicate)) {}

  // An empty predicate fails
  bool tick(AgentRecord& agent, const AIContext& ctx) const override;
  std::string getName() const override { return "Condition"; }

private:
  Predicate m_predicate;
};

class ActionNode : public BehaviorNode {
public:
  using Action = std::function<bool(AgentRecord&, const AIContext&)>;

  explicit ActionNode(Action action) : m_action(std::move(action)) {}

  // An empty action fails
  bool tick(AgentRecord& agent, const AIContext& ctx) const override;
  std::string getName() const override { return "Action"; }

private:
  Action m_action;
};

/**
 * @brief Ticks a tree for one agent.
 *
 * Exceptions thrown by conditions or actions are logged and count as
 * failure; they never reach the caller.
 * @return false for a null root, a failing tree or a throwing node
 */
bool runBehaviorTree(const BehaviorNode* root, AgentRecord& agent, const AIContext& ctx);

} // namespace HordeMind

#endif // BEHAVIOR_TREE_HPP
