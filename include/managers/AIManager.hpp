/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_MANAGER_HPP
#define AI_MANAGER_HPP

/**
 * @file AIManager.hpp
 * @brief Tick-driven orchestrator for NPC decisions and navigation
 *
 * One AIManager instance owns everything an agent population needs:
 * - Spatial index shared with sibling subsystems
 * - Path cache, flow-field cache and the bounded path request queue
 * - The active pathfinding strategy and static obstacle layer
 * - One AgentRecord per agent, created on first sight
 *
 * Each update() refreshes the spatial index, serves a budget of queued path
 * requests, and runs a budget of agents through context building, state
 * evaluation, state actions, the optional behavior tree and movement. DEAD
 * agents are held still outside the budget. Everything runs on the calling
 * thread.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ai/AIConfig.hpp"
#include "ai/AIContext.hpp"
#include "ai/AgentRecord.hpp"
#include "ai/BehaviorStateMachine.hpp"
#include "ai/internal/FlowFieldCache.hpp"
#include "ai/internal/PathCache.hpp"
#include "ai/internal/PathRequestQueue.hpp"
#include "ai/movement/MovementExecutor.hpp"
#include "ai/pathfinding/NavMeshStrategy.hpp"
#include "ai/pathfinding/NavigationGrid.hpp"
#include "ai/pathfinding/PathPlanner.hpp"
#include "collisions/SpatialGrid.hpp"
#include "world/WorldAccess.hpp"

namespace HordeMind {

class FlowFieldStrategy;

struct TickContext {
  float deltaTime{0.0f};     // Seconds since the previous tick
  double totalTimeMs{0.0};   // Cumulative game time, the clock every timestamp uses
  uint64_t frameCount{0};
};

struct AIManagerStats {
  size_t agentUpdatesThisTick{0};
  size_t requestsServedThisTick{0};
  size_t pathsComputedThisTick{0};
  size_t pathCacheSize{0};
  float pathCacheHitRate{0.0f};
  size_t flowFieldCount{0};
  size_t pendingRequests{0};
  size_t trackedAgents{0};
  PathfindingAlgorithm algorithm{PathfindingAlgorithm::Direct};
};

class AIManager {
public:
  /**
   * @param world Entity access and event sink; must outlive the manager
   * @throws std::invalid_argument on non-positive cell sizes or budgets
   */
  explicit AIManager(IWorldAccess &world, const AIConfig &config = AIConfig{});
  ~AIManager() = default;

  AIManager(const AIManager &) = delete;
  AIManager &operator=(const AIManager &) = delete;

  /**
   * @brief Marks the manager ready and emits AISystemInitialized
   * @return true once initialized (repeat calls are no-ops)
   */
  bool init();

  bool isInitialized() const { return m_initialized; }

  /**
   * @brief Drops every agent, cache entry and queued request, and resets
   *        the cache statistics
   */
  void clean();

  /**
   * @brief Runs one AI tick for the given agent list
   *
   * Entities without transform, movement and AI profile are ignored. Agents
   * missing from the list lose their records.
   */
  void update(const TickContext &tick, const std::vector<EntityRef> &agents);

  // Shared spatial index, refreshed at the start of every tick
  SpatialGrid &spatialIndex() { return m_grid; }
  const SpatialGrid &spatialIndex() const { return m_grid; }

  AIManagerStats getStats() const;

  /**
   * @brief Blocks (or clears) the obstacle cells under a world rectangle
   *
   * Any change invalidates both path caches.
   * @return Number of cells that changed
   */
  size_t setObstacle(const Vector2D &worldMin, const Vector2D &worldMax,
                     bool blocked = true);
  void clearObstacles();
  const NavigationGrid &getObstacles() const { return m_obstacles; }

  /**
   * @brief Stores the mesh used by the NavMesh algorithm
   */
  void loadNavMesh(std::vector<NavPolygon> polygons);

  /**
   * @brief Feeds a hit into the agent's threat memory
   *
   * A source whose threat reaches AIContextBuilder::THREAT_SWITCH_LEVEL
   * becomes the agent's target while it stays in perception range.
   * @return false for an untracked agent or self-inflicted damage
   */
  bool recordDamage(EntityID agent, EntityID source, float damage);

  void removeAgent(EntityID id);
  const AgentRecord *getAgent(EntityID id) const;
  size_t getAgentCount() const { return m_agents.size(); }

  /**
   * @brief Swaps the pathfinding strategy; cached paths are discarded
   */
  void setAlgorithm(PathfindingAlgorithm algorithm);
  PathfindingAlgorithm getAlgorithm() const { return m_planner->getAlgorithm(); }

  void setGroupBehaviorEnabled(bool enabled);

  void clearCaches();

  EntityID getPrimaryTarget() const { return m_primaryTarget; }
  const AIConfig &getConfig() const { return m_config; }

private:
  IWorldAccess &m_world;
  AIConfig m_config;
  bool m_initialized{false};

  SpatialGrid m_grid;
  NavigationGrid m_obstacles;
  AIInternal::PathCache m_pathCache;
  AIInternal::FlowFieldCache m_flowFieldCache;
  AIInternal::PathRequestQueue m_requestQueue;

  std::unordered_map<EntityID, AgentRecord> m_agents;
  AIContextBuilder m_contextBuilder;
  BehaviorStateMachine m_stateMachine;
  MovementExecutor m_movement;

  // Non-owning views into the planner's current strategy
  FlowFieldStrategy *m_flowStrategy{nullptr};
  NavMeshStrategy *m_navMeshStrategy{nullptr};
  std::unique_ptr<PathPlanner> m_planner;
  std::vector<NavPolygon> m_navMesh;

  // Per-tick working set
  std::vector<EntityID> m_agentOrder;
  std::unordered_map<EntityID, EntityRef> m_agentRefs;
  std::unordered_set<EntityID> m_indexedIds;   // Everything this manager put in m_grid
  size_t m_cursor{0};
  EntityID m_primaryTarget{INVALID_ENTITY_ID};
  uint64_t m_primaryFieldKey{0};
  bool m_hasPrimaryFieldKey{false};
  double m_lastMaintenanceTime{0.0};

  AIManagerStats m_tickStats{};

  std::unique_ptr<IPathfindingStrategy> createStrategy(PathfindingAlgorithm algorithm);
  NeighborKind classifyNeighbor(EntityID id) const;

  void refreshWorld(const std::vector<EntityRef> &agents);
  void prebuildPrimaryField();
  void servePathRequests();
  void updateAgents(double nowMs);
  void processAgent(AgentRecord &agent, const EntityRef &entity, double nowMs);
  void runMaintenance(double nowMs);
};

} // namespace HordeMind

#endif // AI_MANAGER_HPP
