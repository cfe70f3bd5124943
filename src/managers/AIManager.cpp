/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AIManager.hpp"
#include "ai/BehaviorTree.hpp"
#include "ai/pathfinding/AStarStrategy.hpp"
#include "ai/pathfinding/FlowFieldStrategy.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <string>

namespace HordeMind {

namespace {

AIConfig prepareConfig(const AIConfig &config) {
  config.validate();
  return config.sanitized();
}

SpatialGridConfig spatialConfigFrom(const AIConfig &config) {
  SpatialGridConfig grid;
  grid.cellSize = config.spatialCellSize;
  grid.worldMin = config.worldMin;
  grid.worldMax = config.worldMax;
  return grid;
}

MovementSettings movementSettingsFrom(const AIConfig &config) {
  MovementSettings settings;
  settings.groupBehaviorEnabled = config.groupBehaviorEnabled;
  return settings;
}

bool isAgentEntity(const EntityRef &ref) {
  return ref.hasComponents(ComponentType::Transform | ComponentType::Movement |
                           ComponentType::AI);
}

} // namespace

AIManager::AIManager(IWorldAccess &world, const AIConfig &config)
    : m_world(world), m_config(prepareConfig(config)),
      m_grid(spatialConfigFrom(m_config)),
      m_obstacles(NavigationGrid::fromBounds(m_config.worldMin, m_config.worldMax,
                                             m_config.aStarCellSize)),
      m_pathCache(m_config.pathCacheCapacity, m_config.pathCacheQuantization),
      m_flowFieldCache(m_config.flowFieldCapacity),
      m_requestQueue(m_config.maxQueuedRequests),
      m_contextBuilder(m_grid, m_world,
                       [this](EntityID id) { return classifyNeighbor(id); }),
      m_movement(m_grid, m_world,
                 [this](EntityID id) { return classifyNeighbor(id); },
                 movementSettingsFrom(m_config)) {
  m_planner = std::make_unique<PathPlanner>(createStrategy(m_config.algorithm),
                                            m_pathCache);
}

bool AIManager::init() {
  if (m_initialized) {
    return true;
  }

  AISystemInitializedEvent event;
  event.algorithm = m_planner->getAlgorithm();
  event.maxAgentUpdatesPerTick = static_cast<uint32_t>(m_config.maxAgentUpdatesPerTick);
  event.maxPathfindsPerTick = static_cast<uint32_t>(m_config.maxPathfindsPerTick);
  event.groupBehaviorEnabled = m_config.groupBehaviorEnabled;
  m_world.emit(EventTypeId::AISystemInitialized, event);

  m_initialized = true;
  AI_INFO(std::string("AIManager initialized - algorithm: ") +
          algorithmToString(event.algorithm) + ", agent budget: " +
          std::to_string(m_config.maxAgentUpdatesPerTick) + ", pathfind budget: " +
          std::to_string(m_config.maxPathfindsPerTick));
  return true;
}

void AIManager::clean() {
  for (EntityID id : m_indexedIds) {
    m_grid.remove(id);
  }
  m_indexedIds.clear();
  m_agents.clear();
  m_agentOrder.clear();
  m_agentRefs.clear();
  m_requestQueue.clear();
  clearCaches();
  m_pathCache.resetStats();
  m_cursor = 0;
  m_primaryTarget = INVALID_ENTITY_ID;
  m_initialized = false;
  AI_INFO("AIManager cleaned");
}

std::unique_ptr<IPathfindingStrategy>
AIManager::createStrategy(PathfindingAlgorithm algorithm) {
  m_flowStrategy = nullptr;
  m_navMeshStrategy = nullptr;

  GridSearchSettings search;
  search.cellSize = m_config.aStarCellSize;
  search.maxSearchNodes = static_cast<size_t>(m_config.maxSearchNodes);

  switch (algorithm) {
  case PathfindingAlgorithm::AStar:
    return std::make_unique<AStarStrategy>(search, &m_obstacles);
  case PathfindingAlgorithm::Dijkstra:
    return std::make_unique<DijkstraStrategy>(search, &m_obstacles);
  case PathfindingAlgorithm::FlowField: {
    FlowFieldSettings settings;
    settings.worldMin = m_config.worldMin;
    settings.worldMax = m_config.worldMax;
    settings.resolution = m_config.flowFieldResolution;
    settings.maxPathLength = m_config.maxPathLength;
    auto strategy = std::make_unique<FlowFieldStrategy>(m_flowFieldCache, settings,
                                                        &m_obstacles);
    m_flowStrategy = strategy.get();
    return strategy;
  }
  case PathfindingAlgorithm::NavMesh: {
    auto strategy = std::make_unique<NavMeshStrategy>();
    if (!m_navMesh.empty()) {
      strategy->loadMesh(m_navMesh);
    }
    m_navMeshStrategy = strategy.get();
    return strategy;
  }
  case PathfindingAlgorithm::Direct:
    break;
  }
  return std::make_unique<DirectStrategy>();
}

void AIManager::update(const TickContext &tick,
                       const std::vector<EntityRef> &agents) {
  if (!m_initialized) {
    return;
  }

  const double now = tick.totalTimeMs;
  m_tickStats = AIManagerStats{};
  m_pathCache.setCurrentTime(now);
  m_flowFieldCache.setCurrentTime(now);

  refreshWorld(agents);
  prebuildPrimaryField();
  servePathRequests();
  updateAgents(now);
  runMaintenance(now);
}

void AIManager::refreshWorld(const std::vector<EntityRef> &agents) {
  std::unordered_set<EntityID> seen;

  // Combatants: anything with transform and health that is not AI driven.
  // The first of them is the primary target.
  m_primaryTarget = INVALID_ENTITY_ID;
  const auto combatants = m_world.getEntitiesWithComponents(
      ComponentType::Transform | ComponentType::Health);
  for (const auto &ref : combatants) {
    if (ref.ai || !ref.transform) {
      continue;
    }
    if (m_primaryTarget == INVALID_ENTITY_ID) {
      m_primaryTarget = ref.id;
    }
    if (m_grid.contains(ref.id)) {
      m_grid.update(ref.id, ref.transform->position);
    } else {
      m_grid.insert(ref.id, ref.transform->position);
    }
    m_indexedIds.insert(ref.id);
    seen.insert(ref.id);
  }

  m_agentOrder.clear();
  m_agentRefs.clear();
  for (const auto &ref : agents) {
    if (!isAgentEntity(ref) || m_agentRefs.count(ref.id) != 0) {
      continue;
    }
    auto it = m_agents.find(ref.id);
    if (it == m_agents.end()) {
      it = m_agents
               .emplace(ref.id, AgentRecord::fromProfile(
                                    ref.id, *ref.get<const AIProfile>(), m_config))
               .first;
      AI_DEBUG("Tracking agent " + std::to_string(ref.id));
    }

    const Vector2D &position = ref.get<TransformData>()->position;
    if (m_grid.contains(ref.id)) {
      m_grid.update(ref.id, position);
    } else {
      m_grid.insert(ref.id, position, it->second.bodyRadius);
    }
    m_indexedIds.insert(ref.id);
    seen.insert(ref.id);

    m_agentOrder.push_back(ref.id);
    m_agentRefs.emplace(ref.id, ref);
  }

  // Records of agents that left the list
  for (auto it = m_agents.begin(); it != m_agents.end();) {
    if (m_agentRefs.count(it->first) == 0) {
      AI_DEBUG("Dropping agent " + std::to_string(it->first));
      m_requestQueue.cancel(it->first);
      it = m_agents.erase(it);
    } else {
      ++it;
    }
  }

  // Index entries for anything we inserted that is gone
  for (auto it = m_indexedIds.begin(); it != m_indexedIds.end();) {
    if (seen.count(*it) == 0) {
      m_grid.remove(*it);
      it = m_indexedIds.erase(it);
    } else {
      ++it;
    }
  }
}

void AIManager::prebuildPrimaryField() {
  if (!m_flowStrategy || m_primaryTarget == INVALID_ENTITY_ID) {
    return;
  }
  const auto target = m_grid.getPosition(m_primaryTarget);
  if (!target) {
    return;
  }
  const uint64_t key = m_flowStrategy->keyFor(*target);
  if (m_hasPrimaryFieldKey && key == m_primaryFieldKey &&
      m_flowFieldCache.find(key)) {
    return;
  }
  m_flowStrategy->fieldFor(*target);
  m_primaryFieldKey = key;
  m_hasPrimaryFieldKey = true;
}

void AIManager::servePathRequests() {
  const uint64_t computedBefore = m_planner->getPathsComputed();

  m_tickStats.requestsServedThisTick = m_requestQueue.drain(
      static_cast<size_t>(m_config.maxPathfindsPerTick),
      [this](const AIInternal::PathRequest &request) {
        auto it = m_agents.find(request.agentId);
        if (it == m_agents.end() || it->second.state == AIState::DEAD) {
          return false;
        }
        const auto entity = m_world.getEntity(request.agentId);
        if (!entity || !entity->transform) {
          return false;
        }
        it->second.setPath(
            m_planner->plan(entity->transform->position, request.goal));
        return true;
      });

  m_tickStats.pathsComputedThisTick =
      static_cast<size_t>(m_planner->getPathsComputed() - computedBefore);
}

void AIManager::updateAgents(double nowMs) {
  const size_t count = m_agentOrder.size();
  if (count == 0) {
    m_cursor = 0;
    return;
  }

  const size_t budget = static_cast<size_t>(m_config.maxAgentUpdatesPerTick);
  size_t start = m_cursor % count;
  size_t updated = 0;
  size_t visited = 0;
  while (visited < count && updated < budget) {
    const size_t index = (start + visited) % count;
    ++visited;

    const EntityID id = m_agentOrder[index];
    auto it = m_agents.find(id);
    if (it == m_agents.end()) {
      continue;
    }
    if (it->second.state == AIState::DEAD) {
      // Corpses hold still and do not use up the budget
      if (auto *movement = m_agentRefs.at(id).get<MovementData>()) {
        movement->velocity = Vector2D();
      }
      continue;
    }
    if (nowMs < it->second.nextUpdateTime) {
      continue;
    }
    processAgent(it->second, m_agentRefs.at(id), nowMs);
    ++updated;
  }

  // Resume after the last agent looked at so nobody starves under the budget
  m_cursor = (start + visited) % count;
  m_tickStats.agentUpdatesThisTick = updated;
}

void AIManager::processAgent(AgentRecord &agent, const EntityRef &entity,
                             double nowMs) {
  AIContext ctx = m_contextBuilder.build(agent, entity, m_primaryTarget, nowMs);

  const AIState previous = agent.state;
  const AIState next = m_stateMachine.evaluate(ctx, agent);
  if (m_stateMachine.transition(agent, next, nowMs)) {
    ctx.timeInState = 0.0;

    AIStateChangedEvent event;
    event.entityId = agent.id;
    event.previousState = previous;
    event.newState = next;
    event.timestamp = nowMs;
    m_world.emit(EventTypeId::AIStateChanged, event);

    if (next == AIState::DEAD) {
      m_requestQueue.cancel(agent.id);
      m_movement.execute(agent, entity);
      agent.nextUpdateTime = nowMs + agent.effectiveUpdateInterval();
      return;
    }
  }

  m_stateMachine.applyStateAction(agent, ctx);
  if (agent.behaviorTree) {
    runBehaviorTree(agent.behaviorTree.get(), agent, ctx);
  }

  if (agent.needsPath(nowMs)) {
    const auto result =
        m_requestQueue.enqueue(agent.id, *agent.targetPosition, nowMs);
    if (result != AIInternal::EnqueueResult::Rejected) {
      agent.lastPathfindTime = nowMs;
    }
  }

  m_movement.execute(agent, entity);
  agent.nextUpdateTime = nowMs + agent.effectiveUpdateInterval();
}

void AIManager::runMaintenance(double nowMs) {
  if (nowMs - m_lastMaintenanceTime < m_config.cacheMaintenanceIntervalMs) {
    return;
  }
  m_lastMaintenanceTime = nowMs;

  const size_t evictedPaths = m_pathCache.trimToCapacity();
  const size_t evictedFields = m_flowFieldCache.trimToCapacity();
  if (evictedPaths > 0 || evictedFields > 0) {
    PATHFIND_DEBUG("Cache maintenance evicted " + std::to_string(evictedPaths) +
                   " paths, " + std::to_string(evictedFields) + " flow fields");
  }

  const auto cacheStats = m_pathCache.getStats();
  PathfindingStatsEvent event;
  event.algorithm = m_planner->getAlgorithm();
  event.pathCacheSize = m_pathCache.size();
  event.flowFieldCount = m_flowFieldCache.size();
  event.pendingRequests = m_requestQueue.size();
  event.cacheHits = cacheStats.totalHits;
  event.cacheMisses = cacheStats.totalMisses;
  event.pathsComputed = m_planner->getPathsComputed();
  event.timestamp = nowMs;
  m_world.emit(EventTypeId::PathfindingStats, event);
}

AIManagerStats AIManager::getStats() const {
  AIManagerStats stats = m_tickStats;
  stats.pathCacheSize = m_pathCache.size();
  stats.pathCacheHitRate = m_pathCache.getStats().hitRate;
  stats.flowFieldCount = m_flowFieldCache.size();
  stats.pendingRequests = m_requestQueue.size();
  stats.trackedAgents = m_agents.size();
  stats.algorithm = m_planner->getAlgorithm();
  return stats;
}

size_t AIManager::setObstacle(const Vector2D &worldMin, const Vector2D &worldMax,
                              bool blocked) {
  const size_t changed = m_obstacles.setBlockedRect(worldMin, worldMax, blocked);
  if (changed > 0) {
    clearCaches();
    PATHFIND_INFO("Obstacle layer changed (" + std::to_string(changed) +
                  " cells), caches cleared");
  }
  return changed;
}

void AIManager::clearObstacles() {
  if (m_obstacles.blockedCount() == 0) {
    return;
  }
  m_obstacles.clearObstacles();
  clearCaches();
}

void AIManager::loadNavMesh(std::vector<NavPolygon> polygons) {
  m_navMesh = std::move(polygons);
  if (m_navMeshStrategy) {
    m_navMeshStrategy->loadMesh(m_navMesh);
    m_pathCache.clear();
  }
}

void AIManager::removeAgent(EntityID id) {
  if (m_agents.erase(id) == 0) {
    return;
  }
  m_requestQueue.cancel(id);
  m_agentRefs.erase(id);
  m_agentOrder.erase(std::remove(m_agentOrder.begin(), m_agentOrder.end(), id),
                     m_agentOrder.end());
  if (m_indexedIds.erase(id) != 0) {
    m_grid.remove(id);
  }
}

bool AIManager::recordDamage(EntityID agent, EntityID source, float damage) {
  auto it = m_agents.find(agent);
  if (it == m_agents.end() || source == agent) {
    return false;
  }
  it->second.recordDamage(source, damage);
  AI_DEBUG("Entity " + std::to_string(agent) + " took " + std::to_string(damage) +
           " damage from " + std::to_string(source));
  return true;
}

NeighborKind AIManager::classifyNeighbor(EntityID id) const {
  auto it = m_agents.find(id);
  if (it == m_agents.end()) {
    return NeighborKind::Other;
  }
  return it->second.state == AIState::DEAD ? NeighborKind::DeadAgent
                                           : NeighborKind::Agent;
}

const AgentRecord *AIManager::getAgent(EntityID id) const {
  auto it = m_agents.find(id);
  return it != m_agents.end() ? &it->second : nullptr;
}

void AIManager::setAlgorithm(PathfindingAlgorithm algorithm) {
  if (algorithm == m_planner->getAlgorithm()) {
    return;
  }
  m_planner->setStrategy(createStrategy(algorithm));
  m_pathCache.clear();
  m_hasPrimaryFieldKey = false;
  AI_INFO(std::string("Pathfinding algorithm set to ") +
          algorithmToString(algorithm));
}

void AIManager::setGroupBehaviorEnabled(bool enabled) {
  m_config.groupBehaviorEnabled = enabled;
  m_movement.setGroupBehaviorEnabled(enabled);
}

void AIManager::clearCaches() {
  m_pathCache.clear();
  m_flowFieldCache.clear();
  m_hasPrimaryFieldKey = false;
}

} // namespace HordeMind
