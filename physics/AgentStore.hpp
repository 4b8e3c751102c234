#pragma once

#include "Math.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <vector>

namespace Physics
{
using AgentId = size_t;

struct Agent
{
  AgentId id = 0;
  Math::float2 position = Math::float2(0.0f, 0.0f);
  // Derived from heading and speed every tick
  Math::float2 velocity = Math::float2(0.0f, 0.0f);
  // Steering angle in radians, never wrapped
  float heading = 0.0f;
};

// Read-only view of one agent handed to the presentation layer
struct AgentSnapshot
{
  AgentId id;
  Math::float2 position;
  float heading;
};

// Headings computed by a read pass, keyed by agent, applied by the commit pass.
// Inserting twice for the same agent keeps the last value.
using PendingHeadings = std::map<AgentId, float>;

// Fixed population of boids
class AgentStore
{
  public:
  AgentStore() = default;
  ~AgentStore() = default;

  // Replaces the whole population, fails if two agents share an id
  bool reset(std::vector<Agent> agents);

  size_t size() const { return m_agents.size(); }
  bool empty() const { return m_agents.empty(); }

  // Full population in iteration order, for read passes
  const std::vector<Agent>& agents() const { return m_agents; }

  // Keyed access, throws std::out_of_range on unknown id
  const Agent& agent(AgentId id) const;
  Agent& agent(AgentId id);

  void forEachAgent(const std::function<void(Agent&)>& func);

  // Commit pass: every pending heading overwrites the heading of its agent
  void commitHeadings(const PendingHeadings& pendingHeadings);

  private:
  std::vector<Agent> m_agents;
  std::map<AgentId, size_t> m_indexById;
};

// Euclidean distance between the positions of two agents
float Distance(const Agent& agentA, const Agent& agentB);
}
