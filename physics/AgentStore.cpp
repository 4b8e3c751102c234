#include "AgentStore.hpp"
#include "Logging.hpp"

#include <utility>

using namespace Physics;

bool AgentStore::reset(std::vector<Agent> agents)
{
  std::map<AgentId, size_t> indexById;
  for (size_t i = 0; i < agents.size(); ++i)
  {
    if (!indexById.emplace(agents[i].id, i).second)
    {
      LOG_ERROR("Cannot reset agent store, id {} is used twice", agents[i].id);
      return false;
    }
  }

  m_agents = std::move(agents);
  m_indexById = std::move(indexById);

  return true;
}

const Agent& AgentStore::agent(AgentId id) const
{
  return m_agents[m_indexById.at(id)];
}

Agent& AgentStore::agent(AgentId id)
{
  return m_agents[m_indexById.at(id)];
}

void AgentStore::forEachAgent(const std::function<void(Agent&)>& func)
{
  for (auto& agent : m_agents)
    func(agent);
}

void AgentStore::commitHeadings(const PendingHeadings& pendingHeadings)
{
  for (const auto& pending : pendingHeadings)
  {
    agent(pending.first).heading = pending.second;
  }
}

float Physics::Distance(const Agent& agentA, const Agent& agentB)
{
  return Math::length(agentA.position - agentB.position);
}
