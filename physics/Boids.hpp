#pragma once

#include "AgentStore.hpp"
#include "Model.hpp"
#include "Rules.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Physics
{
// 2D flock steered by separation, alignment, cohesion and boundary avoidance.
// One call to update() is one tick: each rule in turn reads the whole flock
// then commits its headings, velocities and positions are integrated last.
class Boids : public Model
{
  public:
  Boids(ModelParams params);
  ~Boids() = default;

  void update() override;

  // New random population drawn from the model seed
  void reset() override;

  // Setup-time replacement of the population, fails on duplicated ids
  bool resetWithAgents(std::vector<Agent> agents);

  bool updateModelWithInputJson() override;

  //
  void setBoidSize(float boidSize);
  float boidSize() const { return m_boidSize; }

  //
  void setSeparationDistance(float distance);
  float separationDistance() const { return m_separation.distance; }

  void setSeparationSensitivity(float sensitivity);
  float separationSensitivity() const { return m_separation.sensitivity; }

  //
  void setAlignmentDistance(float distance);
  float alignmentDistance() const { return m_alignment.distance; }

  void setAlignmentSensitivity(float sensitivity);
  float alignmentSensitivity() const { return m_alignment.sensitivity; }

  //
  void setCohesionDistance(float distance);
  float cohesionDistance() const { return m_cohesion.distance; }

  void setCohesionSensitivity(float sensitivity);
  float cohesionSensitivity() const { return m_cohesion.sensitivity; }

  //
  const std::vector<Agent>& agents() const { return m_store.agents(); }

  // State of the flock after the last committed tick
  const std::vector<AgentSnapshot>& snapshot() const { return m_snapshot; }

  size_t nbTicks() const { return m_nbTicks; }

  private:
  void setInputValue(const std::string& section, const std::string& name, float value);
  void createRules();
  void updateSnapshot();

  float m_boidSize;

  RuleParams m_separation;
  RuleParams m_alignment;
  RuleParams m_cohesion;

  AgentStore m_store;

  // Applied in this order at each tick
  std::vector<std::unique_ptr<SteeringRule>> m_rules;

  std::vector<AgentSnapshot> m_snapshot;

  size_t m_nbTicks;
};
}
