#pragma once

#include "AgentStore.hpp"
#include "Geometry.hpp"

#include <string>

namespace Physics
{
// Neighbor inclusion threshold and blending strength of one rule.
// A null sensitivity keeps the rule running without any effect on headings.
struct RuleParams
{
  float distance = 0.0f;
  float sensitivity = 0.0f;
};

// Directional rule updating boid headings in two passes.
// The read pass only sees the population as it was before the rule started,
// so it can be computed for all agents in any order.
class SteeringRule
{
  public:
  virtual ~SteeringRule() = default;

  virtual std::string name() const = 0;

  // Read pass
  virtual PendingHeadings computeHeadings(const AgentStore& store) const = 0;

  // Read pass then commit pass, returns the number of updated agents
  size_t apply(AgentStore& store) const;
};

// Steers away from any neighbor closer than distance + boid size.
// Only the last threatening neighbor in iteration order is taken into account.
class SeparationRule : public SteeringRule
{
  public:
  SeparationRule(float boidSize, RuleParams params);

  std::string name() const override { return "Separation"; }
  PendingHeadings computeHeadings(const AgentStore& store) const override;

  private:
  float m_boidSize;
  RuleParams m_params;
};

// Steers toward the mean heading of the neighbors
class AlignmentRule : public SteeringRule
{
  public:
  AlignmentRule(float boidSize, RuleParams params);

  std::string name() const override { return "Alignment"; }
  PendingHeadings computeHeadings(const AgentStore& store) const override;

  private:
  float m_boidSize;
  RuleParams m_params;
};

// Steers toward the centroid of the neighbors
class CohesionRule : public SteeringRule
{
  public:
  CohesionRule(float boidSize, RuleParams params);

  std::string name() const override { return "Cohesion"; }
  PendingHeadings computeHeadings(const AgentStore& store) const override;

  private:
  float m_boidSize;
  RuleParams m_params;
};

// Steers away from the bottom, top and left edges of the world, in this order.
// The right edge is never checked.
class BoundaryAvoidanceRule : public SteeringRule
{
  public:
  BoundaryAvoidanceRule(Geometry::WorldSize2D worldSize, RuleParams separationParams);

  std::string name() const override { return "Boundary Avoidance"; }
  PendingHeadings computeHeadings(const AgentStore& store) const override;

  private:
  Geometry::WorldSize2D m_worldSize;
  RuleParams m_params;
};
}
