#include "Rules.hpp"

#include <array>
#include <cmath>
#include <utility>

using namespace Physics;

namespace
{
// Separation blending, subtractive.
// divisor is the cube root of the distance to the threat
float SteerAway(float heading, float away, float sensitivity, float divisor)
{
  if (std::abs(away - heading) < Math::PI_F)
    return heading - (away - heading) * sensitivity / divisor;
  else
    return heading - (heading - away) * sensitivity / divisor;
}

// Alignment, cohesion and boundary blending, additive
float SteerTowards(float heading, float target, float sensitivity, float divisor = 1.0f)
{
  if (std::abs(target - heading) < Math::PI_F)
    return heading + (target - heading) * sensitivity / divisor;
  else
    return heading + (heading - target) * sensitivity / divisor;
}
}

size_t SteeringRule::apply(AgentStore& store) const
{
  const PendingHeadings pendingHeadings = computeHeadings(store);

  store.commitHeadings(pendingHeadings);

  return pendingHeadings.size();
}

//
// Separation
//

SeparationRule::SeparationRule(float boidSize, RuleParams params)
    : m_boidSize(boidSize)
    , m_params(params)
{
}

PendingHeadings SeparationRule::computeHeadings(const AgentStore& store) const
{
  PendingHeadings pendingHeadings;

  for (const auto& boid : store.agents())
  {
    for (const auto& other : store.agents())
    {
      if (boid.id == other.id)
        continue;

      const float distance = Distance(boid, other);

      if (distance < m_params.distance + m_boidSize)
      {
        const float towardsCollision = std::atan2(boid.position.y - other.position.y, boid.position.x - other.position.x);
        const float awayFromCollision = towardsCollision + Math::PI_F;

        // Closest neighbors give sharper turns, coincident ones an unbounded one
        pendingHeadings[boid.id] = SteerAway(boid.heading, awayFromCollision, m_params.sensitivity, std::cbrt(distance));
      }
    }
  }

  return pendingHeadings;
}

//
// Alignment
//

AlignmentRule::AlignmentRule(float boidSize, RuleParams params)
    : m_boidSize(boidSize)
    , m_params(params)
{
}

PendingHeadings AlignmentRule::computeHeadings(const AgentStore& store) const
{
  PendingHeadings pendingHeadings;

  for (const auto& boid : store.agents())
  {
    float sumHeadings = 0.0f;
    size_t nbNeighbors = 0;

    for (const auto& other : store.agents())
    {
      if (boid.id == other.id)
        continue;

      if (Distance(boid, other) - m_boidSize < m_params.distance)
      {
        sumHeadings += other.heading;
        ++nbNeighbors;
      }
    }

    if (nbNeighbors > 0)
    {
      const float meanHeading = sumHeadings / static_cast<float>(nbNeighbors);
      pendingHeadings[boid.id] = SteerTowards(boid.heading, meanHeading, m_params.sensitivity);
    }
  }

  return pendingHeadings;
}

//
// Cohesion
//

CohesionRule::CohesionRule(float boidSize, RuleParams params)
    : m_boidSize(boidSize)
    , m_params(params)
{
}

PendingHeadings CohesionRule::computeHeadings(const AgentStore& store) const
{
  PendingHeadings pendingHeadings;

  for (const auto& boid : store.agents())
  {
    float sumX = 0.0f;
    float sumY = 0.0f;
    size_t nbNeighbors = 0;

    for (const auto& other : store.agents())
    {
      if (boid.id == other.id)
        continue;

      if (Distance(boid, other) - m_boidSize < m_params.distance)
      {
        sumX += other.position.x;
        sumY += other.position.y;
        ++nbNeighbors;
      }
    }

    if (nbNeighbors > 0)
    {
      const float centroidX = sumX / static_cast<float>(nbNeighbors);
      const float centroidY = sumY / static_cast<float>(nbNeighbors);
      const float towardsCenter = std::atan2(centroidY - boid.position.y, centroidX - boid.position.x);
      pendingHeadings[boid.id] = SteerTowards(boid.heading, towardsCenter, m_params.sensitivity);
    }
  }

  return pendingHeadings;
}

//
// Boundary avoidance
//

BoundaryAvoidanceRule::BoundaryAvoidanceRule(Geometry::WorldSize2D worldSize, RuleParams separationParams)
    : m_worldSize(worldSize)
    , m_params(separationParams)
{
}

PendingHeadings BoundaryAvoidanceRule::computeHeadings(const AgentStore& store) const
{
  // Checked edges with the bearing pointing away from each of them.
  // Later edges override earlier ones for the same boid.
  static const std::array<std::pair<Geometry::Edge, float>, 3> checkedEdges {
    std::make_pair(Geometry::Edge::Bottom, Math::PI_F / 2.0f),
    std::make_pair(Geometry::Edge::Top, 3.0f * Math::PI_F / 2.0f),
    std::make_pair(Geometry::Edge::Left, 0.0f)
  };

  PendingHeadings pendingHeadings;

  for (const auto& boid : store.agents())
  {
    for (const auto& edge : checkedEdges)
    {
      const float distanceToEdge = Geometry::DistanceToEdge(edge.first, boid.position, m_worldSize);

      if (distanceToEdge < m_params.distance)
      {
        pendingHeadings[boid.id] = SteerTowards(boid.heading, edge.second, m_params.sensitivity, std::cbrt(distanceToEdge));
      }
    }
  }

  return pendingHeadings;
}
