#include "Integrators.hpp"

#include <cmath>

void Physics::UpdateVelocities(AgentStore& store, float speed)
{
  store.forEachAgent([speed](Agent& boid) {
    boid.velocity = Math::float2(std::cos(boid.heading) * speed, std::sin(boid.heading) * speed);
  });
}

void Physics::UpdatePositions(AgentStore& store)
{
  store.forEachAgent([](Agent& boid) {
    boid.position += boid.velocity;
  });
}
