#pragma once

#include "AgentStore.hpp"

namespace Physics
{
// velocity = (cos(heading), sin(heading)) * speed, previous velocity discarded
void UpdateVelocities(AgentStore& store, float speed);

// Explicit Euler step, no clamping to the world bounds
void UpdatePositions(AgentStore& store);
}
