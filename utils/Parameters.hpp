#pragma once

#include <cstddef>

namespace Utils
{
// Width of the rectangular world, centered on the origin
static constexpr float WORLD_WIDTH = 960.0f;

// Height of the rectangular world, 16:9 ratio
static constexpr float WORLD_HEIGHT = WORLD_WIDTH * 9.0f / 16.0f;

// Number of boids created at setup
static constexpr size_t NB_BOIDS = 30;

// Distance travelled by each boid during one tick
static constexpr float BOID_SPEED = 3.0f;

// Delay between two ticks in the runner, computation time not deducted
static constexpr int TICK_DELAY_MS = 20;
}
