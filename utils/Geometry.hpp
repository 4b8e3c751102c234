#pragma once

#include "Math.hpp"

#include <cstddef>
#include <random>
#include <vector>

namespace Geometry
{
// Dimensions of the rectangular world where the boids evolve, centered on the origin
struct WorldSize2D
{
  float width;
  float height;
};

enum class Edge
{
  Bottom,
  Top,
  Left,
  Right
};

// Signed distance between a position and one edge of the world,
// negative once the position is beyond that edge
float DistanceToEdge(Edge edge, const Math::float2& pos, const WorldSize2D& worldSize);

// Uniformly distributed positions inside the world
std::vector<Math::float2> GenerateRandomPositions(const WorldSize2D& worldSize, size_t nbPositions, std::mt19937& generator);

// Uniformly distributed angles in [0, 2PI)
std::vector<float> GenerateRandomAngles(size_t nbAngles, std::mt19937& generator);
}
