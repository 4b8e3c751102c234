#include "Geometry.hpp"
#include "Logging.hpp"

namespace Geometry
{
float DistanceToEdge(Edge edge, const Math::float2& pos, const WorldSize2D& worldSize)
{
  switch (edge)
  {
  case Edge::Bottom:
    return pos.y + worldSize.height / 2.0f;
  case Edge::Top:
    return worldSize.height / 2.0f - pos.y;
  case Edge::Left:
    return pos.x + worldSize.width / 2.0f;
  case Edge::Right:
    return worldSize.width / 2.0f - pos.x;
  }
  return 0.0f;
}

std::vector<Math::float2> GenerateRandomPositions(const WorldSize2D& worldSize, size_t nbPositions, std::mt19937& generator)
{
  if (worldSize.width <= 0.0f || worldSize.height <= 0.0f)
  {
    LOG_ERROR("Cannot generate positions inside a world of size {}x{}", worldSize.width, worldSize.height);
    return {};
  }

  std::uniform_real_distribution<float> xDistrib(0.0f, worldSize.width);
  std::uniform_real_distribution<float> yDistrib(0.0f, worldSize.height);

  std::vector<Math::float2> positions;
  positions.reserve(nbPositions);

  for (size_t i = 0; i < nbPositions; ++i)
  {
    float x = xDistrib(generator) - worldSize.width / 2.0f;
    float y = yDistrib(generator) - worldSize.height / 2.0f;
    positions.push_back(Math::float2(x, y));
  }

  return positions;
}

std::vector<float> GenerateRandomAngles(size_t nbAngles, std::mt19937& generator)
{
  std::uniform_real_distribution<float> angleDistrib(0.0f, 2.0f * Math::PI_F);

  std::vector<float> angles(nbAngles, 0.0f);
  for (auto& angle : angles)
    angle = angleDistrib(generator);

  return angles;
}
}
