#include "Geometry.hpp"

#include <gtest/gtest.h>

using namespace Geometry;

namespace
{
constexpr WorldSize2D WORLD = { 960.0f, 540.0f };
}

TEST(Geometry, DistanceToEachEdge)
{
  const Math::float2 pos(100.0f, -20.0f);

  EXPECT_FLOAT_EQ(DistanceToEdge(Edge::Bottom, pos, WORLD), 250.0f);
  EXPECT_FLOAT_EQ(DistanceToEdge(Edge::Top, pos, WORLD), 290.0f);
  EXPECT_FLOAT_EQ(DistanceToEdge(Edge::Left, pos, WORLD), 580.0f);
  EXPECT_FLOAT_EQ(DistanceToEdge(Edge::Right, pos, WORLD), 380.0f);
}

TEST(Geometry, DistanceIsNegativeBeyondEdge)
{
  EXPECT_FLOAT_EQ(DistanceToEdge(Edge::Right, Math::float2(500.0f, 0.0f), WORLD), -20.0f);
  EXPECT_FLOAT_EQ(DistanceToEdge(Edge::Left, Math::float2(-490.0f, 0.0f), WORLD), -10.0f);
  EXPECT_FLOAT_EQ(DistanceToEdge(Edge::Top, Math::float2(0.0f, 275.0f), WORLD), -5.0f);
  EXPECT_FLOAT_EQ(DistanceToEdge(Edge::Bottom, Math::float2(0.0f, -300.0f), WORLD), -30.0f);
}

TEST(Geometry, RandomPositionsStayInsideWorld)
{
  std::mt19937 generator(7);
  const auto positions = GenerateRandomPositions(WORLD, 200, generator);

  ASSERT_EQ(positions.size(), 200u);
  for (const auto& pos : positions)
  {
    EXPECT_GE(DistanceToEdge(Edge::Bottom, pos, WORLD), 0.0f);
    EXPECT_GE(DistanceToEdge(Edge::Top, pos, WORLD), 0.0f);
    EXPECT_GE(DistanceToEdge(Edge::Left, pos, WORLD), 0.0f);
    EXPECT_GE(DistanceToEdge(Edge::Right, pos, WORLD), 0.0f);
  }
}

TEST(Geometry, NoPositionsInEmptyWorld)
{
  std::mt19937 generator(7);
  EXPECT_TRUE(GenerateRandomPositions({ 0.0f, 540.0f }, 10, generator).empty());
  EXPECT_TRUE(GenerateRandomPositions({ 960.0f, -1.0f }, 10, generator).empty());
}

TEST(Geometry, RandomAnglesInFullTurn)
{
  std::mt19937 generator(7);
  const auto angles = GenerateRandomAngles(100, generator);

  ASSERT_EQ(angles.size(), 100u);
  for (float angle : angles)
  {
    EXPECT_GE(angle, 0.0f);
    EXPECT_LE(angle, 2.0f * Math::PI_F);
  }
}
