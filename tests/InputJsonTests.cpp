#include "Boids.hpp"

#include <gtest/gtest.h>

using namespace Physics;

namespace
{
ModelParams ReferenceParams()
{
  ModelParams params;
  params.nbParticles = 10;
  params.worldSize = { 960.0f, 540.0f };
  params.velocity = 3.0f;
  params.seed = 1;
  return params;
}
}

TEST(InputJson, ReferenceDefaults)
{
  Boids boids(ReferenceParams());

  EXPECT_FLOAT_EQ(boids.boidSize(), 15.0f);
  EXPECT_FLOAT_EQ(boids.separationDistance(), 50.0f);
  EXPECT_FLOAT_EQ(boids.separationSensitivity(), 0.1f);
  EXPECT_FLOAT_EQ(boids.alignmentDistance(), 70.0f);
  EXPECT_FLOAT_EQ(boids.alignmentSensitivity(), 0.0f);
  EXPECT_FLOAT_EQ(boids.cohesionDistance(), 100.0f);
  EXPECT_FLOAT_EQ(boids.cohesionSensitivity(), 0.0f);
}

TEST(InputJson, SettersKeepJsonInSync)
{
  Boids boids(ReferenceParams());

  boids.setCohesionSensitivity(0.25f);
  boids.setAlignmentDistance(120.0f);

  EXPECT_FLOAT_EQ(boids.cohesionSensitivity(), 0.25f);
  EXPECT_FLOAT_EQ(boids.alignmentDistance(), 120.0f);

  const json js = boids.getInputJson();
  EXPECT_FLOAT_EQ(js["Cohesion"]["Sensitivity"][0].get<float>(), 0.25f);
  EXPECT_FLOAT_EQ(js["Alignment"]["Distance"][0].get<float>(), 120.0f);
}

TEST(InputJson, PatchUpdatesModel)
{
  Boids boids(ReferenceParams());

  json patch = { { "Separation", { { "Distance", { 80.0f, 0.0f, 300.0f } } } } };
  EXPECT_TRUE(boids.updateInputJson(patch));

  EXPECT_FLOAT_EQ(boids.separationDistance(), 80.0f);
  // Untouched values are kept
  EXPECT_FLOAT_EQ(boids.separationSensitivity(), 0.1f);
}

TEST(InputJson, OutOfRangeValuesAreClamped)
{
  Boids boids(ReferenceParams());

  boids.setSeparationSensitivity(5.0f);
  EXPECT_FLOAT_EQ(boids.separationSensitivity(), 1.0f);

  boids.setBoidSize(-3.0f);
  EXPECT_FLOAT_EQ(boids.boidSize(), 1.0f);

  const json js = boids.getInputJson();
  EXPECT_FLOAT_EQ(js["Separation"]["Sensitivity"][0].get<float>(), 1.0f);
}

TEST(InputJson, InvalidPatchIsRejected)
{
  Boids boids(ReferenceParams());
  const json before = boids.getInputJson();

  json patch = { { "Alignment", { { "Distance", "far" } } } };
  EXPECT_FALSE(boids.updateInputJson(patch));

  EXPECT_FLOAT_EQ(boids.alignmentDistance(), 70.0f);
  EXPECT_EQ(boids.getInputJson(), before);
}

TEST(InputJson, InvertedRangeIsRejected)
{
  Boids boids(ReferenceParams());
  const json before = boids.getInputJson();

  json patch = { { "Boid Size", { 15.0f, 50.0f, 1.0f } } };
  EXPECT_FALSE(boids.updateInputJson(patch));

  EXPECT_FLOAT_EQ(boids.boidSize(), 15.0f);
  EXPECT_EQ(boids.getInputJson(), before);
}

TEST(InputJson, MissingSectionIsRejected)
{
  Boids boids(ReferenceParams());

  // merge_patch removes keys set to null
  json patch = { { "Cohesion", nullptr } };
  EXPECT_FALSE(boids.updateInputJson(patch));

  EXPECT_FLOAT_EQ(boids.cohesionDistance(), 100.0f);
  EXPECT_TRUE(boids.getInputJson().contains("Cohesion"));
}

TEST(InputJson, IdenticalJsonIsNoOp)
{
  Boids boids(ReferenceParams());

  EXPECT_TRUE(boids.updateInputJson(boids.getInputJson()));
  EXPECT_FLOAT_EQ(boids.separationSensitivity(), 0.1f);
}
