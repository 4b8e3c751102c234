#pragma once

#include "Geometry.hpp"

#include <nlohmann/json.hpp>

#include <memory>

using json = nlohmann::json;

namespace Physics
{
// List of supported physical models
enum ModelType
{
  BOIDS = 0
};

// Setup-time parameters, fixed for the whole run
struct ModelParams
{
  size_t nbParticles = 0;
  Geometry::WorldSize2D worldSize = { 0.0f, 0.0f };
  // Distance travelled by each particle during one tick
  float velocity = 0.0f;
  // Seed of the random source used to place the particles
  unsigned int seed = 0;
};

// Models Factory
class Model;
std::unique_ptr<Model> CreateModel(ModelType type, ModelParams params);

// Abstract class defining physical model foundations to implement
class Model
{
  public:
  Model(ModelParams params, json js = {})
      : m_init(false)
      , m_pause(false)
      , m_nbParticles(params.nbParticles)
      , m_worldSize(params.worldSize)
      , m_velocity(params.velocity)
      , m_seed(params.seed)
      , m_inputJson(js) {};

  virtual ~Model() {};

  size_t nbParticles() const { return m_nbParticles; }

  Geometry::WorldSize2D worldSize() const { return m_worldSize; }

  virtual void update() = 0;
  virtual void reset() = 0;

  bool isInit() const { return m_init; }

  void pause(bool pause) { m_pause = pause; }
  bool onPause() const { return m_pause; }

  virtual void setVelocity(float velocity) { m_velocity = velocity; }
  float velocity() const { return m_velocity; }

  unsigned int seed() const { return m_seed; }

  json getInputJson() const
  {
    return m_inputJson;
  }

  // Merges the given json into the current model parameters.
  // Rejected modifications leave the model and its input json untouched.
  bool updateInputJson(const json& newJson);

  virtual bool updateModelWithInputJson() { return true; };

  protected:
  bool m_init;
  bool m_pause;

  size_t m_nbParticles;

  Geometry::WorldSize2D m_worldSize;

  float m_velocity;

  unsigned int m_seed;

  // Container for model parameters available to the outside world
  json m_inputJson;
};
}
