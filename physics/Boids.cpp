#include "Boids.hpp"
#include "Geometry.hpp"
#include "Integrators.hpp"
#include "Logging.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <utility>

using namespace Physics;

namespace Physics
{
// Each parameter is stored as { value, min, max }
static const json initJson // clang-format off
{
  { "Boid Size", { 15.0f, 1.0f, 50.0f } },
  { "Separation", {
      { "Distance", { 50.0f, 0.0f, 300.0f } },
      { "Sensitivity", { 0.1f, 0.0f, 1.0f } }
    }
  },
  { "Alignment", {
      { "Distance", { 70.0f, 0.0f, 300.0f } },
      { "Sensitivity", { 0.0f, 0.0f, 1.0f } }
    }
  },
  { "Cohesion", {
      { "Distance", { 100.0f, 0.0f, 300.0f } },
      { "Sensitivity", { 0.0f, 0.0f, 1.0f } }
    }
  }
}; // clang-format on

// Reads a { value, min, max } parameter, out of range values are clamped
static float ReadRangedValue(const std::string& name, json& js)
{
  const float value = js.at(0).get<float>();
  const float minValue = js.at(1).get<float>();
  const float maxValue = js.at(2).get<float>();

  if (minValue > maxValue)
    throw std::invalid_argument(name + " range minimum is above its maximum");

  const float clampedValue = std::clamp(value, minValue, maxValue);
  if (clampedValue != value)
  {
    LOG_INFO("{} {} out of range [{}, {}], clamped to {}", name, value, minValue, maxValue, clampedValue);
    js.at(0) = clampedValue;
  }

  return clampedValue;
}
}

Boids::Boids(ModelParams params)
    : Model(params, json(initJson))
    , m_boidSize(0.0f)
    , m_nbTicks(0)
{
  if (m_worldSize.width <= 0.0f || m_worldSize.height <= 0.0f)
  {
    LOG_ERROR("Cannot create boids inside a world of size {}x{}", m_worldSize.width, m_worldSize.height);
    return;
  }

  if (!updateModelWithInputJson())
  {
    LOG_ERROR("Cannot create boids with default parameters");
    return;
  }

  m_init = true;

  reset();
}

bool Boids::updateModelWithInputJson()
{
  float boidSize = 0.0f;
  RuleParams separation, alignment, cohesion;

  // Values are read in full before being applied, a broken json changes nothing
  try
  {
    boidSize = ReadRangedValue("Boid Size", m_inputJson.at("Boid Size"));

    auto& separationJson = m_inputJson.at("Separation");
    separation.distance = ReadRangedValue("Separation Distance", separationJson.at("Distance"));
    separation.sensitivity = ReadRangedValue("Separation Sensitivity", separationJson.at("Sensitivity"));

    auto& alignmentJson = m_inputJson.at("Alignment");
    alignment.distance = ReadRangedValue("Alignment Distance", alignmentJson.at("Distance"));
    alignment.sensitivity = ReadRangedValue("Alignment Sensitivity", alignmentJson.at("Sensitivity"));

    auto& cohesionJson = m_inputJson.at("Cohesion");
    cohesion.distance = ReadRangedValue("Cohesion Distance", cohesionJson.at("Distance"));
    cohesion.sensitivity = ReadRangedValue("Cohesion Sensitivity", cohesionJson.at("Sensitivity"));
  }
  catch (const json::exception& e)
  {
    LOG_ERROR("Invalid boids parameters: {}", e.what());
    return false;
  }
  catch (const std::invalid_argument& e)
  {
    LOG_ERROR("Invalid boids parameters: {}", e.what());
    return false;
  }

  m_boidSize = boidSize;
  m_separation = separation;
  m_alignment = alignment;
  m_cohesion = cohesion;

  createRules();

  LOG_INFO("Boid size {}, separation {}/{}, alignment {}/{}, cohesion {}/{}",
      Utils::FloatToStr(m_boidSize),
      Utils::FloatToStr(m_separation.distance), Utils::FloatToStr(m_separation.sensitivity),
      Utils::FloatToStr(m_alignment.distance), Utils::FloatToStr(m_alignment.sensitivity),
      Utils::FloatToStr(m_cohesion.distance), Utils::FloatToStr(m_cohesion.sensitivity));

  return true;
}

void Boids::createRules()
{
  m_rules.clear();
  m_rules.push_back(std::make_unique<SeparationRule>(m_boidSize, m_separation));
  m_rules.push_back(std::make_unique<AlignmentRule>(m_boidSize, m_alignment));
  m_rules.push_back(std::make_unique<CohesionRule>(m_boidSize, m_cohesion));
  // Edges are kept at separation distance, with separation sensitivity
  m_rules.push_back(std::make_unique<BoundaryAvoidanceRule>(m_worldSize, m_separation));
}

void Boids::setInputValue(const std::string& section, const std::string& name, float value)
{
  json newJson = m_inputJson;

  if (section.empty())
    newJson.at(name).at(0) = value;
  else
    newJson.at(section).at(name).at(0) = value;

  updateInputJson(newJson);
}

void Boids::setBoidSize(float boidSize)
{
  setInputValue("", "Boid Size", boidSize);
}

void Boids::setSeparationDistance(float distance)
{
  setInputValue("Separation", "Distance", distance);
}

void Boids::setSeparationSensitivity(float sensitivity)
{
  setInputValue("Separation", "Sensitivity", sensitivity);
}

void Boids::setAlignmentDistance(float distance)
{
  setInputValue("Alignment", "Distance", distance);
}

void Boids::setAlignmentSensitivity(float sensitivity)
{
  setInputValue("Alignment", "Sensitivity", sensitivity);
}

void Boids::setCohesionDistance(float distance)
{
  setInputValue("Cohesion", "Distance", distance);
}

void Boids::setCohesionSensitivity(float sensitivity)
{
  setInputValue("Cohesion", "Sensitivity", sensitivity);
}

void Boids::reset()
{
  if (!m_init)
    return;

  std::mt19937 generator(m_seed);

  const auto positions = Geometry::GenerateRandomPositions(m_worldSize, m_nbParticles, generator);
  const auto headings = Geometry::GenerateRandomAngles(m_nbParticles, generator);

  std::vector<Agent> boids(m_nbParticles);
  for (size_t i = 0; i < boids.size(); ++i)
  {
    boids[i].id = i;
    boids[i].position = positions[i];
    boids[i].heading = headings[i];
  }

  m_store.reset(std::move(boids));
  m_nbTicks = 0;

  updateSnapshot();

  LOG_INFO("{} boids created inside a {}x{} world, seed {}", m_nbParticles, m_worldSize.width, m_worldSize.height, m_seed);
}

bool Boids::resetWithAgents(std::vector<Agent> agents)
{
  if (!m_init)
    return false;

  if (!m_store.reset(std::move(agents)))
    return false;

  m_nbParticles = m_store.size();
  m_nbTicks = 0;

  updateSnapshot();

  return true;
}

void Boids::update()
{
  if (!m_init || m_pause)
    return;

  for (const auto& rule : m_rules)
  {
    const size_t nbUpdated = rule->apply(m_store);
    LOG_DEBUG("{} updated {} boids", rule->name(), nbUpdated);
  }

  UpdateVelocities(m_store, m_velocity);
  UpdatePositions(m_store);

  ++m_nbTicks;

  updateSnapshot();
}

void Boids::updateSnapshot()
{
  m_snapshot.clear();
  m_snapshot.reserve(m_store.size());

  for (const auto& boid : m_store.agents())
  {
    m_snapshot.push_back({ boid.id, boid.position, boid.heading });
  }
}
