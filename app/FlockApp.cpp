#include "FlockApp.hpp"

#include "Logging.hpp"
#include "Utils.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace App
{
namespace
{
std::atomic<bool> s_stopRequested(false);
}

void FlockApp::requestStop()
{
  s_stopRequested = true;
}

FlockApp::FlockApp(RunnerConfig config)
    : m_nameApp("BoidsFlock " + Utils::GetVersions())
    , m_config(config)
    , m_nbTicksRun(0)
    , m_init(false)
{
  if (!initPhysicsEngine())
  {
    LOG_ERROR("Failed to initialize physics engine");
    return;
  }

  LOG_INFO("{} correctly initialized", m_nameApp);

  m_init = true;
}

bool FlockApp::initPhysicsEngine()
{
  m_physicsEngine = Physics::CreateModel(Physics::ModelType::BOIDS, m_config.modelParams);

  if (!m_physicsEngine || !m_physicsEngine->isInit())
    return false;

  if (!m_config.boidsJson.empty() && !m_physicsEngine->updateInputJson(m_config.boidsJson))
  {
    LOG_ERROR("Failed to apply boids parameters from configuration");
    return false;
  }

  return true;
}

void FlockApp::syncPresentation() const
{
  const auto* boids = dynamic_cast<const Physics::Boids*>(m_physicsEngine.get());

  if (!boids || boids->snapshot().empty())
    return;

  Math::float2 center(0.0f, 0.0f);
  for (const auto& boid : boids->snapshot())
    center += boid.position;

  const float nbBoids = static_cast<float>(boids->snapshot().size());

  LOG_DEBUG("Tick {}: {} boids centered on ({}, {})", boids->nbTicks(), boids->snapshot().size(),
      Utils::FloatToStr(center.x / nbBoids), Utils::FloatToStr(center.y / nbBoids));
}

void FlockApp::run()
{
  if (!m_init)
    return;

  // A stop request only ends the run it was made during
  s_stopRequested = false;
  m_nbTicksRun = 0;

  const auto tickDelay = std::chrono::milliseconds(m_config.tickDelayMs);

  while (!s_stopRequested && (m_config.nbTicks == 0 || m_nbTicksRun < m_config.nbTicks))
  {
    m_physicsEngine->update();
    ++m_nbTicksRun;

    syncPresentation();

    // Computation time is not deducted, the pace drifts with the flock size
    std::this_thread::sleep_for(tickDelay);
  }

  LOG_INFO("Stopped after {} ticks", m_nbTicksRun.load());
}

} // End namespace App
