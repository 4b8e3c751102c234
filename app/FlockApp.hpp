#pragma once

#include "Boids.hpp"
#include "RunnerConfig.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace App
{
// Headless harness driving the flock at a fixed pace
class FlockApp
{
  public:
  FlockApp(RunnerConfig config);
  ~FlockApp() = default;
  void run();
  bool isInit() const { return m_init; }

  // Ticks committed by the current or last run, readable from another thread
  size_t nbTicksRun() const { return m_nbTicksRun; }

  // Asks the running loop to stop once the current tick is committed
  static void requestStop();

  private:
  bool initPhysicsEngine();
  void syncPresentation() const;

  std::unique_ptr<Physics::Model> m_physicsEngine;

  std::string m_nameApp;

  RunnerConfig m_config;

  std::atomic<size_t> m_nbTicksRun;

  bool m_init;
};
}
