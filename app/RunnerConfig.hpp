#pragma once

#include "Model.hpp"
#include "Parameters.hpp"

#include <string>

namespace App
{
struct RunnerConfig
{
  Physics::ModelParams modelParams;
  // Number of ticks to run, 0 runs until interrupted
  size_t nbTicks = 0;
  // Pause between two ticks
  int tickDelayMs = Utils::TICK_DELAY_MS;
  // Patch applied to the model input json
  json boidsJson = json::object();
};

RunnerConfig DefaultRunnerConfig();

// Overrides the fields of config present in js. config is left untouched on failure.
bool ParseRunnerConfig(const json& js, RunnerConfig& config);

bool LoadRunnerConfig(const std::string& filePath, RunnerConfig& config);
}
