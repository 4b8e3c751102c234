#include "RunnerConfig.hpp"
#include "Logging.hpp"

#include <fstream>
#include <limits>

namespace App
{
RunnerConfig DefaultRunnerConfig()
{
  RunnerConfig config;
  config.modelParams.nbParticles = Utils::NB_BOIDS;
  config.modelParams.worldSize = { Utils::WORLD_WIDTH, Utils::WORLD_HEIGHT };
  config.modelParams.velocity = Utils::BOID_SPEED;
  config.modelParams.seed = 0;
  return config;
}

bool ParseRunnerConfig(const json& js, RunnerConfig& config)
{
  if (!js.is_object())
  {
    LOG_ERROR("Runner configuration must be a json object");
    return false;
  }

  RunnerConfig newConfig = config;

  try
  {
    if (js.contains("Population"))
    {
      const json& populationJson = js.at("Population");
      if (!populationJson.is_number_integer())
      {
        LOG_ERROR("Population must be an integer, got {}", populationJson.dump());
        return false;
      }

      const long long population = populationJson.get<long long>();
      if (population < 0 || population > std::numeric_limits<int>::max())
      {
        LOG_ERROR("Population out of range, got {}", population);
        return false;
      }
      newConfig.modelParams.nbParticles = static_cast<size_t>(population);
    }

    if (js.contains("World Width"))
      newConfig.modelParams.worldSize.width = js.at("World Width").get<float>();

    if (js.contains("World Height"))
      newConfig.modelParams.worldSize.height = js.at("World Height").get<float>();

    if (js.contains("Speed"))
      newConfig.modelParams.velocity = js.at("Speed").get<float>();

    if (js.contains("Seed"))
    {
      const json& seedJson = js.at("Seed");
      if (!seedJson.is_number_integer())
      {
        LOG_ERROR("Seed must be an integer, got {}", seedJson.dump());
        return false;
      }

      const bool isValidSeed = seedJson.is_number_unsigned()
          ? seedJson.get<unsigned long long>() <= std::numeric_limits<unsigned int>::max()
          : seedJson.get<long long>() >= 0 && seedJson.get<long long>() <= std::numeric_limits<unsigned int>::max();
      if (!isValidSeed)
      {
        LOG_ERROR("Seed out of range, got {}", seedJson.dump());
        return false;
      }
      newConfig.modelParams.seed = seedJson.get<unsigned int>();
    }

    if (js.contains("Ticks"))
    {
      const json& ticksJson = js.at("Ticks");
      if (!ticksJson.is_number_integer())
      {
        LOG_ERROR("Number of ticks must be an integer, got {}", ticksJson.dump());
        return false;
      }

      const long long ticks = ticksJson.get<long long>();
      if (ticks < 0)
      {
        LOG_ERROR("Number of ticks cannot be negative, got {}", ticks);
        return false;
      }
      newConfig.nbTicks = static_cast<size_t>(ticks);
    }

    if (js.contains("Tick Delay Ms"))
      newConfig.tickDelayMs = js.at("Tick Delay Ms").get<int>();

    if (js.contains("Boids"))
      newConfig.boidsJson = js.at("Boids");
  }
  catch (const json::exception& e)
  {
    LOG_ERROR("Invalid runner configuration: {}", e.what());
    return false;
  }

  if (newConfig.modelParams.worldSize.width <= 0.0f || newConfig.modelParams.worldSize.height <= 0.0f)
  {
    LOG_ERROR("World size must be positive, got {}x{}", newConfig.modelParams.worldSize.width, newConfig.modelParams.worldSize.height);
    return false;
  }

  if (newConfig.tickDelayMs < 0)
  {
    LOG_ERROR("Tick delay cannot be negative, got {} ms", newConfig.tickDelayMs);
    return false;
  }

  config = newConfig;
  return true;
}

bool LoadRunnerConfig(const std::string& filePath, RunnerConfig& config)
{
  std::ifstream file(filePath);
  if (!file.is_open())
  {
    LOG_ERROR("Cannot open configuration file {}", filePath);
    return false;
  }

  json js = json::parse(file, nullptr, false);
  if (js.is_discarded())
  {
    LOG_ERROR("Configuration file {} is not valid json", filePath);
    return false;
  }

  LOG_INFO("Configuration loaded from {}", filePath);

  return ParseRunnerConfig(js, config);
}
}
