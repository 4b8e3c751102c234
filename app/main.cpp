#include "FlockApp.hpp"
#include "Logging.hpp"
#include "RunnerConfig.hpp"

#include <csignal>
#include <string>

namespace
{
void onInterrupt(int)
{
  App::FlockApp::requestStop();
}
}

int main(int argc, char** argv)
{
  Utils::InitializeLogger();

  App::RunnerConfig config = App::DefaultRunnerConfig();

  for (int i = 1; i < argc; ++i)
  {
    const std::string arg(argv[i]);
    if (arg == "--config" && i + 1 < argc)
    {
      if (!App::LoadRunnerConfig(argv[++i], config))
        return 1;
    }
    else
    {
      LOG_ERROR("Unknown argument {}, usage: {} [--config <file.json>]", arg, argv[0]);
      return 1;
    }
  }

  std::signal(SIGINT, onInterrupt);

  App::FlockApp app(config);

  if (!app.isInit())
    return 1;

  app.run();

  return 0;
}
