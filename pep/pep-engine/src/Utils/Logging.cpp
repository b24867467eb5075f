// Ticket: 0005_problem_orchestrator

#include "pep-engine/src/Utils/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <utility>

namespace pep_engine
{

std::shared_ptr<spdlog::logger> makeLogger(const std::string& name)
{
  if (auto existing = spdlog::get(name))
  {
    return existing;
  }

  try
  {
    auto logger = spdlog::stdout_color_mt(name);
    logger->set_level(spdlog::level::info);
    return logger;
  }
  catch (const spdlog::spdlog_ex& e)
  {
    std::cerr << "Logger initialization failed: " << e.what() << std::endl;
    return spdlog::default_logger();
  }
}

spdlog::level::level_enum levelForVerbosity(int verbosity)
{
  if (verbosity <= 0)
  {
    return spdlog::level::warn;
  }
  if (verbosity == 1)
  {
    return spdlog::level::info;
  }
  return spdlog::level::debug;
}

ScopedLogLevel::ScopedLogLevel(std::shared_ptr<spdlog::logger> logger,
                               spdlog::level::level_enum level)
  : logger_{std::move(logger)}, previous_{logger_->level()}
{
  logger_->set_level(level);
}

ScopedLogLevel::~ScopedLogLevel()
{
  logger_->set_level(previous_);
}

}  // namespace pep_engine
