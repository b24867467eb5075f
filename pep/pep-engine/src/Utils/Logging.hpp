// Ticket: 0005_problem_orchestrator

#ifndef PEP_ENGINE_UTILS_LOGGING_HPP
#define PEP_ENGINE_UTILS_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pep_engine
{

/// Name of the logger a Problem uses when none is injected
inline constexpr const char* kDefaultLoggerName = "pep";

/**
 * @brief Fetch or create the named colour stdout logger
 *
 * Reuses a logger already registered under `name`. Creation failures are
 * reported on stderr and fall back to spdlog's default logger.
 */
std::shared_ptr<spdlog::logger> makeLogger(
  const std::string& name = kDefaultLoggerName);

/// 0 -> warn, 1 -> info, 2 and above -> debug
[[nodiscard]] spdlog::level::level_enum levelForVerbosity(int verbosity);

/**
 * @brief Sets a logger's level for one scope and restores the previous level
 *
 * The logger may be shared with the caller, so a solve must not leave its
 * verbosity behind.
 */
class ScopedLogLevel
{
public:
  ScopedLogLevel(std::shared_ptr<spdlog::logger> logger,
                 spdlog::level::level_enum level);
  ~ScopedLogLevel();

  ScopedLogLevel(const ScopedLogLevel&) = delete;
  ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;
  ScopedLogLevel(ScopedLogLevel&&) = delete;
  ScopedLogLevel& operator=(ScopedLogLevel&&) = delete;

private:
  std::shared_ptr<spdlog::logger> logger_;
  spdlog::level::level_enum previous_;
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_UTILS_LOGGING_HPP
