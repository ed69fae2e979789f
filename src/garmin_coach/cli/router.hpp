#pragma once

#include "core/logging/logger.hpp"
#include "operations/process_runner.hpp"

#include <filesystem>
#include <optional>

namespace garmin_coach::cli {

// Options accepted before the subcommand name.
struct GlobalOptions {
  std::optional<std::filesystem::path> config_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kWarn;
  bool pass_kind = false;
};

// Routes `garmin-coach` subcommands and returns the process exit code:
//   0  => the external operation succeeded
//   1  => the external operation ran and failed
//   2  => usage error (unknown subcommand / invalid flags)
//   10 => config file missing or invalid
//   11 => recognized but unsupported input (example type)
//   20 => the external operation could not be started
int Dispatch(int argc, char** argv);

// Same contract with an injected runner, so callers can observe or stub the
// external operations.
int Dispatch(int argc, char** argv, operations::IProcessRunner& runner);

} // namespace garmin_coach::cli
