#pragma once

#include "commands/command.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "operations/operation_table.hpp"
#include "operations/process_runner.hpp"

#include <string>

namespace garmin_coach::dispatch {

enum class ResultKind {
  kSuccess,
  kUnsupportedInput,
  kLaunchFailure,
  kOperationFailure,
};

const char* ToString(ResultKind kind);

core::errors::ExitCode ExitCodeFor(ResultKind kind);

// Normalized result handed to the CLI boundary. `text` is the operation's
// stdout for kSuccess, its stderr for kOperationFailure, and a one-line
// diagnostic otherwise. Both streams are passed through byte for byte.
struct UserFacingResult {
  ResultKind kind = ResultKind::kLaunchFailure;
  std::string text;

  bool ok() const {
    return kind == ResultKind::kSuccess;
  }

  bool operator==(const UserFacingResult& other) const = default;
};

// Resolves a command against the operation table, runs the target through the
// injected runner and normalizes the outcome. Holds no state between calls, so
// dispatching the same command against the same runner behavior yields equal
// results.
class Dispatcher {
public:
  Dispatcher(operations::OperationTable table, operations::IProcessRunner& runner,
             core::logging::Logger& logger);

  UserFacingResult Dispatch(const commands::Command& command);

private:
  operations::OperationTable table_;
  operations::IProcessRunner& runner_;
  core::logging::Logger& logger_;
};

} // namespace garmin_coach::dispatch
