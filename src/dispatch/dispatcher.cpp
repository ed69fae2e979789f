#include "dispatch/dispatcher.hpp"

#include "dispatch/target_resolver.hpp"

#include <string>
#include <utility>

namespace garmin_coach::dispatch {

namespace {

UserFacingResult Normalize(const operations::InvocationTarget& target,
                           const operations::InvocationOutcome& outcome) {
  switch (outcome.status) {
  case operations::InvocationStatus::kSucceeded:
    return {ResultKind::kSuccess, outcome.stdout_text};
  case operations::InvocationStatus::kFailedNonZero:
    return {ResultKind::kOperationFailure, outcome.stderr_text};
  case operations::InvocationStatus::kFailedToLaunch:
    break;
  }
  return {ResultKind::kLaunchFailure,
          "failed to launch '" + target.program + "': " + outcome.launch_error};
}

} // namespace

const char* ToString(ResultKind kind) {
  switch (kind) {
  case ResultKind::kSuccess:
    return "success";
  case ResultKind::kUnsupportedInput:
    return "unsupported_input";
  case ResultKind::kLaunchFailure:
    return "launch_failure";
  case ResultKind::kOperationFailure:
    return "operation_failure";
  }
  return "launch_failure";
}

core::errors::ExitCode ExitCodeFor(ResultKind kind) {
  switch (kind) {
  case ResultKind::kSuccess:
    return core::errors::ExitCode::kSuccess;
  case ResultKind::kUnsupportedInput:
    return core::errors::ExitCode::kUnsupportedInput;
  case ResultKind::kLaunchFailure:
    return core::errors::ExitCode::kLaunchFailed;
  case ResultKind::kOperationFailure:
    return core::errors::ExitCode::kOperationFailed;
  }
  return core::errors::ExitCode::kOperationFailed;
}

Dispatcher::Dispatcher(operations::OperationTable table, operations::IProcessRunner& runner,
                       core::logging::Logger& logger)
    : table_(std::move(table)), runner_(runner), logger_(logger) {}

UserFacingResult Dispatcher::Dispatch(const commands::Command& command) {
  const Resolution resolution = ResolveTarget(command, table_);
  if (!resolution.resolved) {
    logger_.Warn("command rejected before launch",
                 {{"command", commands::ToString(command.type())},
                  {"kind", command.kind()},
                  {"reason", resolution.unsupported_reason}});
    return {ResultKind::kUnsupportedInput, resolution.unsupported_reason};
  }

  const std::string described = operations::DescribeTarget(resolution.target);
  logger_.Debug("command resolved", {{"command", commands::ToString(command.type())},
                                     {"kind", command.kind()},
                                     {"operation", operations::ToString(resolution.operation)},
                                     {"target", described}});
  logger_.Info("launching external operation",
               {{"operation", operations::ToString(resolution.operation)},
                {"target", described}});

  const operations::InvocationOutcome outcome = runner_.Run(resolution.target);
  UserFacingResult result = Normalize(resolution.target, outcome);

  const std::string exit_code = std::to_string(outcome.exit_code);
  switch (result.kind) {
  case ResultKind::kSuccess:
    logger_.Info("external operation succeeded",
                 {{"operation", operations::ToString(resolution.operation)},
                  {"stdout_bytes", std::to_string(outcome.stdout_text.size())}});
    break;
  case ResultKind::kOperationFailure:
    logger_.Warn("external operation failed",
                 {{"operation", operations::ToString(resolution.operation)},
                  {"exit_code", exit_code},
                  {"signal", outcome.term_signal ? std::to_string(*outcome.term_signal) : "-"},
                  {"stdout_discarded_bytes", std::to_string(outcome.stdout_text.size())}});
    break;
  case ResultKind::kLaunchFailure:
    logger_.Warn("external operation did not start",
                 {{"operation", operations::ToString(resolution.operation)},
                  {"target", described},
                  {"cause", outcome.launch_error}});
    break;
  case ResultKind::kUnsupportedInput:
    break;
  }
  return result;
}

} // namespace garmin_coach::dispatch
