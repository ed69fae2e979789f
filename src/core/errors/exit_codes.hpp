#pragma once

namespace garmin_coach::core::errors {

// Process-exit contract for wrappers and CI scripts.
//
// 0/1/2 keep their conventional meanings (success, the operation failed,
// usage error). The remaining values separate failures that happen before
// an external operation ever runs, so callers never have to scrape stderr to
// tell "could not start" from "ran and failed".
enum class ExitCode : int {
  kSuccess = 0,
  kOperationFailed = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kUnsupportedInput = 11,
  kLaunchFailed = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace garmin_coach::core::errors
