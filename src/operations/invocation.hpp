#pragma once

#include <optional>
#include <string>
#include <vector>

namespace garmin_coach::operations {

// Resolved external operation: the program (bare name looked up on PATH, or a
// path) and its ordered arguments, not including argv[0].
struct InvocationTarget {
  std::string program;
  std::vector<std::string> args;

  bool operator==(const InvocationTarget& other) const = default;
};

enum class InvocationStatus {
  kSucceeded,
  kFailedNonZero,
  kFailedToLaunch,
};

const char* ToString(InvocationStatus status);

// Raw result of running one InvocationTarget. When status is kFailedToLaunch
// only `launch_error` is meaningful; the captured streams are empty.
struct InvocationOutcome {
  InvocationStatus status = InvocationStatus::kFailedToLaunch;
  int exit_code = -1;
  std::optional<int> term_signal;
  std::string stdout_text;
  std::string stderr_text;
  std::string launch_error;

  bool operator==(const InvocationOutcome& other) const = default;
};

// Printable single-line form, e.g. `python3 python_client/example.py`.
std::string DescribeTarget(const InvocationTarget& target);

} // namespace garmin_coach::operations
