#pragma once

#include "operations/invocation.hpp"

namespace garmin_coach::operations {

// Seam between the dispatcher and the operating system. Implementations run
// one target to completion and report what happened; they never interpret the
// captured output.
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  // Blocks until the target has exited (or failed to start).
  virtual InvocationOutcome Run(const InvocationTarget& target) = 0;
};

} // namespace garmin_coach::operations
