#pragma once

#include "commands/command.hpp"
#include "operations/operation_table.hpp"

#include <string>
#include <string_view>

namespace garmin_coach::dispatch {

// Outcome of mapping a Command onto the operation table. `target` and
// `operation` are only meaningful when `resolved` is true; otherwise
// `unsupported_reason` says which input was recognized but not accepted.
struct Resolution {
  bool resolved = false;
  operations::OperationId operation = operations::OperationId::kFetch;
  operations::InvocationTarget target;
  std::string unsupported_reason;
};

// Example kinds with a target. Anything else is unsupported input.
inline constexpr std::string_view kExampleData = "data";
inline constexpr std::string_view kExampleAi = "ai";

Resolution ResolveTarget(const commands::Command& command, const operations::OperationTable& table);

} // namespace garmin_coach::dispatch
