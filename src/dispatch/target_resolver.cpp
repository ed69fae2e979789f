#include "dispatch/target_resolver.hpp"

namespace garmin_coach::dispatch {

namespace {

Resolution Resolved(operations::OperationId id, const operations::OperationTable& table) {
  Resolution resolution;
  resolution.resolved = true;
  resolution.operation = id;
  resolution.target = table.TargetFor(id);
  return resolution;
}

void AppendKind(const operations::OperationTable& table, const std::string& kind,
                operations::InvocationTarget& target) {
  if (!table.pass_kind) {
    return;
  }
  if (!table.kind_flag.empty()) {
    target.args.push_back(table.kind_flag);
  }
  target.args.push_back(kind);
}

} // namespace

Resolution ResolveTarget(const commands::Command& command,
                         const operations::OperationTable& table) {
  switch (command.type()) {
  case commands::CommandType::kFetchData: {
    Resolution resolution = Resolved(operations::OperationId::kFetch, table);
    AppendKind(table, command.kind(), resolution.target);
    return resolution;
  }
  case commands::CommandType::kCoaching: {
    Resolution resolution = Resolved(operations::OperationId::kCoaching, table);
    AppendKind(table, command.kind(), resolution.target);
    return resolution;
  }
  case commands::CommandType::kExample:
    // The example kind picks the operation; it is never forwarded.
    if (command.kind() == kExampleData) {
      return Resolved(operations::OperationId::kFetch, table);
    }
    if (command.kind() == kExampleAi) {
      return Resolved(operations::OperationId::kCoaching, table);
    }
    break;
  }

  Resolution unsupported;
  unsupported.unsupported_reason = "unsupported example type '" + command.kind() +
                                   "' (expected " + std::string(kExampleData) + "|" +
                                   std::string(kExampleAi) + ")";
  return unsupported;
}

} // namespace garmin_coach::dispatch
