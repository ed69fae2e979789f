#pragma once

#include "operations/invocation.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace garmin_coach::operations {

enum class OperationId {
  kFetch,
  kCoaching,
};

const char* ToString(OperationId id);

inline constexpr std::string_view kPythonEnvVar = "GARMIN_COACH_PYTHON";
inline constexpr std::string_view kConfigEnvVar = "GARMIN_COACH_CONFIG";

// Where each external operation lives, plus the kind pass-through switch.
//
// The legacy tool never forwarded --data-type/--coaching-type to the scripts.
// That stays the default; `pass_kind` appends the kind to the fetch and
// coaching argument lists, preceded by `kind_flag` when it is non-empty.
struct OperationTable {
  InvocationTarget fetch;
  InvocationTarget coaching;
  bool pass_kind = false;
  std::string kind_flag;

  const InvocationTarget& TargetFor(OperationId id) const {
    return id == OperationId::kFetch ? fetch : coaching;
  }
};

// Built-in targets: the bundled python client scripts run by python3, or by
// the interpreter named in GARMIN_COACH_PYTHON.
OperationTable DefaultOperationTable();

// Overlays the keys present in a JSON config document onto `table`. On error
// `table` may be partially updated; callers discard it.
bool ApplyOperationConfig(std::string_view json_text, OperationTable& table, std::string& error);

bool LoadOperationConfigFile(const std::filesystem::path& path, OperationTable& table,
                             std::string& error);

// GARMIN_COACH_CONFIG when set and non-empty.
std::optional<std::filesystem::path> ConfigPathFromEnvironment();

} // namespace garmin_coach::operations
