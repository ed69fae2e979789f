#include "operations/invocation.hpp"

#include <string>

namespace garmin_coach::operations {

const char* ToString(InvocationStatus status) {
  switch (status) {
  case InvocationStatus::kSucceeded:
    return "succeeded";
  case InvocationStatus::kFailedNonZero:
    return "failed_nonzero";
  case InvocationStatus::kFailedToLaunch:
    return "failed_to_launch";
  }
  return "failed_to_launch";
}

std::string DescribeTarget(const InvocationTarget& target) {
  std::string text = target.program;
  for (const auto& arg : target.args) {
    text.push_back(' ');
    if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
      text += '\'' + arg + '\'';
    } else {
      text += arg;
    }
  }
  return text;
}

} // namespace garmin_coach::operations
