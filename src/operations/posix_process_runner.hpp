#pragma once

#include "core/logging/logger.hpp"
#include "operations/process_runner.hpp"

#include <string_view>

namespace garmin_coach::operations {

// Fills status, exit_code and term_signal from a waitpid() status word. A
// non-empty `capture_error` means the streams are incomplete: the run is then
// failed regardless of exit status and the error is appended to stderr_text.
void ClassifyChildExit(int raw_status, std::string_view capture_error,
                       InvocationOutcome& outcome);

// Runs targets as child processes via posix_spawnp. stdout and stderr are
// captured through separate pipes; stdin and the environment are inherited.
class PosixProcessRunner final : public IProcessRunner {
public:
  explicit PosixProcessRunner(core::logging::Logger* logger = nullptr);

  InvocationOutcome Run(const InvocationTarget& target) override;

private:
  core::logging::Logger* logger_ = nullptr;
};

} // namespace garmin_coach::operations
