#include "operations/testing/scripted_process_runner.hpp"

#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/scoped_env.hpp"
#include "../common/temp_dir.hpp"

#include <iostream>
#include <string>

using garmin_coach::operations::testing::ScriptedProcessRunner;
namespace common = garmin_coach::tests::common;

int main() {
  // Usage errors never spawn anything.
  {
    ScriptedProcessRunner spy({ScriptedProcessRunner::Succeeded("unexpected")});
    const auto unknown = common::DispatchCaptured({"garmin-coach", "sync"}, &spy);
    common::AssertExitCode(unknown.exit_code, 2, "unknown subcommand");
    common::AssertContains(unknown.stderr_text, "error: unknown subcommand: sync");

    const auto bad_flag =
        common::DispatchCaptured({"garmin-coach", "fetch-data", "--kind", "x"}, &spy);
    common::AssertExitCode(bad_flag.exit_code, 2, "unknown flag");
    common::AssertContains(bad_flag.stderr_text, "usage: garmin-coach fetch-data");

    const auto empty = common::DispatchCaptured({"garmin-coach"}, &spy);
    common::AssertExitCode(empty.exit_code, 2, "no subcommand");

    const auto bad_level =
        common::DispatchCaptured({"garmin-coach", "--log-level", "loud", "coaching"}, &spy);
    common::AssertExitCode(bad_level.exit_code, 2, "invalid log level");

    const auto bad_level_inline =
        common::DispatchCaptured({"garmin-coach", "--log-level=loud", "coaching"}, &spy);
    common::AssertExitCode(bad_level_inline.exit_code, 2, "invalid inline log level");
    common::AssertContains(bad_level_inline.stderr_text, "invalid --log-level 'loud'");

    const auto empty_config =
        common::DispatchCaptured({"garmin-coach", "--config=", "coaching"}, &spy);
    common::AssertExitCode(empty_config.exit_code, 2, "empty inline config path");
    common::AssertContains(empty_config.stderr_text, "--config requires a non-empty path");

    common::AssertTrue(spy.run_count() == 0U, "usage errors must not spawn processes");
  }

  // Help and version print to stdout and exit 0 without spawning.
  {
    ScriptedProcessRunner spy({ScriptedProcessRunner::Succeeded("unexpected")});
    const auto help = common::DispatchCaptured({"garmin-coach", "--help"}, &spy);
    common::AssertExitCode(help.exit_code, 0, "help");
    common::AssertContains(help.stdout_text, "fetch-data [--data-type|-d");
    common::AssertContains(help.stdout_text, "example [--example-type|-e <data|ai>]");

    const auto sub_help = common::DispatchCaptured({"garmin-coach", "coaching", "-h"}, &spy);
    common::AssertExitCode(sub_help.exit_code, 0, "subcommand help");
    common::AssertContains(sub_help.stdout_text, "default: activity");

    const auto version = common::DispatchCaptured({"garmin-coach", "version"}, &spy);
    common::AssertExitCode(version.exit_code, 0, "version");
    common::AssertContains(version.stdout_text, "garmin-coach ");

    common::AssertTrue(spy.run_count() == 0U, "help/version must not spawn processes");
  }

  // Success prints the operation output and the success footer.
  {
    ScriptedProcessRunner stub({ScriptedProcessRunner::Succeeded("42 activities\n", "debug")});
    const auto run = common::DispatchCaptured({"garmin-coach", "fetch-data"}, &stub);
    common::AssertExitCode(run.exit_code, 0, "fetch success");
    common::AssertContains(run.stdout_text,
                           "Fetching activities data from Garmin Connect...\n"
                           "\n📊 Fetching Garmin data using Python client...\n\n");
    common::AssertContains(run.stdout_text, "42 activities\n✅ Data fetched successfully!\n");
    common::AssertNotContains(run.stderr_text, "debug");
    common::AssertTrue(stub.targets().size() == 1U &&
                           stub.targets().front().args.back() == "python_client/example.py",
                       "fetch-data must run the fetch operation without the kind");
  }

  // Operation failure shows stderr only and exits 1.
  {
    ScriptedProcessRunner stub({ScriptedProcessRunner::FailedNonZero(1, "boom", "half-done")});
    const auto run =
        common::DispatchCaptured({"garmin-coach", "coaching", "--coaching-type", "plan"}, &stub);
    common::AssertExitCode(run.exit_code, 1, "coaching failure");
    common::AssertContains(run.stdout_text, "Getting plan coaching feedback...");
    common::AssertContains(run.stdout_text, "🤖 Getting AI coaching feedback...");
    common::AssertNotContains(run.stdout_text, "half-done");
    common::AssertContains(run.stderr_text, "❌ Error getting coaching:\nboom\n");
  }

  // Launch failure is distinct from operation failure.
  {
    ScriptedProcessRunner stub({ScriptedProcessRunner::FailedToLaunch("Permission denied")});
    const auto run = common::DispatchCaptured({"garmin-coach", "example", "-e", "ai"}, &stub);
    common::AssertExitCode(run.exit_code, 20, "launch failure");
    common::AssertContains(run.stdout_text, "Running ai example...\n\n🚀 Running ai example...\n");
    common::AssertContains(run.stderr_text, "error: failed to launch '");
    common::AssertContains(run.stderr_text, "Permission denied");
  }

  // Unsupported example type: no spawn, dedicated exit code.
  {
    ScriptedProcessRunner spy({ScriptedProcessRunner::Succeeded("unexpected")});
    const auto run =
        common::DispatchCaptured({"garmin-coach", "example", "--example-type", "bogus"}, &spy);
    common::AssertExitCode(run.exit_code, 11, "unsupported example");
    common::AssertContains(run.stderr_text, "Unknown example type. Use 'data' or 'ai'");
    common::AssertContains(run.stdout_text, "Running bogus example...");
    common::AssertNotContains(run.stdout_text, "🚀");
    common::AssertTrue(spy.run_count() == 0U, "unsupported input must not spawn processes");
  }

  // --pass-kind forwards the kind to the operation.
  {
    ScriptedProcessRunner stub({ScriptedProcessRunner::Succeeded("ok")});
    const auto run = common::DispatchCaptured(
        {"garmin-coach", "--pass-kind", "fetch-data", "--data-type=health"}, &stub);
    common::AssertExitCode(run.exit_code, 0, "pass-kind run");
    common::AssertTrue(stub.targets().front().args.back() == "health",
                       "--pass-kind must append the data type");
  }

  // A broken config file stops the run before anything is spawned.
  {
    ScriptedProcessRunner spy({ScriptedProcessRunner::Succeeded("unexpected")});
    const auto run = common::DispatchCaptured(
        {"garmin-coach", "--config", "/nonexistent/garmin-coach.json", "coaching"}, &spy);
    common::AssertExitCode(run.exit_code, 10, "missing config");
    common::AssertContains(run.stderr_text, "config file not found");
    common::AssertTrue(spy.run_count() == 0U, "config errors must not spawn processes");

    const auto inline_form = common::DispatchCaptured(
        {"garmin-coach", "--config=/nonexistent/garmin-coach.json", "coaching"}, &spy);
    common::AssertExitCode(inline_form.exit_code, 10, "missing config given as --config=");
    common::AssertContains(inline_form.stderr_text,
                           "config file not found: /nonexistent/garmin-coach.json");
    common::AssertTrue(spy.run_count() == 0U, "config errors must not spawn processes");
  }

  // --log-level=<level> is accepted like --log-level <level>.
  {
    ScriptedProcessRunner stub({ScriptedProcessRunner::Succeeded("ok")});
    const auto run =
        common::DispatchCaptured({"garmin-coach", "--log-level=info", "coaching"}, &stub);
    common::AssertExitCode(run.exit_code, 0, "inline log level");
    common::AssertContains(run.stderr_text, "msg=\"launching external operation\"");
  }

  // Configuration precedence: defaults, then GARMIN_COACH_PYTHON, then the
  // config file (--config before GARMIN_COACH_CONFIG), then --pass-kind.
  {
    const auto temp_root = common::CreateUniqueTempDir("garmin-coach-precedence");
    const auto env_config = temp_root / "from-env.json";
    const auto flag_config = temp_root / "from-flag.json";
    common::WriteTextFile(env_config,
                          R"({"operations": {"fetch": {"program": "fetch-from-env"}}})");
    common::WriteTextFile(
        flag_config,
        R"({"operations": {"fetch": {"program": "fetch-from-flag"}}, "pass_kind": false})");

    const common::ScopedEnvOverride python("GARMIN_COACH_PYTHON", "/opt/py/bin/python3");

    {
      const common::ScopedEnvOverride no_config("GARMIN_COACH_CONFIG", nullptr);
      ScriptedProcessRunner stub({ScriptedProcessRunner::Succeeded("ok")});
      const auto run = common::DispatchCaptured({"garmin-coach", "coaching"}, &stub);
      common::AssertExitCode(run.exit_code, 0, "interpreter from environment");
      common::AssertEq(stub.targets().front().program, "/opt/py/bin/python3",
                       "GARMIN_COACH_PYTHON replaces the interpreter");
    }

    const common::ScopedEnvOverride config("GARMIN_COACH_CONFIG", env_config.c_str());
    {
      ScriptedProcessRunner stub({ScriptedProcessRunner::Succeeded("ok")});
      const auto run = common::DispatchCaptured({"garmin-coach", "fetch-data"}, &stub);
      common::AssertExitCode(run.exit_code, 0, "config from environment");
      common::AssertEq(stub.targets().front().program, "fetch-from-env",
                       "GARMIN_COACH_CONFIG is loaded when --config is absent");
    }
    {
      ScriptedProcessRunner stub({ScriptedProcessRunner::Succeeded("ok")});
      const auto run = common::DispatchCaptured(
          {"garmin-coach", "--config", flag_config.string(), "--pass-kind", "fetch-data", "-d",
           "sleep"},
          &stub);
      common::AssertExitCode(run.exit_code, 0, "config from flag");
      common::AssertEq(stub.targets().front().program, "fetch-from-flag",
                       "--config wins over GARMIN_COACH_CONFIG");
      common::AssertEq(stub.targets().front().args.back(), "sleep",
                       "--pass-kind wins over pass_kind=false in the config file");
    }
    {
      ScriptedProcessRunner stub({ScriptedProcessRunner::Succeeded("ok")});
      const auto run = common::DispatchCaptured({"garmin-coach", "coaching"}, &stub);
      common::AssertExitCode(run.exit_code, 0, "partial config");
      common::AssertEq(stub.targets().front().program, "/opt/py/bin/python3",
                       "operations the config file does not name keep the environment interpreter");
    }

    common::RemovePathBestEffort(temp_root);
  }

  std::cout << "cli_contract_smoke: ok\n";
  return 0;
}
