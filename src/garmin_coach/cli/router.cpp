#include "garmin_coach/cli/router.hpp"

#include "commands/command.hpp"
#include "core/errors/exit_codes.hpp"
#include "dispatch/dispatcher.hpp"
#include "dispatch/target_resolver.hpp"
#include "operations/operation_table.hpp"
#include "operations/posix_process_runner.hpp"

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace garmin_coach::cli {

namespace {

constexpr std::string_view kProgramName = "garmin-coach";
constexpr std::string_view kVersion = "0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);

// Console text for one subcommand. `%s` in `start` and `launch` is replaced
// by the kind. `launch` is printed only once the command resolved to an
// operation.
struct Presentation {
  std::string_view start;
  std::string_view launch;
  std::string_view success_footer;
  std::string_view failure_header;
};

Presentation PresentationFor(commands::CommandType type) {
  switch (type) {
  case commands::CommandType::kFetchData:
    return {"Fetching %s data from Garmin Connect...",
            "📊 Fetching Garmin data using Python client...", "✅ Data fetched successfully!",
            "❌ Error fetching data:"};
  case commands::CommandType::kCoaching:
    return {"Getting %s coaching feedback...", "🤖 Getting AI coaching feedback...",
            "✅ Coaching feedback received!", "❌ Error getting coaching:"};
  case commands::CommandType::kExample:
    return {"Running %s example...", "🚀 Running %s example...", "",
            "❌ Error running example:"};
  }
  return {"Running %s...", "", "", "❌ Error:"};
}

std::string FormatBanner(std::string_view pattern, std::string_view kind) {
  std::string text(pattern);
  const std::size_t pos = text.find("%s");
  if (pos != std::string::npos) {
    text.replace(pos, 2, kind);
  }
  return text;
}

// Writes captured operation text unchanged, adding a trailing newline only
// when the operation did not end with one.
void WriteBlock(std::ostream& out, std::string_view text) {
  out << text;
  if (!text.empty() && text.back() != '\n') {
    out << '\n';
  }
}

// One usage source keeps help and error paths identical.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  " << kProgramName
      << " [--config <file.json>] [--log-level <" << core::logging::ExpectedLogLevelList()
      << ">] [--pass-kind] <subcommand> [options]\n\n"
      << "subcommands:\n";
  for (const auto& spec : commands::Subcommands()) {
    out << "  " << spec.name << " [--" << spec.long_flag << "|-" << spec.short_flag << " <"
        << spec.value_hint << ">]  " << spec.summary << " (default: " << spec.default_kind
        << ")\n";
  }
  out << "  version\n"
      << "  help\n";
}

void PrintSubcommandUsage(std::ostream& out, const commands::SubcommandSpec& spec) {
  out << "usage: " << kProgramName << ' ' << spec.name << " [--" << spec.long_flag << "|-"
      << spec.short_flag << " <" << spec.value_hint << ">]\n"
      << "  " << spec.summary << '\n'
      << "  --" << spec.long_flag << ", -" << spec.short_flag << "  default: "
      << spec.default_kind << '\n';
}

bool IsHelpToken(std::string_view token) {
  return token == "--help" || token == "-h";
}

// Consumes leading global options from `args`, leaving `next` at the first
// token that belongs to the subcommand. Valued options accept both
// `--name value` and `--name=value`.
bool ParseGlobalOptions(const std::vector<std::string_view>& args, GlobalOptions& options,
                        std::size_t& next, std::string& error) {
  next = 0;
  while (next < args.size()) {
    const std::string_view token = args[next];
    if (token == "--pass-kind") {
      options.pass_kind = true;
      ++next;
      continue;
    }

    const std::size_t equals = token.find('=');
    const std::string_view name = token.substr(0, equals);
    if (name == "--config" || name == "--log-level") {
      std::string_view value;
      if (equals != std::string_view::npos) {
        value = token.substr(equals + 1U);
        next += 1U;
      } else if (next + 1U < args.size()) {
        value = args[next + 1U];
        next += 2U;
      } else {
        error = "missing value for " + std::string(name);
        return false;
      }

      if (name == "--config") {
        if (value.empty()) {
          error = "--config requires a non-empty path";
          return false;
        }
        options.config_path = fs::path(value);
      } else if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (!IsHelpToken(token) && token.size() > 1U && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    break;
  }
  return true;
}

// Builds the operation table from defaults, then the config file (explicit
// path first, environment second), then command-line overrides.
bool BuildOperationTable(const GlobalOptions& options, operations::OperationTable& table,
                         core::logging::Logger& logger, std::string& error) {
  table = operations::DefaultOperationTable();

  std::optional<fs::path> config_path = options.config_path;
  if (!config_path.has_value()) {
    config_path = operations::ConfigPathFromEnvironment();
  }
  if (config_path.has_value()) {
    if (!operations::LoadOperationConfigFile(*config_path, table, error)) {
      return false;
    }
    logger.Debug("operation config loaded", {{"path", config_path->string()}});
  }

  if (options.pass_kind) {
    table.pass_kind = true;
  }
  return true;
}

void Present(const commands::Command& command, const dispatch::UserFacingResult& result) {
  const Presentation presentation = PresentationFor(command.type());
  switch (result.kind) {
  case dispatch::ResultKind::kSuccess:
    WriteBlock(std::cout, result.text);
    if (!presentation.success_footer.empty()) {
      std::cout << presentation.success_footer << '\n';
    }
    break;
  case dispatch::ResultKind::kOperationFailure:
    std::cerr << presentation.failure_header << '\n';
    WriteBlock(std::cerr, result.text);
    break;
  case dispatch::ResultKind::kLaunchFailure:
    std::cerr << "error: " << result.text << '\n'
              << "hint: make sure the program is installed and on PATH, or point --config at "
                 "the right executable\n";
    break;
  case dispatch::ResultKind::kUnsupportedInput:
    std::cerr << "Unknown example type. Use '" << dispatch::kExampleData << "' or '"
              << dispatch::kExampleAi << "'\n";
    break;
  }
}

// `injected` is null for real runs; the POSIX runner then shares the CLI
// logger so spawn diagnostics follow --log-level.
int DispatchInternal(int argc, char** argv, operations::IProcessRunner* injected) {
  const std::vector<std::string_view> args =
      argc > 1 ? std::vector<std::string_view>(argv + 1, argv + argc)
               : std::vector<std::string_view>{};

  GlobalOptions options;
  std::size_t next = 0;
  std::string error;
  if (!ParseGlobalOptions(args, options, next, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  if (next >= args.size()) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::vector<std::string_view> tokens(args.begin() + static_cast<std::ptrdiff_t>(next),
                                             args.end());
  const std::string_view subcommand = tokens.front();
  if (subcommand == "help" || IsHelpToken(subcommand)) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }
  if (subcommand == "version") {
    if (tokens.size() != 1U) {
      std::cerr << "error: version does not accept arguments\n";
      return kExitUsage;
    }
    std::cout << kProgramName << ' ' << kVersion << '\n';
    return kExitSuccess;
  }

  const commands::SubcommandSpec* spec = commands::FindSubcommand(subcommand);
  if (spec != nullptr) {
    for (std::size_t i = 1; i < tokens.size(); ++i) {
      if (IsHelpToken(tokens[i])) {
        PrintSubcommandUsage(std::cout, *spec);
        return kExitSuccess;
      }
    }
  }

  const std::optional<commands::Command> command = commands::ParseCommand(tokens, error);
  if (!command.has_value()) {
    std::cerr << "error: " << error << '\n';
    if (spec != nullptr) {
      PrintSubcommandUsage(std::cerr, *spec);
    } else {
      PrintUsage(std::cerr);
    }
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetComponent(commands::ToString(command->type()));

  operations::OperationTable table;
  if (!BuildOperationTable(options, table, logger, error)) {
    logger.Error("operation config rejected", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  const Presentation presentation = PresentationFor(command->type());
  std::cout << FormatBanner(presentation.start, command->kind()) << '\n';
  if (!presentation.launch.empty() && dispatch::ResolveTarget(*command, table).resolved) {
    std::cout << '\n' << FormatBanner(presentation.launch, command->kind()) << "\n\n";
  }

  operations::PosixProcessRunner posix_runner(&logger);
  operations::IProcessRunner& runner = injected != nullptr ? *injected : posix_runner;
  dispatch::Dispatcher dispatcher(std::move(table), runner, logger);
  const dispatch::UserFacingResult result = dispatcher.Dispatch(*command);
  Present(*command, result);
  return core::errors::ToInt(dispatch::ExitCodeFor(result.kind));
}

} // namespace

int Dispatch(int argc, char** argv) {
  return DispatchInternal(argc, argv, nullptr);
}

int Dispatch(int argc, char** argv, operations::IProcessRunner& runner) {
  return DispatchInternal(argc, argv, &runner);
}

} // namespace garmin_coach::cli
