#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace garmin_coach::commands {

enum class CommandType {
  kFetchData,
  kCoaching,
  kExample,
};

const char* ToString(CommandType type);

// One validated user request. The kind is always populated (flag value or
// the subcommand default) and never empty. Instances are immutable; build them
// through ParseCommand() or the Make* helpers.
class Command {
public:
  static Command MakeFetchData(std::string kind);
  static Command MakeCoaching(std::string kind);
  static Command MakeExample(std::string kind);

  CommandType type() const {
    return type_;
  }

  const std::string& kind() const {
    return kind_;
  }

  bool operator==(const Command& other) const = default;

private:
  Command(CommandType type, std::string kind) : type_(type), kind_(std::move(kind)) {}

  CommandType type_;
  std::string kind_;
};

// Static description of one subcommand. The same table drives parsing, help
// output and defaults so they cannot drift apart.
struct SubcommandSpec {
  CommandType type;
  std::string_view name;
  std::string_view long_flag;
  char short_flag;
  std::string_view default_kind;
  std::string_view value_hint;
  std::string_view summary;
};

const std::array<SubcommandSpec, 3>& Subcommands();

// Returns nullptr for unknown names.
const SubcommandSpec* FindSubcommand(std::string_view name);

// Parses `<subcommand> [flags...]`. Returns std::nullopt and fills `error`
// with a one-line diagnostic when the tokens are not a valid request.
std::optional<Command> ParseCommand(const std::vector<std::string_view>& tokens,
                                    std::string& error);

} // namespace garmin_coach::commands
