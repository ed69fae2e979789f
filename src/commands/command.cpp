#include "commands/command.hpp"

#include <optional>
#include <string>

namespace garmin_coach::commands {

namespace {

constexpr std::array<SubcommandSpec, 3> kSubcommands = {{
    {CommandType::kFetchData, "fetch-data", "data-type", 'd', "activities",
     "activities|health|stats", "retrieve data from Garmin Connect"},
    {CommandType::kCoaching, "coaching", "coaching-type", 'c', "activity",
     "activity|health|plan", "get AI coaching feedback"},
    {CommandType::kExample, "example", "example-type", 'e', "data", "data|ai",
     "run an example script"},
}};

bool LooksLikeOption(std::string_view token) {
  return token.size() > 1U && token.front() == '-';
}

// Extracts the flag value for one token, consuming the following token when
// the value is not attached. Returns std::nullopt when the token is not this
// subcommand's flag at all.
std::optional<bool> TryTakeFlagValue(const SubcommandSpec& spec,
                                     const std::vector<std::string_view>& tokens,
                                     std::size_t& index, std::string& value,
                                     std::string& error) {
  const std::string_view token = tokens[index];
  const std::string long_name = "--" + std::string(spec.long_flag);
  const std::string short_name = std::string("-") + spec.short_flag;

  bool needs_next = false;
  if (token == long_name || token == short_name) {
    needs_next = true;
  } else if (token.starts_with(long_name + "=")) {
    value = std::string(token.substr(long_name.size() + 1U));
  } else if (token.starts_with(short_name) && !token.starts_with("--")) {
    std::string_view attached = token.substr(short_name.size());
    if (attached.starts_with("=")) {
      attached.remove_prefix(1);
    }
    value = std::string(attached);
  } else {
    return std::nullopt;
  }

  if (needs_next) {
    if (index + 1U >= tokens.size() || LooksLikeOption(tokens[index + 1U])) {
      error = "missing value for " + long_name + " (expected " +
              std::string(spec.value_hint) + ")";
      return false;
    }
    value = std::string(tokens[++index]);
  }

  if (value.empty()) {
    error = "value for " + long_name + " cannot be empty";
    return false;
  }
  return true;
}

} // namespace

const char* ToString(CommandType type) {
  switch (type) {
  case CommandType::kFetchData:
    return "fetch-data";
  case CommandType::kCoaching:
    return "coaching";
  case CommandType::kExample:
    return "example";
  }
  return "unknown";
}

Command Command::MakeFetchData(std::string kind) {
  return Command(CommandType::kFetchData, std::move(kind));
}

Command Command::MakeCoaching(std::string kind) {
  return Command(CommandType::kCoaching, std::move(kind));
}

Command Command::MakeExample(std::string kind) {
  return Command(CommandType::kExample, std::move(kind));
}

const std::array<SubcommandSpec, 3>& Subcommands() {
  return kSubcommands;
}

const SubcommandSpec* FindSubcommand(std::string_view name) {
  for (const auto& spec : kSubcommands) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

std::optional<Command> ParseCommand(const std::vector<std::string_view>& tokens,
                                    std::string& error) {
  error.clear();
  if (tokens.empty()) {
    error = "missing subcommand";
    return std::nullopt;
  }

  const SubcommandSpec* spec = FindSubcommand(tokens.front());
  if (spec == nullptr) {
    error = "unknown subcommand: " + std::string(tokens.front());
    return std::nullopt;
  }

  std::string kind(spec->default_kind);
  bool kind_given = false;
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    std::string value;
    const std::optional<bool> taken = TryTakeFlagValue(*spec, tokens, i, value, error);
    if (taken.has_value()) {
      if (!*taken) {
        return std::nullopt;
      }
      if (kind_given) {
        error = "--" + std::string(spec->long_flag) + " cannot be given more than once";
        return std::nullopt;
      }
      kind = std::move(value);
      kind_given = true;
      continue;
    }

    const std::string_view token = tokens[i];
    if (LooksLikeOption(token)) {
      error = "unknown option for " + std::string(spec->name) + ": " + std::string(token);
    } else {
      error = std::string(spec->name) + " does not accept positional argument '" +
              std::string(token) + "'";
    }
    return std::nullopt;
  }

  switch (spec->type) {
  case CommandType::kFetchData:
    return Command::MakeFetchData(std::move(kind));
  case CommandType::kCoaching:
    return Command::MakeCoaching(std::move(kind));
  case CommandType::kExample:
    return Command::MakeExample(std::move(kind));
  }
  error = "unhandled subcommand: " + std::string(spec->name);
  return std::nullopt;
}

} // namespace garmin_coach::commands
