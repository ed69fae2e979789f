#include "operations/operation_table.hpp"

#include "core/json_dom.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace garmin_coach::operations {

namespace {

constexpr std::string_view kDefaultInterpreter = "python3";
constexpr std::string_view kFetchScript = "python_client/example.py";
constexpr std::string_view kCoachingScript = "python_client/ai_example.py";

std::string ReadEnv(std::string_view name) {
  const char* raw = std::getenv(std::string(name).c_str());
  return raw == nullptr ? std::string() : std::string(raw);
}

bool WrongType(std::string_view path, std::string_view expected, const core::json::Value& value,
               std::string& error) {
  error = std::string(path) + ": expected " + std::string(expected) + ", got " +
          core::json::TypeName(value.type);
  return false;
}

bool ApplyTarget(const core::json::Value& node, std::string_view path, InvocationTarget& target,
                 std::string& error) {
  if (node.type != core::json::Value::Type::kObject) {
    return WrongType(path, "object", node, error);
  }

  for (const auto& [key, value] : node.object_value) {
    const std::string field_path = std::string(path) + "." + key;
    if (key == "program") {
      if (value.type != core::json::Value::Type::kString) {
        return WrongType(field_path, "string", value, error);
      }
      if (value.string_value.empty()) {
        error = field_path + ": must not be empty";
        return false;
      }
      target.program = value.string_value;
    } else if (key == "args") {
      if (value.type != core::json::Value::Type::kArray) {
        return WrongType(field_path, "array of strings", value, error);
      }
      std::vector<std::string> args;
      args.reserve(value.array_value.size());
      for (std::size_t i = 0; i < value.array_value.size(); ++i) {
        const auto& item = value.array_value[i];
        if (item.type != core::json::Value::Type::kString) {
          return WrongType(field_path + "[" + std::to_string(i) + "]", "string", item, error);
        }
        args.push_back(item.string_value);
      }
      target.args = std::move(args);
    } else {
      error = field_path + ": unknown key";
      return false;
    }
  }
  return true;
}

} // namespace

const char* ToString(OperationId id) {
  switch (id) {
  case OperationId::kFetch:
    return "fetch";
  case OperationId::kCoaching:
    return "coaching";
  }
  return "fetch";
}

OperationTable DefaultOperationTable() {
  std::string interpreter = ReadEnv(kPythonEnvVar);
  if (interpreter.empty()) {
    interpreter = std::string(kDefaultInterpreter);
  }

  OperationTable table;
  table.fetch = InvocationTarget{interpreter, {std::string(kFetchScript)}};
  table.coaching = InvocationTarget{interpreter, {std::string(kCoachingScript)}};
  return table;
}

bool ApplyOperationConfig(std::string_view json_text, OperationTable& table, std::string& error) {
  core::json::Value root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (root.type != core::json::Value::Type::kObject) {
    return WrongType("$", "object", root, error);
  }

  for (const auto& [key, value] : root.object_value) {
    if (key == "operations") {
      if (value.type != core::json::Value::Type::kObject) {
        return WrongType("operations", "object", value, error);
      }
      for (const auto& [name, node] : value.object_value) {
        const std::string path = "operations." + name;
        if (name == ToString(OperationId::kFetch)) {
          if (!ApplyTarget(node, path, table.fetch, error)) {
            return false;
          }
        } else if (name == ToString(OperationId::kCoaching)) {
          if (!ApplyTarget(node, path, table.coaching, error)) {
            return false;
          }
        } else {
          error = path + ": unknown operation (expected fetch|coaching)";
          return false;
        }
      }
    } else if (key == "pass_kind") {
      if (value.type != core::json::Value::Type::kBool) {
        return WrongType(key, "bool", value, error);
      }
      table.pass_kind = value.bool_value;
    } else if (key == "kind_flag") {
      if (value.type != core::json::Value::Type::kString) {
        return WrongType(key, "string", value, error);
      }
      table.kind_flag = value.string_value;
    } else {
      error = key + ": unknown key";
      return false;
    }
  }
  return true;
}

bool LoadOperationConfigFile(const fs::path& path, OperationTable& table, std::string& error) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "config file not found: " + path.string();
    return false;
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open config file: " + path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());

  if (!ApplyOperationConfig(text, table, error)) {
    error = "invalid config file " + path.string() + ": " + error;
    return false;
  }
  return true;
}

std::optional<fs::path> ConfigPathFromEnvironment() {
  const std::string raw = ReadEnv(kConfigEnvVar);
  if (raw.empty()) {
    return std::nullopt;
  }
  return fs::path(raw);
}

} // namespace garmin_coach::operations
