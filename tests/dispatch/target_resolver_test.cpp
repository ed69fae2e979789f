#include "dispatch/target_resolver.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using garmin_coach::commands::Command;
using garmin_coach::dispatch::ResolveTarget;
using garmin_coach::operations::InvocationTarget;
using garmin_coach::operations::OperationId;
using garmin_coach::operations::OperationTable;

namespace {

OperationTable MakeTable() {
  OperationTable table;
  table.fetch = InvocationTarget{"/opt/coach/fetch", {"--quiet"}};
  table.coaching = InvocationTarget{"/opt/coach/coach", {}};
  return table;
}

} // namespace

TEST_CASE("Fetch and coaching commands resolve to their operations", "[dispatch][resolve]") {
  const OperationTable table = MakeTable();

  const auto fetch = ResolveTarget(Command::MakeFetchData("activities"), table);
  REQUIRE(fetch.resolved);
  REQUIRE(fetch.operation == OperationId::kFetch);
  REQUIRE(fetch.target == table.fetch);

  const auto coaching = ResolveTarget(Command::MakeCoaching("plan"), table);
  REQUIRE(coaching.resolved);
  REQUIRE(coaching.operation == OperationId::kCoaching);
  REQUIRE(coaching.target == table.coaching);
}

TEST_CASE("Kind is advisory unless pass-through is enabled", "[dispatch][resolve]") {
  const OperationTable table = MakeTable();

  // Different kinds, same invocation: the legacy behavior.
  REQUIRE(ResolveTarget(Command::MakeFetchData("health"), table).target ==
          ResolveTarget(Command::MakeFetchData("stats"), table).target);
}

TEST_CASE("Pass-through appends the kind to fetch and coaching targets", "[dispatch][resolve]") {
  OperationTable table = MakeTable();
  table.pass_kind = true;

  SECTION("as a positional argument") {
    const auto fetch = ResolveTarget(Command::MakeFetchData("health"), table);
    REQUIRE(fetch.target.args == std::vector<std::string>{"--quiet", "health"});
  }

  SECTION("behind a configured flag") {
    table.kind_flag = "--type";
    const auto coaching = ResolveTarget(Command::MakeCoaching("plan"), table);
    REQUIRE(coaching.target.args == std::vector<std::string>{"--type", "plan"});
  }

  SECTION("never for examples") {
    const auto example = ResolveTarget(Command::MakeExample("data"), table);
    REQUIRE(example.target == table.fetch);
  }
}

TEST_CASE("Example kinds select the fetch or coaching target", "[dispatch][resolve]") {
  const OperationTable table = MakeTable();

  const auto data = ResolveTarget(Command::MakeExample("data"), table);
  REQUIRE(data.resolved);
  REQUIRE(data.target == ResolveTarget(Command::MakeFetchData("activities"), table).target);

  const auto ai = ResolveTarget(Command::MakeExample("ai"), table);
  REQUIRE(ai.resolved);
  REQUIRE(ai.target == ResolveTarget(Command::MakeCoaching("activity"), table).target);
}

TEST_CASE("Other example kinds are unsupported input", "[dispatch][resolve]") {
  const OperationTable table = MakeTable();

  for (const char* kind : {"bogus", "Data", "AI", "data "}) {
    const auto resolution = ResolveTarget(Command::MakeExample(kind), table);
    REQUIRE_FALSE(resolution.resolved);
    REQUIRE(resolution.unsupported_reason.find("unsupported example type") != std::string::npos);
  }
}
