#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "utl/LaunchCommand.hh"

using namespace tuslice;

namespace {
struct Captured {
  bool _called = false;
  std::string _database;
  std::string _out;
  uint32_t _jobs = 0;
  bool _header = false;
  bool _has_base = false;
  std::string _base;
};

Captured sCaptured;

int capture_export(CommandParamList const& cpl) {
  sCaptured._called = true;
  sCaptured._database = cpl.param_v<std::string>(0);
  sCaptured._out = cpl.option_v<std::string>("out");
  sCaptured._jobs = cpl.option_v<uint32_t>('J');
  sCaptured._header = cpl.option_v<bool>("header");
  sCaptured._has_base = cpl.has_option("base");
  sCaptured._base = cpl.option_v<std::string>("base");
  return 0;
}

std::vector<LaunchCommand> const sCommands = {
  LaunchCommand{
    ._name = "export",
    ._desc = "Export functions",
    ._params =
      {
        {"database", "Program database", CommandParamType::kPath},
      },
    ._opts =
      {
        {"out", 'o', "Output directory", CommandParamType::kPath, std::string(".")},
        {"jobs", 'J', "Worker threads", CommandParamType::kU32, uint32_t(1)},
        {"header", 'H', "Emit a header", CommandParamType::kBoolean, false},
        {"base", '\0', "Artifact base name", CommandParamType::kString, std::string()},
      },
    .command_fn = capture_export,
  },
};

int exec(std::vector<std::string> args) {
  sCaptured = Captured{};
  args.insert(args.begin(), "tu-slice");
  std::vector<char*> argv;
  for (std::string& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return exec_command(sCommands, static_cast<int>(args.size()), argv.data());
}
}  // namespace

TEST_CASE("Test defaults apply when options are absent") {
  REQUIRE(exec({"export", "db.json"}) == 0);
  REQUIRE(sCaptured._called);
  CHECK(sCaptured._database == "db.json");
  CHECK(sCaptured._out == ".");
  CHECK(sCaptured._jobs == 1);
  CHECK_FALSE(sCaptured._header);
  CHECK_FALSE(sCaptured._has_base);
  CHECK(sCaptured._base.empty());
}

TEST_CASE("Test long and short options") {
  REQUIRE(exec({"export", "db.json", "--out=build/out", "--jobs", "4", "-H", "--base", "slice"}) == 0);
  CHECK(sCaptured._out == "build/out");
  CHECK(sCaptured._jobs == 4);
  CHECK(sCaptured._header);
  CHECK(sCaptured._has_base);
  CHECK(sCaptured._base == "slice");

  REQUIRE(exec({"export", "db.json", "-J8", "-o", "dir"}) == 0);
  CHECK(sCaptured._jobs == 8);
  CHECK(sCaptured._out == "dir");

  REQUIRE(exec({"export", "db.json", "--jobs=0x10"}) == 0);
  CHECK(sCaptured._jobs == 16);
}

TEST_CASE("Test repeated options keep the last value") {
  REQUIRE(exec({"export", "db.json", "-J", "2", "--jobs=3", "-o", "a", "--out", "b"}) == 0);
  CHECK(sCaptured._jobs == 3);
  CHECK(sCaptured._out == "b");
}

TEST_CASE("Test bad command lines never reach the command") {
  CHECK(exec({"export"}) == 1);
  CHECK(exec({"export", "db.json", "--nope"}) == 1);
  CHECK(exec({"export", "db.json", "--header=yes"}) == 1);
  CHECK(exec({"export", "db.json", "-Hx"}) == 1);
  CHECK(exec({"export", "db.json", "--jobs", "many"}) == 1);
  CHECK(exec({"export", "db.json", "--jobs", "99999999999"}) == 1);
  CHECK(exec({"export", "db.json", "--jobs"}) == 1);
  CHECK(exec({"export", "db.json", "extra"}) == 1);
  CHECK(exec({"export", "db.json", "--jobs", "0xfg"}) == 1);
  CHECK(exec({"export", "db.json", "-J="}) == 1);
  CHECK(exec({"export", "db.json", "-"}) == 1);
  CHECK(exec({"import", "db.json"}) == 1);
  CHECK(exec({}) == 1);
  CHECK_FALSE(sCaptured._called);
}

TEST_CASE("Test help does not run the command") {
  CHECK(exec({"--help"}) == 0);
  CHECK(exec({"export", "db.json", "-h"}) == 0);
  CHECK_FALSE(sCaptured._called);
}
