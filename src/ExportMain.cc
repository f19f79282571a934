#include <vector>

#include "Commands.hh"
#include "utl/LaunchCommand.hh"

namespace {
using namespace tuslice;

constexpr ParamDesc kDatabaseParam = {
  "database",
  "Path to the JSON program database exported from the decompiler",
  CommandParamType::kPath,
};

std::vector<LaunchCommand> sCommands = {
  LaunchCommand{
    "export",
    "Write the smallest compilable translation unit for a selection of functions",
    {kDatabaseParam},
    {
      OptionDesc{"out", 'o', "Directory the artifacts are written to", CommandParamType::kPath, std::string(".")},
      OptionDesc{
        "base",
        'b',
        "Base file name of the artifacts. Defaults to the program name",
        CommandParamType::kString,
        std::string(),
      },
      OptionDesc{
        "header",
        'H',
        "Also write '<base>.h' with every section but the implementations, included from the source",
        CommandParamType::kBoolean,
        false,
      },
      OptionDesc{"no-source", '\0', "Do not write '<base>.c'", CommandParamType::kBoolean, false},
      OptionDesc{
        "json",
        'j',
        "Write '<base>.json' keyed by function address instead of C text",
        CommandParamType::kBoolean,
        false,
      },
      OptionDesc{"c-comments", '\0', "Use /* */ section banners", CommandParamType::kBoolean, false},
      OptionDesc{"no-types", '\0', "Leave out the data types section", CommandParamType::kBoolean, false},
      OptionDesc{"no-equates", '\0', "Leave out the equates section", CommandParamType::kBoolean, false},
      OptionDesc{"no-decls", '\0', "Leave out the function declarations section", CommandParamType::kBoolean, false},
      OptionDesc{"no-globals", '\0', "Leave out the global variables section", CommandParamType::kBoolean, false},
      OptionDesc{
        "define-globals",
        '\0',
        "Define referenced globals instead of declaring them extern",
        CommandParamType::kBoolean,
        false,
      },
      OptionDesc{
        "no-declare-selected",
        '\0',
        "Do not declare the exported functions ahead of their callees",
        CommandParamType::kBoolean,
        false,
      },
      OptionDesc{"no-prelude", '\0', "Leave out the decompiler pseudo-type typedefs", CommandParamType::kBoolean, false},
      OptionDesc{
        "no-stubs",
        '\0',
        "Leave out comments for functions that failed to decompile",
        CommandParamType::kBoolean,
        false,
      },
      OptionDesc{
        "functions",
        'f',
        "Comma separated names of the functions to export",
        CommandParamType::kString,
        std::string(),
      },
      OptionDesc{
        "addrs",
        'a',
        "Comma separated entry address ranges to export, e.g. '0x1000-0x2000,0x3000'",
        CommandParamType::kString,
        std::string(),
      },
      OptionDesc{
        "tags",
        't',
        "Comma separated function tags, matching functions are skipped",
        CommandParamType::kString,
        std::string(),
      },
      OptionDesc{
        "tag-include",
        '\0',
        "Export only functions carrying one of the tags instead of skipping them",
        CommandParamType::kBoolean,
        false,
      },
      OptionDesc{
        "tolerate-ranges",
        '\0',
        "Ignore an unparseable address range list instead of failing",
        CommandParamType::kBoolean,
        false,
      },
      OptionDesc{
        "strict",
        '\0',
        "Fail when two functions disagree about a global, prototype or equate",
        CommandParamType::kBoolean,
        false,
      },
      OptionDesc{
        "jobs",
        'J',
        "Worker threads for closure computation, 0 for one per core",
        CommandParamType::kU32,
        uint32_t(1),
      },
      OptionDesc{"verbose", 'v', "Report written files and totals", CommandParamType::kBoolean, false},
    },
    export_program,
  },
  LaunchCommand{
    "list",
    "Print every function in the database with its decompilation status",
    {kDatabaseParam},
    {},
    list_functions,
  },
  LaunchCommand{
    "closure",
    "Print the types, globals, callees and equates one function needs",
    {
      kDatabaseParam,
      ParamDesc{
        "name",
        "Name of the function",
        CommandParamType::kString,
      },
    },
    {},
    show_closure,
  },
};
}  // namespace

// clang-format off
int main(int argc, char** argv) {
  return exec_command(sCommands, argc, argv);
}
// clang-format on
