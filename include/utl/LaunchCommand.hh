#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// Command line verbs, each with positional parameters and typed options
// The whole command line is validated before the verb runs
namespace tuslice {
class CommandParamList;
using CmdParamVariant = std::variant<std::monostate, std::string, uint32_t, bool>;

enum class CommandParamType { kPath, kString, kU32, kBoolean };

constexpr const char* kDefaultProgName = "tu-slice";

// Required parameters, have a defined order of appearance
struct ParamDesc {
  std::string_view _name;
  std::string_view _desc;
  CommandParamType _type;
};

// Options follow the parameters in any order, as '--opt value', '--opt=value', '-x value' or '-xvalue'
// Boolean options take no value. A shortopt of '\0' means the option only has a long form
struct OptionDesc {
  std::string_view _opt;
  char _shortopt;
  std::string_view _desc;
  CommandParamType _type;
  CmdParamVariant _default;
};

struct LaunchCommand {
  std::string_view _name;
  std::string_view _desc;
  std::vector<ParamDesc> _params;
  std::vector<OptionDesc> _opts;

  int (*command_fn)(CommandParamList const&);

  OptionDesc const* find_opt(std::string_view opt) const;
  OptionDesc const* find_opt(char shortopt) const;
};

class CommandParamList {
private:
  LaunchCommand const& _cmd;
  std::vector<CmdParamVariant> _parsed_args;
  std::vector<std::pair<OptionDesc const*, CmdParamVariant>> _parsed_opts;
  const CmdParamVariant _invalid;

private:
  std::optional<std::string> parse_args(std::vector<std::string_view> const& args);
  CmdParamVariant const& option_of(OptionDesc const* desc) const;

  friend int exec_command(std::vector<LaunchCommand> const& cmd_list, int argc, char** argv);

public:
  CommandParamList(LaunchCommand const& cmd) : _cmd(cmd), _invalid(std::monostate()) {}

  CmdParamVariant const& param(size_t index) const;
  template <typename T>
  T const& param_v(size_t index) const {
    return std::get<T>(param(index));
  }

  // True if the option appeared on the command line, regardless of its value
  bool has_option(std::string_view opt) const;

  CmdParamVariant const& option(std::string_view opt) const;
  template <typename T>
  T const& option_v(std::string_view opt) const {
    return std::get<T>(option(opt));
  }

  CmdParamVariant const& option(char shortopt) const;
  template <typename T>
  T const& option_v(char shortopt) const {
    return std::get<T>(option(shortopt));
  }
};

int exec_command(std::vector<LaunchCommand> const& cmd_list, int argc, char** argv);
}  // namespace tuslice
