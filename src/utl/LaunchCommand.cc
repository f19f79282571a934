#include "utl/LaunchCommand.hh"

#include <fmt/format.h>

#include <algorithm>
#include <iostream>
#include <limits>

#include "utl/ErrorOr.hh"
#include "utl/StringUtil.hh"
#include "utl/VariantOverloaded.hh"

namespace tuslice {
namespace {
bool is_help_flag(std::string_view arg) { return arg == "-h" || arg == "--help"; }

void print_usage(std::string_view progname, std::vector<LaunchCommand> const& cmd_list) {
  std::cerr << fmt::format("Usage:  {} command [parameters...] [--options...]\nCommands:\n", progname);

  size_t longest_name = 0;
  for (LaunchCommand const& cmd : cmd_list) {
    longest_name = std::max(longest_name, cmd._name.length());
  }
  for (LaunchCommand const& cmd : cmd_list) {
    std::cerr << fmt::format("    {:<{}}  {}\n", cmd._name, longest_name, cmd._desc);
  }

  std::cerr << fmt::format("Run '{} --help' for more detailed information\n", progname);
}

std::string_view type_str(CommandParamType type) {
  switch (type) {
    case CommandParamType::kPath:
      return "path";

    case CommandParamType::kString:
      return "string";

    case CommandParamType::kU32:
      return "uint32";

    case CommandParamType::kBoolean:
      return "flag";
  }
  return "";
}

// Empty when the default is not worth printing
std::string default_str(CmdParamVariant const& value) {
  return std::visit(overloaded{
                      [](std::monostate) { return std::string(); },
                      [](std::string const& str) { return str.empty() ? std::string() : fmt::format("'{}'", str); },
                      [](uint32_t num) { return fmt::format("{}", num); },
                      [](bool) { return std::string(); },
                    },
    value);
}

void print_cmd_help(std::string_view progname, LaunchCommand const& cmd) {
  std::cout << fmt::format("    {} {}", progname, cmd._name);
  for (ParamDesc const& desc : cmd._params) {
    std::cout << fmt::format(" <{}>", desc._name);
  }
  if (!cmd._opts.empty()) {
    std::cout << " [options...]";
  }
  std::cout << fmt::format("\n    {}\n", cmd._desc);

  for (ParamDesc const& desc : cmd._params) {
    std::cout << fmt::format("  <{}> ({})\n        {}\n", desc._name, type_str(desc._type), desc._desc);
  }

  for (OptionDesc const& desc : cmd._opts) {
    std::string names = desc._shortopt != '\0' ? fmt::format("--{}, -{}", desc._opt, desc._shortopt)
                                               : fmt::format("--{}", desc._opt);
    std::string dflt = default_str(desc._default);
    std::cout << fmt::format("  {} ({})\n        {}{}\n",
      names,
      type_str(desc._type),
      desc._desc,
      dflt.empty() ? std::string() : fmt::format(" [default: {}]", dflt));
  }
}

ErrorOr<uint32_t> parse_u32(std::string_view text) {
  if (text.empty()) {
    return std::string("Invalid u32, empty value");
  }
  std::optional<uint64_t> num = parse_number(text);
  if (!num) {
    return fmt::format("Invalid u32 '{}'", text);
  }
  if (*num > std::numeric_limits<uint32_t>::max()) {
    return fmt::format("Invalid u32, '{}' is out of range", text);
  }
  return static_cast<uint32_t>(*num);
}

ErrorOr<CmdParamVariant> parse_value(std::string_view text, CommandParamType type) {
  switch (type) {
    case CommandParamType::kPath:
    case CommandParamType::kString:
      return CmdParamVariant(std::string(text));

    case CommandParamType::kU32: {
      auto result = parse_u32(text);
      if (result.is_error()) {
        return result.err();
      }
      return CmdParamVariant(result.val());
    }

    case CommandParamType::kBoolean:
      return CmdParamVariant(true);
  }
  return std::string("Unknown parameter type");
}
}  // namespace

OptionDesc const* LaunchCommand::find_opt(std::string_view opt) const {
  auto it = std::find_if(_opts.begin(), _opts.end(), [opt](OptionDesc const& od) { return od._opt == opt; });
  return it == _opts.end() ? nullptr : &*it;
}

OptionDesc const* LaunchCommand::find_opt(char shortopt) const {
  if (shortopt == '\0') {
    return nullptr;
  }
  auto it =
    std::find_if(_opts.begin(), _opts.end(), [shortopt](OptionDesc const& od) { return od._shortopt == shortopt; });
  return it == _opts.end() ? nullptr : &*it;
}

std::optional<std::string> CommandParamList::parse_args(std::vector<std::string_view> const& args) {
  size_t next = 0;

  for (ParamDesc const& param : _cmd._params) {
    if (next == args.size()) {
      return fmt::format("Missing required argument '{}'", param._name);
    }
    if (param._type == CommandParamType::kBoolean) {
      return fmt::format("Parameter '{}' cannot be a flag", param._name);
    }
    auto value = parse_value(args[next++], param._type);
    if (value.is_error()) {
      return fmt::format("Failed to parse argument '{}', Reason: {}", param._name, value.err());
    }
    _parsed_args.push_back(value.take());
  }

  while (next < args.size()) {
    std::string_view token = args[next++];
    OptionDesc const* desc = nullptr;
    std::optional<std::string_view> attached;

    if (token.starts_with("--")) {
      std::string_view name = token.substr(2);
      if (size_t split = name.find('='); split != std::string_view::npos) {
        attached = name.substr(split + 1);
        name = name.substr(0, split);
      }
      desc = _cmd.find_opt(name);
      if (desc == nullptr) {
        return fmt::format("Invalid or unrecognized option name '{}'", name);
      }
    } else if (token.size() > 1 && token[0] == '-') {
      desc = _cmd.find_opt(token[1]);
      if (desc == nullptr) {
        return fmt::format("Invalid or unrecognized short option name '{}'", token[1]);
      }
      if (token.size() > 2) {
        attached = token.substr(2);
      }
    } else {
      return fmt::format("Too many required arguments provided (at '{}')", token);
    }

    if (desc->_type == CommandParamType::kBoolean) {
      if (attached) {
        return fmt::format("Option '{}' is a flag and takes no value", desc->_opt);
      }
      _parsed_opts.emplace_back(desc, CmdParamVariant(true));
      continue;
    }

    if (!attached) {
      if (next == args.size()) {
        return fmt::format("Failed to parse option '{}', Reason: Missing value", desc->_opt);
      }
      attached = args[next++];
    }
    auto value = parse_value(*attached, desc->_type);
    if (value.is_error()) {
      return fmt::format("Failed to parse option '{}', Reason: {}", desc->_opt, value.err());
    }
    _parsed_opts.emplace_back(desc, value.take());
  }

  return std::nullopt;
}

CmdParamVariant const& CommandParamList::param(size_t index) const {
  if (index >= _parsed_args.size()) {
    return _invalid;
  }
  return _parsed_args[index];
}

// Last occurrence wins, the declared default otherwise
CmdParamVariant const& CommandParamList::option_of(OptionDesc const* desc) const {
  if (desc == nullptr) {
    return _invalid;
  }
  auto parsed_it =
    std::find_if(_parsed_opts.rbegin(), _parsed_opts.rend(), [desc](auto const& po) { return po.first == desc; });
  return parsed_it != _parsed_opts.rend() ? parsed_it->second : desc->_default;
}

bool CommandParamList::has_option(std::string_view opt) const {
  OptionDesc const* desc = _cmd.find_opt(opt);
  return std::any_of(_parsed_opts.begin(), _parsed_opts.end(), [desc](auto const& po) { return po.first == desc; });
}

CmdParamVariant const& CommandParamList::option(std::string_view opt) const { return option_of(_cmd.find_opt(opt)); }

CmdParamVariant const& CommandParamList::option(char shortopt) const { return option_of(_cmd.find_opt(shortopt)); }

int exec_command(std::vector<LaunchCommand> const& cmd_list, int argc, char** argv) {
  std::string_view progname = argc > 0 ? argv[0] : kDefaultProgName;
  if (argc < 2) {
    print_usage(progname, cmd_list);
    return 1;
  }
  std::string_view cmdname = argv[1];
  if (is_help_flag(cmdname)) {
    std::cout << fmt::format("Usage:  {} command [parameters...] [--options...]\n", progname);
    for (LaunchCommand const& cmd : cmd_list) {
      std::cout << '\n';
      print_cmd_help(progname, cmd);
    }
    return 0;
  }

  auto cmd_it =
    std::find_if(cmd_list.begin(), cmd_list.end(), [cmdname](LaunchCommand const& cmd) { return cmd._name == cmdname; });
  if (cmd_it == cmd_list.end()) {
    std::cerr << fmt::format("Unknown command '{}'\n", cmdname);
    print_usage(progname, cmd_list);
    return 1;
  }

  std::vector<std::string_view> args(argv + 2, argv + argc);
  if (std::any_of(args.begin(), args.end(), is_help_flag)) {
    print_cmd_help(progname, *cmd_it);
    return 0;
  }

  CommandParamList cpl(*cmd_it);
  if (auto fail_reason = cpl.parse_args(args)) {
    std::cerr << fmt::format(
      "Error: {}\nRun '{} {} --help' for more detailed information on command\n", *fail_reason, progname, cmdname);
    return 1;
  }
  return cmd_it->command_fn(cpl);
}
}  // namespace tuslice
