#include "CommandLine.hpp"
#include "Errors.hpp"
#include "qip/String.hpp"
#include <algorithm>
#include <array>
#include <fmt/format.h>
#include <optional>
#include <string_view>

namespace horbital {

namespace {

enum class Arity { none, one, two };

struct Flag {
  std::string_view flag;
  std::string_view block;
  std::string_view key;
  Arity arity;
  // value stored for a switch
  std::string_view value;
};

constexpr std::array flags{
    Flag{"--mode", "Slice", "mode", Arity::one, ""},
    Flag{"--plane", "Slice", "plane", Arity::one, ""},
    Flag{"--value", "Slice", "value", Arity::one, ""},
    Flag{"--range", "Slice", "range", Arity::two, ""},
    Flag{"--points", "Slice", "points", Arity::one, ""},
    Flag{"--scale", "Colour", "scale", Arity::one, ""},
    Flag{"--cmap", "Colour", "cmap", Arity::one, ""},
    Flag{"--line-mode", "Colour", "line_mode", Arity::none, "true"},
    Flag{"--nodal-lines", "Colour", "nodal_lines", Arity::none, "true"},
    Flag{"--colorbar", "Colour", "colorbar", Arity::none, "true"},
    Flag{"--no-colorbar", "Colour", "colorbar", Arity::none, "false"},
    Flag{"--levels", "Colour", "levels", Arity::one, ""},
    Flag{"--linthresh", "Colour", "linthresh", Arity::one, ""},
    Flag{"--output", "Output", "output", Arity::one, ""},
    Flag{"--format", "Output", "format", Arity::one, ""},
    Flag{"--render", "Output", "render", Arity::none, "true"}};

const Flag &find_flag(std::string_view name) {
  const auto it = std::find_if(flags.cbegin(), flags.cend(),
                               [&](const Flag &f) { return f.flag == name; });
  if (it != flags.cend())
    return *it;

  std::vector<std::string> names;
  for (const auto &f : flags)
    names.emplace_back(f.flag);
  const auto closest = qip::ci_closest_match(name, names);
  throw InvalidOptionError(
      fmt::format("Unknown option '{}'; did you mean '{}'? Run `horbital -h` "
                  "for the list of options",
                  name, *closest));
}

} // namespace

//==============================================================================
const std::vector<std::pair<std::string, std::string>> &command_line_flags() {
  static const std::vector<std::pair<std::string, std::string>> list = [] {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto &f : flags) {
      const auto args = f.arity == Arity::none ? "" :
                        f.arity == Arity::one  ? " VALUE" :
                                                 " MIN MAX";
      const auto set =
          f.arity == Arity::none ?
              fmt::format("{}{{{}={};}}", f.block, f.key, f.value) :
              fmt::format("{}{{{};}}", f.block, f.key);
      out.emplace_back(fmt::format("{}{}", f.flag, args), set);
    }
    return out;
  }();
  return list;
}

//==============================================================================
IO::InputBlock command_line_input(const std::vector<std::string> &args) {
  IO::InputBlock input{"horbital"};

  const auto set = [&](std::string_view block, std::string_view key,
                       std::string value) {
    IO::InputBlock new_block{block};
    new_block.add(IO::Option{std::string(key), std::move(value)});
    input.add(std::move(new_block), true);
  };

  std::vector<std::string> positional;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto &arg = args[i];
    if (arg.size() < 2 || arg.substr(0, 2) != "--") {
      if (!qip::string_is_integer(arg)) {
        throw InvalidOptionError(fmt::format(
            "Quantum numbers must be integers: got '{}'", arg));
      }
      positional.push_back(arg);
      continue;
    }

    // --flag=value form
    const auto eq = arg.find('=');
    const auto name = arg.substr(0, eq);
    std::optional<std::string> inline_value;
    if (eq != std::string::npos)
      inline_value = arg.substr(eq + 1);

    const auto &flag = find_flag(name);
    switch (flag.arity) {
    case Arity::none:
      if (inline_value) {
        throw InvalidOptionError(
            fmt::format("Option {} does not take a value", flag.flag));
      }
      set(flag.block, flag.key, std::string(flag.value));
      break;
    case Arity::one:
      if (inline_value) {
        set(flag.block, flag.key, *inline_value);
      } else if (i + 1 < args.size()) {
        set(flag.block, flag.key, args[++i]);
      } else {
        throw InvalidOptionError(
            fmt::format("Option {} requires a value", flag.flag));
      }
      break;
    case Arity::two:
      if (inline_value) {
        set(flag.block, flag.key, *inline_value);
      } else if (i + 2 < args.size()) {
        set(flag.block, flag.key, args[i + 1] + "," + args[i + 2]);
        i += 2;
      } else {
        throw InvalidOptionError(
            fmt::format("Option {} requires two values: MIN MAX", flag.flag));
      }
      break;
    }
  }

  if (positional.size() > 3) {
    throw InvalidOptionError(fmt::format(
        "Expected at most three quantum numbers (n l m), got {}: {}",
        positional.size(), qip::concat(positional, " ")));
  }
  constexpr std::array<std::string_view, 3> qn_keys{"n", "l", "m"};
  for (std::size_t i = 0; i < positional.size(); ++i) {
    set("Orbital", qn_keys[i], positional[i]);
  }
  return input;
}

} // namespace horbital
