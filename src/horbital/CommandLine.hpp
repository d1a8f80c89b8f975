#pragma once
#include "IO/InputBlock.hpp"
#include <string>
#include <utility>
#include <vector>

namespace horbital {

//! Command-line flags, and the Block/option each sets: {flag, description}
const std::vector<std::pair<std::string, std::string>> &command_line_flags();

//! Translates 'horbital n [l] [m] [--flag value]...' into input blocks.
/*!
@details
args excludes the program name. Positional arguments are the quantum numbers
n, l, m (in order, at most three; '-1' etc. are positional). Flags take the
next argument as their value, or may be written '--flag=value'; the switches
(--line-mode, --nodal-lines, --colorbar, --no-colorbar, --render) take none.
--range takes two values.
Values are not parsed here; that happens in read_settings().
Throws InvalidOptionError for unknown flags, missing values, or too many
positional arguments.
*/
IO::InputBlock command_line_input(const std::vector<std::string> &args);

} // namespace horbital
