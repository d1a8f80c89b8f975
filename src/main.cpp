#include "IO/InputBlock.hpp"
#include "IO/StyledPrint.hpp"
#include "horbital/CommandLine.hpp"
#include "horbital/Errors.hpp"
#include "horbital/horbital.hpp"
#include "qip/String.hpp"
#include "qip/omp.hpp"
#include "version/version.hpp"
#include <fmt/color.h>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

//! Man page info
namespace man {

const std::string name{
    "horbital - Hydrogen orbital slices, with colour and contour mapping."};

const std::string synopsis{"horbital n [l] [m] [--option value]...\n"
                           "horbital [InputFile]\n"
                           "horbital -s [input options as string]\n"
                           "horbital -a [InputBlock]...\n"};

const std::string description{
    "horbital evaluates the exact non-relativistic hydrogen wavefunction "
    "psi_nlm (atomic units, a0 = 1) on a 2D slice: a plane x, y, or z = "
    "const, the radial distribution r^2 R_nl^2, or the angular part Y_lm on "
    "the (theta, phi) grid. Values are mapped to colours (linear, log, or "
    "symlog scale) and written as a gnuplot data file and script, which "
    "render the image (png, svg, or pdf).\n"
    "Slice plane and range are chosen automatically unless given."};

const std::vector<std::pair<std::string, std::string>> options{
    {"n [l] [m]",
     "Quantum numbers: n >= 1, 0 <= l < n, |m| <= l. l and m default to 0. "
     "Further options are given as flags (see below).\n"
     "Examples:\n"
     "./horbital 2 1 0 --mode real --plane z --value 0\n"
     "    - Real part of psi_210 in the z = 0 plane\n"
     "./horbital 3 2 1 --mode density --scale log --line-mode\n"
     "    - Log-scaled contour lines of |psi_321|^2, on the most structured "
     "central plane\n"
     "./horbital 4 2 --mode radial_distribution --render\n"
     "    - Radial distribution for 4d, rendered by gnuplot"},
    {"[InputFile]",
     "Runs horbital taking options specified in file 'InputFile', in the "
     "format: Orbital{ n = 2; l = 1; } Slice{ mode = real; } etc. See option "
     "-a for the list of blocks and options."},
    {"-a [BlockName] ..., --options",
     "Prints list of available input blocks. If BlockName(s) are given, "
     "prints the options for those blocks.\n"
     "Example:\n"
     "./horbital -a Slice Colour\n"
     "    - Prints the options for the Slice and Colour input blocks"},
    {"-h, --help, -?", "Prints this help info"},
    {"-l, --libs, --libraries",
     "Prints version details for libaries used by horbital"},
    {"-s [input options as string], --string",
     "Takes input options as a string, using same format as input file\n"},
    {"-v, --version", "Prints horbital version (and git commit) details"} //
};

//! Prints 'man page' style info
void print_manual() {
  const int wrap_at = 80;
  std::string tab = "    ";
  fmt2::styled_print(fmt::emphasis::bold, "NAME\n");
  fmt::print("{}", qip::wrap(name, wrap_at, tab + tab));

  std::cout << "\n";
  std::cout << "horbital v: " << version::version() << '\n';
  std::cout << "Libraries:\n" << version::libraries() << '\n';
  std::cout << "Compiled: " << version::compiled() << '\n';

  std::cout << "\n\n";

  fmt2::styled_print(fmt::emphasis::bold, "SYNOPSIS\n");
  fmt::print("{}", qip::wrap(synopsis, wrap_at, tab + tab));

  std::cout << "\n\n";

  fmt2::styled_print(fmt::emphasis::bold, "DESCRIPTION\n");
  fmt::print("{}", qip::wrap(description, wrap_at, tab + tab));

  std::cout << "\n\n";

  fmt2::styled_print(fmt::emphasis::bold, "OPTIONS\n");
  for (const auto &[option, text] : options) {
    fmt2::styled_print(fg(fmt::color::steel_blue), "{}",
                       qip::wrap(option, wrap_at, tab + tab));
    std::cout << "\n";
    fmt::print("{}", qip::wrap(text, wrap_at, tab + tab + tab));
    std::cout << "\n\n";
  }

  fmt2::styled_print(fmt::emphasis::bold, "FLAGS\n");
  for (const auto &[flag, sets] : horbital::command_line_flags()) {
    fmt2::styled_print(fg(fmt::color::steel_blue), "{}{}", tab, flag);
    fmt::print("  (sets {})\n", sets);
  }
  std::cout << "\n";
}

} // namespace man

//==============================================================================
//! Parses command-line input, then runs horbital
int main(int argc, char *argv[]) {

  const std::string in_text_1 = (argc > 1) ? argv[1] : "";

  // check for special commands
  if (in_text_1 == "") {
    man::print_manual();
    return 0;
  } else if (in_text_1 == "-v" || in_text_1 == "--version") {
    std::cout << "horbital v: " << version::version() << '\n';
    std::cout << "Libraries:\n" << version::libraries() << '\n';
    std::cout << "Compiled: " << version::compiled() << '\n';
    return 0;
  } else if (in_text_1 == "-l" || in_text_1.substr(0, 5) == "--lib") {
    std::cout << "Libraries:\n" << version::libraries() << '\n';
    return 0;
  } else if (in_text_1 == "-h" || in_text_1 == "--help" || in_text_1 == "-?") {
    man::print_manual();
    return 0;
  }

  try {
    if (in_text_1 == "-a" || in_text_1 == "--options") {
      std::vector<std::string> blocks;
      for (int i_in = 2; i_in < argc; ++i_in)
        blocks.emplace_back(argv[i_in]);
      horbital::print_input_options(blocks);
      return 0;
    }

    // Build the input: from string, file, or command-line flags
    IO::InputBlock input;
    if (in_text_1 == "-s" || in_text_1 == "--string") {
      std::cout << "Reading input from command-line string\n";
      input = IO::InputBlock("horbital", (argc > 2) ? argv[2] : "");
    } else if (std::ifstream file(in_text_1);
               !in_text_1.empty() && in_text_1.front() != '-' &&
               !qip::string_is_integer(in_text_1) && file.good()) {
      input = IO::InputBlock("horbital", file);
    } else {
      input = horbital::command_line_input(
          std::vector<std::string>(argv + 1, argv + argc));
    }

    // Print git/version info to screen:
    std::cout << '\n';
    IO::print_line();
    std::cout << "horbital v: " << version::version() << '\n';
    std::cout << "Parallel: " << qip::omp_details() << '\n';
    std::cout << "Compiled: " << version::compiled() << '\n';
    std::cout << "Run time: " << IO::time_date() << '\n';

    horbital::run(input);

  } catch (const horbital::Error &e) {
    fmt2::error(e.kind(), e.what());
    return 1;
  }
  return 0;
}
