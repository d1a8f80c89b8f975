#include "CommandLine.hpp"
#include "Errors.hpp"
#include "catch2/catch.hpp"
#include "horbital.hpp"
#include <iostream>
#include <string>
#include <vector>

TEST_CASE("horbital: command line", "[horbital][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "horbital: command line\n";

  using namespace horbital;
  using Args = std::vector<std::string>;

  const auto in = command_line_input(
      {"3", "2", "-1", "--mode", "real_imag", "--plane=y", "--value", "-2.5",
       "--range", "-15", "15", "--points", "81", "--scale", "symlog",
       "--cmap", "coolwarm", "--nodal-lines", "--colorbar", "--linthresh",
       "0.01", "--output", "figs/d.svg", "--render"});
  REQUIRE(in.get({"Orbital"}, "n", 0) == 3);
  REQUIRE(in.get({"Orbital"}, "l", 0) == 2);
  REQUIRE(in.get({"Orbital"}, "m", 0) == -1);
  REQUIRE(in.get({"Slice"}, "range", std::vector<double>{}) ==
          std::vector<double>{-15.0, 15.0});

  const auto s = read_settings(in);
  REQUIRE(s.qn == Orbital::QuantumNumbers::validated(3, 2, -1));
  REQUIRE(s.mode == Slice::FieldMode::real_imag);
  REQUIRE(s.slice.plane == Slice::Plane::y);
  REQUIRE(s.slice.value == -2.5);
  REQUIRE(s.slice.resolution == 81);
  REQUIRE(s.scale == Render::Scale::symlog);
  REQUIRE(s.colourmap == "coolwarm");
  REQUIRE(s.nodal_lines);
  REQUIRE(s.colorbar);
  REQUIRE_FALSE(s.line_mode);
  REQUIRE(s.mapping.linthresh_fraction == 0.01);
  REQUIRE(*s.output == "figs/d.svg");
  REQUIRE(s.format == Plot::Format::svg);
  REQUIRE(s.render);

  // The later of --colorbar/--no-colorbar wins
  const auto cb = read_settings(
      command_line_input({"1", "--colorbar", "--no-colorbar"}));
  REQUIRE_FALSE(cb.colorbar);

  // Only n given: defaults
  const auto d = read_settings(command_line_input({"4"}));
  REQUIRE(d.qn == Orbital::QuantumNumbers::validated(4, 0, 0));
  REQUIRE(d.mode == Slice::FieldMode::density);
  REQUIRE(d.slice.resolution == 401);

  // Errors
  REQUIRE_THROWS_AS(command_line_input(Args{"2", "--mdoe", "real"}),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(command_line_input(Args{"2", "--mode"}),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(command_line_input(Args{"2", "--range", "5"}),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(command_line_input(Args{"2", "--render=yes"}),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(command_line_input(Args{"2", "1", "0", "1"}),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(command_line_input(Args{"two"}), InvalidOptionError);
  REQUIRE_THROWS_AS(read_settings(command_line_input(Args{})),
                    InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(
      read_settings(command_line_input(Args{"2", "--line-mode",
                                            "--nodal-lines"})),
      ConflictingOptionError);

  REQUIRE(command_line_flags().size() == 16);
}
