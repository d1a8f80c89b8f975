#include "Errors.hpp"
#include "IO/InputBlock.hpp"
#include "Slice/AutoSelect.hpp"
#include "catch2/catch.hpp"
#include "horbital.hpp"
#include <iostream>
#include <string>

TEST_CASE("horbital::read_settings", "[horbital][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "horbital::read_settings\n";

  using namespace horbital;
  using Slice::FieldMode;

  // Defaults
  const auto s = read_settings(IO::InputBlock{"horbital", "Orbital{n=2;}"});
  REQUIRE(s.qn == Orbital::QuantumNumbers::validated(2, 0, 0));
  REQUIRE(s.mode == FieldMode::density);
  REQUIRE_FALSE(s.slice.plane);
  REQUIRE_FALSE(s.slice.value);
  REQUIRE_FALSE(s.slice.range);
  REQUIRE(s.slice.resolution == 401);
  REQUIRE(s.scale == Render::Scale::linear);
  REQUIRE(s.colourmap == "RdYlBu_r");
  REQUIRE_FALSE(s.line_mode);
  REQUIRE_FALSE(s.nodal_lines);
  REQUIRE_FALSE(s.colorbar);
  REQUIRE(s.levels == 8);
  REQUIRE(s.mapping.linthresh_fraction == 1.0e-3);
  REQUIRE_FALSE(s.output);
  REQUIRE(s.format == Plot::Format::png);
  REQUIRE_FALSE(s.render);

  // Everything set
  const std::string full{
      "Orbital{n=3; l=2; m=-1;}"
      "Slice{mode=real_imag; plane=y; value=-1.5; range=-12,12; points=51;}"
      "Colour{scale=auto; cmap=coolwarm; nodal_lines; colorbar=true; "
      "linthresh=0.01;}"
      "Output{output=out/plot.svg; render=false;}"};
  const auto f = read_settings(IO::InputBlock{"horbital", full});
  REQUIRE(f.qn == Orbital::QuantumNumbers::validated(3, 2, -1));
  REQUIRE(f.mode == FieldMode::real_imag);
  REQUIRE(f.slice.plane == Slice::Plane::y);
  REQUIRE(f.slice.value == -1.5);
  REQUIRE(f.slice.range->min == -12.0);
  REQUIRE(f.slice.range->max == 12.0);
  REQUIRE(f.slice.resolution == 51);
  REQUIRE(f.scale == Render::Scale::symlog);
  REQUIRE(f.colourmap == "coolwarm");
  REQUIRE(f.nodal_lines);
  REQUIRE(f.colorbar);
  REQUIRE(f.mapping.linthresh_fraction == 0.01);
  REQUIRE(*f.output == "out/plot.svg");
  REQUIRE(f.format == Plot::Format::svg);

  // Presets resolve to their colourmap
  const auto p = read_settings(
      IO::InputBlock{"horbital", "Orbital{n=1;}Colour{cmap=sample_density;}"});
  REQUIRE(p.colourmap == "YlOrRd");
}

//==============================================================================
TEST_CASE("horbital::read_settings errors", "[horbital][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "horbital::read_settings errors\n";

  using namespace horbital;
  const auto read = [](const std::string &in) {
    return read_settings(IO::InputBlock{"horbital", in});
  };

  REQUIRE_THROWS_AS(read(""), InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(read("Orbital{n=0;}"), InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;l=2;}"), InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;l=1;m=-2;}"),
                    InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(read("Orbital{n=two;}"), InvalidOptionError);

  REQUIRE_THROWS_AS(read("Orbital{n=2;}Slice{mode=phase;}"),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Slice{plane=w;}"), InvalidOptionError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Slice{range=1,2,3;}"),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Slice{points=24;}"),
                    InvalidSliceSpecError);
  REQUIRE_NOTHROW(read("Orbital{n=2;}Slice{points=25;}"));

  REQUIRE_THROWS_AS(read("Orbital{n=2;}Colour{scale=loglog;}"),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Colour{cmap=jet;}"),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Colour{levels=1;}"),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Colour{linthresh=0;}"),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Colour{line_mode=maybe;}"),
                    InvalidOptionError);

  // Scale/mode pairing
  REQUIRE_THROWS_AS(
      read("Orbital{n=2;l=1;}Slice{mode=real;}Colour{scale=log;}"),
      UnsupportedScaleError);
  REQUIRE_THROWS_AS(
      read("Orbital{n=2;}Slice{mode=density;}Colour{scale=symlog;line_mode;}"),
      UnsupportedScaleError);
  REQUIRE_NOTHROW(read("Orbital{n=2;}Colour{scale=symlog;}"));

  // Mutually exclusive line options
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Colour{line_mode;nodal_lines;}"),
                    ConflictingOptionError);

  // Nodal lines only exist on signed fields
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Colour{nodal_lines;}"),
                    ConflictingOptionError);
  REQUIRE_THROWS_AS(
      read("Orbital{n=3;l=1;}Slice{mode=radial_distribution;}"
           "Colour{nodal_lines=true;}"),
      ConflictingOptionError);
  REQUIRE_NOTHROW(read("Orbital{n=2;}Slice{mode=density;}"
                       "Colour{nodal_lines=false;}"));
  REQUIRE(read("Orbital{n=2;l=1;}Slice{mode=real;}Colour{nodal_lines;}")
              .nodal_lines);
  REQUIRE(read("Orbital{n=2;l=1;}Slice{mode=spherical_harmonic;}"
               "Colour{nodal_lines;}")
              .nodal_lines);

  // Output/format
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Output{format=gif;}"),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Output{output=plot;}"),
                    InvalidOptionError);
  REQUIRE_THROWS_AS(read("Orbital{n=2;}Output{output=plot.png;format=pdf;}"),
                    ConflictingOptionError);
  REQUIRE(read("Orbital{n=2;}Output{format=PDF;}").format == Plot::Format::pdf);
}

//==============================================================================
TEST_CASE("horbital::compute", "[horbital][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "horbital::compute\n";

  using namespace horbital;
  using Slice::FieldMode;
  const auto read = [](const std::string &in) {
    return read_settings(IO::InputBlock{"horbital", in});
  };

  // Explicit plane/value: default name
  const auto s = read("Orbital{n=2;l=1;m=0;}Slice{mode=real;plane=z;value=0;"
                      "points=31;}");
  const auto r = compute(s);
  REQUIRE(r.output == "orbital_n2_l1_m0_real_z0p0.png");
  REQUIRE(r.title == "Hydrogen Orbital n=2, l=1, m=0 | mode=real | "
                     "slice=z-plane");
  REQUIRE(r.field.rows() == 31);
  REQUIRE(r.field.cols() == 31);
  REQUIRE(r.spec.range.max == Slice::auto_extent(s.qn, FieldMode::real));
  REQUIRE(r.contours.empty());
  // Idempotent
  REQUIRE(compute(s).field == r.field);

  // Auto plane and scale, line mode
  const auto sl =
      read("Orbital{n=3;l=1;m=1;}Slice{mode=density;points=41;}"
           "Colour{scale=auto;line_mode;levels=6;}Output{format=svg;}");
  const auto rl = compute(sl);
  REQUIRE(rl.contours.size() == 6);
  REQUIRE(rl.mapping.scale == Render::Scale::log);
  REQUIRE(rl.output.substr(rl.output.size() - 4) == ".svg");
  REQUIRE(rl.title.find("| scale=log") != std::string::npos);

  // Plane-independent modes
  const auto rr = compute(read("Orbital{n=3;l=2;}"
                               "Slice{mode=radial_distribution;points=60;}"));
  REQUIRE(rr.output == "orbital_n3_l2_m0_radial_distribution_r0p0.png");
  REQUIRE(rr.title == "Hydrogen Radial Distribution n=3, l=2");
  REQUIRE(rr.spec.range.min == 0.0);

  const auto ra = compute(read("Orbital{n=3;l=2;m=1;}"
                               "Slice{mode=spherical_harmonic;points=30;}"));
  REQUIRE(ra.output == "orbital_n3_l2_m1_spherical_harmonic_angles0p0.png");
  REQUIRE(ra.title == "Spherical Harmonic l=2, m=1 | mode=spherical_harmonic");
  REQUIRE(ra.field.panels.size() == 2);

  // Slice options that do not apply are rejected, not ignored
  REQUIRE_THROWS_AS(
      compute(read("Orbital{n=2;}Slice{mode=radial_distribution;plane=z;}")),
      InvalidSliceSpecError);
  REQUIRE_THROWS_AS(
      compute(read("Orbital{n=2;}Slice{mode=real;range=4,-4;}")),
      InvalidSliceSpecError);
}

//==============================================================================
TEST_CASE("horbital: input options", "[horbital][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "horbital: input options\n";

  using namespace horbital;
  for (const auto &[block, description] : input_blocks()) {
    if (block.empty())
      continue;
    const auto name = block.substr(0, block.size() - 2);
    REQUIRE_FALSE(input_options(name).empty());
  }
  REQUIRE_THROWS_AS(input_options("Grid"), InvalidOptionError);

  // A valid input passes the checks without warnings
  const IO::InputBlock input{"horbital",
                             "Orbital{n=2;l=1;}Slice{mode=imag;points=30;}"};
  REQUIRE(input.check(input_blocks()));
  REQUIRE(input.check({"Slice"}, input_options("Slice")));
  // Misspelled option is flagged
  const IO::InputBlock typo{"horbital", "Slice{mdoe=imag;}"};
  REQUIRE_FALSE(typo.check({"Slice"}, input_options("Slice")));
}
