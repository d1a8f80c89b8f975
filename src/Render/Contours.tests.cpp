#include "ColourScale.hpp"
#include "Colourmap.hpp"
#include "Contours.hpp"
#include "Orbital/Hydrogen.hpp"
#include "Orbital/QuantumNumbers.hpp"
#include "Slice/Sampler.hpp"
#include "catch2/catch.hpp"
#include "horbital/Errors.hpp"
#include <algorithm>
#include <iostream>

TEST_CASE("Render::contour_levels signed", "[Render][Contours][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Render::contour_levels signed\n";

  using namespace Render;
  using Slice::FieldMode;

  const Orbital::Hydrogen h{Orbital::QuantumNumbers::validated(3, 2, 1)};
  const Slice::SliceSpec spec{Slice::Plane::y, 0.0, {-15.0, 15.0}, 61};
  const auto field = Slice::sample(h, spec, FieldMode::real_imag);
  const auto cmap = Colourmap::named("RdBu_r");

  for (const auto scale : {Scale::linear, Scale::symlog}) {
    const auto mapping = map_colours(field, cmap, scale);
    const auto policy = colour_policy(FieldMode::real_imag, scale);
    const auto levels = contour_levels(field, mapping, cmap, policy, 8);

    REQUIRE(levels.size() == 8);
    REQUIRE(std::is_sorted(levels.cbegin(), levels.cend(),
                           [](const auto &a, const auto &b) {
                             return a.level < b.level;
                           }));
    for (std::size_t i = 0; i < levels.size(); ++i) {
      const auto &c = levels[i];
      REQUIRE(c.level != 0.0);
      // symmetric about zero
      REQUIRE(c.level == Approx(-levels[levels.size() - 1 - i].level));
      if (c.level < 0.0) {
        REQUIRE(c.style == LineStyle::dashed);
        REQUIRE(c.colour == cmap.at(0.0));
      } else {
        REQUIRE(c.style == LineStyle::solid);
        REQUIRE(c.colour == cmap.at(1.0));
      }
    }
    REQUIRE(levels.back().level == Approx(mapping.vmax));
    if (scale == Scale::linear) {
      REQUIRE(levels.at(4).level == Approx(0.12 * mapping.vmax));
    } else {
      REQUIRE(levels.at(4).level == Approx(mapping.linthresh));
      // geometric spacing
      REQUIRE(levels.at(6).level / levels.at(5).level ==
              Approx(levels.at(5).level / levels.at(4).level));
    }
  }
}

//==============================================================================
TEST_CASE("Render::contour_levels density", "[Render][Contours][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Render::contour_levels density\n";

  using namespace Render;
  using Slice::FieldMode;

  const Orbital::Hydrogen h{Orbital::QuantumNumbers::validated(2, 1, 0)};
  const Slice::SliceSpec spec{Slice::Plane::x, 0.0, {-10.0, 10.0}, 41};
  const auto field = Slice::sample(h, spec, FieldMode::density);
  const auto cmap = Colourmap::named("YlOrRd");
  const auto policy = colour_policy(FieldMode::density, Scale::linear);

  const auto linear = map_colours(field, cmap, Scale::linear);
  const auto levels = contour_levels(field, linear, cmap, policy, 5);
  REQUIRE(levels.size() == 5);
  REQUIRE(levels.front().level == Approx(0.12 * linear.vmax));
  REQUIRE(levels.back().level == Approx(linear.vmax));
  for (const auto &c : levels) {
    REQUIRE(c.level > 0.0);
    REQUIRE(c.style == LineStyle::solid);
    REQUIRE(c.colour == cmap.at(1.0));
  }

  const auto log = map_colours(field, cmap, Scale::log);
  const auto log_levels = contour_levels(field, log, cmap, policy);
  REQUIRE(log_levels.size() == 8);
  REQUIRE(log_levels.front().level == Approx(log.vmin));
  REQUIRE(log_levels.back().level == Approx(log.vmax));

  REQUIRE_THROWS_AS(contour_levels(field, linear, cmap, policy, 1),
                    horbital::InvalidOptionError);
}

//==============================================================================
TEST_CASE("Render: line options", "[Render][Contours][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Render: line options\n";

  using namespace Render;

  REQUIRE_NOTHROW(check_line_options(true, false));
  REQUIRE_NOTHROW(check_line_options(false, true));
  REQUIRE_NOTHROW(check_line_options(false, false));
  REQUIRE_THROWS_AS(check_line_options(true, true),
                    horbital::ConflictingOptionError);

  const auto nodal = nodal_line();
  REQUIRE(nodal.level == 0.0);
  REQUIRE(nodal.colour.hex() == "#a8a8a8");

  // All-zero field: nothing to draw
  Slice::Field zero;
  zero.mode = Slice::FieldMode::real;
  zero.u = {0.0, 1.0};
  zero.panels.push_back({"Re(psi)", {0.0, 0.0}});
  const auto cmap = Colourmap::named("RdBu");
  const auto mapping = map_colours(zero, cmap, Scale::linear);
  REQUIRE(contour_levels(zero, mapping, cmap,
                         colour_policy(zero.mode, Scale::linear))
              .empty());
}
