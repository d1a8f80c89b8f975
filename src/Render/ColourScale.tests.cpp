#include "ColourScale.hpp"
#include "Colourmap.hpp"
#include "catch2/catch.hpp"
#include "horbital/Errors.hpp"
#include <cmath>
#include <iostream>
#include <utility>
#include <vector>

namespace {
Slice::Field make_field(Slice::FieldMode mode,
                        std::vector<std::vector<double>> panels) {
  Slice::Field field;
  field.mode = mode;
  field.u.resize(panels.front().size());
  for (auto &values : panels)
    field.panels.push_back({"panel", std::move(values)});
  return field;
}
} // namespace

//==============================================================================
TEST_CASE("Render: scale policies", "[Render][ColourScale][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Render: scale policies\n";

  using namespace Render;
  using Slice::FieldMode;

  REQUIRE(is_signed(FieldMode::real));
  REQUIRE(is_signed(FieldMode::spherical_harmonic));
  REQUIRE_FALSE(is_signed(FieldMode::density));
  REQUIRE_FALSE(is_signed(FieldMode::radial_distribution));

  REQUIRE(resolve_scale(FieldMode::density, ScaleRequest::automatic) ==
          Scale::log);
  REQUIRE(resolve_scale(FieldMode::radial_distribution,
                        ScaleRequest::automatic) == Scale::log);
  REQUIRE(resolve_scale(FieldMode::imag, ScaleRequest::automatic) ==
          Scale::symlog);
  REQUIRE(resolve_scale(FieldMode::imag, ScaleRequest::linear) ==
          Scale::linear);
  REQUIRE(parse_scale("AUTO") == ScaleRequest::automatic);
  REQUIRE_THROWS_AS(parse_scale("logarithmic"), horbital::InvalidOptionError);

  // log of a signed field is rejected
  for (const auto mode : {FieldMode::real, FieldMode::imag,
                          FieldMode::real_imag,
                          FieldMode::spherical_harmonic}) {
    REQUIRE_THROWS_AS(check_scale(mode, Scale::log, false),
                      horbital::UnsupportedScaleError);
    REQUIRE_NOTHROW(check_scale(mode, Scale::symlog, true));
  }
  REQUIRE_NOTHROW(check_scale(FieldMode::density, Scale::log, true));
  REQUIRE_NOTHROW(check_scale(FieldMode::density, Scale::symlog, false));
  REQUIRE_THROWS_AS(check_scale(FieldMode::density, Scale::symlog, true),
                    horbital::UnsupportedScaleError);
  REQUIRE_THROWS_AS(
      check_scale(FieldMode::radial_distribution, Scale::symlog, true),
      horbital::UnsupportedScaleError);

  // Colour policies
  const auto density = colour_policy(FieldMode::density, Scale::linear);
  REQUIRE_FALSE(density.signed_field);
  REQUIRE(density.colourmap_from == 0.5);
  REQUIRE(density.colourmap_to == 1.0);
  REQUIRE(density.positive_line_position == 1.0);
  const auto real = colour_policy(FieldMode::real, Scale::symlog);
  REQUIRE(real.signed_field);
  REQUIRE(real.colourmap_from == 0.0);
  REQUIRE(real.negative_line_position == 0.0);
  REQUIRE(real.positive_line_position == 1.0);

  REQUIRE(colourmap_position(density, 0.0) == 0.5);
  REQUIRE(colourmap_position(density, 1.0) == 1.0);
  REQUIRE(colourmap_position(real, -1.0) == 0.0);
  REQUIRE(colourmap_position(real, 0.0) == 0.5);
  REQUIRE(colourmap_position(real, 1.0) == 1.0);
}

//==============================================================================
TEST_CASE("Render::symlog_transform", "[Render][ColourScale][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Render::symlog_transform\n";

  using Render::symlog_transform;
  const auto lt = 0.01;
  const auto adj = 1.0 / 0.9;
  REQUIRE(symlog_transform(0.0, lt) == 0.0);
  REQUIRE(symlog_transform(0.005, lt) == Approx(0.005 * adj));
  // continuous at the threshold
  REQUIRE(symlog_transform(lt * (1.0 + 1.0e-12), lt) ==
          Approx(symlog_transform(lt, lt)));
  REQUIRE(symlog_transform(1.0, lt) == Approx(lt * (adj + 2.0)));
  // odd
  for (const auto x : {1.0e-4, 0.3, 12.0}) {
    REQUIRE(symlog_transform(-x, lt) == Approx(-symlog_transform(x, lt)));
  }
  // monotonic
  REQUIRE(symlog_transform(0.5, lt) < symlog_transform(0.6, lt));
}

//==============================================================================
TEST_CASE("Render::map_colours", "[Render][ColourScale][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Render::map_colours\n";

  using namespace Render;
  using Slice::FieldMode;
  const auto cmap = Colourmap::named("RdBu");

  // Linear, non-negative
  const auto fd = make_field(FieldMode::density, {{0.0, 1.0, 2.0, 4.0}});
  const auto md = map_colours(fd, cmap, Scale::linear);
  REQUIRE(md.colourmap == "RdBu");
  REQUIRE_FALSE(md.signed_field);
  REQUIRE(md.vmax == 4.0);
  REQUIRE(md.vmin == 0.0);
  REQUIRE(md.intensities.at(0) == std::vector{0.0, 0.25, 0.5, 1.0});

  // Log: floor at smallest positive value, or vmax*1e-7
  const auto ml = map_colours(fd, cmap, Scale::log);
  REQUIRE(ml.vmin == 1.0);
  REQUIRE(ml.intensities.at(0).at(0) == 0.0); // clamped to floor
  REQUIRE(ml.intensities.at(0).at(1) == 0.0);
  REQUIRE(ml.intensities.at(0).at(2) == Approx(0.5));
  REQUIRE(ml.intensities.at(0).at(3) == Approx(1.0));
  const auto tiny = make_field(FieldMode::density, {{1.0e-12, 1.0}});
  REQUIRE(map_colours(tiny, cmap, Scale::log).vmin == Approx(1.0e-7));

  // Signed, two panels share one limit
  const auto fs =
      make_field(FieldMode::real_imag, {{-1.0, 0.0, 0.5}, {2.0, -2.0, 0.0}});
  const auto ms = map_colours(fs, cmap, Scale::linear);
  REQUIRE(ms.signed_field);
  REQUIRE(ms.vmax == 2.0);
  REQUIRE(ms.vmin == -2.0);
  REQUIRE(ms.intensities.at(0) == std::vector{-0.5, 0.0, 0.25});
  REQUIRE(ms.intensities.at(1) == std::vector{1.0, -1.0, 0.0});

  // Symlog
  MappingOptions options;
  options.linthresh_fraction = 1.0e-2;
  const auto msym = map_colours(fs, cmap, Scale::symlog, options);
  REQUIRE(msym.linthresh == Approx(0.02));
  REQUIRE(msym.intensities.at(1).at(0) == Approx(1.0));
  REQUIRE(msym.intensities.at(1).at(1) == Approx(-1.0));
  REQUIRE(msym.intensities.at(0).at(1) == 0.0);
  // symlog compresses: 0.5 maps further out than in linear scale
  REQUIRE(msym.intensities.at(0).at(2) > 0.25);
  REQUIRE(map_colours(fs, cmap, Scale::symlog).linthresh == Approx(2.0e-3));

  // All-zero fields map to zero
  const auto fz = make_field(FieldMode::real, {{0.0, 0.0, 0.0}});
  for (const auto scale : {Scale::linear, Scale::log, Scale::symlog}) {
    const auto mz = map_colours(fz, cmap, scale);
    REQUIRE(mz.intensities.at(0) == std::vector{0.0, 0.0, 0.0});
    REQUIRE(std::isfinite(mz.vmax));
    REQUIRE(mz.linthresh >= 1.0e-16);
  }

  // Intensities stay in range
  for (const auto &v : msym.intensities) {
    for (const auto x : v) {
      REQUIRE(x >= -1.0);
      REQUIRE(x <= 1.0);
    }
  }
}
