#include "Orbital/Hydrogen.hpp"
#include "Orbital/QuantumNumbers.hpp"
#include "Sampler.hpp"
#include "SliceSpec.hpp"
#include "catch2/catch.hpp"
#include "horbital/Errors.hpp"
#include <cmath>
#include <iostream>

TEST_CASE("Slice::SliceSpec", "[Slice][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Slice::SliceSpec\n";

  using namespace Slice;

  REQUIRE(parse_mode("density") == FieldMode::density);
  REQUIRE(parse_mode("Real_Imag") == FieldMode::real_imag);
  REQUIRE(parse_mode("spherical_harmonic") == FieldMode::spherical_harmonic);
  REQUIRE_THROWS_AS(parse_mode("densty"), horbital::InvalidOptionError);
  for (const auto mode : all_modes()) {
    REQUIRE(parse_mode(mode_name(mode)) == mode);
  }
  REQUIRE(parse_plane("Y") == Plane::y);
  REQUIRE_THROWS_AS(parse_plane("w"), horbital::InvalidOptionError);

  REQUIRE(is_planar(FieldMode::imag));
  REQUIRE_FALSE(is_planar(FieldMode::radial_distribution));
  REQUIRE(is_density_family(FieldMode::radial_distribution));
  REQUIRE_FALSE(is_density_family(FieldMode::spherical_harmonic));
  REQUIRE(num_panels(FieldMode::real_imag) == 2);
  REQUIRE(num_panels(FieldMode::real) == 1);

  const SliceSpec good{Plane::x, 1.5, {-5.0, 5.0}, 51};
  REQUIRE_NOTHROW(good.validate(FieldMode::real));

  auto bad = good;
  bad.range = {5.0, 5.0};
  REQUIRE_THROWS_AS(bad.validate(FieldMode::real),
                    horbital::InvalidSliceSpecError);
  bad.range = {6.0, 5.0};
  REQUIRE_THROWS_AS(bad.validate(FieldMode::real),
                    horbital::InvalidSliceSpecError);
  bad.range = {-INFINITY, 5.0};
  REQUIRE_THROWS_AS(bad.validate(FieldMode::real),
                    horbital::InvalidSliceSpecError);
  bad = good;
  bad.resolution = 1;
  REQUIRE_THROWS_AS(bad.validate(FieldMode::density),
                    horbital::InvalidSliceSpecError);
  bad = good;
  bad.value = NAN;
  REQUIRE_THROWS_AS(bad.validate(FieldMode::density),
                    horbital::InvalidSliceSpecError);
  // plane/mode pairing
  REQUIRE_THROWS_AS(good.validate(FieldMode::spherical_harmonic),
                    horbital::InvalidSliceSpecError);
  bad = good;
  bad.plane = Plane::none;
  REQUIRE_THROWS_AS(bad.validate(FieldMode::density),
                    horbital::InvalidSliceSpecError);
  // r >= 0 for radial distribution
  REQUIRE_THROWS_AS(bad.validate(FieldMode::radial_distribution),
                    horbital::InvalidSliceSpecError);
  bad.range = {0.0, 5.0};
  REQUIRE_NOTHROW(bad.validate(FieldMode::radial_distribution));
}

//==============================================================================
TEST_CASE("Slice::sample", "[Slice][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Slice::sample\n";

  using namespace Slice;

  const Orbital::Hydrogen h{Orbital::QuantumNumbers::validated(2, 1, 1)};

  // Plane x: (u,v) -> (y,z)
  const SliceSpec spec{Plane::x, 0.5, {-6.0, 6.0}, 25};
  const auto field = sample(h, spec, FieldMode::real_imag);
  REQUIRE(field.panels.size() == 2);
  REQUIRE(field.rows() == 25);
  REQUIRE(field.cols() == 25);
  REQUIRE(field.u.front() == -6.0);
  REQUIRE(field.u.back() == 6.0);
  REQUIRE(field.u_label == "Y");
  REQUIRE(field.v_label == "Z");
  REQUIRE(field.plane == Plane::x);
  REQUIRE(field.value == 0.5);
  for (const std::size_t row : {0ul, 7ul, 24ul}) {
    for (const std::size_t col : {0ul, 12ul, 20ul}) {
      const auto psi = h.psi(0.5, field.u[col], field.v[row]);
      REQUIRE(field.at(0, row, col) == psi.real());
      REQUIRE(field.at(1, row, col) == psi.imag());
    }
  }

  // Plane y: (u,v) -> (x,z); plane z: (u,v) -> (x,y)
  const auto fy =
      sample(h, {Plane::y, -1.0, {-4.0, 4.0}, 9}, FieldMode::density);
  REQUIRE(fy.panels.size() == 1);
  REQUIRE(fy.at(0, 2, 3) == h.density(fy.u[3], -1.0, fy.v[2]));
  const auto fz = sample(h, {Plane::z, 2.0, {-4.0, 4.0}, 9}, FieldMode::imag);
  REQUIRE(fz.at(0, 5, 1) == h.imag_part(fz.u[1], fz.v[5], 2.0));
  REQUIRE(fz.u_label == "X");
  REQUIRE(fz.v_label == "Y");

  // Density is non-negative and finite, including on the z axis / origin
  const auto fd = sample(h, {Plane::y, 0.0, {-3.0, 3.0}, 31},
                         FieldMode::density, Render::Scale::log);
  REQUIRE(fd.scale == Render::Scale::log);
  for (const auto d : fd.panels.at(0).values) {
    REQUIRE(std::isfinite(d));
    REQUIRE(d >= 0.0);
  }

  // Invalid spec: rejected before evaluation
  REQUIRE_THROWS_AS(sample(h, {Plane::z, 0.0, {1.0, -1.0}, 9}, FieldMode::real),
                    horbital::InvalidSliceSpecError);
}

//==============================================================================
TEST_CASE("Slice::sample radial and angular", "[Slice][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Slice::sample radial and angular\n";

  using namespace Slice;

  const Orbital::Hydrogen h{Orbital::QuantumNumbers::validated(3, 2, -2)};

  const auto fr =
      sample(h, {Plane::none, 0.0, {0.0, 30.0}, 101},
             FieldMode::radial_distribution);
  REQUIRE(fr.rows() == 1);
  REQUIRE(fr.cols() == 101);
  REQUIRE(fr.v.empty());
  REQUIRE(fr.u_label == "r / a0");
  REQUIRE(fr.at(0, 0, 0) == 0.0);
  REQUIRE(fr.at(0, 0, 30) == h.radial_distribution(fr.u[30]));

  const auto fa = sample(h, {Plane::none, 0.0, {-1.0, 1.0}, 37},
                         FieldMode::spherical_harmonic);
  REQUIRE(fa.panels.size() == 2);
  REQUIRE(fa.rows() == 37);
  REQUIRE(fa.cols() == 37);
  REQUIRE(fa.u.front() == -1.0); // phi/pi
  REQUIRE(fa.v.back() == 1.0);   // theta/pi
  const auto Y = h.harmonic(M_PI * fa.v[10], M_PI * fa.u[4]);
  REQUIRE(fa.at(0, 10, 4) == Y.real());
  REQUIRE(fa.at(1, 10, 4) == Y.imag());
  // poles: m != 0 vanishes
  for (std::size_t col = 0; col < fa.cols(); ++col) {
    REQUIRE(fa.at(0, 0, col) == 0.0);
    REQUIRE(fa.at(1, 36, col) == 0.0);
  }
}

//==============================================================================
TEST_CASE("Slice::sample is idempotent", "[Slice][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Slice::sample is idempotent\n";

  using namespace Slice;
  const Orbital::Hydrogen h{Orbital::QuantumNumbers::validated(4, 3, 2)};
  const SliceSpec spec{Plane::z, 0.0, {-20.0, 20.0}, 81};
  for (const auto mode : {FieldMode::density, FieldMode::real,
                          FieldMode::imag, FieldMode::real_imag}) {
    REQUIRE(sample(h, spec, mode) == sample(h, spec, mode));
  }
  const SliceSpec spec_r{Plane::none, 0.0, {0.0, 50.0}, 81};
  REQUIRE(sample(h, spec_r, FieldMode::radial_distribution) ==
          sample(h, spec_r, FieldMode::radial_distribution));
}
